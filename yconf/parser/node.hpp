/*
 * node.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-16

Description: Document tree stored in an index addressed arena

**************************************************/

#ifndef YCONF_PARSER_NODE_HPP
#define YCONF_PARSER_NODE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "yconf/error/yaml_error.hpp"
#include "yconf/type/scalar.hpp"

namespace yconf::parser {
using NodeId = std::uint32_t;

/**
 * @brief Reference from a parent to a child node.
 *
 * An owning reference points at the node built in that position. An alias
 * reference points at an anchored node owned elsewhere in the tree.
 */
struct NodeRef {
    NodeId id{0};
    bool alias{false};
};

struct SequenceNode {
    std::vector<NodeRef> items;
};

struct MappingNode {
    std::vector<std::pair<std::string, NodeRef>> entries;

    [[nodiscard]] auto find(std::string_view key) const -> const NodeRef*;
};

struct Node {
    std::variant<type::Scalar, SequenceNode, MappingNode> data;
    std::string anchor;
    Mark mark;

    [[nodiscard]] auto is_scalar() const -> bool {
        return std::holds_alternative<type::Scalar>(data);
    }
    [[nodiscard]] auto is_sequence() const -> bool {
        return std::holds_alternative<SequenceNode>(data);
    }
    [[nodiscard]] auto is_mapping() const -> bool {
        return std::holds_alternative<MappingNode>(data);
    }
};

/**
 * @brief Owns every node of one document.
 *
 * Nodes are addressed by NodeId. References returned by the accessors are
 * invalidated when a node is added.
 */
class NodeArena {
public:
    auto add_scalar(type::Scalar scalar, const Mark& mark) -> NodeId;
    auto add_sequence(const Mark& mark) -> NodeId;
    auto add_mapping(const Mark& mark) -> NodeId;

    [[nodiscard]] auto node(NodeId id) -> Node&;
    [[nodiscard]] auto node(NodeId id) const -> const Node&;
    [[nodiscard]] auto scalar(NodeId id) const -> const type::Scalar&;
    [[nodiscard]] auto sequence(NodeId id) -> SequenceNode&;
    [[nodiscard]] auto sequence(NodeId id) const -> const SequenceNode&;
    [[nodiscard]] auto mapping(NodeId id) -> MappingNode&;
    [[nodiscard]] auto mapping(NodeId id) const -> const MappingNode&;

    [[nodiscard]] auto size() const -> std::size_t { return nodes_.size(); }
    void clear() { nodes_.clear(); }

private:
    auto add(Node node) -> NodeId;

    std::vector<Node> nodes_;
};

/**
 * @brief Result of parsing one YAML document.
 */
struct Document {
    NodeArena arena;
    std::optional<NodeRef> root;  ///< Empty for an empty document.
};
}  // namespace yconf::parser

#endif  // YCONF_PARSER_NODE_HPP
