/*
 * node.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-16

Description: Document tree stored in an index addressed arena

**************************************************/

#include "node.hpp"

#include <limits>

namespace yconf::parser {
auto MappingNode::find(std::string_view key) const -> const NodeRef* {
    for (const auto &[name, ref] : entries) {
        if (name == key) {
            return &ref;
        }
    }
    return nullptr;
}

auto NodeArena::add_scalar(type::Scalar scalar, const Mark& mark) -> NodeId {
    return add(Node{std::move(scalar), {}, mark});
}

auto NodeArena::add_sequence(const Mark& mark) -> NodeId {
    return add(Node{SequenceNode{}, {}, mark});
}

auto NodeArena::add_mapping(const Mark& mark) -> NodeId {
    return add(Node{MappingNode{}, {}, mark});
}

auto NodeArena::add(Node node) -> NodeId {
    if (nodes_.size() >= std::numeric_limits<NodeId>::max()) {
        THROW_PARSE_ERROR(node.mark, "document has too many nodes");
    }
    nodes_.push_back(std::move(node));
    return static_cast<NodeId>(nodes_.size() - 1);
}

auto NodeArena::node(NodeId id) -> Node& { return nodes_.at(id); }

auto NodeArena::node(NodeId id) const -> const Node& { return nodes_.at(id); }

auto NodeArena::scalar(NodeId id) const -> const type::Scalar& {
    return std::get<type::Scalar>(node(id).data);
}

auto NodeArena::sequence(NodeId id) -> SequenceNode& {
    return std::get<SequenceNode>(node(id).data);
}

auto NodeArena::sequence(NodeId id) const -> const SequenceNode& {
    return std::get<SequenceNode>(node(id).data);
}

auto NodeArena::mapping(NodeId id) -> MappingNode& {
    return std::get<MappingNode>(node(id).data);
}

auto NodeArena::mapping(NodeId id) const -> const MappingNode& {
    return std::get<MappingNode>(node(id).data);
}
}  // namespace yconf::parser
