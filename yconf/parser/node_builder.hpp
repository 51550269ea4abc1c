/*
 * node_builder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-17

Description: Builds a document tree from the token stream

**************************************************/

#ifndef YCONF_PARSER_NODE_BUILDER_HPP
#define YCONF_PARSER_NODE_BUILDER_HPP

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "yconf/options.hpp"
#include "yconf/parser/anchor_resolver.hpp"
#include "yconf/parser/node.hpp"
#include "yconf/parser/tokenizer.hpp"

namespace yconf::parser {
/**
 * @brief Turns YAML text into a Document.
 *
 * The builder is a pushdown automaton. Every open collection is a frame on
 * an explicit stack, so nesting depth costs heap memory rather than call
 * stack, and is capped by ParseOptions::max_depth. Anchors, aliases and
 * merge keys are resolved while the tree is built.
 */
class NodeBuilder {
public:
    explicit NodeBuilder(std::string_view input,
                         const ParseOptions& options = {});

    /**
     * @brief Parses the whole input.
     * @throws error::LexError, error::ParseError, error::AnchorError
     */
    auto build() -> Document;

private:
    enum class FrameKind {
        Document,
        BlockMapping,
        BlockSequence,
        FlowSequence,
        FlowMapping,
        FlowPair
    };

    enum class State { ExpectKey, ExpectItem, ExpectValue, AfterValue, Done };

    struct Frame {
        FrameKind kind{FrameKind::Document};
        State state{State::ExpectValue};
        NodeId node{0};
        std::size_t indent{0};
        bool indentless{false};
        Mark mark;

        std::string key;
        bool merge_key{false};
        bool seen_merge{false};
        std::size_t merge_position{0};
        std::vector<NodeId> merge_sources;
        std::unordered_set<std::string> keys;

        std::string anchor;
        bool needs_newline{false};
    };

    // Anchor and tag read ahead of the node they apply to.
    struct Properties {
        std::string anchor;
        std::string tag;
        Mark mark;

        [[nodiscard]] auto empty() const -> bool {
            return anchor.empty() && tag.empty();
        }
    };

    auto take() -> Token;
    auto peek(std::size_t offset = 0) -> const Token&;

    auto dispatch(const Token& token) -> bool;
    auto on_document(const Token& token) -> bool;
    auto on_block_mapping(const Token& token) -> bool;
    auto on_block_sequence(const Token& token) -> bool;
    auto on_flow_sequence(const Token& token) -> bool;
    auto on_flow_mapping(const Token& token) -> bool;
    auto on_flow_pair(const Token& token) -> bool;
    auto on_block_value(const Token& token) -> bool;
    auto on_flow_value(const Token& token) -> bool;
    void on_properties(const Token& token);

    void open(FrameKind kind, std::size_t indent, const Mark& mark,
              bool indentless = false);
    void close();
    void deliver(NodeRef ref, bool needs_newline);
    void deliver_empty(const Mark& mark);
    void accept_key(Frame& frame, const Token& token);
    void add_merge_source(Frame& frame, NodeRef ref);

    auto make_scalar(const std::string& text, type::ScalarStyle style,
                     const Mark& mark) -> NodeRef;
    auto tagged_scalar(const std::string& text, type::ScalarStyle style,
                       const std::string& tag, const Mark& mark)
        -> type::Scalar;
    void check_collection_tag(const std::string& tag, bool mapping,
                              const Mark& mark);
    void reject_key_properties(const Mark& mark);

    [[nodiscard]] auto top() -> Frame& { return frames_.back(); }

    Tokenizer tokenizer_;
    ParseOptions options_;
    NodeArena arena_;
    AnchorResolver anchors_;
    std::vector<Frame> frames_;
    std::deque<Token> lookahead_;
    Properties properties_;
    std::optional<NodeRef> root_;
    bool block_allowed_{true};
    bool value_on_next_line_{false};
    bool document_started_{false};
    std::size_t input_size_{0};
};

/**
 * @brief Convenience wrapper around NodeBuilder.
 */
[[nodiscard]] auto parse_document(std::string_view input,
                                  const ParseOptions& options = {})
    -> Document;
}  // namespace yconf::parser

#endif  // YCONF_PARSER_NODE_BUILDER_HPP
