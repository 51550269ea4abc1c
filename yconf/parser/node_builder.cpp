/*
 * node_builder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-17

Description: Builds a document tree from the token stream

**************************************************/

#include "node_builder.hpp"

#include <spdlog/spdlog.h>

namespace yconf::parser {
namespace {
// Same set the store trims from path segments.
auto is_blank(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}
}  // namespace

NodeBuilder::NodeBuilder(std::string_view input, const ParseOptions& options)
    : tokenizer_(input),
      options_(options),
      anchors_(options.allow_anchor_redefinition),
      input_size_(input.size()) {}

auto NodeBuilder::build() -> Document {
    spdlog::debug("Parsing YAML document ({} bytes)", input_size_);

    frames_.clear();
    frames_.emplace_back();
    while (!frames_.empty()) {
        const Token token = take();
        while (!dispatch(token)) {
        }
    }

    spdlog::log(options_.verbose ? spdlog::level::info : spdlog::level::debug,
                "Built document with {} nodes and {} anchors", arena_.size(),
                anchors_.size());

    Document document;
    document.arena = std::move(arena_);
    document.root = root_;
    return document;
}

auto NodeBuilder::take() -> Token {
    peek();
    Token token = std::move(lookahead_.front());
    lookahead_.pop_front();
    return token;
}

auto NodeBuilder::peek(std::size_t offset) -> const Token& {
    while (lookahead_.size() <= offset) {
        Token token = tokenizer_.next();
        if (token.type != TokenType::Comment) {
            lookahead_.push_back(std::move(token));
        }
    }
    return lookahead_[offset];
}

// Returns false when the token must be offered again to the new top frame.
auto NodeBuilder::dispatch(const Token& token) -> bool {
    switch (top().kind) {
        case FrameKind::Document:
            return on_document(token);
        case FrameKind::BlockMapping:
            return on_block_mapping(token);
        case FrameKind::BlockSequence:
            return on_block_sequence(token);
        case FrameKind::FlowSequence:
            return on_flow_sequence(token);
        case FrameKind::FlowMapping:
            return on_flow_mapping(token);
        case FrameKind::FlowPair:
            return on_flow_pair(token);
    }
    return true;
}

auto NodeBuilder::on_document(const Token& token) -> bool {
    auto& frame = top();
    if (frame.state == State::Done) {
        switch (token.type) {
            case TokenType::NewLine:
            case TokenType::Dedent:
            case TokenType::DocumentEnd:
                return true;
            case TokenType::StreamEnd:
                frames_.pop_back();
                return true;
            case TokenType::DocumentStart:
                THROW_PARSE_ERROR(token.mark,
                                  "multiple documents are not supported");
            default:
                THROW_PARSE_ERROR(token.mark,
                                  "unexpected {} after the document root",
                                  to_string(token.type));
        }
    }

    switch (token.type) {
        case TokenType::DocumentStart:
            if (document_started_) {
                THROW_PARSE_ERROR(token.mark,
                                  "multiple documents are not supported");
            }
            document_started_ = true;
            block_allowed_ = false;
            return true;
        case TokenType::NewLine:
            block_allowed_ = true;
            return true;
        case TokenType::Dedent:
            return true;
        case TokenType::DocumentEnd:
            deliver_empty(token.mark);
            return true;
        case TokenType::StreamEnd:
            if (!properties_.empty()) {
                deliver_empty(token.mark);
            } else {
                frame.state = State::Done;
            }
            return false;
        default:
            return on_block_value(token);
    }
}

auto NodeBuilder::on_block_value(const Token& token) -> bool {
    auto& frame = top();
    // A token on a later line at or left of the owning key or dash leaves
    // the value empty.
    const bool ends_value = value_on_next_line_ && !block_allowed_ &&
                            frame.kind != FrameKind::Document &&
                            token.column() <= frame.indent;
    const bool block_ok = block_allowed_ || value_on_next_line_;
    switch (token.type) {
        case TokenType::Anchor:
        case TokenType::Tag:
            on_properties(token);
            return true;

        case TokenType::Indent:
            block_allowed_ = true;
            return true;

        case TokenType::NewLine:
            value_on_next_line_ = true;
            block_allowed_ = false;
            return true;

        case TokenType::Scalar:
        case TokenType::MergeKey: {
            if (ends_value) {
                deliver_empty(token.mark);
                return false;
            }
            if (token.type == TokenType::MergeKey ||
                peek().type == TokenType::MappingKey) {
                if (!block_ok) {
                    THROW_PARSE_ERROR(token.mark,
                                      "mapping values are not allowed here");
                }
                if (!properties_.empty() &&
                    properties_.mark.line == token.mark.line) {
                    reject_key_properties(properties_.mark);
                }
                open(FrameKind::BlockMapping, token.column(), token.mark);
                return false;
            }
            deliver(make_scalar(token.value, token.style, token.mark), true);
            return true;
        }

        case TokenType::Alias: {
            if (ends_value) {
                deliver_empty(token.mark);
                return false;
            }
            if (peek().type == TokenType::MappingKey) {
                THROW_PARSE_ERROR(token.mark,
                                  "aliases cannot be used as mapping keys");
            }
            if (!properties_.empty()) {
                THROW_PARSE_ERROR(token.mark,
                                  "an alias cannot carry an anchor or a tag");
            }
            deliver(anchors_.resolve(token.value, token.mark), true);
            return true;
        }

        case TokenType::SequenceItem:
            if (block_allowed_ ||
                (value_on_next_line_ && token.column() > frame.indent)) {
                if (!properties_.empty() &&
                    properties_.mark.line == token.mark.line) {
                    THROW_PARSE_ERROR(properties_.mark,
                                      "properties must precede a block "
                                      "sequence on their own line");
                }
                open(FrameKind::BlockSequence, token.column(), token.mark);
                return false;
            }
            if (value_on_next_line_ && frame.kind == FrameKind::BlockMapping &&
                token.column() == frame.indent) {
                open(FrameKind::BlockSequence, token.column(), token.mark,
                     true);
                return false;
            }
            if (value_on_next_line_) {
                deliver_empty(token.mark);
                return false;
            }
            THROW_PARSE_ERROR(token.mark,
                              "block sequence entries are not allowed here");

        case TokenType::FlowSequenceStart:
        case TokenType::FlowMappingStart:
            if (ends_value) {
                deliver_empty(token.mark);
                return false;
            }
            open(token.type == TokenType::FlowSequenceStart
                     ? FrameKind::FlowSequence
                     : FrameKind::FlowMapping,
                 token.column(), token.mark);
            return true;

        case TokenType::Dedent:
        case TokenType::StreamEnd:
        case TokenType::DocumentStart:
        case TokenType::DocumentEnd:
            deliver_empty(token.mark);
            return false;

        default:
            THROW_PARSE_ERROR(token.mark,
                              "unexpected {} where a value was expected",
                              to_string(token.type));
    }
}

auto NodeBuilder::on_block_mapping(const Token& token) -> bool {
    auto& frame = top();
    if (frame.state == State::ExpectValue) {
        return on_block_value(token);
    }
    if (frame.state == State::AfterValue) {
        if (token.type == TokenType::NewLine) {
            frame.state = State::ExpectKey;
            return true;
        }
        if (frame.needs_newline) {
            THROW_PARSE_ERROR(token.mark,
                              "expected a line break after the mapping "
                              "value, found {}",
                              to_string(token.type));
        }
        frame.state = State::ExpectKey;
        return false;
    }

    switch (token.type) {
        case TokenType::NewLine:
            return true;
        case TokenType::Dedent:
            if (token.indent < frame.indent) {
                close();
                return false;
            }
            return true;
        case TokenType::Scalar:
        case TokenType::MergeKey:
            if (token.column() != frame.indent) {
                THROW_PARSE_ERROR(token.mark,
                                  "bad indentation of a mapping entry");
            }
            if (!properties_.empty()) {
                reject_key_properties(properties_.mark);
            }
            if (peek().type != TokenType::MappingKey) {
                THROW_PARSE_ERROR(token.mark, "could not find expected ':'");
            }
            take();
            accept_key(frame, token);
            frame.state = State::ExpectValue;
            return true;
        case TokenType::StreamEnd:
        case TokenType::DocumentStart:
        case TokenType::DocumentEnd:
            close();
            return false;
        case TokenType::SequenceItem:
            if (token.column() < frame.indent) {
                close();
                return false;
            }
            THROW_PARSE_ERROR(token.mark,
                              "block sequence entries are not allowed in "
                              "this mapping");
        case TokenType::Anchor:
        case TokenType::Tag:
            reject_key_properties(token.mark);
            return true;
        case TokenType::Alias:
            THROW_PARSE_ERROR(token.mark,
                              "aliases cannot be used as mapping keys");
        case TokenType::Indent:
            THROW_PARSE_ERROR(token.mark,
                              "bad indentation of a mapping entry");
        default:
            THROW_PARSE_ERROR(token.mark, "expected a mapping key, found {}",
                              to_string(token.type));
    }
}

auto NodeBuilder::on_block_sequence(const Token& token) -> bool {
    auto& frame = top();
    if (frame.state == State::ExpectValue) {
        return on_block_value(token);
    }
    if (frame.state == State::AfterValue) {
        if (token.type == TokenType::NewLine) {
            frame.state = State::ExpectItem;
            return true;
        }
        if (frame.needs_newline) {
            THROW_PARSE_ERROR(token.mark,
                              "expected a line break after the sequence "
                              "entry, found {}",
                              to_string(token.type));
        }
        frame.state = State::ExpectItem;
        return false;
    }

    switch (token.type) {
        case TokenType::NewLine:
            return true;
        case TokenType::Dedent:
            if (token.indent < frame.indent) {
                close();
                return false;
            }
            return true;
        case TokenType::SequenceItem:
            if (token.column() == frame.indent) {
                frame.state = State::ExpectValue;
                block_allowed_ = false;
                value_on_next_line_ = false;
                return true;
            }
            if (token.column() < frame.indent) {
                close();
                return false;
            }
            THROW_PARSE_ERROR(token.mark,
                              "bad indentation of a sequence entry");
        case TokenType::StreamEnd:
        case TokenType::DocumentStart:
        case TokenType::DocumentEnd:
            close();
            return false;
        default:
            // A sequence at its parent key's indentation ends at the next
            // non-entry token on that column.
            if (frame.indentless && token.column() <= frame.indent) {
                close();
                return false;
            }
            THROW_PARSE_ERROR(token.mark,
                              "expected a '-' sequence entry, found {}",
                              to_string(token.type));
    }
}

auto NodeBuilder::on_flow_sequence(const Token& token) -> bool {
    auto& frame = top();
    if (token.type == TokenType::StreamEnd) {
        THROW_PARSE_ERROR(frame.mark, "unterminated flow sequence");
    }

    if (frame.state == State::AfterValue) {
        switch (token.type) {
            case TokenType::Comma:
                frame.state = State::ExpectItem;
                return true;
            case TokenType::FlowSequenceEnd:
                close();
                return true;
            default:
                THROW_PARSE_ERROR(token.mark, "expected ',' or ']', found {}",
                                  to_string(token.type));
        }
    }

    switch (token.type) {
        case TokenType::FlowSequenceEnd:
            if (!properties_.empty()) {
                deliver_empty(token.mark);
                return false;
            }
            close();
            return true;
        case TokenType::Comma:
            if (!properties_.empty()) {
                deliver_empty(token.mark);
                return false;
            }
            THROW_PARSE_ERROR(token.mark,
                              "unexpected ',' in a flow sequence");
        case TokenType::Scalar:
        case TokenType::MergeKey:
            if (token.type == TokenType::MergeKey ||
                peek().type == TokenType::MappingKey) {
                if (!properties_.empty()) {
                    reject_key_properties(properties_.mark);
                }
                open(FrameKind::FlowPair, token.column(), token.mark);
                return false;
            }
            return on_flow_value(token);
        default:
            return on_flow_value(token);
    }
}

auto NodeBuilder::on_flow_mapping(const Token& token) -> bool {
    auto& frame = top();
    if (token.type == TokenType::StreamEnd) {
        THROW_PARSE_ERROR(frame.mark, "unterminated flow mapping");
    }

    switch (frame.state) {
        case State::ExpectValue:
            if (token.type == TokenType::Comma ||
                token.type == TokenType::FlowMappingEnd) {
                deliver_empty(token.mark);
                return false;
            }
            return on_flow_value(token);

        case State::AfterValue:
            if (token.type == TokenType::Comma) {
                frame.state = State::ExpectKey;
                return true;
            }
            if (token.type == TokenType::FlowMappingEnd) {
                close();
                return true;
            }
            THROW_PARSE_ERROR(token.mark, "expected ',' or '}}', found {}",
                              to_string(token.type));

        default:
            break;
    }

    switch (token.type) {
        case TokenType::FlowMappingEnd:
            close();
            return true;
        case TokenType::Scalar:
        case TokenType::MergeKey: {
            if (!properties_.empty()) {
                reject_key_properties(properties_.mark);
            }
            const auto next = peek().type;
            if (next == TokenType::MappingKey) {
                take();
                accept_key(frame, token);
                frame.state = State::ExpectValue;
                return true;
            }
            if (next == TokenType::Comma ||
                next == TokenType::FlowMappingEnd) {
                accept_key(frame, token);
                deliver(make_scalar({}, type::ScalarStyle::Plain, token.mark),
                        true);
                return true;
            }
            THROW_PARSE_ERROR(token.mark, "could not find expected ':'");
        }
        case TokenType::Anchor:
        case TokenType::Tag:
            reject_key_properties(token.mark);
            return true;
        case TokenType::Alias:
            THROW_PARSE_ERROR(token.mark,
                              "aliases cannot be used as mapping keys");
        case TokenType::Comma:
            THROW_PARSE_ERROR(token.mark, "unexpected ',' in a flow mapping");
        default:
            THROW_PARSE_ERROR(token.mark, "expected a mapping key, found {}",
                              to_string(token.type));
    }
}

auto NodeBuilder::on_flow_pair(const Token& token) -> bool {
    auto& frame = top();
    switch (frame.state) {
        case State::ExpectKey:
            take();
            accept_key(frame, token);
            frame.state = State::ExpectValue;
            return true;
        case State::ExpectValue:
            if (token.type == TokenType::Comma ||
                token.type == TokenType::FlowSequenceEnd ||
                token.type == TokenType::StreamEnd) {
                deliver_empty(token.mark);
                return false;
            }
            return on_flow_value(token);
        default:
            close();
            return false;
    }
}

auto NodeBuilder::on_flow_value(const Token& token) -> bool {
    switch (token.type) {
        case TokenType::Anchor:
        case TokenType::Tag:
            on_properties(token);
            return true;
        case TokenType::Scalar:
            deliver(make_scalar(token.value, token.style, token.mark), true);
            return true;
        case TokenType::Alias:
            if (peek().type == TokenType::MappingKey) {
                THROW_PARSE_ERROR(token.mark,
                                  "aliases cannot be used as mapping keys");
            }
            if (!properties_.empty()) {
                THROW_PARSE_ERROR(token.mark,
                                  "an alias cannot carry an anchor or a tag");
            }
            deliver(anchors_.resolve(token.value, token.mark), true);
            return true;
        case TokenType::FlowSequenceStart:
            open(FrameKind::FlowSequence, token.column(), token.mark);
            return true;
        case TokenType::FlowMappingStart:
            open(FrameKind::FlowMapping, token.column(), token.mark);
            return true;
        default:
            THROW_PARSE_ERROR(token.mark,
                              "unexpected {} in a flow collection",
                              to_string(token.type));
    }
}

void NodeBuilder::on_properties(const Token& token) {
    if (properties_.empty()) {
        properties_.mark = token.mark;
    }
    if (token.type == TokenType::Anchor) {
        if (!properties_.anchor.empty()) {
            THROW_PARSE_ERROR(token.mark, "a node can carry only one anchor");
        }
        anchors_.begin(token.value, token.mark);
        properties_.anchor = token.value;
    } else {
        if (!properties_.tag.empty()) {
            THROW_PARSE_ERROR(token.mark, "a node can carry only one tag");
        }
        properties_.tag = token.value;
    }
}

void NodeBuilder::open(FrameKind kind, std::size_t indent, const Mark& mark,
                       bool indentless) {
    if (frames_.size() > options_.max_depth) {
        THROW_PARSE_ERROR(mark, "maximum nesting depth of {} exceeded",
                          options_.max_depth);
    }

    const bool mapping = kind != FrameKind::BlockSequence &&
                         kind != FrameKind::FlowSequence;
    Frame frame;
    frame.kind = kind;
    frame.indent = indent;
    frame.indentless = indentless;
    frame.mark = mark;
    switch (kind) {
        case FrameKind::BlockSequence:
        case FrameKind::FlowSequence:
            frame.state = State::ExpectItem;
            break;
        default:
            frame.state = State::ExpectKey;
            break;
    }

    // A pair inside a flow sequence never takes the sequence's properties.
    if (kind != FrameKind::FlowPair) {
        check_collection_tag(properties_.tag, mapping, mark);
        frame.anchor = std::move(properties_.anchor);
        properties_ = {};
    }

    frame.node = mapping ? arena_.add_mapping(mark) : arena_.add_sequence(mark);
    arena_.node(frame.node).anchor = frame.anchor;

    frames_.push_back(std::move(frame));
    block_allowed_ = false;
    value_on_next_line_ = false;
}

void NodeBuilder::close() {
    Frame frame = std::move(frames_.back());
    frames_.pop_back();

    if (!frame.merge_sources.empty()) {
        AnchorResolver::apply_merge(arena_, frame.node, frame.merge_position,
                                    frame.merge_sources);
    }
    if (!frame.anchor.empty()) {
        anchors_.complete(frame.anchor, frame.node);
    }
    deliver({frame.node, false}, frame.kind != FrameKind::BlockMapping &&
                                     frame.kind != FrameKind::BlockSequence);
}

void NodeBuilder::deliver(NodeRef ref, bool needs_newline) {
    block_allowed_ = false;
    value_on_next_line_ = false;

    auto& parent = top();
    switch (parent.kind) {
        case FrameKind::Document:
            root_ = ref;
            parent.state = State::Done;
            return;
        case FrameKind::BlockSequence:
        case FrameKind::FlowSequence:
            arena_.sequence(parent.node).items.push_back(ref);
            break;
        default:
            if (parent.merge_key) {
                add_merge_source(parent, ref);
                parent.merge_key = false;
            } else {
                arena_.mapping(parent.node)
                    .entries.emplace_back(parent.key, ref);
            }
            break;
    }
    parent.state = State::AfterValue;
    parent.needs_newline = needs_newline;
}

void NodeBuilder::deliver_empty(const Mark& mark) {
    deliver(make_scalar({}, type::ScalarStyle::Plain, mark), false);
}

void NodeBuilder::accept_key(Frame& frame, const Token& token) {
    if (token.type == TokenType::MergeKey) {
        if (frame.seen_merge) {
            THROW_PARSE_ERROR(token.mark, "duplicate merge key '<<'");
        }
        frame.seen_merge = true;
        frame.merge_key = true;
        frame.merge_position = arena_.mapping(frame.node).entries.size();
        return;
    }

    const auto& key = token.value;
    if (key.empty()) {
        THROW_PARSE_ERROR(token.mark, "empty mapping keys are not supported");
    }
    if (is_blank(key.front()) || is_blank(key.back())) {
        THROW_PARSE_ERROR(token.mark,
                          "mapping key '{}' has leading or trailing blanks",
                          key);
    }
    if (key.find(options_.separator) != std::string::npos) {
        THROW_PARSE_ERROR(token.mark,
                          "mapping key '{}' contains the category "
                          "separator '{}'",
                          key, options_.separator);
    }
    if (!frame.keys.insert(key).second) {
        THROW_PARSE_ERROR(token.mark, "duplicate mapping key '{}'", key);
    }
    frame.key = key;
    frame.merge_key = false;
}

void NodeBuilder::add_merge_source(Frame& frame, NodeRef ref) {
    const auto& node = arena_.node(ref.id);
    if (node.is_mapping()) {
        frame.merge_sources.push_back(ref.id);
        return;
    }
    if (node.is_sequence()) {
        for (const auto& item : arena_.sequence(ref.id).items) {
            const auto& source = arena_.node(item.id);
            if (!source.is_mapping()) {
                THROW_PARSE_ERROR(source.mark,
                                  "merge sources must be mappings");
            }
            frame.merge_sources.push_back(item.id);
        }
        return;
    }
    THROW_PARSE_ERROR(node.mark,
                      "the value of '<<' must be a mapping or a sequence "
                      "of mappings");
}

auto NodeBuilder::make_scalar(const std::string& text, type::ScalarStyle style,
                              const Mark& mark) -> NodeRef {
    auto properties = std::move(properties_);
    properties_ = {};

    auto scalar = properties.tag.empty()
                      ? type::Scalar(text, style)
                      : tagged_scalar(text, style, properties.tag, mark);
    const auto id = arena_.add_scalar(std::move(scalar), mark);
    if (!properties.anchor.empty()) {
        arena_.node(id).anchor = properties.anchor;
        anchors_.complete(properties.anchor, id);
    }
    return {id, false};
}

auto NodeBuilder::tagged_scalar(const std::string& text,
                                type::ScalarStyle style,
                                const std::string& tag, const Mark& mark)
    -> type::Scalar {
    using type::ScalarKind;
    if (tag == "!!str") {
        return {text, style, ScalarKind::String};
    }
    if (tag == "!!null") {
        if (!type::is_null_literal(text)) {
            THROW_PARSE_ERROR(mark, "'{}' is not a valid !!null value", text);
        }
        return {text, style, ScalarKind::Null};
    }
    if (tag == "!!bool") {
        if (!type::parse_bool(text)) {
            THROW_PARSE_ERROR(mark, "'{}' is not a valid !!bool value", text);
        }
        return {text, style, ScalarKind::Boolean};
    }
    if (tag == "!!int") {
        if (!type::is_integer_literal(text)) {
            THROW_PARSE_ERROR(mark, "'{}' is not a valid !!int value", text);
        }
        return {text, style, ScalarKind::Integer};
    }
    if (tag == "!!float") {
        if (!type::is_real_literal(text) && !type::is_integer_literal(text)) {
            THROW_PARSE_ERROR(mark, "'{}' is not a valid !!float value", text);
        }
        return {text, style, ScalarKind::Real};
    }
    if (tag == "!!map" || tag == "!!seq") {
        THROW_PARSE_ERROR(mark, "tag {} cannot be applied to a scalar", tag);
    }
    THROW_PARSE_ERROR(mark, "unsupported tag '{}'", tag);
}

void NodeBuilder::check_collection_tag(const std::string& tag, bool mapping,
                                       const Mark& mark) {
    if (tag.empty() || (mapping && tag == "!!map") ||
        (!mapping && tag == "!!seq")) {
        return;
    }
    if (tag == "!!map" || tag == "!!seq" || tag == "!!str" ||
        tag == "!!int" || tag == "!!float" || tag == "!!bool" ||
        tag == "!!null") {
        THROW_PARSE_ERROR(mark, "tag {} cannot be applied to a {}", tag,
                          mapping ? "mapping" : "sequence");
    }
    THROW_PARSE_ERROR(mark, "unsupported tag '{}'", tag);
}

void NodeBuilder::reject_key_properties(const Mark& mark) {
    THROW_PARSE_ERROR(mark,
                      "anchors and tags on mapping keys are not supported");
}

auto parse_document(std::string_view input, const ParseOptions& options)
    -> Document {
    return NodeBuilder(input, options).build();
}
}  // namespace yconf::parser
