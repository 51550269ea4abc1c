/*
 * token.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-15

Description: Lexical tokens of the YAML tokenizer

**************************************************/

#ifndef YCONF_PARSER_TOKEN_HPP
#define YCONF_PARSER_TOKEN_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "yconf/error/yaml_error.hpp"
#include "yconf/type/scalar.hpp"

namespace yconf::parser {
enum class TokenType {
    StreamEnd,
    DocumentStart,
    DocumentEnd,
    Indent,
    Dedent,
    NewLine,
    Scalar,
    MappingKey,
    MergeKey,
    SequenceItem,
    FlowSequenceStart,
    FlowSequenceEnd,
    FlowMappingStart,
    FlowMappingEnd,
    Comma,
    Anchor,
    Alias,
    Tag,
    Comment
};

[[nodiscard]] auto to_string(TokenType type) -> std::string_view;

struct Token {
    TokenType type{TokenType::StreamEnd};
    std::string value;  ///< Scalar text, anchor/alias name, tag or comment.
    type::ScalarStyle style{type::ScalarStyle::Plain};
    std::size_t indent{0};  ///< New level for Indent, level left for Dedent.
    Mark mark;

    /// Zero-based column of the first character.
    [[nodiscard]] auto column() const -> std::size_t { return mark.column - 1; }
};
}  // namespace yconf::parser

#endif  // YCONF_PARSER_TOKEN_HPP
