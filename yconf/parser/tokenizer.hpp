/*
 * tokenizer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-15

Description: Indentation aware YAML tokenizer

**************************************************/

#ifndef YCONF_PARSER_TOKENIZER_HPP
#define YCONF_PARSER_TOKENIZER_HPP

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "yconf/parser/token.hpp"

namespace yconf::parser {
/**
 * @brief Lazily splits YAML text into tokens.
 *
 * Indentation is tracked on a stack of columns: a line indented deeper than
 * the top pushes a level and yields Indent, a shallower line pops levels and
 * yields one Dedent per level. The content following a block "- " on the
 * same line opens a level at its own column, so "- key: value" nests like
 * an indented mapping. Inside flow collections line structure is ignored.
 *
 * Block scalars and multi-line plain or quoted scalars are folded here and
 * reach the parser as a single Scalar token.
 *
 * The tokenizer views the input; the text must outlive it.
 */
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    /**
     * @brief Consumes the next token. StreamEnd repeats once reached.
     * @throws error::LexError on malformed input.
     */
    auto next() -> Token;

    /**
     * @brief Looks ahead without consuming. The reference is valid until
     * the next call to next() or peek().
     */
    auto peek(std::size_t offset = 0) -> const Token&;

    /// Restarts from the beginning of the input.
    void reset();

    [[nodiscard]] auto mark() const -> Mark;

private:
    struct Cursor {
        std::size_t pos;
        std::size_t line;
        std::size_t line_start;
    };

    void fetch();
    void scan_line_start();
    void scan_block_token();
    void scan_flow_token();
    void end_line();
    void finish();

    void scan_comment();
    void scan_anchor_or_alias(TokenType type);
    void scan_tag();
    void scan_block_scalar();
    void scan_plain_block();
    void scan_plain_flow();
    auto scan_plain_line(bool flow) -> std::string;
    auto scan_single_quoted() -> std::string;
    auto scan_double_quoted() -> std::string;
    void fold_quoted_break(std::string& text, std::size_t keep);
    void decode_escape(std::string& text);
    auto read_hex(std::size_t offset, std::size_t digits) -> char32_t;
    void push_key_indicator(bool flow, bool adjacent);
    auto try_merge_key() -> bool;

    void push(TokenType type, const Mark& mark, std::string value = {},
              type::ScalarStyle style = type::ScalarStyle::Plain);
    void push_indent(std::size_t column);
    void unwind_to(std::size_t column);

    [[nodiscard]] auto at(std::size_t offset = 0) const -> char;
    [[nodiscard]] auto at_eof(std::size_t offset = 0) const -> bool;
    [[nodiscard]] auto at_eol(std::size_t offset = 0) const -> bool;
    [[nodiscard]] auto at_blank_or_eol(std::size_t offset = 0) const -> bool;
    [[nodiscard]] auto column() const -> std::size_t;
    [[nodiscard]] auto cursor() const -> Cursor;
    void restore(const Cursor& saved);
    void skip_blanks();
    void skip_to_eol();
    void consume_newline();

    std::string_view input_;
    std::size_t pos_{0};
    std::size_t line_{0};
    std::size_t line_start_{0};
    std::vector<std::size_t> indents_{0};
    std::size_t flow_depth_{0};
    bool at_line_start_{true};
    bool line_has_content_{false};
    bool after_dash_{false};
    bool seen_content_{false};
    bool done_{false};
    std::deque<Token> queue_;
};
}  // namespace yconf::parser

#endif  // YCONF_PARSER_TOKENIZER_HPP
