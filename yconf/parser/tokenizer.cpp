/*
 * tokenizer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-15

Description: Indentation aware YAML tokenizer

**************************************************/

#include "tokenizer.hpp"

#include <spdlog/spdlog.h>

namespace yconf::parser {
namespace {
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

auto is_blank(char c) -> bool { return c == ' ' || c == '\t'; }

auto is_flow_indicator(char c) -> bool {
    return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
}

auto is_hex_digit(char c) -> bool {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

auto hex_value(char c) -> char32_t {
    if (c >= '0' && c <= '9') {
        return static_cast<char32_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<char32_t>(c - 'a' + 10);
    }
    return static_cast<char32_t>(c - 'A' + 10);
}

void append_utf8(std::string& out, char32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

auto is_document_marker(std::string_view rest) -> bool {
    return (rest.starts_with("---") || rest.starts_with("...")) &&
           (rest.size() == 3 || is_blank(rest[3]) || rest[3] == '\n' ||
            rest[3] == '\r');
}

enum class Chomping { Clip, Strip, Keep };
}  // namespace

auto to_string(TokenType type) -> std::string_view {
    switch (type) {
        case TokenType::StreamEnd:
            return "end of stream";
        case TokenType::DocumentStart:
            return "'---'";
        case TokenType::DocumentEnd:
            return "'...'";
        case TokenType::Indent:
            return "indentation";
        case TokenType::Dedent:
            return "dedent";
        case TokenType::NewLine:
            return "line break";
        case TokenType::Scalar:
            return "scalar";
        case TokenType::MappingKey:
            return "':'";
        case TokenType::MergeKey:
            return "'<<'";
        case TokenType::SequenceItem:
            return "'-'";
        case TokenType::FlowSequenceStart:
            return "'['";
        case TokenType::FlowSequenceEnd:
            return "']'";
        case TokenType::FlowMappingStart:
            return "'{'";
        case TokenType::FlowMappingEnd:
            return "'}'";
        case TokenType::Comma:
            return "','";
        case TokenType::Anchor:
            return "anchor";
        case TokenType::Alias:
            return "alias";
        case TokenType::Tag:
            return "tag";
        case TokenType::Comment:
            return "comment";
    }
    return "unknown token";
}

Tokenizer::Tokenizer(std::string_view input) : input_(input) { reset(); }

auto Tokenizer::next() -> Token {
    if (queue_.empty()) {
        fetch();
    }
    Token token = std::move(queue_.front());
    queue_.pop_front();
    return token;
}

auto Tokenizer::peek(std::size_t offset) -> const Token& {
    while (queue_.size() <= offset) {
        fetch();
    }
    return queue_[offset];
}

void Tokenizer::reset() {
    pos_ = 0;
    line_ = 0;
    line_start_ = 0;
    if (input_.starts_with(UTF8_BOM)) {
        pos_ = line_start_ = UTF8_BOM.size();
    }
    indents_.assign(1, 0);
    flow_depth_ = 0;
    at_line_start_ = true;
    line_has_content_ = false;
    after_dash_ = false;
    seen_content_ = false;
    done_ = false;
    queue_.clear();
}

auto Tokenizer::mark() const -> Mark { return {line_ + 1, column() + 1}; }

void Tokenizer::fetch() {
    const auto before = queue_.size();
    while (queue_.size() == before) {
        if (done_) {
            push(TokenType::StreamEnd, mark());
            return;
        }
        if (at_line_start_ && flow_depth_ == 0) {
            scan_line_start();
            continue;
        }
        skip_blanks();
        if (at_eol()) {
            end_line();
            continue;
        }
        if (at() == '#') {
            scan_comment();
            continue;
        }
        if (flow_depth_ > 0) {
            scan_flow_token();
        } else {
            scan_block_token();
        }
    }
}

void Tokenizer::scan_line_start() {
    std::size_t indent = 0;
    while (at(indent) == ' ') {
        ++indent;
    }
    std::size_t first = indent;
    while (is_blank(at(first))) {
        ++first;
    }

    if (at_eol(first)) {
        pos_ += first;
        end_line();
        return;
    }
    if (at(first) == '#') {
        pos_ += first;
        at_line_start_ = false;
        scan_comment();
        return;
    }
    if (at(indent) == '\t') {
        pos_ += indent;
        THROW_LEX_ERROR(mark(), "tab character used for indentation");
    }

    pos_ += indent;
    at_line_start_ = false;
    if (indent == 0) {
        const auto rest = input_.substr(pos_);
        if (is_document_marker(rest)) {
            unwind_to(0);
            push(rest.front() == '-' ? TokenType::DocumentStart
                                     : TokenType::DocumentEnd,
                 mark());
            pos_ += 3;
            seen_content_ = true;
            return;
        }
        if (at() == '%' && !seen_content_) {
            spdlog::debug("Skipping directive on line {}", line_ + 1);
            skip_to_eol();
            return;
        }
    }
    seen_content_ = true;
    unwind_to(indent);
    push_indent(indent);
}

void Tokenizer::scan_block_token() {
    const char c = at();
    if (after_dash_) {
        after_dash_ = false;
        if (c != '|' && c != '>') {
            push_indent(column());
        }
    }

    const auto start = mark();
    switch (c) {
        case '-':
            if (at_blank_or_eol(1)) {
                push(TokenType::SequenceItem, start);
                queue_.back().indent = column();
                ++pos_;
                after_dash_ = true;
                return;
            }
            break;
        case '?':
            if (at_blank_or_eol(1)) {
                THROW_LEX_ERROR(start, "explicit '?' keys are not supported");
            }
            break;
        case ':':
            if (at_blank_or_eol(1)) {
                push(TokenType::MappingKey, start);
                ++pos_;
                return;
            }
            break;
        case '[':
            push(TokenType::FlowSequenceStart, start);
            ++pos_;
            ++flow_depth_;
            return;
        case '{':
            push(TokenType::FlowMappingStart, start);
            ++pos_;
            ++flow_depth_;
            return;
        case ']':
        case '}':
        case ',':
            THROW_LEX_ERROR(start, "unexpected '{}' outside a flow collection",
                            c);
        case '"':
            push(TokenType::Scalar, start, scan_double_quoted(),
                 type::ScalarStyle::DoubleQuoted);
            push_key_indicator(false, false);
            return;
        case '\'':
            push(TokenType::Scalar, start, scan_single_quoted(),
                 type::ScalarStyle::SingleQuoted);
            push_key_indicator(false, false);
            return;
        case '&':
            scan_anchor_or_alias(TokenType::Anchor);
            return;
        case '*':
            scan_anchor_or_alias(TokenType::Alias);
            push_key_indicator(false, false);
            return;
        case '!':
            scan_tag();
            return;
        case '|':
        case '>':
            scan_block_scalar();
            return;
        case '<':
            if (try_merge_key()) {
                return;
            }
            break;
        case '@':
        case '`':
            THROW_LEX_ERROR(start, "reserved indicator '{}' cannot start a "
                            "plain scalar", c);
        default:
            break;
    }
    scan_plain_block();
}

void Tokenizer::scan_flow_token() {
    const char c = at();
    const auto start = mark();
    switch (c) {
        case '[':
            push(TokenType::FlowSequenceStart, start);
            ++pos_;
            ++flow_depth_;
            return;
        case '{':
            push(TokenType::FlowMappingStart, start);
            ++pos_;
            ++flow_depth_;
            return;
        case ']':
            push(TokenType::FlowSequenceEnd, start);
            ++pos_;
            --flow_depth_;
            return;
        case '}':
            push(TokenType::FlowMappingEnd, start);
            ++pos_;
            --flow_depth_;
            return;
        case ',':
            push(TokenType::Comma, start);
            ++pos_;
            return;
        case ':':
            if (at_blank_or_eol(1) || is_flow_indicator(at(1))) {
                push(TokenType::MappingKey, start);
                ++pos_;
                return;
            }
            break;
        case '?':
            if (at_blank_or_eol(1)) {
                THROW_LEX_ERROR(start, "explicit '?' keys are not supported");
            }
            break;
        case '"':
            push(TokenType::Scalar, start, scan_double_quoted(),
                 type::ScalarStyle::DoubleQuoted);
            push_key_indicator(true, true);
            return;
        case '\'':
            push(TokenType::Scalar, start, scan_single_quoted(),
                 type::ScalarStyle::SingleQuoted);
            push_key_indicator(true, true);
            return;
        case '&':
            scan_anchor_or_alias(TokenType::Anchor);
            return;
        case '*':
            scan_anchor_or_alias(TokenType::Alias);
            push_key_indicator(true, false);
            return;
        case '!':
            scan_tag();
            return;
        case '|':
        case '>':
            THROW_LEX_ERROR(start,
                            "block scalars are not allowed inside flow "
                            "collections");
        case '<':
            if (try_merge_key()) {
                return;
            }
            break;
        case '@':
        case '`':
            THROW_LEX_ERROR(start, "reserved indicator '{}' cannot start a "
                            "plain scalar", c);
        default:
            break;
    }
    scan_plain_flow();
}

void Tokenizer::end_line() {
    if (flow_depth_ == 0 && line_has_content_) {
        push(TokenType::NewLine, mark());
    }
    line_has_content_ = false;
    after_dash_ = false;
    if (at_eof()) {
        finish();
        return;
    }
    consume_newline();
    at_line_start_ = flow_depth_ == 0;
}

void Tokenizer::finish() {
    if (flow_depth_ == 0) {
        while (indents_.size() > 1) {
            indents_.pop_back();
            push(TokenType::Dedent, mark());
            queue_.back().indent = indents_.back();
        }
    }
    push(TokenType::StreamEnd, mark());
    done_ = true;
}

void Tokenizer::scan_comment() {
    const auto start = mark();
    ++pos_;
    const auto begin = pos_;
    skip_to_eol();
    auto text = input_.substr(begin, pos_ - begin);
    while (!text.empty() && is_blank(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_blank(text.back())) {
        text.remove_suffix(1);
    }
    push(TokenType::Comment, start, std::string(text));
}

void Tokenizer::scan_anchor_or_alias(TokenType type) {
    const auto start = mark();
    ++pos_;
    const auto begin = pos_;
    while (!at_blank_or_eol() && !is_flow_indicator(at())) {
        ++pos_;
    }
    if (pos_ == begin) {
        THROW_LEX_ERROR(start, "empty {} name",
                        type == TokenType::Anchor ? "anchor" : "alias");
    }
    push(type, start, std::string(input_.substr(begin, pos_ - begin)));
}

void Tokenizer::scan_tag() {
    const auto start = mark();
    const auto begin = pos_;
    ++pos_;
    while (!at_blank_or_eol() &&
           !(flow_depth_ > 0 && is_flow_indicator(at()))) {
        ++pos_;
    }
    push(TokenType::Tag, start, std::string(input_.substr(begin, pos_ - begin)));
}

void Tokenizer::scan_block_scalar() {
    const auto start = mark();
    const auto style = at() == '|' ? type::ScalarStyle::Literal
                                   : type::ScalarStyle::Folded;
    ++pos_;

    auto chomping = Chomping::Clip;
    bool chomping_set = false;
    std::size_t explicit_indent = 0;
    for (int i = 0; i < 2; ++i) {
        const char c = at();
        if ((c == '+' || c == '-') && !chomping_set) {
            chomping = c == '+' ? Chomping::Keep : Chomping::Strip;
            chomping_set = true;
            ++pos_;
        } else if (c >= '1' && c <= '9' && explicit_indent == 0) {
            explicit_indent = static_cast<std::size_t>(c - '0');
            ++pos_;
        } else {
            break;
        }
    }
    if (!at_blank_or_eol()) {
        THROW_LEX_ERROR(mark(), "invalid block scalar header");
    }
    skip_blanks();
    if (at() == '#') {
        skip_to_eol();
    }

    const std::size_t parent = indents_.back();
    if (!at_eof()) {
        consume_newline();
    }

    std::size_t content_indent = parent + explicit_indent;
    if (explicit_indent == 0) {
        content_indent = 0;
        std::size_t offset = 0;
        while (!at_eof(offset)) {
            std::size_t spaces = 0;
            while (at(offset + spaces) == ' ') {
                ++spaces;
            }
            if (at_eol(offset + spaces)) {
                if (at_eof(offset + spaces)) {
                    break;
                }
                offset += spaces + (at(offset + spaces) == '\r' &&
                                            at(offset + spaces + 1) == '\n'
                                        ? 2
                                        : 1);
                continue;
            }
            content_indent = spaces;
            break;
        }
    }

    std::vector<std::string> lines;
    if (content_indent > parent) {
        while (!at_eof()) {
            std::size_t spaces = 0;
            while (at(spaces) == ' ') {
                ++spaces;
            }
            if (at_eol(spaces)) {
                lines.emplace_back();
                pos_ += spaces;
                if (at_eof()) {
                    break;
                }
                consume_newline();
                continue;
            }
            if (spaces < content_indent) {
                break;
            }
            pos_ += content_indent;
            const auto begin = pos_;
            skip_to_eol();
            lines.emplace_back(input_.substr(begin, pos_ - begin));
            if (at_eof()) {
                break;
            }
            consume_newline();
        }
    }

    std::size_t last = lines.size();
    while (last > 0 && lines[last - 1].empty()) {
        --last;
    }
    const std::size_t trailing = lines.size() - last;

    std::string text;
    if (style == type::ScalarStyle::Literal) {
        for (std::size_t i = 0; i < last; ++i) {
            if (i > 0) {
                text += '\n';
            }
            text += lines[i];
        }
    } else {
        bool first = true;
        bool previous_more_indented = false;
        std::size_t breaks = 0;
        for (std::size_t i = 0; i < last; ++i) {
            const auto& line = lines[i];
            if (line.empty()) {
                ++breaks;
                continue;
            }
            const bool more_indented = is_blank(line.front());
            const bool keep_break = more_indented || previous_more_indented;
            if (first) {
                text.append(breaks, '\n');
            } else if (breaks == 0) {
                text += keep_break ? '\n' : ' ';
            } else {
                text.append(breaks + (keep_break ? 1 : 0), '\n');
            }
            text += line;
            breaks = 0;
            previous_more_indented = more_indented;
            first = false;
        }
    }

    if (last > 0) {
        if (chomping != Chomping::Strip) {
            text += '\n';
        }
        if (chomping == Chomping::Keep) {
            text.append(trailing, '\n');
        }
    } else if (chomping == Chomping::Keep) {
        text.append(trailing, '\n');
    }

    push(TokenType::Scalar, start, std::move(text), style);
    push(TokenType::NewLine, mark());
    line_has_content_ = false;
    after_dash_ = false;
    at_line_start_ = true;
}

auto Tokenizer::scan_plain_line(bool flow) -> std::string {
    const auto begin = pos_;
    auto end = pos_;
    while (!at_eol()) {
        const char c = at();
        if (c == ':' &&
            (at_blank_or_eol(1) || (flow && is_flow_indicator(at(1))))) {
            break;
        }
        if (c == '#' && pos_ > begin && is_blank(input_[pos_ - 1])) {
            break;
        }
        if (flow && is_flow_indicator(c)) {
            break;
        }
        ++pos_;
        if (!is_blank(c)) {
            end = pos_;
        }
    }
    pos_ = end;
    return std::string(input_.substr(begin, end - begin));
}

void Tokenizer::scan_plain_block() {
    const auto start = mark();
    const auto start_column = column();
    auto text = scan_plain_line(false);

    std::size_t gap = 0;
    while (is_blank(at(gap))) {
        ++gap;
    }
    if (at(gap) == ':' && at_blank_or_eol(gap + 1)) {
        push(TokenType::Scalar, start, std::move(text));
        pos_ += gap;
        push(TokenType::MappingKey, mark());
        ++pos_;
        return;
    }
    if (!at_eol(gap)) {
        push(TokenType::Scalar, start, std::move(text));
        return;
    }

    // Continuation lines must be indented deeper than the enclosing level.
    // A scalar that opens its own level folds against the level below it.
    long threshold = static_cast<long>(indents_.back());
    if (start_column == indents_.back()) {
        threshold = indents_.size() > 1
                        ? static_cast<long>(indents_[indents_.size() - 2])
                        : -1;
    }

    while (true) {
        const auto saved = cursor();
        pos_ += gap;
        std::size_t breaks = 0;
        bool accepted = false;
        while (!at_eof()) {
            consume_newline();
            std::size_t indent = 0;
            while (at(indent) == ' ') {
                ++indent;
            }
            std::size_t first = indent;
            while (is_blank(at(first))) {
                ++first;
            }
            if (at_eol(first)) {
                if (at_eof(first)) {
                    break;
                }
                pos_ += first;
                ++breaks;
                continue;
            }
            if (at(first) == '#' || at(indent) == '\t' ||
                static_cast<long>(indent) <= threshold) {
                break;
            }
            if (indent == 0 && is_document_marker(input_.substr(pos_))) {
                break;
            }
            pos_ += first;
            auto piece = scan_plain_line(false);
            std::size_t key_gap = 0;
            while (is_blank(at(key_gap))) {
                ++key_gap;
            }
            if (at(key_gap) == ':' && at_blank_or_eol(key_gap + 1)) {
                break;
            }
            if (breaks == 0) {
                text += ' ';
            } else {
                text.append(breaks, '\n');
            }
            text += piece;
            accepted = true;
            break;
        }
        if (!accepted) {
            restore(saved);
            break;
        }
        gap = 0;
        while (is_blank(at(gap))) {
            ++gap;
        }
        if (!at_eol(gap)) {
            break;
        }
    }
    push(TokenType::Scalar, start, std::move(text));
}

void Tokenizer::scan_plain_flow() {
    const auto start = mark();
    auto text = scan_plain_line(true);

    while (true) {
        std::size_t gap = 0;
        while (is_blank(at(gap))) {
            ++gap;
        }
        if (!at_eol(gap) || at_eof(gap)) {
            break;
        }
        const auto saved = cursor();
        pos_ += gap;
        std::size_t breaks = 0;
        while (true) {
            consume_newline();
            skip_blanks();
            if (at_eol() && !at_eof()) {
                ++breaks;
                continue;
            }
            break;
        }
        const char c = at();
        if (at_eof() || c == '#' || is_flow_indicator(c) ||
            (c == ':' &&
             (at_blank_or_eol(1) || is_flow_indicator(at(1))))) {
            restore(saved);
            break;
        }
        if (breaks == 0) {
            text += ' ';
        } else {
            text.append(breaks, '\n');
        }
        text += scan_plain_line(true);
    }
    push(TokenType::Scalar, start, std::move(text));
    push_key_indicator(true, false);
}

auto Tokenizer::scan_single_quoted() -> std::string {
    const auto start = mark();
    ++pos_;
    std::string text;
    while (true) {
        if (at_eof()) {
            THROW_LEX_ERROR(start, "unterminated single-quoted scalar");
        }
        const char c = at();
        if (c == '\'') {
            if (at(1) == '\'') {
                text += '\'';
                pos_ += 2;
                continue;
            }
            ++pos_;
            break;
        }
        if (at_eol()) {
            fold_quoted_break(text, 0);
            continue;
        }
        text += c;
        ++pos_;
    }
    return text;
}

auto Tokenizer::scan_double_quoted() -> std::string {
    const auto start = mark();
    ++pos_;
    std::string text;
    // Characters produced by escapes are never trimmed by line folding.
    std::size_t keep = 0;
    while (true) {
        if (at_eof()) {
            THROW_LEX_ERROR(start, "unterminated double-quoted scalar");
        }
        const char c = at();
        if (c == '"') {
            ++pos_;
            break;
        }
        if (c == '\\') {
            if (at_eol(1) && !at_eof(1)) {
                ++pos_;
                consume_newline();
                skip_blanks();
            } else {
                decode_escape(text);
            }
            keep = text.size();
            continue;
        }
        if (at_eol()) {
            fold_quoted_break(text, keep);
            continue;
        }
        text += c;
        ++pos_;
    }
    return text;
}

void Tokenizer::fold_quoted_break(std::string& text, std::size_t keep) {
    while (text.size() > keep && is_blank(text.back())) {
        text.pop_back();
    }
    consume_newline();
    std::size_t breaks = 0;
    while (true) {
        skip_blanks();
        if (at_eol() && !at_eof()) {
            consume_newline();
            ++breaks;
            continue;
        }
        break;
    }
    if (breaks == 0) {
        text += ' ';
    } else {
        text.append(breaks, '\n');
    }
}

void Tokenizer::decode_escape(std::string& text) {
    const auto start = mark();
    const char escape = at(1);
    std::size_t length = 2;
    switch (escape) {
        case '0':
            text += '\0';
            break;
        case 'a':
            text += '\a';
            break;
        case 'b':
            text += '\b';
            break;
        case 't':
        case '\t':
            text += '\t';
            break;
        case 'n':
            text += '\n';
            break;
        case 'v':
            text += '\v';
            break;
        case 'f':
            text += '\f';
            break;
        case 'r':
            text += '\r';
            break;
        case 'e':
            text += '\x1B';
            break;
        case ' ':
            text += ' ';
            break;
        case '"':
            text += '"';
            break;
        case '/':
            text += '/';
            break;
        case '\\':
            text += '\\';
            break;
        case 'N':
            append_utf8(text, 0x85);
            break;
        case '_':
            append_utf8(text, 0xA0);
            break;
        case 'L':
            append_utf8(text, 0x2028);
            break;
        case 'P':
            append_utf8(text, 0x2029);
            break;
        case 'x':
            append_utf8(text, read_hex(2, 2));
            length = 4;
            break;
        case 'u': {
            char32_t code_point = read_hex(2, 4);
            length = 6;
            if (code_point >= 0xD800 && code_point <= 0xDBFF) {
                if (at(6) != '\\' || at(7) != 'u') {
                    THROW_LEX_ERROR(start, "incomplete surrogate pair");
                }
                const char32_t low = read_hex(8, 4);
                if (low < 0xDC00 || low > 0xDFFF) {
                    THROW_LEX_ERROR(start, "invalid surrogate pair");
                }
                code_point =
                    0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
                length = 12;
            } else if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
                THROW_LEX_ERROR(start, "unpaired low surrogate");
            }
            append_utf8(text, code_point);
            break;
        }
        case 'U': {
            const char32_t code_point = read_hex(2, 8);
            if (code_point > 0x10FFFF ||
                (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                THROW_LEX_ERROR(start, "invalid code point in escape");
            }
            append_utf8(text, code_point);
            length = 10;
            break;
        }
        default:
            THROW_LEX_ERROR(start, "invalid escape sequence '\\{}'", escape);
    }
    pos_ += length;
}

auto Tokenizer::read_hex(std::size_t offset, std::size_t digits) -> char32_t {
    char32_t value = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        const char c = at(offset + i);
        if (at_eof(offset + i) || !is_hex_digit(c)) {
            THROW_LEX_ERROR(mark(), "invalid hexadecimal escape");
        }
        value = (value << 4) | hex_value(c);
    }
    return value;
}

void Tokenizer::push_key_indicator(bool flow, bool adjacent) {
    std::size_t gap = 0;
    while (is_blank(at(gap))) {
        ++gap;
    }
    if (at(gap) != ':') {
        return;
    }
    const bool indicator =
        at_blank_or_eol(gap + 1) ||
        (flow && (adjacent || is_flow_indicator(at(gap + 1))));
    if (!indicator) {
        return;
    }
    pos_ += gap;
    push(TokenType::MappingKey, mark());
    ++pos_;
}

auto Tokenizer::try_merge_key() -> bool {
    if (at(1) != '<') {
        return false;
    }
    std::size_t gap = 2;
    while (is_blank(at(gap))) {
        ++gap;
    }
    if (at(gap) != ':' ||
        !(at_blank_or_eol(gap + 1) ||
          (flow_depth_ > 0 && is_flow_indicator(at(gap + 1))))) {
        return false;
    }
    push(TokenType::MergeKey, mark());
    pos_ += gap;
    push(TokenType::MappingKey, mark());
    ++pos_;
    return true;
}

void Tokenizer::push(TokenType type, const Mark& mark, std::string value,
                     type::ScalarStyle style) {
    switch (type) {
        case TokenType::Comment:
        case TokenType::Indent:
        case TokenType::Dedent:
        case TokenType::NewLine:
        case TokenType::StreamEnd:
            break;
        default:
            line_has_content_ = true;
            break;
    }
    Token token;
    token.type = type;
    token.value = std::move(value);
    token.style = style;
    token.mark = mark;
    queue_.push_back(std::move(token));
}

void Tokenizer::push_indent(std::size_t column) {
    if (column > indents_.back()) {
        indents_.push_back(column);
        push(TokenType::Indent, mark());
        queue_.back().indent = column;
    }
}

void Tokenizer::unwind_to(std::size_t column) {
    while (column < indents_.back()) {
        indents_.pop_back();
        push(TokenType::Dedent, mark());
        queue_.back().indent = indents_.back();
    }
}

auto Tokenizer::at(std::size_t offset) const -> char {
    return pos_ + offset < input_.size() ? input_[pos_ + offset] : '\0';
}

auto Tokenizer::at_eof(std::size_t offset) const -> bool {
    return pos_ + offset >= input_.size();
}

auto Tokenizer::at_eol(std::size_t offset) const -> bool {
    if (at_eof(offset)) {
        return true;
    }
    const char c = at(offset);
    return c == '\n' || c == '\r';
}

auto Tokenizer::at_blank_or_eol(std::size_t offset) const -> bool {
    return at_eol(offset) || is_blank(at(offset));
}

auto Tokenizer::column() const -> std::size_t { return pos_ - line_start_; }

auto Tokenizer::cursor() const -> Cursor { return {pos_, line_, line_start_}; }

void Tokenizer::restore(const Cursor& saved) {
    pos_ = saved.pos;
    line_ = saved.line;
    line_start_ = saved.line_start;
}

void Tokenizer::skip_blanks() {
    while (is_blank(at())) {
        ++pos_;
    }
}

void Tokenizer::skip_to_eol() {
    while (!at_eol()) {
        ++pos_;
    }
}

void Tokenizer::consume_newline() {
    if (at() == '\r') {
        ++pos_;
    }
    if (at() == '\n') {
        ++pos_;
    }
    ++line_;
    line_start_ = pos_;
}
}  // namespace yconf::parser
