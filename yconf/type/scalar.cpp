/*
 * scalar.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-14

Description: Scalar literal classification and typed reads

**************************************************/

#include "scalar.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace yconf::type {
namespace {
auto strip_sign(std::string_view text) -> std::pair<bool, std::string_view> {
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        return {text.front() == '-', text.substr(1)};
    }
    return {false, text};
}

auto all_of(std::string_view text, int base) -> bool {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        const bool ok =
            base == 16 ? std::isxdigit(static_cast<unsigned char>(c)) != 0
                       : c >= '0' && c < static_cast<char>('0' + base);
        if (!ok) {
            return false;
        }
    }
    return true;
}

// Splits "0x1F" into (16, "1F"); decimal digits come back with base 10.
auto split_radix(std::string_view digits) -> std::pair<int, std::string_view> {
    if (digits.size() > 2 && digits[0] == '0') {
        switch (digits[1]) {
            case 'x':
                return {16, digits.substr(2)};
            case 'o':
                return {8, digits.substr(2)};
            case 'b':
                return {2, digits.substr(2)};
            default:
                break;
        }
    }
    return {10, digits};
}

auto is_decimal_digits(std::string_view text) -> bool {
    return all_of(text, 10);
}

auto is_inf_literal(std::string_view text) -> bool {
    auto [negative, body] = strip_sign(text);
    return body == ".inf" || body == ".Inf" || body == ".INF";
}

auto is_nan_literal(std::string_view text) -> bool {
    return text == ".nan" || text == ".NaN" || text == ".NAN";
}

auto equals_ignore_case(std::string_view lhs, std::string_view rhs) -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != rhs[i]) {
            return false;
        }
    }
    return true;
}
}  // namespace

auto to_string(ScalarKind kind) -> std::string_view {
    switch (kind) {
        case ScalarKind::Null:
            return "null";
        case ScalarKind::Boolean:
            return "boolean";
        case ScalarKind::Integer:
            return "integer";
        case ScalarKind::Real:
            return "real";
        case ScalarKind::String:
            return "string";
    }
    return "unknown";
}

auto to_string(ScalarStyle style) -> std::string_view {
    switch (style) {
        case ScalarStyle::Plain:
            return "plain";
        case ScalarStyle::SingleQuoted:
            return "single-quoted";
        case ScalarStyle::DoubleQuoted:
            return "double-quoted";
        case ScalarStyle::Literal:
            return "literal";
        case ScalarStyle::Folded:
            return "folded";
    }
    return "unknown";
}

auto classify(std::string_view text, ScalarStyle style) -> ScalarKind {
    if (style != ScalarStyle::Plain) {
        return ScalarKind::String;
    }
    if (is_null_literal(text)) {
        return ScalarKind::Null;
    }
    if (parse_bool(text).has_value()) {
        return ScalarKind::Boolean;
    }
    if (is_integer_literal(text)) {
        return ScalarKind::Integer;
    }
    if (is_real_literal(text)) {
        return ScalarKind::Real;
    }
    return ScalarKind::String;
}

auto is_null_literal(std::string_view text) -> bool {
    return text.empty() || text == "~" || text == "null" || text == "Null" ||
           text == "NULL";
}

auto parse_bool(std::string_view text) -> std::optional<bool> {
    static constexpr std::array<std::string_view, 3> TRUE_WORDS{"true", "yes",
                                                                "on"};
    static constexpr std::array<std::string_view, 3> FALSE_WORDS{
        "false", "no", "off"};
    for (auto word : TRUE_WORDS) {
        if (equals_ignore_case(text, word)) {
            return true;
        }
    }
    for (auto word : FALSE_WORDS) {
        if (equals_ignore_case(text, word)) {
            return false;
        }
    }
    return std::nullopt;
}

auto is_integer_literal(std::string_view text) -> bool {
    auto [negative, body] = strip_sign(text);
    auto [base, digits] = split_radix(body);
    return all_of(digits, base);
}

auto parse_integer(std::string_view text) -> std::optional<std::int64_t> {
    if (!is_integer_literal(text)) {
        return std::nullopt;
    }
    auto [negative, body] = strip_sign(text);
    auto [base, digits] = split_radix(body);

    std::uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(digits.data(),
                                     digits.data() + digits.size(), magnitude,
                                     base);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }

    constexpr auto MAX = static_cast<std::uint64_t>(
        std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (magnitude > MAX + 1) {
            return std::nullopt;
        }
        if (magnitude == MAX + 1) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return -static_cast<std::int64_t>(magnitude);
    }
    if (magnitude > MAX) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(magnitude);
}

auto is_real_literal(std::string_view text) -> bool {
    if (is_inf_literal(text) || is_nan_literal(text)) {
        return true;
    }
    auto [negative, body] = strip_sign(text);
    if (body.empty()) {
        return false;
    }

    std::size_t pos = 0;
    std::size_t mantissa_digits = 0;
    while (pos < body.size() && std::isdigit(static_cast<unsigned char>(
                                    body[pos])) != 0) {
        ++pos;
        ++mantissa_digits;
    }
    bool has_point = false;
    if (pos < body.size() && body[pos] == '.') {
        has_point = true;
        ++pos;
        while (pos < body.size() && std::isdigit(static_cast<unsigned char>(
                                        body[pos])) != 0) {
            ++pos;
            ++mantissa_digits;
        }
    }
    if (mantissa_digits == 0) {
        return false;
    }

    bool has_exponent = false;
    if (pos < body.size() && (body[pos] == 'e' || body[pos] == 'E')) {
        has_exponent = true;
        ++pos;
        if (pos < body.size() && (body[pos] == '+' || body[pos] == '-')) {
            ++pos;
        }
        if (!is_decimal_digits(body.substr(pos))) {
            return false;
        }
        pos = body.size();
    }
    return pos == body.size() && (has_point || has_exponent);
}

auto parse_real(std::string_view text) -> std::optional<double> {
    if (is_nan_literal(text)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (is_inf_literal(text)) {
        return text.front() == '-' ? -std::numeric_limits<double>::infinity()
                                   : std::numeric_limits<double>::infinity();
    }
    if (is_integer_literal(text)) {
        auto [negative, body] = strip_sign(text);
        auto [base, digits] = split_radix(body);
        if (base != 10) {
            if (auto value = parse_integer(text)) {
                return static_cast<double>(*value);
            }
            return std::nullopt;
        }
    } else if (!is_real_literal(text)) {
        return std::nullopt;
    }

    // from_chars rejects a leading '+'.
    auto [negative, body] = strip_sign(text);
    double value = 0.0;
    auto [ptr, ec] =
        std::from_chars(body.data(), body.data() + body.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::nullopt;
    }
    if (ec != std::errc{} || ptr != body.data() + body.size()) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

auto is_digit_string(std::string_view text) -> bool {
    auto [negative, body] = strip_sign(text);
    return is_decimal_digits(body);
}

auto format_real(double value) -> std::string {
    if (std::isnan(value)) {
        return ".nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? ".inf" : "-.inf";
    }
    auto text = fmt::format("{}", value);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

Scalar::Scalar(std::string text, ScalarStyle style)
    : text_(std::move(text)), style_(style) {}

Scalar::Scalar(std::string text, ScalarStyle style, ScalarKind tagged_kind)
    : text_(std::move(text)), style_(style), tag_(tagged_kind) {}

auto Scalar::kind() const -> ScalarKind {
    if (tag_) {
        return *tag_;
    }
    if (!kind_) {
        kind_ = classify(text_, style_);
    }
    return *kind_;
}

auto Scalar::as_bool() const -> bool {
    if (kind() == ScalarKind::Boolean) {
        if (auto value = parse_bool(text_)) {
            return *value;
        }
    }
    THROW_TYPE_ERROR("cannot read {} '{}' as a boolean", to_string(kind()),
                     text_);
}

auto Scalar::as_int() const -> std::int64_t {
    const auto current = kind();
    if (current == ScalarKind::Integer ||
        (current == ScalarKind::String && is_digit_string(text_))) {
        if (auto value = parse_integer(text_)) {
            return *value;
        }
        THROW_TYPE_ERROR("integer '{}' does not fit in 64 bits", text_);
    }
    THROW_TYPE_ERROR("cannot read {} '{}' as an integer", to_string(current),
                     text_);
}

auto Scalar::as_real() const -> double {
    const auto current = kind();
    if (current == ScalarKind::Integer ||
        (current == ScalarKind::String && is_digit_string(text_))) {
        return static_cast<double>(as_int());
    }
    if (current == ScalarKind::Real) {
        if (auto value = parse_real(text_)) {
            return *value;
        }
        THROW_TYPE_ERROR("real '{}' is out of range", text_);
    }
    THROW_TYPE_ERROR("cannot read {} '{}' as a real", to_string(current),
                     text_);
}

auto Scalar::as_string() const -> const std::string& {
    if (kind() != ScalarKind::String) {
        THROW_TYPE_ERROR("cannot read {} '{}' as a string", to_string(kind()),
                         text_);
    }
    return text_;
}

auto Scalar::same_value(const Scalar& other) const -> bool {
    if (kind() != other.kind()) {
        return false;
    }
    switch (kind()) {
        case ScalarKind::Null:
            return true;
        case ScalarKind::Boolean:
            return parse_bool(text_) == parse_bool(other.text_);
        case ScalarKind::Integer: {
            auto lhs = parse_integer(text_);
            auto rhs = parse_integer(other.text_);
            if (lhs && rhs) {
                return *lhs == *rhs;
            }
            return text_ == other.text_;
        }
        case ScalarKind::Real: {
            auto lhs = parse_real(text_);
            auto rhs = parse_real(other.text_);
            if (lhs && rhs) {
                if (std::isnan(*lhs) && std::isnan(*rhs)) {
                    return true;
                }
                return *lhs == *rhs;
            }
            return text_ == other.text_;
        }
        case ScalarKind::String:
            return text_ == other.text_;
    }
    return false;
}
}  // namespace yconf::type
