/*
 * scalar.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-14

Description: Scalar literal classification and typed reads

**************************************************/

#ifndef YCONF_TYPE_SCALAR_HPP
#define YCONF_TYPE_SCALAR_HPP

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "yconf/error/yaml_error.hpp"

namespace yconf::type {
enum class ScalarKind { Null, Boolean, Integer, Real, String };

enum class ScalarStyle { Plain, SingleQuoted, DoubleQuoted, Literal, Folded };

/**
 * @brief Value types that can be stored in and read from a scalar.
 */
template <typename T>
concept ScalarValue =
    std::same_as<T, bool> || std::same_as<T, std::string> ||
    std::floating_point<T> ||
    (std::integral<T> && !std::same_as<T, char> &&
     !std::same_as<T, wchar_t> && !std::same_as<T, char8_t> &&
     !std::same_as<T, char16_t> && !std::same_as<T, char32_t>);

[[nodiscard]] auto to_string(ScalarKind kind) -> std::string_view;
[[nodiscard]] auto to_string(ScalarStyle style) -> std::string_view;

/**
 * @brief Infers the literal kind of a scalar.
 *
 * Quoted and block scalars are always strings. Plain scalars are tested for
 * null, boolean, integer and real literals in that order; anything else is
 * a string.
 */
[[nodiscard]] auto classify(std::string_view text,
                            ScalarStyle style = ScalarStyle::Plain)
    -> ScalarKind;

[[nodiscard]] auto is_null_literal(std::string_view text) -> bool;
[[nodiscard]] auto parse_bool(std::string_view text) -> std::optional<bool>;

/**
 * @brief Tests the integer literal grammar: an optional sign followed by
 * decimal digits, or a 0x, 0o or 0b prefixed hex, octal or binary number.
 */
[[nodiscard]] auto is_integer_literal(std::string_view text) -> bool;

/**
 * @brief Parses an integer literal.
 * @return The value, or nothing when the text is not an integer literal or
 * the value does not fit in 64 bits.
 */
[[nodiscard]] auto parse_integer(std::string_view text)
    -> std::optional<std::int64_t>;

[[nodiscard]] auto is_real_literal(std::string_view text) -> bool;

/**
 * @brief Parses a real or integer literal, including .inf and .nan.
 */
[[nodiscard]] auto parse_real(std::string_view text) -> std::optional<double>;

/**
 * @brief True for a non-empty run of decimal digits with an optional sign.
 */
[[nodiscard]] auto is_digit_string(std::string_view text) -> bool;

/**
 * @brief Shortest text for a double that still reads back as a real.
 */
[[nodiscard]] auto format_real(double value) -> std::string;

/**
 * @brief A scalar as it appeared in the source: raw text plus style.
 *
 * The literal kind is inferred on first use and cached. A tagged scalar, or
 * one built from a C++ value, carries its kind explicitly.
 */
class Scalar {
public:
    Scalar() = default;
    Scalar(std::string text, ScalarStyle style);
    Scalar(std::string text, ScalarStyle style, ScalarKind tagged_kind);

    template <ScalarValue T>
    static auto from(const T& value) -> Scalar {
        if constexpr (std::same_as<T, bool>) {
            return {value ? "true" : "false", ScalarStyle::Plain,
                    ScalarKind::Boolean};
        } else if constexpr (std::same_as<T, std::string>) {
            return {value, ScalarStyle::DoubleQuoted, ScalarKind::String};
        } else if constexpr (std::floating_point<T>) {
            return {format_real(static_cast<double>(value)),
                    ScalarStyle::Plain, ScalarKind::Real};
        } else {
            return {fmt::format("{}", value), ScalarStyle::Plain,
                    ScalarKind::Integer};
        }
    }

    [[nodiscard]] auto text() const -> const std::string& { return text_; }
    [[nodiscard]] auto style() const -> ScalarStyle { return style_; }
    [[nodiscard]] auto kind() const -> ScalarKind;
    [[nodiscard]] auto is_tagged() const -> bool { return tag_.has_value(); }
    [[nodiscard]] auto is_null() const -> bool {
        return kind() == ScalarKind::Null;
    }

    /**
     * @brief Reads the scalar as a C++ value.
     *
     * Integers widen to reals, digit-only strings are read as numbers, and
     * integral requests narrower than 64 bits are range checked.
     * @throws error::TypeError when the kinds do not match or the value is
     * out of range.
     */
    template <ScalarValue T>
    [[nodiscard]] auto as() const -> T {
        if constexpr (std::same_as<T, bool>) {
            return as_bool();
        } else if constexpr (std::same_as<T, std::string>) {
            return as_string();
        } else if constexpr (std::floating_point<T>) {
            return static_cast<T>(as_real());
        } else {
            const auto value = as_int();
            if (!std::in_range<T>(value)) {
                THROW_TYPE_ERROR("integer {} is out of range for the "
                                 "requested type",
                                 value);
            }
            return static_cast<T>(value);
        }
    }

    [[nodiscard]] auto as_bool() const -> bool;
    [[nodiscard]] auto as_int() const -> std::int64_t;
    [[nodiscard]] auto as_real() const -> double;
    [[nodiscard]] auto as_string() const -> const std::string&;

    /**
     * @brief Value equality: same kind and same decoded value. The source
     * spelling and style are ignored, and NaN equals NaN.
     */
    [[nodiscard]] auto same_value(const Scalar& other) const -> bool;

private:
    std::string text_;
    ScalarStyle style_{ScalarStyle::Plain};
    std::optional<ScalarKind> tag_;
    mutable std::optional<ScalarKind> kind_;
};
}  // namespace yconf::type

#endif  // YCONF_TYPE_SCALAR_HPP
