/*
 * yaml_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-12

Description: Error taxonomy of the YAML configuration parser and store

**************************************************/

#ifndef YCONF_ERROR_YAML_ERROR_HPP
#define YCONF_ERROR_YAML_ERROR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "yconf/error/exception.hpp"

namespace yconf {
/**
 * @brief Position inside the source text, 1-based.
 */
struct Mark {
    std::size_t line{1};
    std::size_t column{1};

    [[nodiscard]] auto to_string() const -> std::string {
        return "line " + std::to_string(line) + ", column " +
               std::to_string(column);
    }

    auto operator==(const Mark&) const -> bool = default;
};
}  // namespace yconf

namespace yconf::error {
enum class ErrorCode {
    Lex,
    Parse,
    AnchorUndefined,
    AnchorCycle,
    AnchorDuplicate,
    TypeMismatch,
    KeyNotFound,
    KeyExists,
    InvalidKey,
    OutOfBounds
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

/**
 * @brief Root of every error raised while parsing or accessing a store.
 *
 * Errors raised from the source text carry the mark they were detected at;
 * the mark is appended to the message.
 */
class YamlError : public Exception {
public:
    template <typename... Args>
    YamlError(const char* file, int line, const char* func, ErrorCode code,
              const Mark& mark, fmt::format_string<Args...> format,
              Args&&... args)
        : Exception(file, line, func, "{} at {}",
                    fmt::format(format, std::forward<Args>(args)...),
                    mark.to_string()),
          code_(code),
          mark_(mark) {}

    template <typename... Args>
    YamlError(const char* file, int line, const char* func, ErrorCode code,
              fmt::format_string<Args...> format, Args&&... args)
        : Exception(file, line, func, format, std::forward<Args>(args)...),
          code_(code) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto mark() const noexcept -> const std::optional<Mark>& {
        return mark_;
    }

protected:
    [[nodiscard]] auto details() const -> std::string override;

private:
    ErrorCode code_;
    std::optional<Mark> mark_;
};

class LexError : public YamlError {
public:
    using YamlError::YamlError;
};

class ParseError : public YamlError {
public:
    using YamlError::YamlError;
};

class AnchorError : public YamlError {
public:
    using YamlError::YamlError;
};

class TypeError : public YamlError {
public:
    using YamlError::YamlError;
};

class KeyError : public YamlError {
public:
    using YamlError::YamlError;
};

class BoundsError : public YamlError {
public:
    using YamlError::YamlError;
};
}  // namespace yconf::error

#define THROW_LEX_ERROR(mark, ...)                                        \
    throw yconf::error::LexError(YCONF_FILE_NAME, YCONF_FILE_LINE,        \
                                 YCONF_FUNC_NAME,                         \
                                 yconf::error::ErrorCode::Lex, mark,      \
                                 __VA_ARGS__)

#define THROW_PARSE_ERROR(mark, ...)                                      \
    throw yconf::error::ParseError(YCONF_FILE_NAME, YCONF_FILE_LINE,      \
                                   YCONF_FUNC_NAME,                       \
                                   yconf::error::ErrorCode::Parse, mark,  \
                                   __VA_ARGS__)

#define THROW_ANCHOR_ERROR(code, mark, ...)                               \
    throw yconf::error::AnchorError(YCONF_FILE_NAME, YCONF_FILE_LINE,     \
                                    YCONF_FUNC_NAME, code, mark,          \
                                    __VA_ARGS__)

#define THROW_TYPE_ERROR(...)                                             \
    throw yconf::error::TypeError(YCONF_FILE_NAME, YCONF_FILE_LINE,       \
                                  YCONF_FUNC_NAME,                        \
                                  yconf::error::ErrorCode::TypeMismatch,  \
                                  __VA_ARGS__)

#define THROW_KEY_ERROR(code, ...)                                        \
    throw yconf::error::KeyError(YCONF_FILE_NAME, YCONF_FILE_LINE,        \
                                 YCONF_FUNC_NAME, code, __VA_ARGS__)

#define THROW_BOUNDS_ERROR(...)                                           \
    throw yconf::error::BoundsError(YCONF_FILE_NAME, YCONF_FILE_LINE,     \
                                    YCONF_FUNC_NAME,                      \
                                    yconf::error::ErrorCode::OutOfBounds, \
                                    __VA_ARGS__)

#endif  // YCONF_ERROR_YAML_ERROR_HPP
