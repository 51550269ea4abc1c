/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-12

Description: Base exception carrying the throw site and thread

**************************************************/

#ifndef YCONF_ERROR_EXCEPTION_HPP
#define YCONF_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "yconf/macro.hpp"

namespace yconf::error {
/**
 * @brief Exception that records where it was thrown.
 *
 * The message is formatted with fmt at construction. The full report
 * returned by what() is rendered on first use; subclasses add lines to it
 * through details().
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              fmt::format_string<Args...> format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()),
          message_(fmt::format(format, std::forward<Args>(args)...)) {}

    virtual ~Exception() = default;

    auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

protected:
    /// Extra report lines, each ending in a newline.
    [[nodiscard]] virtual auto details() const -> std::string { return {}; }

private:
    std::string file_;
    int line_;
    std::string func_;
    std::thread::id thread_id_;
    std::string message_;
    mutable std::string full_message_;
};
}  // namespace yconf::error

#define THROW_EXCEPTION(...)                                        \
    throw yconf::error::Exception(YCONF_FILE_NAME, YCONF_FILE_LINE, \
                                  YCONF_FUNC_NAME, __VA_ARGS__)

#endif  // YCONF_ERROR_EXCEPTION_HPP
