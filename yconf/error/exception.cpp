/*
 * exception.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-12

Description: Base exception carrying the throw site and thread

**************************************************/

#include "exception.hpp"

#include <fmt/std.h>

namespace yconf::error {
auto Exception::what() const noexcept -> const char* {
    if (!full_message_.empty()) {
        return full_message_.c_str();
    }
    try {
        full_message_ =
            fmt::format("{}\n  thrown by {}() at {}:{} on thread {}\n{}",
                        message_, func_, file_, line_, thread_id_, details());
    } catch (const std::exception&) {
        return message_.c_str();
    }
    return full_message_.c_str();
}

auto Exception::getFile() const -> std::string { return file_; }

auto Exception::getLine() const -> int { return line_; }

auto Exception::getFunction() const -> std::string { return func_; }

auto Exception::getMessage() const -> std::string { return message_; }

auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }
}  // namespace yconf::error
