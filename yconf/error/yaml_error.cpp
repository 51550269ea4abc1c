/*
 * yaml_error.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-12

Description: Error taxonomy of the YAML configuration parser and store

**************************************************/

#include "yaml_error.hpp"

namespace yconf::error {
auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Lex:
            return "lex error";
        case ErrorCode::Parse:
            return "parse error";
        case ErrorCode::AnchorUndefined:
            return "undefined anchor";
        case ErrorCode::AnchorCycle:
            return "anchor cycle";
        case ErrorCode::AnchorDuplicate:
            return "duplicate anchor";
        case ErrorCode::TypeMismatch:
            return "type mismatch";
        case ErrorCode::KeyNotFound:
            return "key not found";
        case ErrorCode::KeyExists:
            return "key already exists";
        case ErrorCode::InvalidKey:
            return "invalid key";
        case ErrorCode::OutOfBounds:
            return "index out of bounds";
    }
    return "unknown error";
}

auto YamlError::details() const -> std::string {
    auto report = fmt::format("  code: {}\n", to_string(code_));
    if (mark_) {
        report += fmt::format("  source: {}\n", mark_->to_string());
    }
    return report;
}
}  // namespace yconf::error
