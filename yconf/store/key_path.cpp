/*
 * key_path.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-20

Description: Helpers for separator joined category paths

**************************************************/

#include "key_path.hpp"

#include <algorithm>

#include "yconf/error/yaml_error.hpp"

namespace yconf::store {
namespace {
auto trim(std::string_view text) -> std::string_view {
    constexpr std::string_view BLANKS = " \t\r\n";
    const auto begin = text.find_first_not_of(BLANKS);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(BLANKS);
    return text.substr(begin, end - begin + 1);
}
}  // namespace

auto split_path(std::string_view path, char separator)
    -> std::vector<std::string> {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        const auto pos = path.find(separator, start);
        if (pos == std::string_view::npos) {
            segments.emplace_back(path.substr(start));
            break;
        }
        segments.emplace_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return segments;
}

auto join_path(std::string_view parent, std::string_view key, char separator)
    -> std::string {
    if (parent.empty()) {
        return std::string(key);
    }
    std::string path;
    path.reserve(parent.size() + key.size() + 1);
    path.append(parent);
    path += separator;
    path.append(key);
    return path;
}

auto try_normalize_path(std::string_view path, char separator)
    -> std::optional<std::string> {
    std::string normalized;
    normalized.reserve(path.size());
    std::size_t start = 0;
    while (true) {
        const auto pos = path.find(separator, start);
        const auto segment =
            trim(path.substr(start, pos == std::string_view::npos
                                        ? std::string_view::npos
                                        : pos - start));
        if (segment.empty()) {
            return std::nullopt;
        }
        normalized.append(segment);
        if (pos == std::string_view::npos) {
            break;
        }
        normalized += separator;
        start = pos + 1;
    }
    return normalized;
}

auto normalize_path(std::string_view path, char separator) -> std::string {
    auto normalized = try_normalize_path(path, separator);
    if (!normalized) {
        THROW_KEY_ERROR(error::ErrorCode::InvalidKey,
                        "invalid path '{}': empty segment", path);
    }
    return std::move(*normalized);
}

auto path_depth(std::string_view path, char separator) -> std::size_t {
    return static_cast<std::size_t>(
        std::count(path.begin(), path.end(), separator));
}

auto parent_path(std::string_view path, char separator) -> std::string {
    const auto pos = path.rfind(separator);
    if (pos == std::string_view::npos) {
        return {};
    }
    return std::string(path.substr(0, pos));
}

auto split_category(std::string_view path, char separator)
    -> std::pair<std::string, std::string> {
    const auto pos = path.rfind(separator);
    if (pos == std::string_view::npos) {
        return {std::string{}, std::string(path)};
    }
    return {std::string(path.substr(0, pos)),
            std::string(path.substr(pos + 1))};
}

auto root_key(std::string_view path, char separator) -> std::string {
    return std::string(path.substr(0, path.find(separator)));
}
}  // namespace yconf::store
