/*
 * key_path.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-20

Description: Helpers for separator joined category paths

**************************************************/

#ifndef YCONF_STORE_KEY_PATH_HPP
#define YCONF_STORE_KEY_PATH_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "yconf/options.hpp"

namespace yconf::store {
/**
 * @brief Splits "a%b%c" into its segments. No validation is done.
 */
[[nodiscard]] auto split_path(std::string_view path,
                              char separator = DEFAULT_SEPARATOR)
    -> std::vector<std::string>;

/// "parent%key", or just "key" when the parent is empty.
[[nodiscard]] auto join_path(std::string_view parent, std::string_view key,
                             char separator = DEFAULT_SEPARATOR)
    -> std::string;

/**
 * @brief Trims blanks around every segment.
 * @throws error::KeyError (InvalidKey) for an empty path or segment.
 */
[[nodiscard]] auto normalize_path(std::string_view path,
                                  char separator = DEFAULT_SEPARATOR)
    -> std::string;

/// Non-throwing normalize_path().
[[nodiscard]] auto try_normalize_path(std::string_view path,
                                      char separator = DEFAULT_SEPARATOR)
    -> std::optional<std::string>;

/// Number of separators in the path: 0 for a top-level key.
[[nodiscard]] auto path_depth(std::string_view path,
                              char separator = DEFAULT_SEPARATOR)
    -> std::size_t;

/// Everything before the last separator; empty for a top-level key.
[[nodiscard]] auto parent_path(std::string_view path,
                               char separator = DEFAULT_SEPARATOR)
    -> std::string;

/**
 * @brief Splits a path at its last separator.
 * @return (category, name); the category is empty for a top-level key.
 */
[[nodiscard]] auto split_category(std::string_view path,
                                  char separator = DEFAULT_SEPARATOR)
    -> std::pair<std::string, std::string>;

/// First segment of the path.
[[nodiscard]] auto root_key(std::string_view path,
                            char separator = DEFAULT_SEPARATOR)
    -> std::string;
}  // namespace yconf::store

#endif  // YCONF_STORE_KEY_PATH_HPP
