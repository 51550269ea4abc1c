/*
 * options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-14

Description: Parse and serialize options

**************************************************/

#ifndef YCONF_OPTIONS_HPP
#define YCONF_OPTIONS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace yconf {
inline constexpr char DEFAULT_SEPARATOR = '%';
inline constexpr std::size_t DEFAULT_MAX_DEPTH = 256;

/**
 * @brief Options for turning YAML text into a store.
 */
struct ParseOptions {
    char separator{DEFAULT_SEPARATOR};     ///< Joins nested keys into paths.
    std::size_t max_depth{DEFAULT_MAX_DEPTH};  ///< Open collections limit.
    bool allow_anchor_redefinition{true};  ///< Later anchors replace earlier.
    bool verbose{false};                   ///< Per-entry logging at info.
};

/**
 * @brief Options for writing a store back to YAML.
 */
struct SerializeOptions {
    int indent{2};
    bool explicit_start{false};        ///< Emit a leading "---".
    bool include_descriptions{false};  ///< Descriptions become comments.
    bool flow_arrays{true};            ///< Arrays as [a, b] instead of "- a".
    std::vector<std::string> categories;  ///< Top-level sections to emit.
    bool verbose{false};
};
}  // namespace yconf

#endif  // YCONF_OPTIONS_HPP
