/*
 * serializer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-22

Description: Writes a configuration store back to YAML text

**************************************************/

#ifndef YCONF_STORE_SERIALIZER_HPP
#define YCONF_STORE_SERIALIZER_HPP

#include <string>
#include <string_view>

#include "yconf/options.hpp"
#include "yconf/type/scalar.hpp"

namespace yconf::store {
class ConfigStore;

/**
 * @brief Rebuilds the key hierarchy of @p store and writes it as block YAML.
 *
 * Runs of children keyed 0, 1, 2... below the root are written as block
 * sequences, so index segments produced by flattening read back to the same
 * paths. Arrays nested directly in a sequence are always written in flow
 * style.
 */
[[nodiscard]] auto write_yaml(const ConfigStore& store,
                              const SerializeOptions& options = {})
    -> std::string;

/**
 * @brief Text of a scalar that reads back with the same kind and value.
 *
 * Strings are double-quoted when the plain form would be classified as
 * something else or clash with YAML syntax; other kinds get a core tag when
 * their text alone would be misread (a real written as "1").
 */
[[nodiscard]] auto format_scalar(const type::Scalar& scalar) -> std::string;

/// A mapping key, quoted when the plain form is not safe.
[[nodiscard]] auto format_key(std::string_view key) -> std::string;

/// Double-quoted form of @p text with escapes applied.
[[nodiscard]] auto quote(std::string_view text) -> std::string;
}  // namespace yconf::store

#endif  // YCONF_STORE_SERIALIZER_HPP
