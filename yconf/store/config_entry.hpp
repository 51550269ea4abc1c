/*
 * config_entry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-20

Description: One addressable leaf of the configuration store

**************************************************/

#ifndef YCONF_STORE_CONFIG_ENTRY_HPP
#define YCONF_STORE_CONFIG_ENTRY_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "yconf/error/yaml_error.hpp"
#include "yconf/type/scalar.hpp"

namespace yconf::store {
enum class EntryOrigin { Parsed, Api };

[[nodiscard]] auto to_string(EntryOrigin origin) -> std::string_view;

/**
 * @brief A scalar or an array of scalars stored under a category path.
 *
 * Each element keeps its own literal kind, so arrays may be heterogeneous;
 * typed reads validate the elements they touch.
 */
class ConfigEntry {
public:
    ConfigEntry(std::string path, type::Scalar value,
                std::string description = {},
                EntryOrigin origin = EntryOrigin::Api);
    ConfigEntry(std::string path, std::vector<type::Scalar> values,
                std::string description = {},
                EntryOrigin origin = EntryOrigin::Api);

    [[nodiscard]] auto path() const -> const std::string& { return path_; }
    [[nodiscard]] auto description() const -> const std::string& {
        return description_;
    }
    void set_description(std::string description) {
        description_ = std::move(description);
    }
    [[nodiscard]] auto origin() const -> EntryOrigin { return origin_; }
    [[nodiscard]] auto is_array() const -> bool { return array_; }

    /// Element count; 1 for a scalar entry.
    [[nodiscard]] auto size() const -> std::size_t { return values_.size(); }

    [[nodiscard]] auto values() const -> const std::vector<type::Scalar>& {
        return values_;
    }

    /**
     * @throws error::TypeError if the entry is an array.
     */
    [[nodiscard]] auto value() const -> const type::Scalar&;

    /**
     * @throws error::BoundsError if @p index is past the end.
     */
    [[nodiscard]] auto element(std::size_t index) const
        -> const type::Scalar&;

    /**
     * @brief Kind shared by every element. An empty array reports Null.
     * @throws error::TypeError for a heterogeneous array.
     */
    [[nodiscard]] auto kind() const -> type::ScalarKind;
    [[nodiscard]] auto is_homogeneous() const -> bool;

    template <type::ScalarValue T>
    [[nodiscard]] auto as() const -> T;

    template <type::ScalarValue T>
    [[nodiscard]] auto as_array() const -> std::vector<T>;

    template <type::ScalarValue T>
    [[nodiscard]] auto element_as(std::size_t index) const -> T;

    /**
     * @brief Replaces the value of a scalar entry.
     *
     * A null entry takes any kind and an integer may replace a real (it is
     * stored as a real). Any other change of kind is rejected.
     * @throws error::TypeError on a kind or shape mismatch.
     */
    void assign(type::Scalar value);

    /**
     * @brief Replaces the elements of an array entry. The length may
     * change; element kinds follow the rules of assign(type::Scalar).
     */
    void assign(std::vector<type::Scalar> values);

    [[nodiscard]] auto same_value(const ConfigEntry& other) const -> bool;

private:
    template <type::ScalarValue T>
    auto read(const type::Scalar& scalar) const -> T;
    auto compatible(type::ScalarKind current, type::Scalar& incoming) const
        -> bool;

    std::string path_;
    std::vector<type::Scalar> values_;
    bool array_;
    std::string description_;
    EntryOrigin origin_;
};

// Rethrows a scalar read failure with the entry path attached.
template <type::ScalarValue T>
auto ConfigEntry::read(const type::Scalar& scalar) const -> T {
    try {
        return scalar.as<T>();
    } catch (const error::TypeError& e) {
        THROW_TYPE_ERROR("'{}': {}", path_, e.getMessage());
    }
}

template <type::ScalarValue T>
auto ConfigEntry::as() const -> T {
    return read<T>(value());
}

template <type::ScalarValue T>
auto ConfigEntry::as_array() const -> std::vector<T> {
    if (!array_) {
        THROW_TYPE_ERROR("'{}' is a scalar, not an array", path_);
    }
    std::vector<T> result;
    result.reserve(values_.size());
    for (const auto& scalar : values_) {
        result.push_back(read<T>(scalar));
    }
    return result;
}

template <type::ScalarValue T>
auto ConfigEntry::element_as(std::size_t index) const -> T {
    return read<T>(element(index));
}
}  // namespace yconf::store

#endif  // YCONF_STORE_CONFIG_ENTRY_HPP
