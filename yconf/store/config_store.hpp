/*
 * config_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-21

Description: Typed hierarchical configuration store

**************************************************/

#ifndef YCONF_STORE_CONFIG_STORE_HPP
#define YCONF_STORE_CONFIG_STORE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "yconf/error/yaml_error.hpp"
#include "yconf/options.hpp"
#include "yconf/store/config_entry.hpp"
#include "yconf/type/scalar.hpp"

namespace yconf::store {
/**
 * @brief Flat, ordered view of a YAML configuration.
 *
 * Nested mapping keys are joined with the category separator, so
 * "solver: {tolerance: 1e-6}" is stored under "solver%tolerance". A
 * sequence of scalars becomes one array entry; a sequence holding
 * collections contributes its index as a path segment. Entries keep
 * insertion order.
 *
 * The store is not synchronized.
 */
class ConfigStore {
public:
    explicit ConfigStore(char separator = DEFAULT_SEPARATOR);

    /**
     * @brief Parses YAML text into a new store using options.separator.
     * @throws error::LexError, error::ParseError, error::AnchorError
     */
    [[nodiscard]] static auto from_yaml(std::string_view text,
                                        const ParseOptions& options = {})
        -> ConfigStore;

    /**
     * @brief Parses YAML text and adds its entries to this store, using the
     * store's own separator. Nothing is added if any step fails.
     * @throws error::KeyError (KeyExists) if a parsed path is already
     * present, plus the errors of from_yaml().
     */
    void load(std::string_view text, const ParseOptions& options = {});

    /**
     * @brief Combines two stores. Entries of @p overlay replace entries of
     * @p base with the same path; new paths are appended.
     */
    [[nodiscard]] static auto merge(const ConfigStore& base,
                                    const ConfigStore& overlay)
        -> ConfigStore;

    /**
     * @throws error::KeyError (KeyNotFound) if the path is missing,
     * error::TypeError if the value cannot be read as T.
     */
    template <type::ScalarValue T>
    [[nodiscard]] auto get(std::string_view path) const -> T;

    template <type::ScalarValue T>
    [[nodiscard]] auto get_array(std::string_view path) const
        -> std::vector<T>;

    /**
     * @throws error::BoundsError if @p index is past the end.
     */
    template <type::ScalarValue T>
    [[nodiscard]] auto get_element(std::string_view path,
                                   std::size_t index) const -> T;

    /// Like get(), but returns nothing instead of throwing.
    template <type::ScalarValue T>
    [[nodiscard]] auto try_get(std::string_view path) const
        -> std::optional<T>;

    /**
     * @throws error::KeyError (KeyExists) if the path is present or clashes
     * with the hierarchy of an existing entry.
     */
    template <type::ScalarValue T>
    void add(std::string_view path, const T& value,
             std::string_view description = {});
    void add(std::string_view path, const char* value,
             std::string_view description = {});
    template <type::ScalarValue T>
    void add(std::string_view path, const std::vector<T>& values,
             std::string_view description = {});

    /**
     * @brief Returns the stored value, adding @p default_value first if the
     * path is missing.
     */
    template <type::ScalarValue T>
    auto add_get(std::string_view path, const T& default_value,
                 std::string_view description = {}) -> T;
    template <type::ScalarValue T>
    auto add_get(std::string_view path, const std::vector<T>& default_values,
                 std::string_view description = {}) -> std::vector<T>;

    /**
     * @throws error::KeyError (KeyNotFound) if the path is missing,
     * error::TypeError if the kind or shape changes incompatibly.
     */
    template <type::ScalarValue T>
    void update(std::string_view path, const T& value);
    void update(std::string_view path, const char* value);
    template <type::ScalarValue T>
    void update(std::string_view path, const std::vector<T>& values);

    /// True iff get() would not fail with KeyNotFound. Never throws.
    [[nodiscard]] auto check(std::string_view path) const -> bool;

    [[nodiscard]] auto get_size(std::string_view path) const -> std::size_t;
    [[nodiscard]] auto get_type(std::string_view path) const
        -> type::ScalarKind;
    [[nodiscard]] auto is_array(std::string_view path) const -> bool;
    [[nodiscard]] auto description(std::string_view path) const
        -> const std::string&;

    [[nodiscard]] auto find(std::string_view path) const
        -> const ConfigEntry*;
    [[nodiscard]] auto entry(std::string_view path) const
        -> const ConfigEntry&;

    [[nodiscard]] auto entries() const -> const std::vector<ConfigEntry>& {
        return entries_;
    }
    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }
    [[nodiscard]] auto separator() const -> char { return separator_; }

    /// Distinct parent paths of all entries, in first-seen order.
    [[nodiscard]] auto categories() const -> std::vector<std::string>;

    /// Distinct top-level keys, in first-seen order.
    [[nodiscard]] auto root_keys() const -> std::vector<std::string>;

    /**
     * @brief Writes the store as YAML. Anchors are not reconstructed and
     * merged keys are written out in full.
     */
    [[nodiscard]] auto serialize(const SerializeOptions& options = {}) const
        -> std::string;

    /// Releases every entry; the store is empty afterwards.
    void destroy() noexcept;

private:
    void insert(ConfigEntry entry);
    void insert_all(std::vector<ConfigEntry> entries);
    void index_entry(std::size_t position);
    auto mutable_entry(std::string_view path) -> ConfigEntry&;
    [[nodiscard]] auto normalize(std::string_view path) const -> std::string;

    template <type::ScalarValue T>
    static auto to_scalars(const std::vector<T>& values)
        -> std::vector<type::Scalar>;

    char separator_;
    std::vector<ConfigEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
    // Proper prefixes of every path; an entry may not sit on one.
    std::unordered_map<std::string, std::size_t> prefixes_;
};

template <type::ScalarValue T>
auto ConfigStore::get(std::string_view path) const -> T {
    const auto& target = entry(path);
    try {
        return target.as<T>();
    } catch (const error::TypeError& e) {
        spdlog::error("Type mismatch for '{}': {}", target.path(),
                      e.getMessage());
        throw;
    }
}

template <type::ScalarValue T>
auto ConfigStore::get_array(std::string_view path) const -> std::vector<T> {
    const auto& target = entry(path);
    try {
        return target.as_array<T>();
    } catch (const error::TypeError& e) {
        spdlog::error("Type mismatch for '{}': {}", target.path(),
                      e.getMessage());
        throw;
    }
}

template <type::ScalarValue T>
auto ConfigStore::get_element(std::string_view path, std::size_t index) const
    -> T {
    const auto& target = entry(path);
    try {
        return target.element_as<T>(index);
    } catch (const error::YamlError& e) {
        spdlog::error("Cannot read element {} of '{}': {}", index,
                      target.path(), e.getMessage());
        throw;
    }
}

template <type::ScalarValue T>
auto ConfigStore::try_get(std::string_view path) const -> std::optional<T> {
    const auto* target = find(path);
    if (target == nullptr || target->is_array()) {
        return std::nullopt;
    }
    try {
        return target->as<T>();
    } catch (const error::TypeError& e) {
        spdlog::debug("try_get on '{}' failed: {}", target->path(),
                      e.getMessage());
        return std::nullopt;
    }
}

template <type::ScalarValue T>
void ConfigStore::add(std::string_view path, const T& value,
                      std::string_view description) {
    insert(ConfigEntry(normalize(path), type::Scalar::from(value),
                       std::string(description), EntryOrigin::Api));
}

template <type::ScalarValue T>
void ConfigStore::add(std::string_view path, const std::vector<T>& values,
                      std::string_view description) {
    insert(ConfigEntry(normalize(path), to_scalars(values),
                       std::string(description), EntryOrigin::Api));
}

template <type::ScalarValue T>
auto ConfigStore::add_get(std::string_view path, const T& default_value,
                          std::string_view description) -> T {
    const auto normalized = normalize(path);
    if (find(normalized) != nullptr) {
        return get<T>(normalized);
    }
    add(normalized, default_value, description);
    return default_value;
}

template <type::ScalarValue T>
auto ConfigStore::add_get(std::string_view path,
                          const std::vector<T>& default_values,
                          std::string_view description) -> std::vector<T> {
    const auto normalized = normalize(path);
    if (find(normalized) != nullptr) {
        return get_array<T>(normalized);
    }
    add(normalized, default_values, description);
    return default_values;
}

template <type::ScalarValue T>
void ConfigStore::update(std::string_view path, const T& value) {
    auto& target = mutable_entry(path);
    try {
        target.assign(type::Scalar::from(value));
    } catch (const error::TypeError& e) {
        spdlog::error("Cannot update '{}': {}", target.path(), e.getMessage());
        throw;
    }
    spdlog::debug("Updated entry: {}", target.path());
}

template <type::ScalarValue T>
void ConfigStore::update(std::string_view path, const std::vector<T>& values) {
    auto& target = mutable_entry(path);
    try {
        target.assign(to_scalars(values));
    } catch (const error::TypeError& e) {
        spdlog::error("Cannot update '{}': {}", target.path(), e.getMessage());
        throw;
    }
    spdlog::debug("Updated array entry: {} ({} elements)", target.path(),
                  values.size());
}

template <type::ScalarValue T>
auto ConfigStore::to_scalars(const std::vector<T>& values)
    -> std::vector<type::Scalar> {
    std::vector<type::Scalar> scalars;
    scalars.reserve(values.size());
    for (const auto& value : values) {
        scalars.push_back(type::Scalar::from(static_cast<T>(value)));
    }
    return scalars;
}
}  // namespace yconf::store

#endif  // YCONF_STORE_CONFIG_STORE_HPP
