/*
 * config_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-21

Description: Typed hierarchical configuration store

**************************************************/

#include "config_store.hpp"

#include <unordered_set>
#include <utility>

#include "yconf/parser/node_builder.hpp"
#include "yconf/store/key_path.hpp"
#include "yconf/store/serializer.hpp"

namespace yconf::store {
namespace {
struct PendingNode {
    parser::NodeId id;
    std::string path;
};

// Walks the tree with an explicit stack; children are pushed in reverse so
// entries come out in document order.
auto flatten(const parser::Document& document, char separator, bool verbose)
    -> std::vector<ConfigEntry> {
    std::vector<ConfigEntry> entries;
    if (!document.root) {
        return entries;
    }

    const auto& arena = document.arena;
    const auto& root = arena.node(document.root->id);
    if (root.is_scalar()) {
        if (std::get<type::Scalar>(root.data).is_null()) {
            return entries;
        }
        THROW_PARSE_ERROR(root.mark, "the document root must be a mapping");
    }
    if (root.is_sequence()) {
        THROW_PARSE_ERROR(root.mark, "the document root must be a mapping");
    }

    const auto level =
        verbose ? spdlog::level::info : spdlog::level::debug;
    std::vector<PendingNode> pending;
    pending.push_back({document.root->id, {}});
    while (!pending.empty()) {
        auto current = std::move(pending.back());
        pending.pop_back();
        const auto& node = arena.node(current.id);

        if (const auto* scalar = std::get_if<type::Scalar>(&node.data)) {
            spdlog::log(level, "Entry {} = {}", current.path, scalar->text());
            entries.emplace_back(std::move(current.path), *scalar,
                                 std::string{}, EntryOrigin::Parsed);
            continue;
        }

        if (const auto* mapping = std::get_if<parser::MappingNode>(&node.data)) {
            for (auto it = mapping->entries.rbegin();
                 it != mapping->entries.rend(); ++it) {
                pending.push_back(
                    {it->second.id, join_path(current.path, it->first,
                                              separator)});
            }
            continue;
        }

        const auto& items = std::get<parser::SequenceNode>(node.data).items;
        bool all_scalars = true;
        for (const auto& item : items) {
            all_scalars = all_scalars && arena.node(item.id).is_scalar();
        }
        if (all_scalars) {
            std::vector<type::Scalar> values;
            values.reserve(items.size());
            for (const auto& item : items) {
                values.push_back(arena.scalar(item.id));
            }
            spdlog::log(level, "Entry {} = array of {}", current.path,
                        values.size());
            entries.emplace_back(std::move(current.path), std::move(values),
                                 std::string{}, EntryOrigin::Parsed);
            continue;
        }
        for (std::size_t i = items.size(); i-- > 0;) {
            pending.push_back(
                {items[i].id,
                 join_path(current.path, std::to_string(i), separator)});
        }
    }
    return entries;
}
}  // namespace

ConfigStore::ConfigStore(char separator) : separator_(separator) {}

auto ConfigStore::from_yaml(std::string_view text, const ParseOptions& options)
    -> ConfigStore {
    ConfigStore store(options.separator);
    store.load(text, options);
    return store;
}

void ConfigStore::load(std::string_view text, const ParseOptions& options) {
    spdlog::debug("Loading configuration ({} bytes)", text.size());
    auto effective = options;
    effective.separator = separator_;
    try {
        const auto document = parser::parse_document(text, effective);
        insert_all(flatten(document, separator_, options.verbose));
    } catch (const error::YamlError& e) {
        spdlog::error("Failed to load configuration: {}", e.getMessage());
        throw;
    }
    spdlog::debug("Configuration holds {} entries", entries_.size());
}

auto ConfigStore::merge(const ConfigStore& base, const ConfigStore& overlay)
    -> ConfigStore {
    if (base.separator_ != overlay.separator_) {
        THROW_KEY_ERROR(error::ErrorCode::InvalidKey,
                        "cannot merge stores with separators '{}' and '{}'",
                        base.separator_, overlay.separator_);
    }
    ConfigStore merged = base;
    std::size_t replaced = 0;
    for (const auto& entry : overlay.entries_) {
        if (auto it = merged.index_.find(entry.path());
            it != merged.index_.end()) {
            merged.entries_[it->second] = entry;
            ++replaced;
        } else {
            merged.insert(entry);
        }
    }
    spdlog::debug("Merged {} entries over {} ({} replaced)",
                  overlay.size(), base.size(), replaced);
    return merged;
}

void ConfigStore::add(std::string_view path, const char* value,
                      std::string_view description) {
    add(path, std::string(value), description);
}

void ConfigStore::update(std::string_view path, const char* value) {
    update(path, std::string(value));
}

auto ConfigStore::check(std::string_view path) const -> bool {
    const auto normalized = try_normalize_path(path, separator_);
    return normalized && index_.contains(*normalized);
}

auto ConfigStore::get_size(std::string_view path) const -> std::size_t {
    return entry(path).size();
}

auto ConfigStore::get_type(std::string_view path) const -> type::ScalarKind {
    return entry(path).kind();
}

auto ConfigStore::is_array(std::string_view path) const -> bool {
    return entry(path).is_array();
}

auto ConfigStore::description(std::string_view path) const
    -> const std::string& {
    return entry(path).description();
}

auto ConfigStore::find(std::string_view path) const -> const ConfigEntry* {
    const auto normalized = try_normalize_path(path, separator_);
    if (!normalized) {
        return nullptr;
    }
    auto it = index_.find(*normalized);
    return it == index_.end() ? nullptr : &entries_[it->second];
}

auto ConfigStore::entry(std::string_view path) const -> const ConfigEntry& {
    const auto normalized = normalize(path);
    auto it = index_.find(normalized);
    if (it == index_.end()) {
        spdlog::error("Entry not found: {}", normalized);
        THROW_KEY_ERROR(error::ErrorCode::KeyNotFound, "'{}' not found",
                        normalized);
    }
    return entries_[it->second];
}

auto ConfigStore::mutable_entry(std::string_view path) -> ConfigEntry& {
    const auto& found = std::as_const(*this).entry(path);
    return entries_[index_.at(found.path())];
}

auto ConfigStore::categories() const -> std::vector<std::string> {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& item : entries_) {
        auto category = parent_path(item.path(), separator_);
        if (!category.empty() && seen.insert(category).second) {
            result.push_back(std::move(category));
        }
    }
    return result;
}

auto ConfigStore::root_keys() const -> std::vector<std::string> {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& item : entries_) {
        auto key = root_key(item.path(), separator_);
        if (seen.insert(key).second) {
            result.push_back(std::move(key));
        }
    }
    return result;
}

auto ConfigStore::serialize(const SerializeOptions& options) const
    -> std::string {
    return write_yaml(*this, options);
}

void ConfigStore::destroy() noexcept {
    spdlog::debug("Destroying configuration with {} entries", entries_.size());
    std::vector<ConfigEntry>().swap(entries_);
    std::unordered_map<std::string, std::size_t>().swap(index_);
    std::unordered_map<std::string, std::size_t>().swap(prefixes_);
}

void ConfigStore::insert(ConfigEntry entry) {
    std::vector<ConfigEntry> single;
    single.push_back(std::move(entry));
    insert_all(std::move(single));
}

void ConfigStore::insert_all(std::vector<ConfigEntry> entries) {
    // Validate everything first so a failure leaves the store untouched.
    std::unordered_set<std::string> staged;
    std::unordered_set<std::string> staged_prefixes;
    for (const auto& item : entries) {
        const auto& path = item.path();
        if (index_.contains(path) || staged.contains(path)) {
            spdlog::warn("Entry already exists: {}", path);
            THROW_KEY_ERROR(error::ErrorCode::KeyExists,
                            "'{}' already exists", path);
        }
        if (prefixes_.contains(path) || staged_prefixes.contains(path)) {
            spdlog::warn("Entry would shadow a category: {}", path);
            THROW_KEY_ERROR(error::ErrorCode::KeyExists,
                            "'{}' is already a category", path);
        }
        for (auto parent = parent_path(path, separator_); !parent.empty();
             parent = parent_path(parent, separator_)) {
            if (index_.contains(parent) || staged.contains(parent)) {
                spdlog::warn("Entry would nest under a value: {}", path);
                THROW_KEY_ERROR(error::ErrorCode::KeyExists,
                                "'{}' cannot be nested under the value '{}'",
                                path, parent);
            }
            staged_prefixes.insert(parent);
        }
        staged.insert(path);
    }

    entries_.reserve(entries_.size() + entries.size());
    for (auto& item : entries) {
        spdlog::debug("Adding entry: {}", item.path());
        entries_.push_back(std::move(item));
        index_entry(entries_.size() - 1);
    }
}

void ConfigStore::index_entry(std::size_t position) {
    const auto& path = entries_[position].path();
    index_.emplace(path, position);
    for (auto parent = parent_path(path, separator_); !parent.empty();
         parent = parent_path(parent, separator_)) {
        ++prefixes_[parent];
    }
}

auto ConfigStore::normalize(std::string_view path) const -> std::string {
    return normalize_path(path, separator_);
}
}  // namespace yconf::store
