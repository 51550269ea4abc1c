/*
 * anchor_resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-16

Description: Anchor registry and merge key expansion

**************************************************/

#include "anchor_resolver.hpp"

#include <algorithm>
#include <cstddef>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace yconf::parser {
AnchorResolver::AnchorResolver(bool allow_redefinition)
    : allow_redefinition_(allow_redefinition) {}

void AnchorResolver::begin(const std::string& name, const Mark& mark) {
    if (contains(name) || in_progress(name)) {
        if (!allow_redefinition_) {
            THROW_ANCHOR_ERROR(error::ErrorCode::AnchorDuplicate, mark,
                               "anchor '{}' is already defined", name);
        }
        spdlog::warn("Anchor '{}' redefined at {}", name, mark.to_string());
    }
    ++in_progress_[name];
}

void AnchorResolver::complete(const std::string& name, NodeId id) {
    if (auto it = in_progress_.find(name); it != in_progress_.end()) {
        if (--it->second == 0) {
            in_progress_.erase(it);
        }
    }
    registry_[name] = id;
}

auto AnchorResolver::resolve(const std::string& name, const Mark& mark) const
    -> NodeRef {
    if (in_progress(name)) {
        THROW_ANCHOR_ERROR(error::ErrorCode::AnchorCycle, mark,
                           "alias '*{}' refers to a node that contains it",
                           name);
    }
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        THROW_ANCHOR_ERROR(error::ErrorCode::AnchorUndefined, mark,
                           "alias '*{}' refers to an undefined anchor", name);
    }
    return {it->second, true};
}

auto AnchorResolver::contains(const std::string& name) const -> bool {
    return registry_.contains(name);
}

auto AnchorResolver::in_progress(const std::string& name) const -> bool {
    return in_progress_.contains(name);
}

void AnchorResolver::clear() {
    registry_.clear();
    in_progress_.clear();
}

void AnchorResolver::apply_merge(NodeArena& arena, NodeId mapping,
                                 std::size_t position,
                                 const std::vector<NodeId>& sources) {
    auto& target = arena.mapping(mapping);
    std::unordered_set<std::string> explicit_keys;
    for (const auto &[key, ref] : target.entries) {
        explicit_keys.insert(key);
    }

    std::vector<std::pair<std::string, NodeRef>> merged;
    std::unordered_map<std::string, std::size_t> merged_index;
    for (NodeId source : sources) {
        for (const auto &[key, ref] : arena.mapping(source).entries) {
            if (explicit_keys.contains(key)) {
                continue;
            }
            const NodeRef shared{ref.id, true};
            if (auto it = merged_index.find(key); it != merged_index.end()) {
                merged[it->second].second = shared;
            } else {
                merged_index.emplace(key, merged.size());
                merged.emplace_back(key, shared);
            }
        }
    }

    position = std::min(position, target.entries.size());
    target.entries.insert(
        target.entries.begin() + static_cast<std::ptrdiff_t>(position),
        merged.begin(), merged.end());
    spdlog::debug("Merged {} keys from {} sources", merged.size(),
                  sources.size());
}
}  // namespace yconf::parser
