/*
 * serializer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-22

Description: Writes a configuration store back to YAML text

**************************************************/

#include "serializer.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "yconf/store/config_store.hpp"
#include "yconf/store/key_path.hpp"

namespace yconf::store {
namespace {
struct TreeNode {
    std::string key;
    const ConfigEntry* entry{nullptr};
    std::vector<std::size_t> children;
    std::unordered_map<std::string, std::size_t> lookup;
};

struct PendingNode {
    std::size_t node;
    std::size_t column;
    bool item;
};

auto is_plain_safe(std::string_view text) -> bool {
    constexpr std::string_view LEADING_INDICATORS = "-?:,[]{}#&*!|>'\"%@`";
    constexpr std::string_view FORBIDDEN = ",[]{}#:";
    if (text.empty() || text.front() == ' ' || text.back() == ' ' ||
        LEADING_INDICATORS.find(text.front()) != std::string_view::npos ||
        text.starts_with("...")) {
        return false;
    }
    return std::none_of(text.begin(), text.end(), [&](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte < 0x20 || byte == 0x7f ||
               FORBIDDEN.find(c) != std::string_view::npos;
    });
}

auto core_tag(type::ScalarKind kind) -> std::string_view {
    switch (kind) {
        case type::ScalarKind::Null:
            return "!!null";
        case type::ScalarKind::Boolean:
            return "!!bool";
        case type::ScalarKind::Integer:
            return "!!int";
        case type::ScalarKind::Real:
            return "!!float";
        case type::ScalarKind::String:
            return "!!str";
    }
    return "";
}

auto format_flow_array(const ConfigEntry& entry) -> std::string {
    std::string out = "[";
    for (std::size_t i = 0; i < entry.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += format_scalar(entry.element(i));
    }
    out += ']';
    return out;
}

// Children keyed exactly 0..n-1 read back as a sequence, unless they are
// all plain scalars: such a sequence would flatten into one array entry.
auto is_sequence(const std::vector<TreeNode>& nodes, const TreeNode& node)
    -> bool {
    bool nested = false;
    for (std::size_t i = 0; i < node.children.size(); ++i) {
        const auto& child = nodes[node.children[i]];
        if (child.key != std::to_string(i)) {
            return false;
        }
        nested = nested || child.entry == nullptr || child.entry->is_array();
    }
    return nested;
}

auto build_tree(const ConfigStore& store, const SerializeOptions& options)
    -> std::vector<TreeNode> {
    std::vector<TreeNode> nodes(1);
    const auto& filter = options.categories;
    for (const auto& entry : store.entries()) {
        if (!filter.empty() &&
            std::find(filter.begin(), filter.end(),
                      root_key(entry.path(), store.separator())) ==
                filter.end()) {
            continue;
        }
        std::size_t current = 0;
        for (auto& segment : split_path(entry.path(), store.separator())) {
            auto it = nodes[current].lookup.find(segment);
            if (it != nodes[current].lookup.end()) {
                current = it->second;
                continue;
            }
            const auto child = nodes.size();
            nodes[current].lookup.emplace(segment, child);
            nodes[current].children.push_back(child);
            nodes.push_back({std::move(segment), nullptr, {}, {}});
            current = child;
        }
        nodes[current].entry = &entry;
    }
    return nodes;
}
}  // namespace

auto quote(std::string_view text) -> std::string {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\0':
                out += "\\0";
                break;
            default: {
                const auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20 || byte == 0x7f) {
                    out += fmt::format("\\x{:02X}", byte);
                } else {
                    out += c;
                }
            }
        }
    }
    out += '"';
    return out;
}

auto format_scalar(const type::Scalar& scalar) -> std::string {
    const auto kind = scalar.kind();
    const auto& text = scalar.text();
    if (kind == type::ScalarKind::String) {
        if (is_plain_safe(text) &&
            type::classify(text, type::ScalarStyle::Plain) ==
                type::ScalarKind::String) {
            return text;
        }
        return quote(text);
    }
    if (kind == type::ScalarKind::Null) {
        return "null";
    }
    if (type::classify(text, type::ScalarStyle::Plain) == kind) {
        return text;
    }
    return fmt::format("{} {}", core_tag(kind), text);
}

auto format_key(std::string_view key) -> std::string {
    if (key == "<<" || !is_plain_safe(key)) {
        return quote(key);
    }
    return std::string(key);
}

auto write_yaml(const ConfigStore& store, const SerializeOptions& options)
    -> std::string {
    const auto level =
        options.verbose ? spdlog::level::info : spdlog::level::debug;
    const auto indent = static_cast<std::size_t>(std::max(options.indent, 1));
    const auto nodes = build_tree(store, options);

    std::string out;
    if (options.explicit_start) {
        out += "---\n";
    }
    if (nodes.front().children.empty()) {
        out += "{}\n";
        return out;
    }

    // The first line after a "- " takes the dash as its lead.
    std::optional<std::string> lead;
    auto take_lead = [&lead](std::size_t column) {
        std::string result =
            lead ? std::move(*lead) : std::string(column, ' ');
        lead.reset();
        return result;
    };

    std::vector<PendingNode> pending;
    const auto& root = nodes.front().children;
    for (auto it = root.rbegin(); it != root.rend(); ++it) {
        pending.push_back({*it, 0, false});
    }

    std::size_t written = 0;
    while (!pending.empty()) {
        const auto current = pending.back();
        pending.pop_back();
        const auto& node = nodes[current.node];
        const auto* entry = node.entry;

        if (entry != nullptr && options.include_descriptions &&
            !entry->description().empty()) {
            for (const auto& line : split_path(entry->description(), '\n')) {
                out += fmt::format("{:{}}# {}\n", "", current.column, line);
            }
        }

        auto prefix = take_lead(current.column);
        if (current.item) {
            prefix += "- ";
        } else {
            prefix += format_key(node.key) + ":";
        }
        const auto separator = current.item ? "" : " ";

        if (entry == nullptr) {
            const bool sequence = is_sequence(nodes, node);
            std::size_t child_column = current.column + indent;
            if (current.item) {
                lead = std::move(prefix);
                child_column = current.column + 2;
            } else {
                out += prefix + "\n";
            }
            for (auto it = node.children.rbegin(); it != node.children.rend();
                 ++it) {
                pending.push_back({*it, child_column, sequence});
            }
            continue;
        }

        ++written;
        spdlog::log(level, "Writing {}", entry->path());
        if (!entry->is_array()) {
            out += fmt::format("{}{}{}\n", prefix, separator,
                               format_scalar(entry->value()));
        } else if (options.flow_arrays || current.item || entry->size() == 0) {
            out += fmt::format("{}{}{}\n", prefix, separator,
                               format_flow_array(*entry));
        } else {
            out += prefix + "\n";
            for (const auto& element : entry->values()) {
                out += fmt::format("{:{}}- {}\n", "", current.column + indent,
                                   format_scalar(element));
            }
        }
    }
    spdlog::debug("Serialized {} entries", written);
    return out;
}
}  // namespace yconf::store
