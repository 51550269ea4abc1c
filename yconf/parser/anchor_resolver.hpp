/*
 * anchor_resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-16

Description: Anchor registry and merge key expansion

**************************************************/

#ifndef YCONF_PARSER_ANCHOR_RESOLVER_HPP
#define YCONF_PARSER_ANCHOR_RESOLVER_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "yconf/parser/node.hpp"

namespace yconf::parser {
/**
 * @brief Tracks anchors while a document is being built.
 *
 * An anchor is in progress from the moment "&name" is read until the node
 * it names is complete; only then can it be aliased. Aliasing a name that
 * is still in progress would make a node contain itself.
 */
class AnchorResolver {
public:
    explicit AnchorResolver(bool allow_redefinition = true);

    /**
     * @brief Marks an anchor as in progress.
     * @throws error::AnchorError (duplicate) when the name is already in use
     * and redefinition is disabled.
     */
    void begin(const std::string& name, const Mark& mark);

    /// Registers a completed node under its anchor.
    void complete(const std::string& name, NodeId id);

    /**
     * @brief Looks up an alias.
     * @return A non-owning reference to the anchored node.
     * @throws error::AnchorError (cycle) when the anchor is in progress,
     * (undefined) when it has not been declared yet.
     */
    [[nodiscard]] auto resolve(const std::string& name, const Mark& mark) const
        -> NodeRef;

    [[nodiscard]] auto contains(const std::string& name) const -> bool;
    [[nodiscard]] auto in_progress(const std::string& name) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t { return registry_.size(); }
    void clear();

    /**
     * @brief Expands merge sources into a mapping.
     *
     * Keys written in the mapping itself always win. Among the sources a
     * later one overrides an earlier one. The merged pairs are inserted at
     * @p position, where the "<<" key appeared, and refer to the source
     * values without copying them.
     */
    static void apply_merge(NodeArena& arena, NodeId mapping,
                            std::size_t position,
                            const std::vector<NodeId>& sources);

private:
    bool allow_redefinition_;
    std::unordered_map<std::string, NodeId> registry_;
    std::unordered_map<std::string, std::size_t> in_progress_;
};
}  // namespace yconf::parser

#endif  // YCONF_PARSER_ANCHOR_RESOLVER_HPP
