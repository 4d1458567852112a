#pragma once

#include "core/ClauseId.hpp"
#include "overlay/OverlayStore.hpp"
#include "projection/EffectiveTree.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace MT {

/**
 * Builds scoped views of the effective tree (original mothers with the
 * overlay applied).
 *
 * Without a scope every clause is listed and in scope. With a scope the
 * matching clauses are in scope and the view is widened in two phases so the
 * rendered sub-tree stays connected:
 *   1. ancestor closure over effective mothers, up to the roots;
 *   2. one round of siblings (same effective mother) for every node present
 *      after phase 1. Siblings are not expanded further.
 * An unparseable scope yields an empty tree.
 */
class TreeProjector {
public:
    explicit TreeProjector(OverlayStore const& store);

    [[nodiscard]] auto project(std::optional<std::string_view> scope = std::nullopt) const -> EffectiveTree;

    // Ids matching the scope filter alone, in document order.
    [[nodiscard]] auto scopeNodeIds(std::string_view scope) const -> std::vector<ClauseId>;

private:
    [[nodiscard]] auto assemble(phmap::flat_hash_set<ClauseId> const& present,
                                phmap::flat_hash_set<ClauseId> inScope) const -> EffectiveTree;

    OverlayStore const& store;
};

} // namespace MT
