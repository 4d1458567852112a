#pragma once

#include "core/ClauseId.hpp"
#include "corpus/ClauseNode.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace MT {

class OverlayStore;

enum class EdgeSource {
    Original,
    User
};

[[nodiscard]] inline auto edgeSourceToString(EdgeSource source) -> std::string_view {
    return source == EdgeSource::User ? "user" : "original";
}

// Effective mother link of one listed node; `to` is empty for roots.
struct EdgeView {
    ClauseId   from = 0;
    MotherRef  to;
    EdgeSource source = EdgeSource::Original;

    auto operator==(EdgeView const&) const -> bool = default;
};

using ChildrenMap = phmap::flat_hash_map<ClauseId, std::vector<ClauseId>>;

/**
 * Result of one projection.
 *
 * `nodes` holds the in-scope clauses plus the ancestors and siblings pulled in
 * for context, in document order (ascending slotsStart). `edges` has exactly
 * one entry per listed node in the same order. `children` only lists children
 * that are themselves part of the tree.
 */
struct EffectiveTree {
    phmap::flat_hash_set<ClauseId>             inScope;
    std::vector<ClauseNode const*>             nodes;
    std::vector<EdgeView>                      edges;
    phmap::flat_hash_map<ClauseId, MotherRef>  mothers;
    ChildrenMap                                children;

    [[nodiscard]] auto empty() const -> bool { return nodes.empty(); }
    [[nodiscard]] auto size() const -> std::size_t { return nodes.size(); }
    [[nodiscard]] auto contains(ClauseId id) const -> bool { return mothers.contains(id); }
    [[nodiscard]] auto isInScope(ClauseId id) const -> bool { return inScope.contains(id); }
    [[nodiscard]] auto motherOf(ClauseId id) const -> MotherRef;
    [[nodiscard]] auto childrenOf(ClauseId id) const -> std::vector<ClauseId> const&;
};

// Children of every clause under the current effective mothers, each list in
// document order. Rebuilt on every call.
[[nodiscard]] auto buildEffectiveChildren(OverlayStore const& store) -> ChildrenMap;

} // namespace MT
