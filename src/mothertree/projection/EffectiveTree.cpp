#include "projection/EffectiveTree.hpp"

#include "overlay/OverlayStore.hpp"

namespace MT {

auto EffectiveTree::motherOf(ClauseId id) const -> MotherRef {
    if (auto it = mothers.find(id); it != mothers.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto EffectiveTree::childrenOf(ClauseId id) const -> std::vector<ClauseId> const& {
    static std::vector<ClauseId> const none;
    if (auto it = children.find(id); it != children.end()) {
        return it->second;
    }
    return none;
}

auto buildEffectiveChildren(OverlayStore const& store) -> ChildrenMap {
    ChildrenMap children;
    // Corpus nodes are already in document order, so every list comes out sorted.
    for (auto const& node : store.corpus().nodes()) {
        if (auto mother = store.effectiveMother(node.id)) {
            children[*mother].push_back(node.id);
        }
    }
    return children;
}

} // namespace MT
