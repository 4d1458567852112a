#include "projection/TreeProjector.hpp"

#include "log/TaggedLogger.hpp"
#include "projection/ScopeFilter.hpp"

#include <string>

namespace MT {

TreeProjector::TreeProjector(OverlayStore const& store)
    : store(store) {}

auto TreeProjector::project(std::optional<std::string_view> scope) const -> EffectiveTree {
    auto const& corpus = this->store.corpus();

    if (!scope || scope->empty()) {
        phmap::flat_hash_set<ClauseId> all;
        all.reserve(corpus.size());
        for (auto const& node : corpus.nodes()) {
            all.insert(node.id);
        }
        auto inScope = all;
        return this->assemble(all, std::move(inScope));
    }

    auto filter = parseScope(*scope, corpus);
    if (!filter) {
        mt_log("Scope '" + std::string{*scope} + "' rejected: " + describeError(filter.error()), "Projector");
        return EffectiveTree{};
    }

    phmap::flat_hash_set<ClauseId> present;
    std::vector<ClauseId>          pending;
    for (auto const& node : corpus.nodes()) {
        if (filter->matches(node)) {
            present.insert(node.id);
            pending.push_back(node.id);
        }
    }
    if (present.empty()) {
        return EffectiveTree{};
    }
    auto inScope = present;

    // Phase 1: ancestors, stopping at a root or at a node already present.
    while (!pending.empty()) {
        auto current = pending.back();
        pending.pop_back();
        auto mother = this->store.effectiveMother(current);
        if (!mother || !corpus.contains(*mother))
            continue;
        if (present.insert(*mother).second) {
            pending.push_back(*mother);
        }
    }

    // Phase 2: siblings of everything present after phase 1, one round only.
    auto const children = buildEffectiveChildren(this->store);
    std::vector<ClauseId> const phaseOne(present.begin(), present.end());
    for (auto id : phaseOne) {
        auto mother = this->store.effectiveMother(id);
        if (!mother)
            continue;
        if (auto it = children.find(*mother); it != children.end()) {
            for (auto sibling : it->second) {
                present.insert(sibling);
            }
        }
    }

    mt_log("Scope '" + std::string{*scope} + "' projected " + std::to_string(inScope.size()) + " in scope, "
               + std::to_string(present.size()) + " listed",
           "Projector");
    return this->assemble(present, std::move(inScope));
}

auto TreeProjector::scopeNodeIds(std::string_view scope) const -> std::vector<ClauseId> {
    std::vector<ClauseId> ids;
    auto const&           corpus = this->store.corpus();
    auto                  filter = parseScope(scope, corpus);
    if (!filter) {
        return ids;
    }
    for (auto const& node : corpus.nodes()) {
        if (filter->matches(node)) {
            ids.push_back(node.id);
        }
    }
    return ids;
}

auto TreeProjector::assemble(phmap::flat_hash_set<ClauseId> const& present,
                             phmap::flat_hash_set<ClauseId>         inScope) const -> EffectiveTree {
    EffectiveTree tree;
    tree.inScope = std::move(inScope);
    tree.nodes.reserve(present.size());
    tree.edges.reserve(present.size());
    tree.mothers.reserve(present.size());

    // Walking the corpus in document order gives the node, edge and children order for free.
    for (auto const& node : this->store.corpus().nodes()) {
        if (!present.contains(node.id))
            continue;
        auto mother = this->store.effectiveMother(node.id);
        tree.nodes.push_back(&node);
        tree.mothers.emplace(node.id, mother);
        tree.edges.push_back(EdgeView{.from   = node.id,
                                      .to     = mother,
                                      .source = this->store.hasOverride(node.id) ? EdgeSource::User
                                                                                 : EdgeSource::Original});
        if (mother && present.contains(*mother)) {
            tree.children[*mother].push_back(node.id);
        }
    }
    return tree;
}

} // namespace MT
