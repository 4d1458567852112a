#include "projection/TreeProjector.hpp"

#include "support/GenesisFixture.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <vector>

using namespace MT;

namespace {

auto listedIds(EffectiveTree const& tree) -> std::vector<ClauseId> {
    std::vector<ClauseId> ids;
    for (auto const* node : tree.nodes) {
        ids.push_back(node->id);
    }
    return ids;
}

auto edgeFrom(EffectiveTree const& tree, ClauseId id) -> EdgeView const* {
    auto it = std::find_if(tree.edges.begin(), tree.edges.end(), [id](EdgeView const& e) { return e.from == id; });
    return it == tree.edges.end() ? nullptr : &*it;
}

} // namespace

TEST_SUITE("projection.tree") {
    TEST_CASE("no scope lists everything in scope") {
        auto          corpus = Test::genesisCorpus();
        OverlayStore  store(corpus);
        TreeProjector projector(store);

        for (auto scope : {std::optional<std::string_view>{}, std::optional<std::string_view>{""}}) {
            auto tree = projector.project(scope);
            CHECK(tree.size() == corpus.size());
            CHECK(tree.inScope.size() == corpus.size());
            CHECK(tree.edges.size() == corpus.size());
            CHECK(tree.motherOf(427560) == MotherRef{427559});
            CHECK_FALSE(tree.motherOf(427559).has_value());
        }
    }

    TEST_CASE("a blank scope is a parse failure and projects nothing") {
        auto          corpus = Test::genesisCorpus();
        OverlayStore  store(corpus);
        TreeProjector projector(store);

        auto tree = projector.project(std::string_view{"  "});
        CHECK(tree.empty());
        CHECK(tree.edges.empty());
    }

    TEST_CASE("a verse scope pulls in siblings outside the verse") {
        auto          corpus = Test::genesisCorpus();
        OverlayStore  store(corpus);
        TreeProjector projector(store);

        auto tree = projector.project("Genesis.1.4");
        CHECK(listedIds(tree) == std::vector<ClauseId>{427566, 427567, 427568, 427569});
        CHECK(tree.isInScope(427566));
        CHECK(tree.isInScope(427568));
        // Verse 5, listed only as a sibling of 427567 and 427568.
        CHECK(tree.contains(427569));
        CHECK_FALSE(tree.isInScope(427569));
        CHECK(tree.childrenOf(427566) == std::vector<ClauseId>{427567, 427568, 427569});
        CHECK(tree.childrenOf(427569).empty());
    }

    TEST_CASE("siblings are not expanded any further") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);
        store.setMother(427570, 427569);
        TreeProjector projector(store);

        auto tree = projector.project("Genesis.1.4");
        CHECK(tree.contains(427569));
        CHECK_FALSE(tree.contains(427570));
        CHECK(tree.size() == 4);
    }

    TEST_CASE("ancestors outside the scope keep the tree connected") {
        auto          corpus = Test::genesisCorpus();
        OverlayStore  store(corpus);
        TreeProjector projector(store);

        auto tree = projector.project("gen.1.2");
        CHECK(listedIds(tree) == std::vector<ClauseId>{427559, 427560});
        CHECK_FALSE(tree.isInScope(427559));
        CHECK(tree.isInScope(427560));
        for (auto const& edge : tree.edges) {
            if (edge.to) {
                CHECK(tree.contains(*edge.to));
            }
        }
    }

    TEST_CASE("original relationships are preserved") {
        auto          corpus = Test::genesisCorpus();
        OverlayStore  store(corpus);
        TreeProjector projector(store);

        auto tree = projector.project("Gen.1.18");
        auto const* edge = edgeFrom(tree, 427619);
        REQUIRE(edge != nullptr);
        CHECK(edge->to == MotherRef{427618});
        CHECK(edge->source == EdgeSource::Original);
    }

    TEST_CASE("an edit brings new siblings into the view") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);
        // 427562 joins the children of 427559, so 427560 becomes its sibling.
        store.setMother(427562, 427559);
        TreeProjector projector(store);

        auto tree = projector.project("Gen.1.3");
        CHECK(tree.isInScope(427561));
        CHECK(tree.isInScope(427562));
        CHECK(tree.contains(427559));
        CHECK(tree.contains(427560));
        CHECK_FALSE(tree.isInScope(427560));
        CHECK(tree.size() == 4);
        CHECK_FALSE(tree.contains(427566));
        CHECK(edgeFrom(tree, 427562)->source == EdgeSource::User);
    }

    TEST_CASE("edits show up with a user source") {
        auto          corpus = Test::genesisCorpus();
        OverlayStore  store(corpus);
        TreeProjector projector(store);

        store.setMother(427568, 427567);
        auto tree = projector.project("Gen.1.4");
        auto const* edge = edgeFrom(tree, 427568);
        REQUIRE(edge != nullptr);
        CHECK(edge->to == MotherRef{427567});
        CHECK(edge->source == EdgeSource::User);
        CHECK(tree.childrenOf(427567) == std::vector<ClauseId>{427568});

        store.setMother(427568, 427566);
        auto restored = projector.project("Gen.1.4");
        CHECK(edgeFrom(restored, 427568)->source == EdgeSource::Original);
    }

    TEST_CASE("unparseable or empty scopes give an empty tree") {
        auto          corpus = Test::genesisCorpus();
        OverlayStore  store(corpus);
        TreeProjector projector(store);

        CHECK(projector.project("Leviticus.1").empty());
        CHECK(projector.project("Gen.x").empty());
        CHECK(projector.project("Gen.2").empty());
        CHECK(projector.scopeNodeIds("Gen.x").empty());
        CHECK(projector.scopeNodeIds("Gen.1.5") == std::vector<ClauseId>{427569, 427570});
    }

    TEST_CASE("effective children follow document order") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);
        store.setMother(427619, 427566);
        auto children = buildEffectiveChildren(store);
        CHECK(children.at(427566) == std::vector<ClauseId>{427567, 427568, 427569, 427619});
        CHECK_FALSE(children.contains(427618));
    }
}
