#include "overlay/OverlayStore.hpp"

#include "support/GenesisFixture.hpp"

#include <doctest/doctest.h>

#include <set>
#include <string>

using namespace MT;

TEST_SUITE("overlay.store") {
    TEST_CASE("effective mother falls back to the original") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);

        for (auto const& node : corpus.nodes()) {
            CHECK(store.effectiveMother(node.id) == node.originalMother);
            CHECK_FALSE(store.hasOverride(node.id));
        }
        CHECK_FALSE(store.effectiveMother(1).has_value());
        CHECK(store.overrideCount() == 0);
    }

    TEST_CASE("setting the original mother removes the entry") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);

        store.setMother(427568, 427567);
        CHECK(store.effectiveMother(427568) == MotherRef{427567});
        CHECK(store.hasOverride(427568));

        store.setMother(427568, 427566);
        CHECK(store.effectiveMother(427568) == MotherRef{427566});
        CHECK_FALSE(store.hasOverride(427568));
        CHECK(store.overrideCount() == 0);
        // Both commits are recorded even though the overlay ended up empty.
        CHECK(store.historyStats().undoCount == 2);
    }

    TEST_CASE("rootify of a clause that already is a root keeps the overlay empty") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);
        store.setMother(427566, std::nullopt);
        CHECK_FALSE(store.hasOverride(427566));

        store.setMother(427567, std::nullopt);
        CHECK(store.hasOverride(427567));
        CHECK_FALSE(store.effectiveMother(427567).has_value());
    }

    TEST_CASE("undo and redo replay recorded values") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);

        store.setMother(427568, 427567);
        auto undone = store.undo();
        REQUIRE(undone.has_value());
        CHECK(undone->child == 427568);
        CHECK(undone->mother == MotherRef{427566});
        CHECK(store.effectiveMother(427568) == MotherRef{427566});
        CHECK_FALSE(store.hasOverride(427568));

        auto redone = store.redo();
        REQUIRE(redone.has_value());
        CHECK(redone->mother == MotherRef{427567});
        CHECK(store.effectiveMother(427568) == MotherRef{427567});
        CHECK(store.hasOverride(427568));
    }

    TEST_CASE("empty stacks return NoHistory") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);
        auto         before = store.version();

        auto undone = store.undo();
        REQUIRE_FALSE(undone.has_value());
        CHECK(undone.error().code == Error::Code::NoHistory);
        auto redone = store.redo();
        REQUIRE_FALSE(redone.has_value());
        CHECK(redone.error().code == Error::Code::NoHistory);
        CHECK(store.version() == before);
    }

    TEST_CASE("a commit clears the redo stack") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);
        store.setMother(427568, 427567);
        REQUIRE(store.undo().has_value());
        CHECK(store.history().canRedo());

        store.setMother(427569, 427568);
        CHECK_FALSE(store.history().canRedo());
        CHECK(store.redo().error().code == Error::Code::NoHistory);
    }

    TEST_CASE("every change produces a new version") {
        auto                  corpus = Test::genesisCorpus();
        OverlayStore          store(corpus);
        std::set<std::string> seen{store.version()};

        store.setMother(427568, 427567);
        CHECK(seen.insert(store.version()).second);
        REQUIRE(store.undo().has_value());
        CHECK(seen.insert(store.version()).second);
        REQUIRE(store.redo().has_value());
        CHECK(seen.insert(store.version()).second);
        store.reset();
        CHECK(seen.insert(store.version()).second);
        CHECK(store.version().find('#') != std::string::npos);
    }

    TEST_CASE("restore brings back overlay, history and version") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);
        store.setMother(427568, 427567);
        store.setMother(427569, 427568);
        REQUIRE(store.undo().has_value());

        auto saved = store.snapshot();
        auto overlayBefore = store.overlay();
        auto versionBefore = store.version();

        store.setMother(427619, std::nullopt);
        store.setMother(427562, 427559);
        CHECK(store.overrideCount() == 3);

        store.restore(saved);
        CHECK(store.overlay() == overlayBefore);
        CHECK(store.history() == saved.history);
        CHECK(store.version() == versionBefore);
        CHECK(store.history().canRedo());

        // The sequence keeps counting after a restore.
        store.setMother(427619, std::nullopt);
        CHECK(store.version() != versionBefore);
    }

    TEST_CASE("reset drops edits and history") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);
        store.setMother(427568, 427567);
        store.reset();
        CHECK(store.overrideCount() == 0);
        CHECK_FALSE(store.history().canUndo());
        CHECK(store.effectiveMother(427568) == MotherRef{427566});
    }

    TEST_CASE("overlay copies do not alias the store") {
        auto         corpus = Test::genesisCorpus();
        OverlayStore store(corpus);
        store.setMother(427568, 427567);
        auto copy = store.overlay();
        copy.clear();
        CHECK(store.overrideCount() == 1);
    }
}
