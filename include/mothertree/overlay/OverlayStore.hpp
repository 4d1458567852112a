#pragma once

#include "core/ClauseId.hpp"
#include "core/Error.hpp"
#include "corpus/CorpusSnapshot.hpp"
#include "history/MotherHistory.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

#include <parallel_hashmap/phmap.h>

namespace MT {

using OverlayMap = phmap::flat_hash_map<ClauseId, MotherRef>;

// Full, independent copy of the mutable overlay state. Only used for batch rollback.
struct OverlaySnapshot {
    OverlayMap             overlay;
    History::MotherHistory history;
    std::string            version;
};

// Child and the mother value an undo/redo step applied to it.
struct HistoryStep {
    ClauseId  child = 0;
    MotherRef mother;
};

/**
 * Sparse map of user overridden mother links on top of a CorpusSnapshot, plus
 * the undo/redo journal and the version token.
 *
 * - Minimal overlay: an entry exists only while the effective mother differs
 *   from the original one.
 * - No validation happens here; callers run MutationValidator first.
 * - Single writer: there is no internal locking. The corpus must outlive the store.
 */
class OverlayStore {
public:
    explicit OverlayStore(CorpusSnapshot const& corpus);

    OverlayStore(OverlayStore const&)            = delete;
    OverlayStore& operator=(OverlayStore const&) = delete;

    [[nodiscard]] auto effectiveMother(ClauseId id) const -> MotherRef;
    [[nodiscard]] auto hasOverride(ClauseId id) const -> bool { return overrides.contains(id); }
    [[nodiscard]] auto overrideCount() const -> std::size_t { return overrides.size(); }
    [[nodiscard]] auto overlay() const -> OverlayMap { return overrides; }

    void setMother(ClauseId child, MotherRef newMother);

    [[nodiscard]] auto undo() -> Expected<HistoryStep>;
    [[nodiscard]] auto redo() -> Expected<HistoryStep>;

    [[nodiscard]] auto snapshot() const -> OverlaySnapshot;
    void restore(OverlaySnapshot snapshot);

    // Drops every edit and the whole history.
    void reset();

    [[nodiscard]] auto history() const -> History::MotherHistory const& { return journal; }
    [[nodiscard]] auto historyStats() const -> History::MotherHistory::Stats { return journal.stats(); }
    [[nodiscard]] auto version() const -> std::string const& { return versionToken; }
    [[nodiscard]] auto corpus() const -> CorpusSnapshot const& { return *corpusRef; }

private:
    void applyMother(ClauseId child, MotherRef mother);
    void regenerateVersion();

    CorpusSnapshot const*  corpusRef = nullptr;
    OverlayMap             overrides;
    History::MotherHistory journal;
    std::string            versionToken;
    std::uint64_t          nextSequence = 0;
};

} // namespace MT
