#pragma once

#include "core/ClauseId.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace MT::History {

struct HistoryRecord {
    ClauseId  child = 0;
    MotherRef previousMother;
    MotherRef newMother;

    auto operator==(HistoryRecord const&) const -> bool = default;
};

/**
 * Linear undo/redo journal of committed mother edits.
 *
 * Records before the cursor form the undo stack (top = cursor - 1), records
 * from the cursor on form the redo stack (top = cursor). Appending a new
 * record drops the redo side. Depth is unbounded. The class is a plain value
 * so that snapshots can copy it.
 */
class MotherHistory {
public:
    struct Stats {
        std::size_t totalEntries = 0;
        std::size_t undoCount    = 0;
        std::size_t redoCount    = 0;
    };

    void clear();

    void append(HistoryRecord record);

    [[nodiscard]] auto size() const -> std::size_t { return entries.size(); }
    [[nodiscard]] auto cursor() const -> std::size_t { return cursorIndex; }

    [[nodiscard]] auto canUndo() const -> bool;
    [[nodiscard]] auto canRedo() const -> bool;

    [[nodiscard]] auto peekUndo() const
        -> std::optional<std::reference_wrapper<HistoryRecord const>>;
    [[nodiscard]] auto peekRedo() const
        -> std::optional<std::reference_wrapper<HistoryRecord const>>;

    // Moves one record across the cursor and returns it.
    [[nodiscard]] auto undo()
        -> std::optional<std::reference_wrapper<HistoryRecord const>>;
    [[nodiscard]] auto redo()
        -> std::optional<std::reference_wrapper<HistoryRecord const>>;

    [[nodiscard]] auto entryAt(std::size_t index) const -> HistoryRecord const&;

    [[nodiscard]] auto stats() const -> Stats;

    auto operator==(MotherHistory const&) const -> bool = default;

private:
    void dropRedoTail();

    std::vector<HistoryRecord> entries;
    std::size_t                cursorIndex = 0;
};

} // namespace MT::History
