#include "history/MotherHistory.hpp"

#include <utility>

namespace MT::History {

void MotherHistory::clear() {
    entries.clear();
    cursorIndex = 0;
}

void MotherHistory::append(HistoryRecord record) {
    dropRedoTail();
    entries.push_back(std::move(record));
    cursorIndex = entries.size();
}

auto MotherHistory::canUndo() const -> bool {
    return cursorIndex > 0;
}

auto MotherHistory::canRedo() const -> bool {
    return cursorIndex < entries.size();
}

auto MotherHistory::peekUndo() const
    -> std::optional<std::reference_wrapper<HistoryRecord const>> {
    if (!canUndo())
        return std::nullopt;
    return entries[cursorIndex - 1];
}

auto MotherHistory::peekRedo() const
    -> std::optional<std::reference_wrapper<HistoryRecord const>> {
    if (!canRedo())
        return std::nullopt;
    return entries[cursorIndex];
}

auto MotherHistory::undo()
    -> std::optional<std::reference_wrapper<HistoryRecord const>> {
    if (!canUndo())
        return std::nullopt;
    cursorIndex -= 1;
    return entries[cursorIndex];
}

auto MotherHistory::redo()
    -> std::optional<std::reference_wrapper<HistoryRecord const>> {
    if (!canRedo())
        return std::nullopt;
    auto const& entry = entries[cursorIndex];
    cursorIndex += 1;
    return entry;
}

auto MotherHistory::entryAt(std::size_t index) const -> HistoryRecord const& {
    return entries.at(index);
}

auto MotherHistory::stats() const -> Stats {
    Stats s;
    s.totalEntries = entries.size();
    s.undoCount    = cursorIndex;
    s.redoCount    = entries.size() - cursorIndex;
    return s;
}

void MotherHistory::dropRedoTail() {
    entries.resize(cursorIndex);
}

} // namespace MT::History
