#include "overlay/OverlayStore.hpp"

#include "log/TaggedLogger.hpp"
#include "util/Utils.hpp"

#include <chrono>
#include <utility>

namespace MT {

OverlayStore::OverlayStore(CorpusSnapshot const& corpus)
    : corpusRef(&corpus) {
    regenerateVersion();
}

auto OverlayStore::effectiveMother(ClauseId id) const -> MotherRef {
    if (auto it = overrides.find(id); it != overrides.end()) {
        return it->second;
    }
    return corpusRef->originalMother(id);
}

void OverlayStore::setMother(ClauseId child, MotherRef newMother) {
    auto previous = effectiveMother(child);
    applyMother(child, newMother);
    journal.append(History::HistoryRecord{.child = child, .previousMother = previous, .newMother = newMother});
    regenerateVersion();
    mt_log("Mother of " + std::to_string(child) + " set " + motherToString(previous) + " -> "
               + motherToString(newMother),
           "Overlay");
}

auto OverlayStore::undo() -> Expected<HistoryStep> {
    auto record = journal.undo();
    if (!record) {
        return std::unexpected(Error{Error::Code::NoHistory, "nothing to undo"});
    }
    auto const& entry = record->get();
    applyMother(entry.child, entry.previousMother);
    regenerateVersion();
    mt_log("Undo restored mother of " + std::to_string(entry.child) + " to " + motherToString(entry.previousMother),
           "Overlay");
    return HistoryStep{.child = entry.child, .mother = entry.previousMother};
}

auto OverlayStore::redo() -> Expected<HistoryStep> {
    auto record = journal.redo();
    if (!record) {
        return std::unexpected(Error{Error::Code::NoHistory, "nothing to redo"});
    }
    auto const& entry = record->get();
    applyMother(entry.child, entry.newMother);
    regenerateVersion();
    mt_log("Redo reapplied mother of " + std::to_string(entry.child) + " as " + motherToString(entry.newMother),
           "Overlay");
    return HistoryStep{.child = entry.child, .mother = entry.newMother};
}

auto OverlayStore::snapshot() const -> OverlaySnapshot {
    return OverlaySnapshot{.overlay = overrides, .history = journal, .version = versionToken};
}

void OverlayStore::restore(OverlaySnapshot snapshot) {
    overrides    = std::move(snapshot.overlay);
    journal      = std::move(snapshot.history);
    versionToken = std::move(snapshot.version);
    mt_log("Overlay restored to version " + versionToken, "Overlay");
}

void OverlayStore::reset() {
    overrides.clear();
    journal.clear();
    regenerateVersion();
}

void OverlayStore::applyMother(ClauseId child, MotherRef mother) {
    if (mother == corpusRef->originalMother(child)) {
        overrides.erase(child);
    } else {
        overrides.insert_or_assign(child, mother);
    }
}

void OverlayStore::regenerateVersion() {
    // The sequence keeps tokens distinct within one clock tick and after restore().
    versionToken = Utils::formatUtcTimestamp(std::chrono::system_clock::now()) + "#" + std::to_string(nextSequence++);
}

} // namespace MT
