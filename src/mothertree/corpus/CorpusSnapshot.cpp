#include "corpus/CorpusSnapshot.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace MT {

auto CorpusSnapshot::build(std::vector<ClauseNode> clauses) -> Expected<CorpusSnapshot> {
    CorpusSnapshot snapshot;
    snapshot.indexById.reserve(clauses.size());

    // Document order precondition: walking by id, slotsStart never moves backwards.
    std::vector<std::size_t> byId(clauses.size());
    for (std::size_t i = 0; i < clauses.size(); ++i) {
        byId[i] = i;
    }
    std::sort(byId.begin(), byId.end(), [&](std::size_t lhs, std::size_t rhs) {
        return clauses[lhs].id < clauses[rhs].id;
    });
    for (std::size_t i = 1; i < byId.size(); ++i) {
        auto const& previous = clauses[byId[i - 1]];
        auto const& current  = clauses[byId[i]];
        if (previous.id == current.id) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "duplicate clause id " + std::to_string(current.id)});
        }
        if (current.slotsStart < previous.slotsStart) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "clause id " + std::to_string(current.id)
                                             + " precedes clause id " + std::to_string(previous.id)
                                             + " in the text; ids must follow document order"});
        }
    }

    for (auto& clause : clauses) {
        if (clause.slotCount == 0 && clause.slotsEnd > 0) {
            clause.slotCount = std::max<std::int64_t>(1, clause.slotsEnd - clause.slotsStart + 1);
        }
    }

    std::stable_sort(clauses.begin(), clauses.end(), [](ClauseNode const& lhs, ClauseNode const& rhs) {
        if (lhs.slotsStart != rhs.slotsStart)
            return lhs.slotsStart < rhs.slotsStart;
        return lhs.id < rhs.id;
    });
    snapshot.ordered = std::move(clauses);

    for (std::size_t i = 0; i < snapshot.ordered.size(); ++i) {
        auto const& clause = snapshot.ordered[i];
        snapshot.indexById.emplace(clause.id, i);
        auto key = normalizeBookKey(clause.book);
        if (!key.empty() && !snapshot.bookByKey.contains(key)) {
            snapshot.bookByKey.emplace(key, clause.book);
            snapshot.books.push_back(clause.book);
        }
    }

    for (auto const& clause : snapshot.ordered) {
        if (!clause.originalMother)
            continue;
        if (*clause.originalMother == clause.id) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "clause " + std::to_string(clause.id) + " is its own mother"});
        }
        if (!snapshot.indexById.contains(*clause.originalMother)) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "clause " + std::to_string(clause.id) + " refers to unknown mother "
                                             + std::to_string(*clause.originalMother)});
        }
    }

    mt_log("Corpus snapshot built with " + std::to_string(snapshot.ordered.size()) + " clauses", "Corpus", "INFO");
    return snapshot;
}

auto CorpusSnapshot::find(ClauseId id) const -> ClauseNode const* {
    auto it = indexById.find(id);
    if (it == indexById.end()) {
        return nullptr;
    }
    return &ordered[it->second];
}

auto CorpusSnapshot::originalMother(ClauseId id) const -> MotherRef {
    if (auto const* clause = find(id)) {
        return clause->originalMother;
    }
    return std::nullopt;
}

auto CorpusSnapshot::normalizeBookKey(std::string_view value) -> std::string {
    std::string key;
    key.reserve(value.size());
    for (char ch : value) {
        if (ch == '_' || ch == ' ' || ch == '.')
            continue;
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return key;
}

auto CorpusSnapshot::resolveBook(std::string_view token) const -> std::optional<std::string> {
    auto key = normalizeBookKey(token);
    if (key.empty()) {
        return std::nullopt;
    }
    if (auto exact = bookByKey.find(key); exact != bookByKey.end()) {
        return exact->second;
    }

    std::optional<std::string> match;
    for (auto const& book : books) {
        auto bookKey = normalizeBookKey(book);
        if (!bookKey.starts_with(key))
            continue;
        if (match) {
            // Ambiguous prefix, e.g. "j" for Joshua and Judges.
            return std::nullopt;
        }
        match = book;
    }
    return match;
}

} // namespace MT
