#pragma once

#include "core/ClauseId.hpp"
#include "core/Error.hpp"
#include "corpus/ClauseNode.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace MT {

/**
 * Immutable, read-only view of every clause of the corpus and its original
 * mother link. Built once at startup and shared by reference afterwards.
 *
 * The engine relies on ids growing with document position: `build` refuses a
 * node set in which a larger id starts earlier in the text.
 */
class CorpusSnapshot {
public:
    CorpusSnapshot() = default;

    [[nodiscard]] static auto build(std::vector<ClauseNode> clauses) -> Expected<CorpusSnapshot>;

    [[nodiscard]] auto find(ClauseId id) const -> ClauseNode const*;
    [[nodiscard]] auto contains(ClauseId id) const -> bool { return indexById.contains(id); }
    [[nodiscard]] auto originalMother(ClauseId id) const -> MotherRef;

    // Clauses ordered by slotsStart (ties broken by id).
    [[nodiscard]] auto nodes() const -> std::vector<ClauseNode> const& { return ordered; }
    [[nodiscard]] auto size() const -> std::size_t { return ordered.size(); }
    [[nodiscard]] auto empty() const -> bool { return ordered.empty(); }

    // Book names in order of first appearance.
    [[nodiscard]] auto bookNames() const -> std::vector<std::string> const& { return books; }

    // Resolves a user supplied book token ("gen", "Genesis", "1_Sam") to a book
    // name of this corpus: exact normalised match first, otherwise a unique prefix.
    [[nodiscard]] auto resolveBook(std::string_view token) const -> std::optional<std::string>;

    [[nodiscard]] static auto normalizeBookKey(std::string_view value) -> std::string;

private:
    std::vector<ClauseNode>                        ordered;
    phmap::flat_hash_map<ClauseId, std::size_t>    indexById;
    std::vector<std::string>                       books;
    phmap::flat_hash_map<std::string, std::string> bookByKey;
};

} // namespace MT
