#pragma once

#include "core/ClauseId.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MT {

inline constexpr std::string_view ClauseKind = "clause";

/**
 * One clause of the corpus as delivered by the data provider.
 *
 * - Identity: `id` is unique and grows with document position.
 * - Order: `slotsStart`/`slotsEnd` locate the clause in the text; presentation
 *   order is ascending `slotsStart`.
 * - Structure: `originalMother` is already resolved to a clause id.
 * - Tags: `typ` .. `coreFunctions` are carried through without interpretation.
 */
struct ClauseNode {
    ClauseId    id         = 0;
    std::int64_t slotsStart = 0;
    std::int64_t slotsEnd   = 0;
    std::int64_t slotCount  = 0;
    std::string label;
    std::string containerId;
    MotherRef   originalMother;
    std::string book;
    int         chapter = 0;
    int         verse   = 0;
    std::string kind{ClauseKind};

    std::optional<std::string> typ;
    std::optional<std::string> rela;
    std::optional<std::string> code;
    std::optional<std::string> txt;
    std::optional<std::string> domain;
    std::optional<std::string> instruction;
    std::vector<std::string>   coreFunctions;
    std::string                reference;

    [[nodiscard]] auto isClause() const -> bool { return kind == ClauseKind; }
};

} // namespace MT
