#pragma once

#include "core/Error.hpp"
#include "corpus/ClauseNode.hpp"
#include "corpus/CorpusSnapshot.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace MT {

struct CorpusLoadOptions {
    // Labels longer than this many words are cut and end with an ellipsis.
    std::size_t labelMaxWords = 6;
};

/**
 * Reads a corpus fixture of the form
 *
 *     {"clauses": [{"id": 427559, "slotsStart": 1, "slotsEnd": 11,
 *                   "label": "...", "book": "Genesis", "chapter": 1, "verse": 1,
 *                   "originalMother": null, ...}, ...]}
 *
 * Mother links must already point at clause ids. Both camelCase and
 * snake_case keys are accepted. Missing `containerId`, `slotCount` and
 * `reference` fields are derived from book/chapter/verse and the slot range.
 */
[[nodiscard]] auto parseCorpusClauses(std::string_view text, CorpusLoadOptions const& options = {})
    -> Expected<std::vector<ClauseNode>>;

[[nodiscard]] auto parseCorpusJson(std::string_view text, CorpusLoadOptions const& options = {})
    -> Expected<CorpusSnapshot>;

[[nodiscard]] auto loadCorpusJson(std::filesystem::path const& path, CorpusLoadOptions const& options = {})
    -> Expected<CorpusSnapshot>;

[[nodiscard]] auto truncateLabel(std::string_view label, std::size_t maxWords) -> std::string;

} // namespace MT
