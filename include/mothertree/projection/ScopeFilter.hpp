#pragma once

#include "core/Error.hpp"
#include "corpus/ClauseNode.hpp"
#include "corpus/CorpusSnapshot.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace MT {

// Parsed form of "<book>[.<chapter>[.<verse>|.<verseStart>-<verseEnd>]]".
// Missing chapter or verse act as wildcards; the verse range is inclusive.
struct ScopeFilter {
    std::string        book;
    std::optional<int> chapter;
    std::optional<int> verseStart;
    std::optional<int> verseEnd;

    [[nodiscard]] auto matches(ClauseNode const& node) const -> bool;

    auto operator==(ScopeFilter const&) const -> bool = default;
};

// InvalidScope for an empty text, an unknown or ambiguous book, non numeric
// chapter/verse parts and reversed verse ranges.
[[nodiscard]] auto parseScope(std::string_view text, CorpusSnapshot const& corpus) -> Expected<ScopeFilter>;

} // namespace MT
