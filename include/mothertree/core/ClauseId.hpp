#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace MT {

// Corpus node identifier. The provider assigns ids in document order.
using ClauseId = std::int64_t;

// Effective or original mother of a clause; empty means the clause is a root.
using MotherRef = std::optional<ClauseId>;

[[nodiscard]] inline auto motherToString(MotherRef const& mother) -> std::string {
    return mother ? std::to_string(*mother) : std::string{"null"};
}

} // namespace MT
