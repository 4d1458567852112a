#pragma once

#include <cstddef>
#include <optional>

namespace MT {

// Structural rules applied to every edit.
struct ValidationPolicy {
    // Child and new mother must share a container (verse).
    bool enforceContainer = false;
    bool allowRootify     = true;
    // Longest allowed chain of mothers above and including the child; unset = unbounded.
    std::optional<std::size_t> maxDepth;

    auto operator==(ValidationPolicy const&) const -> bool = default;
};

} // namespace MT
