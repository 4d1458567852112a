#pragma once

#include "core/ClauseId.hpp"
#include "core/Error.hpp"
#include "overlay/OverlayStore.hpp"
#include "validation/ValidationPolicy.hpp"

#include <parallel_hashmap/phmap.h>

namespace MT {

/**
 * Checks a proposed edit against the current effective tree. Never mutates
 * the store.
 *
 * Reparent checks run in this order and the first failure is returned:
 *   NodeNotFound (child, then mother), MotherNotClause, MotherIdNotSmaller,
 *   ContainerMismatch (policy), SameNode, Cycle, DepthLimit (policy).
 * Rootify: NodeNotFound, RootifyDisabled (policy), DepthLimit (policy).
 */
class MutationValidator {
public:
    MutationValidator(OverlayStore const& store, ValidationPolicy policy);

    [[nodiscard]] auto validateReparent(ClauseId child, ClauseId newMother) const -> Expected<void>;
    [[nodiscard]] auto validateRootify(ClauseId child) const -> Expected<void>;

    // Every clause below `id` under the current effective mothers.
    [[nodiscard]] auto descendantsOf(ClauseId id) const -> phmap::flat_hash_set<ClauseId>;

    [[nodiscard]] auto policy() const -> ValidationPolicy const& { return rules; }

private:
    [[nodiscard]] auto checkDepth(MotherRef newMother) const -> Expected<void>;

    OverlayStore const& store;
    ValidationPolicy    rules;
};

} // namespace MT
