#pragma once

#include "core/ClauseId.hpp"
#include "core/Error.hpp"
#include "overlay/OverlayStore.hpp"
#include "validation/MutationValidator.hpp"

#include <span>

namespace MT {

// One step of a batch; an empty mother detaches the child (rootify).
struct BatchOperation {
    ClauseId  child = 0;
    MotherRef newMother;

    auto operator==(BatchOperation const&) const -> bool = default;
};

/**
 * Applies a sequence of edits all-or-nothing.
 *
 * Each operation is validated against the state left by the operations before
 * it. The first failure restores the state captured before the batch (overlay,
 * history and version) and is returned unchanged.
 */
class BatchCoordinator {
public:
    BatchCoordinator(OverlayStore& store, MutationValidator const& validator);

    [[nodiscard]] auto applyBatch(std::span<BatchOperation const> operations) -> Expected<void>;

    // Validates and commits a single edit.
    [[nodiscard]] auto apply(BatchOperation const& operation) -> Expected<void>;

private:
    OverlayStore&            store;
    MutationValidator const& validator;
};

} // namespace MT
