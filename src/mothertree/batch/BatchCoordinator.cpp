#include "batch/BatchCoordinator.hpp"

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace MT {

BatchCoordinator::BatchCoordinator(OverlayStore& store, MutationValidator const& validator)
    : store(store), validator(validator) {}

auto BatchCoordinator::apply(BatchOperation const& operation) -> Expected<void> {
    auto valid = operation.newMother ? this->validator.validateReparent(operation.child, *operation.newMother)
                                     : this->validator.validateRootify(operation.child);
    if (!valid) {
        return valid;
    }
    this->store.setMother(operation.child, operation.newMother);
    return {};
}

auto BatchCoordinator::applyBatch(std::span<BatchOperation const> operations) -> Expected<void> {
    if (operations.empty()) {
        return {};
    }

    auto saved = this->store.snapshot();
    for (std::size_t index = 0; index < operations.size(); ++index) {
        auto result = this->apply(operations[index]);
        if (!result) {
            this->store.restore(std::move(saved));
            mt_log("Batch of " + std::to_string(operations.size()) + " rolled back at operation "
                       + std::to_string(index) + ": " + describeError(result.error()),
                   "Batch");
            return result;
        }
    }
    mt_log("Batch of " + std::to_string(operations.size()) + " committed", "Batch");
    return {};
}

} // namespace MT
