#include "validation/MutationValidator.hpp"

#include "log/TaggedLogger.hpp"
#include "projection/EffectiveTree.hpp"

#include <string>
#include <utility>
#include <vector>

namespace MT {
namespace {

auto reject(Error::Code code, std::string message) -> Expected<void> {
    mt_log(std::string{errorCodeToString(code)} + ": " + message, "Validator");
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace

MutationValidator::MutationValidator(OverlayStore const& store, ValidationPolicy policy)
    : store(store), rules(std::move(policy)) {}

auto MutationValidator::validateReparent(ClauseId child, ClauseId newMother) const -> Expected<void> {
    auto const& corpus    = this->store.corpus();
    auto const* childNode = corpus.find(child);
    if (childNode == nullptr) {
        return reject(Error::Code::NodeNotFound, "clause " + std::to_string(child) + " does not exist");
    }
    auto const* motherNode = corpus.find(newMother);
    if (motherNode == nullptr) {
        return reject(Error::Code::NodeNotFound, "clause " + std::to_string(newMother) + " does not exist");
    }
    if (!motherNode->isClause()) {
        return reject(Error::Code::MotherNotClause, "node " + std::to_string(newMother) + " is a " + motherNode->kind);
    }
    // Ids follow document order, so a mother must come earlier in the text.
    if (newMother >= child) {
        return reject(Error::Code::MotherIdNotSmaller,
                      std::to_string(newMother) + " is not smaller than " + std::to_string(child));
    }
    if (this->rules.enforceContainer && childNode->containerId != motherNode->containerId) {
        return reject(Error::Code::ContainerMismatch,
                      "'" + childNode->containerId + "' differs from '" + motherNode->containerId + "'");
    }
    if (child == newMother) {
        return reject(Error::Code::SameNode, "clause " + std::to_string(child) + " cannot be its own mother");
    }
    if (this->descendantsOf(child).contains(newMother)) {
        return reject(Error::Code::Cycle,
                      std::to_string(newMother) + " is a descendant of " + std::to_string(child));
    }
    return this->checkDepth(newMother);
}

auto MutationValidator::validateRootify(ClauseId child) const -> Expected<void> {
    if (!this->store.corpus().contains(child)) {
        return reject(Error::Code::NodeNotFound, "clause " + std::to_string(child) + " does not exist");
    }
    if (!this->rules.allowRootify) {
        return reject(Error::Code::RootifyDisabled, "rootify is disabled");
    }
    return this->checkDepth(std::nullopt);
}

auto MutationValidator::descendantsOf(ClauseId id) const -> phmap::flat_hash_set<ClauseId> {
    phmap::flat_hash_set<ClauseId> descendants;
    auto const                     children = buildEffectiveChildren(this->store);
    std::vector<ClauseId>          stack{id};
    while (!stack.empty()) {
        auto current = stack.back();
        stack.pop_back();
        auto it = children.find(current);
        if (it == children.end())
            continue;
        for (auto child : it->second) {
            if (descendants.insert(child).second) {
                stack.push_back(child);
            }
        }
    }
    return descendants;
}

auto MutationValidator::checkDepth(MotherRef newMother) const -> Expected<void> {
    if (!this->rules.maxDepth) {
        return {};
    }
    auto const  limit   = *this->rules.maxDepth;
    std::size_t depth   = 0;
    MotherRef   current = newMother;
    while (current) {
        depth += 1;
        if (depth > limit) {
            return reject(Error::Code::DepthLimit, "chain above the child exceeds " + std::to_string(limit));
        }
        current = this->store.effectiveMother(*current);
    }
    // The child itself counts as one more level.
    if (depth + 1 > limit) {
        return reject(Error::Code::DepthLimit, "depth " + std::to_string(depth + 1) + " exceeds " + std::to_string(limit));
    }
    return {};
}

} // namespace MT
