#include "service/MotherService.hpp"

#include "log/TaggedLogger.hpp"

#include <utility>

namespace MT {

MotherService::MotherService(CorpusSnapshot const& corpus, ValidationPolicy policy)
    : corpusRef(corpus)
    , overlay(corpus)
    , validator(overlay, std::move(policy))
    , projector(overlay)
    , batches(overlay, validator) {}

auto MotherService::getTree(std::optional<std::string_view> scope) const -> TreeView {
    TreeView view;
    view.tree = this->projector.project(scope);
    if (scope) {
        view.scope = std::string{*scope};
    }
    view.version = this->overlay.version();
    return view;
}

auto MotherService::reparent(ClauseId child, ClauseId newMother) -> Expected<EdgeChange> {
    auto committed = this->batches.apply(BatchOperation{.child = child, .newMother = newMother});
    if (!committed) {
        return std::unexpected(committed.error());
    }
    return EdgeChange{.edge = this->edgeFor(child), .version = this->overlay.version()};
}

auto MotherService::rootify(ClauseId child) -> Expected<EdgeChange> {
    auto committed = this->batches.apply(BatchOperation{.child = child, .newMother = std::nullopt});
    if (!committed) {
        return std::unexpected(committed.error());
    }
    return EdgeChange{.edge = this->edgeFor(child), .version = this->overlay.version()};
}

auto MotherService::reparentBatch(std::span<BatchOperation const> operations) -> Expected<TreeView> {
    auto committed = this->batches.applyBatch(operations);
    if (!committed) {
        return std::unexpected(committed.error());
    }
    return this->getTree();
}

auto MotherService::undo() -> Expected<EdgeChange> {
    auto step = this->overlay.undo();
    if (!step) {
        return std::unexpected(step.error());
    }
    return EdgeChange{.edge = this->edgeFor(step->child), .version = this->overlay.version()};
}

auto MotherService::redo() -> Expected<EdgeChange> {
    auto step = this->overlay.redo();
    if (!step) {
        return std::unexpected(step.error());
    }
    return EdgeChange{.edge = this->edgeFor(step->child), .version = this->overlay.version()};
}

void MotherService::resetOverlays() {
    this->overlay.reset();
    mt_log("Overlay reset", "Overlay", "INFO");
}

auto MotherService::edgeFor(ClauseId child) const -> EdgeView {
    return EdgeView{.from   = child,
                    .to     = this->overlay.effectiveMother(child),
                    .source = this->overlay.hasOverride(child) ? EdgeSource::User : EdgeSource::Original};
}

} // namespace MT
