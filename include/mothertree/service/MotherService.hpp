#pragma once

#include "batch/BatchCoordinator.hpp"
#include "core/ClauseId.hpp"
#include "core/Error.hpp"
#include "corpus/CorpusSnapshot.hpp"
#include "overlay/OverlayStore.hpp"
#include "projection/EffectiveTree.hpp"
#include "projection/TreeProjector.hpp"
#include "validation/MutationValidator.hpp"
#include "validation/ValidationPolicy.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace MT {

struct TreeView {
    EffectiveTree              tree;
    std::optional<std::string> scope;
    std::string                version;
};

struct EdgeChange {
    EdgeView    edge;
    std::string version;
};

/**
 * The edit engine as seen by a transport: one corpus, one overlay with its
 * history, and the policy every edit is validated against.
 *
 * Single writer. The service does no locking of its own; a host that serves
 * several callers must serialise calls. The corpus must outlive the service.
 */
class MotherService {
public:
    explicit MotherService(CorpusSnapshot const& corpus, ValidationPolicy policy = {});

    MotherService(MotherService const&)            = delete;
    MotherService& operator=(MotherService const&) = delete;

    // Never fails; an unparseable scope gives an empty tree.
    [[nodiscard]] auto getTree(std::optional<std::string_view> scope = std::nullopt) const -> TreeView;

    [[nodiscard]] auto reparent(ClauseId child, ClauseId newMother) -> Expected<EdgeChange>;
    [[nodiscard]] auto rootify(ClauseId child) -> Expected<EdgeChange>;
    // Full unscoped tree after the batch committed.
    [[nodiscard]] auto reparentBatch(std::span<BatchOperation const> operations) -> Expected<TreeView>;
    [[nodiscard]] auto undo() -> Expected<EdgeChange>;
    [[nodiscard]] auto redo() -> Expected<EdgeChange>;

    // Drops every edit and the whole history.
    void resetOverlays();

    [[nodiscard]] auto store() const -> OverlayStore const& { return overlay; }
    [[nodiscard]] auto corpus() const -> CorpusSnapshot const& { return corpusRef; }
    [[nodiscard]] auto policy() const -> ValidationPolicy const& { return validator.policy(); }

private:
    [[nodiscard]] auto edgeFor(ClauseId child) const -> EdgeView;

    CorpusSnapshot const& corpusRef;
    OverlayStore          overlay;
    MutationValidator     validator;
    TreeProjector         projector;
    BatchCoordinator      batches;
};

} // namespace MT
