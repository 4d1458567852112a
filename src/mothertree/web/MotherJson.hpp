#pragma once

#include "batch/BatchCoordinator.hpp"
#include "core/ClauseId.hpp"
#include "core/Error.hpp"
#include "service/MotherService.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace MT::Web {

struct ReparentRequest {
    ClauseId child     = 0;
    ClauseId newMother = 0;
};

struct RootifyRequest {
    ClauseId child = 0;
};

// {"from": id, "to": id|null, "source": "user"|"original"}
[[nodiscard]] auto edgeToJson(EdgeView const& edge) -> nlohmann::json;

// Node objects carry the clause fields, inScope, draggable, originalMother and
// a "children" list of the related clauses present in the tree.
[[nodiscard]] auto treeToJson(TreeView const& view) -> nlohmann::json;

[[nodiscard]] auto edgeChangeToJson(EdgeChange const& change) -> nlohmann::json;

// {"ok": false, "reason": "<CODE>"}
[[nodiscard]] auto errorToJson(Error const& error) -> nlohmann::json;

[[nodiscard]] auto httpStatusFor(Error const& error) -> int;

// Serialises with invalid UTF-8 replaced by U+FFFD; never throws.
[[nodiscard]] auto dumpJson(nlohmann::json const& payload, int indent = -1) -> std::string;

[[nodiscard]] auto parseReparentRequest(std::string_view body) -> Expected<ReparentRequest>;
[[nodiscard]] auto parseRootifyRequest(std::string_view body) -> Expected<RootifyRequest>;
// {"ops": [{"child": id, "newMother": id|null}, ...]}
[[nodiscard]] auto parseBatchRequest(std::string_view body) -> Expected<std::vector<BatchOperation>>;

} // namespace MT::Web
