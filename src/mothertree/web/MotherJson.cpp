#include "web/MotherJson.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace MT::Web {
namespace {

using json = nlohmann::json;

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto optionalString(std::optional<std::string> const& value) -> json {
    if (value) {
        return *value;
    }
    return nullptr;
}

auto motherJson(MotherRef const& mother) -> json {
    if (mother) {
        return *mother;
    }
    return nullptr;
}

auto parseObject(std::string_view body) -> Expected<json> {
    if (body.empty()) {
        return std::unexpected(malformed("missing request body"));
    }
    auto payload = json::parse(body, nullptr, false);
    if (payload.is_discarded()) {
        return std::unexpected(malformed("invalid JSON payload"));
    }
    if (!payload.is_object()) {
        return std::unexpected(malformed("payload must be a JSON object"));
    }
    return payload;
}

auto readId(json const& object, char const* key) -> Expected<ClauseId> {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return std::unexpected(malformed(std::string{key} + " must be an integer"));
    }
    return it->get<std::int64_t>();
}

using NodeIndex = phmap::flat_hash_map<ClauseId, ClauseNode const*>;

auto nodeToJson(ClauseNode const& node, EffectiveTree const& tree, NodeIndex const& listed) -> json {
    json children = json::array();
    for (auto childId : tree.childrenOf(node.id)) {
        auto it = listed.find(childId);
        if (it == listed.end())
            continue;
        children.push_back(json{{"id", childId},
                                {"typ", optionalString(it->second->typ)},
                                {"rela", optionalString(it->second->rela)},
                                {"code", optionalString(it->second->code)}});
    }

    return json{{"id", node.id},
                {"slotsStart", node.slotsStart},
                {"slotsEnd", node.slotsEnd},
                {"slotCount", node.slotCount},
                {"label", node.label},
                {"containerId", node.containerId},
                {"inScope", tree.isInScope(node.id)},
                {"kind", node.kind},
                {"draggable", node.isClause()},
                {"typ", optionalString(node.typ)},
                {"rela", optionalString(node.rela)},
                {"code", optionalString(node.code)},
                {"txt", optionalString(node.txt)},
                {"domain", optionalString(node.domain)},
                {"instruction", optionalString(node.instruction)},
                {"originalMother", motherJson(node.originalMother)},
                {"coreFunctions", node.coreFunctions},
                {"children", std::move(children)},
                {"reference", node.reference}};
}

} // namespace

auto edgeToJson(EdgeView const& edge) -> nlohmann::json {
    return json{{"from", edge.from},
                {"to", motherJson(edge.to)},
                {"source", std::string{edgeSourceToString(edge.source)}}};
}

auto treeToJson(TreeView const& view) -> nlohmann::json {
    NodeIndex listed;
    listed.reserve(view.tree.nodes.size());
    for (auto const* node : view.tree.nodes) {
        listed.emplace(node->id, node);
    }

    json nodes = json::array();
    for (auto const* node : view.tree.nodes) {
        nodes.push_back(nodeToJson(*node, view.tree, listed));
    }

    json edges = json::array();
    for (auto const& edge : view.tree.edges) {
        edges.push_back(edgeToJson(edge));
    }

    return json{{"nodes", std::move(nodes)},
                {"edges", std::move(edges)},
                {"scope", view.scope ? json(*view.scope) : json(nullptr)},
                {"version", view.version}};
}

auto edgeChangeToJson(EdgeChange const& change) -> nlohmann::json {
    return json{{"ok", true}, {"edge", edgeToJson(change.edge)}, {"version", change.version}};
}

auto errorToJson(Error const& error) -> nlohmann::json {
    return json{{"ok", false}, {"reason", std::string{errorCodeToString(error.code)}}};
}

auto dumpJson(nlohmann::json const& payload, int indent) -> std::string {
    return payload.dump(indent, ' ', false, json::error_handler_t::replace);
}

auto httpStatusFor(Error const& error) -> int {
    switch (error.code) {
    case Error::Code::RootifyDisabled:
        return 405;
    case Error::Code::MalformedInput:
    case Error::Code::InvalidScope:
        return 400;
    default:
        break;
    }
    switch (errorSeverity(error.code)) {
    case ErrorSeverity::NotFound:
        return 404;
    case ErrorSeverity::Rejected:
    case ErrorSeverity::NoHistory:
        return 409;
    case ErrorSeverity::Internal:
        break;
    }
    return 500;
}

auto parseReparentRequest(std::string_view body) -> Expected<ReparentRequest> {
    auto payload = parseObject(body);
    if (!payload)
        return std::unexpected(payload.error());
    auto child = readId(*payload, "child");
    if (!child)
        return std::unexpected(child.error());
    auto mother = readId(*payload, "newMother");
    if (!mother)
        return std::unexpected(mother.error());
    return ReparentRequest{.child = *child, .newMother = *mother};
}

auto parseRootifyRequest(std::string_view body) -> Expected<RootifyRequest> {
    auto payload = parseObject(body);
    if (!payload)
        return std::unexpected(payload.error());
    auto child = readId(*payload, "child");
    if (!child)
        return std::unexpected(child.error());
    return RootifyRequest{.child = *child};
}

auto parseBatchRequest(std::string_view body) -> Expected<std::vector<BatchOperation>> {
    auto payload = parseObject(body);
    if (!payload)
        return std::unexpected(payload.error());
    auto ops = payload->find("ops");
    if (ops == payload->end() || !ops->is_array()) {
        return std::unexpected(malformed("ops must be an array"));
    }

    std::vector<BatchOperation> operations;
    operations.reserve(ops->size());
    for (auto const& op : *ops) {
        if (!op.is_object()) {
            return std::unexpected(malformed("every op must be an object"));
        }
        auto child = readId(op, "child");
        if (!child)
            return std::unexpected(child.error());
        auto mother = op.find("newMother");
        if (mother == op.end()) {
            return std::unexpected(malformed("newMother is required (null to rootify)"));
        }
        BatchOperation operation{.child = *child, .newMother = std::nullopt};
        if (!mother->is_null()) {
            if (!mother->is_number_integer()) {
                return std::unexpected(malformed("newMother must be an integer or null"));
            }
            operation.newMother = mother->get<std::int64_t>();
        }
        operations.push_back(operation);
    }
    return operations;
}

} // namespace MT::Web
