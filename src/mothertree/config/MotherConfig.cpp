#include "config/MotherConfig.hpp"

#include "log/TaggedLogger.hpp"
#include "util/Utils.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <utility>

#include <nlohmann/json.hpp>

namespace MT {
namespace {

using json = nlohmann::json;

auto malformed(std::string_view key, std::string_view problem) -> Error {
    std::string message{"config key '"};
    message.append(key);
    message.append("' ");
    message.append(problem);
    return Error{Error::Code::MalformedInput, std::move(message)};
}

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

auto isValidPort(int port) -> bool {
    // 0 asks the system for an ephemeral port.
    return port >= 0 && port <= 65535;
}

auto parseMotherConfig(std::string_view text) -> Expected<MotherConfig> {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "config is not valid JSON"});
    }
    if (!document.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "config must be a JSON object"});
    }

    MotherConfig config;

    if (auto it = document.find("scope_container"); it != document.end() && !it->is_null()) {
        if (it->is_boolean()) {
            config.policy.enforceContainer = it->get<bool>();
        } else if (it->is_string()) {
            config.policy.enforceContainer = !it->get<std::string>().empty();
        } else {
            return std::unexpected(malformed("scope_container", "must be a boolean or a string"));
        }
    }

    if (auto it = document.find("allow_rootify"); it != document.end() && !it->is_null()) {
        if (!it->is_boolean())
            return std::unexpected(malformed("allow_rootify", "must be a boolean"));
        config.policy.allowRootify = it->get<bool>();
    }

    if (auto it = document.find("max_depth"); it != document.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() < 0)
            return std::unexpected(malformed("max_depth", "must be a non-negative integer or null"));
        config.policy.maxDepth = static_cast<std::size_t>(it->get<std::int64_t>());
    }

    if (auto it = document.find("host"); it != document.end() && !it->is_null()) {
        if (!it->is_string())
            return std::unexpected(malformed("host", "must be a string"));
        config.server.host = it->get<std::string>();
    }

    if (auto it = document.find("port"); it != document.end() && !it->is_null()) {
        if (!it->is_number_integer())
            return std::unexpected(malformed("port", "must be an integer"));
        auto port = it->get<std::int64_t>();
        if (port < 0 || port > 65535)
            return std::unexpected(malformed("port", "must be within 0-65535"));
        config.server.port = static_cast<int>(port);
    }

    if (auto it = document.find("enable_shutdown"); it != document.end() && !it->is_null()) {
        if (!it->is_boolean())
            return std::unexpected(malformed("enable_shutdown", "must be a boolean"));
        config.server.enableShutdownRoute = it->get<bool>();
    }

    if (auto it = document.find("label_max_words"); it != document.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() < 1)
            return std::unexpected(malformed("label_max_words", "must be a positive integer"));
        config.labelMaxWords = static_cast<std::size_t>(it->get<std::int64_t>());
    }

    if (auto it = document.find("corpus"); it != document.end() && !it->is_null()) {
        if (!it->is_string() || it->get<std::string>().empty())
            return std::unexpected(malformed("corpus", "must be a non-empty path"));
        config.corpusPath = std::filesystem::path{it->get<std::string>()};
    }

    return config;
}

auto loadMotherConfig(std::filesystem::path const& path) -> Expected<MotherConfig> {
    auto text = Utils::readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto config = parseMotherConfig(*text);
    if (!config) {
        auto error = config.error();
        error.message = path.string() + ": " + error.message.value_or("");
        return std::unexpected(std::move(error));
    }
    mt_log("Loaded config " + path.string(), "Config", "INFO");
    return config;
}

auto applyMotherEnvOverrides(MotherConfig& config) -> bool {
    bool ok = true;
    ok &= apply_env("MOTHERTREE_CORPUS", [&](std::string_view value) {
        if (value.empty())
            return false;
        config.corpusPath = std::filesystem::path{std::string{value}};
        return true;
    });
    ok &= apply_env("MOTHERTREE_HOST", [&](std::string_view value) {
        if (value.empty())
            return false;
        config.server.host = std::string{value};
        return true;
    });
    ok &= apply_env("MOTHERTREE_PORT", [&](std::string_view value) {
        int port = 0;
        if (!parse_integer(value, port) || !isValidPort(port))
            return false;
        config.server.port = port;
        return true;
    });
    return ok;
}

auto validateMotherConfig(MotherConfig const& config) -> std::optional<std::string> {
    if (config.server.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!isValidPort(config.server.port)) {
        return std::string{"--port must be within 0-65535"};
    }
    if (config.labelMaxWords == 0) {
        return std::string{"label_max_words must be at least 1"};
    }
    return std::nullopt;
}

} // namespace MT
