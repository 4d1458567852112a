#pragma once

#include "core/Error.hpp"
#include "validation/ValidationPolicy.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace MT {

struct ServerOptions {
    std::string host{"127.0.0.1"};
    int         port{8000};
    bool        enableShutdownRoute{false};
};

struct MotherConfig {
    ValidationPolicy                     policy;
    ServerOptions                        server;
    std::size_t                          labelMaxWords{6};
    std::optional<std::filesystem::path> corpusPath;
};

// Keys: scope_container (bool or container name), allow_rootify, max_depth
// (null or >= 0), host, port, enable_shutdown, label_max_words, corpus.
// Unknown keys are ignored; a wrong type is MalformedInput.
[[nodiscard]] auto parseMotherConfig(std::string_view text) -> Expected<MotherConfig>;
[[nodiscard]] auto loadMotherConfig(std::filesystem::path const& path) -> Expected<MotherConfig>;

// MOTHERTREE_CORPUS, MOTHERTREE_HOST, MOTHERTREE_PORT. Returns false on an unusable value.
auto applyMotherEnvOverrides(MotherConfig& config) -> bool;

[[nodiscard]] auto validateMotherConfig(MotherConfig const& config) -> std::optional<std::string>;

[[nodiscard]] auto isValidPort(int port) -> bool;

} // namespace MT
