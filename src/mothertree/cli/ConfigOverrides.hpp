#pragma once

#include "cli/CommandLine.hpp"
#include "config/MotherConfig.hpp"
#include "core/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace MT::CLI {

// Values given on the command line; they win over the environment and the config file.
struct ConfigOverrides {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> corpusPath;
    std::optional<std::string>           host;
    std::optional<int>                   port;
    std::optional<bool>                  enforceContainer;
    std::optional<bool>                  allowRootify;
    std::optional<std::size_t>           maxDepth;
    bool                                 unboundedDepth = false;
    bool                                 enableShutdownRoute = false;
    bool                                 showHelp = false;
};

// --config, --corpus, --host, --port, --scope-container, --no-scope-container,
// --no-rootify, --max-depth (a number or "none"), --enable-shutdown, --help.
void addConfigOptions(CommandLine& cli, ConfigOverrides& overrides);

// Defaults, then the config file, then MOTHERTREE_* variables, then the overrides.
[[nodiscard]] auto resolveConfig(ConfigOverrides const& overrides) -> Expected<MotherConfig>;

} // namespace MT::CLI
