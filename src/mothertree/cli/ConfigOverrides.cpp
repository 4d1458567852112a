#include "cli/ConfigOverrides.hpp"

#include <charconv>
#include <utility>

namespace MT::CLI {

void addConfigOptions(CommandLine& cli, ConfigOverrides& overrides) {
    cli.add_value("--config", {.on_value = [&overrides](std::string_view value) -> CommandLine::ParseError {
                                   if (value.empty())
                                       return std::string{"--config requires a path"};
                                   overrides.configPath = std::filesystem::path{std::string{value}};
                                   return std::nullopt;
                               },
                               .placeholder = "FILE",
                               .help        = "JSON configuration file"});
    cli.add_value("--corpus", {.on_value = [&overrides](std::string_view value) -> CommandLine::ParseError {
                                   if (value.empty())
                                       return std::string{"--corpus requires a path"};
                                   overrides.corpusPath = std::filesystem::path{std::string{value}};
                                   return std::nullopt;
                               },
                               .placeholder = "FILE",
                               .help        = "clause corpus JSON"});
    cli.add_value("--host", {.on_value = [&overrides](std::string_view value) -> CommandLine::ParseError {
                                 if (value.empty())
                                     return std::string{"--host must not be empty"};
                                 overrides.host = std::string{value};
                                 return std::nullopt;
                             },
                             .placeholder = "HOST",
                             .help        = "address to bind (default 127.0.0.1)"});
    cli.add_int("--port", {.on_value = [&overrides](int port) -> CommandLine::ParseError {
                               if (!isValidPort(port))
                                   return std::string{"--port must be within 0-65535"};
                               overrides.port = port;
                               return std::nullopt;
                           },
                           .help = "port to listen on, 0 picks a free one (default 8000)"});
    cli.add_flag("--scope-container", {.on_set = [&overrides] { overrides.enforceContainer = true; },
                                       .help   = "require child and mother to share a verse"});
    cli.add_flag("--no-scope-container", {.on_set = [&overrides] { overrides.enforceContainer = false; },
                                          .help   = "allow edits across verses"});
    cli.add_flag("--no-rootify", {.on_set = [&overrides] { overrides.allowRootify = false; },
                                  .help   = "reject detaching a clause from its mother"});
    cli.add_value("--max-depth", {.on_value = [&overrides](std::string_view value) -> CommandLine::ParseError {
                                      if (value == "none") {
                                          overrides.unboundedDepth = true;
                                          overrides.maxDepth.reset();
                                          return std::nullopt;
                                      }
                                      std::size_t depth  = 0;
                                      auto        result = std::from_chars(value.data(), value.data() + value.size(), depth);
                                      if (value.empty() || result.ec != std::errc{}
                                          || result.ptr != value.data() + value.size()) {
                                          return std::string{"--max-depth expects a non-negative number or 'none'"};
                                      }
                                      overrides.maxDepth       = depth;
                                      overrides.unboundedDepth = false;
                                      return std::nullopt;
                                  },
                                  .placeholder = "N",
                                  .help        = "longest allowed mother chain"});
    cli.add_flag("--enable-shutdown", {.on_set = [&overrides] { overrides.enableShutdownRoute = true; },
                                       .help   = "expose POST /shutdown"});
    cli.add_flag("--help", {.on_set = [&overrides] { overrides.showHelp = true; }, .help = "show this help"});
    cli.add_alias("-h", "--help");
}

auto resolveConfig(ConfigOverrides const& overrides) -> Expected<MotherConfig> {
    MotherConfig config;
    if (overrides.configPath) {
        auto loaded = loadMotherConfig(*overrides.configPath);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (!applyMotherEnvOverrides(config)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid MOTHERTREE_* environment value"});
    }

    if (overrides.corpusPath)
        config.corpusPath = overrides.corpusPath;
    if (overrides.host)
        config.server.host = *overrides.host;
    if (overrides.port)
        config.server.port = *overrides.port;
    if (overrides.enforceContainer)
        config.policy.enforceContainer = *overrides.enforceContainer;
    if (overrides.allowRootify)
        config.policy.allowRootify = *overrides.allowRootify;
    if (overrides.unboundedDepth)
        config.policy.maxDepth.reset();
    else if (overrides.maxDepth)
        config.policy.maxDepth = overrides.maxDepth;
    if (overrides.enableShutdownRoute)
        config.server.enableShutdownRoute = true;

    if (auto problem = validateMotherConfig(config)) {
        return std::unexpected(Error{Error::Code::MalformedInput, *problem});
    }
    return config;
}

} // namespace MT::CLI
