#include "cli/CommandLine.hpp"
#include "cli/ConfigOverrides.hpp"
#include "corpus/CorpusJson.hpp"
#include "service/MotherService.hpp"
#include "util/Utils.hpp"
#include "web/MotherJson.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

struct DumpOptions {
    std::optional<std::string>           scope;
    std::optional<std::filesystem::path> batchPath;
    std::optional<std::filesystem::path> outputPath;
    int                                  indent = 2;
};

auto write_output(std::string const& jsonString, std::optional<std::filesystem::path> const& output) -> bool {
    if (!output) {
        std::cout << jsonString << std::endl;
        return true;
    }
    std::filesystem::path destination = *output;
    if (auto parent = destination.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    std::ofstream stream(destination, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << destination.string() << "'" << std::endl;
        return false;
    }
    stream << jsonString;
    if (!stream.good()) {
        std::cerr << "Failed to write JSON output" << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    using MT::CLI::CommandLine;

    DumpOptions              options;
    MT::CLI::ConfigOverrides overrides;
    CommandLine              cli("mothertree_dump");
    MT::CLI::addConfigOptions(cli, overrides);
    cli.add_value("--scope", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                  options.scope = std::string{value};
                                  return std::nullopt;
                              },
                              .placeholder = "SCOPE",
                              .help        = "book[.chapter[.verse|.a-b]] (default: whole corpus)"});
    cli.add_value("--batch", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                  if (value.empty())
                                      return std::string{"--batch requires a file"};
                                  options.batchPath = std::filesystem::path{std::string{value}};
                                  return std::nullopt;
                              },
                              .placeholder = "FILE",
                              .help        = "apply {\"ops\": [...]} before dumping"});
    cli.add_value("--output", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                   if (value.empty())
                                       return std::string{"--output requires a file"};
                                   options.outputPath = std::filesystem::path{std::string{value}};
                                   return std::nullopt;
                               },
                               .placeholder = "FILE",
                               .help        = "write JSON to a file instead of stdout"});
    cli.add_int("--indent", {.on_value = [&](int value) -> CommandLine::ParseError {
                                 options.indent = value;
                                 return std::nullopt;
                             },
                             .help = "JSON indent (default 2, -1 for compact)"});

    if (!cli.parse(argc, argv)) {
        std::cerr << cli.usage();
        return EXIT_FAILURE;
    }
    if (overrides.showHelp) {
        std::cout << cli.usage();
        return EXIT_SUCCESS;
    }

    auto config = MT::CLI::resolveConfig(overrides);
    if (!config) {
        std::cerr << "Invalid configuration: " << MT::describeError(config.error()) << std::endl;
        return EXIT_FAILURE;
    }
    if (!config->corpusPath) {
        std::cerr << "No corpus given; pass --corpus <file>" << std::endl;
        return EXIT_FAILURE;
    }

    auto corpus = MT::loadCorpusJson(*config->corpusPath, MT::CorpusLoadOptions{.labelMaxWords = config->labelMaxWords});
    if (!corpus) {
        std::cerr << "Failed to load corpus: " << MT::describeError(corpus.error()) << std::endl;
        return EXIT_FAILURE;
    }

    MT::MotherService service(*corpus, config->policy);

    if (options.batchPath) {
        auto text = MT::Utils::readTextFile(*options.batchPath);
        if (!text) {
            std::cerr << "Failed to read batch: " << MT::describeError(text.error()) << std::endl;
            return EXIT_FAILURE;
        }
        auto operations = MT::Web::parseBatchRequest(*text);
        if (!operations) {
            std::cerr << "Invalid batch: " << MT::describeError(operations.error()) << std::endl;
            return EXIT_FAILURE;
        }
        auto applied = service.reparentBatch(*operations);
        if (!applied) {
            std::cerr << "Batch rejected: " << MT::describeError(applied.error()) << std::endl;
            return EXIT_FAILURE;
        }
    }

    auto view = service.getTree(options.scope ? std::optional<std::string_view>{*options.scope} : std::nullopt);
    if (options.scope && view.tree.empty()) {
        std::cerr << "Scope '" << *options.scope << "' matched no clauses" << std::endl;
    }

    if (!write_output(MT::Web::dumpJson(MT::Web::treeToJson(view), options.indent), options.outputPath)) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
