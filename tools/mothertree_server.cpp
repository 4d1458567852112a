#include "cli/CommandLine.hpp"
#include "cli/ConfigOverrides.hpp"
#include "corpus/CorpusJson.hpp"
#include "log/TaggedLogger.hpp"
#include "service/MotherService.hpp"
#include "web/MotherHttpServer.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_should_stop = false;

void handle_signal(int) {
    g_should_stop.store(true);
}

} // namespace

int main(int argc, char** argv) {
    MT::CLI::ConfigOverrides overrides;
    MT::CLI::CommandLine     cli("mothertree_server");
    MT::CLI::addConfigOptions(cli, overrides);
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
        std::cerr << "Invalid configuration: " << MT::describeError(config.error()) << "\n";
        return EXIT_FAILURE;
    }
    if (!config->corpusPath) {
        std::cerr << "No corpus given; pass --corpus <file> or set \"corpus\" in the config\n";
        return EXIT_FAILURE;
    }

#ifdef MT_LOG_DEBUG
    MT::set_thread_name("Main");
    if (char const* env = std::getenv("MOTHERTREE_LOG"); env != nullptr && std::string_view{env} != "0") {
        MT::set_logging_enabled(true);
    }
#endif

    auto corpus = MT::loadCorpusJson(*config->corpusPath, MT::CorpusLoadOptions{.labelMaxWords = config->labelMaxWords});
    if (!corpus) {
        std::cerr << "Failed to load corpus " << config->corpusPath->string() << ": "
                  << MT::describeError(corpus.error()) << "\n";
        return EXIT_FAILURE;
    }

    MT::MotherService         service(*corpus, config->policy);
    MT::Web::MotherHttpServer server(service, config->server);
    server.set_shutdown_handler([] { g_should_stop.store(true); });

    auto started = server.start();
    if (!started) {
        std::cerr << "Failed to start mother server: " << MT::describeError(started.error()) << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Mother server listening on " << config->server.host << ":" << server.port() << " with "
              << corpus->size() << " clauses\nPress Ctrl+C to stop.\n";

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    while (!g_should_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // Give the shutdown response a moment to reach the client.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    server.stop();
    server.join();
    return EXIT_SUCCESS;
}
