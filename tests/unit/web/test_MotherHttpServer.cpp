#include "web/MotherHttpServer.hpp"

#include "support/GenesisFixture.hpp"

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include <httplib.h>

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace MT;

namespace {

auto ephemeralOptions() -> ServerOptions {
    ServerOptions options;
    options.host = "127.0.0.1";
    options.port = 0; // ephemeral
    return options;
}

auto makeClient(Web::MotherHttpServer const& server) -> httplib::Client {
    httplib::Client client("127.0.0.1", server.port());
    client.set_connection_timeout(1, 0);
    client.set_read_timeout(1, 0);
    return client;
}

auto getWithRetry(httplib::Client& client, std::string const& path) -> httplib::Result {
    httplib::Result response;
    for (int attempt = 0; attempt < 5 && !response; ++attempt) {
        response = client.Get(path);
        if (!response) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    return response;
}

auto edgeTarget(nlohmann::json const& tree, ClauseId child) -> nlohmann::json {
    for (auto const& edge : tree["edges"]) {
        if (edge["from"] == child) {
            return edge["to"];
        }
    }
    return "missing";
}

} // namespace

TEST_CASE("Mother HTTP server serves scoped trees") {
    auto          corpus = Test::genesisCorpus();
    MotherService service(corpus);

    Web::MotherHttpServer server(service, ephemeralOptions());
    REQUIRE(server.start());
    CHECK(server.is_running());
    CHECK(server.port() != 0);

    auto client   = makeClient(server);
    auto response = getWithRetry(client, "/tree?scope=Gen.1.1-3");
    REQUIRE(response);
    CHECK(response->status == 200);

    auto json = nlohmann::json::parse(response->body);
    CHECK(json["nodes"].size() == 4);
    CHECK(json["nodes"][0]["id"] == 427559);
    CHECK(json["scope"] == "Gen.1.1-3");
    for (auto const& node : json["nodes"]) {
        CHECK(node.contains("slotsStart"));
        CHECK(node.contains("inScope"));
        CHECK(node.contains("draggable"));
    }

    auto badBytes = getWithRetry(client, "/tree?scope=Gen.%FF");
    REQUIRE(badBytes);
    CHECK(badBytes->status == 200);
    CHECK(nlohmann::json::parse(badBytes->body)["nodes"].empty());
    CHECK(server.is_running());

    auto unknown = getWithRetry(client, "/tree?scope=Leviticus.1");
    REQUIRE(unknown);
    CHECK(unknown->status == 200);
    CHECK(nlohmann::json::parse(unknown->body)["nodes"].empty());

    server.stop();
    server.join();
    CHECK_FALSE(server.is_running());
}

TEST_CASE("Mother HTTP server applies and reverts edits") {
    auto          corpus = Test::genesisCorpus();
    MotherService service(corpus);

    Web::MotherHttpServer server(service, ephemeralOptions());
    REQUIRE(server.start());
    auto client = makeClient(server);
    REQUIRE(getWithRetry(client, "/tree"));

    auto reparent = client.Post("/mother/reparent", R"({"child": 427567, "newMother": 427560})", "application/json");
    REQUIRE(reparent);
    CHECK(reparent->status == 200);
    auto change = nlohmann::json::parse(reparent->body);
    CHECK(change["ok"] == true);
    CHECK(change["edge"]["to"] == 427560);
    CHECK(change["edge"]["source"] == "user");

    auto ordering = client.Post("/mother/reparent", R"({"child": 427566, "newMother": 427567})", "application/json");
    REQUIRE(ordering);
    CHECK(ordering->status == 409);
    CHECK(nlohmann::json::parse(ordering->body)["reason"] == "MOTHER_ID_NOT_SMALLER");

    auto missing = client.Post("/mother/reparent", R"({"child": 1, "newMother": 0})", "application/json");
    REQUIRE(missing);
    CHECK(missing->status == 404);

    auto malformed = client.Post("/mother/reparent", "{", "application/json");
    REQUIRE(malformed);
    CHECK(malformed->status == 400);

    auto rootify = client.Post("/mother/rootify", R"({"child": 427619})", "application/json");
    REQUIRE(rootify);
    CHECK(rootify->status == 200);
    CHECK(nlohmann::json::parse(rootify->body)["edge"]["to"].is_null());

    auto undo = client.Post("/mother/undo", "", "application/json");
    REQUIRE(undo);
    CHECK(undo->status == 200);
    CHECK(nlohmann::json::parse(undo->body)["edge"]["to"] == 427618);

    auto redo = client.Post("/mother/redo", "", "application/json");
    REQUIRE(redo);
    CHECK(redo->status == 200);
    auto redone = client.Post("/mother/redo", "", "application/json");
    REQUIRE(redone);
    CHECK(redone->status == 409);
    CHECK(nlohmann::json::parse(redone->body)["reason"] == "NO_HISTORY");

    server.stop();
    server.join();
}

TEST_CASE("Mother HTTP server rolls back failing batches") {
    auto          corpus = Test::genesisCorpus();
    MotherService service(corpus);

    Web::MotherHttpServer server(service, ephemeralOptions());
    REQUIRE(server.start());
    auto client = makeClient(server);
    REQUIRE(getWithRetry(client, "/tree"));

    auto failed = client.Post("/mother/reparent-batch",
                              R"({"ops": [{"child": 427568, "newMother": 427567},
                                          {"child": 427566, "newMother": 427567}]})",
                              "application/json");
    REQUIRE(failed);
    CHECK(failed->status == 409);

    auto tree = getWithRetry(client, "/tree?scope=Gen.1.4");
    REQUIRE(tree);
    CHECK(edgeTarget(nlohmann::json::parse(tree->body), 427568) == 427566);

    auto committed = client.Post("/mother/reparent-batch",
                                 R"({"ops": [{"child": 427568, "newMother": 427567},
                                             {"child": 427569, "newMother": null}]})",
                                 "application/json");
    REQUIRE(committed);
    CHECK(committed->status == 200);
    auto full = nlohmann::json::parse(committed->body);
    CHECK(full["nodes"].size() == corpus.size());
    CHECK(edgeTarget(full, 427568) == 427567);
    CHECK(edgeTarget(full, 427569).is_null());

    server.stop();
    server.join();
}

TEST_CASE("Mother HTTP server maps rootify policy to 405") {
    auto          corpus = Test::genesisCorpus();
    MotherService service(corpus, ValidationPolicy{.allowRootify = false});

    Web::MotherHttpServer server(service, ephemeralOptions());
    REQUIRE(server.start());
    auto client = makeClient(server);
    REQUIRE(getWithRetry(client, "/tree"));

    auto rootify = client.Post("/mother/rootify", R"({"child": 427567})", "application/json");
    REQUIRE(rootify);
    CHECK(rootify->status == 405);
    CHECK(nlohmann::json::parse(rootify->body)["reason"] == "ROOTIFY_DISABLED");

    auto shutdown = client.Post("/shutdown", "", "application/json");
    REQUIRE(shutdown);
    CHECK(shutdown->status == 404);

    server.stop();
    server.join();
}

TEST_CASE("Mother HTTP server shutdown route signals the owner") {
    auto          corpus = Test::genesisCorpus();
    MotherService service(corpus);

    auto options                = ephemeralOptions();
    options.enableShutdownRoute = true;
    Web::MotherHttpServer server(service, options);
    std::atomic<bool>     requested{false};
    server.set_shutdown_handler([&requested] { requested.store(true); });
    REQUIRE(server.start());

    auto client = makeClient(server);
    REQUIRE(getWithRetry(client, "/tree"));
    auto response = client.Post("/shutdown", "", "application/json");
    REQUIRE(response);
    CHECK(response->status == 200);
    CHECK(nlohmann::json::parse(response->body)["message"] == "SERVER_SHUTTING_DOWN");
    CHECK(requested.load());

    server.stop();
    server.join();
}
