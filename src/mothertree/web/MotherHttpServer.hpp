#pragma once

#include "config/MotherConfig.hpp"
#include "core/Error.hpp"
#include "service/MotherService.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include <httplib.h>

namespace MT::Web {

/**
 * HTTP front end of a MotherService.
 *
 *   GET  /tree?scope=<book[.chapter[.verse|.a-b]]>
 *   POST /mother/reparent        {"child", "newMother"}
 *   POST /mother/rootify         {"child"}
 *   POST /mother/reparent-batch  {"ops": [{"child", "newMother"|null}]}
 *   POST /mother/undo
 *   POST /mother/redo
 *   POST /shutdown               (only with ServerOptions::enableShutdownRoute)
 *
 * httplib answers on a worker pool; every handler takes service_mutex_ so the
 * service sees one caller at a time.
 */
class MotherHttpServer {
public:
    MotherHttpServer(MotherService& service, ServerOptions options);
    ~MotherHttpServer();

    MotherHttpServer(MotherHttpServer const&)                        = delete;
    auto operator=(MotherHttpServer const&) -> MotherHttpServer&     = delete;
    MotherHttpServer(MotherHttpServer&&) noexcept                    = delete;
    auto operator=(MotherHttpServer&&) noexcept -> MotherHttpServer& = delete;

    [[nodiscard]] auto start() -> Expected<void>;
    auto stop() -> void;
    auto join() -> void;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto port() const -> std::uint16_t;

    // Called from a request thread once POST /shutdown was answered. It must
    // only signal the owner; calling stop() from it would join its own thread.
    auto set_shutdown_handler(std::function<void()> handler) -> void;

private:
    auto configure_routes(httplib::Server& server) -> void;

    MotherService&                   service_;
    ServerOptions                    options_;
    std::function<void()>            shutdown_handler_;
    std::unique_ptr<httplib::Server> server_;
    std::thread                      server_thread_;
    std::atomic<bool>                running_{false};
    std::uint16_t                    bound_port_ = 0;
    mutable std::mutex               mutex_;
    std::mutex                       service_mutex_;
};

} // namespace MT::Web
