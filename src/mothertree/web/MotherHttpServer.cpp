#include "web/MotherHttpServer.hpp"

#include "log/TaggedLogger.hpp"
#include "web/MotherJson.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace MT::Web {
namespace {

auto write_json(httplib::Response& res, nlohmann::json const& body, int status) -> void {
    res.status = status;
    res.set_content(dumpJson(body), "application/json");
    res.set_header("Cache-Control", "no-store");
}

auto write_error(httplib::Response& res, Error const& error) -> void {
    auto const status = httpStatusFor(error);
    mt_log("Request rejected with " + std::to_string(status) + " " + describeError(error), "Http");
    write_json(res, errorToJson(error), status);
}

auto write_edge_result(httplib::Response& res, Expected<EdgeChange> const& result) -> void {
    if (!result) {
        write_error(res, result.error());
        return;
    }
    write_json(res, edgeChangeToJson(*result), 200);
}

} // namespace

MotherHttpServer::MotherHttpServer(MotherService& service, ServerOptions options)
    : service_(service)
    , options_(std::move(options)) {}

MotherHttpServer::~MotherHttpServer() {
    this->stop();
    this->join();
}

auto MotherHttpServer::set_shutdown_handler(std::function<void()> handler) -> void {
    std::lock_guard lock(mutex_);
    shutdown_handler_ = std::move(handler);
}

auto MotherHttpServer::start() -> Expected<void> {
    std::unique_lock lock(mutex_);
    if (server_) {
        return std::unexpected(Error{Error::Code::InvalidError, "Mother server already running"});
    }

    server_ = std::make_unique<httplib::Server>();
    this->configure_routes(*server_);

    auto requested_port = options_.port;
    if (requested_port < 0) {
        requested_port = 0;
    }

    int bound_port = requested_port;
    if (requested_port == 0) {
        bound_port = server_->bind_to_any_port(options_.host);
        if (bound_port < 0) {
            server_.reset();
            return std::unexpected(Error{Error::Code::UnknownError, "Failed to bind mother HTTP server"});
        }
    } else {
        if (!server_->bind_to_port(options_.host, requested_port)) {
            server_.reset();
            return std::unexpected(Error{Error::Code::UnknownError,
                                         "Failed to bind mother HTTP server to port " + std::to_string(requested_port)});
        }
    }

    bound_port_ = static_cast<std::uint16_t>(bound_port);
    running_.store(true);

    server_thread_ = std::thread([this]() {
        if (server_) {
            server_->listen_after_bind();
        }
        running_.store(false);
    });

    lock.unlock();
    server_->wait_until_ready();
    lock.lock();
    if (!server_ || !server_->is_running()) {
        if (server_) {
            server_->stop();
        }
        lock.unlock();
        this->join();
        lock.lock();
        server_.reset();
        bound_port_ = 0;
        running_.store(false);
        return std::unexpected(Error{Error::Code::UnknownError, "Mother server failed to start listening"});
    }

    mt_log("Listening on " + options_.host + ":" + std::to_string(bound_port_), "Http", "INFO");
    return {};
}

auto MotherHttpServer::stop() -> void {
    std::unique_lock lock(mutex_);
    if (!server_) {
        return;
    }
    server_->stop();
    lock.unlock();
    this->join();
    lock.lock();
    server_.reset();
    bound_port_ = 0;
    running_.store(false);
}

auto MotherHttpServer::join() -> void {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

auto MotherHttpServer::is_running() const -> bool {
    return running_.load();
}

auto MotherHttpServer::port() const -> std::uint16_t {
    std::lock_guard lock(mutex_);
    return bound_port_;
}

auto MotherHttpServer::configure_routes(httplib::Server& server) -> void {
    server.Get("/tree", [this](httplib::Request const& req, httplib::Response& res) {
        std::optional<std::string> scope;
        if (req.has_param("scope")) {
            scope = req.get_param_value("scope");
        }
        std::lock_guard lock(service_mutex_);
        auto view = service_.getTree(scope ? std::optional<std::string_view>{*scope} : std::nullopt);
        write_json(res, treeToJson(view), 200);
    });

    server.Post("/mother/reparent", [this](httplib::Request const& req, httplib::Response& res) {
        auto request = parseReparentRequest(req.body);
        if (!request) {
            write_error(res, request.error());
            return;
        }
        std::lock_guard lock(service_mutex_);
        write_edge_result(res, service_.reparent(request->child, request->newMother));
    });

    server.Post("/mother/rootify", [this](httplib::Request const& req, httplib::Response& res) {
        auto request = parseRootifyRequest(req.body);
        if (!request) {
            write_error(res, request.error());
            return;
        }
        std::lock_guard lock(service_mutex_);
        write_edge_result(res, service_.rootify(request->child));
    });

    server.Post("/mother/reparent-batch", [this](httplib::Request const& req, httplib::Response& res) {
        auto operations = parseBatchRequest(req.body);
        if (!operations) {
            write_error(res, operations.error());
            return;
        }
        std::lock_guard lock(service_mutex_);
        auto view = service_.reparentBatch(*operations);
        if (!view) {
            write_error(res, view.error());
            return;
        }
        write_json(res, treeToJson(*view), 200);
    });

    server.Post("/mother/undo", [this](httplib::Request const&, httplib::Response& res) {
        std::lock_guard lock(service_mutex_);
        write_edge_result(res, service_.undo());
    });

    server.Post("/mother/redo", [this](httplib::Request const&, httplib::Response& res) {
        std::lock_guard lock(service_mutex_);
        write_edge_result(res, service_.redo());
    });

    if (options_.enableShutdownRoute) {
        server.Post("/shutdown", [this](httplib::Request const&, httplib::Response& res) {
            write_json(res, nlohmann::json{{"ok", true}, {"message", "SERVER_SHUTTING_DOWN"}}, 200);
            std::function<void()> handler;
            {
                std::lock_guard lock(mutex_);
                handler = shutdown_handler_;
            }
            if (handler) {
                handler();
            }
        });
    }
}

} // namespace MT::Web
