#include "http_server.hpp"
#include "sanitizer.hpp"
#include <spdlog/spdlog.h>

HttpServer::HttpServer(const Config& config,
                       SyncOrchestrator& orchestrator,
                       const HealthCheck& health)
    : config_(config)
    , orchestrator_(orchestrator)
    , health_(health)
    , server_(std::make_unique<httplib::Server>())
{}

void HttpServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}",
                     config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}",
                          config_.listen_addr, config_.listen_port);
            running_ = false;
        }
    });

    spdlog::info("HTTP server started");
}

void HttpServer::stop() {
    if (!running_ && !server_thread_.joinable()) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("HTTP server stopped");
}

ApiRequest HttpServer::to_api_request(const httplib::Request& req) {
    ApiRequest api_req;
    api_req.method = req.method;
    api_req.body = req.body;
    for (const auto& [name, value] : req.headers) {
        api_req.set_header(name, value);
    }
    for (const auto& [name, value] : req.params) {
        api_req.query.emplace(name, value);
    }
    return api_req;
}

void HttpServer::write_response(const ApiResponse& api_res, httplib::Response& res) {
    res.status = api_res.status;
    res.set_content(api_res.body.dump(), "application/json");
}

void HttpServer::setup_routes() {
    server_->Post("/api/sync",
        [this](const httplib::Request& req, httplib::Response& res) {
            try {
                write_response(orchestrator_.handle_sync(to_api_request(req)), res);
            } catch (const std::exception& e) {
                spdlog::error("Sync handler error: {}", sanitize_error_message(e.what()));
                write_response(ApiResponse::error(500, "Internal server error"), res);
            }
        });

    server_->Get("/api/sync",
        [this](const httplib::Request& req, httplib::Response& res) {
            try {
                write_response(orchestrator_.handle_status(to_api_request(req)), res);
            } catch (const std::exception& e) {
                spdlog::error("Status handler error: {}", sanitize_error_message(e.what()));
                write_response(ApiResponse::error(500, "Internal server error"), res);
            }
        });

    server_->Get("/health",
        [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(health_.get_status().dump(), "application/json");
            res.status = health_.is_healthy() ? 200 : 503;
        });
}
