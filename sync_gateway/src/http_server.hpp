#pragma once

#include "config.hpp"
#include "sync_orchestrator.hpp"
#include "health.hpp"
#include "http_types.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

class HttpServer {
public:
    HttpServer(const Config& config,
               SyncOrchestrator& orchestrator,
               const HealthCheck& health);

    void start();
    void stop();
    bool is_running() const { return running_; }

    static ApiRequest to_api_request(const httplib::Request& req);

private:
    const Config& config_;
    SyncOrchestrator& orchestrator_;
    const HealthCheck& health_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    static void write_response(const ApiResponse& api_res, httplib::Response& res);
};
