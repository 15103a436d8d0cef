#include "config.hpp"
#include "csrf.hpp"
#include "sync_cooldown.hpp"
#include "integration_registry.hpp"
#include "builtin_integrations.hpp"
#include "account_directory.hpp"
#include "sync_progress.hpp"
#include "sync_engine.hpp"
#include "sync_orchestrator.hpp"
#include "health.hpp"
#include "http_server.hpp"
#include "sanitizer.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("sync_gateway", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        return 1;
    }

    int exit_code = 0;
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        AccountDirectory accounts = AccountDirectory::load_file(config.accounts_file);
        IntegrationRegistry registry;
        SyncProgressTracker progress;
        SyncEngine engine(registry, accounts, progress, builtin_integrations(config));

        CsrfGuard csrf(config.trusted_hosts);
        SyncCooldown cooldown(static_cast<int64_t>(config.sync_cooldown_seconds) * 1000);
        SyncOrchestrator orchestrator(csrf, cooldown, engine);

        HealthCheck health(config.service_name, orchestrator, accounts, cooldown);
        HttpServer server(config, orchestrator, health);

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        server.start();

        auto last_cleanup = std::chrono::steady_clock::now();
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            auto now = std::chrono::steady_clock::now();
            if (now - last_cleanup >= std::chrono::minutes(5)) {
                cooldown.cleanup_old_entries();
                last_cleanup = now;
                spdlog::debug("Cooldown entries tracked: {}", cooldown.tracked_accounts());
            }
        }

        spdlog::info("Shutting down gracefully");
        server.stop();
        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", sanitize_error_message(e.what()));
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
