#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", "127.0.0.1");
    cfg.listen_port = get_env_int("LISTEN_PORT", 3000);

    cfg.service_name = get_env("SERVICE_NAME", "sync_gateway");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    cfg.sync_cooldown_seconds = get_env_int("SYNC_COOLDOWN_SECONDS", 60);
    cfg.trusted_hosts = util::split(get_env("TRUSTED_HOSTS", "localhost,127.0.0.1"), ',');
    for (auto& host : cfg.trusted_hosts) {
        host = util::to_lower(host);
    }

    cfg.accounts_file = get_env("ACCOUNTS_FILE", "accounts.json");
    cfg.stripe_api_base = get_env("STRIPE_API_BASE", "https://api.stripe.com/v1");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 15000);

    return cfg;
}

void Config::validate() const {
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }
    if (sync_cooldown_seconds <= 0) {
        throw std::runtime_error("SYNC_COOLDOWN_SECONDS must be positive");
    }
    if (trusted_hosts.empty()) {
        throw std::runtime_error("TRUSTED_HOSTS must name at least one host");
    }
    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Sync cooldown: {}s", sync_cooldown_seconds);
    spdlog::info("  Trusted hosts: {}", fmt::join(trusted_hosts, ","));
    spdlog::info("  Accounts file: {}", accounts_file);
}
