#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    // Sync admission
    int sync_cooldown_seconds;
    std::vector<std::string> trusted_hosts;

    // Accounts and upstreams
    std::string accounts_file;
    std::string stripe_api_base;
    int request_timeout_ms;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
