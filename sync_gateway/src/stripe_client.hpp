#pragma once

#include <string>
#include <vector>
#include <utility>
#include <functional>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

class StripeClient {
public:
    using Params = std::vector<std::pair<std::string, std::string>>;

    StripeClient(const std::string& base_url, const std::string& secret_key, int timeout_ms = 15000);
    ~StripeClient();

    StripeClient(const StripeClient&) = delete;
    StripeClient& operator=(const StripeClient&) = delete;

    // Throws std::runtime_error on transport, HTTP or parse failure
    nlohmann::json get(const std::string& path, const Params& params = {});

    // Follows has_more/starting_after, calling visit for every object in "data"
    size_t list_all(const std::string& path, const Params& params,
                    const std::function<void(const nlohmann::json&)>& visit);

private:
    std::string base_url_;
    std::string secret_key_;
    int timeout_ms_;
    CURL* curl_;

    std::string build_url(const std::string& path, const Params& params);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
