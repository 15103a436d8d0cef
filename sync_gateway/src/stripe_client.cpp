#include "stripe_client.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

StripeClient::StripeClient(const std::string& base_url, const std::string& secret_key, int timeout_ms)
    : base_url_(base_url)
    , secret_key_(secret_key)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for Stripe");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
}

StripeClient::~StripeClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t StripeClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::string StripeClient::build_url(const std::string& path, const Params& params) {
    std::string url = base_url_ + path;

    bool first = true;
    for (const auto& [key, value] : params) {
        url += first ? "?" : "&";
        first = false;

        char* escaped_key = curl_easy_escape(curl_, key.c_str(), static_cast<int>(key.length()));
        char* escaped_val = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.length()));
        if (!escaped_key || !escaped_val) {
            curl_free(escaped_key);
            curl_free(escaped_val);
            throw std::runtime_error("Failed to encode Stripe query parameter " + key);
        }
        url +=std::string(escaped_key) + "=" + std::string(escaped_val);
        curl_free(escaped_key);
        curl_free(escaped_val);
    }

    return url;
}

nlohmann::json StripeClient::get(const std::string& path, const Params& params) {
    std::string url = build_url(path, params);
    std::string response_string;

    std::string auth_header = "Authorization: Bearer " + secret_key_;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, auth_header.c_str());
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

    CURLcode res = curl_easy_perform(curl_);

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("Stripe request failed: ") + curl_easy_strerror(res));
    }

    if (http_code < 200 || http_code >= 300) {
        std::string detail = response_string.substr(0, 200);
        try {
            auto body = nlohmann::json::parse(response_string);
            if (body.contains("error") && body["error"].contains("message")) {
                detail = body["error"]["message"].get<std::string>();
            }
        } catch (const std::exception&) {
            // keep the raw prefix
        }
        throw std::runtime_error("Stripe API error " + std::to_string(http_code) + ": " + detail);
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse Stripe response: ") + e.what());
    }
}

size_t StripeClient::list_all(const std::string& path, const Params& params,
                              const std::function<void(const nlohmann::json&)>& visit) {
    size_t count = 0;
    std::string starting_after;

    while (true) {
        Params page_params = params;
        page_params.emplace_back("limit", "100");
        if (!starting_after.empty()) {
            page_params.emplace_back("starting_after", starting_after);
        }

        auto page = get(path, page_params);
        if (!page.contains("data") || !page["data"].is_array()) {
            throw std::runtime_error("Unexpected Stripe list response for " + path);
        }

        for (const auto& item : page["data"]) {
            visit(item);
            count++;
        }

        if (!page.value("has_more", false) || page["data"].empty()) {
            break;
        }
        starting_after = page["data"].back().value("id", "");
        if (starting_after.empty()) break;
    }

    spdlog::debug("Fetched {} objects from Stripe {}", count, path);
    return count;
}
