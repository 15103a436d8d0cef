#pragma once

#include <string>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

// Transport-neutral view of an inbound request. Header names are stored
// lower-cased so lookups match HTTP's case-insensitive semantics.
struct ApiRequest {
    std::string method = "POST";
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query;
    std::string body;

    void set_header(const std::string& name, const std::string& value);
    std::optional<std::string> header(const std::string& name) const;
    std::optional<std::string> query_param(const std::string& name) const;
};

struct ApiResponse {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();

    static ApiResponse ok(nlohmann::json body) {
        return ApiResponse{200, std::move(body)};
    }

    static ApiResponse error(int status, const std::string& message) {
        return ApiResponse{status, {{"error", message}}};
    }
};
