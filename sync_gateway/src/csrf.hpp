#pragma once

#include "http_types.hpp"
#include <string>
#include <vector>
#include <optional>

// Cross-origin guard for state-changing routes. A request passes when it
// carries the custom header (browsers cannot add it cross-origin without a
// preflight we never grant) or when its Origin, else Referer, names a
// trusted host.
class CsrfGuard {
public:
    static constexpr const char* HEADER_NAME = "x-omd-request";
    static constexpr const char* HEADER_VALUE = "1";
    static constexpr const char* FORBIDDEN_MESSAGE = "Forbidden: cross-origin request blocked";

    explicit CsrfGuard(std::vector<std::string> trusted_hosts = {"localhost", "127.0.0.1"});

    // nullopt means proceed; otherwise a ready-to-send 403
    std::optional<ApiResponse> validate(const ApiRequest& req) const;

    bool is_trusted_url(const std::string& url) const;
    static std::optional<std::string> extract_hostname(const std::string& url);

private:
    std::vector<std::string> trusted_hosts_;

    static bool is_safe_method(const std::string& method);
};
