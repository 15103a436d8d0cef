#include "csrf.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

CsrfGuard::CsrfGuard(std::vector<std::string> trusted_hosts) {
    for (const auto& host : trusted_hosts) {
        trusted_hosts_.push_back(util::to_lower(host));
    }
}

bool CsrfGuard::is_safe_method(const std::string& method) {
    std::string upper = util::to_upper(method);
    return upper == "GET" || upper == "HEAD" || upper == "OPTIONS";
}

std::optional<std::string> CsrfGuard::extract_hostname(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    std::string scheme = util::to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme_end + 3);
    std::string authority = rest.substr(0, rest.find_first_of("/?#"));

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string host;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        host = authority.substr(0, close + 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }

    if (host.empty()) return std::nullopt;
    return util::to_lower(host);
}

bool CsrfGuard::is_trusted_url(const std::string& url) const {
    auto host = extract_hostname(url);
    if (!host) return false;
    return std::find(trusted_hosts_.begin(), trusted_hosts_.end(), *host) != trusted_hosts_.end();
}

std::optional<ApiResponse> CsrfGuard::validate(const ApiRequest& req) const {
    if (is_safe_method(req.method)) {
        return std::nullopt;
    }

    auto custom = req.header(HEADER_NAME);
    if (custom && *custom == HEADER_VALUE) {
        return std::nullopt;
    }

    if (auto origin = req.header("origin")) {
        if (is_trusted_url(*origin)) return std::nullopt;
        spdlog::warn("Blocked cross-origin {} request (origin check)", req.method);
        return ApiResponse::error(403, FORBIDDEN_MESSAGE);
    }

    if (auto referer = req.header("referer")) {
        if (is_trusted_url(*referer)) return std::nullopt;
        spdlog::warn("Blocked cross-origin {} request (referer check)", req.method);
        return ApiResponse::error(403, FORBIDDEN_MESSAGE);
    }

    spdlog::warn("Blocked {} request with no origin signal", req.method);
    return ApiResponse::error(403, FORBIDDEN_MESSAGE);
}
