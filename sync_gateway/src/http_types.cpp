#include "http_types.hpp"
#include "util.hpp"

void ApiRequest::set_header(const std::string& name, const std::string& value) {
    headers[util::to_lower(name)] = value;
}

std::optional<std::string> ApiRequest::header(const std::string& name) const {
    auto it = headers.find(util::to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ApiRequest::query_param(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end()) return std::nullopt;
    return it->second;
}
