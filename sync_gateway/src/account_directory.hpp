#pragma once

#include "integration.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

// Configured accounts, loaded once at start-up and read-only afterwards
class AccountDirectory {
public:
    AccountDirectory() = default;
    explicit AccountDirectory(std::vector<AccountConfig> accounts);

    static AccountDirectory from_json(const nlohmann::json& doc);
    static AccountDirectory load_file(const std::string& path);

    std::optional<AccountConfig> find(const std::string& id) const;
    std::vector<AccountConfig> active() const;
    size_t size() const { return accounts_.size(); }

private:
    std::vector<AccountConfig> accounts_;
};
