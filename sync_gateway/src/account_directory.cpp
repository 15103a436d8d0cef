#include "account_directory.hpp"
#include "validation.hpp"
#include "sanitizer.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>
#include <algorithm>

AccountDirectory::AccountDirectory(std::vector<AccountConfig> accounts)
    : accounts_(std::move(accounts)) {}

AccountDirectory AccountDirectory::from_json(const nlohmann::json& doc) {
    if (!doc.is_array()) {
        throw std::runtime_error("Accounts document must be a JSON array");
    }

    std::vector<AccountConfig> accounts;
    size_t index = 0;

    for (const auto& entry : doc) {
        index++;
        if (!entry.is_object()) {
            spdlog::warn("Skipping account #{}: not an object", index);
            continue;
        }

        auto id = entry.value("id", nlohmann::json());
        auto integration_id = entry.value("integrationId", nlohmann::json());
        auto label = entry.value("label", nlohmann::json());

        auto error = RequestValidator::validate_account_id(id);
        if (!error) error = RequestValidator::validate_integration_id(integration_id);
        if (!error) error = RequestValidator::validate_label(label);
        if (error) {
            spdlog::warn("Skipping account #{}: {}", index, error->message);
            continue;
        }

        AccountConfig account;
        account.id = id.get<std::string>();
        account.integration_id = integration_id.get<std::string>();
        account.label = label.get<std::string>();
        if (entry.contains("isActive")) {
            if (auto bool_error = RequestValidator::validate_boolean("isActive", entry["isActive"])) {
                spdlog::warn("Skipping account #{}: {}", index, bool_error->message);
                continue;
            }
            account.is_active = entry["isActive"].get<bool>();
        }

        if (entry.contains("credentials") && entry["credentials"].is_object()) {
            for (const auto& [key, value] : entry["credentials"].items()) {
                if (value.is_string()) {
                    account.credentials[key] = value.get<std::string>();
                }
            }
        }

        if (std::any_of(accounts.begin(), accounts.end(),
                        [&](const AccountConfig& a) { return a.id == account.id; })) {
            spdlog::warn("Skipping account #{}: duplicate id {}", index, account.id);
            continue;
        }

        accounts.push_back(std::move(account));
    }

    return AccountDirectory(std::move(accounts));
}

AccountDirectory AccountDirectory::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::warn("Accounts file {} not found, starting with no accounts", path);
        return AccountDirectory();
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse accounts file " + path + ": " +
                                 sanitize_error_message(e.what()));
    }

    auto directory = from_json(doc);
    spdlog::info("Loaded {} account(s) from {}", directory.size(), path);
    return directory;
}

std::optional<AccountConfig> AccountDirectory::find(const std::string& id) const {
    for (const auto& account : accounts_) {
        if (account.id == id) return account;
    }
    return std::nullopt;
}

std::vector<AccountConfig> AccountDirectory::active() const {
    std::vector<AccountConfig> result;
    for (const auto& account : accounts_) {
        if (account.is_active) result.push_back(account);
    }
    return result;
}
