#pragma once

#include "integration.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

struct SyncOptions {
    bool full_sync = false;
    std::optional<int64_t> from;  // unix seconds
};

struct AccountSyncResult {
    bool success = false;
    int64_t records_processed = 0;
    std::optional<std::string> error;
    std::vector<SyncStep> steps;
};

struct AccountSyncSummary {
    std::string account_id;
    std::string label;
    AccountSyncResult result;
};

// Collaborator contract the orchestrator drives. Calls may block on
// network I/O and may throw.
class SyncBackend {
public:
    virtual ~SyncBackend() = default;

    // Idempotent after the first success
    virtual void load_all_integrations() = 0;

    virtual AccountSyncResult sync_account(const std::string& account_id,
                                           const SyncOptions& options) = 0;
    virtual std::vector<AccountSyncSummary> sync_all_accounts(const SyncOptions& options) = 0;

    // Latest sync log entry / live progress, as JSON, for the status route
    virtual std::optional<nlohmann::json> account_status(const std::string& account_id) const = 0;
    virtual std::optional<nlohmann::json> sync_progress(const std::string& account_id) const = 0;
};

void to_json(nlohmann::json& j, const AccountSyncResult& result);
void to_json(nlohmann::json& j, const AccountSyncSummary& summary);
