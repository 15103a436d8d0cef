#pragma once

#include "sync_backend.hpp"
#include "integration_registry.hpp"
#include "account_directory.hpp"
#include "sync_progress.hpp"
#include <string>
#include <map>
#include <mutex>
#include <optional>

struct SyncLogEntry {
    std::string id;
    std::string account_id;
    std::string status;  // running | success | error
    std::string started_at;
    std::optional<std::string> completed_at;
    std::optional<std::string> error;
    int64_t records_processed = 0;
};

// In-process implementation of the sync collaborator: resolves the account
// and its integration, runs the fetch, and keeps the latest log entry per
// account in memory.
class SyncEngine : public SyncBackend {
public:
    SyncEngine(IntegrationRegistry& registry,
               const AccountDirectory& accounts,
               SyncProgressTracker& progress,
               IntegrationRegistry::Discovery discovery);

    void load_all_integrations() override;

    AccountSyncResult sync_account(const std::string& account_id,
                                   const SyncOptions& options) override;
    std::vector<AccountSyncSummary> sync_all_accounts(const SyncOptions& options) override;

    std::optional<nlohmann::json> account_status(const std::string& account_id) const override;
    std::optional<nlohmann::json> sync_progress(const std::string& account_id) const override;

    std::optional<SyncLogEntry> latest_log(const std::string& account_id) const;

private:
    IntegrationRegistry& registry_;
    const AccountDirectory& accounts_;
    SyncProgressTracker& progress_;
    IntegrationRegistry::Discovery discovery_;

    mutable std::mutex log_mutex_;
    std::map<std::string, SyncLogEntry> latest_log_;
    std::map<std::string, int64_t> last_success_epoch_;

    std::optional<int64_t> resolve_since(const std::string& account_id,
                                         const SyncOptions& options) const;
    AccountSyncResult finish(SyncLogEntry entry, AccountSyncResult result);
};

void to_json(nlohmann::json& j, const SyncLogEntry& entry);
