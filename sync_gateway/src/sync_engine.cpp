#include "sync_engine.hpp"
#include "sanitizer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

SyncEngine::SyncEngine(IntegrationRegistry& registry,
                       const AccountDirectory& accounts,
                       SyncProgressTracker& progress,
                       IntegrationRegistry::Discovery discovery)
    : registry_(registry)
    , accounts_(accounts)
    , progress_(progress)
    , discovery_(std::move(discovery))
{}

void SyncEngine::load_all_integrations() {
    registry_.load_all(discovery_);
}

std::optional<int64_t> SyncEngine::resolve_since(const std::string& account_id,
                                                 const SyncOptions& options) const {
    if (options.from || options.full_sync) {
        return options.from;
    }

    // Incremental: continue from the last successful completion
    std::lock_guard<std::mutex> lock(log_mutex_);
    auto it = last_success_epoch_.find(account_id);
    if (it == last_success_epoch_.end()) return std::nullopt;
    return it->second;
}

AccountSyncResult SyncEngine::finish(SyncLogEntry entry, AccountSyncResult result) {
    entry.status = result.success ? "success" : "error";
    entry.completed_at = util::current_iso8601();
    entry.error = result.error;
    entry.records_processed = result.records_processed;

    progress_.finalize(entry.account_id, result.success, result.records_processed,
                       result.error, result.steps);

    std::lock_guard<std::mutex> lock(log_mutex_);
    if (result.success) {
        last_success_epoch_[entry.account_id] = util::current_timestamp_ms() / 1000;
    }
    latest_log_[entry.account_id] = std::move(entry);
    return result;
}

AccountSyncResult SyncEngine::sync_account(const std::string& account_id,
                                           const SyncOptions& options) {
    AccountSyncResult result;

    auto account = accounts_.find(account_id);
    if (!account) {
        result.error = "Account not found";
        return result;
    }

    if (!account->is_active) {
        result.error = "Account is inactive";
        return result;
    }

    auto integration = registry_.get(account->integration_id);
    if (!integration) {
        result.error = "Integration \"" + account->integration_id + "\" not found";
        return result;
    }

    SyncLogEntry entry;
    entry.id = util::generate_uuid();
    entry.account_id = account_id;
    entry.status = "running";
    entry.started_at = util::current_iso8601();
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        latest_log_[account_id] = entry;
    }
    progress_.start(account_id);

    auto since = resolve_since(account_id, options);
    spdlog::info("Syncing account {} via {} (sync log {})",
                 account_id, integration->id(), entry.id);

    FetchResult fetched;
    try {
        fetched = integration->sync(*account, since, [this, &account_id](const SyncStep& step) {
            SyncStep safe = step;
            if (safe.error) safe.error = sanitize_error_message(*safe.error);
            progress_.append_step(account_id, safe);
        });
    } catch (const std::exception& e) {
        result.error = sanitize_error_message(e.what());
        spdlog::error("Sync for account {} failed: {}", account_id, *result.error);
        return finish(std::move(entry), std::move(result));
    }

    for (auto& step : fetched.steps) {
        if (step.error) step.error = sanitize_error_message(*step.error);
    }
    result.steps = std::move(fetched.steps);

    if (!fetched.success) {
        result.error = fetched.error ? sanitize_error_message(*fetched.error) : "Sync failed";
        spdlog::warn("Sync for account {} reported failure: {}", account_id, *result.error);
        return finish(std::move(entry), std::move(result));
    }

    result.success = true;
    result.records_processed = fetched.records_processed;
    spdlog::info("Synced account {}: {} records, {} metrics",
                 account_id, fetched.records_processed, fetched.metrics.size());

    return finish(std::move(entry), std::move(result));
}

std::vector<AccountSyncSummary> SyncEngine::sync_all_accounts(const SyncOptions& options) {
    std::vector<AccountSyncSummary> summaries;

    for (const auto& account : accounts_.active()) {
        AccountSyncSummary summary;
        summary.account_id = account.id;
        summary.label = account.label;
        summary.result = sync_account(account.id, options);
        summaries.push_back(std::move(summary));
    }

    return summaries;
}

std::optional<SyncLogEntry> SyncEngine::latest_log(const std::string& account_id) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    auto it = latest_log_.find(account_id);
    if (it == latest_log_.end()) return std::nullopt;
    return it->second;
}

std::optional<nlohmann::json> SyncEngine::account_status(const std::string& account_id) const {
    auto entry = latest_log(account_id);
    if (!entry) return std::nullopt;
    return nlohmann::json(*entry);
}

std::optional<nlohmann::json> SyncEngine::sync_progress(const std::string& account_id) const {
    auto progress = progress_.get(account_id);
    if (!progress) return std::nullopt;
    return nlohmann::json(*progress);
}

void to_json(nlohmann::json& j, const SyncLogEntry& entry) {
    j = {
        {"id", entry.id},
        {"accountId", entry.account_id},
        {"status", entry.status},
        {"startedAt", entry.started_at},
        {"recordsProcessed", entry.records_processed}
    };
    if (entry.completed_at) j["completedAt"] = *entry.completed_at;
    if (entry.error) j["error"] = *entry.error;
}
