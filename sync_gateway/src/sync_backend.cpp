#include "sync_backend.hpp"

void to_json(nlohmann::json& j, const AccountSyncResult& result) {
    j = {
        {"success", result.success},
        {"recordsProcessed", result.records_processed}
    };
    if (result.error) j["error"] = *result.error;
    if (!result.steps.empty()) j["steps"] = result.steps;
}

void to_json(nlohmann::json& j, const AccountSyncSummary& summary) {
    to_json(j, summary.result);
    j["accountId"] = summary.account_id;
    j["label"] = summary.label;
}
