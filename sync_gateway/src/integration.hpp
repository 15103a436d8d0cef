#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

enum class StepStatus {
    Success,
    Error,
    Skipped
};

// One discrete unit of work reported by an integration during a sync
struct SyncStep {
    std::string key;
    std::string label;
    StepStatus status = StepStatus::Success;
    std::optional<int64_t> record_count;
    std::optional<int64_t> duration_ms;
    std::optional<std::string> error;

    std::string status_string() const {
        switch (status) {
            case StepStatus::Success: return "success";
            case StepStatus::Error: return "error";
            default: return "skipped";
        }
    }
};

struct NormalizedMetric {
    std::string metric_type;
    double value = 0.0;
    std::optional<std::string> currency;
    std::string date;  // YYYY-MM-DD
    std::optional<std::string> project_id;
    std::map<std::string, std::string> metadata;
};

struct AccountConfig {
    std::string id;
    std::string integration_id;
    std::string label;
    std::map<std::string, std::string> credentials;
    bool is_active = true;
};

// What an integration hands back from one fetch
struct FetchResult {
    bool success = false;
    int64_t records_processed = 0;
    std::vector<NormalizedMetric> metrics;
    std::optional<std::string> error;
    std::vector<SyncStep> steps;
};

using StepReporter = std::function<void(const SyncStep&)>;

// Capability every data source implements. Implementations may block on
// network I/O and may throw; callers sanitize whatever comes back.
class Integration {
public:
    virtual ~Integration() = default;

    virtual std::string id() const = 0;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    // since: unix seconds; nullopt lets the integration pick its default window.
    // report (may be empty) is called as each step completes.
    virtual FetchResult sync(const AccountConfig& account, std::optional<int64_t> since,
                             const StepReporter& report) = 0;
    virtual bool validate_credentials(const std::map<std::string, std::string>& credentials) = 0;
};

void to_json(nlohmann::json& j, const SyncStep& step);
void to_json(nlohmann::json& j, const NormalizedMetric& metric);
