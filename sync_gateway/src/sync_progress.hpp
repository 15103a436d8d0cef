#pragma once

#include "integration.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

enum class ProgressStatus {
    Running,
    Success,
    Error
};

struct SyncProgress {
    std::string account_id;
    ProgressStatus status = ProgressStatus::Running;
    std::string started_at;
    std::optional<std::string> completed_at;
    std::optional<std::string> error;
    std::optional<int64_t> records_processed;
    std::vector<SyncStep> steps;
    std::chrono::steady_clock::time_point updated_at;
};

// Live per-account progress for the status route. Entries expire a fixed
// time after their last update.
class SyncProgressTracker {
public:
    explicit SyncProgressTracker(int ttl_seconds = 600);

    void start(const std::string& account_id);
    // Replaces the step with the same key, or appends it
    void append_step(const std::string& account_id, const SyncStep& step);
    void finalize(const std::string& account_id, bool success, int64_t records_processed,
                  const std::optional<std::string>& error,
                  const std::vector<SyncStep>& steps);

    std::optional<SyncProgress> get(const std::string& account_id);

private:
    int ttl_seconds_;
    std::mutex mutex_;
    std::unordered_map<std::string, SyncProgress> progress_;

    void sweep_expired();
};

void to_json(nlohmann::json& j, const SyncProgress& progress);
