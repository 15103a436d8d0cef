#include "sync_progress.hpp"
#include "util.hpp"
#include <algorithm>

SyncProgressTracker::SyncProgressTracker(int ttl_seconds) : ttl_seconds_(ttl_seconds) {}

void SyncProgressTracker::sweep_expired() {
    auto now = std::chrono::steady_clock::now();
    for (auto it = progress_.begin(); it != progress_.end();) {
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - it->second.updated_at).count();
        if (age >= ttl_seconds_) {
            it = progress_.erase(it);
        } else {
            ++it;
        }
    }
}

void SyncProgressTracker::start(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_expired();

    SyncProgress progress;
    progress.account_id = account_id;
    progress.status = ProgressStatus::Running;
    progress.started_at = util::current_iso8601();
    progress.updated_at = std::chrono::steady_clock::now();
    progress_[account_id] = progress;
}

void SyncProgressTracker::append_step(const std::string& account_id, const SyncStep& step) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = progress_.find(account_id);
    if (it == progress_.end()) return;

    auto& steps = it->second.steps;
    auto existing = std::find_if(steps.begin(), steps.end(),
                                 [&](const SyncStep& s) { return s.key == step.key; });
    if (existing != steps.end()) {
        *existing = step;
    } else {
        steps.push_back(step);
    }
    it->second.updated_at = std::chrono::steady_clock::now();
}

void SyncProgressTracker::finalize(const std::string& account_id, bool success,
                                   int64_t records_processed,
                                   const std::optional<std::string>& error,
                                   const std::vector<SyncStep>& steps) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string completed_at = util::current_iso8601();
    auto& progress = progress_[account_id];

    if (progress.account_id.empty()) {
        progress.account_id = account_id;
        progress.started_at = completed_at;
    }
    progress.status = success ? ProgressStatus::Success : ProgressStatus::Error;
    progress.completed_at = completed_at;
    progress.error = error;
    progress.records_processed = records_processed;
    if (!steps.empty()) {
        progress.steps = steps;
    }
    progress.updated_at = std::chrono::steady_clock::now();
}

std::optional<SyncProgress> SyncProgressTracker::get(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_expired();

    auto it = progress_.find(account_id);
    if (it == progress_.end()) return std::nullopt;
    return it->second;
}

void to_json(nlohmann::json& j, const SyncProgress& progress) {
    std::string status = "running";
    if (progress.status == ProgressStatus::Success) status = "success";
    else if (progress.status == ProgressStatus::Error) status = "error";

    j = {
        {"accountId", progress.account_id},
        {"status", status},
        {"startedAt", progress.started_at},
        {"steps", progress.steps}
    };
    if (progress.completed_at) j["completedAt"] = *progress.completed_at;
    if (progress.error) j["error"] = *progress.error;
    if (progress.records_processed) j["recordsProcessed"] = *progress.records_processed;
}
