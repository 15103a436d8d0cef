#include "sync_cooldown.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

SyncCooldown::SyncCooldown(int64_t window_ms, Clock clock)
    : window_ms_(window_ms)
    , clock_(clock ? std::move(clock) : Clock(util::current_timestamp_ms))
{}

int64_t SyncCooldown::now_ms() const {
    return clock_();
}

std::optional<std::string> SyncCooldown::check_locked(const std::optional<std::string>& account_id,
                                                      int64_t now) const {
    int64_t last_ms = 0;
    bool has_last = false;

    if (account_id) {
        auto it = last_sync_by_account_.find(*account_id);
        if (it != last_sync_by_account_.end()) {
            last_ms = it->second;
            has_last = true;
        }
    } else {
        last_ms = last_sync_all_ms_;
        has_last = has_synced_all_;
    }

    if (!has_last) return std::nullopt;

    int64_t elapsed = now - last_ms;
    if (elapsed >= window_ms_) return std::nullopt;

    int64_t remaining_ms = window_ms_ - elapsed;
    int64_t remaining_seconds = (remaining_ms + 999) / 1000;

    return fmt::format("Sync cooldown: please wait {}s before syncing {} again",
                       remaining_seconds,
                       account_id ? "this account" : "all accounts");
}

std::optional<std::string> SyncCooldown::check_cooldown(const std::optional<std::string>& account_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_locked(account_id, now_ms());
}

std::optional<std::string> SyncCooldown::try_acquire(const std::optional<std::string>& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool in_flight = account_id
        ? in_flight_accounts_.count(*account_id) > 0
        : sync_all_in_flight_;
    if (in_flight) {
        return fmt::format("Sync already in progress for {}, please wait",
                           account_id ? "this account" : "all accounts");
    }

    if (auto message = check_locked(account_id, now_ms())) {
        return message;
    }

    if (account_id) {
        in_flight_accounts_.insert(*account_id);
    } else {
        sync_all_in_flight_ = true;
    }
    return std::nullopt;
}

void SyncCooldown::record_sync(const std::optional<std::string>& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = now_ms();

    if (account_id) {
        auto& last = last_sync_by_account_[*account_id];
        last = std::max(last, now);
        in_flight_accounts_.erase(*account_id);
    } else {
        last_sync_all_ms_ = std::max(last_sync_all_ms_, now);
        has_synced_all_ = true;
        sync_all_in_flight_ = false;
    }
}

void SyncCooldown::cleanup_old_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t cutoff_ms = now_ms() - window_ms_;

    size_t removed = 0;
    for (auto it = last_sync_by_account_.begin(); it != last_sync_by_account_.end();) {
        if (it->second <= cutoff_ms && in_flight_accounts_.count(it->first) == 0) {
            it = last_sync_by_account_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        spdlog::debug("Cooldown cleanup removed {} expired account entries", removed);
    }
}

size_t SyncCooldown::tracked_accounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sync_by_account_.size();
}
