#pragma once

#include <string>
#include <map>
#include <set>
#include <mutex>
#include <optional>
#include <functional>
#include <cstdint>

// Per-account and global cooldown for sync triggers. One instance lives for
// the whole process and is shared by every request thread. A missing
// account id addresses the "all accounts" slot.
class SyncCooldown {
public:
    using Clock = std::function<int64_t()>;

    static constexpr int64_t DEFAULT_WINDOW_MS = 60 * 1000;

    explicit SyncCooldown(int64_t window_ms = DEFAULT_WINDOW_MS, Clock clock = nullptr);

    // Read-only: message with whole seconds remaining, or nullopt when clear
    std::optional<std::string> check_cooldown(const std::optional<std::string>& account_id) const;

    // Overwrites the slot's timestamp with now and releases any in-flight mark
    void record_sync(const std::optional<std::string>& account_id);

    // Atomic check + reserve. On success the slot is in-flight until
    // record_sync() is called for it; concurrent callers are refused.
    std::optional<std::string> try_acquire(const std::optional<std::string>& account_id);

    // Drops per-account timestamps that can no longer block anything
    void cleanup_old_entries();

    size_t tracked_accounts() const;
    int64_t window_ms() const { return window_ms_; }

private:
    int64_t window_ms_;
    Clock clock_;

    mutable std::mutex mutex_;
    int64_t last_sync_all_ms_ = 0;
    bool has_synced_all_ = false;
    std::map<std::string, int64_t> last_sync_by_account_;
    std::set<std::string> in_flight_accounts_;
    bool sync_all_in_flight_ = false;

    int64_t now_ms() const;
    std::optional<std::string> check_locked(const std::optional<std::string>& account_id,
                                            int64_t now) const;
};
