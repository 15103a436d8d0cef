#pragma once

#include "http_types.hpp"
#include "csrf.hpp"
#include "sync_cooldown.hpp"
#include "sync_backend.hpp"
#include <atomic>
#include <mutex>
#include <optional>

// Entry point for "trigger sync" and "sync status" requests. Order per
// request: origin check, one-time integration load, input validation,
// cooldown, collaborator call. Collaborator errors are sanitized before
// they are logged or returned.
class SyncOrchestrator {
public:
    SyncOrchestrator(const CsrfGuard& csrf, SyncCooldown& cooldown, SyncBackend& backend);

    // POST /api/sync
    ApiResponse handle_sync(const ApiRequest& req);
    // GET /api/sync?accountId=...[&progress=1]
    ApiResponse handle_status(const ApiRequest& req);

    bool integrations_loaded() const { return integrations_loaded_; }

private:
    const CsrfGuard& csrf_;
    SyncCooldown& cooldown_;
    SyncBackend& backend_;

    std::once_flag load_once_;
    std::atomic<bool> integrations_loaded_{false};

    // nullopt once integrations are loaded; a sanitized 500 if loading failed
    std::optional<ApiResponse> ensure_loaded();
    static nlohmann::json parse_body(const std::string& body);

    ApiResponse dispatch(const std::optional<std::string>& account_id, const SyncOptions& options);
};
