#include "sync_orchestrator.hpp"
#include "validation.hpp"
#include "sanitizer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

SyncOrchestrator::SyncOrchestrator(const CsrfGuard& csrf, SyncCooldown& cooldown, SyncBackend& backend)
    : csrf_(csrf)
    , cooldown_(cooldown)
    , backend_(backend)
{}

std::optional<ApiResponse> SyncOrchestrator::ensure_loaded() {
    try {
        std::call_once(load_once_, [this]() {
            backend_.load_all_integrations();
            integrations_loaded_ = true;
        });
    } catch (const std::exception& e) {
        std::string safe = sanitize_error_message(e.what());
        spdlog::error("Failed to load integrations: {}", safe);
        return ApiResponse::error(500, safe);
    }
    return std::nullopt;
}

nlohmann::json SyncOrchestrator::parse_body(const std::string& body) {
    if (util::trim(body).empty()) {
        return nlohmann::json::object();
    }

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        spdlog::debug("Ignoring malformed sync request body");
        return nlohmann::json::object();
    }
    return parsed;
}

ApiResponse SyncOrchestrator::handle_sync(const ApiRequest& req) {
    if (auto forbidden = csrf_.validate(req)) {
        return *forbidden;
    }

    if (auto load_error = ensure_loaded()) {
        return *load_error;
    }

    auto body = parse_body(req.body);

    SyncOptions options;
    if (body.contains("fullSync") && !body["fullSync"].is_null()) {
        if (auto error = RequestValidator::validate_boolean("fullSync", body["fullSync"])) {
            return ApiResponse::error(400, error->message);
        }
        options.full_sync = body["fullSync"].get<bool>();
    }

    if (body.contains("from") && body["from"].is_string()) {
        if (RequestValidator::validate_date_string("from", body["from"])) {
            return ApiResponse::error(400, "Invalid from date");
        }
        options.from = util::epoch_from_date(body["from"].get<std::string>());
    }

    if (body.contains("accountId") && !body["accountId"].is_null()) {
        if (auto error = RequestValidator::validate_account_id(body["accountId"])) {
            return ApiResponse::error(400, error->message);
        }
        return dispatch(body["accountId"].get<std::string>(), options);
    }

    return dispatch(std::nullopt, options);
}

ApiResponse SyncOrchestrator::dispatch(const std::optional<std::string>& account_id,
                                       const SyncOptions& options) {
    std::string corr_id = util::generate_uuid();

    if (auto cooldown_message = cooldown_.try_acquire(account_id)) {
        spdlog::info("Sync for {} rejected: {}",
                     account_id ? *account_id : "all accounts", *cooldown_message);
        return ApiResponse::error(429, *cooldown_message);
    }

    spdlog::info("Dispatching sync for {} (corr_id: {})",
                 account_id ? *account_id : "all accounts", corr_id);

    nlohmann::json result;
    try {
        if (account_id) {
            result = backend_.sync_account(*account_id, options);
        } else {
            result = {{"results", backend_.sync_all_accounts(options)}};
        }
    } catch (const std::exception& e) {
        cooldown_.record_sync(account_id);
        std::string safe = sanitize_error_message(e.what());
        spdlog::error("Sync {} failed upstream: {}", corr_id, safe);
        return ApiResponse::error(500, safe);
    } catch (...) {
        cooldown_.record_sync(account_id);
        throw;
    }

    cooldown_.record_sync(account_id);
    return ApiResponse::ok(std::move(result));
}

ApiResponse SyncOrchestrator::handle_status(const ApiRequest& req) {
    if (auto forbidden = csrf_.validate(req)) {
        return *forbidden;
    }

    if (auto load_error = ensure_loaded()) {
        return *load_error;
    }

    auto account_id = req.query_param("accountId");
    if (!account_id || account_id->empty()) {
        return ApiResponse::error(400, "accountId is required");
    }

    if (auto error = RequestValidator::validate_account_id(*account_id)) {
        return ApiResponse::error(400, error->message);
    }

    try {
        if (req.query_param("progress").value_or("") == "1") {
            auto progress = backend_.sync_progress(*account_id);
            return ApiResponse::ok({{"progress", progress ? *progress : nlohmann::json(nullptr)}});
        }

        auto status = backend_.account_status(*account_id);
        return ApiResponse::ok({{"status", status ? *status : nlohmann::json(nullptr)}});
    } catch (const std::exception& e) {
        std::string safe = sanitize_error_message(e.what());
        spdlog::error("Sync status lookup failed: {}", safe);
        return ApiResponse::error(500, safe);
    }
}
