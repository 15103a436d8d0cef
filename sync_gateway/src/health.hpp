#pragma once

#include "sync_orchestrator.hpp"
#include "sync_cooldown.hpp"
#include "account_directory.hpp"
#include <nlohmann/json.hpp>
#include <string>

class HealthCheck {
public:
    HealthCheck(const std::string& service_name,
                const SyncOrchestrator& orchestrator,
                const AccountDirectory& accounts,
                const SyncCooldown& cooldown);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    std::string service_name_;
    const SyncOrchestrator& orchestrator_;
    const AccountDirectory& accounts_;
    const SyncCooldown& cooldown_;
};
