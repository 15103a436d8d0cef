#include "integration_registry.hpp"
#include <spdlog/spdlog.h>

bool IntegrationRegistry::register_integration(std::shared_ptr<Integration> integration) {
    if (!integration) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = integration->id();

    if (integrations_.count(id) > 0) {
        spdlog::warn("Integration \"{}\" is already registered. Skipping duplicate.", id);
        return false;
    }

    integrations_.emplace(id, std::move(integration));
    spdlog::debug("Registered integration {}", id);
    return true;
}

std::shared_ptr<Integration> IntegrationRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = integrations_.find(id);
    if (it == integrations_.end()) return nullptr;
    return it->second;
}

bool IntegrationRegistry::has(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return integrations_.count(id) > 0;
}

std::vector<std::shared_ptr<Integration>> IntegrationRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Integration>> result;
    for (const auto& [id, integration] : integrations_) {
        result.push_back(integration);
    }
    return result;
}

size_t IntegrationRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return integrations_.size();
}

void IntegrationRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    integrations_.clear();
}

void IntegrationRegistry::load_all(const Discovery& discover) {
    std::call_once(load_once_, [this, &discover]() {
        discover(*this);
        loaded_ = true;
        spdlog::info("Loaded {} integration(s)", size());
    });
}
