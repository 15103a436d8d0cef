#include "builtin_integrations.hpp"
#include "stripe_integration.hpp"
#include <spdlog/spdlog.h>

IntegrationRegistry::Discovery builtin_integrations(const Config& config) {
    std::string stripe_base = config.stripe_api_base;
    int timeout_ms = config.request_timeout_ms;

    return [stripe_base, timeout_ms](IntegrationRegistry& registry) {
        registry.register_integration(std::make_shared<StripeIntegration>(stripe_base, timeout_ms));
        spdlog::info("Registered {} integration(s)", registry.size());
    };
}
