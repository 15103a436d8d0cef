#pragma once

#include "integration_registry.hpp"
#include "config.hpp"

// Discovery callback that registers every integration compiled into the service
IntegrationRegistry::Discovery builtin_integrations(const Config& config);
