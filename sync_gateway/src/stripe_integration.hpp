#pragma once

#include "integration.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Revenue, subscription and customer metrics from a Stripe account
class StripeIntegration : public Integration {
public:
    static constexpr const char* ID = "stripe";
    static constexpr int DEFAULT_LOOKBACK_DAYS = 30;

    StripeIntegration(const std::string& api_base, int timeout_ms);

    std::string id() const override { return ID; }
    std::string name() const override { return "Stripe"; }
    std::string description() const override {
        return "Track revenue, subscriptions, and charges from a Stripe account.";
    }

    FetchResult sync(const AccountConfig& account, std::optional<int64_t> since,
                     const StepReporter& report) override;
    bool validate_credentials(const std::map<std::string, std::string>& credentials) override;

    // Aggregations over raw Stripe objects
    static std::vector<NormalizedMetric> compute_daily_revenue(const std::vector<nlohmann::json>& charges);
    static std::vector<NormalizedMetric> compute_mrr(const std::vector<nlohmann::json>& subscriptions,
                                                     const std::string& today);
    static std::vector<NormalizedMetric> compute_new_customers(const std::vector<nlohmann::json>& customers);

private:
    std::string api_base_;
    int timeout_ms_;

    static std::string secret_key_of(const std::map<std::string, std::string>& credentials);
};
