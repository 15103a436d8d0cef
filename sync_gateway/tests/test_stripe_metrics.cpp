#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/stripe_integration.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Stripe revenue aggregation", "[stripe]") {
    // 2024-01-01 and 2024-01-02 UTC
    std::vector<nlohmann::json> charges = {
        {{"status", "succeeded"}, {"created", 1704067200 + 100}, {"amount", 1250}, {"amount_refunded", 0}, {"currency", "usd"}},
        {{"status", "succeeded"}, {"created", 1704067200 + 200}, {"amount", 750}, {"amount_refunded", 250}, {"currency", "usd"}},
        {{"status", "failed"}, {"created", 1704067200 + 300}, {"amount", 9999}, {"currency", "usd"}},
        {{"status", "succeeded"}, {"created", 1704153600 + 10}, {"amount", 500}, {"currency", "usd"}}
    };

    auto metrics = StripeIntegration::compute_daily_revenue(charges);
    REQUIRE(metrics.size() == 5);

    REQUIRE(metrics[0].metric_type == "revenue");
    REQUIRE(metrics[0].date == "2024-01-01");
    REQUIRE_THAT(metrics[0].value, WithinAbs(20.0, 1e-9));
    REQUIRE(metrics[0].currency == "USD");

    REQUIRE(metrics[1].metric_type == "charges_count");
    REQUIRE_THAT(metrics[1].value, WithinAbs(2.0, 1e-9));

    REQUIRE(metrics[2].metric_type == "refunds");
    REQUIRE_THAT(metrics[2].value, WithinAbs(2.5, 1e-9));

    REQUIRE(metrics[3].date == "2024-01-02");
    REQUIRE(metrics[4].metric_type == "charges_count");
}

TEST_CASE("Stripe MRR normalization", "[stripe]") {
    auto subscription = [](int64_t unit_amount, const std::string& interval, int64_t quantity) {
        return nlohmann::json{
            {"items", {{"data", nlohmann::json::array({
                {{"quantity", quantity},
                 {"price", {{"unit_amount", unit_amount}, {"currency", "eur"},
                            {"recurring", {{"interval", interval}}}}}}
            })}}}
        };
    };

    std::vector<nlohmann::json> subs = {
        subscription(1000, "month", 2),
        subscription(12000, "year", 1),
        subscription(100, "week", 1)
    };

    auto metrics = StripeIntegration::compute_mrr(subs, "2024-01-15");
    REQUIRE(metrics.size() == 2);
    REQUIRE(metrics[0].metric_type == "mrr");
    REQUIRE_THAT(metrics[0].value, WithinAbs(34.33, 1e-9));
    REQUIRE(metrics[0].currency == "EUR");
    REQUIRE(metrics[0].date == "2024-01-15");
    REQUIRE(metrics[1].metric_type == "active_subscriptions");
    REQUIRE_THAT(metrics[1].value, WithinAbs(3.0, 1e-9));
}

TEST_CASE("Stripe new customers", "[stripe]") {
    std::vector<nlohmann::json> customers = {
        {{"created", 1704067200 + 5}},
        {{"created", 1704067200 + 6}},
        {{"created", 1704153600 + 1}, {"deleted", true}}
    };

    auto metrics = StripeIntegration::compute_new_customers(customers);
    REQUIRE(metrics.size() == 1);
    REQUIRE(metrics[0].date == "2024-01-01");
    REQUIRE_THAT(metrics[0].value, WithinAbs(2.0, 1e-9));
}
