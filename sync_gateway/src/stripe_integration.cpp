#include "stripe_integration.hpp"
#include "stripe_client.hpp"
#include "util.hpp"
#include "sanitizer.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <map>
#include <stdexcept>
#include <algorithm>

StripeIntegration::StripeIntegration(const std::string& api_base, int timeout_ms)
    : api_base_(api_base), timeout_ms_(timeout_ms) {}

std::string StripeIntegration::secret_key_of(const std::map<std::string, std::string>& credentials) {
    auto it = credentials.find("secret_key");
    if (it == credentials.end() || it->second.empty()) {
        throw std::runtime_error("Stripe account is missing the secret_key credential");
    }
    return it->second;
}

std::vector<NormalizedMetric> StripeIntegration::compute_daily_revenue(const std::vector<nlohmann::json>& charges) {
    struct DailyTotals {
        double revenue = 0.0;
        int64_t count = 0;
        double refunds = 0.0;
        std::string currency;
    };
    std::map<std::string, DailyTotals> daily;

    for (const auto& charge : charges) {
        if (charge.value("status", "") != "succeeded") continue;

        std::string date = util::date_from_epoch(charge.value("created", int64_t{0}));
        auto& totals = daily[date];

        // Stripe amounts are in minor units
        totals.revenue += charge.value("amount", int64_t{0}) / 100.0;
        totals.refunds += charge.value("amount_refunded", int64_t{0}) / 100.0;
        totals.count += 1;

        totals.currency = util::to_upper(charge.value("currency", "usd"));
    }

    std::vector<NormalizedMetric> metrics;
    for (const auto& [date, totals] : daily) {
        NormalizedMetric revenue;
        revenue.metric_type = "revenue";
        revenue.value = totals.revenue;
        revenue.currency = totals.currency;
        revenue.date = date;
        metrics.push_back(revenue);

        NormalizedMetric count;
        count.metric_type = "charges_count";
        count.value = static_cast<double>(totals.count);
        count.date = date;
        metrics.push_back(count);

        if (totals.refunds > 0) {
            NormalizedMetric refunds;
            refunds.metric_type = "refunds";
            refunds.value = totals.refunds;
            refunds.currency = totals.currency;
            refunds.date = date;
            metrics.push_back(refunds);
        }
    }

    return metrics;
}

std::vector<NormalizedMetric> StripeIntegration::compute_mrr(const std::vector<nlohmann::json>& subscriptions,
                                                             const std::string& today) {
    double total_mrr = 0.0;
    std::string currency = "USD";

    for (const auto& sub : subscriptions) {
        if (!sub.contains("items") || !sub["items"].contains("data")) continue;
        const auto& items = sub["items"]["data"];
        if (!items.is_array() || items.empty()) continue;

        const auto& item = items[0];
        if (!item.contains("price") || !item["price"].is_object()) continue;
        const auto& price = item["price"];

        if (!price.contains("unit_amount") || price["unit_amount"].is_null()) continue;
        if (!price.contains("recurring") || !price["recurring"].is_object()) continue;

        currency = util::to_upper(price.value("currency", "usd"));

        double amount = price["unit_amount"].get<int64_t>() / 100.0;
        int64_t quantity = item.value("quantity", int64_t{1});
        if (quantity <= 0) quantity = 1;
        double line = amount * static_cast<double>(quantity);

        // Normalize to a monthly figure
        std::string interval = price["recurring"].value("interval", "month");
        if (interval == "month") {
            total_mrr += line;
        } else if (interval == "year") {
            total_mrr += line / 12.0;
        } else if (interval == "week") {
            total_mrr += line * 4.33;
        } else if (interval == "day") {
            total_mrr += line * 30.0;
        }
    }

    NormalizedMetric mrr;
    mrr.metric_type = "mrr";
    mrr.value = std::round(total_mrr * 100.0) / 100.0;
    mrr.currency = currency;
    mrr.date = today;

    NormalizedMetric active;
    active.metric_type = "active_subscriptions";
    active.value = static_cast<double>(subscriptions.size());
    active.date = today;

    return {mrr, active};
}

std::vector<NormalizedMetric> StripeIntegration::compute_new_customers(const std::vector<nlohmann::json>& customers) {
    std::map<std::string, int64_t> daily;
    for (const auto& customer : customers) {
        if (customer.value("deleted", false)) continue;
        daily[util::date_from_epoch(customer.value("created", int64_t{0}))]++;
    }

    std::vector<NormalizedMetric> metrics;
    for (const auto& [date, count] : daily) {
        NormalizedMetric metric;
        metric.metric_type = "new_customers";
        metric.value = static_cast<double>(count);
        metric.date = date;
        metrics.push_back(metric);
    }
    return metrics;
}

FetchResult StripeIntegration::sync(const AccountConfig& account, std::optional<int64_t> since,
                                    const StepReporter& report) {
    StripeClient client(api_base_, secret_key_of(account.credentials), timeout_ms_);

    int64_t now_s = util::current_timestamp_ms() / 1000;
    int64_t start_of_today = now_s - (now_s % 86400);
    int64_t sync_since = since.value_or(start_of_today - DEFAULT_LOOKBACK_DAYS * 86400);
    std::string today = util::date_from_epoch(now_s);
    StripeClient::Params created_filter = {{"created[gte]", std::to_string(sync_since)}};

    FetchResult result;

    auto run_step = [&](const std::string& key, const std::string& label,
                        const std::function<int64_t()>& body) {
        SyncStep step;
        step.key = key;
        step.label = label;
        auto t0 = std::chrono::steady_clock::now();
        try {
            int64_t records = body();
            step.status = StepStatus::Success;
            step.record_count = records;
            result.records_processed += records;
        } catch (const std::exception& e) {
            step.status = StepStatus::Error;
            step.error = e.what();
            spdlog::warn("Stripe step {} failed for account {}", key, account.id);
        }
        step.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        if (report) report(step);
        result.steps.push_back(step);
    };

    run_step("fetch_charges", "Fetch charges & revenue", [&]() {
        std::vector<nlohmann::json> charges;
        client.list_all("/charges", created_filter,
                        [&](const nlohmann::json& c) { charges.push_back(c); });
        auto metrics = compute_daily_revenue(charges);
        result.metrics.insert(result.metrics.end(), metrics.begin(), metrics.end());
        return static_cast<int64_t>(charges.size());
    });

    run_step("fetch_subscriptions", "Fetch subscriptions & MRR", [&]() {
        std::vector<nlohmann::json> subscriptions;
        client.list_all("/subscriptions", {{"status", "active"}},
                        [&](const nlohmann::json& s) { subscriptions.push_back(s); });
        auto metrics = compute_mrr(subscriptions, today);
        result.metrics.insert(result.metrics.end(), metrics.begin(), metrics.end());
        return static_cast<int64_t>(subscriptions.size());
    });

    run_step("fetch_customers", "Fetch new customers", [&]() {
        std::vector<nlohmann::json> customers;
        client.list_all("/customers", created_filter,
                        [&](const nlohmann::json& c) { customers.push_back(c); });
        auto metrics = compute_new_customers(customers);
        result.metrics.insert(result.metrics.end(), metrics.begin(), metrics.end());
        return static_cast<int64_t>(customers.size());
    });

    bool all_failed = std::all_of(result.steps.begin(), result.steps.end(),
                                  [](const SyncStep& s) { return s.status == StepStatus::Error; });
    bool any_failed = std::any_of(result.steps.begin(), result.steps.end(),
                                  [](const SyncStep& s) { return s.status == StepStatus::Error; });

    if (all_failed) {
        result.success = false;
        result.records_processed = 0;
        result.metrics.clear();
        result.error = "All sync steps failed";
        return result;
    }

    result.success = true;
    if (any_failed) {
        result.error = "Some sync steps failed";
    }
    return result;
}

bool StripeIntegration::validate_credentials(const std::map<std::string, std::string>& credentials) {
    try {
        StripeClient client(api_base_, secret_key_of(credentials), timeout_ms_);
        client.get("/balance");
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Stripe credential check failed: {}", sanitize_error_message(e.what()));
        return false;
    }
}
