#include "integration.hpp"

void to_json(nlohmann::json& j, const SyncStep& step) {
    j = {
        {"key", step.key},
        {"label", step.label},
        {"status", step.status_string()}
    };
    if (step.record_count) j["recordCount"] = *step.record_count;
    if (step.duration_ms) j["durationMs"] = *step.duration_ms;
    if (step.error) j["error"] = *step.error;
}

void to_json(nlohmann::json& j, const NormalizedMetric& metric) {
    j = {
        {"metricType", metric.metric_type},
        {"value", metric.value},
        {"date", metric.date}
    };
    if (metric.currency) j["currency"] = *metric.currency;
    if (metric.project_id) j["projectId"] = *metric.project_id;
    if (!metric.metadata.empty()) j["metadata"] = metric.metadata;
}
