#include "courier.h"
#include "usage_aggregator.h"

#include <numeric>

double UsageAggregate::average_latency() const {
    if (latencies.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(latencies.begin(), latencies.end(), 0.0);
    return sum / static_cast<double>(latencies.size());
}

nlohmann::json UsageAggregate::to_json() const {
    nlohmann::json breakdown = nlohmann::json::object();
    for (const auto& [model, usage] : per_model) {
        breakdown[model] = {
            {"requests", usage.requests},
            {"tokens", usage.tokens},
            {"cost", courier::round_to(usage.cost, 6)}
        };
    }

    return {
        {"totalRequests", total_requests},
        {"totalTokens", total_tokens},
        {"totalCost", courier::round_to(total_cost, 6)},
        {"averageLatency", courier::round_to(average_latency(), 3)},
        {"modelBreakdown", breakdown}
    };
}

void UsageAggregator::record(const std::string& model, int total_tokens, int prompt_tokens,
                             int completion_tokens, double cost, double latency_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    state_.total_requests++;
    state_.total_tokens += total_tokens;
    state_.total_cost += cost;
    state_.latencies.push_back(latency_seconds);

    auto& bucket = state_.per_model[model];
    bucket.requests++;
    bucket.tokens += total_tokens;
    bucket.cost += cost;

    dprintf(2, "Usage recorded: model=%s prompt=%d completion=%d cost=%.6f latency=%.3f",
            model.c_str(), prompt_tokens, completion_tokens, cost, latency_seconds);
}

UsageAggregate UsageAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}
