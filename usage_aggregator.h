#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include "nlohmann/json.hpp"

/// @brief Point-in-time copy of aggregated usage
struct UsageAggregate {
    struct ModelUsage {
        int requests = 0;
        long tokens = 0;
        double cost = 0.0;
    };

    int total_requests = 0;
    long total_tokens = 0;
    double total_cost = 0.0;
    std::map<std::string, ModelUsage> per_model;
    std::vector<double> latencies;   // Seconds, in recording order

    /// @brief Mean of latencies, 0 when nothing was recorded
    double average_latency() const;

    /// @brief {totalRequests, totalTokens, totalCost, averageLatency, modelBreakdown}
    nlohmann::json to_json() const;
};

/// @brief Running usage totals shared by every request handled on one side
/// Append/increment only. Latencies grow without bound for the process lifetime.
class UsageAggregator {
public:
    void record(const std::string& model, int total_tokens, int prompt_tokens,
                int completion_tokens, double cost, double latency_seconds);

    UsageAggregate snapshot() const;

    nlohmann::json to_json() const { return snapshot().to_json(); }

private:
    mutable std::mutex mutex_;
    UsageAggregate state_;
};
