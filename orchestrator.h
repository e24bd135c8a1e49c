#pragma once

#include "completion.h"
#include "cost_estimator.h"
#include "usage_aggregator.h"
#include "providers/registry.h"
#include "errors.h"
#include "nlohmann/json.hpp"
#include <functional>
#include <optional>
#include <atomic>

/// @brief One completion request as received by the responder
struct CompletionInput {
    std::string message;
    std::optional<std::string> context;   // System prompt; default assistant prompt when absent
    std::optional<std::string> model;     // Provider default when absent
    double temperature = 0.7;
    int max_tokens = 1000;
};

/// @brief Tagged outcome of CompletionOrchestrator::handle()
struct OrchestratorResult {
    enum Status {
        SUCCESS = 0,
        FAILURE = 1
    };

    Status status = SUCCESS;

    // SUCCESS
    CompletionResult result;
    CostRecord cost;
    std::string timestamp;
    double processing_time = 0.0;   // Seconds

    // FAILURE
    ErrorKind error_kind = ErrorKind::UPSTREAM;
    std::string error;

    bool ok() const { return status == SUCCESS; }

    /// @brief 200 on success, otherwise the status mapped from error_kind
    int http_status() const { return ok() ? 200 : http_status_for(error_kind); }

    /// @brief Success or failure wire payload
    nlohmann::json to_json() const;

    static OrchestratorResult failure(ErrorKind kind, const std::string& message);
};

/// @brief Responder-side request pipeline
/// Builds the message list, calls the provider, prices and records the call.
/// Provider failures are returned as FAILURE results, never thrown.
class CompletionOrchestrator {
public:
    static constexpr const char* DEFAULT_SYSTEM_PROMPT = "You are a helpful AI assistant.";
    static constexpr const char* SERVER_NAME = "Courier Responder";

    /// @brief Receives formatted SSE frames; returns false when the client is gone
    using FrameSink = std::function<bool(const std::string& frame)>;

    CompletionOrchestrator(ProviderRegistry& registry,
                           const CostEstimator& estimator,
                           UsageAggregator& usage,
                           double default_temperature = 0.7,
                           int default_max_tokens = 1000);

    OrchestratorResult handle(const CompletionInput& input);

    /// @brief Forward provider chunks as content frames, then [DONE] or an error frame
    void handle_stream(const CompletionInput& input, const FrameSink& sink);

    /// @brief [system(context or default prompt), user(message)]
    static MessageList build_messages(const CompletionInput& input);

    /// @brief {provider, models, default[, note]}
    /// @throws CourierError if the provider cannot be built or listed
    nlohmann::json models_payload();

    /// @brief {status, server, timestamp, messagesProcessed, provider, ai:{configured, status, error?}}
    nlohmann::json health_payload();

    /// @brief {provider, defaultModel, temperature, maxTokens}
    nlohmann::json config_payload();

    /// @brief Usage aggregate as JSON
    nlohmann::json stats_payload() const { return usage.to_json(); }

    /// @brief Successful handle() calls, reported as messagesProcessed in /health
    size_t messages_processed() const { return processed_count.load(); }

    double get_default_temperature() const { return default_temperature; }
    int get_default_max_tokens() const { return default_max_tokens; }

private:
    ProviderRegistry& registry;
    const CostEstimator& estimator;
    UsageAggregator& usage;
    double default_temperature;
    int default_max_tokens;

    std::atomic<size_t> processed_count{0};
};
