#pragma once

#include "http_client.h"
#include "usage_aggregator.h"
#include "conversation_log.h"
#include "errors.h"
#include "nlohmann/json.hpp"
#include <chrono>
#include <functional>
#include <optional>

/// @brief One message to forward to the responder
struct DispatchInput {
    std::string message;
    std::optional<std::string> context;
    std::optional<std::string> model;
    double temperature = 0.7;
    int max_tokens = 1000;

    /// @brief Wire request {message, context?, model?, temperature, max_tokens}
    nlohmann::json to_json() const;
};

/// @brief Tagged outcome of a dispatcher call; never an exception
struct DispatchResult {
    enum State {
        SUCCESS = 0,     // Payload holds the responder's answer
        EXHAUSTED = 1,   // Every attempt failed with a retryable error
        FAILED = 2       // Non-retryable failure (auth, bad response on a single-shot call)
    };

    State state = SUCCESS;
    int attempts = 0;
    nlohmann::json payload;

    ErrorKind error_kind = ErrorKind::UPSTREAM;
    std::string error;

    bool ok() const { return state == SUCCESS; }
    std::string state_name() const;

    /// @brief payload on success, otherwise {status:"error", state, attempts, error:{type, message}}
    nlohmann::json to_json() const;
};

struct DispatcherOptions {
    std::string server_url = "http://localhost:8000";
    int retry_attempts = 3;
    long timeout_seconds = 120;
    long query_timeout_seconds = 10;                     // /health, /models, /config, /stats
    std::chrono::milliseconds backoff_unit{1000};
    std::string local_name = "Courier Messenger";
    std::string remote_name = "Courier Responder";
};

/// @brief Messenger-side client of the responder
/// send() retries connectivity failures, timeouts and non-2xx statuses other
/// than 401/403, waiting 2^i backoff units after failed attempt i.
class RequestDispatcher {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using ChunkCallback = std::function<void(const std::string& chunk)>;

    RequestDispatcher(DispatcherOptions options,
                      UsageAggregator& usage,
                      ConversationLog& log,
                      HttpClientFactory client_factory = default_http_client_factory(),
                      Sleeper sleeper = nullptr);

    /// @brief POST /process with bounded retry
    DispatchResult send(const DispatchInput& input);

    /// @brief POST /stream; chunks go to on_chunk, payload carries the full text
    /// Retried only while no content has been delivered
    DispatchResult send_stream(const DispatchInput& input, const ChunkCallback& on_chunk);

    DispatchResult check_health() { return query("/health"); }
    DispatchResult list_models() { return query("/models"); }
    DispatchResult remote_config() { return query("/config"); }
    DispatchResult remote_stats() { return query("/stats"); }

    /// @brief 2^attempt x unit
    static std::chrono::milliseconds backoff_delay(int attempt, std::chrono::milliseconds unit);

    const DispatcherOptions& get_options() const { return options; }

private:
    DispatchResult query(const std::string& path);
    void record_exchange(const DispatchInput& input, const std::string& response,
                         const std::optional<std::string>& model, const std::optional<int>& tokens);
    void wait_before_retry(int attempt);

    DispatcherOptions options;
    UsageAggregator& usage;
    ConversationLog& log;
    HttpClientFactory client_factory;
    Sleeper sleeper;
};
