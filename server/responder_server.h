#pragma once

#include "orchestrator.h"
#include <httplib.h>
#include "nlohmann/json.hpp"
#include <atomic>
#include <chrono>
#include <string>

/// @brief Limits applied to /process and /stream bodies
struct RequestLimits {
    static constexpr size_t MAX_MESSAGE_CHARS = 10000;
    static constexpr size_t MAX_CONTEXT_CHARS = 5000;
    static constexpr double MIN_TEMPERATURE = 0.0;
    static constexpr double MAX_TEMPERATURE = 2.0;
    static constexpr int MIN_MAX_TOKENS = 1;
    static constexpr int MAX_MAX_TOKENS = 4000;
};

/// @brief Validate a request body and apply defaults
/// Accepts both "max_tokens" and "maxTokens"
/// @throws ValidationError describing the first violation
CompletionInput parse_completion_input(const nlohmann::json& body,
                                       double default_temperature,
                                       int default_max_tokens);

/// @brief {status:"error", error:{type, message}}
nlohmann::json create_error_response(ErrorKind kind, const std::string& message);

/// @brief HTTP front of the responder role
/// Routes: POST /process, POST /stream, GET /models, GET /health, GET /config, GET /stats
class ResponderServer {
public:
    ResponderServer(CompletionOrchestrator& orchestrator, const std::string& host, int port);
    ~ResponderServer();

    /// @brief Register routes and block in listen()
    /// @return 0 on clean shutdown, non-zero if the socket could not be bound
    int run();

    /// @brief Register routes and bind to an ephemeral port (tests)
    /// @return The bound port, or -1 on failure
    int bind_any_port();

    /// @brief Serve on a socket bound by bind_any_port()
    bool listen_after_bind();

    /// @brief Initiate graceful shutdown
    void shutdown();

    bool is_running() const { return tcp_server.is_running(); }

    uint64_t get_requests_processed() const { return requests_processed.load(); }

private:
    void register_endpoints();

    CompletionOrchestrator& orchestrator;
    httplib::Server tcp_server;

    std::string host;
    int port;
    bool endpoints_registered = false;
    std::chrono::steady_clock::time_point start_time;
    std::atomic<uint64_t> requests_processed{0};
};
