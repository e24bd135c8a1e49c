#pragma once

#include "message.h"
#include <string>

/// @brief One provider call; constructed fresh per request, never persisted
struct CompletionRequest {
    MessageList messages;
    std::string model;
    double temperature = 0.7;   // [0, 2]
    int max_tokens = 1000;      // > 0
};

/// @brief Provider-neutral outcome of a completion
/// total_tokens() is always derived, never supplied by a backend
struct CompletionResult {
    std::string content;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    std::string resolved_model;   // Backend model id after alias resolution

    int total_tokens() const { return prompt_tokens + completion_tokens; }
};

/// @brief Per-call cost, rounded to 6 decimal places
struct CostRecord {
    std::string model;
    int prompt_tokens = 0;
    int completion_tokens = 0;
    double cost = 0.0;
};

/// @brief Result of CompletionProvider::health_check()
struct HealthStatus {
    bool healthy = true;
    std::string error;   // Empty when healthy
    std::string note;    // Optional informational text

    std::string status_name() const { return healthy ? "healthy" : "unhealthy"; }
};
