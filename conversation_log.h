#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include "nlohmann/json.hpp"

/// @brief One line of the messenger's conversation history
struct ConversationEntry {
    std::string timestamp;      // ISO-8601 UTC
    std::string from;
    std::string to;
    std::string message;
    bool ai_generated = false;
    std::optional<std::string> model;
    std::optional<int> tokens;

    nlohmann::json to_json() const;
};

/// @brief Append-only, unbounded conversation log guarded by a mutex
class ConversationLog {
public:
    void append(ConversationEntry entry);

    /// @brief Copy of all entries in insertion order
    std::vector<ConversationEntry> entries() const;

    size_t size() const;

    nlohmann::json to_json() const;

private:
    mutable std::mutex mutex_;
    std::vector<ConversationEntry> entries_;
};
