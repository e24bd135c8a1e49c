#include "courier.h"
#include "conversation_log.h"

nlohmann::json ConversationEntry::to_json() const {
    nlohmann::json j = {
        {"timestamp", timestamp},
        {"from", from},
        {"to", to},
        {"message", message},
        {"aiGenerated", ai_generated}
    };
    if (model) {
        j["model"] = *model;
    }
    if (tokens) {
        j["tokens"] = *tokens;
    }
    return j;
}

void ConversationLog::append(ConversationEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry.timestamp.empty()) {
        entry.timestamp = courier::iso8601_now();
    }
    entries_.push_back(std::move(entry));
}

std::vector<ConversationEntry> ConversationLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t ConversationLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

nlohmann::json ConversationLog::to_json() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& entry : entries()) {
        out.push_back(entry.to_json());
    }
    return out;
}
