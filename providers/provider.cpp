#include "courier.h"
#include "providers/provider.h"

#include <algorithm>
#include <cctype>

std::string provider_type_name(ProviderType type) {
    switch (type) {
        case ProviderType::OPENAI:  return "openai";
        case ProviderType::BEDROCK: return "bedrock";
        case ProviderType::MOCK:    return "mock";
    }
    return "openai";
}

ProviderType parse_provider_type(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.empty() || lower == "openai") return ProviderType::OPENAI;
    if (lower == "bedrock") return ProviderType::BEDROCK;
    if (lower == "mock") return ProviderType::MOCK;

    throw ConfigurationError("Unknown AI provider: " + name + " (expected openai, bedrock or mock)");
}

std::string CompletionProvider::first_user_message(const MessageList& messages) {
    for (const auto& msg : messages) {
        if (msg.role == Message::USER) {
            return msg.content;
        }
    }
    return "";
}

StreamChunk CompletionProvider::error_chunk(const std::exception& e) {
    if (auto* courier_error = dynamic_cast<const CourierError*>(&e)) {
        return StreamChunk::error(courier_error->kind(), courier_error->what());
    }
    return StreamChunk::error(ErrorKind::UPSTREAM, e.what());
}
