#pragma once

#include "completion.h"
#include "stream_channel.h"
#include "errors.h"
#include <string>
#include <vector>

/// @brief The closed set of completion backends
enum class ProviderType {
    OPENAI,
    BEDROCK,
    MOCK
};

/// @brief "openai", "bedrock" or "mock"
std::string provider_type_name(ProviderType type);

/// @brief Parse a provider selector (case-insensitive)
/// @throws ConfigurationError for an unknown name
ProviderType parse_provider_type(const std::string& name);

/// @brief Uniform interface over the completion backends
/// Implemented only by OpenAIProvider, BedrockProvider and MockProvider.
/// Credentials are checked once, in the variant's constructor.
class CompletionProvider {
public:
    virtual ~CompletionProvider() = default;

    virtual ProviderType type() const = 0;
    std::string name() const { return provider_type_name(type()); }

    /// @brief Blocking completion
    /// @throws UpstreamError (or subclass) on backend failure,
    ///         ConnectivityError / TimeoutError on transport failure
    virtual CompletionResult complete(const CompletionRequest& request) = 0;

    /// @brief Streamed completion
    /// A producer thread emits CONTENT chunks and exactly one END or ERROR chunk.
    /// Destroying the returned stream cancels the producer.
    virtual ChunkStream complete_stream(const CompletionRequest& request) = 0;

    /// @brief Backend reachability; never throws
    virtual HealthStatus health_check() = 0;

    virtual std::string default_model() const = 0;

    /// @brief Models this backend offers
    /// @throws CourierError when the listing requires a failing upstream call
    virtual std::vector<std::string> list_models() = 0;

    /// @brief Whether required credentials are present
    virtual bool is_configured() const = 0;

protected:
    /// @brief Content of the first user message, or "" if none
    static std::string first_user_message(const MessageList& messages);

    /// @brief Convert a caught exception into the terminal ERROR chunk
    static StreamChunk error_chunk(const std::exception& e);
};
