#pragma once

#include "providers/provider.h"
#include "config.h"
#include "http_client.h"
#include <functional>
#include <memory>
#include <mutex>

/// @brief Owns the single active CompletionProvider
/// The provider is built on the first get(); later calls return the same
/// instance. A failed construction propagates and the next get() retries.
class ProviderRegistry {
public:
    using Builder = std::function<std::unique_ptr<CompletionProvider>()>;

    /// @brief Select the variant from config.provider
    explicit ProviderRegistry(const Config& config,
                              HttpClientFactory client_factory = default_http_client_factory());

    /// @brief Use a custom builder (tests, embedding)
    ProviderRegistry(std::string provider_name, bool configured, Builder builder);

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /// @throws ConfigurationError if the provider cannot be constructed
    CompletionProvider& get();

    /// @brief Configured provider name; does not construct the provider
    const std::string& provider_name() const { return name_; }

    /// @brief Whether the configured provider has its credentials; does not construct it
    bool configured() const { return configured_; }

    /// @brief Build a provider directly from configuration
    static std::unique_ptr<CompletionProvider> create(const Config& config, HttpClientFactory client_factory);

private:
    std::string name_;
    bool configured_;
    Builder builder_;
    std::mutex mutex_;
    std::unique_ptr<CompletionProvider> provider_;
};
