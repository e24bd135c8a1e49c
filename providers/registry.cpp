#include "courier.h"
#include "providers/registry.h"
#include "providers/openai.h"
#include "providers/bedrock.h"
#include "providers/mock.h"

static bool credentials_present(const Config& config) {
    switch (parse_provider_type(config.provider)) {
        case ProviderType::OPENAI:
            return !config.openai_api_key.empty();
        case ProviderType::BEDROCK:
            return !config.aws_access_key_id.empty() && !config.aws_secret_access_key.empty();
        case ProviderType::MOCK:
            return true;
    }
    return false;
}

static bool safe_credentials_present(const Config& config) {
    try {
        return credentials_present(config);
    } catch (const ConfigurationError&) {
        return false;
    }
}

std::unique_ptr<CompletionProvider> ProviderRegistry::create(const Config& config, HttpClientFactory client_factory) {
    LOG_DEBUG("Creating provider: " + config.provider);

    std::unique_ptr<CompletionProvider> provider;

    switch (parse_provider_type(config.provider)) {
        case ProviderType::OPENAI: {
            OpenAIOptions options;
            options.api_key = config.openai_api_key;
            options.api_base = config.openai_api_base;
            options.default_model = config.openai_default_model;
            options.timeout_seconds = config.timeout_seconds;
            provider = std::make_unique<OpenAIProvider>(options, client_factory);
            break;
        }
        case ProviderType::BEDROCK: {
            BedrockOptions options;
            options.region = config.aws_region;
            options.credentials.access_key_id = config.aws_access_key_id;
            options.credentials.secret_access_key = config.aws_secret_access_key;
            options.credentials.session_token = config.aws_session_token;
            options.default_model = config.bedrock_default_model;
            options.model_aliases = config.bedrock_model_aliases;
            options.timeout_seconds = config.timeout_seconds;
            provider = std::make_unique<BedrockProvider>(options, client_factory);
            break;
        }
        case ProviderType::MOCK:
            provider = std::make_unique<MockProvider>();
            break;
    }

    LOG_INFO("Successfully created " + provider->name() + " provider");
    return provider;
}

ProviderRegistry::ProviderRegistry(const Config& config, HttpClientFactory client_factory)
    : ProviderRegistry(config.provider, safe_credentials_present(config),
                       [config, client_factory]() { return create(config, client_factory); }) {
}

ProviderRegistry::ProviderRegistry(std::string provider_name, bool configured, Builder builder)
    : name_(std::move(provider_name)), configured_(configured), builder_(std::move(builder)) {
}

CompletionProvider& ProviderRegistry::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    // A throwing builder leaves provider_ empty, so the next get() retries
    if (!provider_) {
        provider_ = builder_();
    }
    return *provider_;
}
