#pragma once

#include "providers/provider.h"
#include "http_client.h"
#include "nlohmann/json.hpp"
#include <map>

/// @brief Settings for an OpenAI-compatible chat completions endpoint
struct OpenAIOptions {
    std::string api_key;
    std::string api_base = "https://api.openai.com/v1";
    std::string default_model = "gpt-4";
    long timeout_seconds = 120;
};

/// @brief Provider for OpenAI-compatible chat completion APIs
class OpenAIProvider : public CompletionProvider {
public:
	/// @throws ConfigurationError if the API key is empty
	explicit OpenAIProvider(OpenAIOptions options,
	                        HttpClientFactory client_factory = default_http_client_factory());

	ProviderType type() const override { return ProviderType::OPENAI; }

	CompletionResult complete(const CompletionRequest& request) override;
	ChunkStream complete_stream(const CompletionRequest& request) override;
	HealthStatus health_check() override;
	std::string default_model() const override { return options.default_model; }
	std::vector<std::string> list_models() override;
	bool is_configured() const override { return !options.api_key.empty(); }

	/// @brief {model, messages, temperature, max_tokens[, stream]}
	nlohmann::json build_request(const CompletionRequest& request, bool stream) const;

	/// @brief Translate a chat completion body; resolved model is the requested one
	/// @throws UpstreamError if the body has no choices
	static CompletionResult parse_response(const nlohmann::json& body, const std::string& model);

	/// @brief Chat model ids (gpt-3.5*, gpt-4*) from a /models listing, sorted
	static std::vector<std::string> filter_chat_models(const nlohmann::json& listing);

	std::string get_api_endpoint() const { return options.api_base + "/chat/completions"; }

private:
	std::map<std::string, std::string> get_api_headers() const;
	std::unique_ptr<HttpClient> make_client(long timeout_seconds) const;

	OpenAIOptions options;
	HttpClientFactory client_factory;
};
