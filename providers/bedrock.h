#pragma once

#include "providers/provider.h"
#include "http_client.h"
#include "aws_sigv4.h"
#include "nlohmann/json.hpp"
#include <map>

/// @brief Settings for the Bedrock runtime (Anthropic message format)
struct BedrockOptions {
    std::string region = "us-east-1";
    aws::Credentials credentials;
    std::string default_model;
    std::map<std::string, std::string> model_aliases;   // Short name -> Bedrock model id
    long timeout_seconds = 120;
};

/// @brief Provider for Anthropic models on AWS Bedrock
/// Requests are SigV4-signed; streaming responses use AWS event-stream framing
class BedrockProvider : public CompletionProvider {
public:
	static constexpr const char* ANTHROPIC_VERSION = "bedrock-2023-05-31";

	/// @throws ConfigurationError if the access key id or secret is missing
	explicit BedrockProvider(BedrockOptions options,
	                         HttpClientFactory client_factory = default_http_client_factory());

	ProviderType type() const override { return ProviderType::BEDROCK; }

	CompletionResult complete(const CompletionRequest& request) override;
	ChunkStream complete_stream(const CompletionRequest& request) override;
	HealthStatus health_check() override;
	std::string default_model() const override { return options.default_model; }
	std::vector<std::string> list_models() override;
	bool is_configured() const override { return options.credentials.is_valid(); }

	/// @brief Alias -> model id; unknown names pass through
	std::string resolve_model(const std::string& model) const;

	/// @brief Anthropic envelope with the system message hoisted to "system"
	nlohmann::json build_request(const CompletionRequest& request) const;

	/// @brief Translate an invoke response body
	static CompletionResult parse_response(const nlohmann::json& body, const std::string& model_id);

	/// @brief Text of a decoded stream event, or "" if the event carries no text delta
	static std::string extract_text_delta(const nlohmann::json& event);

	std::string invoke_url(const std::string& model_id, bool stream) const;

	/// @brief Set the clock used for signing (tests pin it)
	void set_clock(std::function<std::time_t()> clock) { this->clock = std::move(clock); }

private:
	CompletionResult invoke(const CompletionRequest& request);
	std::map<std::string, std::string> signed_headers(const std::string& method,
	                                                  const std::string& url,
	                                                  std::map<std::string, std::string> headers,
	                                                  const std::string& payload) const;
	std::unique_ptr<HttpClient> make_client(long timeout_seconds) const;

	BedrockOptions options;
	HttpClientFactory client_factory;
	aws::SigV4Signer signer;
	std::function<std::time_t()> clock;
};
