#include "courier.h"
#include "providers/bedrock.h"
#include "aws_event_stream.h"

#include <future>
#include <optional>
#include <thread>

using json = nlohmann::json;

static constexpr long HEALTH_TIMEOUT_SECONDS = 10;

// Map a Bedrock stream exception onto the error taxonomy
static void throw_stream_exception(const aws::EventStreamMessage& message) {
    std::string exception_type = message.header(":exception-type");
    if (exception_type.empty()) {
        exception_type = message.header(":error-code");
    }

    std::string text = exception_type;
    try {
        json payload = json::parse(message.payload);
        if (payload.contains("message") && payload["message"].is_string()) {
            text += ": " + payload["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        if (!message.payload.empty()) {
            text += ": " + message.payload;
        }
    }

    if (exception_type == "throttlingException") {
        throw UpstreamRateLimitError(429, text);
    }
    if (exception_type == "accessDeniedException") {
        throw UpstreamAuthError(403, text);
    }
    if (exception_type == "internalServerException" ||
        exception_type == "serviceUnavailableException" ||
        exception_type == "modelTimeoutException") {
        throw UpstreamServerError(500, text);
    }
    throw UpstreamError(400, text);
}

BedrockProvider::BedrockProvider(BedrockOptions opts, HttpClientFactory factory)
    : options(std::move(opts)),
      client_factory(std::move(factory)),
      signer(options.credentials, options.region, "bedrock"),
      clock([] { return std::time(nullptr); }) {
    if (options.credentials.access_key_id.empty()) {
        throw ConfigurationError("AWS_ACCESS_KEY_ID is not set");
    }
    if (options.credentials.secret_access_key.empty()) {
        throw ConfigurationError("AWS_SECRET_ACCESS_KEY is not set");
    }
    LOG_DEBUG("BedrockProvider created for region " + options.region);
}

std::unique_ptr<HttpClient> BedrockProvider::make_client(long timeout_seconds) const {
    auto client = client_factory();
    client->set_timeout(timeout_seconds);
    return client;
}

std::string BedrockProvider::resolve_model(const std::string& model) const {
    auto it = options.model_aliases.find(model);
    return it == options.model_aliases.end() ? model : it->second;
}

std::string BedrockProvider::invoke_url(const std::string& model_id, bool stream) const {
    return "https://bedrock-runtime." + options.region + ".amazonaws.com/model/" +
           aws::uri_encode(model_id) + (stream ? "/invoke-with-response-stream" : "/invoke");
}

json BedrockProvider::build_request(const CompletionRequest& request) const {
    std::string system_prompt;
    json messages = json::array();

    for (const auto& msg : request.messages) {
        if (msg.role == Message::SYSTEM) {
            system_prompt = msg.content;
        } else {
            messages.push_back({{"role", msg.get_role()}, {"content", msg.content}});
        }
    }

    json body = {
        {"anthropic_version", ANTHROPIC_VERSION},
        {"max_tokens", request.max_tokens},
        {"temperature", request.temperature},
        {"messages", messages}
    };
    if (!system_prompt.empty()) {
        body["system"] = system_prompt;
    }
    return body;
}

CompletionResult BedrockProvider::parse_response(const json& body, const std::string& model_id) {
    CompletionResult result;

    if (body.contains("content") && body["content"].is_array() && !body["content"].empty()) {
        result.content = body["content"][0].value("text", "");
    }

    if (body.contains("usage") && body["usage"].is_object()) {
        result.prompt_tokens = body["usage"].value("input_tokens", 0);
        result.completion_tokens = body["usage"].value("output_tokens", 0);
    }

    result.resolved_model = model_id;
    return result;
}

std::string BedrockProvider::extract_text_delta(const json& event) {
    if (event.value("type", "") != "content_block_delta") {
        return "";
    }
    if (!event.contains("delta") || !event["delta"].is_object()) {
        return "";
    }
    const auto& delta = event["delta"];
    if (delta.value("type", "") != "text_delta") {
        return "";
    }
    return delta.value("text", "");
}

std::map<std::string, std::string> BedrockProvider::signed_headers(const std::string& method,
                                                                   const std::string& url,
                                                                   std::map<std::string, std::string> headers,
                                                                   const std::string& payload) const {
    auto auth = signer.sign(method, url, headers, payload, clock());
    for (auto& [name, value] : auth) {
        headers[name] = value;
    }
    return headers;
}

CompletionResult BedrockProvider::invoke(const CompletionRequest& request) {
    std::string model_id = resolve_model(request.model.empty() ? options.default_model : request.model);
    std::string url = invoke_url(model_id, false);
    std::string body = build_request(request).dump();

    auto headers = signed_headers("POST", url,
                                  {{"content-type", "application/json"}, {"accept", "application/json"}},
                                  body);

    auto client = make_client(options.timeout_seconds);
    HttpResponse response = client->post(url, body, headers);
    check_response(response, "Bedrock invoke " + model_id);

    json parsed;
    try {
        parsed = json::parse(response.body);
    } catch (const json::exception& e) {
        throw UpstreamError(response.status_code, "Malformed Bedrock response: " + std::string(e.what()));
    }
    return parse_response(parsed, model_id);
}

CompletionResult BedrockProvider::complete(const CompletionRequest& request) {
    // The signed HTTP call is synchronous; keep it off the caller's thread
    auto pending = std::async(std::launch::async, [this, request]() { return invoke(request); });
    CompletionResult result = pending.get();
    dprintf(1, "Bedrock completion: %d prompt, %d completion tokens", result.prompt_tokens, result.completion_tokens);
    return result;
}

ChunkStream BedrockProvider::complete_stream(const CompletionRequest& request) {
    auto channel = std::make_shared<StreamChannel>();
    std::string model_id = resolve_model(request.model.empty() ? options.default_model : request.model);
    std::string url = invoke_url(model_id, true);
    std::string body = build_request(request).dump();

    std::thread producer([this, channel, model_id, url, body]() {
        try {
            auto headers = signed_headers("POST", url,
                                          {{"content-type", "application/json"},
                                           {"accept", "application/vnd.amazon.eventstream"}},
                                          body);
            auto client = make_client(options.timeout_seconds);

            aws::EventStreamDecoder decoder;
            std::optional<StreamChunk> failure;
            bool cancelled = false;
            bool streaming = false;
            std::string raw;   // Error bodies arrive as plain JSON, not event-stream

            auto on_message = [&](const aws::EventStreamMessage& message) -> bool {
                if (message.is_exception()) {
                    throw_stream_exception(message);
                }
                if (message.event_type() != "chunk") {
                    return true;
                }
                json event = json::parse(aws::decode_chunk_payload(message.payload));
                std::string text = extract_text_delta(event);
                if (!text.empty() && !channel->push(StreamChunk::content(text))) {
                    cancelled = true;
                    return false;
                }
                return true;
            };

            HttpResponse response = client->post_stream(url, body, headers,
                [&](const std::string& chunk) -> bool {
                    // Exceptions must not unwind through libcurl
                    try {
                        if (!streaming) {
                            // The first bytes tell us whether this is a framed stream
                            if (raw.size() < 65536) {
                                raw += chunk;
                            }
                            if (raw.size() < 12 || raw.front() == '{') {
                                return true;
                            }
                            streaming = true;
                            std::string pending;
                            pending.swap(raw);
                            return decoder.feed(pending, on_message);
                        }
                        return decoder.feed(chunk, on_message);
                    } catch (const std::exception& e) {
                        failure = error_chunk(e);
                        return false;
                    }
                });

            if (cancelled) {
                return;
            }
            if (failure) {
                LOG_ERROR("Bedrock stream failed: " + failure->text);
                channel->push(*failure);
                return;
            }

            response.body = raw;
            check_response(response, "Bedrock invoke stream " + model_id);

            if (!streaming && !raw.empty()) {
                // Short framed body that never reached the detection threshold
                decoder.feed(raw, on_message);
            }
            if (decoder.has_buffered_data()) {
                throw UpstreamError(response.status_code, "Bedrock stream ended mid-frame");
            }
            channel->push(StreamChunk::end());
        } catch (const std::exception& e) {
            LOG_ERROR("Bedrock stream failed: " + std::string(e.what()));
            channel->push(error_chunk(e));
        }
    });

    return ChunkStream(channel, std::move(producer));
}

HealthStatus BedrockProvider::health_check() {
    HealthStatus status;
    try {
        std::string url = "https://bedrock." + options.region + ".amazonaws.com/foundation-models";
        auto headers = signed_headers("GET", url, {{"accept", "application/json"}}, "");
        auto client = make_client(HEALTH_TIMEOUT_SECONDS);
        HttpResponse response = client->get(url, headers);
        check_response(response, "Bedrock foundation model listing");
    } catch (const std::exception& e) {
        status.healthy = false;
        status.error = e.what();
    }
    return status;
}

std::vector<std::string> BedrockProvider::list_models() {
    std::vector<std::string> models;
    for (const auto& entry : options.model_aliases) {
        models.push_back(entry.first);
    }
    return models;
}
