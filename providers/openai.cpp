#include "courier.h"
#include "providers/openai.h"
#include "sse_parser.h"

#include <algorithm>
#include <thread>

using json = nlohmann::json;

static constexpr long HEALTH_TIMEOUT_SECONDS = 10;

OpenAIProvider::OpenAIProvider(OpenAIOptions opts, HttpClientFactory factory)
    : options(std::move(opts)), client_factory(std::move(factory)) {
    if (options.api_key.empty()) {
        throw ConfigurationError("OPENAI_API_KEY environment variable is not set");
    }
    // Strip trailing slash so endpoint joins stay clean
    while (!options.api_base.empty() && options.api_base.back() == '/') {
        options.api_base.pop_back();
    }
    LOG_DEBUG("OpenAIProvider created for " + options.api_base);
}

std::map<std::string, std::string> OpenAIProvider::get_api_headers() const {
    return {
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + options.api_key}
    };
}

std::unique_ptr<HttpClient> OpenAIProvider::make_client(long timeout_seconds) const {
    auto client = client_factory();
    client->set_timeout(timeout_seconds);
    return client;
}

json OpenAIProvider::build_request(const CompletionRequest& request, bool stream) const {
    json messages = json::array();
    for (const auto& msg : request.messages) {
        messages.push_back({{"role", msg.get_role()}, {"content", msg.content}});
    }

    json body = {
        {"model", request.model.empty() ? options.default_model : request.model},
        {"messages", messages},
        {"temperature", request.temperature},
        {"max_tokens", request.max_tokens}
    };
    if (stream) {
        body["stream"] = true;
    }
    return body;
}

CompletionResult OpenAIProvider::parse_response(const json& body, const std::string& model) {
    if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
        throw UpstreamError(200, "OpenAI response has no choices");
    }

    CompletionResult result;
    const auto& message = body["choices"][0].value("message", json::object());
    if (message.contains("content") && message["content"].is_string()) {
        result.content = message["content"].get<std::string>();
    }

    // Missing usage block means zero counts
    if (body.contains("usage") && body["usage"].is_object()) {
        result.prompt_tokens = body["usage"].value("prompt_tokens", 0);
        result.completion_tokens = body["usage"].value("completion_tokens", 0);
    }

    result.resolved_model = model;
    return result;
}

std::vector<std::string> OpenAIProvider::filter_chat_models(const json& listing) {
    std::vector<std::string> models;
    if (!listing.contains("data") || !listing["data"].is_array()) {
        return models;
    }
    for (const auto& entry : listing["data"]) {
        std::string id = entry.value("id", "");
        if (id.rfind("gpt-3.5", 0) == 0 || id.rfind("gpt-4", 0) == 0) {
            models.push_back(id);
        }
    }
    std::sort(models.begin(), models.end());
    return models;
}

CompletionResult OpenAIProvider::complete(const CompletionRequest& request) {
    json body = build_request(request, false);
    std::string model = body["model"].get<std::string>();

    auto client = make_client(options.timeout_seconds);
    HttpResponse response = client->post(get_api_endpoint(), body.dump(), get_api_headers());
    check_response(response, "OpenAI chat completion");

    json parsed;
    try {
        parsed = json::parse(response.body);
    } catch (const json::exception& e) {
        throw UpstreamError(response.status_code, "Malformed OpenAI response: " + std::string(e.what()));
    }

    CompletionResult result = parse_response(parsed, model);
    dprintf(1, "OpenAI completion: %d prompt, %d completion tokens", result.prompt_tokens, result.completion_tokens);
    return result;
}

ChunkStream OpenAIProvider::complete_stream(const CompletionRequest& request) {
    auto channel = std::make_shared<StreamChannel>();
    std::string body = build_request(request, true).dump();

    std::thread producer([this, channel, body]() {
        try {
            auto client = make_client(options.timeout_seconds);
            SSEParser parser;
            bool finished = false;
            bool cancelled = false;
            std::string raw;   // Kept for error reporting when the body is not SSE

            auto on_event = [&](const std::string&, const std::string& data, const std::string&) -> bool {
                if (SSEParser::is_done_marker(data)) {
                    finished = true;
                    channel->push(StreamChunk::end());
                    return false;
                }

                json frame;
                try {
                    frame = json::parse(data);
                } catch (const json::exception& e) {
                    LOG_WARN("Skipping malformed OpenAI stream frame: " + std::string(e.what()));
                    return true;
                }

                if (frame.contains("error")) {
                    finished = true;
                    std::string message = frame["error"].is_object()
                        ? frame["error"].value("message", frame["error"].dump())
                        : frame["error"].dump();
                    channel->push(StreamChunk::error(ErrorKind::UPSTREAM, message));
                    return false;
                }

                if (!frame.contains("choices") || !frame["choices"].is_array() || frame["choices"].empty()) {
                    return true;
                }
                const auto& delta = frame["choices"][0].value("delta", json::object());
                if (delta.contains("content") && delta["content"].is_string()) {
                    std::string content = delta["content"].get<std::string>();
                    // Empty deltas are not forwarded
                    if (!content.empty() && !channel->push(StreamChunk::content(content))) {
                        cancelled = true;
                        return false;
                    }
                }
                return true;
            };

            HttpResponse response = client->post_stream(get_api_endpoint(), body, get_api_headers(),
                [&](const std::string& chunk) -> bool {
                    if (raw.size() < 4096) {
                        raw += chunk;
                    }
                    return parser.process_chunk(chunk, on_event);
                });

            if (finished || cancelled) {
                return;
            }

            response.body = raw;
            check_response(response, "OpenAI chat completion stream");

            // Stream closed without [DONE]: flush whatever is buffered and end
            parser.finish(on_event);
            if (!finished) {
                channel->push(StreamChunk::end());
            }
        } catch (const std::exception& e) {
            LOG_ERROR("OpenAI stream failed: " + std::string(e.what()));
            channel->push(error_chunk(e));
        }
    });

    return ChunkStream(channel, std::move(producer));
}

HealthStatus OpenAIProvider::health_check() {
    HealthStatus status;
    try {
        auto client = make_client(HEALTH_TIMEOUT_SECONDS);
        HttpResponse response = client->get(options.api_base + "/models", get_api_headers());
        check_response(response, "OpenAI model listing");
    } catch (const std::exception& e) {
        status.healthy = false;
        status.error = e.what();
    }
    return status;
}

std::vector<std::string> OpenAIProvider::list_models() {
    auto client = make_client(HEALTH_TIMEOUT_SECONDS);
    HttpResponse response = client->get(options.api_base + "/models", get_api_headers());
    check_response(response, "OpenAI model listing");

    try {
        return filter_chat_models(json::parse(response.body));
    } catch (const json::exception& e) {
        throw UpstreamError(response.status_code, "Malformed OpenAI model listing: " + std::string(e.what()));
    }
}
