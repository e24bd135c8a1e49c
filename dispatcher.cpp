#include "courier.h"
#include "dispatcher.h"
#include "sse_parser.h"

#include <thread>

using json = nlohmann::json;

namespace {

// Fields of the wrong type read as absent
std::string string_field(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

template <typename T>
T number_field(const json& obj, const char* key, T fallback) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_number()) ? it->get<T>() : fallback;
}

}

json DispatchInput::to_json() const {
    json body = {
        {"message", message},
        {"temperature", temperature},
        {"max_tokens", max_tokens}
    };
    if (context) {
        body["context"] = *context;
    }
    if (model) {
        body["model"] = *model;
    }
    return body;
}

std::string DispatchResult::state_name() const {
    switch (state) {
        case SUCCESS:   return "success";
        case EXHAUSTED: return "exhausted";
        case FAILED:    return "failed";
    }
    return "failed";
}

json DispatchResult::to_json() const {
    if (ok()) {
        return payload;
    }
    return {
        {"status", "error"},
        {"state", state_name()},
        {"attempts", attempts},
        {"error", {
            {"type", error_kind_name(error_kind)},
            {"message", error}
        }}
    };
}

RequestDispatcher::RequestDispatcher(DispatcherOptions opts,
                                     UsageAggregator& usage,
                                     ConversationLog& log,
                                     HttpClientFactory factory,
                                     Sleeper sleep_fn)
    : options(std::move(opts)), usage(usage), log(log),
      client_factory(std::move(factory)), sleeper(std::move(sleep_fn)) {
    while (!options.server_url.empty() && options.server_url.back() == '/') {
        options.server_url.pop_back();
    }
    if (options.retry_attempts < 1) {
        options.retry_attempts = 1;
    }
    if (!sleeper) {
        sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::chrono::milliseconds RequestDispatcher::backoff_delay(int attempt, std::chrono::milliseconds unit) {
    return unit * (1LL << attempt);
}

void RequestDispatcher::wait_before_retry(int attempt) {
    auto delay = backoff_delay(attempt, options.backoff_unit);
    LOG_WARN_FMT("Attempt {} failed, retrying in {}ms", attempt + 1, delay.count());
    sleeper(delay);
}

void RequestDispatcher::record_exchange(const DispatchInput& input, const std::string& response,
                                        const std::optional<std::string>& model,
                                        const std::optional<int>& tokens) {
    ConversationEntry outgoing;
    outgoing.timestamp = courier::iso8601_now();
    outgoing.from = options.local_name;
    outgoing.to = options.remote_name;
    outgoing.message = input.message;
    outgoing.ai_generated = false;
    log.append(outgoing);

    ConversationEntry incoming;
    incoming.timestamp = courier::iso8601_now();
    incoming.from = options.remote_name;
    incoming.to = options.local_name;
    incoming.message = response;
    incoming.ai_generated = true;
    incoming.model = model;
    incoming.tokens = tokens;
    log.append(incoming);
}

DispatchResult RequestDispatcher::send(const DispatchInput& input) {
    DispatchResult result;
    std::string url = options.server_url + "/process";
    std::string body = input.to_json().dump();
    std::map<std::string, std::string> headers = {{"Content-Type", "application/json"}};

    for (int attempt = 0; attempt < options.retry_attempts; attempt++) {
        result.attempts = attempt + 1;
        auto start = std::chrono::steady_clock::now();

        try {
            auto client = client_factory();
            client->set_timeout(options.timeout_seconds);

            HttpResponse response = client->post(url, body, headers);
            check_response(response, "Responder /process");

            json payload;
            try {
                payload = json::parse(response.body);
            } catch (const json::exception& e) {
                throw UpstreamError(response.status_code, "Malformed responder payload: " + std::string(e.what()));
            }
            if (!payload.is_object()) {
                throw UpstreamError(response.status_code, "Malformed responder payload: expected an object, got " + std::string(payload.type_name()));
            }
            if (string_field(payload, "status", "") != "success") {
                throw UpstreamError(response.status_code, "Responder reported failure: " + payload.dump());
            }

            double latency = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            auto usage_it = payload.find("usage");
            const json usage_block = (usage_it != payload.end() && usage_it->is_object()) ? *usage_it : json::object();
            std::string model = string_field(payload, "model", input.model.value_or(""));
            int total_tokens = number_field(usage_block, "totalTokens", 0);

            record_exchange(input, string_field(payload, "aiResponse", ""), model, total_tokens);
            usage.record(model,
                         total_tokens,
                         number_field(usage_block, "promptTokens", 0),
                         number_field(usage_block, "completionTokens", 0),
                         number_field(usage_block, "estimatedCost", 0.0),
                         latency);

            LOG_INFO_FMT("Message delivered on attempt {} ({} tokens, model {})", result.attempts, total_tokens, model);
            result.state = DispatchResult::SUCCESS;
            result.payload = std::move(payload);
            return result;

        } catch (const CourierError& e) {
            result.error_kind = e.kind();
            result.error = e.what();
            if (!is_retryable(e.kind())) {
                LOG_ERROR("Not retrying " + error_kind_name(e.kind()) + " failure: " + e.what());
                result.state = DispatchResult::FAILED;
                return result;
            }
        }

        if (attempt + 1 < options.retry_attempts) {
            wait_before_retry(attempt);
        }
    }

    LOG_ERROR("Giving up after " + std::to_string(result.attempts) + " attempts: " + result.error);
    result.state = DispatchResult::EXHAUSTED;
    return result;
}

DispatchResult RequestDispatcher::send_stream(const DispatchInput& input, const ChunkCallback& on_chunk) {
    DispatchResult result;
    std::string url = options.server_url + "/stream";
    std::string body = input.to_json().dump();
    std::map<std::string, std::string> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "text/event-stream"}
    };

    std::string full_response;
    bool delivered = false;

    for (int attempt = 0; attempt < options.retry_attempts; attempt++) {
        result.attempts = attempt + 1;

        SSEParser parser;
        bool done = false;
        std::optional<std::string> stream_error;
        std::string raw;

        auto on_event = [&](const std::string&, const std::string& data, const std::string&) -> bool {
            if (SSEParser::is_done_marker(data)) {
                done = true;
                return false;
            }
            try {
                json frame = json::parse(data);
                if (frame.contains("error")) {
                    stream_error = frame["error"].is_string() ? frame["error"].get<std::string>() : frame["error"].dump();
                    return false;
                }
                if (frame.contains("content") && frame["content"].is_string()) {
                    std::string content = frame["content"].get<std::string>();
                    full_response += content;
                    delivered = true;
                    if (on_chunk) {
                        on_chunk(content);
                    }
                }
            } catch (const json::exception& e) {
                LOG_WARN("Skipping malformed stream frame: " + std::string(e.what()));
            }
            return true;
        };

        try {
            auto client = client_factory();
            client->set_timeout(options.timeout_seconds);

            HttpResponse response = client->post_stream(url, body, headers,
                [&](const std::string& chunk) -> bool {
                    if (raw.size() < 4096) {
                        raw += chunk;
                    }
                    return parser.process_chunk(chunk, on_event);
                });

            if (!done && !stream_error) {
                response.body = raw;
                check_response(response, "Responder /stream");
                parser.finish(on_event);
                if (!done && !stream_error) {
                    throw UpstreamError(response.status_code, "Responder stream ended without end marker");
                }
            }

            if (stream_error) {
                // The responder already classified and reported this; do not replay the stream
                result.state = DispatchResult::FAILED;
                result.error_kind = ErrorKind::UPSTREAM;
                result.error = *stream_error;
                return result;
            }

            record_exchange(input, full_response, input.model, std::nullopt);
            result.state = DispatchResult::SUCCESS;
            result.payload = {{"status", "success"}, {"aiResponse", full_response}};
            return result;

        } catch (const CourierError& e) {
            result.error_kind = e.kind();
            result.error = e.what();
            if (!is_retryable(e.kind()) || delivered) {
                result.state = DispatchResult::FAILED;
                return result;
            }
        }

        if (attempt + 1 < options.retry_attempts) {
            wait_before_retry(attempt);
        }
    }

    result.state = DispatchResult::EXHAUSTED;
    return result;
}

DispatchResult RequestDispatcher::query(const std::string& path) {
    DispatchResult result;
    result.attempts = 1;

    try {
        auto client = client_factory();
        client->set_timeout(options.query_timeout_seconds);

        HttpResponse response = client->get(options.server_url + path);
        check_response(response, "Responder " + path);

        try {
            result.payload = json::parse(response.body);
        } catch (const json::exception& e) {
            throw UpstreamError(response.status_code, "Malformed responder payload: " + std::string(e.what()));
        }
        result.state = DispatchResult::SUCCESS;
    } catch (const CourierError& e) {
        result.state = DispatchResult::FAILED;
        result.error_kind = e.kind();
        result.error = e.what();
    }

    return result;
}
