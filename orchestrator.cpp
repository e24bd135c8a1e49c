#include "courier.h"
#include "orchestrator.h"
#include "sse_parser.h"

using json = nlohmann::json;

json OrchestratorResult::to_json() const {
    if (!ok()) {
        return {
            {"status", "error"},
            {"error", {
                {"type", error_kind_name(error_kind)},
                {"message", error}
            }}
        };
    }

    return {
        {"status", "success"},
        {"aiResponse", result.content},
        {"model", result.resolved_model},
        {"usage", {
            {"promptTokens", result.prompt_tokens},
            {"completionTokens", result.completion_tokens},
            {"totalTokens", result.total_tokens()},
            {"estimatedCost", cost.cost}
        }},
        {"timestamp", timestamp},
        {"processingTime", courier::round_to(processing_time, 3)}
    };
}

OrchestratorResult OrchestratorResult::failure(ErrorKind kind, const std::string& message) {
    OrchestratorResult out;
    out.status = FAILURE;
    out.error_kind = kind;
    out.error = message;
    return out;
}

CompletionOrchestrator::CompletionOrchestrator(ProviderRegistry& registry,
                                               const CostEstimator& estimator,
                                               UsageAggregator& usage,
                                               double default_temperature,
                                               int default_max_tokens)
    : registry(registry), estimator(estimator), usage(usage),
      default_temperature(default_temperature), default_max_tokens(default_max_tokens) {
}

MessageList CompletionOrchestrator::build_messages(const CompletionInput& input) {
    MessageList messages;
    if (input.context && !input.context->empty()) {
        messages.emplace_back(Message::SYSTEM, *input.context);
    } else {
        messages.emplace_back(Message::SYSTEM, DEFAULT_SYSTEM_PROMPT);
    }
    messages.emplace_back(Message::USER, input.message);
    return messages;
}

OrchestratorResult CompletionOrchestrator::handle(const CompletionInput& input) {
    auto start = std::chrono::steady_clock::now();

    try {
        CompletionProvider& provider = registry.get();

        CompletionRequest request;
        request.messages = build_messages(input);
        request.model = (input.model && !input.model->empty()) ? *input.model : provider.default_model();
        request.temperature = input.temperature;
        request.max_tokens = input.max_tokens;

        LOG_DEBUG("Processing message with " + provider.name() + " model " + request.model);

        OrchestratorResult outcome;
        outcome.result = provider.complete(request);

        // Price the model the backend actually used
        outcome.cost = estimator.estimate_record(outcome.result.resolved_model,
                                                 outcome.result.prompt_tokens,
                                                 outcome.result.completion_tokens);

        outcome.processing_time = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        outcome.timestamp = courier::iso8601_now();

        usage.record(outcome.result.resolved_model,
                     outcome.result.total_tokens(),
                     outcome.result.prompt_tokens,
                     outcome.result.completion_tokens,
                     outcome.cost.cost,
                     outcome.processing_time);
        processed_count++;

        LOG_INFO_FMT("Processed message: model={} tokens={} time={}s",
                     outcome.result.resolved_model, outcome.result.total_tokens(), outcome.processing_time);
        return outcome;

    } catch (const CourierError& e) {
        LOG_ERROR("Completion failed (" + error_kind_name(e.kind()) + "): " + e.what());
        return OrchestratorResult::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Completion failed: " + std::string(e.what()));
        return OrchestratorResult::failure(ErrorKind::UPSTREAM, "AI provider error: " + std::string(e.what()));
    }
}

void CompletionOrchestrator::handle_stream(const CompletionInput& input, const FrameSink& sink) {
    auto error_frame = [](const std::string& message) {
        return SSEParser::format_data(json{{"error", message}}.dump());
    };

    ChunkStream stream;
    try {
        CompletionProvider& provider = registry.get();

        CompletionRequest request;
        request.messages = build_messages(input);
        request.model = (input.model && !input.model->empty()) ? *input.model : provider.default_model();
        request.temperature = input.temperature;
        request.max_tokens = input.max_tokens;

        LOG_DEBUG("Streaming message with " + provider.name() + " model " + request.model);
        stream = provider.complete_stream(request);
    } catch (const std::exception& e) {
        LOG_ERROR("Stream setup failed: " + std::string(e.what()));
        sink(error_frame(e.what()));
        return;
    }

    while (true) {
        StreamChunk chunk = stream.next();
        switch (chunk.type) {
            case StreamChunk::CONTENT:
                if (!sink(SSEParser::format_data(json{{"content", chunk.text}}.dump()))) {
                    LOG_DEBUG("Stream client disconnected");
                    return;
                }
                break;
            case StreamChunk::END:
                sink(SSEParser::format_data("[DONE]"));
                return;
            case StreamChunk::ERROR:
                LOG_ERROR("Stream failed (" + error_kind_name(chunk.error_kind) + "): " + chunk.text);
                sink(error_frame(chunk.text));
                return;
        }
    }
}

json CompletionOrchestrator::models_payload() {
    CompletionProvider& provider = registry.get();

    json payload = {
        {"provider", provider.name()},
        {"models", provider.list_models()},
        {"default", provider.default_model()}
    };
    if (provider.type() == ProviderType::MOCK) {
        payload["note"] = "Mock provider for testing - no external API calls";
    }
    return payload;
}

json CompletionOrchestrator::health_payload() {
    json health = {
        {"status", "healthy"},
        {"server", SERVER_NAME},
        {"timestamp", courier::iso8601_now()},
        {"messagesProcessed", messages_processed()},
        {"provider", registry.provider_name()},
        {"ai", {
            {"configured", registry.configured()},
            {"status", "unknown"}
        }}
    };

    try {
        HealthStatus status = registry.get().health_check();
        health["ai"]["status"] = status.status_name();
        if (!status.error.empty()) {
            health["ai"]["error"] = status.error;
            health["status"] = "degraded";
        }
        if (!status.note.empty()) {
            health["ai"]["note"] = status.note;
        }
    } catch (const std::exception& e) {
        health["status"] = "degraded";
        health["ai"]["status"] = "unhealthy";
        health["ai"]["error"] = e.what();
    }

    return health;
}

json CompletionOrchestrator::config_payload() {
    std::string default_model;
    try {
        default_model = registry.get().default_model();
    } catch (const std::exception& e) {
        LOG_WARN("Provider unavailable for config read: " + std::string(e.what()));
    }

    return {
        {"provider", registry.provider_name()},
        {"defaultModel", default_model},
        {"temperature", default_temperature},
        {"maxTokens", default_max_tokens}
    };
}
