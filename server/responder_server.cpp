#include "courier.h"
#include "server/responder_server.h"

using json = nlohmann::json;

// Length in code points; invalid UTF-8 bytes count as one each
static size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

json create_error_response(ErrorKind kind, const std::string& message) {
    return json{
        {"status", "error"},
        {"error", {
            {"type", error_kind_name(kind)},
            {"message", message}
        }}
    };
}

CompletionInput parse_completion_input(const json& body, double default_temperature, int default_max_tokens) {
    if (!body.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }

    CompletionInput input;
    input.temperature = default_temperature;
    input.max_tokens = default_max_tokens;

    // message: required string, 1..10000 characters
    if (!body.contains("message") || !body["message"].is_string()) {
        throw ValidationError("message: field required (string)");
    }
    input.message = body["message"].get<std::string>();
    size_t message_length = utf8_length(input.message);
    if (message_length < 1) {
        throw ValidationError("message: must contain at least 1 character");
    }
    if (message_length > RequestLimits::MAX_MESSAGE_CHARS) {
        throw ValidationError("message: must contain at most " +
                              std::to_string(RequestLimits::MAX_MESSAGE_CHARS) + " characters");
    }

    // context: optional string or null, at most 5000 characters
    if (body.contains("context") && !body["context"].is_null()) {
        if (!body["context"].is_string()) {
            throw ValidationError("context: must be a string");
        }
        std::string context = body["context"].get<std::string>();
        if (utf8_length(context) > RequestLimits::MAX_CONTEXT_CHARS) {
            throw ValidationError("context: must contain at most " +
                                  std::to_string(RequestLimits::MAX_CONTEXT_CHARS) + " characters");
        }
        input.context = context;
    }

    // model: optional string
    if (body.contains("model") && !body["model"].is_null()) {
        if (!body["model"].is_string()) {
            throw ValidationError("model: must be a string");
        }
        std::string model = body["model"].get<std::string>();
        if (!model.empty()) {
            input.model = model;
        }
    }

    // temperature: optional number in [0, 2]
    if (body.contains("temperature") && !body["temperature"].is_null()) {
        if (!body["temperature"].is_number()) {
            throw ValidationError("temperature: must be a number");
        }
        input.temperature = body["temperature"].get<double>();
        if (input.temperature < RequestLimits::MIN_TEMPERATURE || input.temperature > RequestLimits::MAX_TEMPERATURE) {
            throw ValidationError("temperature: must be between 0 and 2");
        }
    }

    // max_tokens / maxTokens: optional integer in [1, 4000]
    const char* max_tokens_key = body.contains("max_tokens") ? "max_tokens" :
                                 body.contains("maxTokens") ? "maxTokens" : nullptr;
    if (max_tokens_key && !body[max_tokens_key].is_null()) {
        const auto& value = body[max_tokens_key];
        if (!value.is_number_integer()) {
            throw ValidationError(std::string(max_tokens_key) + ": must be an integer");
        }
        long long max_tokens = value.get<long long>();
        if (max_tokens < RequestLimits::MIN_MAX_TOKENS || max_tokens > RequestLimits::MAX_MAX_TOKENS) {
            throw ValidationError(std::string(max_tokens_key) + ": must be between 1 and 4000");
        }
        input.max_tokens = static_cast<int>(max_tokens);
    }

    return input;
}

ResponderServer::ResponderServer(CompletionOrchestrator& orchestrator, const std::string& host, int port)
    : orchestrator(orchestrator), host(host), port(port) {
}

ResponderServer::~ResponderServer() {
    shutdown();
}

void ResponderServer::shutdown() {
    if (tcp_server.is_running()) {
        LOG_INFO("Responder shutdown requested");
        tcp_server.stop();
    }
}

void ResponderServer::register_endpoints() {
    if (endpoints_registered) {
        return;
    }
    endpoints_registered = true;

    // Parse and validate a request body; writes the error response on failure
    auto parse_request = [this](const httplib::Request& req, httplib::Response& res,
                                CompletionInput& input) -> bool {
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(create_error_response(ErrorKind::VALIDATION, "Invalid JSON: " + std::string(e.what())).dump(),
                            "application/json");
            return false;
        }

        try {
            input = parse_completion_input(body, orchestrator.get_default_temperature(),
                                           orchestrator.get_default_max_tokens());
        } catch (const ValidationError& e) {
            LOG_WARN("Rejected request: " + std::string(e.what()));
            res.status = http_status_for(ErrorKind::VALIDATION);
            res.set_content(create_error_response(ErrorKind::VALIDATION, e.what()).dump(), "application/json");
            return false;
        }
        return true;
    };

    // POST /process - blocking completion
    tcp_server.Post("/process", [this, parse_request](const httplib::Request& req, httplib::Response& res) {
        CompletionInput input;
        if (!parse_request(req, res, input)) {
            return;
        }

        OrchestratorResult outcome = orchestrator.handle(input);
        requests_processed++;

        res.status = outcome.http_status();
        res.set_content(outcome.to_json().dump(), "application/json");
    });

    // POST /stream - Server-Sent Events of content frames
    tcp_server.Post("/stream", [this, parse_request](const httplib::Request& req, httplib::Response& res) {
        CompletionInput input;
        if (!parse_request(req, res, input)) {
            return;
        }
        requests_processed++;

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");

        CompletionOrchestrator* orch = &orchestrator;
        res.set_content_provider(
            "text/event-stream",
            [orch, input](size_t /*offset*/, httplib::DataSink& sink) {
                orch->handle_stream(input, [&sink](const std::string& frame) {
                    return sink.write(frame.data(), frame.size());
                });
                sink.done();
                return true;
            });
    });

    // GET /models - provider listing
    tcp_server.Get("/models", [this](const httplib::Request&, httplib::Response& res) {
        try {
            res.set_content(orchestrator.models_payload().dump(), "application/json");
        } catch (const CourierError& e) {
            LOG_ERROR("Model listing failed: " + std::string(e.what()));
            res.status = http_status_for(e.kind());
            res.set_content(create_error_response(e.kind(), e.what()).dump(), "application/json");
        } catch (const std::exception& e) {
            LOG_ERROR("Model listing failed: " + std::string(e.what()));
            res.status = 500;
            res.set_content(create_error_response(ErrorKind::UPSTREAM, e.what()).dump(), "application/json");
        }
    });

    // GET /health - provider connectivity
    tcp_server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        json health = orchestrator.health_payload();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time).count();
        health["uptimeSeconds"] = uptime;
        res.set_content(health.dump(), "application/json");
    });

    // GET /config - active configuration
    tcp_server.Get("/config", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(orchestrator.config_payload().dump(), "application/json");
    });

    // GET /stats - usage aggregate
    tcp_server.Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(orchestrator.stats_payload().dump(), "application/json");
    });

    tcp_server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        dprintf(1, "%s %s -> %d", req.method.c_str(), req.path.c_str(), res.status);
    });
}

int ResponderServer::run() {
    register_endpoints();
    start_time = std::chrono::steady_clock::now();

    LOG_INFO("Starting responder on " + host + ":" + std::to_string(port));
    bool success = tcp_server.listen(host.c_str(), port);

    if (!success) {
        LOG_ERROR("Failed to start responder on " + host + ":" + std::to_string(port));
        return 1;
    }

    LOG_INFO("Responder stopped after " + std::to_string(requests_processed.load()) + " requests");
    return 0;
}

int ResponderServer::bind_any_port() {
    register_endpoints();
    start_time = std::chrono::steady_clock::now();
    port = tcp_server.bind_to_any_port(host.c_str());
    return port;
}

bool ResponderServer::listen_after_bind() {
    return tcp_server.listen_after_bind();
}
