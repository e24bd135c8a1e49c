#include <gtest/gtest.h>
#include "server/responder_server.h"
#include "providers/mock.h"
#include "dispatcher.h"
#include "scripted_provider.h"

#include <thread>

using json = nlohmann::json;

// =============================================================================
// Request validation
// =============================================================================

static CompletionInput parse(const json& body) {
    return parse_completion_input(body, 0.7, 1000);
}

TEST(RequestValidationTest, DefaultsApplied) {
    CompletionInput input = parse({{"message", "Hello"}});
    EXPECT_EQ(input.message, "Hello");
    EXPECT_FALSE(input.context.has_value());
    EXPECT_FALSE(input.model.has_value());
    EXPECT_DOUBLE_EQ(input.temperature, 0.7);
    EXPECT_EQ(input.max_tokens, 1000);
}

TEST(RequestValidationTest, AllFields) {
    CompletionInput input = parse({
        {"message", "Hello"}, {"context", "Be brief."}, {"model", "gpt-4"},
        {"temperature", 0}, {"max_tokens", 4000}
    });
    EXPECT_EQ(*input.context, "Be brief.");
    EXPECT_EQ(*input.model, "gpt-4");
    EXPECT_DOUBLE_EQ(input.temperature, 0.0);
    EXPECT_EQ(input.max_tokens, 4000);
}

TEST(RequestValidationTest, CamelCaseMaxTokens) {
    EXPECT_EQ(parse({{"message", "Hi"}, {"maxTokens", 50}}).max_tokens, 50);
}

TEST(RequestValidationTest, NullsAndEmptyModelIgnored) {
    CompletionInput input = parse({{"message", "Hi"}, {"context", nullptr}, {"model", ""}, {"temperature", nullptr}});
    EXPECT_FALSE(input.context.has_value());
    EXPECT_FALSE(input.model.has_value());
    EXPECT_DOUBLE_EQ(input.temperature, 0.7);
}

TEST(RequestValidationTest, MessageRules) {
    EXPECT_THROW(parse(json::object()), ValidationError);
    EXPECT_THROW(parse({{"message", 42}}), ValidationError);
    EXPECT_THROW(parse({{"message", ""}}), ValidationError);
    EXPECT_THROW(parse({{"message", std::string(10001, 'a')}}), ValidationError);
    EXPECT_NO_THROW(parse({{"message", std::string(10000, 'a')}}));
    EXPECT_THROW(parse(json::array({"message"})), ValidationError);
}

TEST(RequestValidationTest, LengthsCountCodePoints) {
    // 10000 two-byte characters is within the limit
    std::string accented;
    for (int i = 0; i < 10000; i++) {
        accented += "\xC3\xA9";
    }
    EXPECT_NO_THROW(parse({{"message", accented}}));
    EXPECT_THROW(parse({{"message", accented + "\xC3\xA9"}}), ValidationError);

    std::string context;
    for (int i = 0; i < 5000; i++) {
        context += "\xE2\x82\xAC";
    }
    EXPECT_NO_THROW(parse({{"message", "Hi"}, {"context", context}}));
    EXPECT_THROW(parse({{"message", "Hi"}, {"context", context + "x"}}), ValidationError);
}

TEST(RequestValidationTest, TemperatureBounds) {
    EXPECT_NO_THROW(parse({{"message", "Hi"}, {"temperature", 2.0}}));
    EXPECT_THROW(parse({{"message", "Hi"}, {"temperature", 2.01}}), ValidationError);
    EXPECT_THROW(parse({{"message", "Hi"}, {"temperature", -0.1}}), ValidationError);
    EXPECT_THROW(parse({{"message", "Hi"}, {"temperature", "hot"}}), ValidationError);
}

TEST(RequestValidationTest, MaxTokensBounds) {
    EXPECT_NO_THROW(parse({{"message", "Hi"}, {"max_tokens", 1}}));
    EXPECT_THROW(parse({{"message", "Hi"}, {"max_tokens", 0}}), ValidationError);
    EXPECT_THROW(parse({{"message", "Hi"}, {"max_tokens", 4001}}), ValidationError);
    EXPECT_THROW(parse({{"message", "Hi"}, {"max_tokens", 10.5}}), ValidationError);
    EXPECT_THROW(parse({{"message", "Hi"}, {"maxTokens", "many"}}), ValidationError);
}

TEST(RequestValidationTest, ErrorNamesField) {
    try {
        parse({{"message", "Hi"}, {"temperature", 3}});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::VALIDATION);
        EXPECT_NE(std::string(e.what()).find("temperature"), std::string::npos);
    }
}

TEST(ErrorResponseTest, Shape) {
    json body = create_error_response(ErrorKind::TIMEOUT, "took too long");
    EXPECT_EQ(body["status"], "error");
    EXPECT_EQ(body["error"]["type"], "timeout");
    EXPECT_EQ(body["error"]["message"], "took too long");
}

// =============================================================================
// Live server on the loopback interface
// =============================================================================

class ResponderServerTest : public ::testing::Test {
protected:
    void start(ProviderRegistry::Builder builder, const std::string& provider_name = "mock") {
        registry = std::make_unique<ProviderRegistry>(provider_name, true, std::move(builder));
        orchestrator = std::make_unique<CompletionOrchestrator>(*registry, estimator, usage);
        server = std::make_unique<ResponderServer>(*orchestrator, "127.0.0.1", 0);

        port = server->bind_any_port();
        ASSERT_GT(port, 0);
        listener = std::thread([this]() { server->listen_after_bind(); });

        for (int i = 0; i < 200 && !server->is_running(); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_TRUE(server->is_running());

        client = std::make_unique<httplib::Client>("127.0.0.1", port);
    }

    void start_mock() {
        start([]() -> std::unique_ptr<CompletionProvider> {
            return std::make_unique<MockProvider>(std::chrono::milliseconds(0), std::chrono::milliseconds(0));
        });
    }

    void TearDown() override {
        if (server) {
            server->shutdown();
        }
        if (listener.joinable()) {
            listener.join();
        }
    }

    CostEstimator estimator;
    UsageAggregator usage;
    std::unique_ptr<ProviderRegistry> registry;
    std::unique_ptr<CompletionOrchestrator> orchestrator;
    std::unique_ptr<ResponderServer> server;
    std::unique_ptr<httplib::Client> client;
    std::thread listener;
    int port = 0;
};

TEST_F(ResponderServerTest, ProcessSucceeds) {
    start_mock();

    auto res = client->Post("/process", R"({"message":"What is 2+2?","model":"mock-model","maxTokens":50})",
                            "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    json body = json::parse(res->body);
    EXPECT_EQ(body["status"], "success");
    EXPECT_NE(body["aiResponse"].get<std::string>().find("What is 2+2?"), std::string::npos);
    EXPECT_EQ(server->get_requests_processed(), 1u);
}

TEST_F(ResponderServerTest, ProcessRejectsBadInput) {
    start_mock();

    auto malformed = client->Post("/process", "{not json", "application/json");
    ASSERT_TRUE(malformed);
    EXPECT_EQ(malformed->status, 400);
    EXPECT_EQ(json::parse(malformed->body)["error"]["type"], "validation");

    auto invalid = client->Post("/process", R"({"message":""})", "application/json");
    ASSERT_TRUE(invalid);
    EXPECT_EQ(invalid->status, 422);
    EXPECT_EQ(json::parse(invalid->body)["status"], "error");

    EXPECT_EQ(server->get_requests_processed(), 0u);
}

TEST_F(ResponderServerTest, ProcessMapsProviderErrors) {
    start([]() -> std::unique_ptr<CompletionProvider> {
        auto provider = std::make_unique<test_helpers::ScriptedProvider>();
        provider->failure = [] { throw UpstreamRateLimitError(429, "Rate limit reached"); };
        return provider;
    }, "openai");

    auto res = client->Post("/process", R"({"message":"Hello"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 429);
    EXPECT_EQ(json::parse(res->body)["error"]["type"], "upstream_rate_limit");
}

TEST_F(ResponderServerTest, StreamSendsFrames) {
    start_mock();

    auto res = client->Post("/stream", R"({"message":"hi there"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Type"), "text/event-stream");
    EXPECT_EQ(res->body.rfind("data: {\"content\":", 0), 0u);

    const std::string done = "data: [DONE]\n\n";
    ASSERT_GE(res->body.size(), done.size());
    EXPECT_EQ(res->body.substr(res->body.size() - done.size()), done);
}

TEST_F(ResponderServerTest, StreamValidatesBeforeStreaming) {
    start_mock();

    auto res = client->Post("/stream", R"({"message":"Hi","temperature":5})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 422);
}

TEST_F(ResponderServerTest, InformationalRoutes) {
    start_mock();

    auto models = client->Get("/models");
    ASSERT_TRUE(models);
    EXPECT_EQ(json::parse(models->body)["default"], "mock-model");

    auto health = client->Get("/health");
    ASSERT_TRUE(health);
    json health_body = json::parse(health->body);
    EXPECT_EQ(health_body["status"], "healthy");
    EXPECT_TRUE(health_body.contains("uptimeSeconds"));

    auto config = client->Get("/config");
    ASSERT_TRUE(config);
    EXPECT_EQ(json::parse(config->body)["provider"], "mock");

    auto stats = client->Get("/stats");
    ASSERT_TRUE(stats);
    EXPECT_EQ(json::parse(stats->body)["totalRequests"], 0);
}

TEST_F(ResponderServerTest, ModelsFailureUsesErrorKindStatus) {
    start([]() -> std::unique_ptr<CompletionProvider> {
        throw ConfigurationError("OPENAI_API_KEY environment variable is not set");
    }, "openai");

    auto res = client->Get("/models");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    EXPECT_EQ(json::parse(res->body)["error"]["type"], "configuration");

    auto health = client->Get("/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(json::parse(health->body)["status"], "degraded");
}

TEST_F(ResponderServerTest, DispatcherRoundTrip) {
    start_mock();

    DispatcherOptions options;
    options.server_url = "http://127.0.0.1:" + std::to_string(port);
    options.timeout_seconds = 10;
    UsageAggregator messenger_usage;
    ConversationLog log;
    RequestDispatcher dispatcher(options, messenger_usage, log);

    DispatchInput input;
    input.message = "hi there";
    DispatchResult first = dispatcher.send(input);
    ASSERT_TRUE(first.ok()) << first.error;
    EXPECT_EQ(first.attempts, 1);
    EXPECT_NE(first.payload["aiResponse"].get<std::string>().find("#1]"), std::string::npos);
    EXPECT_EQ(first.payload["usage"]["promptTokens"], 4);

    DispatchResult second = dispatcher.send(input);
    ASSERT_TRUE(second.ok());
    EXPECT_NE(second.payload["aiResponse"].get<std::string>().find("#2]"), std::string::npos);

    std::string streamed;
    DispatchResult stream = dispatcher.send_stream(input, [&streamed](const std::string& chunk) { streamed += chunk; });
    ASSERT_TRUE(stream.ok()) << stream.error;
    EXPECT_EQ(streamed, MockProvider::stream_text(3, "hi there") + " ");

    EXPECT_EQ(messenger_usage.snapshot().total_requests, 2);
    EXPECT_EQ(log.size(), 6u);
    EXPECT_EQ(usage.snapshot().total_requests, 2);

    DispatchResult health = dispatcher.check_health();
    ASSERT_TRUE(health.ok());
    EXPECT_EQ(health.payload["messagesProcessed"], 2);
}
