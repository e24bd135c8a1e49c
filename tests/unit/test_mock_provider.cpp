#include <gtest/gtest.h>
#include "providers/mock.h"

using namespace std::chrono_literals;

namespace {

CompletionRequest make_request(const std::string& user, const std::string& system = "You are helpful.") {
    CompletionRequest request;
    request.messages = {Message(Message::SYSTEM, system), Message(Message::USER, user)};
    request.model = MockProvider::MODEL;
    return request;
}

std::string drain(ChunkStream& stream, StreamChunk::Type* terminal = nullptr) {
    std::string text;
    while (true) {
        StreamChunk chunk = stream.next();
        if (chunk.is_terminal()) {
            if (terminal) *terminal = chunk.type;
            return text;
        }
        text += chunk.text;
    }
}

std::string rtrim(std::string s) {
    while (!s.empty() && s.back() == ' ') s.pop_back();
    return s;
}

} // namespace

// =============================================================================
// complete()
// =============================================================================

TEST(MockProviderTest, CounterAndTokenHeuristic) {
    MockProvider provider(0ms, 0ms);

    CompletionResult first = provider.complete(make_request("hi there"));
    CompletionResult second = provider.complete(make_request("hi there"));

    EXPECT_NE(first.content.find("#1"), std::string::npos);
    EXPECT_NE(second.content.find("#2"), std::string::npos);
    EXPECT_EQ(first.prompt_tokens, 4);
    EXPECT_EQ(second.prompt_tokens, 4);
    EXPECT_EQ(provider.request_count(), 2);
}

TEST(MockProviderTest, ResponseEchoesUserMessage) {
    MockProvider provider(0ms, 0ms);
    CompletionResult result = provider.complete(make_request("What is 2+2?"));

    EXPECT_EQ(result.content, MockProvider::response_text(1, "What is 2+2?"));
    EXPECT_NE(result.content.find("What is 2+2?"), std::string::npos);
    EXPECT_EQ(result.resolved_model, "mock-model");
}

TEST(MockProviderTest, CompletionTokensAreWordsTimesTwo) {
    MockProvider provider(0ms, 0ms);
    CompletionResult result = provider.complete(make_request("one two three"));

    EXPECT_EQ(result.prompt_tokens, 6);
    EXPECT_EQ(result.completion_tokens, MockProvider::word_count(result.content) * 2);
    EXPECT_EQ(result.total_tokens(), result.prompt_tokens + result.completion_tokens);
}

TEST(MockProviderTest, SystemMessageIsNotCounted) {
    MockProvider provider(0ms, 0ms);
    CompletionResult result = provider.complete(make_request("hello", "a very long system prompt indeed"));
    EXPECT_EQ(result.prompt_tokens, 2);
}

TEST(MockProviderTest, WordCount) {
    EXPECT_EQ(MockProvider::word_count(""), 0);
    EXPECT_EQ(MockProvider::word_count("   "), 0);
    EXPECT_EQ(MockProvider::word_count("a"), 1);
    EXPECT_EQ(MockProvider::word_count("  a\tb\nc  "), 3);
}

// =============================================================================
// complete_stream()
// =============================================================================

TEST(MockProviderTest, StreamEmitsWordsThenEnd) {
    MockProvider provider(0ms, 0ms);
    ChunkStream stream = provider.complete_stream(make_request("hi there"));

    StreamChunk::Type terminal = StreamChunk::CONTENT;
    std::string text = drain(stream, &terminal);

    EXPECT_EQ(terminal, StreamChunk::END);
    EXPECT_EQ(rtrim(text), MockProvider::stream_text(1, "hi there"));
}

TEST(MockProviderTest, StreamChunksAreSingleWords) {
    MockProvider provider(0ms, 0ms);
    ChunkStream stream = provider.complete_stream(make_request("hi"));

    int chunks = 0;
    while (true) {
        StreamChunk chunk = stream.next();
        if (chunk.is_terminal()) break;
        chunks++;
        EXPECT_EQ(MockProvider::word_count(chunk.text), 1) << chunk.text;
        EXPECT_EQ(chunk.text.back(), ' ');
    }
    EXPECT_EQ(chunks, MockProvider::word_count(MockProvider::stream_text(1, "hi")));
}

TEST(MockProviderTest, StreamAndCompleteShareCounterAndBody) {
    MockProvider provider(0ms, 0ms);

    CompletionResult result = provider.complete(make_request("hi there"));
    ChunkStream stream = provider.complete_stream(make_request("hi there"));
    std::string streamed = rtrim(drain(stream));

    EXPECT_NE(result.content.find("#1"), std::string::npos);
    EXPECT_NE(streamed.find("#2"), std::string::npos);
    EXPECT_NE(result.content.find("You said: 'hi there'"), std::string::npos);
    EXPECT_NE(streamed.find("You said: 'hi there'"), std::string::npos);
}

TEST(MockProviderTest, StreamIsDeterministicForSameCounter) {
    MockProvider a(0ms, 0ms);
    MockProvider b(0ms, 0ms);

    ChunkStream sa = a.complete_stream(make_request("same input"));
    ChunkStream sb = b.complete_stream(make_request("same input"));
    EXPECT_EQ(drain(sa), drain(sb));
}

TEST(MockProviderTest, AbandonedStreamDoesNotHang) {
    MockProvider provider(0ms, 1ms);
    {
        ChunkStream stream = provider.complete_stream(make_request("a long message with many words in it"));
        EXPECT_EQ(stream.next().type, StreamChunk::CONTENT);
    }
    SUCCEED();
}

// =============================================================================
// Metadata
// =============================================================================

TEST(MockProviderTest, HealthAndModels) {
    MockProvider provider(0ms, 0ms);

    HealthStatus health = provider.health_check();
    EXPECT_TRUE(health.healthy);
    EXPECT_TRUE(health.error.empty());
    EXPECT_FALSE(health.note.empty());

    EXPECT_EQ(provider.default_model(), "mock-model");
    EXPECT_EQ(provider.list_models(), std::vector<std::string>{"mock-model"});
    EXPECT_TRUE(provider.is_configured());
    EXPECT_EQ(provider.type(), ProviderType::MOCK);
    EXPECT_EQ(provider.name(), "mock");
}
