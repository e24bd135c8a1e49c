#include "courier.h"
#include "providers/mock.h"

#include <sstream>
#include <thread>

MockProvider::MockProvider(std::chrono::milliseconds response_delay,
                           std::chrono::milliseconds word_delay)
    : response_delay_(response_delay), word_delay_(word_delay) {
    LOG_DEBUG("MockProvider created");
}

int MockProvider::word_count(const std::string& text) {
    std::istringstream stream(text);
    std::string word;
    int count = 0;
    while (stream >> word) {
        count++;
    }
    return count;
}

std::string MockProvider::response_text(int n, const std::string& user_message) {
    return "[MOCK RESPONSE #" + std::to_string(n) + "] You said: '" + user_message +
           "'. This is a test response without calling any external API.";
}

std::string MockProvider::stream_text(int n, const std::string& user_message) {
    return "[MOCK STREAM #" + std::to_string(n) + "] You said: '" + user_message +
           "'. This is a streaming test response.";
}

CompletionResult MockProvider::complete(const CompletionRequest& request) {
    int n = ++request_count_;

    // Emulate backend latency
    if (response_delay_.count() > 0) {
        std::this_thread::sleep_for(response_delay_);
    }

    std::string user_message = first_user_message(request.messages);

    CompletionResult result;
    result.content = response_text(n, user_message);
    result.prompt_tokens = word_count(user_message) * 2;
    result.completion_tokens = word_count(result.content) * 2;
    result.resolved_model = MODEL;

    dprintf(2, "Mock response #%d: %d prompt, %d completion tokens",
            n, result.prompt_tokens, result.completion_tokens);
    return result;
}

ChunkStream MockProvider::complete_stream(const CompletionRequest& request) {
    int n = ++request_count_;
    std::string text = stream_text(n, first_user_message(request.messages));
    auto channel = std::make_shared<StreamChannel>();
    auto delay = word_delay_;

    std::thread producer([channel, text, delay]() {
        std::istringstream words(text);
        std::string word;
        while (words >> word) {
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            if (!channel->push(StreamChunk::content(word + " "))) {
                dprintf(2, "Mock stream cancelled by consumer");
                return;
            }
        }
        channel->push(StreamChunk::end());
    });

    return ChunkStream(channel, std::move(producer));
}

HealthStatus MockProvider::health_check() {
    HealthStatus status;
    status.healthy = true;
    status.note = "Mock provider - no external API";
    return status;
}
