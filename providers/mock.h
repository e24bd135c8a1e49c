#pragma once

#include "providers/provider.h"
#include <atomic>
#include <chrono>

/// @brief Deterministic provider with no network access
/// Responses embed a per-instance call counter (starting at 1) shared by
/// complete() and complete_stream(). Token counts are words x 2.
class MockProvider : public CompletionProvider {
public:
    static constexpr const char* MODEL = "mock-model";

    MockProvider(std::chrono::milliseconds response_delay = std::chrono::milliseconds(100),
                 std::chrono::milliseconds word_delay = std::chrono::milliseconds(50));

    ProviderType type() const override { return ProviderType::MOCK; }

    CompletionResult complete(const CompletionRequest& request) override;
    ChunkStream complete_stream(const CompletionRequest& request) override;
    HealthStatus health_check() override;
    std::string default_model() const override { return MODEL; }
    std::vector<std::string> list_models() override { return {MODEL}; }
    bool is_configured() const override { return true; }

    /// @brief Calls made so far (complete + complete_stream)
    int request_count() const { return request_count_.load(); }

    /// @brief Whitespace-separated word count
    static int word_count(const std::string& text);

    static std::string response_text(int n, const std::string& user_message);
    static std::string stream_text(int n, const std::string& user_message);

private:
    std::atomic<int> request_count_{0};
    std::chrono::milliseconds response_delay_;
    std::chrono::milliseconds word_delay_;
};
