#pragma once

#include "errors.h"
#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <memory>
#include <thread>
#include <string>

/// @brief One element of a streamed completion
/// A stream is zero or more CONTENT chunks followed by exactly one END or ERROR
struct StreamChunk {
    enum Type {
        CONTENT,   // Incremental piece of the completion text
        END,       // Explicit end-of-stream marker
        ERROR      // Upstream failure; nothing after it is meaningful
    };

    Type type = CONTENT;
    std::string text;                           // Content text, or error message for ERROR
    ErrorKind error_kind = ErrorKind::UPSTREAM; // Only meaningful for ERROR

    static StreamChunk content(const std::string& t) { return StreamChunk{CONTENT, t, ErrorKind::UPSTREAM}; }
    static StreamChunk end() { return StreamChunk{END, "", ErrorKind::UPSTREAM}; }
    static StreamChunk error(ErrorKind kind, const std::string& message) { return StreamChunk{ERROR, message, kind}; }

    bool is_terminal() const { return type != CONTENT; }
};

/// @brief Bounded single-producer/single-consumer queue of StreamChunks
/// push() blocks while full; once a terminal chunk is pushed or the consumer
/// closes the channel, further pushes are rejected
class StreamChannel {
public:
    explicit StreamChannel(size_t capacity = 64) : capacity(capacity == 0 ? 1 : capacity) {}

    /// @brief Producer side. Blocks while the channel is full.
    /// @return false if the channel is closed (consumer gone or stream already terminated)
    bool push(StreamChunk chunk) {
        std::unique_lock<std::mutex> lock(mutex);
        not_full.wait(lock, [this] { return closed || queue.size() < capacity; });
        if (closed || terminated) {
            return false;
        }
        if (chunk.is_terminal()) {
            terminated = true;
        }
        queue.push_back(std::move(chunk));
        not_empty.notify_one();
        return true;
    }

    /// @brief Consumer side. Blocks until a chunk is available.
    /// Returns END if the channel was closed with nothing left to read.
    StreamChunk pop() {
        std::unique_lock<std::mutex> lock(mutex);
        not_empty.wait(lock, [this] { return closed || !queue.empty(); });
        if (queue.empty()) {
            return StreamChunk::end();
        }
        StreamChunk item = std::move(queue.front());
        queue.pop_front();
        not_full.notify_one();
        return item;
    }

    template<typename Rep, typename Period>
    std::optional<StreamChunk> wait_for_and_pop(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!not_empty.wait_for(lock, timeout, [this] { return closed || !queue.empty(); })) {
            return std::nullopt;
        }
        if (queue.empty()) {
            return StreamChunk::end();
        }
        StreamChunk item = std::move(queue.front());
        queue.pop_front();
        not_full.notify_one();
        return item;
    }

    /// @brief Consumer gives up; wakes a blocked producer so it can stop
    void close() {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        not_full.notify_all();
        not_empty.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

private:
    std::deque<StreamChunk> queue;
    size_t capacity;
    bool closed = false;
    bool terminated = false;
    mutable std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
};

/// @brief Consumer handle for a streamed completion
/// Owns the producer thread; destroying the handle closes the channel and joins
class ChunkStream {
public:
    ChunkStream() = default;
    ChunkStream(std::shared_ptr<StreamChannel> channel, std::thread producer)
        : channel(std::move(channel)), producer(std::move(producer)) {}

    ~ChunkStream() { finish(); }

    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    ChunkStream(ChunkStream&& other) noexcept = default;
    ChunkStream& operator=(ChunkStream&& other) noexcept {
        if (this != &other) {
            finish();
            channel = std::move(other.channel);
            producer = std::move(other.producer);
            done = other.done;
        }
        return *this;
    }

    /// @brief Next chunk; after a terminal chunk every further call returns END
    StreamChunk next() {
        if (done || !channel) {
            return StreamChunk::end();
        }
        StreamChunk chunk = channel->pop();
        if (chunk.is_terminal()) {
            done = true;
        }
        return chunk;
    }

    bool finished() const { return done; }

private:
    void finish() {
        if (channel) {
            channel->close();
        }
        if (producer.joinable()) {
            producer.join();
        }
    }

    std::shared_ptr<StreamChannel> channel;
    std::thread producer;
    bool done = false;
};
