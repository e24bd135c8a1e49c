#include <gtest/gtest.h>
#include "stream_channel.h"
#include <atomic>
#include <thread>

using namespace std::chrono_literals;

// =============================================================================
// StreamChannel
// =============================================================================

TEST(StreamChannelTest, PushPopPreservesOrder) {
    StreamChannel channel;
    EXPECT_TRUE(channel.push(StreamChunk::content("a")));
    EXPECT_TRUE(channel.push(StreamChunk::content("b")));
    EXPECT_TRUE(channel.push(StreamChunk::end()));

    EXPECT_EQ(channel.pop().text, "a");
    EXPECT_EQ(channel.pop().text, "b");
    EXPECT_EQ(channel.pop().type, StreamChunk::END);
}

TEST(StreamChannelTest, PushAfterTerminalIsRejected) {
    StreamChannel channel;
    EXPECT_TRUE(channel.push(StreamChunk::error(ErrorKind::UPSTREAM_SERVER, "boom")));
    EXPECT_FALSE(channel.push(StreamChunk::content("late")));
    EXPECT_FALSE(channel.push(StreamChunk::end()));

    StreamChunk chunk = channel.pop();
    EXPECT_EQ(chunk.type, StreamChunk::ERROR);
    EXPECT_EQ(chunk.error_kind, ErrorKind::UPSTREAM_SERVER);
    EXPECT_EQ(chunk.text, "boom");
    EXPECT_EQ(channel.size(), 0u);
}

TEST(StreamChannelTest, PopOnClosedEmptyChannelIsEnd) {
    StreamChannel channel;
    channel.close();
    EXPECT_TRUE(channel.is_closed());
    EXPECT_EQ(channel.pop().type, StreamChunk::END);
    EXPECT_FALSE(channel.push(StreamChunk::content("x")));
}

TEST(StreamChannelTest, WaitForAndPopTimesOut) {
    StreamChannel channel;
    auto chunk = channel.wait_for_and_pop(20ms);
    EXPECT_FALSE(chunk.has_value());
}

TEST(StreamChannelTest, BoundedPushBlocksUntilConsumed) {
    StreamChannel channel(1);
    ASSERT_TRUE(channel.push(StreamChunk::content("first")));

    std::atomic<bool> second_pushed{false};
    std::thread producer([&]() {
        channel.push(StreamChunk::content("second"));
        second_pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(second_pushed.load());

    EXPECT_EQ(channel.pop().text, "first");
    producer.join();
    EXPECT_TRUE(second_pushed.load());
    EXPECT_EQ(channel.pop().text, "second");
}

TEST(StreamChannelTest, CloseReleasesBlockedProducer) {
    StreamChannel channel(1);
    ASSERT_TRUE(channel.push(StreamChunk::content("fill")));

    std::atomic<int> result{-1};
    std::thread producer([&]() {
        result = channel.push(StreamChunk::content("blocked")) ? 1 : 0;
    });

    std::this_thread::sleep_for(20ms);
    channel.close();
    producer.join();
    EXPECT_EQ(result.load(), 0);
}

// =============================================================================
// ChunkStream
// =============================================================================

TEST(ChunkStreamTest, DefaultStreamIsEnded) {
    ChunkStream stream;
    EXPECT_EQ(stream.next().type, StreamChunk::END);
}

TEST(ChunkStreamTest, NextAfterTerminalReturnsEnd) {
    auto channel = std::make_shared<StreamChannel>();
    std::thread producer([channel]() {
        channel->push(StreamChunk::content("hello"));
        channel->push(StreamChunk::error(ErrorKind::TIMEOUT, "slow"));
    });
    ChunkStream stream(channel, std::move(producer));

    EXPECT_EQ(stream.next().text, "hello");
    StreamChunk err = stream.next();
    EXPECT_EQ(err.type, StreamChunk::ERROR);
    EXPECT_EQ(err.error_kind, ErrorKind::TIMEOUT);
    EXPECT_TRUE(stream.finished());
    EXPECT_EQ(stream.next().type, StreamChunk::END);
}

TEST(ChunkStreamTest, DestroyingStreamStopsProducer) {
    auto channel = std::make_shared<StreamChannel>(2);
    std::atomic<bool> producer_exited{false};
    std::atomic<int> pushed{0};

    {
        std::thread producer([channel, &producer_exited, &pushed]() {
            // Would run forever if nobody closed the channel
            while (channel->push(StreamChunk::content("x"))) {
                pushed++;
            }
            producer_exited = true;
        });
        ChunkStream stream(channel, std::move(producer));
        EXPECT_EQ(stream.next().text, "x");
    }

    EXPECT_TRUE(producer_exited.load());
    EXPECT_GE(pushed.load(), 1);
}

TEST(ChunkStreamTest, MoveTransfersOwnership) {
    auto channel = std::make_shared<StreamChannel>();
    std::thread producer([channel]() {
        channel->push(StreamChunk::content("moved"));
        channel->push(StreamChunk::end());
    });

    ChunkStream original(channel, std::move(producer));
    ChunkStream moved(std::move(original));

    EXPECT_EQ(moved.next().text, "moved");
    EXPECT_EQ(moved.next().type, StreamChunk::END);
}
