#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "nexstar/channel.hpp"
#include "nexstar/errors.hpp"
#include "mock_transport.hpp"

namespace nexstar {
namespace {

/// Fixture that opens a CommandChannel over a MockTransport.
class ChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto transport = std::make_unique<testing::MockTransport>();
        mock_ = transport.get();  // keep raw pointer for inspection
        channel_ = std::make_unique<CommandChannel>(std::move(transport), 0.3);
        channel_->open();
    }

    testing::MockTransport* mock_ = nullptr;
    std::unique_ptr<CommandChannel> channel_;
};

TEST_F(ChannelTest, AppendsTerminatorAndStripsIt) {
    mock_->set_responder([](const std::string&) { return std::string("12345678,9ABCDEF0#"); });

    EXPECT_EQ(channel_->send_command("E"), "12345678,9ABCDEF0");
    EXPECT_EQ(mock_->last_command(), "E");
}

TEST_F(ChannelTest, EmptyAcknowledgement) {
    EXPECT_EQ(channel_->send_command("M"), "");
}

TEST_F(ChannelTest, HashInsideRawPayloadIsData) {
    // 0x23 is '#': a model byte of 35 must not end the response early
    mock_->set_responder([](const std::string&) { return std::string("##"); });

    std::string response = channel_->send_command("m", 1);
    ASSERT_EQ(response.size(), 1u);
    EXPECT_EQ(response[0], '#');
}

TEST_F(ChannelTest, StaleInputDiscardedBeforeSend) {
    mock_->set_responder([](const std::string& cmd) {
        return cmd == "L" ? std::string("1#garbage#") : std::string("0#");
    });
    EXPECT_EQ(channel_->send_command("L"), "1");
    EXPECT_EQ(channel_->send_command("X"), "0");
}

TEST_F(ChannelTest, TimeoutNearConfiguredValue) {
    mock_->set_hang(true);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(channel_->send_command("E"), TimeoutError);
    double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    EXPECT_GE(elapsed, 0.29);
    EXPECT_LT(elapsed, 1.0);
}

TEST_F(ChannelTest, PartialResponseTimesOut) {
    mock_->set_responder([](const std::string&) { return std::string("1234"); });
    EXPECT_THROW(channel_->send_command("E"), TimeoutError);
}

TEST_F(ChannelTest, ClosedChannelRaisesNotConnected) {
    channel_->close();
    EXPECT_FALSE(channel_->is_open());
    EXPECT_THROW(channel_->send_command("E"), NotConnectedError);
    EXPECT_EQ(mock_->command_count(), 0u);
}

TEST_F(ChannelTest, OpenAndCloseAreIdempotent) {
    channel_->open();
    EXPECT_EQ(mock_->open_count(), 1);
    channel_->close();
    channel_->close();
    EXPECT_FALSE(channel_->is_open());
}

TEST_F(ChannelTest, SetTimeout) {
    channel_->set_timeout(0.1);
    EXPECT_DOUBLE_EQ(channel_->timeout(), 0.1);

    mock_->set_hang(true);
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(channel_->send_command("Z"), TimeoutError);
    double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_LT(elapsed, 0.5);
}

TEST_F(ChannelTest, ConcurrentCallersEachGetTheirOwnReply) {
    mock_->set_half_duplex_check(true);
    mock_->set_responder([](const std::string& cmd) {
        return "R" + cmd.substr(1) + "#";
    });

    constexpr int kThreads = 6;
    constexpr int kCommandsPerThread = 200;
    std::atomic<int> mismatches{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kCommandsPerThread; ++i) {
                std::string tag = std::to_string(t) + "-" + std::to_string(i);
                try {
                    if (channel_->send_command("Q" + tag) != "R" + tag) {
                        ++mismatches;
                    }
                } catch (const NexStarError&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(mock_->overlap_count(), 0);
    EXPECT_EQ(mock_->command_count(), static_cast<size_t>(kThreads * kCommandsPerThread));
}

TEST(ChannelConstructionTest, NullTransportRejected) {
    EXPECT_THROW(CommandChannel(nullptr), ConnectionError);
}

} // namespace
} // namespace nexstar
