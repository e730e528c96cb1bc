#include "signaling_channel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

namespace livecall {
namespace {

using namespace std::chrono_literals;

SignalingMessage Candidate(const ParticipantId& from, const ParticipantId& to, uint64_t seq) {
    return SignalingMessage{from, to, seq, CandidatePayload{"candidate:" + std::to_string(seq), 0}};
}

class SignalingChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel_ = std::make_shared<SignalingChannel>("room-1");
        channel_->Open("alice");
        channel_->Open("bob");
    }

    std::shared_ptr<SignalingChannel> channel_;
};

TEST_F(SignalingChannelTest, DeliversInSendOrder) {
    auto inbox = channel_->Subscribe("bob");
    for (uint64_t seq = 1; seq <= 5; ++seq) {
        ASSERT_TRUE(channel_->Send(Candidate("alice", "bob", seq)).Ok());
    }

    for (uint64_t seq = 1; seq <= 5; ++seq) {
        auto message = inbox->TryNext();
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(seq, message->seq);
        EXPECT_EQ("alice", message->from);
    }
    EXPECT_FALSE(inbox->TryNext().has_value());
}

TEST_F(SignalingChannelTest, DropsDuplicateSequenceNumbers) {
    auto inbox = channel_->Subscribe("bob");
    ASSERT_TRUE(channel_->Send(Candidate("alice", "bob", 1)).Ok());
    ASSERT_TRUE(channel_->Send(Candidate("alice", "bob", 2)).Ok());
    EXPECT_TRUE(channel_->Send(Candidate("alice", "bob", 2)).Ok());
    EXPECT_TRUE(channel_->Send(Candidate("alice", "bob", 1)).Ok());

    EXPECT_EQ(1u, inbox->TryNext()->seq);
    EXPECT_EQ(2u, inbox->TryNext()->seq);
    EXPECT_FALSE(inbox->TryNext().has_value());
}

TEST_F(SignalingChannelTest, RejectsClosedEndpoints) {
    channel_->Close("bob");

    auto toClosed = channel_->Send(Candidate("alice", "bob", 1));
    ASSERT_FALSE(toClosed.Ok());
    EXPECT_EQ(ErrorCode::ChannelClosed, toClosed.GetError().code);

    auto fromClosed = channel_->Send(Candidate("bob", "alice", 1));
    ASSERT_FALSE(fromClosed.Ok());
    EXPECT_EQ(ErrorCode::ChannelClosed, fromClosed.GetError().code);

    auto toStranger = channel_->Send(Candidate("alice", "carol", 1));
    ASSERT_FALSE(toStranger.Ok());
    EXPECT_EQ(ErrorCode::ChannelClosed, toStranger.GetError().code);
}

TEST_F(SignalingChannelTest, CloseAllRejectsEverySend) {
    channel_->CloseAll();

    EXPECT_FALSE(channel_->IsOpen("alice"));
    auto sent = channel_->Send(SignalingMessage{"alice", std::nullopt, 1, ByePayload{}});
    ASSERT_FALSE(sent.Ok());
    EXPECT_EQ(ErrorCode::ChannelClosed, sent.GetError().code);
}

TEST_F(SignalingChannelTest, BroadcastSkipsSender) {
    channel_->Open("carol");
    auto alice = channel_->Subscribe("alice");
    auto bob = channel_->Subscribe("bob");
    auto carol = channel_->Subscribe("carol");

    ASSERT_TRUE(channel_->Send(SignalingMessage{"alice", std::nullopt, 1, ByePayload{"leaving"}}).Ok());

    EXPECT_FALSE(alice->TryNext().has_value());
    ASSERT_TRUE(bob->TryNext().has_value());
    ASSERT_TRUE(carol->TryNext().has_value());
}

TEST_F(SignalingChannelTest, ResubscribeReplaysUnacknowledged) {
    auto inbox = channel_->Subscribe("bob");
    for (uint64_t seq = 1; seq <= 3; ++seq) {
        ASSERT_TRUE(channel_->Send(Candidate("alice", "bob", seq)).Ok());
    }
    ASSERT_EQ(1u, inbox->TryNext()->seq);
    ASSERT_EQ(2u, inbox->TryNext()->seq);
    inbox->Acknowledge("alice", 1);

    auto resumed = channel_->Subscribe("bob");
    EXPECT_FALSE(inbox->TryNext().has_value());
    EXPECT_EQ(2u, resumed->TryNext()->seq);
    EXPECT_EQ(3u, resumed->TryNext()->seq);
    EXPECT_FALSE(resumed->TryNext().has_value());
}

TEST_F(SignalingChannelTest, NotifierFiresForPendingAndNewMessages) {
    auto inbox = channel_->Subscribe("bob");
    ASSERT_TRUE(channel_->Send(Candidate("alice", "bob", 1)).Ok());

    std::atomic_int calls{0};
    inbox->SetNotifier([&] { ++calls; });
    EXPECT_EQ(1, calls);

    ASSERT_TRUE(channel_->Send(Candidate("alice", "bob", 2)).Ok());
    EXPECT_EQ(2, calls);
}

TEST_F(SignalingChannelTest, NextTimesOutOnEmptyMailbox) {
    auto inbox = channel_->Subscribe("bob");

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(inbox->Next(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST_F(SignalingChannelTest, NextWakesOnDelivery) {
    auto inbox = channel_->Subscribe("bob");

    std::thread sender([this] {
        std::this_thread::sleep_for(20ms);
        ASSERT_TRUE(channel_->Send(Candidate("alice", "bob", 1)).Ok());
    });

    auto message = inbox->Next(2000ms);
    sender.join();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(1u, message->seq);
}

TEST_F(SignalingChannelTest, RejoinResetsSequenceTracking) {
    auto inbox = channel_->Subscribe("bob");
    ASSERT_TRUE(channel_->Send(Candidate("alice", "bob", 5)).Ok());
    ASSERT_TRUE(inbox->TryNext().has_value());

    channel_->Close("alice");
    channel_->Open("alice");
    ASSERT_TRUE(channel_->Send(Candidate("alice", "bob", 1)).Ok());

    auto message = inbox->TryNext();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(1u, message->seq);
}

} // namespace
} // namespace livecall
