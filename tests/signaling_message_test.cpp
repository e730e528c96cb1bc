#include "signaling_message.hpp"

#include <gtest/gtest.h>

namespace livecall {
namespace {

using json = nlohmann::json;

TEST(SignalingMessageTest, SerializesOfferWithRecipient) {
    SignalingMessage message{"alice", "bob", 7, OfferPayload{"v=0", true}};

    auto j = ToJson(message);
    EXPECT_EQ("offer", j["type"]);
    EXPECT_EQ(7u, j["seq"].get<uint64_t>());
    EXPECT_EQ("alice", j["from"]);
    EXPECT_EQ("bob", j["to"]);
    EXPECT_EQ("v=0", j["payload"]["sdp"]);
    EXPECT_TRUE(j["payload"]["iceRestart"].get<bool>());
}

TEST(SignalingMessageTest, BroadcastHasNoRecipient) {
    SignalingMessage message{"alice", std::nullopt, 3, ByePayload{"done"}};

    auto j = ToJson(message);
    EXPECT_EQ("bye", j["type"]);
    EXPECT_FALSE(j.contains("to"));
    EXPECT_TRUE(message.IsBroadcast());
}

TEST(SignalingMessageTest, ParsesCandidateFromWire) {
    auto parsed = Deserialize(R"({"type":"candidate","seq":4,"from":"bob","to":"alice",
        "payload":{"candidate":"candidate:1 1 udp 1 10.0.0.1 5000 typ host","sdpMLineIndex":1}})");

    ASSERT_TRUE(parsed.Ok());
    const auto& message = parsed.Value();
    EXPECT_EQ("bob", message.from);
    ASSERT_TRUE(message.to.has_value());
    EXPECT_EQ("alice", *message.to);
    EXPECT_EQ(4u, message.seq);

    auto candidate = std::get_if<CandidatePayload>(&message.payload);
    ASSERT_NE(nullptr, candidate);
    EXPECT_EQ(1, candidate->mLineIndex);
    EXPECT_EQ("candidate", std::string(TypeName(message.payload)));
}

TEST(SignalingMessageTest, MediaStateDefaultsMissingFlags) {
    auto parsed = Deserialize(R"({"type":"media-state","seq":1,"from":"bob","payload":{"audio":false}})");

    ASSERT_TRUE(parsed.Ok());
    auto state = std::get_if<MediaStatePayload>(&parsed.Value().payload);
    ASSERT_NE(nullptr, state);
    EXPECT_FALSE(state->audio);
    EXPECT_TRUE(state->video);
    EXPECT_FALSE(state->screen);
}

TEST(SignalingMessageTest, RejectsMalformedMessages) {
    const char* samples[] = {
        "not json",
        R"([1,2,3])",
        R"({"seq":1,"from":"a","payload":{}})",
        R"({"type":"offer","from":"a","payload":{"sdp":"x"}})",
        R"({"type":"offer","seq":-1,"from":"a","payload":{"sdp":"x"}})",
        R"({"type":"offer","seq":1,"payload":{"sdp":"x"}})",
        R"({"type":"offer","seq":1,"from":"a","payload":{}})",
        R"({"type":"answer","seq":1,"from":"a","to":5,"payload":{"sdp":"x"}})",
        R"({"type":"hello","seq":1,"from":"a","payload":{}})",
        R"({"type":"candidate","seq":1,"from":"a","payload":{"candidate":"c","sdpMLineIndex":1.5}})",
        R"({"type":"candidate","seq":1,"from":"a","payload":{"candidate":"c","sdpMLineIndex":-1}})",
        R"({"type":"candidate","seq":1,"from":"a","payload":{"candidate":"c","sdpMLineIndex":4294967297}})",
        R"({"type":"candidate","seq":1,"from":"a","payload":{"candidate":"c","sdpMLineIndex":"0"}})",
    };

    for (const char* sample : samples) {
        auto parsed = Deserialize(sample);
        ASSERT_FALSE(parsed.Ok()) << sample;
        EXPECT_EQ(ErrorCode::InvalidMessage, parsed.GetError().code) << sample;
    }
}

TEST(SignalingMessageTest, KnowsSignalingTypes) {
    EXPECT_TRUE(IsSignalingType("offer"));
    EXPECT_TRUE(IsSignalingType("media-state"));
    EXPECT_FALSE(IsSignalingType("join"));
    EXPECT_FALSE(IsSignalingType("ping"));
}

} // namespace
} // namespace livecall
