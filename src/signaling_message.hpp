#pragma once

#include "errors.hpp"
#include "fwd.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace livecall {

struct OfferPayload {
    std::string sdp;
    bool iceRestart = false;
};

struct AnswerPayload {
    std::string sdp;
};

struct CandidatePayload {
    std::string candidate;
    int mLineIndex = 0;
};

struct ByePayload {
    std::string reason;
};

// Lets the remote side show mute/camera-off/sharing indicators.
struct MediaStatePayload {
    bool audio = true;
    bool video = true;
    bool screen = false;
};

using SignalingPayload = std::variant<OfferPayload, AnswerPayload, CandidatePayload, ByePayload, MediaStatePayload>;

struct SignalingMessage {
    ParticipantId from;
    std::optional<ParticipantId> to;
    uint64_t seq = 0;
    SignalingPayload payload;

    bool IsBroadcast() const {
        return !to.has_value();
    }
};

const char* TypeName(const SignalingPayload& payload);
bool IsSignalingType(const std::string& type);

// Wire format: {type, seq, from, to?, payload}.
nlohmann::json ToJson(const SignalingMessage& message);
Result<SignalingMessage> ParseSignalingMessage(const nlohmann::json& json);

Result<SignalingMessage> Deserialize(const std::string& text);

} // namespace livecall
