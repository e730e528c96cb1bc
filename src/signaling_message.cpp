#include "signaling_message.hpp"

namespace livecall {

namespace {

using json = nlohmann::json;

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

json PayloadToJson(const SignalingPayload& payload) {
    return std::visit(Overloaded{
        [](const OfferPayload& offer) {
            return json{{"sdp", offer.sdp}, {"iceRestart", offer.iceRestart}};
        },
        [](const AnswerPayload& answer) {
            return json{{"sdp", answer.sdp}};
        },
        [](const CandidatePayload& candidate) {
            return json{{"candidate", candidate.candidate}, {"sdpMLineIndex", candidate.mLineIndex}};
        },
        [](const ByePayload& bye) {
            return json{{"reason", bye.reason}};
        },
        [](const MediaStatePayload& state) {
            return json{{"audio", state.audio}, {"video", state.video}, {"screen", state.screen}};
        },
    }, payload);
}

Result<std::string> RequireString(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return MakeError(ErrorCode::InvalidMessage, std::string("Payload missing ") + key);
    }
    return it->get<std::string>();
}

Result<SignalingPayload> ParsePayload(const std::string& type, const json& payload) {
    if (type == "offer") {
        auto sdp = RequireString(payload, "sdp");
        if (!sdp) {
            return sdp.GetError();
        }
        return SignalingPayload{OfferPayload{sdp.Value(), payload.value("iceRestart", false)}};
    }
    if (type == "answer") {
        auto sdp = RequireString(payload, "sdp");
        if (!sdp) {
            return sdp.GetError();
        }
        return SignalingPayload{AnswerPayload{sdp.Value()}};
    }
    if (type == "candidate") {
        auto candidate = RequireString(payload, "candidate");
        if (!candidate) {
            return candidate.GetError();
        }
        int mLineIndex = 0;
        if (auto it = payload.find("sdpMLineIndex"); it != payload.end()) {
            if (!it->is_number_integer() || it->get<int64_t>() < 0 || it->get<int64_t>() > 255) {
                return MakeError(ErrorCode::InvalidMessage, "Bad sdpMLineIndex");
            }
            mLineIndex = it->get<int>();
        }
        return SignalingPayload{CandidatePayload{candidate.Value(), mLineIndex}};
    }
    if (type == "bye") {
        return SignalingPayload{ByePayload{payload.value("reason", std::string{})}};
    }
    if (type == "media-state") {
        return SignalingPayload{MediaStatePayload{
            payload.value("audio", true),
            payload.value("video", true),
            payload.value("screen", false)}};
    }
    return MakeError(ErrorCode::InvalidMessage, "Unknown signaling type: " + type);
}

} // namespace

const char* TypeName(const SignalingPayload& payload) {
    return std::visit(Overloaded{
        [](const OfferPayload&) { return "offer"; },
        [](const AnswerPayload&) { return "answer"; },
        [](const CandidatePayload&) { return "candidate"; },
        [](const ByePayload&) { return "bye"; },
        [](const MediaStatePayload&) { return "media-state"; },
    }, payload);
}

bool IsSignalingType(const std::string& type) {
    return type == "offer" || type == "answer" || type == "candidate" || type == "bye" || type == "media-state";
}

json ToJson(const SignalingMessage& message) {
    json j = {
        {"type", TypeName(message.payload)},
        {"seq", message.seq},
        {"from", message.from},
        {"payload", PayloadToJson(message.payload)},
    };
    if (message.to) {
        j["to"] = *message.to;
    }
    return j;
}

Result<SignalingMessage> ParseSignalingMessage(const json& j) {
    if (!j.is_object()) {
        return MakeError(ErrorCode::InvalidMessage, "Signaling message is not an object");
    }

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string()) {
        return MakeError(ErrorCode::InvalidMessage, "Signaling message missing type");
    }

    auto seqIt = j.find("seq");
    if (seqIt == j.end() || !seqIt->is_number_unsigned()) {
        return MakeError(ErrorCode::InvalidMessage, "Signaling message missing seq");
    }

    auto fromIt = j.find("from");
    if (fromIt == j.end() || !fromIt->is_string()) {
        return MakeError(ErrorCode::InvalidMessage, "Signaling message missing from");
    }

    SignalingMessage message;
    message.seq = seqIt->get<uint64_t>();
    message.from = fromIt->get<std::string>();

    if (auto toIt = j.find("to"); toIt != j.end() && !toIt->is_null()) {
        if (!toIt->is_string()) {
            return MakeError(ErrorCode::InvalidMessage, "Signaling message has non-string to");
        }
        message.to = toIt->get<std::string>();
    }

    static const json EmptyPayload = json::object();
    auto payloadIt = j.find("payload");
    const json& payload = (payloadIt != j.end() && payloadIt->is_object()) ? *payloadIt : EmptyPayload;

    auto parsed = ParsePayload(typeIt->get<std::string>(), payload);
    if (!parsed) {
        return parsed.GetError();
    }
    message.payload = std::move(parsed.Value());
    return message;
}

Result<SignalingMessage> Deserialize(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return MakeError(ErrorCode::InvalidMessage, std::string("Invalid JSON signaling message: ") + e.what());
    }
    return ParseSignalingMessage(j);
}

} // namespace livecall
