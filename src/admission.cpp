#include "admission.hpp"

#include <nlohmann/json.hpp>

namespace livecall {

namespace {

using json = nlohmann::json;

} // namespace

std::string AdmissionPath(const std::string& sessionId) {
    return "/sessions/" + sessionId + "/join";
}

Result<AdmissionGrant> ParseAdmissionResponse(int httpStatus, const std::string& body) {
    if (httpStatus < 200 || httpStatus >= 300) {
        return MakeError(ErrorCode::AdmissionDenied, "Admission rejected with HTTP " + std::to_string(httpStatus));
    }

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return MakeError(ErrorCode::AdmissionDenied, std::string("Malformed admission response: ") + e.what());
    }

    auto roomIt = j.find("roomId");
    auto participantIt = j.find("participantId");
    if (roomIt == j.end() || participantIt == j.end()) {
        return MakeError(ErrorCode::AdmissionDenied, "Admission response missing roomId or participantId");
    }

    AdmissionGrant grant;
    // Scheduling hands out numeric ids for some session kinds.
    grant.roomId = roomIt->is_string() ? roomIt->get<std::string>() : roomIt->dump();
    grant.participantId = participantIt->is_string() ? participantIt->get<std::string>() : participantIt->dump();

    if (auto it = j.find("iceServers"); it != j.end()) {
        auto servers = ParseIceServerList(*it);
        if (!servers) {
            return MakeError(ErrorCode::AdmissionDenied, servers.GetError().message);
        }
        grant.iceServers = std::move(servers.Value());
    }
    return grant;
}

} // namespace livecall
