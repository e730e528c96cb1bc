#pragma once

#include "errors.hpp"
#include "fwd.hpp"
#include "ice_config.hpp"

#include <functional>
#include <string>
#include <vector>

namespace livecall {

struct AdmissionGrant {
    RoomId roomId;
    ParticipantId participantId;
    std::vector<IceServer> iceServers;
};

using AdmissionCallback = std::function<void(Result<AdmissionGrant>)>;

// Client of the scheduling collaborator's POST /sessions/{id}/join.
class AdmissionService {
public:
    virtual ~AdmissionService() = default;
    virtual void RequestJoin(const std::string& sessionId, const ParticipantId& participantId,
                             AdmissionCallback callback) = 0;
};

std::string AdmissionPath(const std::string& sessionId);

// Any non-2xx status is AdmissionDenied.
Result<AdmissionGrant> ParseAdmissionResponse(int httpStatus, const std::string& body);

} // namespace livecall
