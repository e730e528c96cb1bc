#pragma once

#include "admission.hpp"
#include "errors.hpp"
#include "fwd.hpp"
#include "ice_config.hpp"
#include "media.hpp"
#include "peer_session.hpp"
#include "room_registry.hpp"
#include "transport.hpp"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace livecall {

struct JoinRequest {
    RoomId roomId;
    ParticipantId participantId;
    ParticipantRole role = ParticipantRole::Student;
    // When set, admission goes through the scheduling service first and the
    // room it names wins over roomId.
    std::optional<std::string> scheduledSessionId;
};

struct JoinInfo {
    SessionHandle handle = 0;
    RoomId roomId;
    std::vector<Participant> roster;
};

struct PendingJoin {
    SessionHandle handle = 0;
    std::future<Result<JoinInfo>> completion;
};

struct OrchestratorDependencies {
    std::shared_ptr<RoomRegistry> registry;
    std::shared_ptr<IceConfigProvider> iceConfig;
    std::shared_ptr<MediaDevices> devices;
    TransportFactory transportFactory;
    // Optional.
    std::shared_ptr<AdmissionService> admission;
    PeerSessionOptions sessionOptions;
};

using CallEndedCallback = std::function<void(SessionHandle handle, const std::optional<Error>& cause)>;

// Entry point for the client layer. Must be owned by a shared_ptr.
class CallOrchestrator : public std::enable_shared_from_this<CallOrchestrator> {
public:
    explicit CallOrchestrator(OrchestratorDependencies deps);
    ~CallOrchestrator();

    CallOrchestrator(const CallOrchestrator&) = delete;
    CallOrchestrator& operator=(const CallOrchestrator&) = delete;

    PendingJoin Join(JoinRequest request);

    // Departs without telling the peer.
    void Leave(SessionHandle handle);
    // Sends Bye, then tears the session down. Unknown or ended handles are ignored.
    void EndCall(SessionHandle handle);

    std::future<Result<bool>> ToggleVideo(SessionHandle handle);
    std::future<Result<bool>> ToggleAudio(SessionHandle handle);
    std::future<Result<bool>> ToggleScreenShare(SessionHandle handle);

    // Fired on the session's thread whenever a call ends, locally or not.
    void SetCallEndedCallback(CallEndedCallback callback);

    std::shared_ptr<PeerSession> GetSession(SessionHandle handle) const;
    Result<SessionState> GetSessionState(SessionHandle handle) const;
    size_t ActiveCallCount() const;

private:
    struct Call {
        SessionHandle handle = 0;
        JoinRequest request;
        RoomId roomId;
        std::shared_ptr<PeerSession> session;
        std::optional<ListenerId> listener;
        bool cancelled = false;
        bool settled = false;
        std::promise<Result<JoinInfo>> completion;
    };

    void OnAdmissionGranted(const std::shared_ptr<Call>& call, Result<AdmissionGrant> grant);
    void AdmitToRoom(const std::shared_ptr<Call>& call, std::vector<IceServer> grantedServers);
    void StartSession(const std::shared_ptr<Call>& call, Admission admission, std::vector<IceServer> iceServers);
    void OnSessionStarted(const std::shared_ptr<Call>& call, Result<void> result, JoinInfo info);
    void OnSessionTerminated(SessionHandle handle, const std::shared_ptr<Call>& call,
                             const std::optional<Error>& cause);

    bool IsCancelled(const std::shared_ptr<Call>& call) const;
    void FailJoin(const std::shared_ptr<Call>& call, Error error);
    void Settle(const std::shared_ptr<Call>& call, Result<JoinInfo> result);
    void Depart(SessionHandle handle, bool sendBye);

    std::shared_ptr<Call> FindCall(SessionHandle handle) const;
    std::future<Result<bool>> Toggle(SessionHandle handle,
                                     std::future<Result<bool>> (PeerSession::*toggle)());

    OrchestratorDependencies Deps_;

    mutable std::mutex Mutex_;
    std::unordered_map<SessionHandle, std::shared_ptr<Call>> Calls_;
    SessionHandle NextHandle_ = 1;
    CallEndedCallback CallEnded_;
};

} // namespace livecall
