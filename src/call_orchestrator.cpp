#include "call_orchestrator.hpp"

#include <iostream>

namespace livecall {

namespace {

std::future<Result<bool>> Resolved(Result<bool> result) {
    std::promise<Result<bool>> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace

CallOrchestrator::CallOrchestrator(OrchestratorDependencies deps)
    : Deps_(std::move(deps))
{ }

CallOrchestrator::~CallOrchestrator() {
    std::vector<SessionHandle> handles;
    {
        std::lock_guard guard(Mutex_);
        for (const auto& [handle, call] : Calls_) {
            handles.push_back(handle);
        }
    }
    for (auto handle : handles) {
        Depart(handle, true);
    }
}

PendingJoin CallOrchestrator::Join(JoinRequest request) {
    auto call = std::make_shared<Call>();
    call->request = std::move(request);
    call->roomId = call->request.roomId;

    PendingJoin pending;
    pending.completion = call->completion.get_future();
    {
        std::lock_guard guard(Mutex_);
        call->handle = NextHandle_++;
        Calls_.emplace(call->handle, call);
    }
    pending.handle = call->handle;

    const auto& participantId = call->request.participantId;
    if (participantId.empty()) {
        FailJoin(call, MakeError(ErrorCode::InvalidMessage, "Participant id is empty"));
        return pending;
    }

    std::cout << "[Call " << call->handle << "] " << ToString(call->request.role) << " " << participantId
              << " joining room " << call->roomId << std::endl;

    const auto& sessionId = call->request.scheduledSessionId;
    if (sessionId && Deps_.admission) {
        std::weak_ptr<CallOrchestrator> weak = weak_from_this();
        Deps_.admission->RequestJoin(*sessionId, participantId, [weak, call](Result<AdmissionGrant> grant) {
            if (auto self = weak.lock()) {
                self->OnAdmissionGranted(call, std::move(grant));
            }
        });
    } else {
        AdmitToRoom(call, {});
    }
    return pending;
}

void CallOrchestrator::OnAdmissionGranted(const std::shared_ptr<Call>& call, Result<AdmissionGrant> grant) {
    if (IsCancelled(call)) {
        return;
    }
    if (!grant) {
        FailJoin(call, grant.GetError());
        return;
    }

    auto& granted = grant.Value();
    if (!granted.roomId.empty()) {
        call->roomId = granted.roomId;
    }
    AdmitToRoom(call, std::move(granted.iceServers));
}

void CallOrchestrator::AdmitToRoom(const std::shared_ptr<Call>& call, std::vector<IceServer> grantedServers) {
    if (IsCancelled(call)) {
        return;
    }

    const auto& participantId = call->request.participantId;
    auto admitted = Deps_.registry->Admit(call->roomId, Participant{participantId, call->request.role});
    if (!admitted) {
        FailJoin(call, admitted.GetError());
        return;
    }
    if (IsCancelled(call)) {
        std::cout << "[Call " << call->handle << "] Cancelled after admission" << std::endl;
        Deps_.registry->Remove(call->roomId, participantId);
        return;
    }

    if (!grantedServers.empty()) {
        StartSession(call, std::move(admitted.Value()), std::move(grantedServers));
        return;
    }

    std::weak_ptr<CallOrchestrator> weak = weak_from_this();
    Deps_.iceConfig->Fetch([weak, call, admission = std::move(admitted.Value())](std::vector<IceServer> servers) {
        if (auto self = weak.lock()) {
            self->StartSession(call, admission, std::move(servers));
        }
    });
}

void CallOrchestrator::StartSession(const std::shared_ptr<Call>& call, Admission admission,
                                    std::vector<IceServer> iceServers) {
    const auto roomId = call->roomId;
    const auto participantId = call->request.participantId;

    if (IsCancelled(call)) {
        std::cout << "[Call " << call->handle << "] Cancelled while fetching ICE servers" << std::endl;
        Deps_.registry->Remove(roomId, participantId);
        return;
    }

    auto transport = Deps_.transportFactory(participantId, iceServers);
    if (!transport) {
        Deps_.registry->Remove(roomId, participantId);
        FailJoin(call, MakeError(ErrorCode::TransportError, "Could not create a peer connection"));
        return;
    }

    auto session = std::make_shared<PeerSession>(participantId, roomId, admission.channel, transport, Deps_.devices,
                                                 Deps_.sessionOptions);

    std::weak_ptr<CallOrchestrator> weak = weak_from_this();
    std::weak_ptr<Call> weakCall = call;
    std::weak_ptr<RoomRegistry> registry = Deps_.registry;
    auto handle = call->handle;

    session->SetCallbacks(SessionCallbacks{
        nullptr,
        [weak, weakCall, handle](const std::optional<Error>& cause) {
            if (auto self = weak.lock()) {
                self->OnSessionTerminated(handle, weakCall.lock(), cause);
            }
        },
        [registry, roomId, participantId] {
            if (auto r = registry.lock()) {
                r->Remove(roomId, participantId);
            }
        }});

    std::weak_ptr<PeerSession> weakSession = session;
    auto listener = Deps_.registry->Subscribe(roomId, participantId, [weakSession](const RoomEvent& event) {
        if (auto s = weakSession.lock()) {
            s->OnRoomEvent(event);
        }
    });
    Deps_.registry->AttachSession(roomId, participantId, session);

    bool cancelled;
    {
        std::lock_guard guard(Mutex_);
        cancelled = call->cancelled;
        if (!cancelled) {
            call->session = session;
            call->listener = listener;
        }
    }
    if (cancelled) {
        // The session now owns the roster entry; closing it removes it.
        Deps_.registry->Unsubscribe(listener);
        session->Close(false).wait();
        return;
    }

    std::vector<ParticipantId> others;
    for (const auto& participant : admission.roster) {
        if (participant.id != participantId) {
            others.push_back(participant.id);
        }
    }

    JoinInfo info{handle, roomId, std::move(admission.roster)};
    session->Start(std::move(others), [weak, weakCall, info = std::move(info)](Result<void> result) {
        auto self = weak.lock();
        auto call = weakCall.lock();
        if (self && call) {
            self->OnSessionStarted(call, std::move(result), info);
        }
    });
}

void CallOrchestrator::OnSessionStarted(const std::shared_ptr<Call>& call, Result<void> result, JoinInfo info) {
    if (!result) {
        // The session closed itself; OnSessionTerminated cleans up.
        Settle(call, result.GetError());
        return;
    }

    std::cout << "[Call " << call->handle << "] " << call->request.participantId << " is in room " << call->roomId
              << std::endl;
    Settle(call, std::move(info));
}

void CallOrchestrator::OnSessionTerminated(SessionHandle handle, const std::shared_ptr<Call>& call,
                                           const std::optional<Error>& cause) {
    std::optional<ListenerId> listener;
    CallEndedCallback callback;
    {
        std::lock_guard guard(Mutex_);
        auto it = Calls_.find(handle);
        if (it != Calls_.end() && it->second == call) {
            Calls_.erase(it);
        }
        if (call) {
            listener = call->listener;
            call->listener.reset();
        }
        callback = CallEnded_;
    }

    if (listener) {
        Deps_.registry->Unsubscribe(*listener);
    }
    if (call) {
        Settle(call, cause ? *cause : MakeError(ErrorCode::CallFailed, "Call ended before it was established"));
    }

    if (cause) {
        std::cout << "[Call " << handle << "] Ended: " << ToString(cause->code) << " " << cause->message << std::endl;
    } else {
        std::cout << "[Call " << handle << "] Ended" << std::endl;
    }
    if (callback) {
        callback(handle, cause);
    }
}

void CallOrchestrator::Leave(SessionHandle handle) {
    Depart(handle, false);
}

void CallOrchestrator::EndCall(SessionHandle handle) {
    Depart(handle, true);
}

void CallOrchestrator::Depart(SessionHandle handle, bool sendBye) {
    std::shared_ptr<Call> call;
    std::shared_ptr<PeerSession> session;
    std::optional<ListenerId> listener;
    {
        std::lock_guard guard(Mutex_);
        auto it = Calls_.find(handle);
        if (it == Calls_.end()) {
            return;
        }
        call = it->second;
        Calls_.erase(it);
        call->cancelled = true;
        session = call->session;
        listener = call->listener;
        call->listener.reset();
    }

    Settle(call, MakeError(ErrorCode::ChannelClosed, "Join cancelled"));
    if (listener) {
        Deps_.registry->Unsubscribe(*listener);
    }
    // Without a session yet, the join step in flight sees the flag and undoes the admission.
    if (session) {
        session->Close(sendBye).wait();
    }
}

std::future<Result<bool>> CallOrchestrator::Toggle(SessionHandle handle,
                                                   std::future<Result<bool>> (PeerSession::*toggle)()) {
    auto session = GetSession(handle);
    if (!session) {
        return Resolved(MakeError(ErrorCode::InvalidHandle, "No active call " + std::to_string(handle)));
    }
    return ((*session).*toggle)();
}

std::future<Result<bool>> CallOrchestrator::ToggleVideo(SessionHandle handle) {
    return Toggle(handle, &PeerSession::ToggleVideo);
}

std::future<Result<bool>> CallOrchestrator::ToggleAudio(SessionHandle handle) {
    return Toggle(handle, &PeerSession::ToggleAudio);
}

std::future<Result<bool>> CallOrchestrator::ToggleScreenShare(SessionHandle handle) {
    return Toggle(handle, &PeerSession::ToggleScreenShare);
}

void CallOrchestrator::SetCallEndedCallback(CallEndedCallback callback) {
    std::lock_guard guard(Mutex_);
    CallEnded_ = std::move(callback);
}

std::shared_ptr<PeerSession> CallOrchestrator::GetSession(SessionHandle handle) const {
    auto call = FindCall(handle);
    if (!call) {
        return nullptr;
    }
    std::lock_guard guard(Mutex_);
    return call->session;
}

Result<SessionState> CallOrchestrator::GetSessionState(SessionHandle handle) const {
    auto call = FindCall(handle);
    if (!call) {
        return MakeError(ErrorCode::InvalidHandle, "No active call " + std::to_string(handle));
    }
    std::lock_guard guard(Mutex_);
    return call->session ? call->session->State() : SessionState::Idle;
}

size_t CallOrchestrator::ActiveCallCount() const {
    std::lock_guard guard(Mutex_);
    return Calls_.size();
}

std::shared_ptr<CallOrchestrator::Call> CallOrchestrator::FindCall(SessionHandle handle) const {
    std::lock_guard guard(Mutex_);
    auto it = Calls_.find(handle);
    return it != Calls_.end() ? it->second : nullptr;
}

bool CallOrchestrator::IsCancelled(const std::shared_ptr<Call>& call) const {
    std::lock_guard guard(Mutex_);
    return call->cancelled;
}

void CallOrchestrator::FailJoin(const std::shared_ptr<Call>& call, Error error) {
    std::cerr << "[Call " << call->handle << "] Join failed: " << ToString(error.code) << " " << error.message
              << std::endl;
    {
        std::lock_guard guard(Mutex_);
        auto it = Calls_.find(call->handle);
        if (it != Calls_.end() && it->second == call) {
            Calls_.erase(it);
        }
    }
    Settle(call, std::move(error));
}

void CallOrchestrator::Settle(const std::shared_ptr<Call>& call, Result<JoinInfo> result) {
    {
        std::lock_guard guard(Mutex_);
        if (call->settled) {
            return;
        }
        call->settled = true;
    }
    call->completion.set_value(std::move(result));
}

} // namespace livecall
