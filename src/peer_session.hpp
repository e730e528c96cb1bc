#pragma once

#include "errors.hpp"
#include "fwd.hpp"
#include "loop.hpp"
#include "media.hpp"
#include "media_track_coordinator.hpp"
#include "room_registry.hpp"
#include "signaling_message.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace livecall {

enum class SessionState {
    Idle,
    Negotiating,
    Connected,
    Renegotiating,
    Failed,
    Closed,
};

enum class ConnectionQuality {
    Unknown,
    Good,
    Degraded,
    Lost,
};

const char* ToString(SessionState state);
const char* ToString(ConnectionQuality quality);

struct PeerSessionOptions {
    std::chrono::milliseconds negotiationTimeout{10000};
    std::chrono::milliseconds retryBackoff{1000};
    int maxRetries = 1;
    std::chrono::milliseconds deviceAcquisitionTimeout{30000};
};

struct SessionCallbacks {
    std::function<void(SessionState state)> onStateChange;
    // Fired once when the session reaches Closed; empty for a local end.
    std::function<void(const std::optional<Error>& cause)> onTerminated;
    // Fired exactly once, before onTerminated.
    std::function<void()> onDeparture;
};

struct MediaSnapshot {
    std::vector<Track> tracks;
    size_t enabledVideoTracks = 0;
    bool cameraEnabled = false;
    bool micEnabled = false;
    bool sharing = false;
};

// One participant's connection to a room. All state lives on the session's
// own loop thread; public methods only post work to it.
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
    PeerSession(ParticipantId self, RoomId roomId, std::shared_ptr<SignalingChannel> channel,
                std::shared_ptr<Transport> transport, std::shared_ptr<MediaDevices> devices,
                PeerSessionOptions options = {});
    ~PeerSession();

    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    void SetCallbacks(SessionCallbacks callbacks);

    // `others` are the members already in the room; if there are any this
    // side sends the first offer.
    void Start(std::vector<ParticipantId> others, std::function<void(Result<void>)> done);

    void OnRoomEvent(const RoomEvent& event);

    std::future<Result<bool>> ToggleVideo();
    std::future<Result<bool>> ToggleAudio();
    std::future<Result<bool>> ToggleScreenShare();
    std::future<Result<void>> SetCameraEnabled(bool enabled);
    std::future<Result<void>> SetMicEnabled(bool enabled);
    std::future<Result<void>> StartScreenShare();
    std::future<Result<void>> StopScreenShare();

    // Idempotent. With sendBye the peer is told the call is over.
    std::future<void> Close(bool sendBye = true);

    SessionState State() const {
        return State_.load();
    }

    std::vector<SessionState> Trace() const;
    MediaSnapshot Media() const;
    std::optional<MediaStatePayload> RemoteMediaState() const;
    ConnectionQuality Quality() const;
    std::optional<ParticipantId> RemotePeer() const;
    // Time since the first connection, frozen once closed.
    std::chrono::milliseconds CallDuration() const;
    int RetriesUsed() const;

    const ParticipantId& GetParticipantId() const {
        return Self_;
    }

    const RoomId& GetRoomId() const {
        return RoomId_;
    }

private:
    struct PendingToggle {
        std::function<void(std::function<void()> finished)> run;
        std::function<void()> cancel;
    };

    void Post(Task&& task);

    void DoStart(std::vector<ParticipantId> others, std::function<void(Result<void>)> done);
    void OnLocalMediaReady(Result<void> result);
    void OnAcquisitionTimeout();

    void DrainSignaling();
    void HandleMessage(const SignalingMessage& message);
    void HandleOffer(const SignalingMessage& message, const OfferPayload& offer);
    void HandleAnswer(const SignalingMessage& message, const AnswerPayload& answer);
    void HandleCandidate(const CandidatePayload& candidate);
    void HandleBye(const SignalingMessage& message, const ByePayload& bye);
    void HandleRoomEvent(const RoomEvent& event);

    void OnTransportState(TransportState state);
    void OnLocalCandidate(const std::string& candidate, int mLineIndex);

    void SendOffer(bool iceRestart);
    Result<void> SendToPeer(SignalingPayload payload);
    void BroadcastMediaState();
    void FlushRemoteCandidates();

    void ArmNegotiationTimer();
    void DisarmNegotiationTimer();
    void OnNegotiationTimeout(uint64_t generation);

    void Fail(ErrorCode code, const std::string& reason);
    void RetryNegotiation();
    void Renegotiate();

    void EnqueueToggle(PendingToggle toggle);
    void RunNextToggle();
    void CloseInternal(std::optional<Error> cause, bool sendBye);

    void TransitionTo(SessionState state);
    void SetPeer(const ParticipantId& peer);
    void UpdateMediaSnapshot();

    template <typename T>
    std::future<Result<T>> Toggle(std::function<void(std::function<void(Result<T>)>)> action);

    const ParticipantId Self_;
    const RoomId RoomId_;
    const PeerSessionOptions Options_;
    std::shared_ptr<SignalingChannel> Channel_;
    std::shared_ptr<Transport> Transport_;
    std::shared_ptr<MediaDevices> Devices_;

    std::shared_ptr<Loop> Loop_;
    std::thread Thread_;

    // Loop thread only.
    SessionCallbacks Callbacks_;
    std::unique_ptr<MediaTrackCoordinator> Coordinator_;
    std::shared_ptr<SignalingSubscription> Subscription_;
    std::optional<ParticipantId> Peer_;
    bool Ready_ = false;
    bool InitiateOnReady_ = false;
    bool HaveLocalOffer_ = false;
    bool RemoteDescriptionSet_ = false;
    bool PendingRenegotiation_ = false;
    bool DepartureNotified_ = false;
    uint64_t NextSeq_ = 1;
    int Retries_ = 0;
    std::optional<SignalingMessage> BufferedOffer_;
    std::vector<CandidatePayload> PendingRemoteCandidates_;
    std::function<void(Result<void>)> StartDone_;
    std::optional<TimerId> AcquisitionTimer_;
    std::optional<TimerId> NegotiationTimer_;
    std::optional<TimerId> RetryTimer_;
    uint64_t NegotiationGeneration_ = 0;
    std::deque<PendingToggle> Toggles_;
    bool ToggleRunning_ = false;
    uint64_t ToggleToken_ = 0;
    std::function<void()> RunningCancel_;

    std::atomic<SessionState> State_{SessionState::Idle};

    mutable std::mutex SnapshotMutex_;
    std::vector<SessionState> Trace_;
    MediaSnapshot Media_;
    std::optional<MediaStatePayload> RemoteMedia_;
    ConnectionQuality Quality_ = ConnectionQuality::Unknown;
    std::optional<ParticipantId> PeerSnapshot_;
    std::optional<std::chrono::steady_clock::time_point> ConnectedAt_;
    std::optional<std::chrono::steady_clock::time_point> EndedAt_;
    int RetriesSnapshot_ = 0;
};

} // namespace livecall
