#include "peer_session.hpp"

#include "signaling_channel.hpp"

#include <iostream>

namespace livecall {

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Negotiating: return "Negotiating";
        case SessionState::Connected: return "Connected";
        case SessionState::Renegotiating: return "Renegotiating";
        case SessionState::Failed: return "Failed";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

const char* ToString(ConnectionQuality quality) {
    switch (quality) {
        case ConnectionQuality::Unknown: return "unknown";
        case ConnectionQuality::Good: return "good";
        case ConnectionQuality::Degraded: return "degraded";
        case ConnectionQuality::Lost: return "lost";
    }
    return "unknown";
}

PeerSession::PeerSession(ParticipantId self, RoomId roomId, std::shared_ptr<SignalingChannel> channel,
                         std::shared_ptr<Transport> transport, std::shared_ptr<MediaDevices> devices,
                         PeerSessionOptions options)
    : Self_(std::move(self))
    , RoomId_(std::move(roomId))
    , Options_(options)
    , Channel_(std::move(channel))
    , Transport_(std::move(transport))
    , Devices_(std::move(devices))
    , Loop_(std::make_shared<Loop>())
    , Trace_{SessionState::Idle}
{
    Thread_ = std::thread([loop = Loop_] {
        loop->Run();
    });
}

PeerSession::~PeerSession() {
    Loop_->Stop();
    if (Thread_.joinable()) {
        // The last reference can be dropped by a task running on the loop itself.
        if (Loop_->IsLoopThread()) {
            Thread_.detach();
        } else {
            Thread_.join();
        }
    }

    if (State_.load() != SessionState::Closed) {
        Coordinator_.reset();
        Transport_->Close();
    }
}

void PeerSession::SetCallbacks(SessionCallbacks callbacks) {
    Post([this, callbacks = std::move(callbacks)]() mutable {
        Callbacks_ = std::move(callbacks);
    });
}

void PeerSession::Post(Task&& task) {
    Loop_->EnqueueTask([weak = weak_from_this(), task = std::move(task)] {
        if (auto self = weak.lock()) {
            task();
        }
    });
}

void PeerSession::Start(std::vector<ParticipantId> others, std::function<void(Result<void>)> done) {
    Post([this, others = std::move(others), done = std::move(done)]() mutable {
        DoStart(std::move(others), std::move(done));
    });
}

void PeerSession::DoStart(std::vector<ParticipantId> others, std::function<void(Result<void>)> done) {
    if (State_ != SessionState::Idle || Coordinator_) {
        done(MakeError(ErrorCode::AlreadyJoined, "Session already started"));
        return;
    }

    std::weak_ptr<PeerSession> weak = weak_from_this();

    Coordinator_ = std::make_unique<MediaTrackCoordinator>(Transport_, Devices_, [weak](Task&& task) {
        if (auto self = weak.lock()) {
            self->Post(std::move(task));
        }
    });
    Coordinator_->SetScreenShareEndedCallback([this] {
        // The platform ended the capture; go through the queue like any toggle.
        EnqueueToggle(PendingToggle{
            [this](std::function<void()> finished) {
                Coordinator_->StopScreenShare();
                UpdateMediaSnapshot();
                BroadcastMediaState();
                finished();
            },
            [] {}});
    });

    Transport_->SetCallbacks(TransportCallbacks{
        [weak](const std::string& candidate, int mLineIndex) {
            if (auto self = weak.lock()) {
                self->Post([raw = self.get(), candidate, mLineIndex] {
                    raw->OnLocalCandidate(candidate, mLineIndex);
                });
            }
        },
        [weak](TransportState state) {
            if (auto self = weak.lock()) {
                self->Post([raw = self.get(), state] {
                    raw->OnTransportState(state);
                });
            }
        }});

    Subscription_ = Channel_->Subscribe(Self_);
    Subscription_->SetNotifier([weak] {
        if (auto self = weak.lock()) {
            self->Post([raw = self.get()] {
                raw->DrainSignaling();
            });
        }
    });

    if (!others.empty()) {
        InitiateOnReady_ = true;
        SetPeer(others.front());
    }

    StartDone_ = std::move(done);
    AcquisitionTimer_ = Loop_->EnqueueDelayed(Options_.deviceAcquisitionTimeout, [weak] {
        if (auto self = weak.lock()) {
            self->OnAcquisitionTimeout();
        }
    });

    std::cout << "[Session " << Self_ << "] Acquiring local media" << std::endl;
    Coordinator_->AcquireLocalMedia([this](Result<void> result) {
        OnLocalMediaReady(std::move(result));
    });
}

void PeerSession::OnLocalMediaReady(Result<void> result) {
    if (State_ == SessionState::Closed) {
        return;
    }
    if (AcquisitionTimer_) {
        Loop_->CancelDelayed(*AcquisitionTimer_);
        AcquisitionTimer_.reset();
    }

    if (!result) {
        auto done = std::move(StartDone_);
        StartDone_ = nullptr;
        CloseInternal(result.GetError(), false);
        if (done) {
            done(result.GetError());
        }
        return;
    }

    Coordinator_->PublishLocalTracks();
    Ready_ = true;
    UpdateMediaSnapshot();
    TransitionTo(SessionState::Negotiating);

    if (auto done = std::move(StartDone_)) {
        StartDone_ = nullptr;
        done({});
    }

    if (InitiateOnReady_ && Peer_) {
        SendOffer(false);
    }
    if (BufferedOffer_ && State_ != SessionState::Closed) {
        auto offer = std::move(*BufferedOffer_);
        BufferedOffer_.reset();
        HandleMessage(offer);
    }
    BroadcastMediaState();
    RunNextToggle();
}

void PeerSession::OnAcquisitionTimeout() {
    AcquisitionTimer_.reset();
    if (Ready_ || State_ == SessionState::Closed) {
        return;
    }

    std::cerr << "[Session " << Self_ << "] Timed out waiting for local media" << std::endl;
    Coordinator_->AbandonAcquisition();

    auto error = MakeError(ErrorCode::DeviceUnavailable, "Timed out waiting for camera and microphone");
    auto done = std::move(StartDone_);
    StartDone_ = nullptr;
    CloseInternal(error, false);
    if (done) {
        done(error);
    }
}

void PeerSession::OnRoomEvent(const RoomEvent& event) {
    Post([this, event] {
        HandleRoomEvent(event);
    });
}

void PeerSession::HandleRoomEvent(const RoomEvent& event) {
    if (State_ == SessionState::Closed) {
        return;
    }

    switch (event.type) {
        case RoomEventType::ParticipantJoined:
            if (!Peer_) {
                SetPeer(event.participantId);
                std::cout << "[Session " << Self_ << "] Waiting for an offer from " << event.participantId << std::endl;
            }
            break;
        case RoomEventType::ParticipantLeft:
            if (Peer_ && *Peer_ == event.participantId) {
                CloseInternal(MakeError(ErrorCode::PeerDisconnected, event.participantId + " left the room"), false);
            }
            break;
        case RoomEventType::RoomClosed:
            CloseInternal(MakeError(ErrorCode::PeerDisconnected, "Room " + RoomId_ + " was closed"), false);
            break;
    }
}

void PeerSession::DrainSignaling() {
    while (Subscription_ && State_ != SessionState::Closed) {
        auto message = Subscription_->TryNext();
        if (!message) {
            break;
        }
        HandleMessage(*message);
        if (Subscription_) {
            Subscription_->Acknowledge(message->from, message->seq);
        }
    }
}

void PeerSession::HandleMessage(const SignalingMessage& message) {
    if (State_ == SessionState::Closed) {
        return;
    }
    if (message.to && *message.to != Self_) {
        return;
    }

    if (auto offer = std::get_if<OfferPayload>(&message.payload)) {
        HandleOffer(message, *offer);
    } else if (auto answer = std::get_if<AnswerPayload>(&message.payload)) {
        HandleAnswer(message, *answer);
    } else if (auto candidate = std::get_if<CandidatePayload>(&message.payload)) {
        if (!Peer_ || *Peer_ == message.from) {
            HandleCandidate(*candidate);
        }
    } else if (auto bye = std::get_if<ByePayload>(&message.payload)) {
        HandleBye(message, *bye);
    } else if (auto media = std::get_if<MediaStatePayload>(&message.payload)) {
        std::lock_guard guard(SnapshotMutex_);
        RemoteMedia_ = *media;
    }
}

void PeerSession::HandleOffer(const SignalingMessage& message, const OfferPayload& offer) {
    if (!Ready_) {
        BufferedOffer_ = message;
        return;
    }
    if (Peer_ && *Peer_ != message.from) {
        std::cerr << "[Session " << Self_ << "] Ignoring offer from " << message.from << std::endl;
        return;
    }
    SetPeer(message.from);

    if (HaveLocalOffer_) {
        // Both sides offered; the smaller id yields.
        if (Self_ < message.from) {
            std::cout << "[Session " << Self_ << "] Offer collision with " << message.from << ", yielding" << std::endl;
            Transport_->Rollback();
            HaveLocalOffer_ = false;
            DisarmNegotiationTimer();
            // The rolled back offer carried a track change.
            if (State_ == SessionState::Renegotiating) {
                PendingRenegotiation_ = true;
            }
        } else {
            std::cout << "[Session " << Self_ << "] Offer collision with " << message.from << ", keeping ours" << std::endl;
            return;
        }
    }

    auto state = State_.load();
    if (state == SessionState::Connected) {
        TransitionTo(offer.iceRestart ? SessionState::Negotiating : SessionState::Renegotiating);
    } else if (state == SessionState::Failed || (state == SessionState::Renegotiating && offer.iceRestart)) {
        if (RetryTimer_) {
            Loop_->CancelDelayed(*RetryTimer_);
            RetryTimer_.reset();
        }
        TransitionTo(SessionState::Negotiating);
    }

    auto answer = Transport_->AcceptOffer(offer.sdp, offer.iceRestart);
    if (!answer) {
        Fail(ErrorCode::TransportError, answer.GetError().message);
        return;
    }
    RemoteDescriptionSet_ = true;
    FlushRemoteCandidates();

    if (!SendToPeer(AnswerPayload{answer.Value()})) {
        return;
    }

    if (State_ == SessionState::Renegotiating) {
        TransitionTo(SessionState::Connected);
        if (PendingRenegotiation_) {
            Renegotiate();
        }
    } else if (State_ == SessionState::Negotiating) {
        ArmNegotiationTimer();
    }
}

void PeerSession::HandleAnswer(const SignalingMessage& message, const AnswerPayload& answer) {
    if (!HaveLocalOffer_ || !Peer_ || *Peer_ != message.from) {
        std::cerr << "[Session " << Self_ << "] Dropping unexpected answer from " << message.from << std::endl;
        return;
    }
    HaveLocalOffer_ = false;

    auto applied = Transport_->AcceptAnswer(answer.sdp);
    if (!applied) {
        Fail(ErrorCode::TransportError, applied.GetError().message);
        return;
    }
    RemoteDescriptionSet_ = true;
    FlushRemoteCandidates();

    if (State_ == SessionState::Renegotiating) {
        DisarmNegotiationTimer();
        TransitionTo(SessionState::Connected);
        if (PendingRenegotiation_) {
            Renegotiate();
        }
    }
}

void PeerSession::HandleCandidate(const CandidatePayload& candidate) {
    if (!RemoteDescriptionSet_) {
        PendingRemoteCandidates_.push_back(candidate);
        return;
    }

    auto added = Transport_->AddRemoteCandidate(candidate.candidate, candidate.mLineIndex);
    if (!added) {
        std::cerr << "[Session " << Self_ << "] Bad remote candidate: " << added.GetError().message << std::endl;
    }
}

void PeerSession::FlushRemoteCandidates() {
    auto pending = std::move(PendingRemoteCandidates_);
    PendingRemoteCandidates_.clear();
    for (const auto& candidate : pending) {
        HandleCandidate(candidate);
    }
}

void PeerSession::HandleBye(const SignalingMessage& message, const ByePayload& bye) {
    if (Peer_ && *Peer_ != message.from) {
        return;
    }

    std::string reason = message.from + " ended the call";
    if (!bye.reason.empty()) {
        reason += " (" + bye.reason + ")";
    }
    CloseInternal(MakeError(ErrorCode::PeerDisconnected, reason), false);
}

void PeerSession::OnTransportState(TransportState state) {
    if (State_ == SessionState::Closed) {
        return;
    }

    std::cout << "[Session " << Self_ << "] Transport " << ToString(state) << std::endl;

    switch (state) {
        case TransportState::New:
        case TransportState::Connecting:
            break;
        case TransportState::Connected: {
            {
                std::lock_guard guard(SnapshotMutex_);
                Quality_ = ConnectionQuality::Good;
            }
            if (State_ != SessionState::Negotiating) {
                break;
            }
            DisarmNegotiationTimer();
            Retries_ = 0;
            {
                std::lock_guard guard(SnapshotMutex_);
                if (!ConnectedAt_) {
                    ConnectedAt_ = std::chrono::steady_clock::now();
                }
                RetriesSnapshot_ = 0;
            }
            TransitionTo(SessionState::Connected);
            if (PendingRenegotiation_) {
                Renegotiate();
            }
            break;
        }
        case TransportState::Disconnected: {
            std::lock_guard guard(SnapshotMutex_);
            Quality_ = ConnectionQuality::Degraded;
            break;
        }
        case TransportState::Failed:
        case TransportState::Closed: {
            {
                std::lock_guard guard(SnapshotMutex_);
                Quality_ = ConnectionQuality::Lost;
            }
            auto current = State_.load();
            if (current == SessionState::Negotiating || current == SessionState::Connected ||
                current == SessionState::Renegotiating) {
                Fail(state == TransportState::Failed ? ErrorCode::IceFailure : ErrorCode::TransportError,
                     std::string("Transport ") + ToString(state));
            }
            break;
        }
    }
}

void PeerSession::OnLocalCandidate(const std::string& candidate, int mLineIndex) {
    if (State_ == SessionState::Closed || !Peer_) {
        return;
    }
    auto sent = SendToPeer(CandidatePayload{candidate, mLineIndex});
    (void)sent;
}

void PeerSession::SendOffer(bool iceRestart) {
    auto offer = Transport_->CreateOffer(iceRestart);
    if (!offer) {
        Fail(ErrorCode::TransportError, offer.GetError().message);
        return;
    }

    HaveLocalOffer_ = true;
    if (iceRestart) {
        RemoteDescriptionSet_ = false;
    }
    if (!SendToPeer(OfferPayload{offer.Value(), iceRestart})) {
        return;
    }
    ArmNegotiationTimer();
}

Result<void> PeerSession::SendToPeer(SignalingPayload payload) {
    if (!Peer_) {
        return MakeError(ErrorCode::ChannelClosed, "No remote participant");
    }

    SignalingMessage message{Self_, Peer_, NextSeq_++, std::move(payload)};
    auto sent = Channel_->Send(message);
    if (!sent) {
        std::cerr << "[Session " << Self_ << "] Failed to send " << TypeName(message.payload) << " to " << *Peer_
                  << ": " << sent.GetError().message << std::endl;
        if (sent.GetError().code == ErrorCode::ChannelClosed) {
            CloseInternal(MakeError(ErrorCode::PeerDisconnected, sent.GetError().message), false);
        }
    }
    return sent;
}

void PeerSession::BroadcastMediaState() {
    if (!Peer_ || !Ready_ || State_ == SessionState::Closed) {
        return;
    }

    auto sent = SendToPeer(MediaStatePayload{
        Coordinator_->HasMicrophone() && Coordinator_->MicEnabled(),
        Coordinator_->HasCamera() && Coordinator_->CameraEnabled() && !Coordinator_->IsSharing(),
        Coordinator_->IsSharing()});
    (void)sent;
}

void PeerSession::ArmNegotiationTimer() {
    DisarmNegotiationTimer();
    auto generation = NegotiationGeneration_;
    NegotiationTimer_ = Loop_->EnqueueDelayed(Options_.negotiationTimeout, [weak = weak_from_this(), generation] {
        if (auto self = weak.lock()) {
            self->OnNegotiationTimeout(generation);
        }
    });
}

void PeerSession::DisarmNegotiationTimer() {
    if (NegotiationTimer_) {
        Loop_->CancelDelayed(*NegotiationTimer_);
        NegotiationTimer_.reset();
    }
    ++NegotiationGeneration_;
}

void PeerSession::OnNegotiationTimeout(uint64_t generation) {
    if (generation != NegotiationGeneration_) {
        return;
    }
    NegotiationTimer_.reset();

    auto state = State_.load();
    if (state == SessionState::Negotiating || state == SessionState::Renegotiating) {
        Fail(ErrorCode::NegotiationTimeout,
             "No connection after " + std::to_string(Options_.negotiationTimeout.count()) + "ms");
    }
}

void PeerSession::Fail(ErrorCode code, const std::string& reason) {
    auto state = State_.load();
    if (state == SessionState::Closed || state == SessionState::Failed) {
        return;
    }

    std::cerr << "[Session " << Self_ << "] " << ToString(code) << ": " << reason << std::endl;
    DisarmNegotiationTimer();
    HaveLocalOffer_ = false;
    TransitionTo(SessionState::Failed);

    if (Retries_ >= Options_.maxRetries) {
        CloseInternal(MakeError(ErrorCode::CallFailed, std::string(ToString(code)) + ": " + reason), true);
        return;
    }

    ++Retries_;
    {
        std::lock_guard guard(SnapshotMutex_);
        RetriesSnapshot_ = Retries_;
    }
    RetryTimer_ = Loop_->EnqueueDelayed(Options_.retryBackoff * Retries_, [weak = weak_from_this()] {
        if (auto self = weak.lock()) {
            self->RetryNegotiation();
        }
    });
}

void PeerSession::RetryNegotiation() {
    RetryTimer_.reset();
    if (State_ != SessionState::Failed) {
        return;
    }

    TransitionTo(SessionState::Negotiating);
    if (Peer_) {
        std::cout << "[Session " << Self_ << "] Restarting ICE (attempt " << Retries_ << ")" << std::endl;
        SendOffer(true);
    }
}

void PeerSession::Renegotiate() {
    PendingRenegotiation_ = false;
    if (State_ != SessionState::Connected) {
        PendingRenegotiation_ = true;
        return;
    }
    if (!Peer_) {
        return;
    }

    TransitionTo(SessionState::Renegotiating);
    SendOffer(false);
}

template <typename T>
std::future<Result<T>> PeerSession::Toggle(std::function<void(std::function<void(Result<T>)>)> action) {
    auto promise = std::make_shared<std::promise<Result<T>>>();
    auto future = promise->get_future();
    auto settled = std::make_shared<std::atomic_bool>(false);
    auto settle = [promise, settled](Result<T> result) {
        if (!settled->exchange(true)) {
            promise->set_value(std::move(result));
        }
    };

    Post([this, action = std::move(action), settle] {
        if (State_ == SessionState::Closed) {
            settle(MakeError(ErrorCode::ChannelClosed, "Session is closed"));
            return;
        }
        EnqueueToggle(PendingToggle{
            [action, settle](std::function<void()> finished) {
                action([settle, finished](Result<T> result) {
                    settle(std::move(result));
                    finished();
                });
            },
            [settle] {
                settle(MakeError(ErrorCode::ChannelClosed, "Session is closed"));
            }});
    });
    return future;
}

std::future<Result<bool>> PeerSession::ToggleVideo() {
    return Toggle<bool>([this](std::function<void(Result<bool>)> done) {
        bool enabled = !Coordinator_->CameraEnabled();
        auto applied = Coordinator_->SetCameraEnabled(enabled);
        if (!applied) {
            done(applied.GetError());
            return;
        }
        UpdateMediaSnapshot();
        BroadcastMediaState();
        done(enabled);
    });
}

std::future<Result<bool>> PeerSession::ToggleAudio() {
    return Toggle<bool>([this](std::function<void(Result<bool>)> done) {
        bool enabled = !Coordinator_->MicEnabled();
        auto applied = Coordinator_->SetMicEnabled(enabled);
        if (!applied) {
            done(applied.GetError());
            return;
        }
        UpdateMediaSnapshot();
        BroadcastMediaState();
        done(enabled);
    });
}

std::future<Result<bool>> PeerSession::ToggleScreenShare() {
    return Toggle<bool>([this](std::function<void(Result<bool>)> done) {
        if (Coordinator_->IsSharing()) {
            Coordinator_->StopScreenShare();
            UpdateMediaSnapshot();
            BroadcastMediaState();
            done(false);
            return;
        }

        Coordinator_->StartScreenShare([this, done](Result<ShareOutcome> outcome) {
            if (!outcome) {
                done(outcome.GetError());
                return;
            }
            UpdateMediaSnapshot();
            if (outcome.Value().needsRenegotiation) {
                Renegotiate();
            }
            BroadcastMediaState();
            done(true);
        });
    });
}

std::future<Result<void>> PeerSession::SetCameraEnabled(bool enabled) {
    return Toggle<void>([this, enabled](std::function<void(Result<void>)> done) {
        auto applied = Coordinator_->SetCameraEnabled(enabled);
        if (applied) {
            UpdateMediaSnapshot();
            BroadcastMediaState();
        }
        done(applied);
    });
}

std::future<Result<void>> PeerSession::SetMicEnabled(bool enabled) {
    return Toggle<void>([this, enabled](std::function<void(Result<void>)> done) {
        auto applied = Coordinator_->SetMicEnabled(enabled);
        if (applied) {
            UpdateMediaSnapshot();
            BroadcastMediaState();
        }
        done(applied);
    });
}

std::future<Result<void>> PeerSession::StartScreenShare() {
    return Toggle<void>([this](std::function<void(Result<void>)> done) {
        Coordinator_->StartScreenShare([this, done](Result<ShareOutcome> outcome) {
            if (!outcome) {
                done(outcome.GetError());
                return;
            }
            UpdateMediaSnapshot();
            if (outcome.Value().needsRenegotiation) {
                Renegotiate();
            }
            BroadcastMediaState();
            done({});
        });
    });
}

std::future<Result<void>> PeerSession::StopScreenShare() {
    return Toggle<void>([this](std::function<void(Result<void>)> done) {
        if (Coordinator_->IsSharing()) {
            Coordinator_->StopScreenShare();
            UpdateMediaSnapshot();
            BroadcastMediaState();
        }
        done({});
    });
}

void PeerSession::EnqueueToggle(PendingToggle toggle) {
    if (State_ == SessionState::Closed) {
        toggle.cancel();
        return;
    }
    Toggles_.push_back(std::move(toggle));
    RunNextToggle();
}

void PeerSession::RunNextToggle() {
    if (ToggleRunning_ || !Ready_ || State_ == SessionState::Closed || Toggles_.empty()) {
        return;
    }

    auto toggle = std::move(Toggles_.front());
    Toggles_.pop_front();
    ToggleRunning_ = true;
    RunningCancel_ = toggle.cancel;

    auto token = ++ToggleToken_;
    toggle.run([this, token] {
        if (token != ToggleToken_) {
            return;
        }
        ToggleRunning_ = false;
        RunningCancel_ = nullptr;
        RunNextToggle();
    });
}

std::future<void> PeerSession::Close(bool sendBye) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    if (Loop_->IsLoopThread()) {
        CloseInternal(std::nullopt, sendBye);
        promise->set_value();
        return future;
    }

    Post([this, promise, sendBye] {
        CloseInternal(std::nullopt, sendBye);
        promise->set_value();
    });
    return future;
}

void PeerSession::CloseInternal(std::optional<Error> cause, bool sendBye) {
    if (State_ == SessionState::Closed) {
        return;
    }

    if (cause) {
        std::cout << "[Session " << Self_ << "] Closing: " << cause->message << std::endl;
    } else {
        std::cout << "[Session " << Self_ << "] Closing" << std::endl;
    }

    DisarmNegotiationTimer();
    for (auto* timer : {&AcquisitionTimer_, &RetryTimer_}) {
        if (*timer) {
            Loop_->CancelDelayed(**timer);
            timer->reset();
        }
    }

    if (sendBye) {
        SignalingMessage bye{Self_, std::nullopt, NextSeq_++, ByePayload{cause ? cause->message : "left"}};
        auto sent = Channel_->Send(bye);
        if (!sent) {
            std::cerr << "[Session " << Self_ << "] Bye not delivered: " << sent.GetError().message << std::endl;
        }
    }

    TransitionTo(SessionState::Closed);

    if (Coordinator_) {
        Coordinator_->AbandonAcquisition();
        Coordinator_->ReleaseAll();
    }
    Transport_->Close();
    if (Subscription_) {
        Subscription_->SetNotifier(nullptr);
        Subscription_.reset();
    }
    BufferedOffer_.reset();
    PendingRemoteCandidates_.clear();

    {
        std::lock_guard guard(SnapshotMutex_);
        EndedAt_ = std::chrono::steady_clock::now();
    }
    UpdateMediaSnapshot();

    ++ToggleToken_;
    ToggleRunning_ = false;
    if (auto cancel = std::move(RunningCancel_)) {
        RunningCancel_ = nullptr;
        cancel();
    }
    auto queued = std::move(Toggles_);
    Toggles_.clear();
    for (auto& toggle : queued) {
        toggle.cancel();
    }

    if (auto done = std::move(StartDone_)) {
        StartDone_ = nullptr;
        done(cause ? *cause : MakeError(ErrorCode::ChannelClosed, "Session closed before it was ready"));
    }

    if (!DepartureNotified_) {
        DepartureNotified_ = true;
        if (Callbacks_.onDeparture) {
            Callbacks_.onDeparture();
        }
    }
    if (Callbacks_.onTerminated) {
        Callbacks_.onTerminated(cause);
    }
}

void PeerSession::TransitionTo(SessionState state) {
    auto previous = State_.exchange(state);
    if (previous == state) {
        return;
    }

    {
        std::lock_guard guard(SnapshotMutex_);
        Trace_.push_back(state);
    }
    std::cout << "[Session " << Self_ << "] " << ToString(previous) << " -> " << ToString(state) << std::endl;

    if (Callbacks_.onStateChange) {
        Callbacks_.onStateChange(state);
    }
}

void PeerSession::SetPeer(const ParticipantId& peer) {
    Peer_ = peer;
    std::lock_guard guard(SnapshotMutex_);
    PeerSnapshot_ = peer;
}

void PeerSession::UpdateMediaSnapshot() {
    MediaSnapshot snapshot;
    if (Coordinator_) {
        snapshot.tracks = Coordinator_->Tracks();
        snapshot.enabledVideoTracks = Coordinator_->EnabledVideoTrackCount();
        snapshot.cameraEnabled = Coordinator_->HasCamera() && Coordinator_->CameraEnabled();
        snapshot.micEnabled = Coordinator_->HasMicrophone() && Coordinator_->MicEnabled();
        snapshot.sharing = Coordinator_->IsSharing();
    }

    std::lock_guard guard(SnapshotMutex_);
    Media_ = std::move(snapshot);
}

std::vector<SessionState> PeerSession::Trace() const {
    std::lock_guard guard(SnapshotMutex_);
    return Trace_;
}

MediaSnapshot PeerSession::Media() const {
    std::lock_guard guard(SnapshotMutex_);
    return Media_;
}

std::optional<MediaStatePayload> PeerSession::RemoteMediaState() const {
    std::lock_guard guard(SnapshotMutex_);
    return RemoteMedia_;
}

ConnectionQuality PeerSession::Quality() const {
    std::lock_guard guard(SnapshotMutex_);
    return Quality_;
}

std::optional<ParticipantId> PeerSession::RemotePeer() const {
    std::lock_guard guard(SnapshotMutex_);
    return PeerSnapshot_;
}

std::chrono::milliseconds PeerSession::CallDuration() const {
    std::lock_guard guard(SnapshotMutex_);
    if (!ConnectedAt_) {
        return std::chrono::milliseconds{0};
    }
    auto end = EndedAt_ ? *EndedAt_ : std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - *ConnectedAt_);
}

int PeerSession::RetriesUsed() const {
    std::lock_guard guard(SnapshotMutex_);
    return RetriesSnapshot_;
}

} // namespace livecall
