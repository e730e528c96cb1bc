#pragma once

#include "admission.hpp"
#include "errors.hpp"
#include "ice_config.hpp"
#include "media.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace livecall::testing {

using namespace std::chrono_literals;

template <typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

class FakeMediaSource : public MediaSource {
public:
    FakeMediaSource(TrackKind kind, TrackSource source)
        : Kind_(kind)
        , Source_(source)
    { }

    TrackKind Kind() const override {
        return Kind_;
    }

    TrackSource Source() const override {
        return Source_;
    }

    void SetEnabled(bool enabled) override {
        Enabled_ = enabled;
    }

    bool IsEnabled() const override {
        return Enabled_;
    }

    void SetFrameSink(FrameSink sink) override {
        std::lock_guard guard(Mutex_);
        Sink_ = std::move(sink);
    }

    void OnEnded(EndedCallback callback) override {
        std::lock_guard guard(Mutex_);
        Ended_ = std::move(callback);
    }

    void Stop() override {
        Stopped_ = true;
        Enabled_ = false;
    }

    bool IsStopped() const override {
        return Stopped_;
    }

    // The platform ends the capture (system "stop sharing" button).
    void EndCapture() {
        EndedCallback ended;
        {
            std::lock_guard guard(Mutex_);
            ended = Ended_;
        }
        if (ended) {
            ended();
        }
    }

private:
    const TrackKind Kind_;
    const TrackSource Source_;
    std::atomic_bool Enabled_{true};
    std::atomic_bool Stopped_{false};
    std::mutex Mutex_;
    FrameSink Sink_;
    EndedCallback Ended_;
};

enum class DeviceMode {
    Grant,
    Deny,
    Hold,
};

class FakeMediaDevices : public MediaDevices {
public:
    std::atomic<DeviceMode> camera{DeviceMode::Grant};
    std::atomic<DeviceMode> microphone{DeviceMode::Grant};
    std::atomic<DeviceMode> screen{DeviceMode::Grant};

    void AcquireCamera(AcquireCallback callback) override {
        Acquire(TrackKind::Video, TrackSource::Camera, camera, ErrorCode::DeviceUnavailable, std::move(callback));
    }

    void AcquireMicrophone(AcquireCallback callback) override {
        Acquire(TrackKind::Audio, TrackSource::Microphone, microphone, ErrorCode::DeviceUnavailable,
                std::move(callback));
    }

    void AcquireScreen(AcquireCallback callback) override {
        Acquire(TrackKind::Video, TrackSource::Screen, screen, ErrorCode::UserCancelledCapture, std::move(callback));
    }

    // Completes every held acquisition with a fresh source.
    void GrantHeld() {
        std::vector<std::pair<std::shared_ptr<FakeMediaSource>, AcquireCallback>> held;
        {
            std::lock_guard guard(Mutex_);
            held.swap(Held_);
        }
        for (auto& [source, callback] : held) {
            callback(std::shared_ptr<MediaSource>(source));
        }
    }

    size_t HeldCount() const {
        std::lock_guard guard(Mutex_);
        return Held_.size();
    }

    std::vector<std::shared_ptr<FakeMediaSource>> Sources() const {
        std::lock_guard guard(Mutex_);
        return Sources_;
    }

    std::shared_ptr<FakeMediaSource> Last(TrackSource source) const {
        std::lock_guard guard(Mutex_);
        for (auto it = Sources_.rbegin(); it != Sources_.rend(); ++it) {
            if ((*it)->Source() == source) {
                return *it;
            }
        }
        return nullptr;
    }

private:
    void Acquire(TrackKind kind, TrackSource source, DeviceMode mode, ErrorCode denial, AcquireCallback callback) {
        if (mode == DeviceMode::Deny) {
            callback(MakeError(denial, std::string(ToString(source)) + " denied"));
            return;
        }

        auto created = std::make_shared<FakeMediaSource>(kind, source);
        {
            std::lock_guard guard(Mutex_);
            Sources_.push_back(created);
            if (mode == DeviceMode::Hold) {
                Held_.emplace_back(created, std::move(callback));
                return;
            }
        }
        callback(std::shared_ptr<MediaSource>(created));
    }

    mutable std::mutex Mutex_;
    std::vector<std::shared_ptr<FakeMediaSource>> Sources_;
    std::vector<std::pair<std::shared_ptr<FakeMediaSource>, AcquireCallback>> Held_;
};

class FakeTransport;

// Lets FakeTransports that exchanged an offer and an answer "connect".
class FakeNetwork {
public:
    std::atomic_bool connectivity{true};

    void Register(const ParticipantId& id, std::weak_ptr<FakeTransport> transport) {
        std::lock_guard guard(Mutex_);
        Transports_[id] = std::move(transport);
    }

    void Connect(const ParticipantId& a, const ParticipantId& b);

private:
    std::mutex Mutex_;
    std::map<ParticipantId, std::weak_ptr<FakeTransport>> Transports_;
};

// SDP strings look like "offer:<owner>:<n>" and "answer:<owner>:<n>".
class FakeTransport : public Transport {
public:
    struct Slot {
        TrackKind kind;
        std::shared_ptr<MediaSource> source;
    };

    FakeTransport(ParticipantId self, std::shared_ptr<FakeNetwork> network)
        : Self_(std::move(self))
        , Network_(std::move(network))
    { }

    void SetCallbacks(TransportCallbacks callbacks) override {
        std::lock_guard guard(Mutex_);
        Callbacks_ = std::move(callbacks);
    }

    Result<std::string> CreateOffer(bool iceRestart) override {
        std::string sdp;
        {
            std::lock_guard guard(Mutex_);
            if (Closed_) {
                return MakeError(ErrorCode::TransportError, "closed");
            }
            ++Offers_;
            if (iceRestart) {
                ++Restarts_;
            }
            sdp = "offer:" + Self_ + ":" + std::to_string(++Counter_);
            LocalOffer_ = sdp;
        }
        EmitCandidate();
        return sdp;
    }

    Result<std::string> AcceptOffer(const std::string& sdp, bool iceRestart) override {
        std::string answer;
        {
            std::lock_guard guard(Mutex_);
            if (Closed_) {
                return MakeError(ErrorCode::TransportError, "closed");
            }
            if (sdp.rfind("offer:", 0) != 0) {
                return MakeError(ErrorCode::TransportError, "not an offer: " + sdp);
            }
            if (iceRestart) {
                ++Restarts_;
            }
            LocalOffer_.reset();
            answer = "answer:" + Self_ + ":" + std::to_string(++Counter_);
            ++Answers_;
        }
        EmitCandidate();
        return answer;
    }

    Result<void> AcceptAnswer(const std::string& sdp) override {
        {
            std::lock_guard guard(Mutex_);
            if (Closed_ || !LocalOffer_) {
                return MakeError(ErrorCode::TransportError, "no local offer");
            }
            LocalOffer_.reset();
        }
        auto first = sdp.find(':');
        auto last = sdp.rfind(':');
        if (first == std::string::npos || last <= first) {
            return MakeError(ErrorCode::TransportError, "bad answer: " + sdp);
        }
        Network_->Connect(Self_, sdp.substr(first + 1, last - first - 1));
        return {};
    }

    void Rollback() override {
        std::lock_guard guard(Mutex_);
        LocalOffer_.reset();
        ++Rollbacks_;
    }

    Result<void> AddRemoteCandidate(const std::string& candidate, int) override {
        std::lock_guard guard(Mutex_);
        RemoteCandidates_.push_back(candidate);
        return {};
    }

    SlotId AddSender(TrackKind kind) override {
        std::lock_guard guard(Mutex_);
        Slots_.push_back(Slot{kind, nullptr});
        return Slots_.size() - 1;
    }

    void ReplaceSource(SlotId slot, std::shared_ptr<MediaSource> source) override {
        std::lock_guard guard(Mutex_);
        Slots_.at(slot).source = std::move(source);
        ++Replacements_;
    }

    void Close() override {
        std::lock_guard guard(Mutex_);
        Closed_ = true;
    }

    void EmitState(TransportState state) {
        TransportCallbacks callbacks;
        {
            std::lock_guard guard(Mutex_);
            if (Closed_) {
                return;
            }
            callbacks = Callbacks_;
        }
        if (callbacks.onStateChange) {
            callbacks.onStateChange(state);
        }
    }

    std::vector<Slot> Slots() const {
        std::lock_guard guard(Mutex_);
        return Slots_;
    }

    std::vector<std::string> RemoteCandidates() const {
        std::lock_guard guard(Mutex_);
        return RemoteCandidates_;
    }

    int Offers() const {
        std::lock_guard guard(Mutex_);
        return Offers_;
    }

    int Answers() const {
        std::lock_guard guard(Mutex_);
        return Answers_;
    }

    int Restarts() const {
        std::lock_guard guard(Mutex_);
        return Restarts_;
    }

    int Rollbacks() const {
        std::lock_guard guard(Mutex_);
        return Rollbacks_;
    }

    int Replacements() const {
        std::lock_guard guard(Mutex_);
        return Replacements_;
    }

    bool IsClosed() const {
        std::lock_guard guard(Mutex_);
        return Closed_;
    }

private:
    void EmitCandidate() {
        TransportCallbacks callbacks;
        std::string candidate;
        {
            std::lock_guard guard(Mutex_);
            callbacks = Callbacks_;
            candidate = "candidate:" + Self_ + " " + std::to_string(Counter_);
        }
        if (callbacks.onLocalCandidate) {
            callbacks.onLocalCandidate(candidate, 0);
        }
    }

    const ParticipantId Self_;
    std::shared_ptr<FakeNetwork> Network_;

    mutable std::mutex Mutex_;
    TransportCallbacks Callbacks_;
    std::optional<std::string> LocalOffer_;
    std::vector<Slot> Slots_;
    std::vector<std::string> RemoteCandidates_;
    int Counter_ = 0;
    int Offers_ = 0;
    int Answers_ = 0;
    int Restarts_ = 0;
    int Rollbacks_ = 0;
    int Replacements_ = 0;
    bool Closed_ = false;
};

inline void FakeNetwork::Connect(const ParticipantId& a, const ParticipantId& b) {
    if (!connectivity) {
        return;
    }

    std::shared_ptr<FakeTransport> first;
    std::shared_ptr<FakeTransport> second;
    {
        std::lock_guard guard(Mutex_);
        if (auto it = Transports_.find(a); it != Transports_.end()) {
            first = it->second.lock();
        }
        if (auto it = Transports_.find(b); it != Transports_.end()) {
            second = it->second.lock();
        }
    }
    if (first && second) {
        first->EmitState(TransportState::Connected);
        second->EmitState(TransportState::Connected);
    }
}

// Hands out FakeTransports and remembers them by participant.
class FakeTransportFactory {
public:
    explicit FakeTransportFactory(std::shared_ptr<FakeNetwork> network = std::make_shared<FakeNetwork>())
        : Network_(std::move(network))
    { }

    std::shared_ptr<FakeTransport> Create(const ParticipantId& self) {
        auto transport = std::make_shared<FakeTransport>(self, Network_);
        Network_->Register(self, transport);
        std::lock_guard guard(Mutex_);
        Created_[self] = transport;
        return transport;
    }

    TransportFactory AsFactory() {
        return [this](const ParticipantId& self, const std::vector<IceServer>& iceServers) {
            {
                std::lock_guard guard(Mutex_);
                LastIceServers_ = iceServers;
            }
            return std::static_pointer_cast<Transport>(Create(self));
        };
    }

    std::shared_ptr<FakeTransport> Get(const ParticipantId& self) const {
        std::lock_guard guard(Mutex_);
        auto it = Created_.find(self);
        return it != Created_.end() ? it->second : nullptr;
    }

    std::vector<IceServer> LastIceServers() const {
        std::lock_guard guard(Mutex_);
        return LastIceServers_;
    }

    const std::shared_ptr<FakeNetwork>& Network() const {
        return Network_;
    }

private:
    std::shared_ptr<FakeNetwork> Network_;
    mutable std::mutex Mutex_;
    std::map<ParticipantId, std::shared_ptr<FakeTransport>> Created_;
    std::vector<IceServer> LastIceServers_;
};

// An ICE source that can fail, or hold its callbacks until released.
class ScriptedIceConfigSource : public IceConfigSource {
public:
    std::atomic_bool fail{false};
    std::atomic_bool hold{false};
    std::vector<IceServer> servers;

    void FetchIceServers(IceServersCallback callback) override {
        if (hold) {
            std::lock_guard guard(Mutex_);
            Held_.push_back(std::move(callback));
            return;
        }
        if (fail) {
            callback(MakeError(ErrorCode::TransportError, "config endpoint unreachable"));
            return;
        }
        callback(servers);
    }

    void ReleaseHeld() {
        std::vector<IceServersCallback> held;
        {
            std::lock_guard guard(Mutex_);
            held.swap(Held_);
        }
        for (auto& callback : held) {
            callback(servers);
        }
    }

    size_t HeldCount() {
        std::lock_guard guard(Mutex_);
        return Held_.size();
    }

private:
    std::mutex Mutex_;
    std::vector<IceServersCallback> Held_;
};

class FakeAdmissionService : public AdmissionService {
public:
    std::optional<Error> denial;
    RoomId grantedRoom;
    std::vector<IceServer> grantedServers;

    void RequestJoin(const std::string& sessionId, const ParticipantId& participantId,
                     AdmissionCallback callback) override {
        requests.push_back(sessionId);
        if (denial) {
            callback(*denial);
            return;
        }
        callback(AdmissionGrant{grantedRoom, participantId, grantedServers});
    }

    std::vector<std::string> requests;
};

} // namespace livecall::testing
