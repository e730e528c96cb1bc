#include "rtc_transport.hpp"

#include <iostream>
#include <variant>

namespace livecall {

namespace {

constexpr int kH264PayloadType = 96;
constexpr int kOpusPayloadType = 111;

template <typename Description>
std::string MidAt(const Description& description, int index) {
    if (index < 0 || index >= description.mediaCount()) {
        return {};
    }
    return std::visit([](auto* entry) { return entry->mid(); }, description.media(index));
}

template <typename Description>
int IndexOf(const Description& description, const std::string& mid) {
    for (int i = 0; i < description.mediaCount(); ++i) {
        if (MidAt(description, i) == mid) {
            return i;
        }
    }
    return 0;
}

TransportState FromRtc(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return TransportState::New;
        case rtc::PeerConnection::State::Connecting: return TransportState::Connecting;
        case rtc::PeerConnection::State::Connected: return TransportState::Connected;
        case rtc::PeerConnection::State::Disconnected: return TransportState::Disconnected;
        case rtc::PeerConnection::State::Failed: return TransportState::Failed;
        case rtc::PeerConnection::State::Closed: return TransportState::Closed;
    }
    return TransportState::Failed;
}

} // namespace

rtc::Configuration MakeRtcConfiguration(const std::vector<IceServer>& iceServers) {
    rtc::Configuration config;
    config.disableAutoNegotiation = true;

    for (const auto& server : iceServers) {
        for (const auto& url : server.urls) {
            try {
                rtc::IceServer entry(url);
                if (server.username) {
                    entry.username = *server.username;
                }
                if (server.credential) {
                    entry.password = *server.credential;
                }
                config.iceServers.push_back(std::move(entry));
            } catch (const std::exception& e) {
                std::cerr << "[IceConfig] Skipping " << url << ": " << e.what() << std::endl;
            }
        }
    }
    return config;
}

RtcTransport::RtcTransport(ParticipantId self, const std::vector<IceServer>& iceServers)
    : Self_(std::move(self))
    , Config_(MakeRtcConfiguration(iceServers))
{
    std::lock_guard guard(Mutex_);
    CreatePeerConnection();
}

RtcTransport::~RtcTransport() {
    Close();
}

// Caller holds Mutex_.
void RtcTransport::CreatePeerConnection() {
    if (Pc_) {
        Pc_->resetCallbacks();
        Pc_->close();
    }

    std::cout << "[Transport " << Self_ << "] Creating PeerConnection" << std::endl;
    Pc_ = std::make_shared<rtc::PeerConnection>(Config_);

    std::weak_ptr<rtc::PeerConnection> weakPc = Pc_;
    Pc_->onLocalCandidate([this, weakPc](rtc::Candidate candidate) {
        auto pc = weakPc.lock();
        if (!pc) {
            return;
        }

        int index = 0;
        if (auto local = pc->localDescription()) {
            index = IndexOf(*local, candidate.mid());
        }

        TransportCallbacks callbacks;
        {
            std::lock_guard guard(CallbacksMutex_);
            callbacks = Callbacks_;
        }
        if (callbacks.onLocalCandidate) {
            callbacks.onLocalCandidate(candidate.candidate(), index);
        }
    });

    Pc_->onStateChange([this](rtc::PeerConnection::State state) {
        TransportCallbacks callbacks;
        {
            std::lock_guard guard(CallbacksMutex_);
            callbacks = Callbacks_;
        }
        if (callbacks.onStateChange) {
            callbacks.onStateChange(FromRtc(state));
        }
    });

    Pc_->onTrack([this](std::shared_ptr<rtc::Track> track) {
        std::cout << "[Transport " << Self_ << "] Remote track " << track->mid() << std::endl;
    });

    for (auto& sender : Senders_) {
        AttachTrack(sender);
    }
}

// Caller holds Mutex_.
void RtcTransport::AttachTrack(Sender& sender) {
    if (sender.kind == TrackKind::Video) {
        rtc::Description::Video media(sender.mid, rtc::Description::Direction::SendRecv);
        media.addH264Codec(kH264PayloadType);
        sender.track = Pc_->addTrack(media);
    } else {
        rtc::Description::Audio media(sender.mid, rtc::Description::Direction::SendRecv);
        media.addOpusCodec(kOpusPayloadType);
        sender.track = Pc_->addTrack(media);
    }
    Feed(sender);
}

void RtcTransport::Feed(Sender& sender) {
    if (!sender.source) {
        return;
    }

    std::weak_ptr<rtc::Track> weakTrack = sender.track;
    sender.source->SetFrameSink([weakTrack](const MediaSource::Frame& frame) {
        auto track = weakTrack.lock();
        if (!track || !track->isOpen()) {
            return;
        }
        try {
            track->send(frame.data(), frame.size());
        } catch (const std::exception& e) {
            std::cerr << "[Transport] Dropping frame on " << track->mid() << ": " << e.what() << std::endl;
        }
    });
}

void RtcTransport::SetCallbacks(TransportCallbacks callbacks) {
    std::lock_guard guard(CallbacksMutex_);
    Callbacks_ = std::move(callbacks);
}

// Caller holds Mutex_.
Result<std::string> RtcTransport::LocalSdp() {
    auto description = Pc_->localDescription();
    if (!description) {
        return MakeError(ErrorCode::TransportError, "No local description");
    }
    return std::string(*description);
}

Result<std::string> RtcTransport::CreateOffer(bool iceRestart) {
    std::lock_guard guard(Mutex_);
    if (Closed_) {
        return MakeError(ErrorCode::TransportError, "Transport is closed");
    }

    try {
        if (iceRestart) {
            CreatePeerConnection();
        }
        Pc_->setLocalDescription(rtc::Description::Type::Offer);
        return LocalSdp();
    } catch (const std::exception& e) {
        return MakeError(ErrorCode::TransportError, e.what());
    }
}

Result<std::string> RtcTransport::AcceptOffer(const std::string& sdp, bool iceRestart) {
    std::lock_guard guard(Mutex_);
    if (Closed_) {
        return MakeError(ErrorCode::TransportError, "Transport is closed");
    }

    try {
        if (iceRestart) {
            CreatePeerConnection();
        }
        Pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Offer));
        Pc_->setLocalDescription(rtc::Description::Type::Answer);
        return LocalSdp();
    } catch (const std::exception& e) {
        return MakeError(ErrorCode::TransportError, e.what());
    }
}

Result<void> RtcTransport::AcceptAnswer(const std::string& sdp) {
    std::lock_guard guard(Mutex_);
    if (Closed_) {
        return MakeError(ErrorCode::TransportError, "Transport is closed");
    }

    try {
        Pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Answer));
        return {};
    } catch (const std::exception& e) {
        return MakeError(ErrorCode::TransportError, e.what());
    }
}

void RtcTransport::Rollback() {
    std::lock_guard guard(Mutex_);
    if (Closed_) {
        return;
    }

    try {
        Pc_->setLocalDescription(rtc::Description::Type::Rollback);
    } catch (const std::exception& e) {
        std::cerr << "[Transport " << Self_ << "] Rollback failed: " << e.what() << std::endl;
    }
}

Result<void> RtcTransport::AddRemoteCandidate(const std::string& candidate, int mLineIndex) {
    std::lock_guard guard(Mutex_);
    if (Closed_) {
        return MakeError(ErrorCode::TransportError, "Transport is closed");
    }
    if (candidate.empty()) {
        return {};
    }

    try {
        std::string mid;
        if (auto remote = Pc_->remoteDescription()) {
            mid = MidAt(*remote, mLineIndex);
        }
        Pc_->addRemoteCandidate(rtc::Candidate(candidate, mid));
        return {};
    } catch (const std::exception& e) {
        return MakeError(ErrorCode::TransportError, e.what());
    }
}

SlotId RtcTransport::AddSender(TrackKind kind) {
    std::lock_guard guard(Mutex_);

    size_t sameKind = 0;
    for (const auto& sender : Senders_) {
        if (sender.kind == kind) {
            ++sameKind;
        }
    }

    Sender sender;
    sender.kind = kind;
    sender.mid = kind == TrackKind::Video ? "video" : "audio";
    if (sameKind > 0) {
        sender.mid += "-" + std::to_string(sameKind);
    }

    if (!Closed_) {
        try {
            AttachTrack(sender);
        } catch (const std::exception& e) {
            std::cerr << "[Transport " << Self_ << "] Could not add " << sender.mid << ": " << e.what() << std::endl;
        }
    }

    Senders_.push_back(std::move(sender));
    return Senders_.size() - 1;
}

void RtcTransport::ReplaceSource(SlotId slot, std::shared_ptr<MediaSource> source) {
    std::lock_guard guard(Mutex_);
    if (slot >= Senders_.size()) {
        return;
    }

    auto& sender = Senders_[slot];
    if (sender.source && sender.source != source) {
        sender.source->SetFrameSink(nullptr);
    }
    sender.source = std::move(source);
    if (sender.track) {
        Feed(sender);
    }
}

void RtcTransport::Close() {
    std::shared_ptr<rtc::PeerConnection> pc;
    {
        std::lock_guard guard(Mutex_);
        if (Closed_) {
            return;
        }
        Closed_ = true;

        for (auto& sender : Senders_) {
            if (sender.source) {
                sender.source->SetFrameSink(nullptr);
            }
        }
        pc = std::move(Pc_);
    }
    {
        std::lock_guard guard(CallbacksMutex_);
        Callbacks_ = {};
    }

    if (pc) {
        pc->resetCallbacks();
        try {
            pc->close();
        } catch (const std::exception& e) {
            std::cerr << "[Transport " << Self_ << "] Close failed: " << e.what() << std::endl;
        }
    }
}

TransportFactory MakeRtcTransportFactory() {
    return [](const ParticipantId& self, const std::vector<IceServer>& iceServers) -> std::shared_ptr<Transport> {
        try {
            return std::make_shared<RtcTransport>(self, iceServers);
        } catch (const std::exception& e) {
            std::cerr << "[Transport " << self << "] " << e.what() << std::endl;
            return nullptr;
        }
    };
}

} // namespace livecall
