#include "media_track_coordinator.hpp"

#include <iostream>

namespace livecall {

namespace {

// Wraps an acquisition callback so the result comes back through the
// poster, or is stopped right away if the coordinator is already gone.
template <typename Handler>
MediaDevices::AcquireCallback Marshal(std::weak_ptr<bool> alive, MediaTrackCoordinator::Poster poster, Handler handler) {
    return [alive, poster = std::move(poster), handler = std::move(handler)](Result<std::shared_ptr<MediaSource>> result) {
        if (alive.expired()) {
            if (result) {
                result.Value()->Stop();
            }
            return;
        }
        poster([alive, handler, result = std::move(result)]() mutable {
            if (alive.expired()) {
                if (result) {
                    result.Value()->Stop();
                }
                return;
            }
            handler(std::move(result));
        });
    };
}

} // namespace

MediaTrackCoordinator::MediaTrackCoordinator(std::shared_ptr<Transport> transport, std::shared_ptr<MediaDevices> devices,
                                             Poster poster)
    : Transport_(std::move(transport))
    , Devices_(std::move(devices))
    , Poster_(std::move(poster))
    , Alive_(std::make_shared<bool>(true))
{ }

MediaTrackCoordinator::~MediaTrackCoordinator() {
    ReleaseAll();
}

void MediaTrackCoordinator::AcquireLocalMedia(std::function<void(Result<void>)> done) {
    AcquireDone_ = std::move(done);
    AcquisitionAbandoned_ = false;
    PendingAcquisitions_ = 2;

    Devices_->AcquireMicrophone(Marshal(Alive_, Poster_, [this](Result<std::shared_ptr<MediaSource>> result) {
        OnLocalSource(TrackSource::Microphone, std::move(result));
    }));
    Devices_->AcquireCamera(Marshal(Alive_, Poster_, [this](Result<std::shared_ptr<MediaSource>> result) {
        OnLocalSource(TrackSource::Camera, std::move(result));
    }));
}

void MediaTrackCoordinator::AbandonAcquisition() {
    AcquisitionAbandoned_ = true;
    AcquireDone_ = nullptr;
}

void MediaTrackCoordinator::OnLocalSource(TrackSource source, Result<std::shared_ptr<MediaSource>> result) {
    if (Released_ || AcquisitionAbandoned_) {
        if (result) {
            std::cout << "[Media] Releasing late " << ToString(source) << std::endl;
            result.Value()->Stop();
        }
        return;
    }

    if (result) {
        auto& slot = source == TrackSource::Microphone ? Microphone_ : Camera_;
        slot = std::move(result.Value());
        slot->SetEnabled(source == TrackSource::Microphone ? MicEnabled_ : CameraEnabled_);
    } else {
        std::cerr << "[Media] No " << ToString(source) << ": " << result.GetError().message << std::endl;
    }

    if (--PendingAcquisitions_ > 0 || !AcquireDone_) {
        return;
    }

    auto done = std::move(AcquireDone_);
    AcquireDone_ = nullptr;
    if (!Camera_ && !Microphone_) {
        done(MakeError(ErrorCode::DeviceUnavailable, "No camera or microphone available"));
    } else {
        done({});
    }
}

void MediaTrackCoordinator::PublishLocalTracks() {
    if (Microphone_ && !AudioSlot_) {
        AudioSlot_ = Transport_->AddSender(TrackKind::Audio);
        Transport_->ReplaceSource(*AudioSlot_, Microphone_);
    }
    if (Camera_ && !VideoSlot_) {
        VideoSlot_ = Transport_->AddSender(TrackKind::Video);
        Transport_->ReplaceSource(*VideoSlot_, Camera_);
    }
}

Result<void> MediaTrackCoordinator::SetCameraEnabled(bool enabled) {
    if (!Camera_) {
        return MakeError(ErrorCode::DeviceUnavailable, "No camera available");
    }

    CameraEnabled_ = enabled;
    // While sharing the camera stays paused; the flag is applied on stop.
    if (!Screen_) {
        Camera_->SetEnabled(enabled);
    }
    return {};
}

Result<void> MediaTrackCoordinator::SetMicEnabled(bool enabled) {
    if (!Microphone_) {
        return MakeError(ErrorCode::DeviceUnavailable, "No microphone available");
    }

    MicEnabled_ = enabled;
    Microphone_->SetEnabled(enabled);
    return {};
}

void MediaTrackCoordinator::StartScreenShare(std::function<void(Result<ShareOutcome>)> done) {
    if (Released_) {
        done(MakeError(ErrorCode::ChannelClosed, "Session is closed"));
        return;
    }
    if (Screen_ || CapturePending_) {
        done(MakeError(ErrorCode::AlreadySharing, "A screen share is already active"));
        return;
    }

    CapturePending_ = true;
    ShareDone_ = std::move(done);
    Devices_->AcquireScreen(Marshal(Alive_, Poster_, [this](Result<std::shared_ptr<MediaSource>> result) {
        OnScreenCaptured(std::move(result));
    }));
}

void MediaTrackCoordinator::OnScreenCaptured(Result<std::shared_ptr<MediaSource>> result) {
    CapturePending_ = false;
    auto done = std::move(ShareDone_);
    ShareDone_ = nullptr;

    if (Released_) {
        if (result) {
            result.Value()->Stop();
        }
        return;
    }
    if (!result) {
        if (done) {
            done(result.GetError());
        }
        return;
    }

    Screen_ = std::move(result.Value());
    Screen_->SetEnabled(true);

    ShareOutcome outcome;
    if (!VideoSlot_) {
        VideoSlot_ = Transport_->AddSender(TrackKind::Video);
        outcome.needsRenegotiation = true;
    }

    // Pause before the swap so the slot never carries two enabled sources.
    if (Camera_) {
        Camera_->SetEnabled(false);
    }
    Transport_->ReplaceSource(*VideoSlot_, Screen_);

    std::weak_ptr<bool> alive = Alive_;
    std::weak_ptr<MediaSource> weakScreen = Screen_;
    Screen_->OnEnded([this, alive, weakScreen, poster = Poster_] {
        if (alive.expired()) {
            return;
        }
        poster([this, alive, weakScreen] {
            if (alive.expired() || !Screen_ || Screen_ != weakScreen.lock()) {
                return;
            }
            std::cout << "[Media] Screen capture ended by the platform" << std::endl;
            if (ScreenShareEnded_) {
                ScreenShareEnded_();
            } else {
                StopScreenShare();
            }
        });
    });

    if (done) {
        done(outcome);
    }
}

void MediaTrackCoordinator::StopScreenShare() {
    if (!Screen_) {
        return;
    }

    auto screen = std::move(Screen_);
    Screen_.reset();

    RestoreCamera();
    screen->SetFrameSink(nullptr);
    screen->Stop();

    if (Camera_) {
        Camera_->SetEnabled(CameraEnabled_);
    }
}

void MediaTrackCoordinator::RestoreCamera() {
    if (VideoSlot_) {
        Transport_->ReplaceSource(*VideoSlot_, Camera_);
    }
}

void MediaTrackCoordinator::ReleaseAll() {
    if (Released_) {
        return;
    }
    Released_ = true;
    AcquireDone_ = nullptr;
    ShareDone_ = nullptr;
    ScreenShareEnded_ = nullptr;

    for (auto* source : {&Screen_, &Camera_, &Microphone_}) {
        if (*source) {
            (*source)->SetFrameSink(nullptr);
            (*source)->Stop();
            source->reset();
        }
    }
    AudioSlot_.reset();
    VideoSlot_.reset();
}

std::vector<Track> MediaTrackCoordinator::Tracks() const {
    std::vector<Track> tracks;
    if (Microphone_) {
        tracks.push_back(Track{TrackKind::Audio, TrackSource::Microphone, MicEnabled_});
    }
    if (Screen_) {
        tracks.push_back(Track{TrackKind::Video, TrackSource::Screen, Screen_->IsEnabled()});
    } else if (Camera_) {
        tracks.push_back(Track{TrackKind::Video, TrackSource::Camera, CameraEnabled_});
    }
    return tracks;
}

size_t MediaTrackCoordinator::EnabledVideoTrackCount() const {
    size_t count = 0;
    if (Camera_ && Camera_->IsEnabled()) {
        ++count;
    }
    if (Screen_ && Screen_->IsEnabled()) {
        ++count;
    }
    return count;
}

} // namespace livecall
