#pragma once

#include "errors.hpp"
#include "fwd.hpp"
#include "loop.hpp"
#include "media.hpp"
#include "transport.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace livecall {

struct ShareOutcome {
    // True when there was no video slot to replace into and one was added.
    bool needsRenegotiation = false;
};

// Owns the local capture sources of one PeerSession and decides which of
// them feeds each transport sender slot. Not thread-safe: every call, and
// every completion, runs on the owning session's loop.
class MediaTrackCoordinator {
public:
    using Poster = std::function<void(Task&&)>;

    MediaTrackCoordinator(std::shared_ptr<Transport> transport, std::shared_ptr<MediaDevices> devices, Poster poster);
    ~MediaTrackCoordinator();

    MediaTrackCoordinator(const MediaTrackCoordinator&) = delete;
    MediaTrackCoordinator& operator=(const MediaTrackCoordinator&) = delete;

    // Acquires microphone and camera. Fails only if neither is available.
    void AcquireLocalMedia(std::function<void(Result<void>)> done);
    // Late acquisitions are stopped as soon as they arrive.
    void AbandonAcquisition();

    // Adds one sender slot per acquired device.
    void PublishLocalTracks();

    Result<void> SetCameraEnabled(bool enabled);
    Result<void> SetMicEnabled(bool enabled);

    void StartScreenShare(std::function<void(Result<ShareOutcome>)> done);
    void StopScreenShare();

    // Invoked when a capture ends on its own (platform "stop sharing").
    void SetScreenShareEndedCallback(std::function<void()> callback) {
        ScreenShareEnded_ = std::move(callback);
    }

    void ReleaseAll();

    bool HasCamera() const {
        return static_cast<bool>(Camera_);
    }

    bool HasMicrophone() const {
        return static_cast<bool>(Microphone_);
    }

    bool CameraEnabled() const {
        return CameraEnabled_;
    }

    bool MicEnabled() const {
        return MicEnabled_;
    }

    bool IsSharing() const {
        return static_cast<bool>(Screen_);
    }

    std::vector<Track> Tracks() const;
    size_t EnabledVideoTrackCount() const;

private:
    void OnLocalSource(TrackSource source, Result<std::shared_ptr<MediaSource>> result);
    void OnScreenCaptured(Result<std::shared_ptr<MediaSource>> result);
    void RestoreCamera();

    std::shared_ptr<Transport> Transport_;
    std::shared_ptr<MediaDevices> Devices_;
    Poster Poster_;
    std::shared_ptr<bool> Alive_;

    std::shared_ptr<MediaSource> Camera_;
    std::shared_ptr<MediaSource> Microphone_;
    std::shared_ptr<MediaSource> Screen_;

    std::optional<SlotId> AudioSlot_;
    std::optional<SlotId> VideoSlot_;

    bool CameraEnabled_ = true;
    bool MicEnabled_ = true;

    int PendingAcquisitions_ = 0;
    bool AcquisitionAbandoned_ = false;
    std::function<void(Result<void>)> AcquireDone_;

    bool CapturePending_ = false;
    std::function<void(Result<ShareOutcome>)> ShareDone_;
    std::function<void()> ScreenShareEnded_;

    bool Released_ = false;
};

} // namespace livecall
