#pragma once

#include "errors.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace livecall {

enum class TrackKind {
    Audio,
    Video,
};

enum class TrackSource {
    Camera,
    Microphone,
    Screen,
};

const char* ToString(TrackKind kind);
const char* ToString(TrackSource source);

struct Track {
    TrackKind kind;
    TrackSource source;
    bool enabled = true;
};

// A local capture source. Implemented by the platform's capture layer.
class MediaSource {
public:
    using Frame = std::vector<std::byte>;
    using FrameSink = std::function<void(const Frame&)>;
    using EndedCallback = std::function<void()>;

    virtual ~MediaSource() = default;

    virtual TrackKind Kind() const = 0;
    virtual TrackSource Source() const = 0;

    virtual void SetEnabled(bool enabled) = 0;
    virtual bool IsEnabled() const = 0;

    // Frames go to the sink while the source is enabled; null detaches.
    virtual void SetFrameSink(FrameSink sink) = 0;

    // Fired when capture ends outside our control (e.g. the system
    // "stop sharing" button).
    virtual void OnEnded(EndedCallback callback) = 0;

    virtual void Stop() = 0;
    virtual bool IsStopped() const = 0;
};

// Acquisition may prompt the user; callbacks can arrive on any thread, at
// any time, or never.
class MediaDevices {
public:
    using AcquireCallback = std::function<void(Result<std::shared_ptr<MediaSource>>)>;

    virtual ~MediaDevices() = default;

    virtual void AcquireCamera(AcquireCallback callback) = 0;
    virtual void AcquireMicrophone(AcquireCallback callback) = 0;
    virtual void AcquireScreen(AcquireCallback callback) = 0;
};

} // namespace livecall
