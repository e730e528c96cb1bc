#include "media.hpp"
#include "transport.hpp"

namespace livecall {

const char* ToString(TrackKind kind) {
    switch (kind) {
        case TrackKind::Audio: return "audio";
        case TrackKind::Video: return "video";
    }
    return "unknown";
}

const char* ToString(TrackSource source) {
    switch (source) {
        case TrackSource::Camera: return "camera";
        case TrackSource::Microphone: return "microphone";
        case TrackSource::Screen: return "screen";
    }
    return "unknown";
}

const char* ToString(TransportState state) {
    switch (state) {
        case TransportState::New: return "New";
        case TransportState::Connecting: return "Connecting";
        case TransportState::Connected: return "Connected";
        case TransportState::Disconnected: return "Disconnected";
        case TransportState::Failed: return "Failed";
        case TransportState::Closed: return "Closed";
    }
    return "Unknown";
}

} // namespace livecall
