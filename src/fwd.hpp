#pragma once

#include <cstdint>
#include <string>

namespace livecall {

using RoomId = std::string;
using ParticipantId = std::string;
using SessionHandle = uint64_t;

class Loop;
class SignalingChannel;
class SignalingSubscription;
class RoomRegistry;
class PeerSession;
class MediaTrackCoordinator;
class CallOrchestrator;
class IceConfigProvider;
class Transport;
class MediaSource;
class MediaDevices;

} // namespace livecall
