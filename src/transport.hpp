#pragma once

#include "errors.hpp"
#include "fwd.hpp"
#include "ice_config.hpp"
#include "media.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace livecall {

enum class TransportState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed,
};

const char* ToString(TransportState state);

using SlotId = size_t;

struct TransportCallbacks {
    std::function<void(const std::string& candidate, int mLineIndex)> onLocalCandidate;
    std::function<void(TransportState state)> onStateChange;
};

// The peer connection underneath a PeerSession. Callbacks may fire on any
// thread, including synchronously from inside a call.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void SetCallbacks(TransportCallbacks callbacks) = 0;

    virtual Result<std::string> CreateOffer(bool iceRestart) = 0;
    virtual Result<std::string> AcceptOffer(const std::string& sdp, bool iceRestart) = 0;
    virtual Result<void> AcceptAnswer(const std::string& sdp) = 0;

    // Discards a local offer that lost a glare tie-break.
    virtual void Rollback() = 0;

    virtual Result<void> AddRemoteCandidate(const std::string& candidate, int mLineIndex) = 0;

    // A new sender slot changes the negotiated media; replacing the source
    // of an existing slot does not.
    virtual SlotId AddSender(TrackKind kind) = 0;
    virtual void ReplaceSource(SlotId slot, std::shared_ptr<MediaSource> source) = 0;

    virtual void Close() = 0;
};

using TransportFactory = std::function<std::shared_ptr<Transport>(const ParticipantId& self,
                                                                  const std::vector<IceServer>& iceServers)>;

} // namespace livecall
