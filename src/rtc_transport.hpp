#pragma once

#include "ice_config.hpp"
#include "transport.hpp"

#include <rtc/rtc.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace livecall {

rtc::Configuration MakeRtcConfiguration(const std::vector<IceServer>& iceServers);

// Transport over a libdatachannel PeerConnection. libdatachannel has no
// in-place ICE restart, so a restart rebuilds the connection and re-adds
// every sender under its old mid.
class RtcTransport : public Transport {
public:
    RtcTransport(ParticipantId self, const std::vector<IceServer>& iceServers);
    ~RtcTransport() override;

    void SetCallbacks(TransportCallbacks callbacks) override;

    Result<std::string> CreateOffer(bool iceRestart) override;
    Result<std::string> AcceptOffer(const std::string& sdp, bool iceRestart) override;
    Result<void> AcceptAnswer(const std::string& sdp) override;
    void Rollback() override;
    Result<void> AddRemoteCandidate(const std::string& candidate, int mLineIndex) override;

    SlotId AddSender(TrackKind kind) override;
    void ReplaceSource(SlotId slot, std::shared_ptr<MediaSource> source) override;

    void Close() override;

private:
    struct Sender {
        TrackKind kind;
        std::string mid;
        std::shared_ptr<rtc::Track> track;
        std::shared_ptr<MediaSource> source;
    };

    void CreatePeerConnection();
    void AttachTrack(Sender& sender);
    static void Feed(Sender& sender);
    Result<std::string> LocalSdp();

    const ParticipantId Self_;
    const rtc::Configuration Config_;

    std::mutex Mutex_;
    std::shared_ptr<rtc::PeerConnection> Pc_;
    std::vector<Sender> Senders_;
    bool Closed_ = false;

    // libdatachannel threads only ever take this one.
    std::mutex CallbacksMutex_;
    TransportCallbacks Callbacks_;
};

TransportFactory MakeRtcTransportFactory();

} // namespace livecall
