#pragma once

#include "config.hpp"
#include "fwd.hpp"
#include "ice_config.hpp"
#include "loop.hpp"
#include "room_registry.hpp"

#include <nlohmann/json.hpp>
#include <rtc/rtc.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace livecall {

using ClientId = uint64_t;
using ClientSender = std::function<void(const std::string& text)>;

// Relays the room registry and signaling channels to WebSocket clients.
// All client and seat bookkeeping happens on one loop thread.
class SignalingServer {
public:
    // iceServers are handed to every client in its "joined" reply.
    SignalingServer(std::shared_ptr<RoomRegistry> registry, ServerConfig config,
                    std::vector<IceServer> iceServers = {});
    ~SignalingServer();

    // Starts the loop, listens, and blocks until Stop().
    void Run();

    void Start();
    void Listen();
    void Stop();

    // Connection plumbing; the WebSocket server drives these.
    ClientId Connect(ClientSender sender);
    void Receive(ClientId clientId, std::string text);
    void Disconnect(ClientId clientId);

private:
    struct Seat {
        RoomId roomId;
        ParticipantId participantId;
        std::shared_ptr<SignalingChannel> channel;
        std::shared_ptr<SignalingSubscription> subscription;
        ListenerId listener = 0;
        std::optional<ClientId> client;
        std::optional<TimerId> eviction;
    };

    struct Client {
        ClientId id;
        ClientSender sender;
        std::shared_ptr<Seat> seat;
    };

    using SeatKey = std::pair<RoomId, ParticipantId>;

    void OnMessage(const std::shared_ptr<Client>& client, const std::string& text);
    void HandleJoin(const std::shared_ptr<Client>& client, const nlohmann::json& message);
    void HandleResume(const std::shared_ptr<Client>& client, const nlohmann::json& message);
    void HandleAck(const std::shared_ptr<Client>& client, const nlohmann::json& message);
    void HandleSignaling(const std::shared_ptr<Client>& client, const nlohmann::json& message);
    void OnRoomEvent(const std::weak_ptr<Seat>& weakSeat, const RoomEvent& event);

    void Attach(const std::shared_ptr<Client>& client, const std::shared_ptr<Seat>& seat);
    void Drain(Seat& seat);
    void Evict(const std::shared_ptr<Seat>& seat);

    void Send(const Client& client, const nlohmann::json& message);
    void SendError(const Client& client, const Error& error);
    void SendJoined(const Client& client, const Seat& seat, bool resumed);

    std::shared_ptr<RoomRegistry> Registry_;
    const ServerConfig Config_;
    const std::vector<IceServer> IceServers_;

    std::shared_ptr<Loop> Loop_;
    std::thread LoopThread_;
    std::shared_ptr<rtc::WebSocketServer> WsServer_;

    std::atomic_uint64_t IdGenerator_{1};

    // Loop thread only.
    std::unordered_map<ClientId, std::shared_ptr<Client>> Clients_;
    std::map<SeatKey, std::shared_ptr<Seat>> Seats_;

    std::mutex SocketsMutex_;
    std::unordered_map<ClientId, std::shared_ptr<rtc::WebSocket>> Sockets_;
};

} // namespace livecall
