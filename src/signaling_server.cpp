#include "signaling_server.hpp"

#include "signaling_channel.hpp"
#include "signaling_message.hpp"

#include <iostream>

namespace livecall {

namespace {

using json = nlohmann::json;

json RosterJson(const std::vector<Participant>& roster) {
    json list = json::array();
    for (const auto& participant : roster) {
        list.push_back({{"participantId", participant.id}, {"role", ToString(participant.role)}});
    }
    return list;
}

const char* EventType(RoomEventType type) {
    switch (type) {
        case RoomEventType::ParticipantJoined: return "participant-joined";
        case RoomEventType::ParticipantLeft: return "participant-left";
        case RoomEventType::RoomClosed: return "room-closed";
    }
    return "unknown";
}

} // namespace

SignalingServer::SignalingServer(std::shared_ptr<RoomRegistry> registry, ServerConfig config,
                                 std::vector<IceServer> iceServers)
    : Registry_(std::move(registry))
    , Config_(std::move(config))
    , IceServers_(std::move(iceServers))
    , Loop_(std::make_shared<Loop>())
{ }

SignalingServer::~SignalingServer() {
    Stop();
    if (LoopThread_.joinable()) {
        LoopThread_.join();
    }

    // The registry outlives us; detach from it.
    for (auto& [key, seat] : Seats_) {
        if (seat->subscription) {
            seat->subscription->SetNotifier(nullptr);
        }
        Registry_->Unsubscribe(seat->listener);
    }
}

void SignalingServer::Run() {
    Start();
    Listen();
    LoopThread_.join();
}

void SignalingServer::Start() {
    if (!LoopThread_.joinable()) {
        LoopThread_ = std::thread{std::bind(&Loop::Run, Loop_)};
    }
}

void SignalingServer::Listen() {
    rtc::WebSocketServer::Configuration wsCfg;
    wsCfg.port = Config_.port;
    wsCfg.enableTls = false;
    if (Config_.bindAddress) {
        wsCfg.bindAddress = *Config_.bindAddress;
    }

    WsServer_ = std::make_shared<rtc::WebSocketServer>(wsCfg);
    WsServer_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
        std::weak_ptr<rtc::WebSocket> weakWs = ws;
        auto clientId = Connect([weakWs](const std::string& text) {
            auto ws = weakWs.lock();
            if (!ws || !ws->isOpen()) {
                return;
            }
            try {
                ws->send(text);
            } catch (const std::exception& e) {
                std::cerr << "WebSocket send failed: " << e.what() << std::endl;
            }
        });

        {
            std::lock_guard guard(SocketsMutex_);
            Sockets_.emplace(clientId, ws);
        }

        ws->onOpen([clientId] {
            std::cout << "[Client " << clientId << "] WebSocket connected" << std::endl;
        });

        ws->onClosed([this, clientId] {
            Disconnect(clientId);
        });

        ws->onMessage([this, clientId](rtc::message_variant message) {
            auto text = std::get_if<std::string>(&message);
            if (!text) {
                return;
            }
            Receive(clientId, std::move(*text));
        });
    });

    std::cout << "Signaling server listening on ws://" << Config_.bindAddress.value_or("0.0.0.0") << ":"
              << WsServer_->port() << std::endl;
}

void SignalingServer::Stop() {
    if (WsServer_) {
        WsServer_->stop();
    }

    std::unordered_map<ClientId, std::shared_ptr<rtc::WebSocket>> sockets;
    {
        std::lock_guard guard(SocketsMutex_);
        sockets.swap(Sockets_);
    }
    for (auto& [id, ws] : sockets) {
        ws->resetCallbacks();
        ws->close();
    }

    Loop_->Stop();
}

ClientId SignalingServer::Connect(ClientSender sender) {
    auto id = IdGenerator_++;
    Loop_->EnqueueTask([this, id, sender = std::move(sender)]() mutable {
        auto client = std::make_shared<Client>();
        client->id = id;
        client->sender = std::move(sender);
        Clients_.emplace(id, client);
    });
    return id;
}

void SignalingServer::Receive(ClientId clientId, std::string text) {
    Loop_->EnqueueTask([this, clientId, text = std::move(text)] {
        auto it = Clients_.find(clientId);
        if (it == Clients_.end()) {
            std::cerr << "Client not found for signaling message" << std::endl;
            return;
        }
        OnMessage(it->second, text);
    });
}

void SignalingServer::Disconnect(ClientId clientId) {
    Loop_->EnqueueTask([this, clientId] {
        {
            std::lock_guard guard(SocketsMutex_);
            Sockets_.erase(clientId);
        }

        auto it = Clients_.find(clientId);
        if (it == Clients_.end()) {
            return;
        }
        auto client = it->second;
        Clients_.erase(it);
        std::cout << "[Client " << clientId << "] WebSocket disconnected" << std::endl;

        auto seat = std::move(client->seat);
        if (!seat || seat->client != clientId) {
            return;
        }
        seat->client.reset();
        if (seat->subscription) {
            seat->subscription->SetNotifier(nullptr);
        }

        if (Config_.reconnectGrace.count() == 0) {
            Evict(seat);
            return;
        }

        std::weak_ptr<Seat> weakSeat = seat;
        seat->eviction = Loop_->EnqueueDelayed(Config_.reconnectGrace, [this, weakSeat] {
            if (auto held = weakSeat.lock()) {
                held->eviction.reset();
                Evict(held);
            }
        });
        std::cout << "[Room " << seat->roomId << "] Holding seat of " << seat->participantId << " for "
                  << Config_.reconnectGrace.count() << "ms" << std::endl;
    });
}

void SignalingServer::OnMessage(const std::shared_ptr<Client>& client, const std::string& text) {
    json message;
    try {
        message = json::parse(text);
    } catch (const json::parse_error& e) {
        SendError(*client, MakeError(ErrorCode::InvalidMessage, std::string("Invalid JSON: ") + e.what()));
        return;
    }

    auto typeIt = message.find("type");
    if (typeIt == message.end() || !typeIt->is_string()) {
        SendError(*client, MakeError(ErrorCode::InvalidMessage, "Message missing type"));
        return;
    }
    const std::string type = *typeIt;

    try {
        if (type == "join") {
            HandleJoin(client, message);
        } else if (type == "resume") {
            HandleResume(client, message);
        } else if (type == "ack") {
            HandleAck(client, message);
        } else if (type == "ping") {
            Send(*client, {{"type", "pong"}});
        } else if (IsSignalingType(type)) {
            HandleSignaling(client, message);
        } else {
            SendError(*client, MakeError(ErrorCode::InvalidMessage, "Unknown message type: " + type));
        }
    } catch (const json::exception& e) {
        SendError(*client, MakeError(ErrorCode::InvalidMessage, e.what()));
    }
}

void SignalingServer::HandleJoin(const std::shared_ptr<Client>& client, const json& message) {
    if (client->seat) {
        SendError(*client, MakeError(ErrorCode::AlreadyJoined, "Connection already joined a room"));
        return;
    }

    RoomId roomId = message.value("roomId", "");
    ParticipantId participantId = message.value("participantId", "");
    if (roomId.empty() || participantId.empty()) {
        SendError(*client, MakeError(ErrorCode::InvalidMessage, "join needs roomId and participantId"));
        return;
    }
    auto role = ParseParticipantRole(message.value("role", "student"));
    if (!role) {
        SendError(*client, MakeError(ErrorCode::InvalidMessage, "Unknown role"));
        return;
    }

    auto admitted = Registry_->Admit(roomId, Participant{participantId, *role});
    if (!admitted) {
        SendError(*client, admitted.GetError());
        return;
    }

    auto seat = std::make_shared<Seat>();
    seat->roomId = roomId;
    seat->participantId = participantId;
    seat->channel = admitted.Value().channel;

    std::weak_ptr<Seat> weakSeat = seat;
    seat->listener = Registry_->Subscribe(roomId, participantId, [this, weakSeat](const RoomEvent& event) {
        Loop_->EnqueueTask([this, weakSeat, event] {
            OnRoomEvent(weakSeat, event);
        });
    });
    Seats_[{roomId, participantId}] = seat;

    std::cout << "[Client " << client->id << "] Joined room " << roomId << " as " << participantId << std::endl;
    Attach(client, seat);
    SendJoined(*client, *seat, false);
}

void SignalingServer::HandleResume(const std::shared_ptr<Client>& client, const json& message) {
    if (client->seat) {
        SendError(*client, MakeError(ErrorCode::AlreadyJoined, "Connection already joined a room"));
        return;
    }

    RoomId roomId = message.value("roomId", "");
    ParticipantId participantId = message.value("participantId", "");
    auto it = Seats_.find({roomId, participantId});
    if (it == Seats_.end()) {
        SendError(*client, MakeError(ErrorCode::RoomNotFound, "No seat to resume in room " + roomId));
        return;
    }
    auto seat = it->second;

    // A resume takes the seat over from a connection that has not noticed it is dead yet.
    if (seat->client) {
        if (auto old = Clients_.find(*seat->client); old != Clients_.end()) {
            old->second->seat.reset();
        }
    }
    if (seat->eviction) {
        Loop_->CancelDelayed(*seat->eviction);
        seat->eviction.reset();
    }

    std::cout << "[Client " << client->id << "] Resumed " << participantId << " in room " << roomId << std::endl;
    Attach(client, seat);
    SendJoined(*client, *seat, true);
}

void SignalingServer::HandleAck(const std::shared_ptr<Client>& client, const json& message) {
    if (!client->seat || !client->seat->subscription) {
        return;
    }

    auto fromIt = message.find("from");
    auto seqIt = message.find("seq");
    if (fromIt == message.end() || !fromIt->is_string() || seqIt == message.end() || !seqIt->is_number_unsigned()) {
        SendError(*client, MakeError(ErrorCode::InvalidMessage, "ack needs from and seq"));
        return;
    }
    client->seat->subscription->Acknowledge(fromIt->get<std::string>(), seqIt->get<uint64_t>());
}

void SignalingServer::HandleSignaling(const std::shared_ptr<Client>& client, const json& message) {
    if (!client->seat) {
        SendError(*client, MakeError(ErrorCode::ChannelClosed, "Join a room first"));
        return;
    }

    auto parsed = ParseSignalingMessage(message);
    if (!parsed) {
        SendError(*client, parsed.GetError());
        return;
    }
    if (parsed.Value().from != client->seat->participantId) {
        SendError(*client, MakeError(ErrorCode::InvalidMessage, "Sender does not match the joined participant"));
        return;
    }

    auto sent = client->seat->channel->Send(parsed.Value());
    if (!sent) {
        SendError(*client, sent.GetError());
    }
}

void SignalingServer::OnRoomEvent(const std::weak_ptr<Seat>& weakSeat, const RoomEvent& event) {
    auto seat = weakSeat.lock();
    if (!seat) {
        return;
    }

    std::shared_ptr<Client> client;
    if (seat->client) {
        if (auto it = Clients_.find(*seat->client); it != Clients_.end()) {
            client = it->second;
        }
    }

    if (client) {
        json notice = {{"type", EventType(event.type)}, {"roomId", event.roomId}};
        if (!event.participantId.empty()) {
            notice["participantId"] = event.participantId;
        }
        Send(*client, notice);
    }

    if (event.type == RoomEventType::RoomClosed) {
        if (seat->eviction) {
            Loop_->CancelDelayed(*seat->eviction);
            seat->eviction.reset();
        }
        Registry_->Unsubscribe(seat->listener);
        Seats_.erase({seat->roomId, seat->participantId});
        if (client && client->seat == seat) {
            client->seat.reset();
        }
    }
}

void SignalingServer::Attach(const std::shared_ptr<Client>& client, const std::shared_ptr<Seat>& seat) {
    client->seat = seat;
    seat->client = client->id;

    // Resubscribing replays everything not acknowledged yet.
    seat->subscription = seat->channel->Subscribe(seat->participantId);
    std::weak_ptr<Seat> weakSeat = seat;
    seat->subscription->SetNotifier([this, weakSeat] {
        Loop_->EnqueueTask([this, weakSeat] {
            if (auto held = weakSeat.lock()) {
                Drain(*held);
            }
        });
    });
}

void SignalingServer::Drain(Seat& seat) {
    if (!seat.client || !seat.subscription) {
        return;
    }
    auto it = Clients_.find(*seat.client);
    if (it == Clients_.end()) {
        return;
    }

    while (auto message = seat.subscription->TryNext()) {
        Send(*it->second, ToJson(*message));
    }
}

void SignalingServer::Evict(const std::shared_ptr<Seat>& seat) {
    auto it = Seats_.find({seat->roomId, seat->participantId});
    if (it == Seats_.end() || it->second != seat) {
        return;
    }
    Seats_.erase(it);

    std::cout << "[Room " << seat->roomId << "] Releasing seat of " << seat->participantId << std::endl;
    Registry_->Unsubscribe(seat->listener);
    Registry_->Remove(seat->roomId, seat->participantId);
}

void SignalingServer::Send(const Client& client, const json& message) {
    if (client.sender) {
        client.sender(message.dump());
    }
}

void SignalingServer::SendError(const Client& client, const Error& error) {
    std::cerr << "[Client " << client.id << "] " << ToString(error.code) << ": " << error.message << std::endl;
    Send(client, {{"type", "error"}, {"code", ToString(error.code)}, {"message", error.message}});
}

void SignalingServer::SendJoined(const Client& client, const Seat& seat, bool resumed) {
    Send(client, {
        {"type", "joined"},
        {"roomId", seat.roomId},
        {"participantId", seat.participantId},
        {"roster", RosterJson(Registry_->GetRoster(seat.roomId))},
        {"iceServers", ToJson(IceServers_)},
        {"resumed", resumed},
    });
}

} // namespace livecall
