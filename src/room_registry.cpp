#include "room_registry.hpp"

#include "signaling_channel.hpp"

#include <algorithm>
#include <iostream>

namespace livecall {

const char* ToString(RoomStatus status) {
    switch (status) {
        case RoomStatus::Scheduled: return "Scheduled";
        case RoomStatus::Live: return "Live";
        case RoomStatus::Ended: return "Ended";
    }
    return "Unknown";
}

const char* ToString(ParticipantRole role) {
    switch (role) {
        case ParticipantRole::Tutor: return "tutor";
        case ParticipantRole::Student: return "student";
    }
    return "unknown";
}

std::optional<ParticipantRole> ParseParticipantRole(const std::string& name) {
    if (name == "tutor" || name == "teacher") {
        return ParticipantRole::Tutor;
    }
    if (name == "student") {
        return ParticipantRole::Student;
    }
    return std::nullopt;
}

RoomRegistry::RoomRegistry(RegistryConfig config)
    : Config_(config)
{ }

bool RoomRegistry::ScheduleRoom(const RoomId& roomId, size_t capacity) {
    std::unique_lock lock(RoomsMutex_);
    if (Rooms_.count(roomId)) {
        return false;
    }

    auto room = std::make_shared<Room>();
    room->id = roomId;
    room->capacity = capacity;
    room->channel = std::make_shared<SignalingChannel>(roomId);
    Rooms_.emplace(roomId, room);
    Unarchive(roomId);

    std::cout << "[Room " << roomId << "] Scheduled with capacity " << capacity << std::endl;
    return true;
}

Result<Admission> RoomRegistry::Admit(const RoomId& roomId, const Participant& participant) {
    while (true) {
        auto room = FindOrCreateRoom(roomId);
        if (!room) {
            return MakeError(ErrorCode::RoomNotFound, "Room " + roomId + " does not exist");
        }

        std::lock_guard guard(room->mutex);
        if (room->retired) {
            // Closed while we waited for the lock; the next lookup creates a fresh room.
            continue;
        }

        auto& participants = room->participants;
        bool member = std::any_of(participants.begin(), participants.end(), [&](const Participant& p) {
            return p.id == participant.id;
        });
        if (member) {
            return MakeError(ErrorCode::AlreadyJoined, participant.id + " is already in room " + roomId);
        }
        if (participants.size() >= room->capacity) {
            return MakeError(ErrorCode::RoomFull, "Room " + roomId + " is full");
        }

        Participant admitted = participant;
        admitted.joinedAt = std::chrono::system_clock::now();
        participants.push_back(std::move(admitted));
        room->status = RoomStatus::Live;
        room->channel->Open(participant.id);

        std::cout << "[Room " << roomId << "] " << ToString(participant.role) << " " << participant.id
                  << " joined (" << participants.size() << "/" << room->capacity << ")" << std::endl;

        EmitLocked(*room, RoomEvent{RoomEventType::ParticipantJoined, roomId, participant.id}, participant.id);
        return Admission{room->channel, participants};
    }
}

void RoomRegistry::Remove(const RoomId& roomId, const ParticipantId& participantId) {
    auto room = FindRoom(roomId);
    if (!room) {
        return;
    }

    std::lock_guard guard(room->mutex);
    if (room->retired) {
        return;
    }

    auto& participants = room->participants;
    auto it = std::find_if(participants.begin(), participants.end(), [&](const Participant& p) {
        return p.id == participantId;
    });
    if (it == participants.end()) {
        return;
    }

    participants.erase(it);
    room->channel->Close(participantId);

    auto& listeners = room->listeners;
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(), [&](const Listener& l) {
        return l.participantId == participantId;
    }), listeners.end());

    std::cout << "[Room " << roomId << "] Participant " << participantId << " left ("
              << participants.size() << "/" << room->capacity << ")" << std::endl;

    EmitLocked(*room, RoomEvent{RoomEventType::ParticipantLeft, roomId, participantId}, participantId);

    if (participants.empty()) {
        RetireRoom(room);
    }
}

void RoomRegistry::EndRoom(const RoomId& roomId) {
    auto room = FindRoom(roomId);
    if (!room) {
        return;
    }

    std::lock_guard guard(room->mutex);
    if (room->retired) {
        return;
    }

    std::cout << "[Room " << roomId << "] Ending with " << room->participants.size() << " participant(s)" << std::endl;

    room->participants.clear();
    RetireRoom(room);
}

Result<RoomStatus> RoomRegistry::GetRoomStatus(const RoomId& roomId) const {
    if (auto room = FindRoom(roomId)) {
        std::lock_guard guard(room->mutex);
        return room->status;
    }

    std::shared_lock lock(RoomsMutex_);
    auto it = Archived_.find(roomId);
    if (it != Archived_.end()) {
        return it->second;
    }
    return MakeError(ErrorCode::RoomNotFound, "Room " + roomId + " does not exist");
}

std::vector<Participant> RoomRegistry::GetRoster(const RoomId& roomId) const {
    auto room = FindRoom(roomId);
    if (!room) {
        return {};
    }

    std::lock_guard guard(room->mutex);
    return room->participants;
}

std::shared_ptr<SignalingChannel> RoomRegistry::GetChannel(const RoomId& roomId) const {
    auto room = FindRoom(roomId);
    return room ? room->channel : nullptr;
}

void RoomRegistry::AttachSession(const RoomId& roomId, const ParticipantId& participantId,
                                 std::weak_ptr<PeerSession> session) {
    auto room = FindRoom(roomId);
    if (!room) {
        return;
    }

    std::lock_guard guard(room->mutex);
    for (auto& p : room->participants) {
        if (p.id == participantId) {
            p.session = std::move(session);
            return;
        }
    }
}

ListenerId RoomRegistry::Subscribe(const RoomId& roomId, const ParticipantId& participantId,
                                   RoomEventCallback callback) {
    ListenerId id;
    {
        std::lock_guard guard(ListenersMutex_);
        id = NextListenerId_++;
        ListenerRooms_.emplace(id, roomId);
    }

    auto room = FindRoom(roomId);
    if (!room) {
        return id;
    }

    std::lock_guard guard(room->mutex);
    if (!room->retired) {
        room->listeners.push_back(Listener{id, participantId, std::move(callback)});
    }
    return id;
}

void RoomRegistry::Unsubscribe(ListenerId listenerId) {
    RoomId roomId;
    {
        std::lock_guard guard(ListenersMutex_);
        auto it = ListenerRooms_.find(listenerId);
        if (it == ListenerRooms_.end()) {
            return;
        }
        roomId = it->second;
        ListenerRooms_.erase(it);
    }

    auto room = FindRoom(roomId);
    if (!room) {
        return;
    }

    std::lock_guard guard(room->mutex);
    auto& listeners = room->listeners;
    listeners.erase(std::remove_if(listeners.begin(), listeners.end(), [&](const Listener& l) {
        return l.id == listenerId;
    }), listeners.end());
}

void RoomRegistry::SetEventCallback(RoomEventCallback callback) {
    std::lock_guard guard(CallbackMutex_);
    EventCallback_ = std::move(callback);
}

size_t RoomRegistry::RoomCount() const {
    std::shared_lock lock(RoomsMutex_);
    return Rooms_.size();
}

std::shared_ptr<RoomRegistry::Room> RoomRegistry::FindRoom(const RoomId& roomId) const {
    std::shared_lock lock(RoomsMutex_);
    auto it = Rooms_.find(roomId);
    return it != Rooms_.end() ? it->second : nullptr;
}

std::shared_ptr<RoomRegistry::Room> RoomRegistry::FindOrCreateRoom(const RoomId& roomId) {
    if (auto room = FindRoom(roomId)) {
        return room;
    }

    std::unique_lock lock(RoomsMutex_);
    auto it = Rooms_.find(roomId);
    if (it != Rooms_.end()) {
        return it->second;
    }
    if (!Config_.autoCreateRooms) {
        return nullptr;
    }

    auto room = std::make_shared<Room>();
    room->id = roomId;
    room->capacity = Config_.defaultCapacity;
    room->channel = std::make_shared<SignalingChannel>(roomId);
    Rooms_.emplace(roomId, room);
    Unarchive(roomId);

    std::cout << "[Room " << roomId << "] Created on first join" << std::endl;
    return room;
}

// Caller holds room->mutex.
void RoomRegistry::RetireRoom(const std::shared_ptr<Room>& room) {
    EmitLocked(*room, RoomEvent{RoomEventType::RoomClosed, room->id, {}}, {});

    room->retired = true;
    room->status = RoomStatus::Ended;
    room->listeners.clear();
    room->channel->CloseAll();

    {
        std::unique_lock lock(RoomsMutex_);
        auto it = Rooms_.find(room->id);
        if (it != Rooms_.end() && it->second == room) {
            Rooms_.erase(it);
        }
        Archive(room->id);
    }

    std::cout << "[Room " << room->id << "] Closed" << std::endl;
}

// Caller holds RoomsMutex_ exclusively.
void RoomRegistry::Archive(const RoomId& roomId) {
    if (Archived_.emplace(roomId, RoomStatus::Ended).second) {
        ArchiveOrder_.push_back(roomId);
    }
    while (ArchiveOrder_.size() > Config_.archivedRooms) {
        Archived_.erase(ArchiveOrder_.front());
        ArchiveOrder_.pop_front();
    }
}

// Caller holds RoomsMutex_ exclusively.
void RoomRegistry::Unarchive(const RoomId& roomId) {
    if (Archived_.erase(roomId)) {
        ArchiveOrder_.erase(std::find(ArchiveOrder_.begin(), ArchiveOrder_.end(), roomId));
    }
}

// Caller holds room.mutex.
void RoomRegistry::EmitLocked(Room& room, const RoomEvent& event, const ParticipantId& exclude) {
    for (const auto& listener : room.listeners) {
        if (listener.participantId != exclude && listener.callback) {
            listener.callback(event);
        }
    }

    std::lock_guard guard(CallbackMutex_);
    if (EventCallback_) {
        EventCallback_(event);
    }
}

} // namespace livecall
