#pragma once

#include "errors.hpp"
#include "fwd.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace livecall {

enum class RoomStatus {
    Scheduled,
    Live,
    Ended,
};

enum class ParticipantRole {
    Tutor,
    Student,
};

const char* ToString(RoomStatus status);
const char* ToString(ParticipantRole role);
std::optional<ParticipantRole> ParseParticipantRole(const std::string& name);

struct Participant {
    ParticipantId id;
    ParticipantRole role = ParticipantRole::Student;
    std::chrono::system_clock::time_point joinedAt;
    std::weak_ptr<PeerSession> session;
};

struct Admission {
    std::shared_ptr<SignalingChannel> channel;
    // Includes the admitted participant, in join order.
    std::vector<Participant> roster;
};

enum class RoomEventType {
    ParticipantJoined,
    ParticipantLeft,
    RoomClosed,
};

struct RoomEvent {
    RoomEventType type;
    RoomId roomId;
    ParticipantId participantId;
};

using RoomEventCallback = std::function<void(const RoomEvent& event)>;
using ListenerId = uint64_t;

struct RegistryConfig {
    size_t defaultCapacity = 2;
    bool autoCreateRooms = true;
    // Ended rooms remembered for GetRoomStatus; the oldest are forgotten first.
    size_t archivedRooms = 1024;
};

// Admission and removal are serialized per room. Event callbacks run under
// the room lock and must not call back into the registry.
class RoomRegistry {
public:
    explicit RoomRegistry(RegistryConfig config = {});

    bool ScheduleRoom(const RoomId& roomId, size_t capacity);

    Result<Admission> Admit(const RoomId& roomId, const Participant& participant);
    void Remove(const RoomId& roomId, const ParticipantId& participantId);
    void EndRoom(const RoomId& roomId);

    Result<RoomStatus> GetRoomStatus(const RoomId& roomId) const;
    std::vector<Participant> GetRoster(const RoomId& roomId) const;
    std::shared_ptr<SignalingChannel> GetChannel(const RoomId& roomId) const;
    void AttachSession(const RoomId& roomId, const ParticipantId& participantId, std::weak_ptr<PeerSession> session);

    // Delivers events about other members of the room to this member.
    ListenerId Subscribe(const RoomId& roomId, const ParticipantId& participantId, RoomEventCallback callback);
    void Unsubscribe(ListenerId listenerId);

    // Observes every event in every room.
    void SetEventCallback(RoomEventCallback callback);

    size_t RoomCount() const;

private:
    struct Listener {
        ListenerId id;
        ParticipantId participantId;
        RoomEventCallback callback;
    };

    struct Room {
        RoomId id;
        size_t capacity;
        RoomStatus status = RoomStatus::Scheduled;
        std::vector<Participant> participants;
        std::vector<Listener> listeners;
        std::shared_ptr<SignalingChannel> channel;
        std::mutex mutex;
        bool retired = false;
    };

    std::shared_ptr<Room> FindRoom(const RoomId& roomId) const;
    std::shared_ptr<Room> FindOrCreateRoom(const RoomId& roomId);
    void RetireRoom(const std::shared_ptr<Room>& room);
    void EmitLocked(Room& room, const RoomEvent& event, const ParticipantId& exclude);
    void Archive(const RoomId& roomId);
    void Unarchive(const RoomId& roomId);

    RegistryConfig Config_;

    mutable std::shared_mutex RoomsMutex_;
    std::unordered_map<RoomId, std::shared_ptr<Room>> Rooms_;
    std::unordered_map<RoomId, RoomStatus> Archived_;
    std::deque<RoomId> ArchiveOrder_;

    std::mutex ListenersMutex_;
    std::unordered_map<ListenerId, RoomId> ListenerRooms_;
    ListenerId NextListenerId_ = 1;

    std::mutex CallbackMutex_;
    RoomEventCallback EventCallback_;
};

} // namespace livecall
