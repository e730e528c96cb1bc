#pragma once

#include "errors.hpp"
#include "fwd.hpp"
#include "signaling_message.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace livecall {

// Reader side of one endpoint's mailbox. A newer Subscribe() for the same
// endpoint supersedes this one.
class SignalingSubscription {
public:
    SignalingSubscription(std::weak_ptr<SignalingChannel> channel, ParticipantId participantId, uint64_t generation);

    std::optional<SignalingMessage> TryNext();
    std::optional<SignalingMessage> Next(std::chrono::milliseconds timeout);

    // Everything up to and including (from, seq) is dropped from the mailbox.
    void Acknowledge(const ParticipantId& from, uint64_t seq);

    // Called after every delivery, outside the channel lock.
    void SetNotifier(std::function<void()> notifier);

    const ParticipantId& GetParticipantId() const {
        return ParticipantId_;
    }

private:
    std::weak_ptr<SignalingChannel> Channel_;
    ParticipantId ParticipantId_;
    uint64_t Generation_;
};

class SignalingChannel : public std::enable_shared_from_this<SignalingChannel> {
public:
    explicit SignalingChannel(RoomId roomId);

    void Open(const ParticipantId& participantId);
    void Close(const ParticipantId& participantId);
    void CloseAll();

    bool IsOpen(const ParticipantId& participantId) const;

    // Duplicate or stale sequence numbers are accepted and dropped.
    Result<void> Send(const SignalingMessage& message);

    // Resumes from the first unacknowledged message.
    std::shared_ptr<SignalingSubscription> Subscribe(const ParticipantId& participantId);

    const RoomId& GetRoomId() const {
        return RoomId_;
    }

private:
    friend class SignalingSubscription;

    struct Mailbox {
        bool open = true;
        uint64_t generation = 0;
        std::deque<SignalingMessage> pending;
        size_t cursor = 0;
        std::unordered_map<ParticipantId, uint64_t> lastDelivered;
        std::function<void()> notifier;
    };

    bool DeliverLocked(Mailbox& mailbox, const SignalingMessage& message);
    Mailbox* FindLive(const ParticipantId& participantId, uint64_t generation);

    RoomId RoomId_;
    mutable std::mutex Mutex_;
    std::condition_variable Cv_;
    std::unordered_map<ParticipantId, Mailbox> Mailboxes_;
    bool Closed_ = false;
};

} // namespace livecall
