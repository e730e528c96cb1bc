#include "signaling_channel.hpp"

#include <iostream>
#include <vector>

namespace livecall {

SignalingSubscription::SignalingSubscription(std::weak_ptr<SignalingChannel> channel, ParticipantId participantId,
                                             uint64_t generation)
    : Channel_(std::move(channel))
    , ParticipantId_(std::move(participantId))
    , Generation_(generation)
{ }

std::optional<SignalingMessage> SignalingSubscription::TryNext() {
    auto channel = Channel_.lock();
    if (!channel) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(channel->Mutex_);
    auto mailbox = channel->FindLive(ParticipantId_, Generation_);
    if (!mailbox || mailbox->cursor >= mailbox->pending.size()) {
        return std::nullopt;
    }
    return mailbox->pending[mailbox->cursor++];
}

std::optional<SignalingMessage> SignalingSubscription::Next(std::chrono::milliseconds timeout) {
    auto channel = Channel_.lock();
    if (!channel) {
        return std::nullopt;
    }

    std::unique_lock<std::mutex> lock(channel->Mutex_);
    SignalingChannel::Mailbox* mailbox = nullptr;
    channel->Cv_.wait_for(lock, timeout, [&] {
        mailbox = channel->FindLive(ParticipantId_, Generation_);
        return !mailbox || !mailbox->open || channel->Closed_ || mailbox->cursor < mailbox->pending.size();
    });
    if (!mailbox || mailbox->cursor >= mailbox->pending.size()) {
        return std::nullopt;
    }
    return mailbox->pending[mailbox->cursor++];
}

void SignalingSubscription::Acknowledge(const ParticipantId& from, uint64_t seq) {
    auto channel = Channel_.lock();
    if (!channel) {
        return;
    }

    std::lock_guard<std::mutex> lock(channel->Mutex_);
    auto mailbox = channel->FindLive(ParticipantId_, Generation_);
    if (!mailbox) {
        return;
    }

    for (size_t i = 0; i < mailbox->cursor; ++i) {
        const auto& message = mailbox->pending[i];
        if (message.from == from && message.seq == seq) {
            mailbox->pending.erase(mailbox->pending.begin(), mailbox->pending.begin() + i + 1);
            mailbox->cursor -= i + 1;
            return;
        }
    }
}

void SignalingSubscription::SetNotifier(std::function<void()> notifier) {
    auto channel = Channel_.lock();
    if (!channel) {
        return;
    }

    bool hasUnread = false;
    {
        std::lock_guard<std::mutex> lock(channel->Mutex_);
        auto mailbox = channel->FindLive(ParticipantId_, Generation_);
        if (!mailbox) {
            return;
        }
        mailbox->notifier = notifier;
        hasUnread = mailbox->cursor < mailbox->pending.size();
    }

    if (hasUnread && notifier) {
        notifier();
    }
}

SignalingChannel::SignalingChannel(RoomId roomId)
    : RoomId_(std::move(roomId))
{ }

void SignalingChannel::Open(const ParticipantId& participantId) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        if (Closed_) {
            return;
        }

        // A rejoining participant starts counting from scratch.
        for (auto& [id, mailbox] : Mailboxes_) {
            mailbox.lastDelivered.erase(participantId);
        }

        auto& mailbox = Mailboxes_[participantId];
        mailbox.open = true;
        mailbox.generation++;
        mailbox.pending.clear();
        mailbox.cursor = 0;
        mailbox.lastDelivered.clear();
        mailbox.notifier = nullptr;
    }

    Cv_.notify_all();
}

void SignalingChannel::Close(const ParticipantId& participantId) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        auto it = Mailboxes_.find(participantId);
        if (it == Mailboxes_.end()) {
            return;
        }
        it->second.open = false;
        it->second.notifier = nullptr;
    }

    Cv_.notify_all();
}

void SignalingChannel::CloseAll() {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Closed_ = true;
        for (auto& [id, mailbox] : Mailboxes_) {
            mailbox.open = false;
            mailbox.notifier = nullptr;
        }
    }

    Cv_.notify_all();
}

bool SignalingChannel::IsOpen(const ParticipantId& participantId) const {
    std::lock_guard<std::mutex> lock(Mutex_);
    auto it = Mailboxes_.find(participantId);
    return !Closed_ && it != Mailboxes_.end() && it->second.open;
}

Result<void> SignalingChannel::Send(const SignalingMessage& message) {
    std::vector<std::function<void()>> notifiers;

    {
        std::lock_guard<std::mutex> lock(Mutex_);
        if (Closed_) {
            return MakeError(ErrorCode::ChannelClosed, "Room " + RoomId_ + " channel is closed");
        }

        auto senderIt = Mailboxes_.find(message.from);
        if (senderIt == Mailboxes_.end() || !senderIt->second.open) {
            return MakeError(ErrorCode::ChannelClosed, "Sender " + message.from + " is not connected");
        }

        if (message.to) {
            auto recipientIt = Mailboxes_.find(*message.to);
            if (recipientIt == Mailboxes_.end() || !recipientIt->second.open) {
                return MakeError(ErrorCode::ChannelClosed, "Recipient " + *message.to + " is not connected");
            }
            if (DeliverLocked(recipientIt->second, message) && recipientIt->second.notifier) {
                notifiers.push_back(recipientIt->second.notifier);
            }
        } else {
            for (auto& [id, mailbox] : Mailboxes_) {
                if (id == message.from || !mailbox.open) {
                    continue;
                }
                if (DeliverLocked(mailbox, message) && mailbox.notifier) {
                    notifiers.push_back(mailbox.notifier);
                }
            }
        }
    }

    Cv_.notify_all();
    for (auto& notifier : notifiers) {
        notifier();
    }
    return {};
}

std::shared_ptr<SignalingSubscription> SignalingChannel::Subscribe(const ParticipantId& participantId) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        auto [it, inserted] = Mailboxes_.try_emplace(participantId);
        auto& mailbox = it->second;
        if (inserted) {
            mailbox.open = false;
        }
        mailbox.generation++;
        mailbox.cursor = 0;
        mailbox.notifier = nullptr;
        generation = mailbox.generation;
    }

    // Wake a reader blocked on the superseded subscription.
    Cv_.notify_all();
    return std::make_shared<SignalingSubscription>(weak_from_this(), participantId, generation);
}

bool SignalingChannel::DeliverLocked(Mailbox& mailbox, const SignalingMessage& message) {
    auto& last = mailbox.lastDelivered[message.from];
    if (message.seq <= last) {
        std::cout << "[Room " << RoomId_ << "] Dropping duplicate " << TypeName(message.payload)
                  << " seq=" << message.seq << " from " << message.from << std::endl;
        return false;
    }
    last = message.seq;
    mailbox.pending.push_back(message);
    return true;
}

SignalingChannel::Mailbox* SignalingChannel::FindLive(const ParticipantId& participantId, uint64_t generation) {
    auto it = Mailboxes_.find(participantId);
    if (it == Mailboxes_.end() || it->second.generation != generation) {
        return nullptr;
    }
    return &it->second;
}

} // namespace livecall
