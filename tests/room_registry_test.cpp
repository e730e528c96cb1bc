#include "room_registry.hpp"

#include "signaling_channel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace livecall {
namespace {

Participant Member(const ParticipantId& id, ParticipantRole role = ParticipantRole::Student) {
    Participant participant;
    participant.id = id;
    participant.role = role;
    return participant;
}

class RoomRegistryTest : public ::testing::Test {
protected:
    RoomRegistry registry_;
};

TEST_F(RoomRegistryTest, AdmitsUpToCapacity) {
    auto tutor = registry_.Admit("r1", Member("tutor", ParticipantRole::Tutor));
    ASSERT_TRUE(tutor.Ok());
    ASSERT_EQ(1u, tutor.Value().roster.size());

    auto student = registry_.Admit("r1", Member("student"));
    ASSERT_TRUE(student.Ok());
    ASSERT_EQ(2u, student.Value().roster.size());
    EXPECT_EQ("tutor", student.Value().roster[0].id);
    EXPECT_EQ("student", student.Value().roster[1].id);
    EXPECT_EQ(tutor.Value().channel, student.Value().channel);

    auto third = registry_.Admit("r1", Member("third"));
    ASSERT_FALSE(third.Ok());
    EXPECT_EQ(ErrorCode::RoomFull, third.GetError().code);
    EXPECT_EQ(2u, registry_.GetRoster("r1").size());
}

TEST_F(RoomRegistryTest, RejectsDuplicateMember) {
    ASSERT_TRUE(registry_.Admit("r1", Member("alice")).Ok());

    auto again = registry_.Admit("r1", Member("alice"));
    ASSERT_FALSE(again.Ok());
    EXPECT_EQ(ErrorCode::AlreadyJoined, again.GetError().code);
}

TEST_F(RoomRegistryTest, ConcurrentAdmissionNeverExceedsCapacity) {
    constexpr int Contenders = 16;
    std::atomic_int admitted{0};
    std::atomic_int full{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < Contenders; ++i) {
        threads.emplace_back([&, i] {
            auto result = registry_.Admit("busy", Member("p" + std::to_string(i)));
            if (result.Ok()) {
                ++admitted;
            } else if (result.GetError().code == ErrorCode::RoomFull) {
                ++full;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(2, admitted);
    EXPECT_EQ(Contenders - 2, full);
    EXPECT_EQ(2u, registry_.GetRoster("busy").size());
}

TEST_F(RoomRegistryTest, RemoveIsIdempotentAndClosesEmptyRoom) {
    ASSERT_TRUE(registry_.Admit("r1", Member("alice")).Ok());
    ASSERT_TRUE(registry_.Admit("r1", Member("bob")).Ok());
    auto channel = registry_.GetChannel("r1");
    ASSERT_TRUE(channel);

    registry_.Remove("r1", "alice");
    registry_.Remove("r1", "alice");
    EXPECT_EQ(1u, registry_.GetRoster("r1").size());
    EXPECT_FALSE(channel->IsOpen("alice"));
    EXPECT_TRUE(channel->IsOpen("bob"));

    registry_.Remove("r1", "bob");
    EXPECT_TRUE(registry_.GetRoster("r1").empty());
    EXPECT_EQ(0u, registry_.RoomCount());

    auto status = registry_.GetRoomStatus("r1");
    ASSERT_TRUE(status.Ok());
    EXPECT_EQ(RoomStatus::Ended, status.Value());
}

TEST_F(RoomRegistryTest, ListenersHearAboutOthersOnly) {
    ASSERT_TRUE(registry_.Admit("r1", Member("alice")).Ok());

    std::mutex mutex;
    std::vector<RoomEvent> events;
    registry_.Subscribe("r1", "alice", [&](const RoomEvent& event) {
        std::lock_guard guard(mutex);
        events.push_back(event);
    });

    ASSERT_TRUE(registry_.Admit("r1", Member("bob")).Ok());
    registry_.Remove("r1", "bob");
    registry_.Remove("r1", "alice");

    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(RoomEventType::ParticipantJoined, events[0].type);
    EXPECT_EQ("bob", events[0].participantId);
    EXPECT_EQ(RoomEventType::ParticipantLeft, events[1].type);
    EXPECT_EQ("bob", events[1].participantId);
}

TEST_F(RoomRegistryTest, UnsubscribedListenerIsSilent) {
    ASSERT_TRUE(registry_.Admit("r1", Member("alice")).Ok());

    int calls = 0;
    auto id = registry_.Subscribe("r1", "alice", [&](const RoomEvent&) { ++calls; });
    registry_.Unsubscribe(id);
    registry_.Unsubscribe(id);

    ASSERT_TRUE(registry_.Admit("r1", Member("bob")).Ok());
    EXPECT_EQ(0, calls);
}

TEST_F(RoomRegistryTest, EndRoomNotifiesAndClosesChannel) {
    ASSERT_TRUE(registry_.Admit("r1", Member("alice")).Ok());
    ASSERT_TRUE(registry_.Admit("r1", Member("bob")).Ok());
    auto channel = registry_.GetChannel("r1");

    std::vector<RoomEventType> seen;
    registry_.Subscribe("r1", "bob", [&](const RoomEvent& event) { seen.push_back(event.type); });

    registry_.EndRoom("r1");

    ASSERT_EQ(1u, seen.size());
    EXPECT_EQ(RoomEventType::RoomClosed, seen[0]);
    EXPECT_FALSE(channel->IsOpen("alice"));
    EXPECT_FALSE(channel->IsOpen("bob"));
    EXPECT_TRUE(registry_.GetRoster("r1").empty());
    EXPECT_EQ(RoomStatus::Ended, registry_.GetRoomStatus("r1").Value());
}

TEST_F(RoomRegistryTest, RoomReopensAfterEnding) {
    ASSERT_TRUE(registry_.Admit("r1", Member("alice")).Ok());
    registry_.EndRoom("r1");

    auto again = registry_.Admit("r1", Member("alice"));
    ASSERT_TRUE(again.Ok());
    EXPECT_EQ(RoomStatus::Live, registry_.GetRoomStatus("r1").Value());
    EXPECT_TRUE(again.Value().channel->IsOpen("alice"));
}

TEST_F(RoomRegistryTest, GlobalCallbackSeesEveryEvent) {
    std::vector<RoomEventType> seen;
    registry_.SetEventCallback([&](const RoomEvent& event) { seen.push_back(event.type); });

    ASSERT_TRUE(registry_.Admit("r1", Member("alice")).Ok());
    registry_.Remove("r1", "alice");

    EXPECT_EQ(std::vector<RoomEventType>({
        RoomEventType::ParticipantJoined,
        RoomEventType::ParticipantLeft,
        RoomEventType::RoomClosed,
    }), seen);
}

TEST(RoomRegistryConfigTest, UnknownRoomWithoutAutoCreate) {
    RoomRegistry registry(RegistryConfig{2, false});

    auto admitted = registry.Admit("nowhere", Member("alice"));
    ASSERT_FALSE(admitted.Ok());
    EXPECT_EQ(ErrorCode::RoomNotFound, admitted.GetError().code);
    EXPECT_EQ(ErrorCode::RoomNotFound, registry.GetRoomStatus("nowhere").GetError().code);

    ASSERT_TRUE(registry.ScheduleRoom("class", 3));
    EXPECT_FALSE(registry.ScheduleRoom("class", 3));
    EXPECT_EQ(RoomStatus::Scheduled, registry.GetRoomStatus("class").Value());
    for (const char* id : {"a", "b", "c"}) {
        ASSERT_TRUE(registry.Admit("class", Member(id)).Ok());
    }
    EXPECT_EQ(ErrorCode::RoomFull, registry.Admit("class", Member("d")).GetError().code);
}

TEST(RoomRegistryConfigTest, ForgetsOldestEndedRooms) {
    RoomRegistry registry(RegistryConfig{2, true, 2});
    auto endRoom = [&](const RoomId& roomId) {
        ASSERT_TRUE(registry.Admit(roomId, Member("alice")).Ok());
        registry.Remove(roomId, "alice");
    };

    endRoom("r1");
    endRoom("r2");
    endRoom("r3");
    EXPECT_EQ(ErrorCode::RoomNotFound, registry.GetRoomStatus("r1").GetError().code);
    EXPECT_EQ(RoomStatus::Ended, registry.GetRoomStatus("r2").Value());
    EXPECT_EQ(RoomStatus::Ended, registry.GetRoomStatus("r3").Value());

    // Reopening r2 makes it the newest ended room.
    endRoom("r2");
    endRoom("r4");
    EXPECT_EQ(ErrorCode::RoomNotFound, registry.GetRoomStatus("r3").GetError().code);
    EXPECT_EQ(RoomStatus::Ended, registry.GetRoomStatus("r2").Value());
    EXPECT_EQ(RoomStatus::Ended, registry.GetRoomStatus("r4").Value());
    EXPECT_EQ(0u, registry.RoomCount());
}

TEST(ParticipantRoleTest, ParsesKnownRoles) {
    EXPECT_EQ(ParticipantRole::Tutor, ParseParticipantRole("tutor"));
    EXPECT_EQ(ParticipantRole::Tutor, ParseParticipantRole("teacher"));
    EXPECT_EQ(ParticipantRole::Student, ParseParticipantRole("student"));
    EXPECT_FALSE(ParseParticipantRole("admin").has_value());
}

} // namespace
} // namespace livecall
