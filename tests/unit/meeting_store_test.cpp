#include "core/meeting/meeting_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace meetcoord::core;
using namespace meetcoord::common;

namespace {

MeetingData MakeMeeting(const std::string& id, int max_participants = 6, const std::string& password = "") {
    MeetingData data;
    data.meeting_id = id;
    data.title = "Planning";
    data.host_user_id = "host";
    data.created_by = "host";
    data.settings.max_participants = max_participants;
    data.room_password = password;
    data.created_at = 1000;
    data.updated_at = 1000;
    return data;
}

ParticipantData MakeParticipant(const std::string& user_id) {
    ParticipantData p;
    p.user_id = user_id;
    p.display_name = "User " + user_id;
    p.joined_at = 1100;
    return p;
}

// 可以从外部占住某个会议锁的存储
class HeldEntryStore : public InMemoryMeetingStore {
public:
    using InMemoryMeetingStore::InMemoryMeetingStore;

    // 在另一个线程持有锁, 直到 release 就绪
    std::thread Hold(const std::string& meeting_id, std::promise<void>& held, std::shared_future<void> release) {
        auto entry = FindEntry(meeting_id);
        return std::thread([entry, &held, release]() {
            EntryLock lock(entry->mutex);
            held.set_value();
            release.wait();
        });
    }
};

} // namespace

class InMemoryMeetingStoreTest : public ::testing::Test {
protected:
    InMemoryMeetingStore store_;
};

TEST_F(InMemoryMeetingStoreTest, CreateRejectsDuplicateId) {
    ASSERT_TRUE(store_.CreateMeeting(MakeMeeting("m1")).IsOk());
    auto dup = store_.CreateMeeting(MakeMeeting("m1"));
    ASSERT_FALSE(dup.IsOk());
    EXPECT_EQ(dup.GetStatus().Code(), StatusCode::kAlreadyExists);

    auto exists = store_.MeetingExists("m1");
    ASSERT_TRUE(exists.IsOk());
    EXPECT_TRUE(exists.Value());
    EXPECT_FALSE(store_.MeetingExists("m2").Value());
}

TEST_F(InMemoryMeetingStoreTest, GetUnknownMeetingIsNotFound) {
    auto missing = store_.GetMeeting("nope");
    ASSERT_FALSE(missing.IsOk());
    EXPECT_EQ(missing.GetStatus().Code(), StatusCode::kNotFound);
}

TEST_F(InMemoryMeetingStoreTest, AdmissionDecisions) {
    ASSERT_TRUE(store_.CreateMeeting(MakeMeeting("m1", 2, "secret")).IsOk());

    auto wrong = store_.TryAddParticipant("m1", MakeParticipant("u1"), "guess");
    ASSERT_TRUE(wrong.IsOk());
    EXPECT_EQ(wrong.Value().result, AdmissionResult::kWrongPassword);
    EXPECT_EQ(wrong.Value().active_count, 0);

    auto first = store_.TryAddParticipant("m1", MakeParticipant("u1"), "secret");
    ASSERT_TRUE(first.IsOk());
    EXPECT_EQ(first.Value().result, AdmissionResult::kAdmitted);
    EXPECT_EQ(first.Value().active_count, 1);

    auto again = store_.TryAddParticipant("m1", MakeParticipant("u1"), "secret");
    ASSERT_TRUE(again.IsOk());
    EXPECT_EQ(again.Value().result, AdmissionResult::kAlreadyActive);
    EXPECT_EQ(again.Value().active_count, 1);

    ASSERT_EQ(store_.TryAddParticipant("m1", MakeParticipant("u2"), "secret").Value().result,
              AdmissionResult::kAdmitted);
    auto full = store_.TryAddParticipant("m1", MakeParticipant("u3"), "secret");
    ASSERT_TRUE(full.IsOk());
    EXPECT_EQ(full.Value().result, AdmissionResult::kRoomFull);
    EXPECT_EQ(full.Value().active_count, 2);
}

// 重新加入追加新的参与记录, 旧记录保留
TEST_F(InMemoryMeetingStoreTest, RejoinAppendsNewRecord) {
    ASSERT_TRUE(store_.CreateMeeting(MakeMeeting("m1")).IsOk());
    ASSERT_EQ(store_.TryAddParticipant("m1", MakeParticipant("u1"), "").Value().result, AdmissionResult::kAdmitted);

    auto left = store_.MarkLeft("m1", "u1", 1200);
    ASSERT_TRUE(left.IsOk());
    EXPECT_TRUE(left.Value().changed);
    EXPECT_EQ(left.Value().active_count, 0);

    auto left_again = store_.MarkLeft("m1", "u1", 1300);
    ASSERT_TRUE(left_again.IsOk());
    EXPECT_FALSE(left_again.Value().changed);

    ASSERT_EQ(store_.TryAddParticipant("m1", MakeParticipant("u1"), "").Value().result, AdmissionResult::kAdmitted);
    auto meeting = store_.GetMeeting("m1");
    ASSERT_TRUE(meeting.IsOk());
    ASSERT_EQ(meeting.Value().participants.size(), 2u);
    EXPECT_EQ(meeting.Value().participants[0].left_at, 1200);
    EXPECT_TRUE(meeting.Value().participants[1].IsActive());
    EXPECT_EQ(meeting.Value().ActiveParticipantCount(), 1);
}

TEST_F(InMemoryMeetingStoreTest, ConcurrentAdmissionNeverExceedsCapacity) {
    constexpr int kCapacity = 6;
    constexpr int kCandidates = 40;
    ASSERT_TRUE(store_.CreateMeeting(MakeMeeting("m1", kCapacity)).IsOk());

    std::atomic<int> admitted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kCandidates; ++i) {
        threads.emplace_back([&, i]() {
            auto outcome = store_.TryAddParticipant("m1", MakeParticipant("user-" + std::to_string(i)), "");
            ASSERT_TRUE(outcome.IsOk());
            if (outcome.Value().result == AdmissionResult::kAdmitted) {
                ++admitted;
            } else if (outcome.Value().result == AdmissionResult::kRoomFull) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(admitted.load(), kCapacity);
    EXPECT_EQ(rejected.load(), kCandidates - kCapacity);
    EXPECT_EQ(store_.GetMeeting("m1").Value().ActiveParticipantCount(), kCapacity);
}

TEST_F(InMemoryMeetingStoreTest, SetStatusIsConditional) {
    ASSERT_TRUE(store_.CreateMeeting(MakeMeeting("m1")).IsOk());

    auto wrong_from = store_.SetStatus("m1", {MeetingStatus::kActive, MeetingStatus::kEnded, 2000, false});
    ASSERT_TRUE(wrong_from.IsOk());
    EXPECT_FALSE(wrong_from.Value());

    auto activated = store_.SetStatus("m1", {MeetingStatus::kScheduled, MeetingStatus::kActive, 2000, false});
    ASSERT_TRUE(activated.IsOk());
    EXPECT_TRUE(activated.Value());
    EXPECT_EQ(store_.GetMeeting("m1").Value().actual_start_time, 2000);

    auto again = store_.SetStatus("m1", {MeetingStatus::kScheduled, MeetingStatus::kActive, 2100, false});
    ASSERT_TRUE(again.IsOk());
    EXPECT_FALSE(again.Value());
    EXPECT_EQ(store_.GetMeeting("m1").Value().actual_start_time, 2000);
}

TEST_F(InMemoryMeetingStoreTest, IllegalTransitionIsInvalidState) {
    ASSERT_TRUE(store_.CreateMeeting(MakeMeeting("m1")).IsOk());
    auto backwards = store_.SetStatus("m1", {MeetingStatus::kEnded, MeetingStatus::kActive, 2000, false});
    ASSERT_FALSE(backwards.IsOk());
    EXPECT_EQ(backwards.GetStatus().Code(), StatusCode::kFailedPrecondition);
}

TEST_F(InMemoryMeetingStoreTest, EndingClosesParticipationAndRecordsDuration) {
    ASSERT_TRUE(store_.CreateMeeting(MakeMeeting("m1")).IsOk());
    ASSERT_EQ(store_.TryAddParticipant("m1", MakeParticipant("u1"), "").Value().result, AdmissionResult::kAdmitted);
    ASSERT_TRUE(store_.SetStatus("m1", {MeetingStatus::kScheduled, MeetingStatus::kActive, 2000, false}).Value());

    // 有人在会时 only_if_empty 不迁移
    auto guarded = store_.SetStatus("m1", {MeetingStatus::kActive, MeetingStatus::kEnded, 2600, true});
    ASSERT_TRUE(guarded.IsOk());
    EXPECT_FALSE(guarded.Value());

    auto ended = store_.SetStatus("m1", {MeetingStatus::kActive, MeetingStatus::kEnded, 2000 + 45 * 60, false});
    ASSERT_TRUE(ended.IsOk());
    EXPECT_TRUE(ended.Value());

    auto meeting = store_.GetMeeting("m1").Value();
    EXPECT_EQ(meeting.status, MeetingStatus::kEnded);
    EXPECT_EQ(meeting.ended_at, 2000 + 45 * 60);
    EXPECT_EQ(meeting.duration_minutes, 45);
    EXPECT_EQ(meeting.ActiveParticipantCount(), 0);
    EXPECT_EQ(meeting.participants[0].left_at, meeting.ended_at);

    auto late = store_.TryAddParticipant("m1", MakeParticipant("u2"), "");
    ASSERT_TRUE(late.IsOk());
    EXPECT_EQ(late.Value().result, AdmissionResult::kInvalidState);
}

TEST_F(InMemoryMeetingStoreTest, UpdateSettingsGuards) {
    ASSERT_TRUE(store_.CreateMeeting(MakeMeeting("m1", 4)).IsOk());
    for (const char* user : {"u1", "u2", "u3"}) {
        ASSERT_EQ(store_.TryAddParticipant("m1", MakeParticipant(user), "").Value().result, AdmissionResult::kAdmitted);
    }

    MeetingSettings smaller;
    smaller.max_participants = 2;
    auto shrink = store_.UpdateSettings("m1", smaller, 3000);
    EXPECT_EQ(shrink.Code(), StatusCode::kFailedPrecondition);

    MeetingSettings updated;
    updated.max_participants = 3;
    updated.allow_chat = false;
    ASSERT_TRUE(store_.UpdateSettings("m1", updated, 3000).IsOk());
    auto meeting = store_.GetMeeting("m1").Value();
    EXPECT_EQ(meeting.settings.max_participants, 3);
    EXPECT_FALSE(meeting.settings.allow_chat);
    EXPECT_EQ(meeting.updated_at, 3000);

    ASSERT_TRUE(store_.SetStatus("m1", {MeetingStatus::kScheduled, MeetingStatus::kEnded, 3100, false}).Value());
    EXPECT_EQ(store_.UpdateSettings("m1", updated, 3200).Code(), StatusCode::kFailedPrecondition);
}

TEST_F(InMemoryMeetingStoreTest, ListUserMeetingsFiltersAndPages) {
    for (int i = 0; i < 5; ++i) {
        auto meeting = MakeMeeting("m" + std::to_string(i));
        meeting.created_at = 1000 + i;
        ASSERT_TRUE(store_.CreateMeeting(meeting).IsOk());
    }
    auto other = MakeMeeting("other");
    other.host_user_id = "someone";
    other.created_by = "someone";
    ASSERT_TRUE(store_.CreateMeeting(other).IsOk());
    ASSERT_EQ(store_.TryAddParticipant("other", MakeParticipant("guest"), "").Value().result,
              AdmissionResult::kAdmitted);

    UserMeetingQuery query;
    query.user_id = "host";
    query.limit = 2;
    query.skip = 1;
    auto page = store_.ListUserMeetings(query);
    ASSERT_TRUE(page.IsOk());
    ASSERT_EQ(page.Value().size(), 2u);
    EXPECT_EQ(page.Value()[0].meeting_id, "m3");
    EXPECT_EQ(page.Value()[1].meeting_id, "m2");

    UserMeetingQuery guest;
    guest.user_id = "guest";
    auto joined = store_.ListUserMeetings(guest);
    ASSERT_TRUE(joined.IsOk());
    ASSERT_EQ(joined.Value().size(), 1u);
    EXPECT_EQ(joined.Value()[0].meeting_id, "other");

    guest.status = MeetingStatus::kEnded;
    EXPECT_TRUE(store_.ListUserMeetings(guest).Value().empty());
}

TEST(ComputeDurationMinutesTest, RoundsToNearestMinute) {
    EXPECT_EQ(ComputeDurationMinutes(0, 5000), 0);
    EXPECT_EQ(ComputeDurationMinutes(1000, 1000), 0);
    EXPECT_EQ(ComputeDurationMinutes(1000, 1000 + 89), 1);
    EXPECT_EQ(ComputeDurationMinutes(1000, 1000 + 90), 2);
    EXPECT_EQ(ComputeDurationMinutes(1000, 1000 + 3600), 60);
}

TEST(InMemoryMeetingStoreLockTest, ContendedMeetingLockIsUnavailable) {
    HeldEntryStore store(std::chrono::milliseconds(20));
    ASSERT_TRUE(store.CreateMeeting(MakeMeeting("m1")).IsOk());
    ASSERT_TRUE(store.CreateMeeting(MakeMeeting("m2")).IsOk());

    std::promise<void> held;
    std::promise<void> release;
    auto holder = store.Hold("m1", held, release.get_future().share());
    held.get_future().wait();

    EXPECT_EQ(store.GetMeeting("m1").GetStatus().Code(), StatusCode::kUnavailable);
    EXPECT_EQ(store.TryAddParticipant("m1", MakeParticipant("u1"), "").GetStatus().Code(),
              StatusCode::kUnavailable);
    EXPECT_EQ(store.MarkLeft("m1", "u1", 1200).GetStatus().Code(), StatusCode::kUnavailable);
    EXPECT_EQ(store.SetStatus("m1", StatusTransition{}).GetStatus().Code(), StatusCode::kUnavailable);
    EXPECT_EQ(store.FindByStatus(MeetingStatus::kScheduled).GetStatus().Code(), StatusCode::kUnavailable);

    // 其他会议不受影响
    EXPECT_EQ(store.TryAddParticipant("m2", MakeParticipant("u1"), "").Value().result, AdmissionResult::kAdmitted);

    release.set_value();
    holder.join();
    auto meeting = store.GetMeeting("m1");
    ASSERT_TRUE(meeting.IsOk());
    EXPECT_TRUE(meeting.Value().participants.empty());
}
