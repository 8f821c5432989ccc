#include "core/meeting/admission_controller.hpp"
#include "core/meeting/errors.hpp"
#include "core/meeting/lifecycle_manager.hpp"
#include "core/presence/connection.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace meetcoord::core;
using namespace meetcoord::common;
using meetcoord::core::presence::QueuedConnection;
using meetcoord::core::presence::RoomEvent;
using meetcoord::core::presence::RoomEventType;

namespace {

// Arm 之后下一次 TryAddParticipant 在返回前停住, 直到 Release
class GatedStore : public InMemoryMeetingStore {
public:
    std::future<void> Arm() {
        armed_ = true;
        entered_ = std::promise<void>();
        return entered_.get_future();
    }

    void Release() { release_.set_value(); }

    StatusOr<AdmissionOutcome> TryAddParticipant(const std::string& meeting_id,
                                                 const ParticipantData& participant,
                                                 const std::string& supplied_password) override {
        auto outcome = InMemoryMeetingStore::TryAddParticipant(meeting_id, participant, supplied_password);
        if (armed_.exchange(false)) {
            entered_.set_value();
            gate_.wait();
        }
        return outcome;
    }

private:
    std::atomic<bool> armed_{false};
    std::promise<void> entered_;
    std::promise<void> release_;
    std::shared_future<void> gate_{release_.get_future().share()};
};

} // namespace

class AdmissionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryMeetingStore>();
        broadcaster_ = std::make_shared<presence::PresenceBroadcaster>();
        lifecycle_ = std::make_shared<MeetingLifecycleManager>(LifecycleConfig{}, store_, broadcaster_);
        admission_ = std::make_unique<AdmissionController>(store_, lifecycle_, broadcaster_);
    }

    void CreateMeeting(const std::string& id, int max_participants, const std::string& password = "") {
        MeetingData data;
        data.meeting_id = id;
        data.title = "Review";
        data.host_user_id = "host";
        data.created_by = "host";
        data.settings.max_participants = max_participants;
        data.room_password = password;
        ASSERT_TRUE(store_->CreateMeeting(data).IsOk());
    }

    static JoinRequest Request(const std::string& meeting_id, const std::string& user, const std::string& password = "") {
        return JoinRequest{meeting_id, user, "Name " + user, user + "@example.com", password};
    }

    static std::shared_ptr<QueuedConnection> NewConnection(const std::string& user) {
        return std::make_shared<QueuedConnection>(presence::NewConnectionId(), user, 16);
    }

    std::shared_ptr<InMemoryMeetingStore> store_;
    std::shared_ptr<presence::PresenceBroadcaster> broadcaster_;
    std::shared_ptr<MeetingLifecycleManager> lifecycle_;
    std::unique_ptr<AdmissionController> admission_;
};

TEST_F(AdmissionControllerTest, FillsRoomUpToCapacity) {
    CreateMeeting("m1", 2);

    auto a = admission_->Join(Request("m1", "alice"));
    ASSERT_TRUE(a.IsOk()) << a.GetStatus().Message();
    EXPECT_EQ(a.Value().participant_count, 1);
    EXPECT_EQ(a.Value().meeting.status, MeetingStatus::kActive);
    EXPECT_EQ(a.Value().room_id, "room_m1");
    EXPECT_GT(a.Value().meeting.actual_start_time, 0);

    auto b = admission_->Join(Request("m1", "bob"));
    ASSERT_TRUE(b.IsOk());
    EXPECT_EQ(b.Value().participant_count, 2);

    auto c = admission_->Join(Request("m1", "carol"));
    ASSERT_FALSE(c.IsOk());
    EXPECT_EQ(MapStatus(c.GetStatus()), MeetingErrorCode::kRoomFull);
    EXPECT_EQ(store_->GetMeeting("m1").Value().ActiveParticipantCount(), 2);
}

TEST_F(AdmissionControllerTest, PasswordGate) {
    CreateMeeting("m1", 6, "abcd");

    auto wrong = admission_->Join(Request("m1", "alice", "wrong"));
    ASSERT_FALSE(wrong.IsOk());
    EXPECT_EQ(MapStatus(wrong.GetStatus()), MeetingErrorCode::kWrongPassword);

    auto missing = admission_->Join(Request("m1", "alice"));
    ASSERT_FALSE(missing.IsOk());
    EXPECT_EQ(MapStatus(missing.GetStatus()), MeetingErrorCode::kWrongPassword);

    auto meeting = store_->GetMeeting("m1").Value();
    EXPECT_TRUE(meeting.participants.empty());
    EXPECT_EQ(meeting.status, MeetingStatus::kScheduled);

    auto ok = admission_->Join(Request("m1", "alice", "abcd"));
    ASSERT_TRUE(ok.IsOk());
    EXPECT_EQ(ok.Value().participant_count, 1);
}

TEST_F(AdmissionControllerTest, RepeatedJoinReturnsExistingRecord) {
    CreateMeeting("m1", 2);
    ASSERT_TRUE(admission_->Join(Request("m1", "alice")).IsOk());

    auto again = admission_->Join(Request("m1", "alice"));
    ASSERT_TRUE(again.IsOk());
    EXPECT_TRUE(again.Value().already_active);
    EXPECT_EQ(again.Value().participant_count, 1);
    EXPECT_EQ(store_->GetMeeting("m1").Value().participants.size(), 1u);
}

TEST_F(AdmissionControllerTest, UnknownMeetingIsNotFound) {
    auto missing = admission_->Join(Request("ghost", "alice"));
    ASSERT_FALSE(missing.IsOk());
    EXPECT_EQ(MapStatus(missing.GetStatus()), MeetingErrorCode::kNotFound);
}

TEST_F(AdmissionControllerTest, RequiresIdentity) {
    CreateMeeting("m1", 2);
    auto no_name = admission_->Join(JoinRequest{"m1", "alice", "", "", ""});
    ASSERT_FALSE(no_name.IsOk());
    EXPECT_EQ(no_name.GetStatus().Code(), StatusCode::kInvalidArgument);
}

TEST_F(AdmissionControllerTest, LeaveIsIdempotent) {
    CreateMeeting("m1", 4);
    ASSERT_TRUE(admission_->Join(Request("m1", "alice")).IsOk());
    ASSERT_TRUE(admission_->Join(Request("m1", "bob")).IsOk());

    ASSERT_TRUE(admission_->Leave("m1", "alice").IsOk());
    const auto once = store_->GetMeeting("m1").Value();
    ASSERT_TRUE(admission_->Leave("m1", "alice").IsOk());
    const auto twice = store_->GetMeeting("m1").Value();

    EXPECT_EQ(once.ActiveParticipantCount(), 1);
    EXPECT_EQ(twice.ActiveParticipantCount(), 1);
    ASSERT_EQ(once.participants.size(), twice.participants.size());
    EXPECT_EQ(once.participants[0].left_at, twice.participants[0].left_at);

    // 从未加入的用户离开也不报错
    EXPECT_TRUE(admission_->Leave("m1", "nobody").IsOk());
}

TEST_F(AdmissionControllerTest, PresenceEventsReachOtherConnections) {
    CreateMeeting("m1", 4);
    auto alice = NewConnection("alice");
    auto bob = NewConnection("bob");
    ASSERT_TRUE(admission_->Join(Request("m1", "alice"), alice).IsOk());
    ASSERT_TRUE(admission_->Join(Request("m1", "bob"), bob).IsOk());

    RoomEvent event;
    ASSERT_TRUE(alice->Next(event, std::chrono::milliseconds(100)));
    EXPECT_EQ(event.type, RoomEventType::kParticipantJoined);
    EXPECT_EQ(event.user_id, "bob");
    EXPECT_EQ(event.active_participants, 2);
    // 加入者不会收到自己的加入事件
    EXPECT_FALSE(bob->Next(event, std::chrono::milliseconds(20)));

    ASSERT_TRUE(admission_->Leave("m1", "bob").IsOk());
    EXPECT_TRUE(bob->Closed());
    ASSERT_TRUE(alice->Next(event, std::chrono::milliseconds(100)));
    EXPECT_EQ(event.type, RoomEventType::kParticipantLeft);
    EXPECT_EQ(event.user_id, "bob");
    EXPECT_EQ(event.active_participants, 1);
    EXPECT_EQ(broadcaster_->ConnectionCount("room_m1"), 1u);
}

TEST_F(AdmissionControllerTest, JoinEndedMeetingIsInvalidState) {
    CreateMeeting("m1", 4);
    ASSERT_TRUE(lifecycle_->EndMeeting("m1", "host").IsOk());

    auto late = admission_->Join(Request("m1", "alice"), NewConnection("alice"));
    ASSERT_FALSE(late.IsOk());
    EXPECT_EQ(MapStatus(late.GetStatus()), MeetingErrorCode::kInvalidState);
    EXPECT_EQ(broadcaster_->ConnectionCount("room_m1"), 0u);
}

TEST_F(AdmissionControllerTest, ConcurrentJoinsRespectCapacity) {
    constexpr int kCapacity = 5;
    constexpr int kUsers = 32;
    CreateMeeting("m1", kCapacity);

    std::atomic<int> admitted{0};
    std::atomic<int> full{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kUsers; ++i) {
        threads.emplace_back([&, i]() {
            auto result = admission_->Join(Request("m1", "user-" + std::to_string(i)));
            if (result.IsOk()) {
                ++admitted;
            } else if (MapStatus(result.GetStatus()) == MeetingErrorCode::kRoomFull) {
                ++full;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(admitted.load(), kCapacity);
    EXPECT_EQ(full.load(), kUsers - kCapacity);
    auto meeting = store_->GetMeeting("m1").Value();
    EXPECT_EQ(meeting.ActiveParticipantCount(), kCapacity);
    EXPECT_EQ(meeting.status, MeetingStatus::kActive);
}

TEST_F(AdmissionControllerTest, DisconnectKeepsUserWhileAnotherConnectionLives) {
    CreateMeeting("m1", 4);
    auto first = NewConnection("alice");
    auto second = NewConnection("alice");
    ASSERT_TRUE(admission_->Join(Request("m1", "alice"), first).IsOk());
    ASSERT_TRUE(admission_->Join(Request("m1", "alice"), second).IsOk());

    ASSERT_TRUE(admission_->Disconnect("m1", "alice", first->Id()).IsOk());
    EXPECT_FALSE(second->Closed());
    EXPECT_TRUE(broadcaster_->HasUser("room_m1", "alice"));
    EXPECT_EQ(store_->GetMeeting("m1").Value().ActiveParticipantCount(), 1);

    ASSERT_TRUE(admission_->Disconnect("m1", "alice", second->Id()).IsOk());
    EXPECT_EQ(store_->GetMeeting("m1").Value().ActiveParticipantCount(), 0);
    EXPECT_EQ(broadcaster_->ConnectionCount("room_m1"), 0u);
}

// 旧连接的断开与同一用户的重连交错时, 新连接不能被关闭
TEST(AdmissionReconnectTest, DisconnectWaitsForConcurrentRejoin) {
    auto store = std::make_shared<GatedStore>();
    auto broadcaster = std::make_shared<presence::PresenceBroadcaster>();
    auto lifecycle = std::make_shared<MeetingLifecycleManager>(LifecycleConfig{}, store, broadcaster);
    AdmissionController admission(store, lifecycle, broadcaster);

    MeetingData data;
    data.meeting_id = "m1";
    data.host_user_id = "host";
    data.settings.max_participants = 4;
    ASSERT_TRUE(store->CreateMeeting(data).IsOk());

    const JoinRequest request{"m1", "alice", "Alice", "", ""};
    auto old_connection = std::make_shared<QueuedConnection>(presence::NewConnectionId(), "alice", 16);
    auto new_connection = std::make_shared<QueuedConnection>(presence::NewConnectionId(), "alice", 16);
    ASSERT_TRUE(admission.Join(request, old_connection).IsOk());

    auto entered = store->Arm();
    auto rejoin = std::async(std::launch::async, [&]() { return admission.Join(request, new_connection); });
    ASSERT_EQ(entered.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    auto disconnect = std::async(std::launch::async, [&]() {
        return admission.Disconnect("m1", "alice", old_connection->Id());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    store->Release();

    auto joined = rejoin.get();
    ASSERT_TRUE(joined.IsOk()) << joined.GetStatus().Message();
    EXPECT_TRUE(joined.Value().already_active);
    ASSERT_TRUE(disconnect.get().IsOk());

    EXPECT_FALSE(new_connection->Closed());
    EXPECT_TRUE(broadcaster->HasUser("room_m1", "alice"));
    EXPECT_EQ(broadcaster->ConnectionCount("room_m1"), 1u);
    EXPECT_EQ(store->GetMeeting("m1").Value().ActiveParticipantCount(), 1);
}
