#include "cache/redis_client.hpp"
#include "core/meeting/cached_meeting_store.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace meetcoord::core;
using namespace meetcoord::common;

namespace {

MeetingData SampleMeeting(const std::string& id) {
    MeetingData data;
    data.meeting_id = id;
    data.title = "Sprint Review";
    data.description = "demo";
    data.host_user_id = "host";
    data.created_by = "host";
    data.status = MeetingStatus::kActive;
    data.settings.max_participants = 4;
    data.settings.allow_recording = true;
    data.room_password = "abcd";
    data.actual_start_time = 1700000000;
    data.created_at = 1699999000;
    data.updated_at = 1700000000;
    ParticipantData p;
    p.user_id = "alice";
    p.display_name = "Alice";
    p.joined_at = 1700000001;
    data.participants.push_back(p);
    p.user_id = "bob";
    p.display_name = "Bob";
    p.left_at = 1700000100;
    data.participants.push_back(p);
    return data;
}

ParticipantData Participant(const std::string& user_id) {
    ParticipantData p;
    p.user_id = user_id;
    p.display_name = user_id;
    return p;
}

RedisConfig RedisConfigFromEnv() {
    RedisConfig cfg;
    cfg.enabled = true;
    if (const char* host = std::getenv("REDIS_HOST")) cfg.host = host;
    if (const char* port = std::getenv("REDIS_PORT")) cfg.port = std::atoi(port);
    if (const char* pass = std::getenv("REDIS_PASSWORD")) cfg.password = pass;
    return cfg;
}

} // namespace

TEST(MeetingCacheCodecTest, EncodeDecodeKeepsSnapshot) {
    const auto snapshot = SampleMeeting("abc123");
    auto decoded = DecodeMeeting(EncodeMeeting(snapshot));
    ASSERT_TRUE(decoded.IsOk()) << decoded.GetStatus().Message();

    const auto& data = decoded.Value();
    EXPECT_EQ(data.meeting_id, snapshot.meeting_id);
    EXPECT_EQ(data.status, MeetingStatus::kActive);
    EXPECT_EQ(data.settings.max_participants, 4);
    EXPECT_TRUE(data.settings.allow_recording);
    EXPECT_EQ(data.room_password, "abcd");
    ASSERT_EQ(data.participants.size(), 2u);
    EXPECT_TRUE(data.participants[0].IsActive());
    EXPECT_EQ(data.participants[1].left_at, 1700000100);
    EXPECT_EQ(data.ActiveParticipantCount(), 1);
    EXPECT_EQ(data.actual_start_time, 1700000000);
}

TEST(MeetingCacheCodecTest, RejectsCorruptPayload) {
    EXPECT_EQ(DecodeMeeting("not json").GetStatus().Code(), StatusCode::kUnavailable);
    EXPECT_EQ(DecodeMeeting("[]").GetStatus().Code(), StatusCode::kUnavailable);
    EXPECT_EQ(DecodeMeeting(R"({"meeting_id":"x","status":9})").GetStatus().Code(), StatusCode::kUnavailable);
    EXPECT_EQ(DecodeMeeting(R"({"title":"no id"})").GetStatus().Code(), StatusCode::kUnavailable);
    EXPECT_EQ(DecodeMeeting(R"({"meeting_id":"x","title":42})").GetStatus().Code(), StatusCode::kUnavailable);
}

// 缓存不可用时所有操作回落到主存储
TEST(CachedMeetingStoreTest, FallsBackWhenCacheUnavailable) {
    RedisConfig disabled;
    disabled.enabled = false;
    auto primary = std::make_shared<InMemoryMeetingStore>();
    CachedMeetingStore store(primary, std::make_shared<meetcoord::cache::RedisClient>(disabled), 60);

    auto meeting = SampleMeeting("fallback1");
    meeting.participants.clear();
    meeting.status = MeetingStatus::kScheduled;
    ASSERT_TRUE(store.CreateMeeting(meeting).IsOk());
    EXPECT_TRUE(store.MeetingExists("fallback1").Value());

    auto outcome = store.TryAddParticipant("fallback1", Participant("alice"), "abcd");
    ASSERT_TRUE(outcome.IsOk());
    EXPECT_EQ(outcome.Value().result, AdmissionResult::kAdmitted);

    auto fetched = store.GetMeeting("fallback1");
    ASSERT_TRUE(fetched.IsOk());
    EXPECT_EQ(fetched.Value().ActiveParticipantCount(), 1);
}

class CachedMeetingStoreRedisTest : public ::testing::Test {
protected:
    void SetUp() override {
        redis_ = std::make_shared<meetcoord::cache::RedisClient>(RedisConfigFromEnv());
        auto ping = redis_->Ping();
        if (!ping.IsOk()) {
            GTEST_SKIP() << "redis unavailable: " << ping.Message();
        }
        primary_ = std::make_shared<InMemoryMeetingStore>();
        store_ = std::make_unique<CachedMeetingStore>(primary_, redis_, 60);
        ASSERT_TRUE(redis_->Del(CachedMeetingStore::KeyForId("cached1")).IsOk());
    }

    void TearDown() override {
        if (redis_ && store_) {
            auto status = redis_->Del(CachedMeetingStore::KeyForId("cached1"));
            EXPECT_TRUE(status.IsOk()) << status.Message();
        }
    }

    std::shared_ptr<meetcoord::cache::RedisClient> redis_;
    std::shared_ptr<InMemoryMeetingStore> primary_;
    std::unique_ptr<CachedMeetingStore> store_;
};

TEST_F(CachedMeetingStoreRedisTest, ReadThroughPopulatesCache) {
    auto meeting = SampleMeeting("cached1");
    meeting.participants.clear();
    ASSERT_TRUE(store_->CreateMeeting(meeting).IsOk());
    EXPECT_FALSE(redis_->Exists(CachedMeetingStore::KeyForId("cached1")).Value());

    ASSERT_TRUE(store_->GetMeeting("cached1").IsOk());
    EXPECT_TRUE(redis_->Exists(CachedMeetingStore::KeyForId("cached1")).Value());
}

TEST_F(CachedMeetingStoreRedisTest, WritesInvalidateSnapshot) {
    auto meeting = SampleMeeting("cached1");
    meeting.participants.clear();
    ASSERT_TRUE(store_->CreateMeeting(meeting).IsOk());
    ASSERT_TRUE(store_->GetMeeting("cached1").IsOk());

    auto outcome = store_->TryAddParticipant("cached1", Participant("alice"), "abcd");
    ASSERT_TRUE(outcome.IsOk());
    ASSERT_EQ(outcome.Value().result, AdmissionResult::kAdmitted);
    EXPECT_FALSE(redis_->Exists(CachedMeetingStore::KeyForId("cached1")).Value());

    auto fetched = store_->GetMeeting("cached1");
    ASSERT_TRUE(fetched.IsOk());
    EXPECT_EQ(fetched.Value().ActiveParticipantCount(), 1);

    ASSERT_TRUE(store_->MarkLeft("cached1", "alice", 1700000500).Value().changed);
    EXPECT_FALSE(redis_->Exists(CachedMeetingStore::KeyForId("cached1")).Value());
    EXPECT_EQ(store_->GetMeeting("cached1").Value().ActiveParticipantCount(), 0);
}
