#pragma once

#include "cache/redis_client.hpp"
#include "core/meeting/meeting_store.hpp"

#include <memory>
#include <string>

namespace meetcoord {
namespace core {

// 带 Redis 读缓存的会议存储包装器
//
// 只缓存单个会议的快照; 任何写操作先落主存储再删除缓存键,
// 原子准入, 离开与状态迁移始终由主存储完成.
class CachedMeetingStore : public MeetingStore {
public:
    CachedMeetingStore(std::shared_ptr<MeetingStore> primary,
                       std::shared_ptr<cache::RedisClient> redis,
                       int ttl_seconds = 300);

    common::StatusOr<MeetingData> CreateMeeting(const MeetingData& data) override;
    common::StatusOr<MeetingData> GetMeeting(const std::string& meeting_id) const override;
    common::StatusOr<bool> MeetingExists(const std::string& meeting_id) const override;
    common::Status UpdateSettings(const std::string& meeting_id,
                                  const MeetingSettings& settings,
                                  std::int64_t updated_at) override;
    common::StatusOr<bool> SetStatus(const std::string& meeting_id,
                                     const StatusTransition& transition) override;
    common::StatusOr<AdmissionOutcome> TryAddParticipant(const std::string& meeting_id,
                                                         const ParticipantData& participant,
                                                         const std::string& supplied_password) override;
    common::StatusOr<LeaveOutcome> MarkLeft(const std::string& meeting_id,
                                            const std::string& user_id,
                                            std::int64_t left_at) override;
    common::StatusOr<std::vector<MeetingData>> FindByStatus(MeetingStatus status) const override;
    common::StatusOr<std::vector<MeetingData>> ListUserMeetings(const UserMeetingQuery& query) const override;

    static std::string KeyForId(const std::string& meeting_id);

private:
    bool HasCache() const { return static_cast<bool>(redis_); }

    common::Status CachePut(const MeetingData& data) const;
    common::StatusOr<MeetingData> CacheGet(const std::string& meeting_id) const;
    void Invalidate(const std::string& meeting_id, const char* operation) const;

private:
    std::shared_ptr<MeetingStore> primary_;
    std::shared_ptr<cache::RedisClient> redis_;
    int ttl_seconds_;
};

// 会议快照的缓存编码
std::string EncodeMeeting(const MeetingData& data);
common::StatusOr<MeetingData> DecodeMeeting(const std::string& payload);

} // namespace core
} // namespace meetcoord
