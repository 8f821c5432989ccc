#pragma once

#include "core/meeting/meeting_store.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace meetcoord {
namespace storage {

// 基于 MySQL 的会议存储
//
// 准入, 离开与状态迁移都在事务内先对 meetings 行加 FOR UPDATE 行锁,
// 同一会议的并发修改在数据库侧串行化, 多个服务实例共享同一份状态.
class MySqlMeetingStore : public core::MeetingStore {
public:
    explicit MySqlMeetingStore(std::shared_ptr<ConnectionPool> pool);

    common::StatusOr<core::MeetingData> CreateMeeting(const core::MeetingData& data) override;
    common::StatusOr<core::MeetingData> GetMeeting(const std::string& meeting_id) const override;
    common::StatusOr<bool> MeetingExists(const std::string& meeting_id) const override;
    common::Status UpdateSettings(const std::string& meeting_id,
                                  const core::MeetingSettings& settings,
                                  std::int64_t updated_at) override;
    common::StatusOr<bool> SetStatus(const std::string& meeting_id,
                                     const core::StatusTransition& transition) override;
    common::StatusOr<core::AdmissionOutcome> TryAddParticipant(const std::string& meeting_id,
                                                               const core::ParticipantData& participant,
                                                               const std::string& supplied_password) override;
    common::StatusOr<core::LeaveOutcome> MarkLeft(const std::string& meeting_id,
                                                  const std::string& user_id,
                                                  std::int64_t left_at) override;
    common::StatusOr<std::vector<core::MeetingData>> FindByStatus(core::MeetingStatus status) const override;
    common::StatusOr<std::vector<core::MeetingData>> ListUserMeetings(const core::UserMeetingQuery& query) const override;

private:
    // 会议行与其自增主键
    struct MeetingRow {
        std::uint64_t id = 0;
        core::MeetingData data;
    };

    // 按 meeting_id 读取会议及参与记录, lock_row 为 true 时加行锁
    static common::StatusOr<MeetingRow> LoadMeeting(MYSQL* conn, const std::string& meeting_id, bool lock_row);
    // 执行会议查询并补齐参与记录, tail 为 WHERE / ORDER BY / LIMIT 子句
    static common::StatusOr<std::vector<MeetingRow>> QueryRows(MYSQL* conn, const std::string& tail);
    static common::StatusOr<std::vector<core::MeetingData>> LoadMeetings(MYSQL* conn, const std::string& tail);
    static common::Status LoadParticipants(MYSQL* conn, std::vector<MeetingRow>& rows);

private:
    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace meetcoord
