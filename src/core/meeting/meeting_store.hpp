#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/meeting/meeting_data.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meetcoord {
namespace core {

// 准入判定结果
enum class AdmissionResult {
    kAdmitted = 0,
    kAlreadyActive,
    kWrongPassword,
    kRoomFull,
    kInvalidState,
};

struct AdmissionOutcome {
    AdmissionResult result = AdmissionResult::kInvalidState;
    MeetingData meeting;   // 操作完成后的会议快照
    int active_count = 0;  // 操作完成后的在会人数
};

struct LeaveOutcome {
    bool changed = false;  // 本次调用是否真正标记了离开
    int active_count = 0;
    MeetingStatus status = MeetingStatus::kScheduled;
};

// 条件状态迁移: 仅当当前状态等于 from 时才迁移到 to
struct StatusTransition {
    MeetingStatus from = MeetingStatus::kScheduled;
    MeetingStatus to = MeetingStatus::kActive;
    std::int64_t at = 0;
    bool only_if_empty = false; // 额外要求无人在会
    bool from_any_live = false; // 忽略 from, 未结束即可迁移; 只用于迁移到 ended
};

// 检查迁移本身是否合法
common::Status ValidateTransition(const StatusTransition& transition);
// 在持有会议锁时判断迁移是否适用于当前状态
bool TransitionApplies(const StatusTransition& transition, const MeetingData& data);

struct UserMeetingQuery {
    std::string user_id;
    std::optional<MeetingStatus> status;
    int limit = 20;
    int skip = 0;
};

// 会议存储接口
class MeetingStore {
public:
    virtual ~MeetingStore() = default;

    // 创建新会议, ID 重复时返回 AlreadyExists
    virtual common::StatusOr<MeetingData> CreateMeeting(const MeetingData& data) = 0;

    virtual common::StatusOr<MeetingData> GetMeeting(const std::string& meeting_id) const = 0;

    virtual common::StatusOr<bool> MeetingExists(const std::string& meeting_id) const = 0;

    // 更新会议设置, 已结束的会议或容量低于当前在会人数时失败
    virtual common::Status UpdateSettings(const std::string& meeting_id,
                                          const MeetingSettings& settings,
                                          std::int64_t updated_at) = 0;

    // 原子条件迁移, 返回本次调用是否完成迁移
    // 进入 active 记录实际开始时间; 进入 ended 记录结束时间与时长, 并把所有在会者标记为离开
    virtual common::StatusOr<bool> SetStatus(const std::string& meeting_id,
                                             const StatusTransition& transition) = 0;

    // 原子准入: 状态, 密码, 重复加入, 容量检查与追加在同一操作内完成
    virtual common::StatusOr<AdmissionOutcome> TryAddParticipant(const std::string& meeting_id,
                                                                 const ParticipantData& participant,
                                                                 const std::string& supplied_password) = 0;

    // 标记离开, 重复调用无副作用
    virtual common::StatusOr<LeaveOutcome> MarkLeft(const std::string& meeting_id,
                                                    const std::string& user_id,
                                                    std::int64_t left_at) = 0;

    virtual common::StatusOr<std::vector<MeetingData>> FindByStatus(MeetingStatus status) const = 0;

    // 用户创建或参加过的会议, 按创建时间倒序
    virtual common::StatusOr<std::vector<MeetingData>> ListUserMeetings(const UserMeetingQuery& query) const = 0;
};

class InMemoryMeetingStore : public MeetingStore {
public:
    explicit InMemoryMeetingStore(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(2000));

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

protected:
    // 每个会议一把锁, 不同会议之间互不竞争
    struct Entry {
        mutable std::timed_mutex mutex;
        MeetingData data;
    };
    using EntryLock = std::unique_lock<std::timed_mutex>;

    std::shared_ptr<Entry> FindEntry(const std::string& meeting_id) const;
    std::vector<std::shared_ptr<Entry>> SnapshotEntries() const;
    common::Status LockEntry(const Entry& entry, EntryLock& lock) const;

private:
    std::chrono::milliseconds lock_timeout_;
    mutable std::shared_mutex mutex_; // 只保护 meetings_ 的查找与插入
    std::unordered_map<std::string, std::shared_ptr<Entry>> meetings_;
};

// 结束会议时计算时长(分钟, 四舍五入)
std::int64_t ComputeDurationMinutes(std::int64_t started_at, std::int64_t ended_at);

} // namespace core
} // namespace meetcoord
