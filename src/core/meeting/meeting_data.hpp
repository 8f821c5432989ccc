#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace meetcoord {
namespace core {

enum class MeetingStatus {
    kScheduled = 0,
    kActive,
    kEnded,
};

struct MeetingSettings {
    int  max_participants   = 6;
    bool is_public          = false;
    bool require_approval   = false;
    bool allow_chat         = true;
    bool allow_screen_share = true;
    bool allow_recording    = false;
    bool mute_on_entry      = false;
};

struct ParticipantData {
    std::string  user_id;       // 用户ID
    std::string  display_name;  // 显示名称
    std::string  email;         // 邮箱, 可为空
    std::int64_t joined_at = 0; // 加入时间
    std::int64_t left_at   = 0; // 离开时间, 0 表示仍在会议中

    bool IsActive() const { return left_at == 0; }
};

struct MeetingData {
    std::string                  meeting_id;    // 会议ID, 对外分享
    std::string                  title;         // 会议标题
    std::string                  description;   // 会议描述
    std::string                  host_user_id;  // 主持人用户ID
    std::string                  created_by;    // 创建者用户ID
    MeetingStatus                status = MeetingStatus::kScheduled;
    MeetingSettings              settings;
    std::string                  room_password; // 入会密码, 空表示无需密码
    std::vector<ParticipantData> participants;  // 参与记录, 离开后保留
    std::int64_t                 scheduled_start_time = 0;
    std::int64_t                 actual_start_time    = 0;
    std::int64_t                 ended_at             = 0;
    std::int64_t                 duration_minutes     = 0;
    std::int64_t                 created_at           = 0;
    std::int64_t                 updated_at           = 0;

    std::string RoomId() const;

    int ActiveParticipantCount() const {
        return static_cast<int>(std::count_if(participants.begin(), participants.end(),
            [](const ParticipantData& p) { return p.IsActive(); }));
    }

    bool IsHost(const std::string& user_id) const {
        const auto& host = host_user_id.empty() ? created_by : host_user_id;
        return !user_id.empty() && user_id == host;
    }

    bool RequiresPassword() const { return !room_password.empty(); }

    bool IsJoinable() const { return status != MeetingStatus::kEnded; }

    bool IsFull() const { return ActiveParticipantCount() >= settings.max_participants; }

    const ParticipantData* FindActive(const std::string& user_id) const;
    ParticipantData* FindActive(const std::string& user_id);

    // 最后一次有人在场的时间, 用于空闲判断
    std::int64_t IdleSince() const;
};

std::string RoomIdFor(const std::string& meeting_id);
std::string MeetingStatusToString(MeetingStatus status);
bool ParseMeetingStatus(const std::string& text, MeetingStatus* status);

// 生命周期只允许 scheduled -> active -> ended 以及 scheduled -> ended
bool IsLegalTransition(MeetingStatus from, MeetingStatus to);

} // namespace core
} // namespace meetcoord
