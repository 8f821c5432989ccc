#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "common/striped_mutex.hpp"
#include "core/chat/chat_log.hpp"
#include "core/meeting/admission_controller.hpp"
#include "core/meeting/identifier_allocator.hpp"
#include "core/meeting/lifecycle_manager.hpp"
#include "core/meeting/meeting_data.hpp"
#include "core/meeting/meeting_store.hpp"
#include "core/presence/presence_broadcaster.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meetcoord {
namespace core {

struct MeetingManagerConfig {
    common::MeetingConfig meeting;
    common::LifecycleConfig lifecycle;
    common::ChatConfig chat;
};

struct CreateMeetingCommand {
    std::string title;
    std::string description;
    std::string host_user_id;
    std::int64_t scheduled_start_time = 0;
    std::optional<MeetingSettings> settings; // 缺省使用默认设置
    std::string room_password;
};

struct UpdateSettingsCommand {
    std::string meeting_id;
    std::string requester_user_id;
    MeetingSettings settings;
};

struct SendChatCommand {
    std::string meeting_id;
    std::string user_id;
    std::string body;
};

// 入会前的公开信息, 不含密码与名单
struct JoinInfo {
    std::string meeting_id;
    std::string title;
    std::string description;
    MeetingStatus status = MeetingStatus::kScheduled;
    int max_participants = 0;
    int current_participants = 0;
    bool requires_password = false;
    bool allow_chat = true;
    bool allow_screen_share = true;
    bool is_joinable = false;
    bool is_full = false;
};

// 会议协调入口, 供传输层调用
class MeetingManager {
public:
    using Status = common::Status;
    using StatusOrMeeting = common::StatusOr<MeetingData>;

    explicit MeetingManager(MeetingManagerConfig config = MeetingManagerConfig{},
                            std::shared_ptr<MeetingStore> store = nullptr,
                            std::shared_ptr<ChatLog> chat_log = nullptr,
                            std::shared_ptr<presence::PresenceBroadcaster> broadcaster = nullptr);
    ~MeetingManager();

    StatusOrMeeting CreateMeeting(const CreateMeetingCommand& command);
    StatusOrMeeting GetMeeting(const std::string& meeting_id);
    common::StatusOr<JoinInfo> GetJoinInfo(const std::string& meeting_id);

    common::StatusOr<JoinResult> JoinMeeting(const JoinRequest& request,
                                             std::shared_ptr<presence::Connection> connection = nullptr);
    Status LeaveMeeting(const std::string& meeting_id, const std::string& user_id);
    // 实时连接断开: 只注销该连接, 用户在房间内已无其他连接时才离会
    Status DisconnectLive(const std::string& meeting_id,
                          const std::string& user_id,
                          const std::string& connection_id);
    Status EndMeeting(const std::string& meeting_id, const std::string& requester_user_id);
    StatusOrMeeting UpdateSettings(const UpdateSettingsCommand& command);

    common::StatusOr<ChatMessage> SendChat(const SendChatCommand& command);
    common::StatusOr<std::vector<ChatMessage>> GetChatHistory(ChatQuery query);

    common::StatusOr<std::vector<MeetingData>> ListActiveMeetings();
    common::StatusOr<std::vector<MeetingData>> ListUserMeetings(UserMeetingQuery query);

    presence::RoomStats GetRoomStats() const;

    SweepReport SweepIdle(std::int64_t now);
    void StartBackgroundSweep();
    void StopBackgroundSweep();

    const MeetingManagerConfig& Config() const { return config_; }

private:
    Status ValidateSettings(const MeetingSettings& settings) const;
    common::StatusOr<std::string> NormalizeMeetingId(const std::string& raw) const;

private:
    MeetingManagerConfig config_;
    std::shared_ptr<MeetingStore> store_;
    std::shared_ptr<ChatLog> chat_log_;
    std::shared_ptr<presence::PresenceBroadcaster> broadcaster_;
    std::shared_ptr<MeetingLifecycleManager> lifecycle_;
    std::unique_ptr<IdentifierAllocator> allocator_;
    std::unique_ptr<AdmissionController> admission_;
    common::StripedMutex<> chat_locks_; // 追加与广播在同一把锁内, 广播顺序等于序号顺序
};

} // namespace core
} // namespace meetcoord
