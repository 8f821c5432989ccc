#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "common/striped_mutex.hpp"
#include "core/meeting/lifecycle_manager.hpp"
#include "core/meeting/meeting_store.hpp"
#include "core/presence/connection.hpp"
#include "core/presence/presence_broadcaster.hpp"

#include <memory>
#include <string>

namespace meetcoord {
namespace core {

struct JoinRequest {
    std::string meeting_id;
    std::string user_id;
    std::string display_name;
    std::string email;
    std::string room_password;
};

struct JoinResult {
    MeetingData meeting;
    std::string room_id;
    int participant_count = 0;
    bool already_active = false; // 重复加入, 返回已有的参与记录
};

// 入会与离会
//
// 容量, 密码与状态检查都下沉到 MeetingStore::TryAddParticipant 的单次原子操作.
// 这里的分段锁只按 (会议, 用户) 串行化同一参与者的加入与离开,
// 保证其 joined / left 事件不会乱序, 不同参与者之间互不阻塞.
class AdmissionController {
public:
    AdmissionController(std::shared_ptr<MeetingStore> store,
                        std::shared_ptr<MeetingLifecycleManager> lifecycle,
                        std::shared_ptr<presence::PresenceBroadcaster> broadcaster);

    common::StatusOr<JoinResult> Join(const JoinRequest& request,
                                      std::shared_ptr<presence::Connection> connection = nullptr);

    // 幂等; 关闭该用户在房间内的全部实时连接
    common::Status Leave(const std::string& meeting_id, const std::string& user_id);

    // 撤销单个实时连接; 该用户在房间内已无其他连接时才记为离开
    common::Status Disconnect(const std::string& meeting_id,
                              const std::string& user_id,
                              const std::string& connection_id);

private:
    std::mutex& ParticipantLock(const std::string& meeting_id, const std::string& user_id);
    common::Status RejectIfEnded(const std::string& meeting_id,
                                 const std::shared_ptr<presence::Connection>& connection);
    void AnnounceLeft(const std::string& meeting_id, const std::string& user_id, const LeaveOutcome& outcome);

private:
    std::shared_ptr<MeetingStore> store_;
    std::shared_ptr<MeetingLifecycleManager> lifecycle_;
    std::shared_ptr<presence::PresenceBroadcaster> broadcaster_;
    common::StripedMutex<> participant_locks_;
};

} // namespace core
} // namespace meetcoord
