#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/meeting/meeting_store.hpp"
#include "core/presence/presence_broadcaster.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace meetcoord {
namespace core {

struct SweepReport {
    std::vector<std::string> ended_meetings;
    std::vector<presence::StaleConnection> stale_connections;
};

// 会议状态机: scheduled -> active -> ended
//
// 所有迁移都是存储层的原子条件更新, 并发触发时只有一方真正迁移,
// 另一方视为成功的空操作.
class MeetingLifecycleManager {
public:
    using StaleHandler = std::function<void(const presence::StaleConnection&)>;

    MeetingLifecycleManager(common::LifecycleConfig config,
                            std::shared_ptr<MeetingStore> store,
                            std::shared_ptr<presence::PresenceBroadcaster> broadcaster);
    ~MeetingLifecycleManager();

    MeetingLifecycleManager(const MeetingLifecycleManager&) = delete;
    MeetingLifecycleManager& operator=(const MeetingLifecycleManager&) = delete;

    // 首次入会触发
    common::StatusOr<bool> Activate(const std::string& meeting_id);

    // 主持人结束会议; 非主持人返回 Forbidden, 已结束视为成功
    common::Status EndMeeting(const std::string& meeting_id, const std::string& requester_user_id);

    // 最后一人离开
    common::Status OnRoomEmpty(const std::string& meeting_id);

    // 关闭心跳超时的连接, 结束空闲超过宽限期的会议
    SweepReport SweepIdle(std::int64_t now);

    void SetStaleHandler(StaleHandler handler);

    void StartSweeper();
    void StopSweeper();

    const common::LifecycleConfig& Config() const { return config_; }

private:
    // 从任意非终止状态迁移到 ended, 返回本次是否完成迁移
    common::StatusOr<bool> Finalize(const std::string& meeting_id, const char* reason, bool only_if_empty);
    void SweepLoop();

private:
    common::LifecycleConfig config_;
    std::shared_ptr<MeetingStore> store_;
    std::shared_ptr<presence::PresenceBroadcaster> broadcaster_;

    std::mutex handler_mutex_;
    StaleHandler stale_handler_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool sweep_stop_ = true;
    std::thread sweeper_;
};

} // namespace core
} // namespace meetcoord
