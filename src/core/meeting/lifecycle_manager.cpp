#include "core/meeting/lifecycle_manager.hpp"
#include "common/clock.hpp"
#include "common/logger.hpp"
#include "core/meeting/errors.hpp"

#include <algorithm>
#include <chrono>

namespace meetcoord {
namespace core {

namespace {

presence::RoomEvent MeetingEndedEvent(const std::string& meeting_id, const char* reason, std::int64_t at) {
    presence::RoomEvent event;
    event.type = presence::RoomEventType::kMeetingEnded;
    event.meeting_id = meeting_id;
    event.room_id = RoomIdFor(meeting_id);
    event.active_participants = 0;
    event.body = reason;
    event.timestamp = at;
    return event;
}

} // namespace

MeetingLifecycleManager::MeetingLifecycleManager(common::LifecycleConfig config,
                                                 std::shared_ptr<MeetingStore> store,
                                                 std::shared_ptr<presence::PresenceBroadcaster> broadcaster)
    : config_(std::move(config))
    , store_(std::move(store))
    , broadcaster_(std::move(broadcaster)) {}

MeetingLifecycleManager::~MeetingLifecycleManager() {
    StopSweeper();
}

common::StatusOr<bool> MeetingLifecycleManager::Activate(const std::string& meeting_id) {
    StatusTransition transition{MeetingStatus::kScheduled, MeetingStatus::kActive, common::CurrentUnixSeconds(), false};
    auto result = store_->SetStatus(meeting_id, transition);
    if (result.IsOk() && result.Value()) {
        MEETCOORD_LOG_INFO("[Lifecycle] meeting {} is now active", meeting_id);
    }
    return result;
}

common::Status MeetingLifecycleManager::EndMeeting(const std::string& meeting_id, const std::string& requester_user_id) {
    auto meeting_or = store_->GetMeeting(meeting_id);
    if (!meeting_or.IsOk()) {
        return meeting_or.GetStatus();
    }
    const auto& meeting = meeting_or.Value();
    if (!meeting.IsHost(requester_user_id)) {
        return errors::Forbidden("only the host can end the meeting");
    }
    if (meeting.status == MeetingStatus::kEnded) {
        return common::Status::OK();
    }
    auto ended = Finalize(meeting_id, "ended-by-host", false);
    if (!ended.IsOk()) {
        return ended.GetStatus();
    }
    return common::Status::OK();
}

common::Status MeetingLifecycleManager::OnRoomEmpty(const std::string& meeting_id) {
    if (!config_.end_when_empty) {
        // 交给空闲巡检
        return common::Status::OK();
    }
    auto ended = Finalize(meeting_id, "room-empty", true);
    if (!ended.IsOk()) {
        return ended.GetStatus();
    }
    return common::Status::OK();
}

// 迁移条件完全交给存储层在会议锁内判断, 不依赖任何先读出的状态
common::StatusOr<bool> MeetingLifecycleManager::Finalize(const std::string& meeting_id,
                                                         const char* reason,
                                                         bool only_if_empty) {
    const auto now = common::CurrentUnixSeconds();
    StatusTransition transition;
    transition.to = MeetingStatus::kEnded;
    transition.at = now;
    if (only_if_empty) {
        transition.from = MeetingStatus::kActive;
        transition.only_if_empty = true;
    } else {
        transition.from_any_live = true;
    }
    auto result = store_->SetStatus(meeting_id, transition);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    if (!result.Value()) {
        return common::StatusOr<bool>(false);
    }
    auto closed = broadcaster_->CloseRoom(RoomIdFor(meeting_id), MeetingEndedEvent(meeting_id, reason, now));
    MEETCOORD_LOG_INFO("[Lifecycle] meeting {} ended ({}), closed {} connection(s)", meeting_id, reason, closed);
    return common::StatusOr<bool>(true);
}

SweepReport MeetingLifecycleManager::SweepIdle(std::int64_t now) {
    SweepReport report;
    if (config_.stale_connection_seconds > 0) {
        report.stale_connections = broadcaster_->CloseStale(now, config_.stale_connection_seconds);
        StaleHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = stale_handler_;
        }
        for (const auto& stale : report.stale_connections) {
            MEETCOORD_LOG_WARN("[Lifecycle] closing stale connection {} of user {} in {}",
                               stale.connection_id, stale.user_id, stale.room_id);
            if (handler) {
                handler(stale);
            }
        }
    }

    auto active = store_->FindByStatus(MeetingStatus::kActive);
    if (!active.IsOk()) {
        MEETCOORD_LOG_ERROR("[Lifecycle] sweep failed to list active meetings: {}", active.GetStatus().Message());
        return report;
    }
    for (const auto& meeting : active.Value()) {
        if (meeting.ActiveParticipantCount() > 0) {
            continue;
        }
        if (now - meeting.IdleSince() < config_.idle_grace_seconds) {
            continue;
        }
        auto ended = Finalize(meeting.meeting_id, "idle-timeout", true);
        if (!ended.IsOk()) {
            MEETCOORD_LOG_WARN("[Lifecycle] idle end of {} failed: {}", meeting.meeting_id, ended.GetStatus().Message());
            continue;
        }
        if (ended.Value()) {
            report.ended_meetings.push_back(meeting.meeting_id);
        }
    }
    return report;
}

void MeetingLifecycleManager::SetStaleHandler(StaleHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    stale_handler_ = std::move(handler);
}

void MeetingLifecycleManager::StartSweeper() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    if (!sweep_stop_ || config_.sweep_interval_ms <= 0) {
        return;
    }
    sweep_stop_ = false;
    sweeper_ = std::thread(&MeetingLifecycleManager::SweepLoop, this);
}

void MeetingLifecycleManager::StopSweeper() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        sweep_stop_ = true;
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

void MeetingLifecycleManager::SweepLoop() {
    const auto interval = std::chrono::milliseconds(config_.sweep_interval_ms);
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!sweep_stop_) {
        if (sweep_cv_.wait_for(lock, interval, [this]() { return sweep_stop_; })) {
            break;
        }
        lock.unlock();
        auto report = SweepIdle(common::CurrentUnixSeconds());
        if (!report.ended_meetings.empty() || !report.stale_connections.empty()) {
            MEETCOORD_LOG_INFO("[Lifecycle] sweep ended {} meeting(s), closed {} stale connection(s)",
                               report.ended_meetings.size(), report.stale_connections.size());
        }
        lock.lock();
    }
}

} // namespace core
} // namespace meetcoord
