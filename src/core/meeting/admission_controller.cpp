#include "core/meeting/admission_controller.hpp"
#include "common/clock.hpp"
#include "common/logger.hpp"
#include "core/meeting/errors.hpp"

namespace meetcoord {
namespace core {

namespace {

presence::RoomEvent PresenceEvent(presence::RoomEventType type,
                                  const std::string& meeting_id,
                                  const std::string& user_id,
                                  const std::string& display_name,
                                  int active_participants) {
    presence::RoomEvent event;
    event.type = type;
    event.meeting_id = meeting_id;
    event.room_id = RoomIdFor(meeting_id);
    event.user_id = user_id;
    event.display_name = display_name;
    event.active_participants = active_participants;
    event.timestamp = common::CurrentUnixSeconds();
    return event;
}

} // namespace

AdmissionController::AdmissionController(std::shared_ptr<MeetingStore> store,
                                         std::shared_ptr<MeetingLifecycleManager> lifecycle,
                                         std::shared_ptr<presence::PresenceBroadcaster> broadcaster)
    : store_(std::move(store))
    , lifecycle_(std::move(lifecycle))
    , broadcaster_(std::move(broadcaster)) {}

std::mutex& AdmissionController::ParticipantLock(const std::string& meeting_id, const std::string& user_id) {
    return participant_locks_.For(meeting_id + '\n' + user_id);
}

common::StatusOr<JoinResult> AdmissionController::Join(const JoinRequest& request,
                                                       std::shared_ptr<presence::Connection> connection) {
    if (request.meeting_id.empty()) {
        return common::Status::InvalidArgument("meeting id is required");
    }
    if (request.user_id.empty()) {
        return common::Status::InvalidArgument("user id is required");
    }
    if (request.display_name.empty()) {
        return common::Status::InvalidArgument("display name is required");
    }

    std::lock_guard<std::mutex> guard(ParticipantLock(request.meeting_id, request.user_id));

    auto meeting_or = store_->GetMeeting(request.meeting_id);
    if (!meeting_or.IsOk()) {
        return meeting_or.GetStatus();
    }
    if (meeting_or.Value().status == MeetingStatus::kEnded) {
        return errors::InvalidState("meeting has ended");
    }

    ParticipantData participant;
    participant.user_id = request.user_id;
    participant.display_name = request.display_name;
    participant.email = request.email;
    participant.joined_at = common::CurrentUnixSeconds();

    auto outcome_or = store_->TryAddParticipant(request.meeting_id, participant, request.room_password);
    if (!outcome_or.IsOk()) {
        return outcome_or.GetStatus();
    }
    auto& outcome = outcome_or.Value();
    switch (outcome.result) {
        case AdmissionResult::kInvalidState:
            return errors::InvalidState("meeting has ended");
        case AdmissionResult::kWrongPassword:
            return errors::WrongPassword();
        case AdmissionResult::kRoomFull:
            return errors::RoomFull(outcome.meeting.settings.max_participants);
        case AdmissionResult::kAdmitted:
        case AdmissionResult::kAlreadyActive:
            break;
    }

    JoinResult result;
    result.already_active = outcome.result == AdmissionResult::kAlreadyActive;
    result.room_id = RoomIdFor(request.meeting_id);
    result.meeting = std::move(outcome.meeting);
    result.participant_count = outcome.active_count;

    if (result.meeting.status == MeetingStatus::kScheduled) {
        auto activated = lifecycle_->Activate(request.meeting_id);
        if (!activated.IsOk()) {
            // 参与记录已提交, 重试会走重复加入路径并再次尝试激活
            MEETCOORD_LOG_WARN("[Admission] activate {} failed: {}",
                               request.meeting_id, activated.GetStatus().Message());
            return activated.GetStatus();
        }
        auto refreshed = store_->GetMeeting(request.meeting_id);
        if (!refreshed.IsOk()) {
            return refreshed.GetStatus();
        }
        result.meeting = std::move(refreshed.Value());
        result.participant_count = result.meeting.ActiveParticipantCount();
    }

    if (connection) {
        auto status = broadcaster_->Register(result.room_id, request.meeting_id, connection);
        if (!status.IsOk()) {
            return status;
        }
        status = RejectIfEnded(request.meeting_id, connection);
        if (!status.IsOk()) {
            return status;
        }
    }

    if (!result.already_active) {
        broadcaster_->Broadcast(result.room_id,
                                PresenceEvent(presence::RoomEventType::kParticipantJoined,
                                              request.meeting_id,
                                              request.user_id,
                                              request.display_name,
                                              result.participant_count),
                                connection ? connection->Id() : std::string());
    }
    MEETCOORD_LOG_INFO("[Admission] {} joined {} ({}/{}){}",
                       request.user_id, request.meeting_id, result.participant_count,
                       result.meeting.settings.max_participants,
                       result.already_active ? " again" : "");
    return common::StatusOr<JoinResult>(std::move(result));
}

// 注册连接后复查状态; 会议已在此期间结束时撤销注册并通知连接
common::Status AdmissionController::RejectIfEnded(const std::string& meeting_id,
                                                  const std::shared_ptr<presence::Connection>& connection) {
    auto current = store_->GetMeeting(meeting_id);
    if (!current.IsOk()) {
        broadcaster_->Deregister(RoomIdFor(meeting_id), connection->Id());
        return current.GetStatus();
    }
    if (current.Value().status != MeetingStatus::kEnded) {
        return common::Status::OK();
    }
    broadcaster_->Deregister(RoomIdFor(meeting_id), connection->Id());
    presence::RoomEvent ended;
    ended.type = presence::RoomEventType::kMeetingEnded;
    ended.meeting_id = meeting_id;
    ended.room_id = RoomIdFor(meeting_id);
    ended.timestamp = current.Value().ended_at;
    if (!connection->Deliver(ended)) {
        MEETCOORD_LOG_WARN("[Admission] could not notify {} that {} ended", connection->Id(), meeting_id);
    }
    connection->Close();
    return errors::InvalidState("meeting has ended");
}

common::Status AdmissionController::Leave(const std::string& meeting_id, const std::string& user_id) {
    if (meeting_id.empty() || user_id.empty()) {
        return common::Status::InvalidArgument("meeting id and user id are required");
    }

    std::lock_guard<std::mutex> guard(ParticipantLock(meeting_id, user_id));

    auto outcome_or = store_->MarkLeft(meeting_id, user_id, common::CurrentUnixSeconds());
    if (!outcome_or.IsOk()) {
        return outcome_or.GetStatus();
    }
    for (const auto& connection : broadcaster_->DeregisterUser(RoomIdFor(meeting_id), user_id)) {
        connection->Close();
    }
    AnnounceLeft(meeting_id, user_id, outcome_or.Value());
    return common::Status::OK();
}

// 与 Join 持有同一把参与者锁, 撤销连接与判断是否还有其他连接在同一临界区内完成
common::Status AdmissionController::Disconnect(const std::string& meeting_id,
                                               const std::string& user_id,
                                               const std::string& connection_id) {
    if (meeting_id.empty() || user_id.empty()) {
        return common::Status::InvalidArgument("meeting id and user id are required");
    }

    std::lock_guard<std::mutex> guard(ParticipantLock(meeting_id, user_id));

    const auto room_id = RoomIdFor(meeting_id);
    if (!connection_id.empty()) {
        broadcaster_->Deregister(room_id, connection_id);
    }
    if (broadcaster_->HasUser(room_id, user_id)) {
        // 已重连
        return common::Status::OK();
    }

    auto outcome_or = store_->MarkLeft(meeting_id, user_id, common::CurrentUnixSeconds());
    if (!outcome_or.IsOk()) {
        return outcome_or.GetStatus();
    }
    AnnounceLeft(meeting_id, user_id, outcome_or.Value());
    return common::Status::OK();
}

void AdmissionController::AnnounceLeft(const std::string& meeting_id,
                                       const std::string& user_id,
                                       const LeaveOutcome& outcome) {
    if (!outcome.changed) {
        return;
    }
    broadcaster_->Broadcast(RoomIdFor(meeting_id),
                            PresenceEvent(presence::RoomEventType::kParticipantLeft,
                                          meeting_id, user_id, std::string(), outcome.active_count));
    MEETCOORD_LOG_INFO("[Admission] {} left {} ({} remaining)", user_id, meeting_id, outcome.active_count);

    if (outcome.active_count == 0 && outcome.status == MeetingStatus::kActive) {
        auto status = lifecycle_->OnRoomEmpty(meeting_id);
        if (!status.IsOk()) {
            // 离开已提交; 空闲巡检会兜底结束会议
            MEETCOORD_LOG_WARN("[Admission] empty-room handling for {} failed: {}", meeting_id, status.Message());
        }
    }
}

} // namespace core
} // namespace meetcoord
