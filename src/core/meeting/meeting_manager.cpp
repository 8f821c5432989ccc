#include "core/meeting/meeting_manager.hpp"
#include "common/clock.hpp"
#include "common/logger.hpp"
#include "common/string_util.hpp"
#include "core/meeting/errors.hpp"

#include <algorithm>
#include <chrono>

namespace meetcoord {
namespace core {

namespace {

constexpr int kDefaultUserMeetingLimit = 20;
constexpr int kMaxUserMeetingLimit = 100;

using common::Trim;

} // namespace

MeetingManager::MeetingManager(MeetingManagerConfig config,
                               std::shared_ptr<MeetingStore> store,
                               std::shared_ptr<ChatLog> chat_log,
                               std::shared_ptr<presence::PresenceBroadcaster> broadcaster)
    : config_(std::move(config))
    , store_(std::move(store))
    , chat_log_(std::move(chat_log))
    , broadcaster_(std::move(broadcaster)) {
    if (!store_) {
        store_ = std::make_shared<InMemoryMeetingStore>(
            std::chrono::milliseconds(config_.meeting.store_lock_timeout_ms));
    }
    if (!chat_log_) {
        chat_log_ = std::make_shared<InMemoryChatLog>();
    }
    if (!broadcaster_) {
        broadcaster_ = std::make_shared<presence::PresenceBroadcaster>();
    }
    lifecycle_ = std::make_shared<MeetingLifecycleManager>(config_.lifecycle, store_, broadcaster_);
    allocator_ = std::make_unique<IdentifierAllocator>(
        store_, static_cast<std::size_t>(config_.meeting.id_length), config_.meeting.id_max_attempts);
    admission_ = std::make_unique<AdmissionController>(store_, lifecycle_, broadcaster_);

    // 心跳超时的连接已被移出房间, 该用户没有其他连接时按离会处理
    lifecycle_->SetStaleHandler([this](const presence::StaleConnection& stale) {
        auto status = admission_->Disconnect(stale.meeting_id, stale.user_id, stale.connection_id);
        if (!status.IsOk()) {
            MEETCOORD_LOG_WARN("[MeetingManager] leave for stale connection {} failed: {}",
                               stale.connection_id, status.Message());
        }
    });
}

MeetingManager::~MeetingManager() {
    lifecycle_->StopSweeper();
    lifecycle_->SetStaleHandler(nullptr);
}

common::StatusOr<std::string> MeetingManager::NormalizeMeetingId(const std::string& raw) const {
    auto meeting_id = IdentifierAllocator::Normalize(raw);
    if (meeting_id.empty()) {
        return common::Status::InvalidArgument("meeting id is required");
    }
    return common::StatusOr<std::string>(std::move(meeting_id));
}

MeetingManager::Status MeetingManager::ValidateSettings(const MeetingSettings& settings) const {
    if (settings.max_participants < config_.meeting.min_participants
        || settings.max_participants > config_.meeting.max_participants_limit) {
        return Status::InvalidArgument("max participants must be between "
                                       + std::to_string(config_.meeting.min_participants) + " and "
                                       + std::to_string(config_.meeting.max_participants_limit));
    }
    return Status::OK();
}

MeetingManager::StatusOrMeeting MeetingManager::CreateMeeting(const CreateMeetingCommand& command) {
    const auto title = Trim(command.title);
    if (title.empty()) {
        return Status::InvalidArgument("meeting title is required");
    }
    if (title.size() > static_cast<std::size_t>(config_.meeting.title_max_length)) {
        return Status::InvalidArgument("meeting title is too long");
    }
    const auto host = Trim(command.host_user_id);
    if (host.empty()) {
        return Status::InvalidArgument("host user id is required");
    }
    const auto description = Trim(command.description);
    if (description.size() > static_cast<std::size_t>(config_.meeting.description_max_length)) {
        return Status::InvalidArgument("meeting description is too long");
    }
    const auto password = Trim(command.room_password);
    if (!password.empty()
        && (password.size() < static_cast<std::size_t>(config_.meeting.password_min_length)
            || password.size() > static_cast<std::size_t>(config_.meeting.password_max_length))) {
        return Status::InvalidArgument("room password must be between "
                                       + std::to_string(config_.meeting.password_min_length) + " and "
                                       + std::to_string(config_.meeting.password_max_length) + " characters");
    }

    MeetingSettings settings;
    settings.max_participants = config_.meeting.default_max_participants;
    if (command.settings.has_value()) {
        settings = *command.settings;
    }
    auto settings_status = ValidateSettings(settings);
    if (!settings_status.IsOk()) {
        return settings_status;
    }

    MeetingData meeting;
    meeting.title = title;
    meeting.description = description;
    meeting.host_user_id = host;
    meeting.created_by = host;
    meeting.status = MeetingStatus::kScheduled;
    meeting.settings = settings;
    meeting.room_password = password;
    meeting.scheduled_start_time = command.scheduled_start_time;
    meeting.created_at = common::CurrentUnixSeconds();
    meeting.updated_at = meeting.created_at;

    // 检查与插入之间仍可能撞号, 插入冲突时重新分配
    const int attempts = allocator_->MaxAttempts();
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto id_or = allocator_->Allocate();
        if (!id_or.IsOk()) {
            return id_or.GetStatus();
        }
        meeting.meeting_id = id_or.Value();
        auto created = store_->CreateMeeting(meeting);
        if (created.IsOk()) {
            MEETCOORD_LOG_INFO("[MeetingManager] meeting {} created by {}", meeting.meeting_id, host);
            return created;
        }
        if (created.GetStatus().Code() != common::StatusCode::kAlreadyExists) {
            return created.GetStatus();
        }
        MEETCOORD_LOG_WARN("[MeetingManager] meeting id {} taken at insert (attempt {}/{})",
                           meeting.meeting_id, attempt, attempts);
    }
    return errors::AllocationExhausted(attempts);
}

MeetingManager::StatusOrMeeting MeetingManager::GetMeeting(const std::string& meeting_id) {
    auto id = NormalizeMeetingId(meeting_id);
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    return store_->GetMeeting(id.Value());
}

common::StatusOr<JoinInfo> MeetingManager::GetJoinInfo(const std::string& meeting_id) {
    auto meeting_or = GetMeeting(meeting_id);
    if (!meeting_or.IsOk()) {
        return meeting_or.GetStatus();
    }
    const auto& meeting = meeting_or.Value();
    JoinInfo info;
    info.meeting_id = meeting.meeting_id;
    info.title = meeting.title;
    info.description = meeting.description;
    info.status = meeting.status;
    info.max_participants = meeting.settings.max_participants;
    info.current_participants = meeting.ActiveParticipantCount();
    info.requires_password = meeting.RequiresPassword();
    info.allow_chat = meeting.settings.allow_chat;
    info.allow_screen_share = meeting.settings.allow_screen_share;
    info.is_joinable = meeting.IsJoinable();
    info.is_full = meeting.IsFull();
    return common::StatusOr<JoinInfo>(std::move(info));
}

common::StatusOr<JoinResult> MeetingManager::JoinMeeting(const JoinRequest& request,
                                                         std::shared_ptr<presence::Connection> connection) {
    auto id = NormalizeMeetingId(request.meeting_id);
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    JoinRequest normalized;
    normalized.meeting_id = id.Value();
    normalized.user_id = Trim(request.user_id);
    normalized.display_name = Trim(request.display_name);
    normalized.email = Trim(request.email);
    normalized.room_password = Trim(request.room_password);
    return admission_->Join(normalized, std::move(connection));
}

MeetingManager::Status MeetingManager::LeaveMeeting(const std::string& meeting_id, const std::string& user_id) {
    auto id = NormalizeMeetingId(meeting_id);
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    return admission_->Leave(id.Value(), Trim(user_id));
}

MeetingManager::Status MeetingManager::DisconnectLive(const std::string& meeting_id,
                                                     const std::string& user_id,
                                                     const std::string& connection_id) {
    auto id = NormalizeMeetingId(meeting_id);
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    return admission_->Disconnect(id.Value(), user_id, connection_id);
}

MeetingManager::Status MeetingManager::EndMeeting(const std::string& meeting_id, const std::string& requester_user_id) {
    auto id = NormalizeMeetingId(meeting_id);
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    const auto requester = Trim(requester_user_id);
    if (requester.empty()) {
        return Status::InvalidArgument("requester user id is required");
    }
    return lifecycle_->EndMeeting(id.Value(), requester);
}

MeetingManager::StatusOrMeeting MeetingManager::UpdateSettings(const UpdateSettingsCommand& command) {
    auto meeting_or = GetMeeting(command.meeting_id);
    if (!meeting_or.IsOk()) {
        return meeting_or.GetStatus();
    }
    const auto& meeting = meeting_or.Value();
    if (!meeting.IsHost(Trim(command.requester_user_id))) {
        return errors::Forbidden("only the host can change meeting settings");
    }
    auto settings_status = ValidateSettings(command.settings);
    if (!settings_status.IsOk()) {
        return settings_status;
    }
    auto status = store_->UpdateSettings(meeting.meeting_id, command.settings, common::CurrentUnixSeconds());
    if (!status.IsOk()) {
        return status;
    }
    return store_->GetMeeting(meeting.meeting_id);
}

common::StatusOr<ChatMessage> MeetingManager::SendChat(const SendChatCommand& command) {
    auto id = NormalizeMeetingId(command.meeting_id);
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    const auto body = Trim(command.body);
    if (body.empty()) {
        return Status::InvalidArgument("message body is empty");
    }
    if (body.size() > static_cast<std::size_t>(config_.chat.max_body_length)) {
        return Status::InvalidArgument("message body is too long");
    }

    auto meeting_or = store_->GetMeeting(id.Value());
    if (!meeting_or.IsOk()) {
        return meeting_or.GetStatus();
    }
    const auto& meeting = meeting_or.Value();
    if (meeting.status == MeetingStatus::kEnded) {
        return errors::InvalidState("meeting has ended");
    }
    if (!meeting.settings.allow_chat) {
        return errors::InvalidState("chat is disabled for this meeting");
    }
    const auto* sender = meeting.FindActive(Trim(command.user_id));
    if (sender == nullptr) {
        return errors::Forbidden("only active participants can send messages");
    }

    std::lock_guard<std::mutex> guard(chat_locks_.For(meeting.meeting_id));
    auto message = chat_log_->Append(meeting.meeting_id, sender->user_id, sender->display_name, body);
    if (!message.IsOk()) {
        return message.GetStatus();
    }

    presence::RoomEvent event;
    event.type = presence::RoomEventType::kChatMessage;
    event.meeting_id = meeting.meeting_id;
    event.room_id = meeting.RoomId();
    event.user_id = sender->user_id;
    event.display_name = sender->display_name;
    event.active_participants = meeting.ActiveParticipantCount();
    // 人数以写入消息后的存储为准
    auto current = store_->GetMeeting(meeting.meeting_id);
    if (current.IsOk()) {
        event.active_participants = current.Value().ActiveParticipantCount();
    } else {
        MEETCOORD_LOG_WARN("[MeetingManager] participant count for chat in {} not refreshed: {}",
                           meeting.meeting_id, current.GetStatus().Message());
    }
    event.sequence = message.Value().sequence;
    event.body = message.Value().body;
    event.timestamp = message.Value().sent_at;
    broadcaster_->Broadcast(event.room_id, event);
    return message;
}

common::StatusOr<std::vector<ChatMessage>> MeetingManager::GetChatHistory(ChatQuery query) {
    auto id = NormalizeMeetingId(query.meeting_id);
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    auto exists = store_->MeetingExists(id.Value());
    if (!exists.IsOk()) {
        return exists.GetStatus();
    }
    if (!exists.Value()) {
        return errors::MeetingNotFound(id.Value());
    }
    query.meeting_id = id.Value();
    if (query.limit <= 0) {
        query.limit = config_.chat.default_history_limit;
    }
    query.limit = std::min(query.limit, config_.chat.max_history_limit);
    return chat_log_->FetchSince(query);
}

common::StatusOr<std::vector<MeetingData>> MeetingManager::ListActiveMeetings() {
    return store_->FindByStatus(MeetingStatus::kActive);
}

common::StatusOr<std::vector<MeetingData>> MeetingManager::ListUserMeetings(UserMeetingQuery query) {
    query.user_id = Trim(query.user_id);
    if (query.user_id.empty()) {
        return Status::InvalidArgument("user id is required");
    }
    if (query.limit <= 0) {
        query.limit = kDefaultUserMeetingLimit;
    }
    query.limit = std::min(query.limit, kMaxUserMeetingLimit);
    query.skip = std::max(query.skip, 0);
    return store_->ListUserMeetings(query);
}

presence::RoomStats MeetingManager::GetRoomStats() const {
    return broadcaster_->GetRoomStats();
}

SweepReport MeetingManager::SweepIdle(std::int64_t now) {
    return lifecycle_->SweepIdle(now);
}

void MeetingManager::StartBackgroundSweep() {
    lifecycle_->StartSweeper();
}

void MeetingManager::StopBackgroundSweep() {
    lifecycle_->StopSweeper();
}

} // namespace core
} // namespace meetcoord
