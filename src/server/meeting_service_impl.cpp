#include "server/meeting_service_impl.hpp"
#include "cache/redis_client.hpp"
#include "common/clock.hpp"
#include "common/config_loader.hpp"
#include "common/string_util.hpp"
#include "config_path.hpp"
#include "core/meeting/cached_meeting_store.hpp"
#include "core/presence/connection.hpp"
#include "storage/mysql/chat_log.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/meeting_store.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace meetcoord {
namespace server {

namespace {

using LiveStream = grpc::ServerReaderWriter<proto::common::RoomEvent, proto::meeting::ClientFrame>;

// 实时入会任务与等待它的流线程之间的交接; 后完成的一方负责收尾超时放弃的入会
struct LiveJoinHandoff {
    std::mutex mutex;
    bool abandoned = false;
    bool finished = false;
    bool admitted = false;
};

thread_pool::ThreadPool CreateThreadPool(const std::string& config_path) {
    auto loader = thread_pool::ThreadPoolConfigLoader::FromFile(config_path);
    if (loader.has_value()) {
        return thread_pool::ThreadPool(loader->GetConfig());
    }
    MEETCOORD_LOG_WARN("[MeetingService] thread pool config {} not usable, using defaults", config_path);
    return thread_pool::ThreadPool(4, 1024);
}

// 根据配置创建 Redis 客户端, 不可用时退化为无缓存
std::shared_ptr<cache::RedisClient> CreateRedisClient(const common::RedisConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }
    auto client = std::make_shared<cache::RedisClient>(config);
    auto status = client->Ping();
    if (!status.IsOk()) {
        MEETCOORD_LOG_WARN("[MeetingService] redis init failed, running without cache: {}", status.Message());
        return nullptr;
    }
    return client;
}

// 根据配置创建 MySQL 连接池, 不可用时退化为内存存储
std::shared_ptr<storage::ConnectionPool> CreateMysqlPool(const common::MysqlConfig& config) {
    if (!config.enabled) {
        MEETCOORD_LOG_WARN("[MeetingService] MySQL backend disabled; using in-memory store");
        return nullptr;
    }
    auto pool = std::make_shared<storage::ConnectionPool>(storage::OptionsFromConfig(config));
    auto first = pool->Acquire();
    if (!first.IsOk()) {
        MEETCOORD_LOG_ERROR("[MeetingService] failed to connect to MySQL, using in-memory store: {}",
                            first.GetStatus().Message());
        return nullptr;
    }
    return pool;
}

std::unique_ptr<core::MeetingManager> CreateMeetingManager(const common::AppConfig& config) {
    auto pool = CreateMysqlPool(config.storage.mysql);
    auto redis = CreateRedisClient(config.cache.redis);

    std::shared_ptr<core::MeetingStore> store;
    std::shared_ptr<core::ChatLog> chat_log;
    if (pool) {
        store = std::make_shared<storage::MySqlMeetingStore>(pool);
        chat_log = std::make_shared<storage::MySqlChatLog>(pool);
    } else {
        store = std::make_shared<core::InMemoryMeetingStore>(
            std::chrono::milliseconds(config.meeting.store_lock_timeout_ms));
    }
    if (redis) {
        store = std::make_shared<core::CachedMeetingStore>(store, redis, config.cache.redis.meeting_ttl_seconds);
    }

    core::MeetingManagerConfig manager_config{config.meeting, config.lifecycle, config.chat};
    return std::make_unique<core::MeetingManager>(manager_config, store, chat_log);
}

void SetTimestamp(std::int64_t seconds, google::protobuf::Timestamp* ts) {
    if (ts == nullptr || seconds <= 0) {
        return;
    }
    ts->set_seconds(seconds);
    ts->set_nanos(0);
}

void FillSettings(const core::MeetingSettings& settings, proto::common::MeetingSettings* out) {
    out->set_max_participants(settings.max_participants);
    out->set_is_public(settings.is_public);
    out->set_require_approval(settings.require_approval);
    out->set_allow_chat(settings.allow_chat);
    out->set_allow_screen_share(settings.allow_screen_share);
    out->set_allow_recording(settings.allow_recording);
    out->set_mute_on_entry(settings.mute_on_entry);
}

// max_participants 为 0 时取 fallback_max; 未携带的开关取默认值
core::MeetingSettings SettingsFromProto(const proto::common::MeetingSettings& in, int fallback_max) {
    core::MeetingSettings settings;
    settings.max_participants = in.max_participants() > 0 ? in.max_participants() : fallback_max;
    if (in.has_is_public()) settings.is_public = in.is_public();
    if (in.has_require_approval()) settings.require_approval = in.require_approval();
    if (in.has_allow_chat()) settings.allow_chat = in.allow_chat();
    if (in.has_allow_screen_share()) settings.allow_screen_share = in.allow_screen_share();
    if (in.has_allow_recording()) settings.allow_recording = in.allow_recording();
    if (in.has_mute_on_entry()) settings.mute_on_entry = in.mute_on_entry();
    return settings;
}

void FillChatMessage(const core::ChatMessage& message, proto::common::ChatMessage* out) {
    out->set_meeting_id(message.meeting_id);
    out->set_sequence(message.sequence);
    out->set_sender_user_id(message.sender_user_id);
    out->set_sender_name(message.sender_name);
    out->set_body(message.body);
    SetTimestamp(message.sent_at, out->mutable_sent_at());
}

proto::common::RoomEventType ToProtoEventType(core::presence::RoomEventType type) {
    using core::presence::RoomEventType;
    switch (type) {
        case RoomEventType::kRoomJoined:
            return proto::common::ROOM_EVENT_ROOM_JOINED;
        case RoomEventType::kParticipantJoined:
            return proto::common::ROOM_EVENT_PARTICIPANT_JOINED;
        case RoomEventType::kParticipantLeft:
            return proto::common::ROOM_EVENT_PARTICIPANT_LEFT;
        case RoomEventType::kChatMessage:
            return proto::common::ROOM_EVENT_CHAT_MESSAGE;
        case RoomEventType::kMeetingEnded:
            return proto::common::ROOM_EVENT_MEETING_ENDED;
        case RoomEventType::kError:
            return proto::common::ROOM_EVENT_ERROR;
    }
    return proto::common::ROOM_EVENT_ERROR;
}

core::JoinRequest ToJoinRequest(const proto::meeting::JoinMeetingRequest& request) {
    core::JoinRequest join;
    join.meeting_id = request.meeting_id();
    join.user_id = common::Trim(request.user_id());
    join.display_name = request.display_name();
    join.email = request.email();
    join.room_password = request.room_password();
    return join;
}

core::presence::RoomEvent ErrorEvent(const std::string& meeting_id, const common::Status& status) {
    core::presence::RoomEvent event;
    event.type = core::presence::RoomEventType::kError;
    event.meeting_id = meeting_id;
    event.room_id = meeting_id.empty() ? std::string() : core::RoomIdFor(meeting_id);
    event.body = status.Message();
    event.error_code = static_cast<int>(core::MapStatus(status));
    event.timestamp = common::CurrentUnixSeconds();
    return event;
}

template <typename Response>
grpc::Status Fail(const common::Status& status, Response* response) {
    core::ErrorToProto(status, response->mutable_error());
    return MeetingServiceImpl::ToGrpcStatus(status);
}

template <typename Response>
grpc::Status Succeed(Response* response) {
    core::ErrorToProto(core::MeetingErrorCode::kOk, common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

} // namespace

MeetingServiceImpl::MeetingServiceImpl() : MeetingServiceImpl(common::GlobalConfig()) {}

MeetingServiceImpl::MeetingServiceImpl(const common::AppConfig& config)
    : MeetingServiceImpl(config, CreateMeetingManager(config)) {}

MeetingServiceImpl::MeetingServiceImpl(const common::AppConfig& config, std::unique_ptr<core::MeetingManager> manager)
    : config_(config)
    , manager_(std::move(manager))
    , request_timeout_(config.server.request_timeout_ms)
    , thread_pool_(CreateThreadPool(config.thread_pool.config_path.empty()
                                        ? common::GetThreadPoolConfigPath()
                                        : config.thread_pool.config_path)) {
    thread_pool_.Start();
}

MeetingServiceImpl::~MeetingServiceImpl() {
    thread_pool_.Stop();
    manager_->StopBackgroundSweep();
}

grpc::Status MeetingServiceImpl::CreateMeeting(grpc::ServerContext* context
                                               , const proto::meeting::CreateMeetingRequest* request
                                               , proto::meeting::CreateMeetingResponse* response) {
    (void)context;
    core::CreateMeetingCommand command;
    command.title = request->title();
    command.description = request->description();
    command.host_user_id = request->host_user_id();
    command.scheduled_start_time = request->scheduled_start_time();
    command.room_password = request->room_password();
    if (request->has_settings()) {
        command.settings = SettingsFromProto(request->settings(), config_.meeting.default_max_participants);
    }
    MEETCOORD_LOG_INFO("[MeetingService] CreateMeeting title={} host={}", command.title, command.host_user_id);

    auto created = Dispatch("CreateMeeting", [this, command]() {
        return manager_->CreateMeeting(command);
    });
    if (!created.IsOk()) {
        return Fail(created.GetStatus(), response);
    }
    FillMeetingInfo(created.Value(), response->mutable_meeting());
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::GetMeeting(grpc::ServerContext* context
                                            , const proto::meeting::GetMeetingRequest* request
                                            , proto::meeting::GetMeetingResponse* response) {
    (void)context;
    auto meeting = Dispatch("GetMeeting", [this, id = request->meeting_id()]() {
        return manager_->GetMeeting(id);
    });
    if (!meeting.IsOk()) {
        return Fail(meeting.GetStatus(), response);
    }
    FillMeetingInfo(meeting.Value(), response->mutable_meeting());
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::GetJoinInfo(grpc::ServerContext* context
                                             , const proto::meeting::GetJoinInfoRequest* request
                                             , proto::meeting::GetJoinInfoResponse* response) {
    (void)context;
    auto info_or = Dispatch("GetJoinInfo", [this, id = request->meeting_id()]() {
        return manager_->GetJoinInfo(id);
    });
    if (!info_or.IsOk()) {
        return Fail(info_or.GetStatus(), response);
    }
    const auto& info = info_or.Value();
    auto* out = response->mutable_info();
    out->set_meeting_id(info.meeting_id);
    out->set_title(info.title);
    out->set_description(info.description);
    out->set_status(core::MeetingStatusToString(info.status));
    out->set_max_participants(info.max_participants);
    out->set_current_participants(info.current_participants);
    out->set_requires_password(info.requires_password);
    out->set_allow_chat(info.allow_chat);
    out->set_allow_screen_share(info.allow_screen_share);
    out->set_is_joinable(info.is_joinable);
    out->set_is_full(info.is_full);
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::JoinMeeting(grpc::ServerContext* context
                                             , const proto::meeting::JoinMeetingRequest* request
                                             , proto::meeting::JoinMeetingResponse* response) {
    (void)context;
    auto join = ToJoinRequest(*request);
    MEETCOORD_LOG_INFO("[MeetingService] JoinMeeting meeting={} user={}", join.meeting_id, join.user_id);
    auto joined = Dispatch("JoinMeeting", [this, join]() {
        return manager_->JoinMeeting(join);
    });
    if (!joined.IsOk()) {
        return Fail(joined.GetStatus(), response);
    }
    FillMeetingInfo(joined.Value().meeting, response->mutable_meeting());
    response->set_room_id(joined.Value().room_id);
    response->set_participant_count(joined.Value().participant_count);
    response->set_already_joined(joined.Value().already_active);
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::LeaveMeeting(grpc::ServerContext* context
                                              , const proto::meeting::LeaveMeetingRequest* request
                                              , proto::meeting::LeaveMeetingResponse* response) {
    (void)context;
    MEETCOORD_LOG_INFO("[MeetingService] LeaveMeeting meeting={} user={}", request->meeting_id(), request->user_id());
    auto status = Dispatch("LeaveMeeting", [this, id = request->meeting_id(), user = request->user_id()]() {
        return manager_->LeaveMeeting(id, user);
    });
    if (!status.IsOk()) {
        return Fail(status, response);
    }
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::EndMeeting(grpc::ServerContext* context
                                            , const proto::meeting::EndMeetingRequest* request
                                            , proto::meeting::EndMeetingResponse* response) {
    (void)context;
    MEETCOORD_LOG_INFO("[MeetingService] EndMeeting meeting={} requester={}",
                       request->meeting_id(), request->requester_user_id());
    auto status = Dispatch("EndMeeting", [this, id = request->meeting_id(), user = request->requester_user_id()]() {
        return manager_->EndMeeting(id, user);
    });
    if (!status.IsOk()) {
        return Fail(status, response);
    }
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::UpdateSettings(grpc::ServerContext* context
                                                , const proto::meeting::UpdateSettingsRequest* request
                                                , proto::meeting::UpdateSettingsResponse* response) {
    (void)context;
    if (!request->has_settings()) {
        return Fail(common::Status::InvalidArgument("settings are required"), response);
    }
    core::UpdateSettingsCommand command;
    command.meeting_id = request->meeting_id();
    command.requester_user_id = request->requester_user_id();
    command.settings = SettingsFromProto(request->settings(), config_.meeting.default_max_participants);
    auto updated = Dispatch("UpdateSettings", [this, command]() {
        return manager_->UpdateSettings(command);
    });
    if (!updated.IsOk()) {
        return Fail(updated.GetStatus(), response);
    }
    FillMeetingInfo(updated.Value(), response->mutable_meeting());
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::SendChat(grpc::ServerContext* context
                                          , const proto::meeting::SendChatRequest* request
                                          , proto::meeting::SendChatResponse* response) {
    (void)context;
    core::SendChatCommand command{request->meeting_id(), request->user_id(), request->body()};
    auto sent = Dispatch("SendChat", [this, command]() {
        return manager_->SendChat(command);
    });
    if (!sent.IsOk()) {
        return Fail(sent.GetStatus(), response);
    }
    FillChatMessage(sent.Value(), response->mutable_message());
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::GetChatHistory(grpc::ServerContext* context
                                                , const proto::meeting::GetChatHistoryRequest* request
                                                , proto::meeting::GetChatHistoryResponse* response) {
    (void)context;
    core::ChatQuery query;
    query.meeting_id = request->meeting_id();
    query.since_sequence = request->since_sequence();
    query.since_timestamp = request->since_timestamp();
    query.limit = request->limit();
    auto history = Dispatch("GetChatHistory", [this, query]() {
        return manager_->GetChatHistory(query);
    });
    if (!history.IsOk()) {
        return Fail(history.GetStatus(), response);
    }
    for (const auto& message : history.Value()) {
        FillChatMessage(message, response->add_messages());
    }
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::ListActiveMeetings(grpc::ServerContext* context
                                                    , const proto::meeting::ListActiveMeetingsRequest* request
                                                    , proto::meeting::ListActiveMeetingsResponse* response) {
    (void)context;
    (void)request;
    auto meetings = Dispatch("ListActiveMeetings", [this]() {
        return manager_->ListActiveMeetings();
    });
    if (!meetings.IsOk()) {
        return Fail(meetings.GetStatus(), response);
    }
    for (const auto& meeting : meetings.Value()) {
        FillMeetingInfo(meeting, response->add_meetings());
    }
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::ListUserMeetings(grpc::ServerContext* context
                                                  , const proto::meeting::ListUserMeetingsRequest* request
                                                  , proto::meeting::ListUserMeetingsResponse* response) {
    (void)context;
    core::UserMeetingQuery query;
    query.user_id = request->user_id();
    query.limit = request->limit();
    query.skip = request->skip();
    if (!request->status().empty()) {
        core::MeetingStatus status;
        if (!core::ParseMeetingStatus(request->status(), &status)) {
            return Fail(common::Status::InvalidArgument("unknown meeting status: " + request->status()), response);
        }
        query.status = status;
    }
    auto meetings = Dispatch("ListUserMeetings", [this, query]() {
        return manager_->ListUserMeetings(query);
    });
    if (!meetings.IsOk()) {
        return Fail(meetings.GetStatus(), response);
    }
    for (const auto& meeting : meetings.Value()) {
        FillMeetingInfo(meeting, response->add_meetings());
    }
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::GetRoomStats(grpc::ServerContext* context
                                              , const proto::meeting::GetRoomStatsRequest* request
                                              , proto::meeting::GetRoomStatsResponse* response) {
    (void)context;
    (void)request;
    const auto stats = manager_->GetRoomStats();
    response->set_total_rooms(static_cast<std::int32_t>(stats.total_rooms));
    response->set_total_connections(static_cast<std::int32_t>(stats.total_connections));
    for (const auto& room : stats.rooms) {
        auto* out = response->add_rooms();
        out->set_room_id(room.room_id);
        out->set_meeting_id(room.meeting_id);
        out->set_connection_count(static_cast<std::int32_t>(room.connection_count));
        SetTimestamp(room.created_at, out->mutable_created_at());
    }
    return Succeed(response);
}

grpc::Status MeetingServiceImpl::Live(grpc::ServerContext* context, LiveStream* stream) {
    proto::meeting::ClientFrame first;
    if (!stream->Read(&first)) {
        return grpc::Status::OK;
    }
    if (first.frame_case() != proto::meeting::ClientFrame::kJoin) {
        auto status = common::Status::InvalidArgument("first frame must be a join frame");
        proto::common::RoomEvent error;
        FillRoomEvent(ErrorEvent(std::string(), status), &error);
        stream->Write(error);
        return ToGrpcStatus(status);
    }

    auto join = ToJoinRequest(first.join());
    const auto capacity = static_cast<std::size_t>(std::max(config_.presence.outbox_capacity, 1));
    auto connection = std::make_shared<core::presence::QueuedConnection>(
        core::presence::NewConnectionId(), join.user_id, capacity);

    auto handoff = std::make_shared<LiveJoinHandoff>();
    auto joined = Dispatch("Live.Join", [this, join, connection, handoff]() {
        auto result = manager_->JoinMeeting(join, connection);
        bool abandoned = false;
        {
            std::lock_guard<std::mutex> lock(handoff->mutex);
            handoff->finished = true;
            handoff->admitted = result.IsOk();
            abandoned = handoff->abandoned;
        }
        if (abandoned) {
            ReleaseAbandonedJoin(join, connection, result.IsOk());
        }
        return result;
    });
    if (!joined.IsOk()) {
        bool finished = false;
        bool admitted = false;
        {
            std::lock_guard<std::mutex> lock(handoff->mutex);
            handoff->abandoned = true;
            finished = handoff->finished;
            admitted = handoff->admitted;
        }
        // 任务未完成时连接保持打开, 由任务完成后收尾
        if (finished) {
            ReleaseAbandonedJoin(join, connection, admitted);
        }
        proto::common::RoomEvent error;
        FillRoomEvent(ErrorEvent(join.meeting_id, joined.GetStatus()), &error);
        stream->Write(error);
        return ToGrpcStatus(joined.GetStatus());
    }
    const std::string meeting_id = joined.Value().meeting.meeting_id;
    MEETCOORD_LOG_INFO("[MeetingService] live connection {} of {} opened in {}",
                       connection->Id(), connection->UserId(), joined.Value().room_id);

    // 确认帧先于其他事件写出
    core::presence::RoomEvent ack;
    ack.type = core::presence::RoomEventType::kRoomJoined;
    ack.meeting_id = meeting_id;
    ack.room_id = joined.Value().room_id;
    ack.user_id = connection->UserId();
    ack.display_name = join.display_name;
    ack.active_participants = joined.Value().participant_count;
    ack.timestamp = common::CurrentUnixSeconds();
    proto::common::RoomEvent ack_out;
    FillRoomEvent(ack, &ack_out);
    bool writable = stream->Write(ack_out);

    std::atomic<bool> reader_done{false};
    std::thread reader([this, stream, connection, meeting_id, &reader_done]() {
        ServeLiveFrames(stream, connection, meeting_id);
        reader_done.store(true);
    });

    const auto poll = std::chrono::milliseconds(std::max(config_.presence.writer_poll_ms, 10));
    core::presence::RoomEvent event;
    while (writable && !context->IsCancelled()) {
        if (connection->Next(event, poll)) {
            proto::common::RoomEvent out;
            FillRoomEvent(event, &out);
            writable = stream->Write(out);
            continue;
        }
        if (connection->Closed()) {
            break;
        }
    }
    connection->Close();
    // 读线程可能仍阻塞在 Read 上
    if (!reader_done.load()) {
        context->TryCancel();
    }
    reader.join();

    auto status = manager_->DisconnectLive(meeting_id, connection->UserId(), connection->Id());
    if (!status.IsOk()) {
        MEETCOORD_LOG_WARN("[MeetingService] teardown of live connection {} failed: {}",
                           connection->Id(), status.Message());
    }
    MEETCOORD_LOG_INFO("[MeetingService] live connection {} closed", connection->Id());
    return grpc::Status::OK;
}

void MeetingServiceImpl::ReleaseAbandonedJoin(const core::JoinRequest& join,
                                              const std::shared_ptr<core::presence::QueuedConnection>& connection,
                                              bool admitted) {
    connection->Close();
    if (!admitted) {
        return;
    }
    auto status = manager_->DisconnectLive(join.meeting_id, join.user_id, connection->Id());
    if (!status.IsOk()) {
        MEETCOORD_LOG_WARN("[MeetingService] could not release abandoned live join {}: {}",
                           connection->Id(), status.Message());
        return;
    }
    MEETCOORD_LOG_INFO("[MeetingService] released abandoned live join {} of {}", connection->Id(), join.user_id);
}

void MeetingServiceImpl::ServeLiveFrames(LiveStream* stream,
                                         const std::shared_ptr<core::presence::QueuedConnection>& connection,
                                         const std::string& meeting_id) {
    auto reply_error = [&](const common::Status& status) {
        if (!connection->Deliver(ErrorEvent(meeting_id, status))) {
            MEETCOORD_LOG_WARN("[MeetingService] could not deliver error to {}", connection->Id());
        }
    };

    proto::meeting::ClientFrame frame;
    while (stream->Read(&frame)) {
        connection->Touch(common::CurrentUnixSeconds());
        switch (frame.frame_case()) {
            case proto::meeting::ClientFrame::kChat: {
                core::SendChatCommand command{meeting_id, connection->UserId(), frame.chat().body()};
                auto sent = Dispatch("Live.Chat", [this, command]() {
                    return manager_->SendChat(command);
                });
                if (!sent.IsOk()) {
                    reply_error(sent.GetStatus());
                }
                break;
            }
            case proto::meeting::ClientFrame::kPing:
                break;
            case proto::meeting::ClientFrame::kLeave: {
                auto status = Dispatch("Live.Leave", [this, meeting_id, user = connection->UserId()]() {
                    return manager_->LeaveMeeting(meeting_id, user);
                });
                if (!status.IsOk()) {
                    reply_error(status);
                }
                connection->Close();
                return;
            }
            case proto::meeting::ClientFrame::kJoin:
                reply_error(common::Status::InvalidArgument("connection has already joined"));
                break;
            default:
                reply_error(common::Status::InvalidArgument("empty frame"));
                break;
        }
    }
    // 客户端半关闭或取消
    connection->Close();
}

grpc::Status MeetingServiceImpl::ToGrpcStatus(const common::Status& status) {
    using common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return grpc::Status::OK;
        case StatusCode::kInvalidArgument:
            return {grpc::StatusCode::INVALID_ARGUMENT, status.Message()};
        case StatusCode::kNotFound:
            return {grpc::StatusCode::NOT_FOUND, status.Message()};
        case StatusCode::kAlreadyExists:
            return {grpc::StatusCode::ALREADY_EXISTS, status.Message()};
        case StatusCode::kPermissionDenied:
            return {grpc::StatusCode::PERMISSION_DENIED, status.Message()};
        case StatusCode::kResourceExhausted:
            return {grpc::StatusCode::RESOURCE_EXHAUSTED, status.Message()};
        case StatusCode::kFailedPrecondition:
            return {grpc::StatusCode::FAILED_PRECONDITION, status.Message()};
        case StatusCode::kAborted:
            return {grpc::StatusCode::ABORTED, status.Message()};
        case StatusCode::kUnauthenticated:
            return {grpc::StatusCode::UNAUTHENTICATED, status.Message()};
        case StatusCode::kUnavailable:
            return {grpc::StatusCode::UNAVAILABLE, status.Message()};
        case StatusCode::kInternal:
            return {grpc::StatusCode::INTERNAL, status.Message()};
    }
    return {grpc::StatusCode::UNKNOWN, status.Message()};
}

// 会议信息不包含入会密码
void MeetingServiceImpl::FillMeetingInfo(const core::MeetingData& data, proto::common::MeetingInfo* info) {
    if (info == nullptr) {
        return;
    }
    info->set_meeting_id(data.meeting_id);
    info->set_room_id(data.RoomId());
    info->set_title(data.title);
    info->set_description(data.description);
    info->set_host_user_id(data.host_user_id);
    info->set_created_by(data.created_by);
    info->set_status(core::MeetingStatusToString(data.status));
    FillSettings(data.settings, info->mutable_settings());
    info->set_requires_password(data.RequiresPassword());
    info->clear_participants();
    for (const auto& participant : data.participants) {
        auto* out = info->add_participants();
        out->set_user_id(participant.user_id);
        out->set_display_name(participant.display_name);
        out->set_email(participant.email);
        SetTimestamp(participant.joined_at, out->mutable_joined_at());
        if (!participant.IsActive()) {
            SetTimestamp(participant.left_at, out->mutable_left_at());
        }
        out->set_active(participant.IsActive());
    }
    info->set_active_participants(data.ActiveParticipantCount());
    SetTimestamp(data.scheduled_start_time, info->mutable_scheduled_start_time());
    SetTimestamp(data.actual_start_time, info->mutable_actual_start_time());
    SetTimestamp(data.ended_at, info->mutable_ended_at());
    info->set_duration_minutes(data.duration_minutes);
    SetTimestamp(data.created_at, info->mutable_created_at());
    SetTimestamp(data.updated_at, info->mutable_updated_at());
}

void MeetingServiceImpl::FillRoomEvent(const core::presence::RoomEvent& event, proto::common::RoomEvent* out) {
    out->set_type(ToProtoEventType(event.type));
    out->set_meeting_id(event.meeting_id);
    out->set_room_id(event.room_id);
    out->set_user_id(event.user_id);
    out->set_display_name(event.display_name);
    out->set_active_participants(event.active_participants);
    out->set_sequence(event.sequence);
    out->set_body(event.body);
    SetTimestamp(event.timestamp, out->mutable_timestamp());
    if (event.type == core::presence::RoomEventType::kError) {
        out->mutable_error()->set_code(event.error_code);
        out->mutable_error()->set_message(event.body);
    }
}

} // namespace server
} // namespace meetcoord
