#pragma once

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/status.hpp"
#include "core/meeting/errors.hpp"
#include "core/meeting/meeting_manager.hpp"
#include "thread_pool/config.hpp"
#include "thread_pool/thread_pool.hpp"

#include "meeting_service.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>

namespace meetcoord {
namespace server {

class MeetingServiceImpl final : public proto::meeting::MeetingService::Service {
public:
    // 使用 GlobalConfig()
    MeetingServiceImpl();
    explicit MeetingServiceImpl(const common::AppConfig& config);
    // 使用外部构造的会议管理器
    MeetingServiceImpl(const common::AppConfig& config, std::unique_ptr<core::MeetingManager> manager);
    ~MeetingServiceImpl();

    grpc::Status CreateMeeting(grpc::ServerContext* context
                               , const proto::meeting::CreateMeetingRequest* request
                               , proto::meeting::CreateMeetingResponse* response) override;

    grpc::Status GetMeeting(grpc::ServerContext* context
                            , const proto::meeting::GetMeetingRequest* request
                            , proto::meeting::GetMeetingResponse* response) override;

    grpc::Status GetJoinInfo(grpc::ServerContext* context
                             , const proto::meeting::GetJoinInfoRequest* request
                             , proto::meeting::GetJoinInfoResponse* response) override;

    grpc::Status JoinMeeting(grpc::ServerContext* context
                             , const proto::meeting::JoinMeetingRequest* request
                             , proto::meeting::JoinMeetingResponse* response) override;

    grpc::Status LeaveMeeting(grpc::ServerContext* context
                              , const proto::meeting::LeaveMeetingRequest* request
                              , proto::meeting::LeaveMeetingResponse* response) override;

    grpc::Status EndMeeting(grpc::ServerContext* context
                            , const proto::meeting::EndMeetingRequest* request
                            , proto::meeting::EndMeetingResponse* response) override;

    grpc::Status UpdateSettings(grpc::ServerContext* context
                                , const proto::meeting::UpdateSettingsRequest* request
                                , proto::meeting::UpdateSettingsResponse* response) override;

    grpc::Status SendChat(grpc::ServerContext* context
                          , const proto::meeting::SendChatRequest* request
                          , proto::meeting::SendChatResponse* response) override;

    grpc::Status GetChatHistory(grpc::ServerContext* context
                                , const proto::meeting::GetChatHistoryRequest* request
                                , proto::meeting::GetChatHistoryResponse* response) override;

    grpc::Status ListActiveMeetings(grpc::ServerContext* context
                                    , const proto::meeting::ListActiveMeetingsRequest* request
                                    , proto::meeting::ListActiveMeetingsResponse* response) override;

    grpc::Status ListUserMeetings(grpc::ServerContext* context
                                  , const proto::meeting::ListUserMeetingsRequest* request
                                  , proto::meeting::ListUserMeetingsResponse* response) override;

    grpc::Status GetRoomStats(grpc::ServerContext* context
                              , const proto::meeting::GetRoomStatsRequest* request
                              , proto::meeting::GetRoomStatsResponse* response) override;

    // 实时通道: 读线程处理客户端帧, 本线程把发件箱中的事件写回客户端
    grpc::Status Live(grpc::ServerContext* context
                      , grpc::ServerReaderWriter<proto::common::RoomEvent, proto::meeting::ClientFrame>* stream) override;

    core::MeetingManager& Manager() { return *manager_; }

    static grpc::Status ToGrpcStatus(const common::Status& status);
    static void FillMeetingInfo(const core::MeetingData& data, proto::common::MeetingInfo* info);
    static void FillRoomEvent(const core::presence::RoomEvent& event, proto::common::RoomEvent* out);

private:
    // 把请求交给线程池执行, 等待超过 request_timeout_ms 时返回 Unavailable
    template <typename Task>
    auto Dispatch(const char* rpc, Task task) -> decltype(task());

    // 关闭被放弃的实时连接, 已入会时按断开处理
    void ReleaseAbandonedJoin(const core::JoinRequest& join,
                              const std::shared_ptr<core::presence::QueuedConnection>& connection,
                              bool admitted);

    void ServeLiveFrames(grpc::ServerReaderWriter<proto::common::RoomEvent, proto::meeting::ClientFrame>* stream,
                         const std::shared_ptr<core::presence::QueuedConnection>& connection,
                         const std::string& meeting_id);

private:
    common::AppConfig config_;
    std::unique_ptr<core::MeetingManager> manager_;
    std::chrono::milliseconds request_timeout_;
    thread_pool::ThreadPool thread_pool_;
};

template <typename Task>
auto MeetingServiceImpl::Dispatch(const char* rpc, Task task) -> decltype(task()) {
    using Result = decltype(task());
    try {
        auto future = thread_pool_.Submit(std::move(task));
        if (future.wait_for(request_timeout_) != std::future_status::ready) {
            MEETCOORD_LOG_WARN("[MeetingService] {} timed out after {} ms", rpc, request_timeout_.count());
            return Result(core::errors::Unavailable("request timed out"));
        }
        return future.get();
    } catch (const std::exception& ex) {
        MEETCOORD_LOG_ERROR("[MeetingService] {} could not run on the worker pool: {}", rpc, ex.what());
        return Result(core::errors::Unavailable(std::string("worker pool unavailable: ") + ex.what()));
    }
}

} // namespace server
} // namespace meetcoord
