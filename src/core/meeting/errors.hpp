#pragma once

#include "common/status.hpp"
#include "meeting_common.pb.h"

#include <string>

namespace meetcoord {
namespace core {

// 对外暴露的业务错误码
enum class MeetingErrorCode {
    kOk = 0,
    kNotFound = 1,
    kInvalidState = 2,
    kWrongPassword = 3,
    kRoomFull = 4,
    kForbidden = 5,
    kAllocationExhausted = 6,
    kUnavailable = 7,
    kInvalidArgument = 8,
    kInternal = 9,
};

namespace errors {

inline common::Status MeetingNotFound(const std::string& meeting_id) {
    return common::Status::NotFound("meeting not found: " + meeting_id);
}

inline common::Status InvalidState(std::string message) {
    return common::Status::FailedPrecondition(std::move(message));
}

inline common::Status WrongPassword() {
    return common::Status::Unauthenticated("room password does not match");
}

inline common::Status RoomFull(int max_participants) {
    return common::Status::ResourceExhausted(
        "meeting is full (" + std::to_string(max_participants) + " participants)");
}

inline common::Status Forbidden(std::string message) {
    return common::Status::PermissionDenied(std::move(message));
}

inline common::Status AllocationExhausted(int attempts) {
    return common::Status::Aborted(
        "could not allocate a unique meeting id after " + std::to_string(attempts) + " attempts");
}

inline common::Status Unavailable(std::string message) {
    return common::Status::Unavailable(std::move(message));
}

} // namespace errors

inline MeetingErrorCode MapStatus(const common::Status& status) {
    using common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return MeetingErrorCode::kOk;
        case StatusCode::kNotFound:
            return MeetingErrorCode::kNotFound;
        case StatusCode::kFailedPrecondition:
            return MeetingErrorCode::kInvalidState;
        case StatusCode::kUnauthenticated:
            return MeetingErrorCode::kWrongPassword;
        case StatusCode::kResourceExhausted:
            return MeetingErrorCode::kRoomFull;
        case StatusCode::kPermissionDenied:
            return MeetingErrorCode::kForbidden;
        case StatusCode::kAborted:
            return MeetingErrorCode::kAllocationExhausted;
        case StatusCode::kUnavailable:
            return MeetingErrorCode::kUnavailable;
        case StatusCode::kInvalidArgument:
            return MeetingErrorCode::kInvalidArgument;
        default:
            return MeetingErrorCode::kInternal;
    }
}

inline void ErrorToProto(MeetingErrorCode code
                        , const common::Status& status
                        , proto::common::Error* error_proto) {
    if (error_proto == nullptr) {
        return;
    }
    error_proto->set_code(static_cast<int32_t>(code));
    error_proto->set_message(status.Message());
}

inline void ErrorToProto(const common::Status& status, proto::common::Error* error_proto) {
    ErrorToProto(MapStatus(status), status, error_proto);
}

} // namespace core
} // namespace meetcoord
