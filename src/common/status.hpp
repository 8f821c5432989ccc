#pragma once

#include <string>
#include <utility>

namespace meetcoord {
namespace common {

// 状态码枚举, 取值与 gRPC 状态码一致
enum class StatusCode {
    kOk = 0,
    kInvalidArgument = 3,
    kNotFound = 5,
    kAlreadyExists = 6,
    kPermissionDenied = 7,
    kResourceExhausted = 8,
    kFailedPrecondition = 9,
    kAborted = 10,
    kInternal = 13,
    kUnavailable = 14,
    kUnauthenticated = 16,
};

// 表示操作结果的状态
class Status {
public:
    Status() = default;
    Status(StatusCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() {
        return Status(StatusCode::kOk, "");
    }
    static Status InvalidArgument(std::string message) {
        return Status(StatusCode::kInvalidArgument, std::move(message));
    }
    static Status NotFound(std::string message) {
        return Status(StatusCode::kNotFound, std::move(message));
    }
    static Status AlreadyExists(std::string message) {
        return Status(StatusCode::kAlreadyExists, std::move(message));
    }
    static Status PermissionDenied(std::string message) {
        return Status(StatusCode::kPermissionDenied, std::move(message));
    }
    static Status ResourceExhausted(std::string message) {
        return Status(StatusCode::kResourceExhausted, std::move(message));
    }
    static Status FailedPrecondition(std::string message) {
        return Status(StatusCode::kFailedPrecondition, std::move(message));
    }
    static Status Aborted(std::string message) {
        return Status(StatusCode::kAborted, std::move(message));
    }
    static Status Unauthenticated(std::string message) {
        return Status(StatusCode::kUnauthenticated, std::move(message));
    }
    static Status Internal(std::string message) {
        return Status(StatusCode::kInternal, std::move(message));
    }
    static Status Unavailable(std::string message) {
        return Status(StatusCode::kUnavailable, std::move(message));
    }

    bool IsOk() const {
        return code_ == StatusCode::kOk;
    }
    StatusCode Code() const {
        return code_;
    }
    const std::string& Message() const {
        return message_;
    }
private:
    StatusCode code_ = StatusCode::kOk;
    std::string message_;
};

inline std::string StatusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::kOk:
            return "OK";
        case StatusCode::kInvalidArgument:
            return "Invalid Argument";
        case StatusCode::kNotFound:
            return "Not Found";
        case StatusCode::kAlreadyExists:
            return "Already Exists";
        case StatusCode::kPermissionDenied:
            return "Permission Denied";
        case StatusCode::kResourceExhausted:
            return "Resource Exhausted";
        case StatusCode::kFailedPrecondition:
            return "Failed Precondition";
        case StatusCode::kAborted:
            return "Aborted";
        case StatusCode::kUnauthenticated:
            return "Unauthenticated";
        case StatusCode::kInternal:
            return "Internal";
        case StatusCode::kUnavailable:
            return "Unavailable";
        default:
            return "Unknown";
    }
}

}
}
