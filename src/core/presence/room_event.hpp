#pragma once

#include <cstdint>
#include <string>

namespace meetcoord {
namespace core {
namespace presence {

enum class RoomEventType {
    kRoomJoined = 0,      // 仅发给加入者的确认
    kParticipantJoined,
    kParticipantLeft,
    kChatMessage,
    kMeetingEnded,
    kError,               // 仅单播
};

struct RoomEvent {
    RoomEventType type = RoomEventType::kError;
    std::string   meeting_id;
    std::string   room_id;
    std::string   user_id;                // 事件相关的用户
    std::string   display_name;
    int           active_participants = 0; // 事件发生后的在会人数
    std::uint64_t sequence = 0;            // 聊天消息序号
    std::string   body;                    // 聊天内容或错误描述
    int           error_code = 0;          // 仅 kError, 取值同 MeetingErrorCode
    std::int64_t  timestamp = 0;
};

inline const char* RoomEventTypeName(RoomEventType type) {
    switch (type) {
        case RoomEventType::kRoomJoined:
            return "room-joined";
        case RoomEventType::kParticipantJoined:
            return "participant-joined";
        case RoomEventType::kParticipantLeft:
            return "participant-left";
        case RoomEventType::kChatMessage:
            return "chat-message";
        case RoomEventType::kMeetingEnded:
            return "meeting-ended";
        case RoomEventType::kError:
            return "error";
    }
    return "unknown";
}

} // namespace presence
} // namespace core
} // namespace meetcoord
