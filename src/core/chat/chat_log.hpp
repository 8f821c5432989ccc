#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meetcoord {
namespace core {

struct ChatMessage {
    std::string   meeting_id;
    std::uint64_t sequence = 0;   // 会议内从 1 开始连续递增
    std::string   sender_user_id;
    std::string   sender_name;
    std::string   body;
    std::int64_t  sent_at = 0;
};

// since_sequence 与 since_timestamp 都为 0 时返回最近的 limit 条
struct ChatQuery {
    std::string   meeting_id;
    std::uint64_t since_sequence = 0;
    std::int64_t  since_timestamp = 0;
    int           limit = 50;
};

// 按会议追加的聊天记录, 不提供修改与删除
class ChatLog {
public:
    virtual ~ChatLog() = default;

    virtual common::StatusOr<ChatMessage> Append(const std::string& meeting_id,
                                                 const std::string& sender_user_id,
                                                 const std::string& sender_name,
                                                 const std::string& body) = 0;

    // 结果按 sequence 升序
    virtual common::StatusOr<std::vector<ChatMessage>> FetchSince(const ChatQuery& query) const = 0;
};

class InMemoryChatLog : public ChatLog {
public:
    common::StatusOr<ChatMessage> Append(const std::string& meeting_id,
                                         const std::string& sender_user_id,
                                         const std::string& sender_name,
                                         const std::string& body) override;

    common::StatusOr<std::vector<ChatMessage>> FetchSince(const ChatQuery& query) const override;

private:
    struct MeetingLog {
        mutable std::mutex mutex;
        std::vector<ChatMessage> messages;
    };

    std::shared_ptr<MeetingLog> FindLog(const std::string& meeting_id) const;
    std::shared_ptr<MeetingLog> FindOrCreateLog(const std::string& meeting_id);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<MeetingLog>> logs_;
};

// 从已按 sequence 升序排列的消息中挑出查询窗口
std::vector<ChatMessage> SelectWindow(const std::vector<ChatMessage>& ordered, const ChatQuery& query);

} // namespace core
} // namespace meetcoord
