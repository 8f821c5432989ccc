#pragma once

#include "core/chat/chat_log.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace meetcoord {
namespace storage {

// 基于 MySQL 的聊天记录
// 序号由 meetings.chat_sequence 在事务内递增分配, 多实例共享时仍然连续
class MySqlChatLog : public core::ChatLog {
public:
    explicit MySqlChatLog(std::shared_ptr<ConnectionPool> pool);

    common::StatusOr<core::ChatMessage> Append(const std::string& meeting_id,
                                               const std::string& sender_user_id,
                                               const std::string& sender_name,
                                               const std::string& body) override;

    common::StatusOr<std::vector<core::ChatMessage>> FetchSince(const core::ChatQuery& query) const override;

private:
    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace meetcoord
