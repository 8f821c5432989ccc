#include "storage/mysql/chat_log.hpp"
#include "common/clock.hpp"
#include "core/meeting/errors.hpp"
#include "storage/mysql/sql_utils.hpp"
#include "storage/mysql/transaction.hpp"

#include <fmt/format.h>

namespace meetcoord {
namespace storage {

namespace {

constexpr const char* kMessageColumns =
    "meeting_id, sequence, sender_user_id, sender_name, body, UNIX_TIMESTAMP(sent_at)";

} // namespace

MySqlChatLog::MySqlChatLog(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

common::StatusOr<core::ChatMessage> MySqlChatLog::Append(const std::string& meeting_id,
                                                         const std::string& sender_user_id,
                                                         const std::string& sender_name,
                                                         const std::string& body) {
    if (meeting_id.empty() || sender_user_id.empty()) {
        return common::Status::InvalidArgument("meeting id and sender are required");
    }
    if (body.empty()) {
        return common::Status::InvalidArgument("message body is empty");
    }

    Transaction transaction(pool_);
    auto status = transaction.Begin();
    if (!status.IsOk()) {
        return status;
    }
    MYSQL* conn = transaction.Raw();

    // LAST_INSERT_ID(expr) 让递增后的序号通过 mysql_insert_id 取回, 会议行锁持有到提交
    status = Execute(conn, fmt::format(
        "UPDATE meetings SET chat_sequence = LAST_INSERT_ID(chat_sequence + 1) WHERE meeting_id = {}",
        Quote(conn, meeting_id)));
    if (!status.IsOk()) {
        return status;
    }
    if (mysql_affected_rows(conn) == 0) {
        return core::errors::MeetingNotFound(meeting_id);
    }

    core::ChatMessage message;
    message.meeting_id = meeting_id;
    message.sequence = static_cast<std::uint64_t>(mysql_insert_id(conn));
    message.sender_user_id = sender_user_id;
    message.sender_name = sender_name;
    message.body = body;
    message.sent_at = common::CurrentUnixSeconds();

    status = Execute(conn, fmt::format(
        "INSERT INTO meeting_messages (meeting_id, sequence, sender_user_id, sender_name, body, sent_at) "
        "VALUES ({}, {}, {}, {}, {}, {})",
        Quote(conn, meeting_id),
        message.sequence,
        Quote(conn, sender_user_id),
        Quote(conn, sender_name),
        Quote(conn, body),
        UnixTime(message.sent_at)));
    if (!status.IsOk()) {
        return status;
    }
    status = transaction.Commit();
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<core::ChatMessage>(std::move(message));
}

common::StatusOr<std::vector<core::ChatMessage>> MySqlChatLog::FetchSince(const core::ChatQuery& query) const {
    std::vector<core::ChatMessage> messages;
    if (query.limit <= 0) {
        return common::StatusOr<std::vector<core::ChatMessage>>(std::move(messages));
    }

    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();

    const auto meeting = Quote(conn, query.meeting_id);
    std::string sql;
    if (query.since_sequence == 0 && query.since_timestamp == 0) {
        // 最近 limit 条, 外层再按序号升序
        sql = fmt::format(
            "SELECT meeting_id, sequence, sender_user_id, sender_name, body, UNIX_TIMESTAMP(sent_at) FROM "
            "(SELECT meeting_id, sequence, sender_user_id, sender_name, body, sent_at FROM meeting_messages "
            "WHERE meeting_id = {} ORDER BY sequence DESC LIMIT {}) recent ORDER BY sequence ASC",
            meeting, query.limit);
    } else if (query.since_sequence > 0) {
        sql = fmt::format("SELECT {} FROM meeting_messages WHERE meeting_id = {} AND sequence > {} "
                          "ORDER BY sequence ASC LIMIT {}",
                          kMessageColumns, meeting, query.since_sequence, query.limit);
    } else {
        sql = fmt::format("SELECT {} FROM meeting_messages WHERE meeting_id = {} AND sent_at > {} "
                          "ORDER BY sequence ASC LIMIT {}",
                          kMessageColumns, meeting, UnixTime(query.since_timestamp), query.limit);
    }

    auto result = Query(conn, sql);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    if (result.Value()) {
        MYSQL_ROW row;
        while ((row = mysql_fetch_row(result.Value().get())) != nullptr) {
            core::ChatMessage message;
            message.meeting_id = ParseString(row[0]);
            message.sequence = ParseUInt64(row[1]);
            message.sender_user_id = ParseString(row[2]);
            message.sender_name = ParseString(row[3]);
            message.body = ParseString(row[4]);
            message.sent_at = ParseInt64(row[5]);
            messages.push_back(std::move(message));
        }
    }
    return common::StatusOr<std::vector<core::ChatMessage>>(std::move(messages));
}

} // namespace storage
} // namespace meetcoord
