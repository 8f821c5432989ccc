#include "storage/mysql/sql_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>

namespace meetcoord {
namespace storage {

namespace {

constexpr unsigned int kDuplicateEntry = 1062;
constexpr unsigned int kLockWaitTimeout = 1205;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kServerGone = 2006;
constexpr unsigned int kServerLost = 2013;

} // namespace

common::Status MapMySqlError(MYSQL* conn) {
    const unsigned int err = mysql_errno(conn);
    switch (err) {
        case kDuplicateEntry:
            return common::Status::AlreadyExists(mysql_error(conn));
        case kLockWaitTimeout:
        case kDeadlock:
        case kServerGone:
        case kServerLost:
            return common::Status::Unavailable(mysql_error(conn));
        default:
            return common::Status::Internal(fmt::format("mysql error {}: {}", err, mysql_error(conn)));
    }
}

std::string Escape(MYSQL* conn, const std::string& value) {
    if (!conn) {
        return value;
    }
    std::string buf;
    buf.resize(value.size() * 2 + 1);
    unsigned long escaped_len = mysql_real_escape_string(conn, buf.data(), value.data(), value.size());
    buf.resize(escaped_len);
    return buf;
}

std::string Quote(MYSQL* conn, const std::string& value) {
    return fmt::format("'{}'", Escape(conn, value));
}

std::string UnixTime(std::int64_t seconds) {
    return fmt::format("FROM_UNIXTIME({})", std::max<std::int64_t>(seconds, 1));
}

std::string UnixTimeOrNull(std::int64_t seconds) {
    if (seconds <= 0) {
        return "NULL";
    }
    return fmt::format("FROM_UNIXTIME({})", seconds);
}

common::Status Execute(MYSQL* conn, const std::string& sql) {
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn);
    }
    return common::Status::OK();
}

common::StatusOr<ResultPtr> Query(MYSQL* conn, const std::string& sql) {
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn);
    }
    ResultPtr result(mysql_store_result(conn));
    if (!result && mysql_field_count(conn) != 0) {
        return MapMySqlError(conn);
    }
    return common::StatusOr<ResultPtr>(std::move(result));
}

std::int64_t ParseInt64(const char* field) {
    if (!field) return 0;
    return std::strtoll(field, nullptr, 10);
}

std::uint64_t ParseUInt64(const char* field) {
    if (!field) return 0;
    return static_cast<std::uint64_t>(std::strtoull(field, nullptr, 10));
}

std::string ParseString(const char* field) {
    return field ? std::string(field) : std::string();
}

bool ParseBool(const char* field) {
    return ParseInt64(field) != 0;
}

} // namespace storage
} // namespace meetcoord
