#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <mysql/mysql.h>

#include <cstdint>
#include <memory>
#include <string>

namespace meetcoord {
namespace storage {

struct ResultDeleter {
    void operator()(MYSQL_RES* result) const {
        if (result != nullptr) {
            mysql_free_result(result);
        }
    }
};
using ResultPtr = std::unique_ptr<MYSQL_RES, ResultDeleter>;

// 把 MySQL 错误码映射为 Status: 主键冲突 -> AlreadyExists, 断线/锁等待 -> Unavailable
common::Status MapMySqlError(MYSQL* conn);

std::string Escape(MYSQL* conn, const std::string& value);
std::string Quote(MYSQL* conn, const std::string& value);

// FROM_UNIXTIME(...) 表达式; OrNull 版本在 seconds <= 0 时生成 NULL
std::string UnixTime(std::int64_t seconds);
std::string UnixTimeOrNull(std::int64_t seconds);

common::Status Execute(MYSQL* conn, const std::string& sql);
common::StatusOr<ResultPtr> Query(MYSQL* conn, const std::string& sql);

std::int64_t ParseInt64(const char* field);
std::uint64_t ParseUInt64(const char* field);
std::string ParseString(const char* field);
bool ParseBool(const char* field);

} // namespace storage
} // namespace meetcoord
