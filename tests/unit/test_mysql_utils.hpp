#pragma once

#include "common/config_loader.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/options.hpp"

#include <gtest/gtest.h>
#include <mysql/mysql.h>

#include <memory>
#include <string>

namespace testutils {

// 配置未启用 MySQL 或数据库不可达时返回 nullptr, 调用方据此跳过用例
inline std::shared_ptr<meetcoord::storage::ConnectionPool> CreatePoolFromConfig() {
    const auto cfg = meetcoord::common::ConfigLoader::LoadFromEnvOrDefault();
    if (!cfg.storage.mysql.enabled) {
        return nullptr;
    }
    auto pool = std::make_shared<meetcoord::storage::ConnectionPool>(
        meetcoord::storage::OptionsFromConfig(cfg.storage.mysql));
    auto first = pool->Acquire();
    if (!first.IsOk()) {
        return nullptr;
    }
    return pool;
}

inline void ExecuteSql(meetcoord::storage::ConnectionPool& pool, const std::string& sql) {
    auto lease_or = pool.Acquire();
    ASSERT_TRUE(lease_or.IsOk()) << lease_or.GetStatus().Message();
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    ASSERT_EQ(0, mysql_real_query(conn, sql.c_str(), sql.size())) << mysql_error(conn);
}

// 清理测试表，确保每次用例运行前数据库干净
inline void ClearMysqlTestData(meetcoord::storage::ConnectionPool& pool) {
    ExecuteSql(pool, "DELETE FROM meeting_messages");
    ExecuteSql(pool, "DELETE FROM meeting_participants");
    ExecuteSql(pool, "DELETE FROM meetings");
}

} // namespace testutils
