#pragma once

#include "common/status.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace meetcoord {
namespace storage {

// 在一个租约连接上的事务, 未提交时析构自动回滚
class Transaction {
public:
    explicit Transaction(std::shared_ptr<ConnectionPool> pool);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    common::Status Begin();
    common::Status Commit();
    common::Status Rollback();

    MYSQL* Raw() const noexcept { return conn_; }
    bool Active() const noexcept { return active_; }

private:
    void RestoreAutocommit();

    std::shared_ptr<ConnectionPool> pool_;
    ConnectionPool::Lease lease_;
    MYSQL* conn_ = nullptr;
    bool active_ = false;
};

} // namespace storage
} // namespace meetcoord
