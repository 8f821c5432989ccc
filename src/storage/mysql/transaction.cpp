#include "storage/mysql/transaction.hpp"
#include "common/logger.hpp"

namespace meetcoord {
namespace storage {

Transaction::Transaction(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

Transaction::~Transaction() {
    if (active_) {
        auto status = Rollback();
        if (!status.IsOk()) {
            MEETCOORD_LOG_WARN("[MySQL] rollback on scope exit failed: {}", status.Message());
        }
    }
}

common::Status Transaction::Begin() {
    if (active_) {
        return common::Status::FailedPrecondition("transaction already started");
    }
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    lease_ = std::move(lease_or.Value());
    conn_ = lease_.Raw();
    if (mysql_autocommit(conn_, 0) != 0) {
        return common::Status::Unavailable(mysql_error(conn_));
    }
    active_ = true;
    return common::Status::OK();
}

common::Status Transaction::Commit() {
    if (!active_) {
        return common::Status::OK();
    }
    if (mysql_commit(conn_) != 0) {
        // 保持 active, 析构时回滚
        return common::Status::Unavailable(mysql_error(conn_));
    }
    active_ = false;
    RestoreAutocommit();
    return common::Status::OK();
}

common::Status Transaction::Rollback() {
    if (!active_) {
        return common::Status::OK();
    }
    active_ = false;
    if (mysql_rollback(conn_) != 0) {
        auto status = common::Status::Unavailable(mysql_error(conn_));
        RestoreAutocommit();
        return status;
    }
    RestoreAutocommit();
    return common::Status::OK();
}

void Transaction::RestoreAutocommit() {
    if (mysql_autocommit(conn_, 1) != 0) {
        MEETCOORD_LOG_WARN("[MySQL] failed to restore autocommit: {}", mysql_error(conn_));
    }
}

} // namespace storage
} // namespace meetcoord
