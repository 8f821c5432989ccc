#include "storage/mysql/connection_pool.hpp"

#include <chrono>

namespace meetcoord {
namespace storage {

ConnectionPool::ConnectionPool(Options options) : options_(std::move(options)) {}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() {
    if (pool_ && connection_) {
        pool_->Return(std::move(connection_));
    }
    pool_ = nullptr;
}

common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        // 有空闲连接直接复用
        if (!idle_.empty()) {
            auto connection = std::move(idle_.front());
            idle_.pop();
            return common::StatusOr<Lease>(Lease(this, std::move(connection)));
        }
        // 未达上限则新建, 建连期间不持锁
        if (total_connections_ < options_.pool_size) {
            ++total_connections_;
            lock.unlock();
            auto created = Connection::Create(options_);
            if (!created.IsOk()) {
                std::lock_guard<std::mutex> guard(mutex_);
                --total_connections_;
                cv_.notify_one();
                return created.GetStatus();
            }
            return common::StatusOr<Lease>(Lease(this, std::move(created.Value())));
        }
        // 达到上限, 等待归还或名额释放
        if (!cv_.wait_until(lock, deadline, [this]() {
                return !idle_.empty() || total_connections_ < options_.pool_size;
            })) {
            return common::Status::Unavailable("timed out acquiring mysql connection");
        }
    }
}

std::size_t ConnectionPool::TotalConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_connections_;
}

void ConnectionPool::Return(std::unique_ptr<Connection> connection) {
    // 断开的连接直接丢弃, 释放名额
    if (!connection->Ping()) {
        std::lock_guard<std::mutex> lock(mutex_);
        --total_connections_;
        cv_.notify_one();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push(std::move(connection));
    }
    cv_.notify_one();
}

} // namespace storage
} // namespace meetcoord
