#pragma once

#include "core/presence/room_event.hpp"

#include <mpmc/blocking_queue_adapter.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace meetcoord {
namespace core {
namespace presence {

// 一个参与者的实时连接
class Connection {
public:
    Connection(std::string connection_id, std::string user_id);
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& Id() const noexcept { return id_; }
    const std::string& UserId() const noexcept { return user_id_; }

    // 非阻塞投递; 返回 false 表示连接已关闭或积压已满
    virtual bool Deliver(const RoomEvent& event) = 0;
    // 关闭前的最后一条事件, 积压已满时允许挤掉最旧的事件
    virtual bool DeliverFinal(const RoomEvent& event) { return Deliver(event); }
    virtual void Close() = 0;
    virtual bool Closed() const = 0;

    // 记录心跳
    void Touch(std::int64_t now) noexcept { last_seen_.store(now, std::memory_order_relaxed); }
    std::int64_t LastSeen() const noexcept { return last_seen_.load(std::memory_order_relaxed); }

private:
    std::string id_;
    std::string user_id_;
    std::atomic<std::int64_t> last_seen_;
};

// 带有限发件箱的连接, 由传输层的写循环取出事件
class QueuedConnection : public Connection {
public:
    QueuedConnection(std::string connection_id, std::string user_id, std::size_t outbox_capacity);

    bool Deliver(const RoomEvent& event) override;
    bool DeliverFinal(const RoomEvent& event) override;
    void Close() override;
    bool Closed() const override;

    // 取下一条事件; 超时, 或已关闭且发件箱为空时返回 false
    bool Next(RoomEvent& out, std::chrono::milliseconds timeout);

    std::size_t Pending() const noexcept { return outbox_.Size(); }
    std::size_t Capacity() const noexcept { return outbox_.Capacity(); }

private:
    BlockingQueueAdapter<RoomEvent> outbox_;
};

std::string NewConnectionId();

} // namespace presence
} // namespace core
} // namespace meetcoord
