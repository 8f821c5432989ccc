#include "core/presence/connection.hpp"
#include "common/clock.hpp"

#include <random>

namespace meetcoord {
namespace core {
namespace presence {

Connection::Connection(std::string connection_id, std::string user_id)
    : id_(std::move(connection_id))
    , user_id_(std::move(user_id))
    , last_seen_(common::CurrentUnixSeconds()) {}

QueuedConnection::QueuedConnection(std::string connection_id, std::string user_id, std::size_t outbox_capacity)
    : Connection(std::move(connection_id), std::move(user_id))
    , outbox_(outbox_capacity == 0 ? 1 : outbox_capacity) {}

bool QueuedConnection::Deliver(const RoomEvent& event) {
    return outbox_.TryPush(event);
}

bool QueuedConnection::DeliverFinal(const RoomEvent& event) {
    RoomEvent item = event;
    RoomEvent dropped;
    return outbox_.OverwritePush(std::move(item), &dropped);
}

void QueuedConnection::Close() {
    outbox_.Close();
}

bool QueuedConnection::Closed() const {
    return outbox_.Closed();
}

bool QueuedConnection::Next(RoomEvent& out, std::chrono::milliseconds timeout) {
    return outbox_.WaitPopFor(out, timeout);
}

std::string NewConnectionId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr char kHex[] = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id = "conn_";
    for (int i = 0; i < 16; ++i) {
        id.push_back(kHex[dist(rng)]);
    }
    return id;
}

} // namespace presence
} // namespace core
} // namespace meetcoord
