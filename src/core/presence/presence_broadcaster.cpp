#include "core/presence/presence_broadcaster.hpp"
#include "common/clock.hpp"
#include "common/logger.hpp"

namespace meetcoord {
namespace core {
namespace presence {

std::shared_ptr<PresenceBroadcaster::Room> PresenceBroadcaster::FindRoom(const std::string& room_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<PresenceBroadcaster::Room> PresenceBroadcaster::FindOrCreateRoom(const std::string& room_id,
                                                                                 const std::string& meeting_id) {
    if (auto room = FindRoom(room_id)) {
        return room;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = rooms_[room_id];
    if (!slot) {
        slot = std::make_shared<Room>();
        slot->meeting_id = meeting_id;
        slot->created_at = common::CurrentUnixSeconds();
    }
    return slot;
}

std::vector<std::pair<std::string, std::shared_ptr<PresenceBroadcaster::Room>>> PresenceBroadcaster::SnapshotRooms() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return {rooms_.begin(), rooms_.end()};
}

// 房间为空时从表中摘除; 锁顺序固定为先房间表后房间
void PresenceBroadcaster::EraseIfEmpty(const std::string& room_id, const std::shared_ptr<Room>& room) {
    std::unique_lock<std::shared_mutex> map_lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end() || it->second != room) {
        return;
    }
    std::lock_guard<std::mutex> room_lock(room->mutex);
    if (!room->connections.empty()) {
        return;
    }
    room->removed = true;
    rooms_.erase(it);
}

void PresenceBroadcaster::CloseDropped(const std::string& room_id,
                                       const std::vector<std::shared_ptr<Connection>>& dropped) {
    for (const auto& connection : dropped) {
        MEETCOORD_LOG_WARN("[Presence] dropping slow consumer {} (user {}) from {}",
                           connection->Id(), connection->UserId(), room_id);
        connection->Close();
    }
}

common::Status PresenceBroadcaster::Register(const std::string& room_id,
                                             const std::string& meeting_id,
                                             std::shared_ptr<Connection> connection) {
    if (!connection) {
        return common::Status::InvalidArgument("connection is null");
    }
    if (connection->Closed()) {
        return common::Status::FailedPrecondition("connection already closed");
    }
    for (;;) {
        auto room = FindOrCreateRoom(room_id, meeting_id);
        std::lock_guard<std::mutex> lock(room->mutex);
        if (room->removed) {
            // 与 EraseIfEmpty 竞争失败, 重新查找
            continue;
        }
        room->connections[connection->Id()] = connection;
        return common::Status::OK();
    }
}

bool PresenceBroadcaster::Deregister(const std::string& room_id, const std::string& connection_id) {
    auto room = FindRoom(room_id);
    if (!room) {
        return false;
    }
    bool removed = false;
    bool empty = false;
    {
        std::lock_guard<std::mutex> lock(room->mutex);
        removed = room->connections.erase(connection_id) > 0;
        empty = room->connections.empty();
    }
    if (empty) {
        EraseIfEmpty(room_id, room);
    }
    return removed;
}

std::vector<std::shared_ptr<Connection>> PresenceBroadcaster::DeregisterUser(const std::string& room_id,
                                                                             const std::string& user_id) {
    std::vector<std::shared_ptr<Connection>> removed;
    auto room = FindRoom(room_id);
    if (!room) {
        return removed;
    }
    bool empty = false;
    {
        std::lock_guard<std::mutex> lock(room->mutex);
        for (auto it = room->connections.begin(); it != room->connections.end();) {
            if (it->second->UserId() == user_id) {
                removed.push_back(it->second);
                it = room->connections.erase(it);
            } else {
                ++it;
            }
        }
        empty = room->connections.empty();
    }
    if (empty) {
        EraseIfEmpty(room_id, room);
    }
    return removed;
}

std::size_t PresenceBroadcaster::Broadcast(const std::string& room_id,
                                           const RoomEvent& event,
                                           const std::string& exclude_connection_id) {
    auto room = FindRoom(room_id);
    if (!room) {
        return 0;
    }
    std::size_t delivered = 0;
    std::vector<std::shared_ptr<Connection>> dropped;
    bool empty = false;
    {
        std::lock_guard<std::mutex> lock(room->mutex);
        for (auto it = room->connections.begin(); it != room->connections.end();) {
            if (it->first == exclude_connection_id) {
                ++it;
                continue;
            }
            if (it->second->Deliver(event)) {
                ++delivered;
                ++it;
            } else {
                dropped.push_back(it->second);
                it = room->connections.erase(it);
            }
        }
        empty = room->connections.empty();
    }
    CloseDropped(room_id, dropped);
    if (empty) {
        EraseIfEmpty(room_id, room);
    }
    return delivered;
}

std::size_t PresenceBroadcaster::CloseRoom(const std::string& room_id, const RoomEvent& final_event) {
    std::shared_ptr<Room> room;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = rooms_.find(room_id);
        if (it == rooms_.end()) {
            return 0;
        }
        room = it->second;
        rooms_.erase(it);
    }

    std::unordered_map<std::string, std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(room->mutex);
        room->removed = true;
        connections.swap(room->connections);
    }
    for (const auto& kv : connections) {
        if (!kv.second->DeliverFinal(final_event)) {
            MEETCOORD_LOG_WARN("[Presence] final event not delivered to {}", kv.first);
        }
        kv.second->Close();
    }
    MEETCOORD_LOG_INFO("[Presence] closed {} with {} connection(s)", room_id, connections.size());
    return connections.size();
}

std::vector<StaleConnection> PresenceBroadcaster::CloseStale(std::int64_t now, std::int64_t max_idle_seconds) {
    std::vector<StaleConnection> stale;
    for (const auto& kv : SnapshotRooms()) {
        const auto& room = kv.second;
        std::vector<std::shared_ptr<Connection>> expired;
        bool empty = false;
        {
            std::lock_guard<std::mutex> lock(room->mutex);
            for (auto it = room->connections.begin(); it != room->connections.end();) {
                if (now - it->second->LastSeen() > max_idle_seconds || it->second->Closed()) {
                    expired.push_back(it->second);
                    stale.push_back({kv.first, room->meeting_id, it->second->UserId(), it->first});
                    it = room->connections.erase(it);
                } else {
                    ++it;
                }
            }
            empty = room->connections.empty();
        }
        for (const auto& connection : expired) {
            connection->Close();
        }
        if (empty) {
            EraseIfEmpty(kv.first, room);
        }
    }
    return stale;
}

std::size_t PresenceBroadcaster::ConnectionCount(const std::string& room_id) const {
    auto room = FindRoom(room_id);
    if (!room) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(room->mutex);
    return room->connections.size();
}

bool PresenceBroadcaster::HasUser(const std::string& room_id, const std::string& user_id) const {
    auto room = FindRoom(room_id);
    if (!room) {
        return false;
    }
    std::lock_guard<std::mutex> lock(room->mutex);
    for (const auto& kv : room->connections) {
        if (kv.second->UserId() == user_id) {
            return true;
        }
    }
    return false;
}

RoomStats PresenceBroadcaster::GetRoomStats() const {
    RoomStats stats;
    for (const auto& kv : SnapshotRooms()) {
        RoomStat stat;
        stat.room_id = kv.first;
        {
            std::lock_guard<std::mutex> lock(kv.second->mutex);
            if (kv.second->removed) {
                continue;
            }
            stat.meeting_id = kv.second->meeting_id;
            stat.created_at = kv.second->created_at;
            stat.connection_count = kv.second->connections.size();
        }
        stats.total_connections += stat.connection_count;
        stats.rooms.push_back(std::move(stat));
    }
    stats.total_rooms = stats.rooms.size();
    return stats;
}

} // namespace presence
} // namespace core
} // namespace meetcoord
