#pragma once

#include "common/status.hpp"
#include "core/presence/connection.hpp"
#include "core/presence/room_event.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meetcoord {
namespace core {
namespace presence {

struct RoomStat {
    std::string  room_id;
    std::string  meeting_id;
    std::size_t  connection_count = 0;
    std::int64_t created_at = 0;
};

struct RoomStats {
    std::size_t total_rooms = 0;
    std::size_t total_connections = 0;
    std::vector<RoomStat> rooms;
};

// 被巡检关闭的连接
struct StaleConnection {
    std::string room_id;
    std::string meeting_id;
    std::string user_id;
    std::string connection_id;
};

// 进程内的房间 -> 实时连接注册表
//
// 房间表的读写锁只用于查找, 插入与删除; 每个房间有自己的互斥锁,
// 注册, 注销与广播都只锁住对应房间. 投递不阻塞, 发件箱已满的连接
// 会被关闭并移出房间, 不会拖住同房间的其他连接.
class PresenceBroadcaster {
public:
    PresenceBroadcaster() = default;

    common::Status Register(const std::string& room_id,
                            const std::string& meeting_id,
                            std::shared_ptr<Connection> connection);

    // 注销单个连接, 不关闭它
    bool Deregister(const std::string& room_id, const std::string& connection_id);

    // 注销并返回某用户在房间内的全部连接
    std::vector<std::shared_ptr<Connection>> DeregisterUser(const std::string& room_id,
                                                            const std::string& user_id);

    // 投递到房间内除 exclude_connection_id 外的所有连接, 返回成功投递数
    std::size_t Broadcast(const std::string& room_id,
                          const RoomEvent& event,
                          const std::string& exclude_connection_id = "");

    // 发送终止事件后关闭并移除整个房间, 返回关闭的连接数
    std::size_t CloseRoom(const std::string& room_id, const RoomEvent& final_event);

    // 关闭超过 max_idle_seconds 未心跳的连接
    std::vector<StaleConnection> CloseStale(std::int64_t now, std::int64_t max_idle_seconds);

    std::size_t ConnectionCount(const std::string& room_id) const;
    bool HasUser(const std::string& room_id, const std::string& user_id) const;

    RoomStats GetRoomStats() const;

private:
    struct Room {
        std::mutex mutex;
        std::string meeting_id;
        std::int64_t created_at = 0;
        bool removed = false; // 已从房间表摘除, 注册方需重新查找
        std::unordered_map<std::string, std::shared_ptr<Connection>> connections;
    };

    std::shared_ptr<Room> FindRoom(const std::string& room_id) const;
    std::shared_ptr<Room> FindOrCreateRoom(const std::string& room_id, const std::string& meeting_id);
    std::vector<std::pair<std::string, std::shared_ptr<Room>>> SnapshotRooms() const;
    void EraseIfEmpty(const std::string& room_id, const std::shared_ptr<Room>& room);
    static void CloseDropped(const std::string& room_id,
                             const std::vector<std::shared_ptr<Connection>>& dropped);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
};

} // namespace presence
} // namespace core
} // namespace meetcoord
