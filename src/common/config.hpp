#pragma once

#include <string>

namespace meetcoord {
namespace common {

// 服务器配置
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50051;
    int request_timeout_ms = 3000; // 单个请求在线程池中的最长等待时间
};

// 日志配置
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
    bool integrate_thread_pool_logger = false;
};

// 线程池配置文件路径
struct ThreadPoolConfigPath {
    std::string config_path = "config/thread_pool.json";
};

// Mysql配置
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "meetcoord";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    bool enabled = false;
};

// 存储配置
struct StorageConfig {
    MysqlConfig mysql;
};

// Redis配置
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 200;
    int socket_timeout_ms = 200;
    int meeting_ttl_seconds = 300;
    bool enabled = false;
};

// 缓存配置
struct CacheConfig {
    RedisConfig redis;
};

// 会议创建与准入配置
struct MeetingConfig {
    int id_length = 12;
    int id_max_attempts = 5;
    int default_max_participants = 6;
    int max_participants_limit = 6;
    int min_participants = 2;
    int title_max_length = 200;
    int description_max_length = 1000;
    int password_min_length = 4;
    int password_max_length = 20;
    int store_lock_timeout_ms = 2000; // 单个会议锁的最长等待时间
};

// 生命周期配置
struct LifecycleConfig {
    bool end_when_empty = false;           // 最后一人离开时立即结束
    int idle_grace_seconds = 300;          // 无人会议的空闲宽限期
    int stale_connection_seconds = 90;     // 长连接心跳超时
    int sweep_interval_ms = 30000;         // 后台巡检间隔
};

// 在线广播配置
struct PresenceConfig {
    int outbox_capacity = 256; // 每个连接的待发送事件上限
    int writer_poll_ms = 200;  // 长连接写循环的轮询间隔
};

// 聊天配置
struct ChatConfig {
    int max_body_length = 2000;
    int default_history_limit = 50;
    int max_history_limit = 200;
};

// 应用配置
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    ThreadPoolConfigPath thread_pool;
    StorageConfig storage;
    CacheConfig cache;
    MeetingConfig meeting;
    LifecycleConfig lifecycle;
    PresenceConfig presence;
    ChatConfig chat;
};

}
}
