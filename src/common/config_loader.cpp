#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace meetcoord {
namespace common {

namespace {

// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("MEETCOORD_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

// 读取可选字段, 缺省时保留默认值
template <typename T>
void ReadField(const nlohmann::json& section, const char* key, T& field) {
    field = section.value(key, field);
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

const AppConfig& GlobalConfig() {
    static const AppConfig config = ConfigLoader::LoadFromEnvOrDefault();
    return config;
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    if (j.contains("server")) {
        const auto& server = j["server"];
        ReadField(server, "host", cfg.server.host);
        ReadField(server, "port", cfg.server.port);
        ReadField(server, "request_timeout_ms", cfg.server.request_timeout_ms);
    }
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        ReadField(logging, "level", cfg.logging.level);
        ReadField(logging, "pattern", cfg.logging.pattern);
        ReadField(logging, "console", cfg.logging.console);
        ReadField(logging, "file", cfg.logging.file);
        ReadField(logging, "integrate_thread_pool_logger", cfg.logging.integrate_thread_pool_logger);
    }
    if (j.contains("thread_pool")) {
        ReadField(j["thread_pool"], "config_path", cfg.thread_pool.config_path);
    }
    // Storage配置
    if (j.contains("storage") && j["storage"].contains("mysql")) {
        const auto& mysql = j["storage"]["mysql"];
        ReadField(mysql, "host", cfg.storage.mysql.host);
        ReadField(mysql, "port", cfg.storage.mysql.port);
        ReadField(mysql, "user", cfg.storage.mysql.user);
        ReadField(mysql, "password", cfg.storage.mysql.password);
        ReadField(mysql, "database", cfg.storage.mysql.database);
        ReadField(mysql, "pool_size", cfg.storage.mysql.pool_size);
        ReadField(mysql, "connection_timeout_ms", cfg.storage.mysql.connection_timeout_ms);
        ReadField(mysql, "read_timeout_ms", cfg.storage.mysql.read_timeout_ms);
        ReadField(mysql, "write_timeout_ms", cfg.storage.mysql.write_timeout_ms);
        ReadField(mysql, "enabled", cfg.storage.mysql.enabled);
    }
    // Cache配置
    if (j.contains("cache") && j["cache"].contains("redis")) {
        const auto& redis = j["cache"]["redis"];
        ReadField(redis, "host", cfg.cache.redis.host);
        ReadField(redis, "port", cfg.cache.redis.port);
        ReadField(redis, "password", cfg.cache.redis.password);
        ReadField(redis, "db", cfg.cache.redis.db);
        ReadField(redis, "pool_size", cfg.cache.redis.pool_size);
        ReadField(redis, "connection_timeout_ms", cfg.cache.redis.connection_timeout_ms);
        ReadField(redis, "socket_timeout_ms", cfg.cache.redis.socket_timeout_ms);
        ReadField(redis, "meeting_ttl_seconds", cfg.cache.redis.meeting_ttl_seconds);
        ReadField(redis, "enabled", cfg.cache.redis.enabled);
    }
    if (j.contains("meeting")) {
        const auto& meeting = j["meeting"];
        ReadField(meeting, "id_length", cfg.meeting.id_length);
        ReadField(meeting, "id_max_attempts", cfg.meeting.id_max_attempts);
        ReadField(meeting, "default_max_participants", cfg.meeting.default_max_participants);
        ReadField(meeting, "max_participants_limit", cfg.meeting.max_participants_limit);
        ReadField(meeting, "min_participants", cfg.meeting.min_participants);
        ReadField(meeting, "title_max_length", cfg.meeting.title_max_length);
        ReadField(meeting, "description_max_length", cfg.meeting.description_max_length);
        ReadField(meeting, "password_min_length", cfg.meeting.password_min_length);
        ReadField(meeting, "password_max_length", cfg.meeting.password_max_length);
        ReadField(meeting, "store_lock_timeout_ms", cfg.meeting.store_lock_timeout_ms);
    }
    if (j.contains("lifecycle")) {
        const auto& lifecycle = j["lifecycle"];
        ReadField(lifecycle, "end_when_empty", cfg.lifecycle.end_when_empty);
        ReadField(lifecycle, "idle_grace_seconds", cfg.lifecycle.idle_grace_seconds);
        ReadField(lifecycle, "stale_connection_seconds", cfg.lifecycle.stale_connection_seconds);
        ReadField(lifecycle, "sweep_interval_ms", cfg.lifecycle.sweep_interval_ms);
    }
    if (j.contains("presence")) {
        const auto& presence = j["presence"];
        ReadField(presence, "outbox_capacity", cfg.presence.outbox_capacity);
        ReadField(presence, "writer_poll_ms", cfg.presence.writer_poll_ms);
    }
    if (j.contains("chat")) {
        const auto& chat = j["chat"];
        ReadField(chat, "max_body_length", cfg.chat.max_body_length);
        ReadField(chat, "default_history_limit", cfg.chat.default_history_limit);
        ReadField(chat, "max_history_limit", cfg.chat.max_history_limit);
    }
    return cfg;
}

}
}
