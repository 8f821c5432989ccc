#include "cache/redis_client.hpp"

#include <chrono>

namespace meetcoord {
namespace cache {

RedisClient::RedisClient(const common::RedisConfig& config)
    : config_(config) {}

RedisClient::~RedisClient() = default;

std::shared_ptr<sw::redis::Redis> RedisClient::Handle() {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_;
}

common::Status RedisClient::Connect() {
    if (!config_.enabled) {
        return common::Status::Unavailable("redis is disabled in the configuration");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (redis_) {
        return common::Status::OK();
    }

    try {
        sw::redis::ConnectionOptions opts;
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<std::size_t>(config_.pool_size > 0 ? config_.pool_size : 1);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        redis_ = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return common::Status::Unavailable("failed to connect to redis: " + std::string(err.what()));
    }
}

common::Status RedisClient::Ping() {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        Handle()->ping();
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return common::Status::Unavailable("redis ping failed: " + std::string(err.what()));
    }
}

common::Status RedisClient::SetEx(const std::string& key, const std::string& value, int ttl_seconds) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        Handle()->set(key, value, std::chrono::seconds(ttl_seconds));
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return common::Status::Unavailable("redis set failed: " + std::string(err.what()));
    }
}

common::StatusOr<std::string> RedisClient::Get(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        auto val = Handle()->get(key);
        if (!val) {
            return common::Status::NotFound("key not found in redis: " + key);
        }
        return common::StatusOr<std::string>(*val);
    } catch (const sw::redis::Error& err) {
        return common::Status::Unavailable("redis get failed: " + std::string(err.what()));
    }
}

common::Status RedisClient::Del(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        Handle()->del(key);
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return common::Status::Unavailable("redis del failed: " + std::string(err.what()));
    }
}

common::StatusOr<bool> RedisClient::Exists(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        auto count = Handle()->exists(key);
        return common::StatusOr<bool>(count > 0);
    } catch (const sw::redis::Error& err) {
        return common::Status::Unavailable("redis exists failed: " + std::string(err.what()));
    }
}

} // namespace cache
} // namespace meetcoord
