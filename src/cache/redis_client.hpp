#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <sw/redis++/redis++.h>

#include <memory>
#include <mutex>
#include <string>

namespace meetcoord {
namespace cache {

// redis++ 的薄封装, 异常统一转换为 Status
class RedisClient {
public:
    explicit RedisClient(const common::RedisConfig& config);
    ~RedisClient();

    // 懒连接, 重复调用无副作用; 配置未启用时返回 Unavailable
    common::Status Connect();

    // 连接并发送 PING
    common::Status Ping();

    common::Status SetEx(const std::string& key, const std::string& value, int ttl_seconds);

    // 键不存在时返回 NotFound
    common::StatusOr<std::string> Get(const std::string& key);

    common::Status Del(const std::string& key);

    common::StatusOr<bool> Exists(const std::string& key);

    const common::RedisConfig& Config() const { return config_; }

private:
    std::shared_ptr<sw::redis::Redis> Handle();

private:
    common::RedisConfig config_;
    std::mutex mutex_;
    std::shared_ptr<sw::redis::Redis> redis_;
};

} // namespace cache
} // namespace meetcoord
