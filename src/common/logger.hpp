#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace meetcoord {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

#define MEETCOORD_LOG_DEBUG(...) ::meetcoord::common::GetLogger()->debug(__VA_ARGS__)
#define MEETCOORD_LOG_INFO(...)  ::meetcoord::common::GetLogger()->info(__VA_ARGS__)
#define MEETCOORD_LOG_WARN(...)  ::meetcoord::common::GetLogger()->warn(__VA_ARGS__)
#define MEETCOORD_LOG_ERROR(...) ::meetcoord::common::GetLogger()->error(__VA_ARGS__)

}
}
