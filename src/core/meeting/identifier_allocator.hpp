#pragma once

#include "common/status_or.hpp"
#include "core/meeting/meeting_store.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace meetcoord {
namespace core {

// 生成不与已有会议冲突的短会议ID
class IdentifierAllocator {
public:
    using Generator = std::function<std::string(std::size_t length)>;

    IdentifierAllocator(std::shared_ptr<MeetingStore> store,
                        std::size_t length = 12,
                        int max_attempts = 5,
                        Generator generator = nullptr);

    // 最多尝试 max_attempts 个候选, 全部冲突时返回 AllocationExhausted
    common::StatusOr<std::string> Allocate() const;

    // 用户输入的会议ID统一去空白并转小写
    static std::string Normalize(const std::string& raw);

    // 小写字母与数字组成的随机串
    static std::string RandomCandidate(std::size_t length);

    int MaxAttempts() const { return max_attempts_; }

private:
    std::shared_ptr<MeetingStore> store_;
    std::size_t length_;
    int max_attempts_;
    Generator generator_;
};

} // namespace core
} // namespace meetcoord
