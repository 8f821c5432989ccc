#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

namespace meetcoord {
namespace common {

// 按键散列到固定数量的互斥锁, 不同键大概率互不阻塞
template <std::size_t N = 64>
class StripedMutex {
public:
    std::mutex& For(const std::string& key) {
        return stripes_[std::hash<std::string>{}(key) % N];
    }
private:
    std::array<std::mutex, N> stripes_;
};

}
}
