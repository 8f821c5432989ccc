#pragma once

#include <chrono>
#include <cstdint>

namespace meetcoord {
namespace common {

inline std::int64_t CurrentUnixSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}
}
