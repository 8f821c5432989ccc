#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace meetcoord {
namespace common {

// 去掉首尾空白
inline std::string Trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

}
}
