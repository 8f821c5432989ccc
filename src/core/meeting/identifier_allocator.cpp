#include "core/meeting/identifier_allocator.hpp"
#include "common/logger.hpp"
#include "common/string_util.hpp"
#include "core/meeting/errors.hpp"

#include <algorithm>
#include <cctype>
#include <random>

namespace meetcoord {
namespace core {

IdentifierAllocator::IdentifierAllocator(std::shared_ptr<MeetingStore> store,
                                         std::size_t length,
                                         int max_attempts,
                                         Generator generator)
    : store_(std::move(store))
    , length_(length)
    , max_attempts_(std::max(max_attempts, 1))
    , generator_(std::move(generator)) {
    if (!generator_) {
        generator_ = &IdentifierAllocator::RandomCandidate;
    }
}

common::StatusOr<std::string> IdentifierAllocator::Allocate() const {
    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        auto candidate = Normalize(generator_(length_));
        if (candidate.empty()) {
            continue;
        }
        auto exists = store_->MeetingExists(candidate);
        if (!exists.IsOk()) {
            return exists.GetStatus();
        }
        if (!exists.Value()) {
            return common::StatusOr<std::string>(std::move(candidate));
        }
        MEETCOORD_LOG_WARN("[IdentifierAllocator] collision on {} (attempt {}/{})",
                           candidate, attempt, max_attempts_);
    }
    return errors::AllocationExhausted(max_attempts_);
}

std::string IdentifierAllocator::Normalize(const std::string& raw) {
    auto result = common::Trim(raw);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

std::string IdentifierAllocator::RandomCandidate(std::size_t length) {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr char kChars[] =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz";

    std::uniform_int_distribution<int> dist(0, sizeof(kChars) - 2);
    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(kChars[dist(rng)]);
    }
    return result;
}

} // namespace core
} // namespace meetcoord
