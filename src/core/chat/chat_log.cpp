#include "core/chat/chat_log.hpp"
#include "common/clock.hpp"

#include <algorithm>

namespace meetcoord {
namespace core {

std::vector<ChatMessage> SelectWindow(const std::vector<ChatMessage>& ordered, const ChatQuery& query) {
    std::vector<ChatMessage> window;
    if (query.limit <= 0) {
        return window;
    }
    const auto limit = static_cast<std::size_t>(query.limit);

    if (query.since_sequence == 0 && query.since_timestamp == 0) {
        auto first = ordered.size() > limit ? ordered.end() - static_cast<std::ptrdiff_t>(limit) : ordered.begin();
        window.assign(first, ordered.end());
        return window;
    }

    auto it = ordered.begin();
    if (query.since_sequence > 0) {
        it = std::upper_bound(ordered.begin(), ordered.end(), query.since_sequence,
            [](std::uint64_t seq, const ChatMessage& m) { return seq < m.sequence; });
    } else {
        it = std::find_if(ordered.begin(), ordered.end(), [&](const ChatMessage& m) {
            return m.sent_at > query.since_timestamp;
        });
    }
    for (; it != ordered.end() && window.size() < limit; ++it) {
        window.push_back(*it);
    }
    return window;
}

std::shared_ptr<InMemoryChatLog::MeetingLog> InMemoryChatLog::FindLog(const std::string& meeting_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = logs_.find(meeting_id);
    if (it == logs_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<InMemoryChatLog::MeetingLog> InMemoryChatLog::FindOrCreateLog(const std::string& meeting_id) {
    if (auto log = FindLog(meeting_id)) {
        return log;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = logs_[meeting_id];
    if (!slot) {
        slot = std::make_shared<MeetingLog>();
    }
    return slot;
}

common::StatusOr<ChatMessage> InMemoryChatLog::Append(const std::string& meeting_id,
                                                      const std::string& sender_user_id,
                                                      const std::string& sender_name,
                                                      const std::string& body) {
    if (meeting_id.empty() || sender_user_id.empty()) {
        return common::Status::InvalidArgument("meeting id and sender are required");
    }
    if (body.empty()) {
        return common::Status::InvalidArgument("message body is empty");
    }
    auto log = FindOrCreateLog(meeting_id);
    std::lock_guard<std::mutex> lock(log->mutex);
    ChatMessage message;
    message.meeting_id = meeting_id;
    message.sequence = log->messages.size() + 1;
    message.sender_user_id = sender_user_id;
    message.sender_name = sender_name;
    message.body = body;
    message.sent_at = common::CurrentUnixSeconds();
    log->messages.push_back(message);
    return common::StatusOr<ChatMessage>(std::move(message));
}

common::StatusOr<std::vector<ChatMessage>> InMemoryChatLog::FetchSince(const ChatQuery& query) const {
    auto log = FindLog(query.meeting_id);
    if (!log) {
        return common::StatusOr<std::vector<ChatMessage>>(std::vector<ChatMessage>{});
    }
    std::lock_guard<std::mutex> lock(log->mutex);
    return common::StatusOr<std::vector<ChatMessage>>(SelectWindow(log->messages, query));
}

} // namespace core
} // namespace meetcoord
