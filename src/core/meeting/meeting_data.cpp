#include "core/meeting/meeting_data.hpp"

namespace meetcoord {
namespace core {

namespace {
constexpr char kRoomPrefix[] = "room_";
}

std::string RoomIdFor(const std::string& meeting_id) {
    return kRoomPrefix + meeting_id;
}

std::string MeetingData::RoomId() const {
    return RoomIdFor(meeting_id);
}

const ParticipantData* MeetingData::FindActive(const std::string& user_id) const {
    auto it = std::find_if(participants.begin(), participants.end(), [&](const ParticipantData& p) {
        return p.IsActive() && p.user_id == user_id;
    });
    return it == participants.end() ? nullptr : &*it;
}

ParticipantData* MeetingData::FindActive(const std::string& user_id) {
    auto it = std::find_if(participants.begin(), participants.end(), [&](const ParticipantData& p) {
        return p.IsActive() && p.user_id == user_id;
    });
    return it == participants.end() ? nullptr : &*it;
}

std::int64_t MeetingData::IdleSince() const {
    std::int64_t last = actual_start_time;
    for (const auto& p : participants) {
        last = std::max(last, p.left_at);
    }
    return last;
}

std::string MeetingStatusToString(MeetingStatus status) {
    switch (status) {
        case MeetingStatus::kScheduled:
            return "scheduled";
        case MeetingStatus::kActive:
            return "active";
        case MeetingStatus::kEnded:
            return "ended";
    }
    return "unknown";
}

bool ParseMeetingStatus(const std::string& text, MeetingStatus* status) {
    if (status == nullptr) {
        return false;
    }
    if (text == "scheduled") {
        *status = MeetingStatus::kScheduled;
    } else if (text == "active") {
        *status = MeetingStatus::kActive;
    } else if (text == "ended") {
        *status = MeetingStatus::kEnded;
    } else {
        return false;
    }
    return true;
}

bool IsLegalTransition(MeetingStatus from, MeetingStatus to) {
    switch (from) {
        case MeetingStatus::kScheduled:
            return to == MeetingStatus::kActive || to == MeetingStatus::kEnded;
        case MeetingStatus::kActive:
            return to == MeetingStatus::kEnded;
        case MeetingStatus::kEnded:
            return false;
    }
    return false;
}

} // namespace core
} // namespace meetcoord
