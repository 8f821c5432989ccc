#include "core/meeting/meeting_store.hpp"
#include "common/clock.hpp"
#include "core/meeting/errors.hpp"

#include <algorithm>
#include <cmath>

namespace meetcoord {
namespace core {

std::int64_t ComputeDurationMinutes(std::int64_t started_at, std::int64_t ended_at) {
    if (started_at <= 0 || ended_at <= started_at) {
        return 0;
    }
    return static_cast<std::int64_t>(std::llround(static_cast<double>(ended_at - started_at) / 60.0));
}

common::Status ValidateTransition(const StatusTransition& transition) {
    if (transition.from_any_live) {
        if (transition.to != MeetingStatus::kEnded) {
            return errors::InvalidState("only the end transition may start from any live state");
        }
        return common::Status::OK();
    }
    if (!IsLegalTransition(transition.from, transition.to)) {
        return errors::InvalidState("illegal transition " + MeetingStatusToString(transition.from)
                                    + " -> " + MeetingStatusToString(transition.to));
    }
    return common::Status::OK();
}

bool TransitionApplies(const StatusTransition& transition, const MeetingData& data) {
    const bool from_matches = transition.from_any_live
        ? data.status != MeetingStatus::kEnded
        : data.status == transition.from;
    if (!from_matches) {
        return false;
    }
    return !(transition.only_if_empty && data.ActiveParticipantCount() > 0);
}

InMemoryMeetingStore::InMemoryMeetingStore(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout) {}

std::shared_ptr<InMemoryMeetingStore::Entry> InMemoryMeetingStore::FindEntry(const std::string& meeting_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = meetings_.find(meeting_id);
    if (it == meetings_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<InMemoryMeetingStore::Entry>> InMemoryMeetingStore::SnapshotEntries() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Entry>> entries;
    entries.reserve(meetings_.size());
    for (const auto& kv : meetings_) {
        entries.push_back(kv.second);
    }
    return entries;
}

common::Status InMemoryMeetingStore::LockEntry(const Entry& entry, EntryLock& lock) const {
    lock = EntryLock(entry.mutex, std::defer_lock);
    if (!lock.try_lock_for(lock_timeout_)) {
        return errors::Unavailable("timed out waiting for meeting lock");
    }
    return common::Status::OK();
}

// 创建新会议
common::StatusOr<MeetingData> InMemoryMeetingStore::CreateMeeting(const MeetingData& data) {
    auto entry = std::make_shared<Entry>();
    entry->data = data;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!meetings_.emplace(data.meeting_id, entry).second) {
        return common::Status::AlreadyExists("meeting already exists");
    }
    return common::StatusOr<MeetingData>(data);
}

common::StatusOr<MeetingData> InMemoryMeetingStore::GetMeeting(const std::string& meeting_id) const {
    auto entry = FindEntry(meeting_id);
    if (!entry) {
        return errors::MeetingNotFound(meeting_id);
    }
    EntryLock lock;
    auto status = LockEntry(*entry, lock);
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<MeetingData>(entry->data);
}

common::StatusOr<bool> InMemoryMeetingStore::MeetingExists(const std::string& meeting_id) const {
    return common::StatusOr<bool>(FindEntry(meeting_id) != nullptr);
}

common::Status InMemoryMeetingStore::UpdateSettings(const std::string& meeting_id,
                                                    const MeetingSettings& settings,
                                                    std::int64_t updated_at) {
    auto entry = FindEntry(meeting_id);
    if (!entry) {
        return errors::MeetingNotFound(meeting_id);
    }
    EntryLock lock;
    auto status = LockEntry(*entry, lock);
    if (!status.IsOk()) {
        return status;
    }
    auto& data = entry->data;
    if (data.status == MeetingStatus::kEnded) {
        return errors::InvalidState("cannot change settings of an ended meeting");
    }
    if (settings.max_participants < data.ActiveParticipantCount()) {
        return errors::InvalidState("capacity is below the current participant count");
    }
    data.settings = settings;
    data.updated_at = updated_at;
    return common::Status::OK();
}

common::StatusOr<bool> InMemoryMeetingStore::SetStatus(const std::string& meeting_id,
                                                       const StatusTransition& transition) {
    auto valid = ValidateTransition(transition);
    if (!valid.IsOk()) {
        return valid;
    }
    auto entry = FindEntry(meeting_id);
    if (!entry) {
        return errors::MeetingNotFound(meeting_id);
    }
    EntryLock lock;
    auto status = LockEntry(*entry, lock);
    if (!status.IsOk()) {
        return status;
    }

    auto& data = entry->data;
    if (!TransitionApplies(transition, data)) {
        return common::StatusOr<bool>(false);
    }

    const auto at = transition.at > 0 ? transition.at : common::CurrentUnixSeconds();
    if (transition.to == MeetingStatus::kActive && data.actual_start_time == 0) {
        data.actual_start_time = at;
    }
    if (transition.to == MeetingStatus::kEnded) {
        data.ended_at = at;
        data.duration_minutes = ComputeDurationMinutes(data.actual_start_time, at);
        for (auto& p : data.participants) {
            if (p.IsActive()) {
                p.left_at = at;
            }
        }
    }
    data.status = transition.to;
    data.updated_at = at;
    return common::StatusOr<bool>(true);
}

common::StatusOr<AdmissionOutcome> InMemoryMeetingStore::TryAddParticipant(const std::string& meeting_id,
                                                                           const ParticipantData& participant,
                                                                           const std::string& supplied_password) {
    auto entry = FindEntry(meeting_id);
    if (!entry) {
        return errors::MeetingNotFound(meeting_id);
    }
    EntryLock lock;
    auto status = LockEntry(*entry, lock);
    if (!status.IsOk()) {
        return status;
    }

    auto& data = entry->data;
    AdmissionOutcome outcome;
    if (data.status == MeetingStatus::kEnded) {
        outcome.result = AdmissionResult::kInvalidState;
    } else if (data.RequiresPassword() && supplied_password != data.room_password) {
        outcome.result = AdmissionResult::kWrongPassword;
    } else if (data.FindActive(participant.user_id) != nullptr) {
        outcome.result = AdmissionResult::kAlreadyActive;
    } else if (data.ActiveParticipantCount() >= data.settings.max_participants) {
        outcome.result = AdmissionResult::kRoomFull;
    } else {
        ParticipantData record = participant;
        if (record.joined_at == 0) {
            record.joined_at = common::CurrentUnixSeconds();
        }
        record.left_at = 0;
        data.participants.push_back(std::move(record));
        data.updated_at = data.participants.back().joined_at;
        outcome.result = AdmissionResult::kAdmitted;
    }
    outcome.meeting = data;
    outcome.active_count = data.ActiveParticipantCount();
    return common::StatusOr<AdmissionOutcome>(std::move(outcome));
}

common::StatusOr<LeaveOutcome> InMemoryMeetingStore::MarkLeft(const std::string& meeting_id,
                                                              const std::string& user_id,
                                                              std::int64_t left_at) {
    auto entry = FindEntry(meeting_id);
    if (!entry) {
        return errors::MeetingNotFound(meeting_id);
    }
    EntryLock lock;
    auto status = LockEntry(*entry, lock);
    if (!status.IsOk()) {
        return status;
    }

    auto& data = entry->data;
    LeaveOutcome outcome;
    if (auto* participant = data.FindActive(user_id)) {
        participant->left_at = left_at > 0 ? left_at : common::CurrentUnixSeconds();
        data.updated_at = participant->left_at;
        outcome.changed = true;
    }
    outcome.active_count = data.ActiveParticipantCount();
    outcome.status = data.status;
    return common::StatusOr<LeaveOutcome>(outcome);
}

common::StatusOr<std::vector<MeetingData>> InMemoryMeetingStore::FindByStatus(MeetingStatus status) const {
    std::vector<MeetingData> result;
    for (const auto& entry : SnapshotEntries()) {
        EntryLock lock;
        auto lock_status = LockEntry(*entry, lock);
        if (!lock_status.IsOk()) {
            return lock_status;
        }
        if (entry->data.status == status) {
            result.push_back(entry->data);
        }
    }
    std::sort(result.begin(), result.end(), [](const MeetingData& a, const MeetingData& b) {
        return a.created_at > b.created_at;
    });
    return common::StatusOr<std::vector<MeetingData>>(std::move(result));
}

common::StatusOr<std::vector<MeetingData>> InMemoryMeetingStore::ListUserMeetings(const UserMeetingQuery& query) const {
    std::vector<MeetingData> matched;
    for (const auto& entry : SnapshotEntries()) {
        EntryLock lock;
        auto lock_status = LockEntry(*entry, lock);
        if (!lock_status.IsOk()) {
            return lock_status;
        }
        const auto& data = entry->data;
        if (query.status.has_value() && data.status != *query.status) {
            continue;
        }
        bool involved = data.created_by == query.user_id || data.host_user_id == query.user_id;
        if (!involved) {
            involved = std::any_of(data.participants.begin(), data.participants.end(),
                [&](const ParticipantData& p) { return p.user_id == query.user_id; });
        }
        if (involved) {
            matched.push_back(data);
        }
    }
    std::sort(matched.begin(), matched.end(), [](const MeetingData& a, const MeetingData& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return a.meeting_id < b.meeting_id;
    });

    std::vector<MeetingData> page;
    const auto skip = static_cast<std::size_t>(std::max(query.skip, 0));
    const auto limit = static_cast<std::size_t>(std::max(query.limit, 0));
    for (std::size_t i = skip; i < matched.size() && page.size() < limit; ++i) {
        page.push_back(std::move(matched[i]));
    }
    return common::StatusOr<std::vector<MeetingData>>(std::move(page));
}

} // namespace core
} // namespace meetcoord
