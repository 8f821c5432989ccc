#include "core/meeting/cached_meeting_store.hpp"
#include "common/logger.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace meetcoord {
namespace core {

namespace {

constexpr std::string_view kIdPrefix = "meetcoord:meeting:";

nlohmann::json SettingsToJson(const MeetingSettings& s) {
    return nlohmann::json{
        {"max_participants", s.max_participants},
        {"is_public", s.is_public},
        {"require_approval", s.require_approval},
        {"allow_chat", s.allow_chat},
        {"allow_screen_share", s.allow_screen_share},
        {"allow_recording", s.allow_recording},
        {"mute_on_entry", s.mute_on_entry},
    };
}

MeetingSettings SettingsFromJson(const nlohmann::json& j) {
    MeetingSettings s;
    s.max_participants = j.value("max_participants", s.max_participants);
    s.is_public = j.value("is_public", s.is_public);
    s.require_approval = j.value("require_approval", s.require_approval);
    s.allow_chat = j.value("allow_chat", s.allow_chat);
    s.allow_screen_share = j.value("allow_screen_share", s.allow_screen_share);
    s.allow_recording = j.value("allow_recording", s.allow_recording);
    s.mute_on_entry = j.value("mute_on_entry", s.mute_on_entry);
    return s;
}

} // namespace

std::string EncodeMeeting(const MeetingData& data) {
    nlohmann::json participants = nlohmann::json::array();
    for (const auto& p : data.participants) {
        participants.push_back({
            {"user_id", p.user_id},
            {"display_name", p.display_name},
            {"email", p.email},
            {"joined_at", p.joined_at},
            {"left_at", p.left_at},
        });
    }
    nlohmann::json j{
        {"meeting_id", data.meeting_id},
        {"title", data.title},
        {"description", data.description},
        {"host_user_id", data.host_user_id},
        {"created_by", data.created_by},
        {"status", static_cast<int>(data.status)},
        {"settings", SettingsToJson(data.settings)},
        {"room_password", data.room_password},
        {"participants", std::move(participants)},
        {"scheduled_start_time", data.scheduled_start_time},
        {"actual_start_time", data.actual_start_time},
        {"ended_at", data.ended_at},
        {"duration_minutes", data.duration_minutes},
        {"created_at", data.created_at},
        {"updated_at", data.updated_at},
    };
    return j.dump();
}

common::StatusOr<MeetingData> DecodeMeeting(const std::string& payload) {
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return common::Status::Unavailable("invalid cache payload");
    }
    try {
        MeetingData data;
        data.meeting_id = j.value("meeting_id", "");
        data.title = j.value("title", "");
        data.description = j.value("description", "");
        data.host_user_id = j.value("host_user_id", "");
        data.created_by = j.value("created_by", "");
        const int status = j.value("status", 0);
        if (status < static_cast<int>(MeetingStatus::kScheduled) || status > static_cast<int>(MeetingStatus::kEnded)) {
            return common::Status::Unavailable("invalid meeting status in cache payload");
        }
        data.status = static_cast<MeetingStatus>(status);
        if (j.contains("settings") && j["settings"].is_object()) {
            data.settings = SettingsFromJson(j["settings"]);
        }
        data.room_password = j.value("room_password", "");
        if (j.contains("participants") && j["participants"].is_array()) {
            for (const auto& item : j["participants"]) {
                ParticipantData p;
                p.user_id = item.value("user_id", "");
                p.display_name = item.value("display_name", "");
                p.email = item.value("email", "");
                p.joined_at = item.value("joined_at", 0LL);
                p.left_at = item.value("left_at", 0LL);
                data.participants.push_back(std::move(p));
            }
        }
        data.scheduled_start_time = j.value("scheduled_start_time", 0LL);
        data.actual_start_time = j.value("actual_start_time", 0LL);
        data.ended_at = j.value("ended_at", 0LL);
        data.duration_minutes = j.value("duration_minutes", 0LL);
        data.created_at = j.value("created_at", 0LL);
        data.updated_at = j.value("updated_at", 0LL);
        if (data.meeting_id.empty()) {
            return common::Status::Unavailable("cache payload has no meeting id");
        }
        return common::StatusOr<MeetingData>(std::move(data));
    } catch (const nlohmann::json::exception& ex) {
        return common::Status::Unavailable(std::string("invalid cache payload: ") + ex.what());
    }
}

CachedMeetingStore::CachedMeetingStore(std::shared_ptr<MeetingStore> primary,
                                       std::shared_ptr<cache::RedisClient> redis,
                                       int ttl_seconds)
    : primary_(std::move(primary)), redis_(std::move(redis)), ttl_seconds_(ttl_seconds) {}

std::string CachedMeetingStore::KeyForId(const std::string& meeting_id) {
    return std::string(kIdPrefix).append(meeting_id);
}

// 新会议在首次读取时才进入缓存
common::StatusOr<MeetingData> CachedMeetingStore::CreateMeeting(const MeetingData& data) {
    return primary_->CreateMeeting(data);
}

common::StatusOr<MeetingData> CachedMeetingStore::GetMeeting(const std::string& meeting_id) const {
    if (HasCache()) {
        auto cached = CacheGet(meeting_id);
        if (cached.IsOk()) {
            return cached;
        }
        if (cached.GetStatus().Code() != common::StatusCode::kNotFound) {
            MEETCOORD_LOG_WARN("[MeetingCache] get {} failed: {}", meeting_id, cached.GetStatus().Message());
        }
    }

    auto db = primary_->GetMeeting(meeting_id);
    if (!db.IsOk() || !HasCache()) {
        return db;
    }
    auto put = CachePut(db.Value());
    if (!put.IsOk()) {
        MEETCOORD_LOG_WARN("[MeetingCache] put after get failed: {}", put.Message());
    }
    return db;
}

common::StatusOr<bool> CachedMeetingStore::MeetingExists(const std::string& meeting_id) const {
    if (HasCache()) {
        auto exists = redis_->Exists(KeyForId(meeting_id));
        if (exists.IsOk() && exists.Value()) {
            return exists;
        }
    }
    return primary_->MeetingExists(meeting_id);
}

common::Status CachedMeetingStore::UpdateSettings(const std::string& meeting_id,
                                                  const MeetingSettings& settings,
                                                  std::int64_t updated_at) {
    auto status = primary_->UpdateSettings(meeting_id, settings, updated_at);
    Invalidate(meeting_id, "update settings");
    return status;
}

common::StatusOr<bool> CachedMeetingStore::SetStatus(const std::string& meeting_id,
                                                     const StatusTransition& transition) {
    auto result = primary_->SetStatus(meeting_id, transition);
    if (result.IsOk() && result.Value()) {
        Invalidate(meeting_id, "set status");
    }
    return result;
}

common::StatusOr<AdmissionOutcome> CachedMeetingStore::TryAddParticipant(const std::string& meeting_id,
                                                                         const ParticipantData& participant,
                                                                         const std::string& supplied_password) {
    auto outcome = primary_->TryAddParticipant(meeting_id, participant, supplied_password);
    if (outcome.IsOk() && outcome.Value().result == AdmissionResult::kAdmitted) {
        Invalidate(meeting_id, "add participant");
    }
    return outcome;
}

common::StatusOr<LeaveOutcome> CachedMeetingStore::MarkLeft(const std::string& meeting_id,
                                                            const std::string& user_id,
                                                            std::int64_t left_at) {
    auto outcome = primary_->MarkLeft(meeting_id, user_id, left_at);
    if (outcome.IsOk() && outcome.Value().changed) {
        Invalidate(meeting_id, "mark left");
    }
    return outcome;
}

// 列表查询不缓存
common::StatusOr<std::vector<MeetingData>> CachedMeetingStore::FindByStatus(MeetingStatus status) const {
    return primary_->FindByStatus(status);
}

common::StatusOr<std::vector<MeetingData>> CachedMeetingStore::ListUserMeetings(const UserMeetingQuery& query) const {
    return primary_->ListUserMeetings(query);
}

common::Status CachedMeetingStore::CachePut(const MeetingData& data) const {
    return redis_->SetEx(KeyForId(data.meeting_id), EncodeMeeting(data), ttl_seconds_);
}

common::StatusOr<MeetingData> CachedMeetingStore::CacheGet(const std::string& meeting_id) const {
    auto payload = redis_->Get(KeyForId(meeting_id));
    if (!payload.IsOk()) {
        return payload.GetStatus();
    }
    return DecodeMeeting(payload.Value());
}

void CachedMeetingStore::Invalidate(const std::string& meeting_id, const char* operation) const {
    if (!HasCache()) {
        return;
    }
    auto status = redis_->Del(KeyForId(meeting_id));
    if (!status.IsOk()) {
        MEETCOORD_LOG_WARN("[MeetingCache] invalidate on {} failed: {}", operation, status.Message());
    }
}

} // namespace core
} // namespace meetcoord
