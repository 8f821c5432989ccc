#include "storage/mysql/meeting_store.hpp"
#include "common/clock.hpp"
#include "core/meeting/errors.hpp"
#include "storage/mysql/sql_utils.hpp"
#include "storage/mysql/transaction.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <unordered_map>

namespace meetcoord {
namespace storage {

namespace {

constexpr const char* kMeetingColumns =
    "m.id, m.meeting_id, m.title, m.description, m.host_user_id, m.created_by, m.status, "
    "m.max_participants, m.is_public, m.require_approval, m.allow_chat, m.allow_screen_share, "
    "m.allow_recording, m.mute_on_entry, m.room_password, m.scheduled_start_time, "
    "UNIX_TIMESTAMP(m.actual_start_time), UNIX_TIMESTAMP(m.ended_at), m.duration_minutes, "
    "UNIX_TIMESTAMP(m.created_at), UNIX_TIMESTAMP(m.updated_at)";

core::MeetingStatus ParseStatus(const char* field) {
    auto value = ParseInt64(field);
    if (value < static_cast<int>(core::MeetingStatus::kScheduled)
        || value > static_cast<int>(core::MeetingStatus::kEnded)) {
        return core::MeetingStatus::kScheduled;
    }
    return static_cast<core::MeetingStatus>(value);
}

int ToInt(bool flag) {
    return flag ? 1 : 0;
}

} // namespace

MySqlMeetingStore::MySqlMeetingStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

common::Status MySqlMeetingStore::LoadParticipants(MYSQL* conn, std::vector<MeetingRow>& rows) {
    if (rows.empty()) {
        return common::Status::OK();
    }
    std::unordered_map<std::uint64_t, std::size_t> index;
    std::string ids;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        index[rows[i].id] = i;
        if (!ids.empty()) {
            ids += ",";
        }
        ids += std::to_string(rows[i].id);
    }

    auto sql = fmt::format(
        "SELECT meeting_ref, user_id, display_name, email, UNIX_TIMESTAMP(joined_at), UNIX_TIMESTAMP(left_at) "
        "FROM meeting_participants WHERE meeting_ref IN ({}) ORDER BY id",
        ids);
    auto result = Query(conn, sql);
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    if (!result.Value()) {
        return common::Status::OK();
    }
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(result.Value().get())) != nullptr) {
        auto it = index.find(ParseUInt64(row[0]));
        if (it == index.end()) {
            continue;
        }
        core::ParticipantData participant;
        participant.user_id = ParseString(row[1]);
        participant.display_name = ParseString(row[2]);
        participant.email = ParseString(row[3]);
        participant.joined_at = ParseInt64(row[4]);
        participant.left_at = ParseInt64(row[5]);
        rows[it->second].data.participants.push_back(std::move(participant));
    }
    return common::Status::OK();
}

common::StatusOr<std::vector<MySqlMeetingStore::MeetingRow>> MySqlMeetingStore::QueryRows(MYSQL* conn,
                                                                                          const std::string& tail) {
    auto result = Query(conn, fmt::format("SELECT {} FROM meetings m {}", kMeetingColumns, tail));
    if (!result.IsOk()) {
        return result.GetStatus();
    }

    std::vector<MeetingRow> rows;
    if (result.Value()) {
        MYSQL_ROW row;
        while ((row = mysql_fetch_row(result.Value().get())) != nullptr) {
            MeetingRow parsed;
            parsed.id = ParseUInt64(row[0]);
            auto& data = parsed.data;
            data.meeting_id = ParseString(row[1]);
            data.title = ParseString(row[2]);
            data.description = ParseString(row[3]);
            data.host_user_id = ParseString(row[4]);
            data.created_by = ParseString(row[5]);
            data.status = ParseStatus(row[6]);
            data.settings.max_participants = static_cast<int>(ParseInt64(row[7]));
            data.settings.is_public = ParseBool(row[8]);
            data.settings.require_approval = ParseBool(row[9]);
            data.settings.allow_chat = ParseBool(row[10]);
            data.settings.allow_screen_share = ParseBool(row[11]);
            data.settings.allow_recording = ParseBool(row[12]);
            data.settings.mute_on_entry = ParseBool(row[13]);
            data.room_password = ParseString(row[14]);
            data.scheduled_start_time = ParseInt64(row[15]);
            data.actual_start_time = ParseInt64(row[16]);
            data.ended_at = ParseInt64(row[17]);
            data.duration_minutes = ParseInt64(row[18]);
            data.created_at = ParseInt64(row[19]);
            data.updated_at = ParseInt64(row[20]);
            rows.push_back(std::move(parsed));
        }
    }
    // 释放结果集后才能在同一连接上继续查询
    result.Value().reset();

    auto status = LoadParticipants(conn, rows);
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<std::vector<MeetingRow>>(std::move(rows));
}

common::StatusOr<std::vector<core::MeetingData>> MySqlMeetingStore::LoadMeetings(MYSQL* conn,
                                                                                  const std::string& tail) {
    auto rows = QueryRows(conn, tail);
    if (!rows.IsOk()) {
        return rows.GetStatus();
    }
    std::vector<core::MeetingData> meetings;
    meetings.reserve(rows.Value().size());
    for (auto& row : rows.Value()) {
        meetings.push_back(std::move(row.data));
    }
    return common::StatusOr<std::vector<core::MeetingData>>(std::move(meetings));
}

common::StatusOr<MySqlMeetingStore::MeetingRow> MySqlMeetingStore::LoadMeeting(MYSQL* conn,
                                                                                const std::string& meeting_id,
                                                                                bool lock_row) {
    auto rows = QueryRows(conn, fmt::format("WHERE m.meeting_id = {} LIMIT 1{}",
                                            Quote(conn, meeting_id), lock_row ? " FOR UPDATE" : ""));
    if (!rows.IsOk()) {
        return rows.GetStatus();
    }
    if (rows.Value().empty()) {
        return core::errors::MeetingNotFound(meeting_id);
    }
    return common::StatusOr<MeetingRow>(std::move(rows.Value().front()));
}

common::StatusOr<core::MeetingData> MySqlMeetingStore::CreateMeeting(const core::MeetingData& data) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();

    const auto created_at = std::max<std::int64_t>(data.created_at, 1);
    const auto updated_at = std::max<std::int64_t>(data.updated_at, created_at);
    auto sql = fmt::format(
        "INSERT INTO meetings (meeting_id, title, description, host_user_id, created_by, status, "
        "max_participants, is_public, require_approval, allow_chat, allow_screen_share, allow_recording, "
        "mute_on_entry, room_password, scheduled_start_time, actual_start_time, ended_at, duration_minutes, "
        "chat_sequence, created_at, updated_at) "
        "VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, 0, {}, {})",
        Quote(conn, data.meeting_id),
        Quote(conn, data.title),
        Quote(conn, data.description),
        Quote(conn, data.host_user_id),
        Quote(conn, data.created_by),
        static_cast<int>(data.status),
        data.settings.max_participants,
        ToInt(data.settings.is_public),
        ToInt(data.settings.require_approval),
        ToInt(data.settings.allow_chat),
        ToInt(data.settings.allow_screen_share),
        ToInt(data.settings.allow_recording),
        ToInt(data.settings.mute_on_entry),
        Quote(conn, data.room_password),
        data.scheduled_start_time,
        UnixTimeOrNull(data.actual_start_time),
        UnixTimeOrNull(data.ended_at),
        data.duration_minutes,
        UnixTime(created_at),
        UnixTime(updated_at));
    auto status = Execute(conn, sql);
    if (!status.IsOk()) {
        if (status.Code() == common::StatusCode::kAlreadyExists) {
            return common::Status::AlreadyExists("meeting already exists");
        }
        return status;
    }
    return common::StatusOr<core::MeetingData>(data);
}

common::StatusOr<core::MeetingData> MySqlMeetingStore::GetMeeting(const std::string& meeting_id) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());

    auto row = LoadMeeting(lease.Raw(), meeting_id, false);
    if (!row.IsOk()) {
        return row.GetStatus();
    }
    return common::StatusOr<core::MeetingData>(std::move(row.Value().data));
}

common::StatusOr<bool> MySqlMeetingStore::MeetingExists(const std::string& meeting_id) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();

    auto result = Query(conn, fmt::format("SELECT 1 FROM meetings WHERE meeting_id = {} LIMIT 1",
                                          Quote(conn, meeting_id)));
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    const bool exists = result.Value() && mysql_fetch_row(result.Value().get()) != nullptr;
    return common::StatusOr<bool>(exists);
}

common::Status MySqlMeetingStore::UpdateSettings(const std::string& meeting_id,
                                                 const core::MeetingSettings& settings,
                                                 std::int64_t updated_at) {
    Transaction transaction(pool_);
    auto status = transaction.Begin();
    if (!status.IsOk()) {
        return status;
    }
    MYSQL* conn = transaction.Raw();

    auto row = LoadMeeting(conn, meeting_id, true);
    if (!row.IsOk()) {
        return row.GetStatus();
    }
    const auto& data = row.Value().data;
    if (data.status == core::MeetingStatus::kEnded) {
        return core::errors::InvalidState("cannot change settings of an ended meeting");
    }
    if (settings.max_participants < data.ActiveParticipantCount()) {
        return core::errors::InvalidState("capacity is below the current participant count");
    }

    auto sql = fmt::format(
        "UPDATE meetings SET max_participants = {}, is_public = {}, require_approval = {}, allow_chat = {}, "
        "allow_screen_share = {}, allow_recording = {}, mute_on_entry = {}, updated_at = {} WHERE id = {}",
        settings.max_participants,
        ToInt(settings.is_public),
        ToInt(settings.require_approval),
        ToInt(settings.allow_chat),
        ToInt(settings.allow_screen_share),
        ToInt(settings.allow_recording),
        ToInt(settings.mute_on_entry),
        UnixTime(updated_at),
        row.Value().id);
    status = Execute(conn, sql);
    if (!status.IsOk()) {
        return status;
    }
    return transaction.Commit();
}

common::StatusOr<bool> MySqlMeetingStore::SetStatus(const std::string& meeting_id,
                                                    const core::StatusTransition& transition) {
    auto valid = core::ValidateTransition(transition);
    if (!valid.IsOk()) {
        return valid;
    }

    Transaction transaction(pool_);
    auto status = transaction.Begin();
    if (!status.IsOk()) {
        return status;
    }
    MYSQL* conn = transaction.Raw();

    auto row = LoadMeeting(conn, meeting_id, true);
    if (!row.IsOk()) {
        return row.GetStatus();
    }
    const auto& data = row.Value().data;
    const auto id = row.Value().id;
    if (!core::TransitionApplies(transition, data)) {
        status = transaction.Commit();
        if (!status.IsOk()) {
            return status;
        }
        return common::StatusOr<bool>(false);
    }

    const auto at = transition.at > 0 ? transition.at : common::CurrentUnixSeconds();
    std::string sql;
    if (transition.to == core::MeetingStatus::kActive) {
        sql = fmt::format(
            "UPDATE meetings SET status = {}, actual_start_time = COALESCE(actual_start_time, {}), "
            "updated_at = {} WHERE id = {}",
            static_cast<int>(transition.to), UnixTime(at), UnixTime(at), id);
    } else {
        sql = fmt::format(
            "UPDATE meetings SET status = {}, ended_at = {}, duration_minutes = {}, updated_at = {} WHERE id = {}",
            static_cast<int>(transition.to),
            UnixTime(at),
            core::ComputeDurationMinutes(data.actual_start_time, at),
            UnixTime(at),
            id);
    }
    status = Execute(conn, sql);
    if (!status.IsOk()) {
        return status;
    }
    if (transition.to == core::MeetingStatus::kEnded) {
        // 结束时所有在会者一并离开
        status = Execute(conn, fmt::format(
            "UPDATE meeting_participants SET left_at = {} WHERE meeting_ref = {} AND left_at IS NULL",
            UnixTime(at), id));
        if (!status.IsOk()) {
            return status;
        }
    }
    status = transaction.Commit();
    if (!status.IsOk()) {
        return status;
    }
    return common::StatusOr<bool>(true);
}

common::StatusOr<core::AdmissionOutcome> MySqlMeetingStore::TryAddParticipant(const std::string& meeting_id,
                                                                              const core::ParticipantData& participant,
                                                                              const std::string& supplied_password) {
    Transaction transaction(pool_);
    auto status = transaction.Begin();
    if (!status.IsOk()) {
        return status;
    }
    MYSQL* conn = transaction.Raw();

    // 行锁保证同一会议的准入判定串行执行
    auto row = LoadMeeting(conn, meeting_id, true);
    if (!row.IsOk()) {
        return row.GetStatus();
    }
    auto& data = row.Value().data;

    core::AdmissionOutcome outcome;
    if (data.status == core::MeetingStatus::kEnded) {
        outcome.result = core::AdmissionResult::kInvalidState;
    } else if (data.RequiresPassword() && supplied_password != data.room_password) {
        outcome.result = core::AdmissionResult::kWrongPassword;
    } else if (data.FindActive(participant.user_id) != nullptr) {
        outcome.result = core::AdmissionResult::kAlreadyActive;
    } else if (data.ActiveParticipantCount() >= data.settings.max_participants) {
        outcome.result = core::AdmissionResult::kRoomFull;
    } else {
        core::ParticipantData record = participant;
        if (record.joined_at == 0) {
            record.joined_at = common::CurrentUnixSeconds();
        }
        record.left_at = 0;
        status = Execute(conn, fmt::format(
            "INSERT INTO meeting_participants (meeting_ref, user_id, display_name, email, joined_at, left_at) "
            "VALUES ({}, {}, {}, {}, {}, NULL)",
            row.Value().id,
            Quote(conn, record.user_id),
            Quote(conn, record.display_name),
            Quote(conn, record.email),
            UnixTime(record.joined_at)));
        if (!status.IsOk()) {
            return status;
        }
        status = Execute(conn, fmt::format("UPDATE meetings SET updated_at = {} WHERE id = {}",
                                           UnixTime(record.joined_at), row.Value().id));
        if (!status.IsOk()) {
            return status;
        }
        data.updated_at = record.joined_at;
        data.participants.push_back(std::move(record));
        outcome.result = core::AdmissionResult::kAdmitted;
    }

    status = transaction.Commit();
    if (!status.IsOk()) {
        return status;
    }
    outcome.active_count = data.ActiveParticipantCount();
    outcome.meeting = std::move(data);
    return common::StatusOr<core::AdmissionOutcome>(std::move(outcome));
}

common::StatusOr<core::LeaveOutcome> MySqlMeetingStore::MarkLeft(const std::string& meeting_id,
                                                                 const std::string& user_id,
                                                                 std::int64_t left_at) {
    Transaction transaction(pool_);
    auto status = transaction.Begin();
    if (!status.IsOk()) {
        return status;
    }
    MYSQL* conn = transaction.Raw();

    auto row = LoadMeeting(conn, meeting_id, true);
    if (!row.IsOk()) {
        return row.GetStatus();
    }
    auto& data = row.Value().data;
    const auto at = left_at > 0 ? left_at : common::CurrentUnixSeconds();

    core::LeaveOutcome outcome;
    status = Execute(conn, fmt::format(
        "UPDATE meeting_participants SET left_at = {} WHERE meeting_ref = {} AND user_id = {} AND left_at IS NULL",
        UnixTime(at), row.Value().id, Quote(conn, user_id)));
    if (!status.IsOk()) {
        return status;
    }
    if (mysql_affected_rows(conn) > 0) {
        status = Execute(conn, fmt::format("UPDATE meetings SET updated_at = {} WHERE id = {}",
                                           UnixTime(at), row.Value().id));
        if (!status.IsOk()) {
            return status;
        }
        for (auto& participant : data.participants) {
            if (participant.user_id == user_id && participant.IsActive()) {
                participant.left_at = at;
            }
        }
        outcome.changed = true;
    }

    status = transaction.Commit();
    if (!status.IsOk()) {
        return status;
    }
    outcome.active_count = data.ActiveParticipantCount();
    outcome.status = data.status;
    return common::StatusOr<core::LeaveOutcome>(outcome);
}

common::StatusOr<std::vector<core::MeetingData>> MySqlMeetingStore::FindByStatus(core::MeetingStatus status) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    return LoadMeetings(lease.Raw(), fmt::format("WHERE m.status = {} ORDER BY m.created_at DESC, m.meeting_id ASC",
                                                 static_cast<int>(status)));
}

common::StatusOr<std::vector<core::MeetingData>> MySqlMeetingStore::ListUserMeetings(const core::UserMeetingQuery& query) const {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();

    const auto user = Quote(conn, query.user_id);
    std::string clause = fmt::format(
        "WHERE (m.created_by = {0} OR m.host_user_id = {0} OR EXISTS "
        "(SELECT 1 FROM meeting_participants p WHERE p.meeting_ref = m.id AND p.user_id = {0}))",
        user);
    if (query.status.has_value()) {
        clause += fmt::format(" AND m.status = {}", static_cast<int>(*query.status));
    }
    clause += fmt::format(" ORDER BY m.created_at DESC, m.meeting_id ASC LIMIT {}, {}",
                          std::max(query.skip, 0), std::max(query.limit, 0));
    return LoadMeetings(conn, clause);
}

} // namespace storage
} // namespace meetcoord
