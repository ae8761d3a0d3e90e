#include "storage/calendar_repository.hpp"

namespace almanac::storage {
namespace {

constexpr const char* CALENDAR_SELECT = R"SQL(
    SELECT id, remote_id, owner_id, name, description, color, is_default, is_shared,
           sync_status, created_at, updated_at
    FROM calendars
)SQL";

void bind_calendar_fields(Statement& stmt, const Calendar& c) {
    stmt.bind_optional_text(1, c.remote_id)
        .bind_text(2, c.owner_id)
        .bind_text(3, c.name)
        .bind_optional_text(4, c.description)
        .bind_text(5, c.color)
        .bind_bool(6, c.is_default)
        .bind_bool(7, c.is_shared)
        .bind_text(8, to_string(c.sync_status))
        .bind_timestamp(9, c.created_at)
        .bind_timestamp(10, c.updated_at);
}

} // namespace

Calendar CalendarRepository::row_to_calendar(Statement& stmt) {
    return Calendar{
        .id = stmt.column_int64(0),
        .remote_id = stmt.column_optional_text(1),
        .owner_id = stmt.column_text(2),
        .name = stmt.column_text(3),
        .description = stmt.column_optional_text(4),
        .color = stmt.column_text(5),
        .is_default = stmt.column_bool(6),
        .is_shared = stmt.column_bool(7),
        .sync_status = parse_sync_status(stmt.column_text(8)).value_or(SyncStatus::Local),
        .created_at = stmt.column_timestamp(9),
        .updated_at = stmt.column_timestamp(10)
    };
}

Result<RecordId, Error> CalendarRepository::insert(const Calendar& c) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO calendars (remote_id, owner_id, name, description, color, is_default,
                               is_shared, sync_status, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<RecordId, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    bind_calendar_fields(stmt, c);

    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<RecordId, Error>::err(step_result.unwrap_err());
    }
    return Result<RecordId, Error>::ok(db_.last_insert_rowid());
}

Result<void, Error> CalendarRepository::update(const Calendar& c) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE calendars SET remote_id = ?, owner_id = ?, name = ?, description = ?, color = ?,
                             is_default = ?, is_shared = ?, sync_status = ?, created_at = ?,
                             updated_at = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    bind_calendar_fields(stmt, c);
    stmt.bind_int64(11, c.id);

    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return step_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "calendar " + std::to_string(c.id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> CalendarRepository::remove(RecordId id) {
    auto stmt_result = db_.prepare("DELETE FROM calendars WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return step_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "calendar " + std::to_string(id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<std::optional<Calendar>, Error> CalendarRepository::get(RecordId id) {
    auto stmt_result = db_.prepare(std::string(CALENDAR_SELECT) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Calendar>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    return first_row<Calendar>(stmt, row_to_calendar);
}

Result<std::vector<Calendar>, Error> CalendarRepository::by_owner(const std::string& owner_id) {
    auto stmt_result = db_.prepare(std::string(CALENDAR_SELECT) +
                                   " WHERE owner_id = ? ORDER BY id;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Calendar>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    return collect_rows<Calendar>(stmt, row_to_calendar);
}

Result<std::optional<Calendar>, Error> CalendarRepository::find_by_name(const std::string& owner_id,
                                                                        const std::string& name) {
    auto stmt_result = db_.prepare(std::string(CALENDAR_SELECT) +
                                   " WHERE owner_id = ? AND name = ? ORDER BY id LIMIT 1;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Calendar>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id).bind_text(2, name);
    return first_row<Calendar>(stmt, row_to_calendar);
}

Result<std::optional<Calendar>, Error> CalendarRepository::default_for(const std::string& owner_id) {
    auto stmt_result = db_.prepare(std::string(CALENDAR_SELECT) +
                                   " WHERE owner_id = ? ORDER BY is_default DESC, id LIMIT 1;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Calendar>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    return first_row<Calendar>(stmt, row_to_calendar);
}

Result<std::vector<RecordId>, Error> CalendarRepository::other_defaults(const std::string& owner_id,
                                                                        RecordId keep) {
    auto stmt_result = db_.prepare(
        "SELECT id FROM calendars WHERE owner_id = ? AND is_default = 1 AND id != ?;");
    if (stmt_result.is_err()) {
        return Result<std::vector<RecordId>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id).bind_int64(2, keep);
    return collect_rows<RecordId>(stmt, [](Statement& s) { return s.column_int64(0); });
}

Result<void, Error> CalendarRepository::set_sync_state(RecordId id, SyncStatus status,
                                                       const std::optional<std::string>& remote_id) {
    auto stmt_result = db_.prepare(
        "UPDATE calendars SET sync_status = ?, remote_id = COALESCE(?, remote_id) WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, to_string(status)).bind_optional_text(2, remote_id).bind_int64(3, id);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return step_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "calendar " + std::to_string(id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<int, Error> CalendarRepository::reset_sync_state(const std::string& owner_id) {
    auto stmt_result = db_.prepare(
        "UPDATE calendars SET sync_status = 'local', remote_id = NULL WHERE owner_id = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<int, Error> CalendarRepository::remove_by_owner(const std::string& owner_id) {
    auto stmt_result = db_.prepare("DELETE FROM calendars WHERE owner_id = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<int64_t, Error> CalendarRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM calendars;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

} // namespace almanac::storage
