#include "storage/event_repository.hpp"
#include "core/record_json.hpp"

namespace almanac::storage {
namespace {

constexpr const char* EVENT_COLUMNS = R"SQL(
    id, remote_id, owner_id, title, description, location, start_time, end_time,
    all_day, color, category_id, recurrence_json, reminders_json, attendees_json,
    metadata_json, sync_status, last_modified, created_at, updated_at, is_deleted
)SQL";

std::optional<std::string> recurrence_column(const Event& e) {
    if (!e.recurrence) return std::nullopt;
    return to_compact_json(to_json(*e.recurrence));
}

// Binds every column except id, starting at `first`. Returns the next index.
int bind_event_fields(Statement& stmt, const Event& e, int first) {
    int i = first;
    stmt.bind_optional_text(i++, e.remote_id)
        .bind_text(i++, e.owner_id)
        .bind_text(i++, e.title)
        .bind_optional_text(i++, e.description)
        .bind_optional_text(i++, e.location)
        .bind_timestamp(i++, e.start_time)
        .bind_optional_timestamp(i++, e.end_time)
        .bind_bool(i++, e.all_day)
        .bind_optional_text(i++, e.color)
        .bind_optional_text(i++, e.category_id)
        .bind_optional_text(i++, recurrence_column(e))
        .bind_text(i++, reminders_to_string(e.reminders))
        .bind_text(i++, strings_to_string(e.attendees))
        .bind_text(i++, e.metadata_json)
        .bind_text(i++, to_string(e.sync_status))
        .bind_timestamp(i++, e.last_modified)
        .bind_timestamp(i++, e.created_at)
        .bind_timestamp(i++, e.updated_at)
        .bind_bool(i++, e.is_deleted);
    return i;
}

std::string escape_like(const std::string& term) {
    std::string out;
    out.reserve(term.size());
    for (char c : term) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

} // namespace

Event EventRepository::row_to_event(Statement& stmt) {
    Event e;
    e.id = stmt.column_int64(0);
    e.remote_id = stmt.column_optional_text(1);
    e.owner_id = stmt.column_text(2);
    e.title = stmt.column_text(3);
    e.description = stmt.column_optional_text(4);
    e.location = stmt.column_optional_text(5);
    e.start_time = stmt.column_timestamp(6);
    e.end_time = stmt.column_optional_timestamp(7);
    e.all_day = stmt.column_bool(8);
    e.color = stmt.column_optional_text(9);
    e.category_id = stmt.column_optional_text(10);
    if (!stmt.column_is_null(11)) {
        e.recurrence = recurrence_from_string(stmt.column_text(11));
    }
    e.reminders = reminders_from_string(stmt.column_text(12));
    e.attendees = strings_from_string(stmt.column_text(13));
    e.metadata_json = stmt.column_text(14);
    e.sync_status = parse_sync_status(stmt.column_text(15)).value_or(SyncStatus::Local);
    e.last_modified = stmt.column_timestamp(16);
    e.created_at = stmt.column_timestamp(17);
    e.updated_at = stmt.column_timestamp(18);
    e.is_deleted = stmt.column_bool(19);
    return e;
}

Result<std::vector<Event>, Error> EventRepository::select_many(
    const std::string& where_clause,
    const std::function<void(Statement&)>& bind
) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + EVENT_COLUMNS +
                                   " FROM events WHERE " + where_clause + ";");
    if (stmt_result.is_err()) {
        return Result<std::vector<Event>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    bind(stmt);
    return collect_rows<Event>(stmt, row_to_event);
}

Result<RecordId, Error> EventRepository::insert(const Event& event) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO events (remote_id, owner_id, title, description, location, start_time,
                            end_time, all_day, color, category_id, recurrence_json,
                            reminders_json, attendees_json, metadata_json, sync_status,
                            last_modified, created_at, updated_at, is_deleted)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<RecordId, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    bind_event_fields(stmt, event, 1);

    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<RecordId, Error>::err(step_result.unwrap_err());
    }
    return Result<RecordId, Error>::ok(db_.last_insert_rowid());
}

Result<void, Error> EventRepository::update(const Event& event) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE events SET
            remote_id = ?, owner_id = ?, title = ?, description = ?, location = ?,
            start_time = ?, end_time = ?, all_day = ?, color = ?, category_id = ?,
            recurrence_json = ?, reminders_json = ?, attendees_json = ?, metadata_json = ?,
            sync_status = ?, last_modified = ?, created_at = ?, updated_at = ?, is_deleted = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    int next = bind_event_fields(stmt, event, 1);
    stmt.bind_int64(next, event.id);

    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return step_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "event " + std::to_string(event.id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> EventRepository::remove(RecordId id) {
    auto stmt_result = db_.prepare("DELETE FROM events WHERE id = ?;");
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
            Error{ErrorKind::NotFound, "event " + std::to_string(id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<std::optional<Event>, Error> EventRepository::get(RecordId id) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + EVENT_COLUMNS +
                                   " FROM events WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Event>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    return first_row<Event>(stmt, row_to_event);
}

Result<std::optional<Event>, Error> EventRepository::find_by_remote_id(const std::string& remote_id) {
    auto stmt_result = db_.prepare(std::string("SELECT ") + EVENT_COLUMNS +
                                   " FROM events WHERE remote_id = ? LIMIT 1;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Event>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, remote_id);
    return first_row<Event>(stmt, row_to_event);
}

Result<std::vector<Event>, Error> EventRepository::by_owner(const std::string& owner_id,
                                                            bool include_deleted) {
    const std::string where = include_deleted
        ? "owner_id = ? ORDER BY start_time, id"
        : "owner_id = ? AND is_deleted = 0 ORDER BY start_time, id";
    return select_many(where, [&](Statement& s) { s.bind_text(1, owner_id); });
}

Result<std::vector<Event>, Error> EventRepository::in_range(const std::string& owner_id,
                                                            TimeRange range) {
    return select_many(
        "owner_id = ? AND start_time >= ? AND start_time < ? AND is_deleted = 0 "
        "ORDER BY start_time, id",
        [&](Statement& s) {
            s.bind_text(1, owner_id).bind_timestamp(2, range.start).bind_timestamp(3, range.end);
        });
}

Result<std::vector<Event>, Error> EventRepository::by_category(const std::string& owner_id,
                                                               const std::string& category_id) {
    return select_many(
        "owner_id = ? AND category_id = ? AND is_deleted = 0 ORDER BY start_time, id",
        [&](Statement& s) { s.bind_text(1, owner_id).bind_text(2, category_id); });
}

Result<std::vector<Event>, Error> EventRepository::pending_sync(const std::string& owner_id) {
    return select_many(
        "owner_id = ? AND sync_status IN ('local', 'pending') ORDER BY updated_at, id",
        [&](Statement& s) { s.bind_text(1, owner_id); });
}

Result<std::vector<Event>, Error> EventRepository::search(const std::string& owner_id,
                                                          const std::string& term,
                                                          int limit) {
    const auto pattern = "%" + escape_like(term) + "%";
    return select_many(
        "owner_id = ? AND is_deleted = 0 AND ("
        "title LIKE ?2 ESCAPE '\\' OR description LIKE ?2 ESCAPE '\\' "
        "OR location LIKE ?2 ESCAPE '\\') ORDER BY start_time, id LIMIT ?3",
        [&](Statement& s) {
            s.bind_text(1, owner_id).bind_text(2, pattern).bind_int(3, limit);
        });
}

Result<std::vector<Event>, Error> EventRepository::recurring(const std::string& owner_id) {
    return select_many(
        "owner_id = ? AND recurrence_json IS NOT NULL AND is_deleted = 0 ORDER BY start_time, id",
        [&](Statement& s) { s.bind_text(1, owner_id); });
}

Result<std::optional<Event>, Error> EventRepository::find_equivalent(const std::string& owner_id,
                                                                     const std::string& title,
                                                                     Timestamp start_time) {
    auto rows = select_many(
        "owner_id = ? AND title = ? AND start_time = ? AND is_deleted = 0 ORDER BY id LIMIT 1",
        [&](Statement& s) {
            s.bind_text(1, owner_id).bind_text(2, title).bind_timestamp(3, start_time);
        });
    if (rows.is_err()) {
        return Result<std::optional<Event>, Error>::err(rows.unwrap_err());
    }
    auto& events = rows.unwrap();
    if (events.empty()) {
        return Result<std::optional<Event>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Event>, Error>::ok(std::move(events.front()));
}

Result<void, Error> EventRepository::set_sync_state(RecordId id, SyncStatus status,
                                                    const std::optional<std::string>& remote_id) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE events SET sync_status = ?, remote_id = COALESCE(?, remote_id) WHERE id = ?;
    )SQL");
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
            Error{ErrorKind::NotFound, "event " + std::to_string(id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<int, Error> EventRepository::reset_sync_state(const std::string& owner_id) {
    auto stmt_result = db_.prepare(
        "UPDATE events SET sync_status = 'local', remote_id = NULL WHERE owner_id = ?;");
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

Result<int, Error> EventRepository::remove_by_owner(const std::string& owner_id) {
    auto stmt_result = db_.prepare("DELETE FROM events WHERE owner_id = ?;");
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

Result<int, Error> EventRepository::purge_deleted_before(Timestamp cutoff) {
    auto stmt_result = db_.prepare(
        "DELETE FROM events WHERE is_deleted = 1 AND updated_at < ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, cutoff);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<int64_t, Error> EventRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM events;");
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

Result<std::map<SyncStatus, int>, Error> EventRepository::count_by_status(const std::string& owner_id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT sync_status, COUNT(*) FROM events
        WHERE owner_id = ? AND is_deleted = 0 GROUP BY sync_status;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::map<SyncStatus, int>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);

    std::map<SyncStatus, int> counts;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::map<SyncStatus, int>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        if (auto status = parse_sync_status(stmt.column_text(0))) {
            counts[*status] = stmt.column_int(1);
        }
    }
    return Result<std::map<SyncStatus, int>, Error>::ok(std::move(counts));
}

} // namespace almanac::storage
