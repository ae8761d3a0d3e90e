#include "storage/preferences_repository.hpp"
#include "core/record_json.hpp"

namespace almanac::storage {

Preferences PreferencesRepository::row_to_preferences(Statement& stmt) {
    return Preferences{
        .id = stmt.column_int64(0),
        .owner_id = stmt.column_text(1),
        .theme = stmt.column_text(2),
        .first_day_of_week = stmt.column_int(3),
        .time_format = stmt.column_text(4),
        .timezone = stmt.column_text(5),
        .default_event_duration = stmt.column_int(6),
        .weekend_days = ints_from_string(stmt.column_text(7)),
        .working_hours = WorkingHours{stmt.column_text(8), stmt.column_text(9)},
        .last_sync_time = stmt.column_optional_timestamp(10),
        .offline_mode = stmt.column_bool(11),
        .auto_sync = stmt.column_bool(12),
        .sync_interval_minutes = stmt.column_int(13)
    };
}

Result<std::optional<Preferences>, Error> PreferencesRepository::get(const std::string& owner_id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, owner_id, theme, first_day_of_week, time_format, timezone,
               default_event_duration, weekend_days_json, working_hours_start,
               working_hours_end, last_sync_time, offline_mode, auto_sync,
               sync_interval_minutes
        FROM preferences WHERE owner_id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::optional<Preferences>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    return first_row<Preferences>(stmt, row_to_preferences);
}

Result<RecordId, Error> PreferencesRepository::save(const Preferences& p) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO preferences (owner_id, theme, first_day_of_week, time_format, timezone,
                                 default_event_duration, weekend_days_json,
                                 working_hours_start, working_hours_end, last_sync_time,
                                 offline_mode, auto_sync, sync_interval_minutes)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(owner_id) DO UPDATE SET
            theme = excluded.theme,
            first_day_of_week = excluded.first_day_of_week,
            time_format = excluded.time_format,
            timezone = excluded.timezone,
            default_event_duration = excluded.default_event_duration,
            weekend_days_json = excluded.weekend_days_json,
            working_hours_start = excluded.working_hours_start,
            working_hours_end = excluded.working_hours_end,
            last_sync_time = excluded.last_sync_time,
            offline_mode = excluded.offline_mode,
            auto_sync = excluded.auto_sync,
            sync_interval_minutes = excluded.sync_interval_minutes;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<RecordId, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, p.owner_id)
        .bind_text(2, p.theme)
        .bind_int(3, p.first_day_of_week)
        .bind_text(4, p.time_format)
        .bind_text(5, p.timezone)
        .bind_int(6, p.default_event_duration)
        .bind_text(7, ints_to_string(p.weekend_days))
        .bind_text(8, p.working_hours.start)
        .bind_text(9, p.working_hours.end)
        .bind_optional_timestamp(10, p.last_sync_time)
        .bind_bool(11, p.offline_mode)
        .bind_bool(12, p.auto_sync)
        .bind_int(13, p.sync_interval_minutes);

    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<RecordId, Error>::err(step_result.unwrap_err());
    }

    // last_insert_rowid is stale after the UPDATE branch of an upsert.
    auto stored = get(p.owner_id);
    if (stored.is_err()) {
        return Result<RecordId, Error>::err(stored.unwrap_err());
    }
    const auto& row = stored.unwrap();
    return Result<RecordId, Error>::ok(row ? row->id : 0);
}

Result<int, Error> PreferencesRepository::remove(const std::string& owner_id) {
    auto stmt_result = db_.prepare("DELETE FROM preferences WHERE owner_id = ?;");
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

Result<int64_t, Error> PreferencesRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM preferences;");
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
