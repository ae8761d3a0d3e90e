#include "sync/outbox.hpp"
#include "core/logging.hpp"

namespace almanac::sync {

using storage::Statement;

namespace {

constexpr const char* ENTRY_SELECT = R"SQL(
    SELECT id, owner_id, operation, entity, entity_id, payload_json, attempts,
           last_attempt, last_error, created_at
    FROM sync_queue
)SQL";

} // namespace

std::optional<OutboxOperation> parse_outbox_operation(std::string_view s) {
    if (s == "create") return OutboxOperation::Create;
    if (s == "update") return OutboxOperation::Update;
    if (s == "delete") return OutboxOperation::Delete;
    return std::nullopt;
}

OutboxEntry Outbox::row_to_entry(Statement& stmt) {
    return OutboxEntry{
        .id = stmt.column_int64(0),
        .owner_id = stmt.column_text(1),
        .operation = parse_outbox_operation(stmt.column_text(2)).value_or(OutboxOperation::Update),
        .entity = parse_entity_kind(stmt.column_text(3)).value_or(EntityKind::Event),
        .entity_id = stmt.column_int64(4),
        .payload_json = stmt.column_text(5),
        .attempts = stmt.column_int(6),
        .last_attempt = stmt.column_optional_timestamp(7),
        .last_error = stmt.column_optional_text(8),
        .created_at = stmt.column_timestamp(9)
    };
}

Result<int64_t, Error> Outbox::enqueue(const std::string& owner_id,
                                       OutboxOperation operation,
                                       EntityKind entity,
                                       RecordId entity_id,
                                       const std::string& payload_json) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO sync_queue (owner_id, operation, entity, entity_id, payload_json,
                                attempts, created_at)
        VALUES (?, ?, ?, ?, ?, 0, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id)
        .bind_text(2, to_string(operation))
        .bind_text(3, to_string(entity))
        .bind_int64(4, entity_id)
        .bind_text(5, payload_json)
        .bind_timestamp(6, clock_.now());

    auto step_result = storage::run(stmt);
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(db_.last_insert_rowid());
}

Result<std::vector<OutboxEntry>, Error> Outbox::list(const std::string& owner_id) {
    auto stmt_result = db_.prepare(std::string(ENTRY_SELECT) +
                                   " WHERE owner_id = ? ORDER BY created_at, id;");
    if (stmt_result.is_err()) {
        return Result<std::vector<OutboxEntry>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    return storage::collect_rows<OutboxEntry>(stmt, row_to_entry);
}

Result<std::vector<OutboxEntry>, Error> Outbox::drain(int limit) {
    auto stmt_result = db_.prepare(std::string(ENTRY_SELECT) +
                                   " WHERE attempts < ? ORDER BY created_at, id LIMIT ?;");
    if (stmt_result.is_err()) {
        return Result<std::vector<OutboxEntry>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, max_attempts_).bind_int(2, limit > 0 ? limit : -1);
    return storage::collect_rows<OutboxEntry>(stmt, row_to_entry);
}

Result<std::vector<OutboxEntry>, Error> Outbox::pending(const std::string& owner_id, int limit) {
    auto stmt_result = db_.prepare(std::string(ENTRY_SELECT) +
        " WHERE owner_id = ? AND attempts < ? ORDER BY created_at, id LIMIT ?;");
    if (stmt_result.is_err()) {
        return Result<std::vector<OutboxEntry>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id).bind_int(2, max_attempts_).bind_int(3, limit);
    return storage::collect_rows<OutboxEntry>(stmt, row_to_entry);
}

Result<std::optional<OutboxEntry>, Error> Outbox::get(int64_t id) {
    auto stmt_result = db_.prepare(std::string(ENTRY_SELECT) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<OutboxEntry>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    return storage::first_row<OutboxEntry>(stmt, row_to_entry);
}

Result<bool, Error> Outbox::has_entries_for(EntityKind entity, RecordId entity_id) {
    auto stmt_result = db_.prepare(
        "SELECT EXISTS(SELECT 1 FROM sync_queue WHERE entity = ? AND entity_id = ?);");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, to_string(entity)).bind_int64(2, entity_id);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<bool, Error>::err(step_result.unwrap_err());
    }
    return Result<bool, Error>::ok(stmt.column_bool(0));
}

Result<void, Error> Outbox::mark_attempted(int64_t id, const std::string& error) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE sync_queue SET attempts = attempts + 1, last_attempt = ?, last_error = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, clock_.now()).bind_text(2, error).bind_int64(3, id);
    auto step_result = storage::run(stmt);
    if (step_result.is_err()) {
        return step_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "outbox entry " + std::to_string(id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Outbox::remove(int64_t id) {
    auto stmt_result = db_.prepare("DELETE FROM sync_queue WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    return storage::run(stmt);
}

Result<int, Error> Outbox::clear(const std::string& owner_id) {
    auto stmt_result = db_.prepare("DELETE FROM sync_queue WHERE owner_id = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    auto step_result = storage::run(stmt);
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<OutboxStats, Error> Outbox::stats(const std::string& owner_id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT operation, COUNT(*), SUM(CASE WHEN attempts < ? THEN 1 ELSE 0 END)
        FROM sync_queue WHERE owner_id = ? GROUP BY operation;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<OutboxStats, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, max_attempts_).bind_text(2, owner_id);

    OutboxStats stats;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<OutboxStats, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        const int total = stmt.column_int(1);
        const int pending = stmt.column_int(2);
        stats.total += total;
        stats.pending += pending;
        stats.failed += total - pending;
        if (auto op = parse_outbox_operation(stmt.column_text(0))) {
            stats.by_operation[*op] += total;
        }
    }
    return Result<OutboxStats, Error>::ok(std::move(stats));
}

Result<std::vector<OutboxEntry>, Error> Outbox::reap(const ReapPolicy& policy) {
    const auto cutoff = clock_.now() - policy.max_age;

    return db_.transaction([&]() -> Result<std::vector<OutboxEntry>, Error> {
        auto stmt_result = db_.prepare(std::string(ENTRY_SELECT) +
            " WHERE created_at < ? AND attempts >= ? ORDER BY created_at, id;");
        if (stmt_result.is_err()) {
            return Result<std::vector<OutboxEntry>, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        stmt.bind_timestamp(1, cutoff).bind_int(2, policy.max_attempts);
        auto rows = storage::collect_rows<OutboxEntry>(stmt, row_to_entry);
        if (rows.is_err()) {
            return rows;
        }

        auto del_result = db_.prepare(
            "DELETE FROM sync_queue WHERE created_at < ? AND attempts >= ?;");
        if (del_result.is_err()) {
            return Result<std::vector<OutboxEntry>, Error>::err(del_result.unwrap_err());
        }
        auto del = std::move(del_result).unwrap();
        del.bind_timestamp(1, cutoff).bind_int(2, policy.max_attempts);
        auto step_result = storage::run(del);
        if (step_result.is_err()) {
            return Result<std::vector<OutboxEntry>, Error>::err(step_result.unwrap_err());
        }

        for (const auto& entry : rows.unwrap()) {
            qCWarning(almanacSyncLog).nospace()
                << "Outbox: reaped entry " << entry.id << " (" << to_qstring(to_string(entry.operation))
                << " " << to_qstring(to_string(entry.entity)) << " " << entry.entity_id
                << ", owner " << to_qstring(entry.owner_id) << ") after "
                << entry.attempts << " attempts; last error: "
                << to_qstring(entry.last_error.value_or("none"));
        }
        return rows;
    });
}

} // namespace almanac::sync
