#include "storage/backup_repository.hpp"
#include "core/record_json.hpp"

namespace almanac::storage {
namespace {

constexpr const char* BACKUP_COLUMNS = R"SQL(
    SELECT id, owner_id, timestamp, version, size, tables_json, record_count, compressed,
           checksum, encrypted
)SQL";

} // namespace

BackupRecord BackupRepository::row_to_record(Statement& stmt) {
    return BackupRecord{
        .id = stmt.column_int64(0),
        .owner_id = stmt.column_text(1),
        .timestamp = stmt.column_timestamp(2),
        .version = stmt.column_int(3),
        .size = stmt.column_int64(4),
        .tables = strings_from_string(stmt.column_text(5)),
        .record_count = stmt.column_int64(6),
        .compressed = stmt.column_bool(7),
        .checksum = stmt.column_text(8),
        .encrypted = stmt.column_bool(9)
    };
}

Result<RecordId, Error> BackupRepository::insert(const BackupRecord& r) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO backups (owner_id, timestamp, version, size, tables_json, record_count,
                             compressed, checksum, encrypted, payload)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<RecordId, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, r.owner_id)
        .bind_timestamp(2, r.timestamp)
        .bind_int(3, r.version)
        .bind_int64(4, r.size)
        .bind_text(5, strings_to_string(r.tables))
        .bind_int64(6, r.record_count)
        .bind_bool(7, r.compressed)
        .bind_text(8, r.checksum)
        .bind_bool(9, r.encrypted)
        .bind_blob(10, r.payload.data(), r.payload.size());

    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<RecordId, Error>::err(step_result.unwrap_err());
    }
    return Result<RecordId, Error>::ok(db_.last_insert_rowid());
}

Result<void, Error> BackupRepository::remove(RecordId id) {
    auto stmt_result = db_.prepare("DELETE FROM backups WHERE id = ?;");
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
            Error{ErrorKind::NotFound, "backup " + std::to_string(id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<std::optional<BackupRecord>, Error> BackupRepository::get(RecordId id) {
    auto stmt_result = db_.prepare(std::string(BACKUP_COLUMNS) + ", payload FROM backups WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<BackupRecord>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    return first_row<BackupRecord>(stmt, [](Statement& s) {
        auto record = row_to_record(s);
        record.payload = s.column_blob(10);
        return record;
    });
}

Result<std::vector<BackupRecord>, Error> BackupRepository::by_owner(const std::string& owner_id) {
    auto stmt_result = db_.prepare(std::string(BACKUP_COLUMNS) +
        " FROM backups WHERE owner_id = ? ORDER BY timestamp DESC, id DESC;");
    if (stmt_result.is_err()) {
        return Result<std::vector<BackupRecord>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    return collect_rows<BackupRecord>(stmt, row_to_record);
}

Result<int, Error> BackupRepository::prune(const std::string& owner_id, int keep) {
    auto stmt_result = db_.prepare(R"SQL(
        DELETE FROM backups
        WHERE owner_id = ?1 AND id NOT IN (
            SELECT id FROM backups WHERE owner_id = ?1
            ORDER BY timestamp DESC, id DESC LIMIT ?2
        );
    )SQL");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id).bind_int(2, keep);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<int64_t, Error> BackupRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM backups;");
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
