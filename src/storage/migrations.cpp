#include "storage/migrations.hpp"
#include "core/logging.hpp"

namespace almanac::storage {
namespace {

// Rows written before v3 never had last_modified maintained.
Result<void, Error> backfill_last_modified(Database& db) {
    return db.execute(
        "UPDATE events SET last_modified = updated_at WHERE last_modified = 0;");
}

} // namespace

// Each version lists only the indexes it adds. The full index set at
// version N is the union of versions 1..N, and an upgrade from any earlier
// version ends with exactly that set.
const std::vector<Migration>& all_migrations() {
    static const std::vector<Migration> migrations = {
        {
            .version = 1,
            .name = "initial_schema",
            .up_sql = R"SQL(
                CREATE TABLE IF NOT EXISTS events (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    remote_id TEXT,
                    owner_id TEXT NOT NULL,
                    title TEXT NOT NULL,
                    description TEXT,
                    location TEXT,
                    start_time INTEGER NOT NULL,
                    end_time INTEGER,
                    color TEXT,
                    category_id TEXT,
                    reminders_json TEXT NOT NULL DEFAULT '[]',
                    attendees_json TEXT NOT NULL DEFAULT '[]',
                    metadata_json TEXT NOT NULL DEFAULT '{}',
                    sync_status TEXT NOT NULL DEFAULT 'local',
                    last_modified INTEGER NOT NULL DEFAULT 0,
                    created_at INTEGER NOT NULL,
                    updated_at INTEGER NOT NULL,
                    is_deleted INTEGER NOT NULL DEFAULT 0
                );
                CREATE INDEX IF NOT EXISTS idx_events_remote ON events(remote_id);
                CREATE INDEX IF NOT EXISTS idx_events_owner_start ON events(owner_id, start_time);
                CREATE INDEX IF NOT EXISTS idx_events_owner_category ON events(owner_id, category_id);
                CREATE INDEX IF NOT EXISTS idx_events_owner_status ON events(owner_id, sync_status);
                CREATE INDEX IF NOT EXISTS idx_events_last_modified ON events(last_modified);

                CREATE TABLE IF NOT EXISTS categories (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    remote_id TEXT,
                    owner_id TEXT NOT NULL,
                    name TEXT NOT NULL,
                    color TEXT NOT NULL,
                    icon TEXT,
                    sync_status TEXT NOT NULL DEFAULT 'local',
                    created_at INTEGER NOT NULL,
                    updated_at INTEGER NOT NULL
                );
                CREATE INDEX IF NOT EXISTS idx_categories_owner_name ON categories(owner_id, name);

                CREATE TABLE IF NOT EXISTS calendars (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    remote_id TEXT,
                    owner_id TEXT NOT NULL,
                    name TEXT NOT NULL,
                    description TEXT,
                    color TEXT NOT NULL,
                    is_default INTEGER NOT NULL DEFAULT 0,
                    is_shared INTEGER NOT NULL DEFAULT 0,
                    sync_status TEXT NOT NULL DEFAULT 'local',
                    created_at INTEGER NOT NULL,
                    updated_at INTEGER NOT NULL
                );
                CREATE INDEX IF NOT EXISTS idx_calendars_owner_default ON calendars(owner_id, is_default);

                CREATE TABLE IF NOT EXISTS preferences (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    owner_id TEXT NOT NULL UNIQUE,
                    theme TEXT NOT NULL,
                    first_day_of_week INTEGER NOT NULL,
                    time_format TEXT NOT NULL,
                    timezone TEXT NOT NULL,
                    default_event_duration INTEGER NOT NULL,
                    weekend_days_json TEXT NOT NULL DEFAULT '[0,6]',
                    working_hours_start TEXT NOT NULL,
                    working_hours_end TEXT NOT NULL,
                    last_sync_time INTEGER,
                    offline_mode INTEGER NOT NULL DEFAULT 0,
                    auto_sync INTEGER NOT NULL DEFAULT 1,
                    sync_interval_minutes INTEGER NOT NULL DEFAULT 5
                );

                CREATE TABLE IF NOT EXISTS sync_queue (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    owner_id TEXT NOT NULL,
                    operation TEXT NOT NULL,
                    entity TEXT NOT NULL,
                    entity_id INTEGER NOT NULL,
                    payload_json TEXT NOT NULL DEFAULT '{}',
                    attempts INTEGER NOT NULL DEFAULT 0,
                    last_attempt INTEGER,
                    last_error TEXT,
                    created_at INTEGER NOT NULL
                );
                CREATE INDEX IF NOT EXISTS idx_sync_queue_owner_entity ON sync_queue(owner_id, entity);
                CREATE INDEX IF NOT EXISTS idx_sync_queue_created ON sync_queue(created_at);

                CREATE TABLE IF NOT EXISTS cache_entries (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    owner_id TEXT NOT NULL,
                    cache_key TEXT NOT NULL,
                    payload TEXT NOT NULL,
                    expires_at INTEGER NOT NULL,
                    created_at INTEGER NOT NULL,
                    UNIQUE(owner_id, cache_key)
                );

                CREATE TABLE IF NOT EXISTS backups (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    owner_id TEXT NOT NULL,
                    timestamp INTEGER NOT NULL,
                    version INTEGER NOT NULL,
                    size INTEGER NOT NULL,
                    tables_json TEXT NOT NULL DEFAULT '[]',
                    record_count INTEGER NOT NULL,
                    compressed INTEGER NOT NULL DEFAULT 0
                );

                CREATE TABLE IF NOT EXISTS metrics (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    operation TEXT NOT NULL,
                    duration_ms REAL NOT NULL,
                    record_count INTEGER,
                    timestamp INTEGER NOT NULL,
                    success INTEGER NOT NULL,
                    error TEXT
                );
            )SQL"
        },
        {
            .version = 2,
            .name = "compound_indexes",
            .up_sql = R"SQL(
                CREATE INDEX IF NOT EXISTS idx_events_owner_end ON events(owner_id, end_time);
                CREATE INDEX IF NOT EXISTS idx_events_owner_range ON events(owner_id, start_time, end_time);
                CREATE INDEX IF NOT EXISTS idx_events_deleted ON events(is_deleted);
                CREATE INDEX IF NOT EXISTS idx_categories_owner_status ON categories(owner_id, sync_status);
                CREATE INDEX IF NOT EXISTS idx_calendars_owner_status ON calendars(owner_id, sync_status);
                CREATE INDEX IF NOT EXISTS idx_sync_queue_attempts ON sync_queue(attempts);
                CREATE INDEX IF NOT EXISTS idx_sync_queue_owner_operation ON sync_queue(owner_id, operation);
                CREATE INDEX IF NOT EXISTS idx_cache_entries_expires ON cache_entries(expires_at);
                CREATE INDEX IF NOT EXISTS idx_backups_owner_timestamp ON backups(owner_id, timestamp);
                CREATE INDEX IF NOT EXISTS idx_metrics_operation ON metrics(operation);
                CREATE INDEX IF NOT EXISTS idx_metrics_timestamp ON metrics(timestamp);

                CREATE TABLE IF NOT EXISTS cache_tags (
                    entry_id INTEGER NOT NULL REFERENCES cache_entries(id) ON DELETE CASCADE,
                    tag TEXT NOT NULL,
                    PRIMARY KEY (entry_id, tag)
                );
                CREATE INDEX IF NOT EXISTS idx_cache_tags_tag ON cache_tags(tag);
            )SQL"
        },
        {
            .version = 3,
            .name = "recurrence_and_all_day",
            .up_sql = R"SQL(
                ALTER TABLE events ADD COLUMN all_day INTEGER NOT NULL DEFAULT 0;
                ALTER TABLE events ADD COLUMN recurrence_json TEXT;
                CREATE INDEX IF NOT EXISTS idx_events_owner_title ON events(owner_id, title);
                CREATE INDEX IF NOT EXISTS idx_calendars_owner_shared ON calendars(owner_id, is_shared);
                CREATE INDEX IF NOT EXISTS idx_sync_queue_retry ON sync_queue(attempts, last_attempt);
                CREATE INDEX IF NOT EXISTS idx_metrics_operation_time ON metrics(operation, timestamp);
            )SQL",
            .data_step = backfill_last_modified
        },
        {
            .version = 4,
            .name = "backup_payloads",
            .up_sql = R"SQL(
                ALTER TABLE backups ADD COLUMN checksum TEXT NOT NULL DEFAULT '';
                ALTER TABLE backups ADD COLUMN encrypted INTEGER NOT NULL DEFAULT 0;
                ALTER TABLE backups ADD COLUMN payload BLOB;
            )SQL"
        }
    };
    return migrations;
}

Result<void, Error> MigrationRunner::ensure_log_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS migration_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensure_result = ensure_log_table();
    if (ensure_result.is_err()) {
        return Result<int, Error>::err(ensure_result.unwrap_err());
    }

    auto stmt_result = db_.prepare(
        "SELECT COALESCE(MAX(version), 0) FROM migration_log WHERE success = 1;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }

    return Result<int, Error>::ok(stmt.column_int(0));
}

Result<void, Error> MigrationRunner::log_attempt(const Migration& m, bool success,
                                                 const std::optional<std::string>& error) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO migration_log (version, name, applied_at, success, error)
        VALUES (?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, m.version)
        .bind_text(2, m.name)
        .bind_timestamp(3, Timestamp::now())
        .bind_bool(4, success)
        .bind_optional_text(5, error);
    return run(stmt);
}

Result<void, Error> MigrationRunner::run_migration(const Migration& m) {
    auto exec_result = db_.execute(m.up_sql);
    if (exec_result.is_err()) {
        return Result<void, Error>::err(Error{
            "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " +
            exec_result.unwrap_err().message,
            exec_result.unwrap_err().code
        });
    }

    if (m.data_step) {
        auto data_result = m.data_step(db_);
        if (data_result.is_err()) {
            return Result<void, Error>::err(Error{
                "Migration " + std::to_string(m.version) + " (" + m.name + ") data step failed: " +
                data_result.unwrap_err().message,
                data_result.unwrap_err().code
            });
        }
    }

    return log_attempt(m, true, std::nullopt);
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(
            current_result.unwrap_err().with_kind(ErrorKind::SchemaUpgradeFailure));
    }

    const int current = current_result.unwrap();

    if (current > latest_version()) {
        return Result<void, Error>::err(Error{
            ErrorKind::SchemaUpgradeFailure,
            "Database schema version " + std::to_string(current) +
            " is newer than the supported version " + std::to_string(latest_version())});
    }

    if (current >= target_version) {
        return Result<void, Error>::ok();
    }

    const Migration* failed = nullptr;
    auto result = db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : migrations_) {
            if (m.version > current && m.version <= target_version) {
                auto step = run_migration(m);
                if (step.is_err()) {
                    failed = &m;
                    return step;
                }
                qCInfo(almanacStoreLog) << "Migrations: applied version" << m.version
                                        << QString::fromStdString(m.name);
            }
        }
        return Result<void, Error>::ok();
    });

    if (result.is_ok()) {
        return result;
    }

    const auto& error = result.unwrap_err();
    qCWarning(almanacStoreLog) << "Migrations: upgrade from version" << current << "failed:"
                               << QString::fromStdString(error.message);

    // The transaction has rolled back; record the failed attempt on its own.
    if (failed) {
        auto logged = log_attempt(*failed, false, error.message);
        if (logged.is_err()) {
            qCWarning(almanacStoreLog) << "Migrations: could not record failure:"
                                       << QString::fromStdString(logged.unwrap_err().message);
        }
    }

    return Result<void, Error>::err(error.with_kind(ErrorKind::SchemaUpgradeFailure));
}

Result<std::vector<MigrationLogEntry>, Error> MigrationRunner::history() {
    auto ensure_result = ensure_log_table();
    if (ensure_result.is_err()) {
        return Result<std::vector<MigrationLogEntry>, Error>::err(ensure_result.unwrap_err());
    }

    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, version, name, applied_at, success, error
        FROM migration_log ORDER BY id;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<MigrationLogEntry>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    return collect_rows<MigrationLogEntry>(stmt, [](Statement& s) {
        return MigrationLogEntry{
            .id = s.column_int64(0),
            .version = s.column_int(1),
            .name = s.column_text(2),
            .applied_at = s.column_timestamp(3),
            .success = s.column_bool(4),
            .error = s.column_optional_text(5)
        };
    });
}

} // namespace almanac::storage
