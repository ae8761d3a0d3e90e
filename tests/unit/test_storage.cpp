#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/event_repository.hpp"
#include "storage/category_repository.hpp"
#include "storage/calendar_repository.hpp"
#include "storage/preferences_repository.hpp"
#include "storage/backup_repository.hpp"
#include "storage/metrics_sink.hpp"
#include "storage/store.hpp"
#include <QTemporaryDir>
#include <set>

using namespace almanac;
using namespace almanac::storage;

namespace {

int count_rows(Database& db, const std::string& table) {
    auto stmt = db.prepare("SELECT COUNT(*) FROM " + table + ";").unwrap();
    stmt.step();
    return stmt.column_int(0);
}

bool table_exists(Database& db, const std::string& table) {
    auto stmt = db.prepare("SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = ?;").unwrap();
    stmt.bind_text(1, table);
    stmt.step();
    return stmt.column_int(0) == 1;
}

// Indexes created by CREATE INDEX on any table, read through pragma_index_list.
std::set<std::string> created_indexes(Database& db) {
    auto stmt = db.prepare(R"SQL(
        SELECT il.name FROM sqlite_master AS m, pragma_index_list(m.name) AS il
        WHERE m.type = 'table' AND il.origin = 'c';
    )SQL").unwrap();
    auto names = collect_rows<std::string>(stmt, [](Statement& s) { return s.column_text(0); }).unwrap();
    return std::set<std::string>(names.begin(), names.end());
}

} // namespace

TEST_CASE("Database basic operations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    db.execute("CREATE TABLE test (id INTEGER, name TEXT);");

    SECTION("Prepare, bind and step") {
        auto insert = db.prepare("INSERT INTO test VALUES (?, ?);").unwrap();
        insert.bind_int(1, 1).bind_text(2, "Standup");
        REQUIRE(run(insert).is_ok());

        auto stmt = db.prepare("SELECT id, name FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Standup");
        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Bind failures surface at step") {
        auto stmt = db.prepare("INSERT INTO test VALUES (?, ?);").unwrap();
        stmt.bind_int(7, 1);  // no such parameter
        REQUIRE(stmt.step().is_err());
    }

    SECTION("Transaction commits on Ok") {
        auto result = db.transaction([&]() -> Result<void, Error> {
            db.execute("INSERT INTO test VALUES (1, 'a');");
            db.execute("INSERT INTO test VALUES (2, 'b');");
            return Result<void, Error>::ok();
        });
        REQUIRE(result.is_ok());
        REQUIRE(count_rows(db, "test") == 2);
        REQUIRE_FALSE(db.in_transaction());
    }

    SECTION("Transaction rolls back on Err") {
        db.execute("INSERT INTO test VALUES (1, 'kept');");
        auto result = db.transaction([&]() -> Result<void, Error> {
            db.execute("INSERT INTO test VALUES (2, 'dropped');");
            return Result<void, Error>::err(Error{"forced error"});
        });
        REQUIRE(result.is_err());
        REQUIRE(count_rows(db, "test") == 1);
    }

    SECTION("Nested transaction rolls back alone") {
        auto result = db.transaction([&]() -> Result<void, Error> {
            db.execute("INSERT INTO test VALUES (1, 'outer');");
            auto inner = db.transaction([&]() -> Result<void, Error> {
                db.execute("INSERT INTO test VALUES (2, 'inner');");
                return Result<void, Error>::err(Error{ErrorKind::ItemFailure, "bad item"});
            });
            REQUIRE(inner.is_err());
            return Result<void, Error>::ok();
        });
        REQUIRE(result.is_ok());
        REQUIRE(count_rows(db, "test") == 1);
    }

    SECTION("Commit hook veto is a TransactionFailure") {
        db.set_commit_hook([] { return false; });
        auto result = db.transaction([&]() -> Result<void, Error> {
            return db.execute("INSERT INTO test VALUES (1, 'vetoed');");
        });
        db.set_commit_hook({});

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::TransactionFailure);
        REQUIRE(count_rows(db, "test") == 0);
        REQUIRE_FALSE(db.in_transaction());
    }

    SECTION("TransactionGuard rolls back unless committed") {
        {
            TransactionGuard guard(db);
            db.execute("INSERT INTO test VALUES (1, 'guarded');");
        }
        REQUIRE(count_rows(db, "test") == 0);

        {
            TransactionGuard guard(db);
            db.execute("INSERT INTO test VALUES (1, 'guarded');");
            REQUIRE(guard.commit().is_ok());
        }
        REQUIRE(count_rows(db, "test") == 1);
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Fresh database is version 0") {
        REQUIRE(runner.current_version().unwrap() == 0);
    }

    SECTION("Migrate reaches the latest version with every table") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == runner.latest_version());
        REQUIRE(runner.latest_version() == 4);
        for (const char* table : {"events", "categories", "calendars", "preferences", "sync_queue",
                                  "cache_entries", "cache_tags", "backups", "metrics"}) {
            REQUIRE(table_exists(db, table));
        }
    }

    SECTION("Migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == runner.latest_version());
        REQUIRE(runner.history().unwrap().size() == 4);
    }

    SECTION("Upgrading step by step keeps existing rows") {
        REQUIRE(runner.migrate_to(2).is_ok());
        db.execute(R"SQL(
            INSERT INTO events (owner_id, title, start_time, sync_status, last_modified,
                                created_at, updated_at)
            VALUES ('alice', 'Dentist', 1000, 'local', 1000, 1000, 1000);
        )SQL");

        REQUIRE(runner.migrate().is_ok());

        EventRepository events(db);
        auto stored = events.by_owner("alice").unwrap();
        REQUIRE(stored.size() == 1);
        REQUIRE(stored[0].title == "Dentist");
        REQUIRE_FALSE(stored[0].all_day);
        REQUIRE_FALSE(stored[0].recurrence.has_value());
    }
}

TEST_CASE("Every schema version has its cumulative index set", "[storage]") {
    const std::set<std::string> v1{
        "idx_events_remote", "idx_events_owner_start", "idx_events_owner_category",
        "idx_events_owner_status", "idx_events_last_modified", "idx_categories_owner_name",
        "idx_calendars_owner_default", "idx_sync_queue_owner_entity", "idx_sync_queue_created"};

    auto v2 = v1;
    v2.insert({"idx_events_owner_end", "idx_events_owner_range", "idx_events_deleted",
               "idx_categories_owner_status", "idx_calendars_owner_status", "idx_sync_queue_attempts",
               "idx_sync_queue_owner_operation", "idx_cache_entries_expires",
               "idx_backups_owner_timestamp", "idx_metrics_operation", "idx_metrics_timestamp",
               "idx_cache_tags_tag"});

    auto v3 = v2;
    v3.insert({"idx_events_owner_title", "idx_calendars_owner_shared", "idx_sync_queue_retry",
               "idx_metrics_operation_time"});

    const std::vector<std::set<std::string>> expected{v1, v2, v3, v3};

    for (int version = 1; version <= 4; ++version) {
        auto db = Database::open_memory().unwrap();
        MigrationRunner runner(db);
        REQUIRE(runner.migrate_to(version).is_ok());
        REQUIRE(created_indexes(db) == expected[static_cast<size_t>(version - 1)]);
    }

    SECTION("Upgrading from any version reaches the same set") {
        for (int from = 1; from <= 3; ++from) {
            auto db = Database::open_memory().unwrap();
            MigrationRunner runner(db);
            REQUIRE(runner.migrate_to(from).is_ok());
            REQUIRE(runner.migrate().is_ok());
            REQUIRE(created_indexes(db) == v3);
        }
    }
}

TEST_CASE("A failing migration leaves the database untouched", "[storage]") {
    auto db = Database::open_memory().unwrap();
    const std::vector<Migration> broken = {
        {.version = 1, .name = "create", .up_sql = "CREATE TABLE widgets (id INTEGER PRIMARY KEY);"},
        {.version = 2, .name = "broken", .up_sql = "ALTER TABLE no_such_table ADD COLUMN x INTEGER;"},
    };
    MigrationRunner runner(db, broken);

    auto result = runner.migrate();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::SchemaUpgradeFailure);
    REQUIRE(runner.current_version().unwrap() == 0);
    REQUIRE_FALSE(table_exists(db, "widgets"));

    auto history = runner.history().unwrap();
    REQUIRE(history.size() == 1);
    REQUIRE(history[0].version == 2);
    REQUIRE_FALSE(history[0].success);
    REQUIRE(history[0].error.has_value());
}

TEST_CASE("Store refuses to open a database from a newer schema", "[storage]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("future.db")).toStdString();

    {
        auto db = Database::open(path).unwrap();
        REQUIRE(initialize_database(db).is_ok());
        db.execute("INSERT INTO migration_log (version, name, applied_at, success) "
                   "VALUES (99, 'future', 0, 1);");
    }

    StoreConfig config;
    config.db_path = path;
    auto opened = Store::open(config);
    REQUIRE(opened.is_err());
    REQUIRE(opened.unwrap_err().kind == ErrorKind::SchemaUpgradeFailure);
}

TEST_CASE("Schema carries the composite indexes", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());

    auto stmt = db.prepare("SELECT name FROM sqlite_master WHERE type = 'index' AND tbl_name = 'events';").unwrap();
    auto names = collect_rows<std::string>(stmt, [](Statement& s) { return s.column_text(0); }).unwrap();

    auto has = [&](const std::string& name) {
        return std::find(names.begin(), names.end(), name) != names.end();
    };
    REQUIRE(has("idx_events_owner_start"));
    REQUIRE(has("idx_events_owner_category"));
    REQUIRE(has("idx_events_owner_range"));
}

TEST_CASE("EventRepository", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    EventRepository repo(db);

    auto event = create_event("alice", "Planning", Timestamp(10'000), Timestamp(13'600));
    event.location = "Room 4";
    event.reminders = {Reminder{ReminderType::Email, 30}};
    event.attendees = {"bob@example.com"};
    event.recurrence = RecurrenceRule{.frequency = Frequency::Weekly, .interval = 2, .by_day = {"MO"}};

    SECTION("Insert and get keep every field") {
        auto id = repo.insert(event).unwrap();
        auto stored = repo.get(id).unwrap();
        REQUIRE(stored.has_value());

        event.id = id;
        REQUIRE(*stored == event);
    }

    SECTION("Range query is half-open over start time") {
        repo.insert(event);
        repo.insert(create_event("alice", "Later", Timestamp(20'000)));
        repo.insert(create_event("bob", "Other owner", Timestamp(10'000)));

        auto hits = repo.in_range("alice", TimeRange{Timestamp(10'000), Timestamp(20'000)}).unwrap();
        REQUIRE(hits.size() == 1);
        REQUIRE(hits[0].title == "Planning");
    }

    SECTION("Soft-deleted events are hidden unless asked for") {
        auto id = repo.insert(event).unwrap();
        auto stored = *repo.get(id).unwrap();
        stored.is_deleted = true;
        REQUIRE(repo.update(stored).is_ok());

        REQUIRE(repo.by_owner("alice").unwrap().empty());
        REQUIRE(repo.by_owner("alice", true).unwrap().size() == 1);
    }

    SECTION("Search matches title, description and location") {
        repo.insert(event);
        REQUIRE(repo.search("alice", "room").unwrap().size() == 1);
        REQUIRE(repo.search("alice", "PLAN").unwrap().size() == 1);
        REQUIRE(repo.search("alice", "absent").unwrap().empty());
    }

    SECTION("Equivalent events match on owner, title and start") {
        repo.insert(event);
        REQUIRE(repo.find_equivalent("alice", "Planning", Timestamp(10'000)).unwrap().has_value());
        REQUIRE_FALSE(repo.find_equivalent("alice", "Planning", Timestamp(10'001)).unwrap().has_value());
        REQUIRE_FALSE(repo.find_equivalent("bob", "Planning", Timestamp(10'000)).unwrap().has_value());
    }

    SECTION("Purge removes only old soft-deleted events") {
        auto old_id = repo.insert(event).unwrap();
        auto old_event = *repo.get(old_id).unwrap();
        old_event.is_deleted = true;
        old_event.updated_at = Timestamp(1'000);
        repo.update(old_event);

        auto fresh = create_event("alice", "Fresh", Timestamp(10'000));
        fresh.is_deleted = true;
        fresh.updated_at = Timestamp(50'000);
        repo.insert(fresh);

        REQUIRE(repo.purge_deleted_before(Timestamp(10'000)).unwrap() == 1);
        REQUIRE(repo.count().unwrap() == 1);
    }
}

TEST_CASE("Calendar and category repositories", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());

    SECTION("Default calendar falls back to the oldest") {
        CalendarRepository repo(db);
        auto first = repo.insert(create_calendar("alice", "Work")).unwrap();
        repo.insert(create_calendar("alice", "Home"));
        REQUIRE(repo.default_for("alice").unwrap()->id == first);

        auto home_default = repo.insert(create_calendar("alice", "Family", true)).unwrap();
        REQUIRE(repo.default_for("alice").unwrap()->id == home_default);
        REQUIRE(repo.other_defaults("alice", 0).unwrap() == std::vector<RecordId>{home_default});
        REQUIRE(repo.other_defaults("alice", home_default).unwrap().empty());
    }

    SECTION("Categories partition by owner") {
        CategoryRepository repo(db);
        repo.insert(create_category("alice", "Work"));
        repo.insert(create_category("alice", "Health", "#ef4444"));
        repo.insert(create_category("bob", "Work"));

        REQUIRE(repo.by_owner("alice").unwrap().size() == 2);
        REQUIRE(repo.remove_by_owner("alice").unwrap() == 2);
        REQUIRE(repo.count().unwrap() == 1);
    }
}

TEST_CASE("PreferencesRepository upserts per owner", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    PreferencesRepository repo(db);

    auto prefs = default_preferences("alice");
    prefs.theme = "dark";
    repo.save(prefs);
    prefs.time_format = "24";
    repo.save(prefs);

    REQUIRE(repo.count().unwrap() == 1);
    auto stored = repo.get("alice").unwrap();
    REQUIRE(stored->theme == "dark");
    REQUIRE(stored->time_format == "24");
    REQUIRE(stored->weekend_days == std::vector<int>{0, 6});
    REQUIRE_FALSE(repo.get("bob").unwrap().has_value());
}

TEST_CASE("BackupRepository keeps the newest backups", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    BackupRepository repo(db);

    for (int i = 0; i < 5; ++i) {
        repo.insert(BackupRecord{
            .owner_id = "alice",
            .timestamp = Timestamp(1'000 * (i + 1)),
            .version = 4,
            .size = 100,
            .tables = {"events"},
            .record_count = i,
            .checksum = "c" + std::to_string(i),
            .payload = {1, 2, 3}
        });
    }
    repo.insert(BackupRecord{.owner_id = "bob", .timestamp = Timestamp(1), .version = 4});

    REQUIRE(repo.prune("alice", 3).unwrap() == 2);

    auto listed = repo.by_owner("alice").unwrap();
    REQUIRE(listed.size() == 3);
    REQUIRE(listed.front().checksum == "c4");
    REQUIRE(listed.back().checksum == "c2");
    REQUIRE(listed.front().payload.empty());  // listings leave payloads out
    REQUIRE(listed.front().tables == std::vector<std::string>{"events"});

    auto full = repo.get(listed.front().id).unwrap();
    REQUIRE(full->payload == std::vector<uint8_t>{1, 2, 3});
    REQUIRE(repo.count().unwrap() == 4);

    REQUIRE(repo.remove(9999).unwrap_err().kind == ErrorKind::NotFound);
}

TEST_CASE("MetricsSink", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    MetricsSink sink(db);

    sink.record(Metric{.operation = "event.range", .duration_ms = 10, .timestamp = Timestamp(1'000)});
    sink.record(Metric{.operation = "event.range", .duration_ms = 30, .timestamp = Timestamp(2'000)});
    sink.record(Metric{.operation = "bulk.events.create", .duration_ms = 500, .record_count = 250,
                       .timestamp = Timestamp(3'000), .success = false, .error = "150 items failed"});

    REQUIRE(sink.average_duration("event.range").unwrap() == 20.0);
    REQUIRE(sink.average_duration("missing").unwrap() == 0.0);

    auto recent = sink.recent().unwrap();
    REQUIRE(recent.size() == 3);
    REQUIRE(recent.front().operation == "bulk.events.create");
    REQUIRE(recent.front().record_count == 250);
    REQUIRE(recent.front().error == "150 items failed");

    auto summary = sink.summarize().unwrap();
    REQUIRE(summary["event.range"].samples == 2);
    REQUIRE(summary["bulk.events.create"].failures == 1);

    REQUIRE(sink.clear_older_than(Timestamp(2'500)).unwrap() == 2);
    REQUIRE(sink.count().unwrap() == 1);
}
