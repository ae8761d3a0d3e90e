#include <catch2/catch_test_macros.hpp>
#include "backup/backup_manager.hpp"
#include "support/full_records.hpp"
#include "core/record_json.hpp"
#include <QCryptographicHash>
#include <QFile>
#include <QJsonDocument>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <algorithm>

using namespace almanac;
using namespace almanac::backup;
using almanac::test::StoreFixture;

namespace {

void seed_owner(StoreFixture& f, const std::string& owner) {
    f.add_event(owner, "Dentist");
    f.add_event(owner, "Flight", std::chrono::hours(48));
    REQUIRE(f->create_category(create_category(owner, "Health", "#ef4444")).is_ok());
    REQUIRE(f->create_calendar(create_calendar(owner, "Personal", true)).is_ok());
    REQUIRE(f->update_preferences(owner, PreferencesPatch{.theme = "dark"}).is_ok());
}

} // namespace

TEST_CASE("Backup file names", "[backup]") {
    REQUIRE(backup_file_name("alice", Timestamp(1'709'285'400'000)) ==
            "almanac-backup-alice-20240301T093000Z.json");
    REQUIRE(backup_file_name("team/ops lead", Timestamp(0)) ==
            "almanac-backup-team_ops_lead-19700101T000000Z.json");
}

TEST_CASE("Backup envelope JSON", "[backup]") {
    BackupData data;
    data.events.push_back(create_event("alice", "Dentist", Timestamp(1'000)));
    data.preferences = default_preferences("alice");

    BackupEnvelope envelope;
    envelope.version = 4;
    envelope.timestamp = Timestamp(1'709'285'400'123);
    envelope.owner_id = "alice";
    envelope.stats = data.stats();
    envelope.payload = serialize_body(data);
    envelope.checksum = "abc";

    REQUIRE(envelope.stats.total_records == 2);
    REQUIRE(envelope.stats.event_count == 1);

    SECTION("Plain bodies are written inline") {
        const auto bytes = envelope_to_json(envelope);
        const auto obj = QJsonDocument::fromJson(bytes).object();
        REQUIRE(obj.value(QStringLiteral("format")).toString() == QStringLiteral("almanac-backup"));
        REQUIRE(obj.value(QStringLiteral("timestamp")).toString() == QStringLiteral("2024-03-01T09:30:00.123Z"));
        REQUIRE(obj.value(QStringLiteral("data")).isObject());
        REQUIRE_FALSE(obj.contains(QStringLiteral("payload")));

        auto read = envelope_from_json(bytes).unwrap();
        REQUIRE(read.payload == envelope.payload);
        REQUIRE(read.timestamp == envelope.timestamp);
        REQUIRE(read.stats == envelope.stats);
        REQUIRE(read.version == 4);
    }

    SECTION("Compressed bodies travel as base64") {
        envelope.payload = qCompress(envelope.payload);
        envelope.compressed = true;

        const auto obj = QJsonDocument::fromJson(envelope_to_json(envelope)).object();
        REQUIRE(obj.value(QStringLiteral("payload")).isString());
        REQUIRE_FALSE(obj.contains(QStringLiteral("data")));

        auto read = envelope_from_json(envelope_to_json(envelope)).unwrap();
        REQUIRE(read.compressed);
        REQUIRE(read.payload == envelope.payload);
    }

    SECTION("Malformed files") {
        auto not_json = envelope_from_json("not json");
        REQUIRE(not_json.unwrap_err().kind == ErrorKind::Format);
        REQUIRE(not_json.unwrap_err().message.rfind("Invalid backup file: ", 0) == 0);

        REQUIRE(envelope_from_json(R"({"format":"other"})").unwrap_err().kind == ErrorKind::Format);

        auto obj = QJsonDocument::fromJson(envelope_to_json(envelope)).object();
        obj.remove(QStringLiteral("data"));
        obj.insert(QStringLiteral("payload"), QStringLiteral("%%%not base64%%%"));
        auto bad_payload = envelope_from_json(QJsonDocument(obj).toJson());
        REQUIRE(bad_payload.unwrap_err().message == "Invalid backup file: payload is not base64");
    }

    SECTION("Body round trip") {
        auto parsed = parse_body(serialize_body(data)).unwrap();
        REQUIRE(parsed.events == data.events);
        REQUIRE(parsed.preferences == data.preferences);
        REQUIRE(parse_body(R"({"stats":{}})").is_err());
    }
}

TEST_CASE("Creating backups", "[backup]") {
    StoreFixture f;
    seed_owner(f, "alice");
    BackupManager manager(*f);

    SECTION("Stats, checksum and catalogue row") {
        auto envelope = manager.create_backup("alice").unwrap();
        REQUIRE(envelope.owner_id == "alice");
        REQUIRE(envelope.version == 4);
        REQUIRE(envelope.timestamp == f.clock->now());
        REQUIRE(envelope.stats.event_count == 2);
        REQUIRE(envelope.stats.category_count == 1);
        REQUIRE(envelope.stats.calendar_count == 1);
        REQUIRE(envelope.stats.total_records == 5);
        REQUIRE_FALSE(envelope.compressed);  // under the threshold
        REQUIRE(envelope.checksum.size() == 64);

        auto listed = manager.list_backups("alice").unwrap();
        REQUIRE(listed.size() == 1);
        REQUIRE(listed[0].checksum == envelope.checksum);
        REQUIRE(listed[0].record_count == 5);
        REQUIRE(listed[0].tables == std::vector<std::string>{"events", "categories", "calendars", "preferences"});

        auto metric = f->metrics().recent("backup.create").unwrap();
        REQUIRE(metric.size() == 1);
        REQUIRE(metric[0].success);
    }

    SECTION("Compression above the threshold") {
        StoreConfig config;
        config.compression_threshold = 64;
        StoreFixture small(config);
        seed_owner(small, "alice");

        BackupManager m(*small);
        auto envelope = m.create_backup("alice").unwrap();
        REQUIRE(envelope.compressed);
        REQUIRE_FALSE(qUncompress(envelope.payload).isEmpty());

        auto uncompressed = m.create_backup("alice", BackupOptions{.compress = false}).unwrap();
        REQUIRE_FALSE(uncompressed.compressed);
    }

    SECTION("The checksum is the SHA-256 of the stored payload") {
        auto plain = manager.create_backup("alice").unwrap();
        const auto expected = QCryptographicHash::hash(plain.payload, QCryptographicHash::Sha256).toHex();
        REQUIRE(plain.checksum == expected.toStdString());
    }

    SECTION("Deleted events only on request") {
        auto events = f->events_for_owner("alice").unwrap();
        REQUIRE(f->delete_event(events[0].id).is_ok());

        REQUIRE(manager.create_backup("alice").unwrap().stats.event_count == 1);
        REQUIRE(manager.create_backup("alice", BackupOptions{.include_deleted = true}).unwrap()
                    .stats.event_count == 2);
    }

    SECTION("Validation") {
        REQUIRE(manager.create_backup("").unwrap_err().kind == ErrorKind::Validation);
        REQUIRE(manager.create_backup("alice", BackupOptions{.encrypt = true}).unwrap_err().kind ==
                ErrorKind::Validation);
        REQUIRE(manager.list_backups("alice").unwrap().empty());

        auto metric = f->metrics().recent("backup.create").unwrap();
        REQUIRE(metric.size() == 2);
        REQUIRE_FALSE(metric[0].success);
    }

    SECTION("Only the newest ten are kept") {
        for (int i = 0; i < 12; ++i) {
            f.clock->advance(std::chrono::minutes(1));
            REQUIRE(manager.create_backup("alice").is_ok());
        }
        auto listed = manager.list_backups("alice").unwrap();
        REQUIRE(listed.size() == 10);
        REQUIRE(listed.front().timestamp == f.clock->now());
        REQUIRE(listed.back().timestamp == f.clock->now() - std::chrono::minutes(9));
    }
}

TEST_CASE("Restoring backups", "[backup]") {
    StoreFixture f;
    seed_owner(f, "alice");
    BackupManager manager(*f);
    auto envelope = manager.create_backup("alice").unwrap();

    SECTION("Overwrite replaces the owner's records") {
        f.add_event("alice", "Added after the backup");
        REQUIRE(f->events_for_owner("alice").unwrap().size() == 3);

        auto result = manager.restore_backup(envelope, RestoreOptions{.overwrite = true});
        REQUIRE(result.success);
        REQUIRE(result.checksum_verified);
        REQUIRE(result.warnings.empty());
        REQUIRE(result.restored.events == 2);
        REQUIRE(result.restored.categories == 1);
        REQUIRE(result.restored.calendars == 1);
        REQUIRE(result.restored.preferences);

        auto events = f->events_for_owner("alice").unwrap();
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].title == "Dentist");
        REQUIRE(f->get_preferences("alice").unwrap().theme == "dark");
        REQUIRE(f->default_calendar("alice").unwrap()->name == "Personal");
        REQUIRE(f.outbox().list("alice").unwrap().empty());
    }

    SECTION("Append duplicates and keeps a single default calendar") {
        auto result = manager.restore_backup(envelope);
        REQUIRE(result.success);
        REQUIRE(result.restored.events == 2);
        REQUIRE(f->events_for_owner("alice").unwrap().size() == 4);

        auto calendars = f->calendars("alice").unwrap();
        REQUIRE(calendars.size() == 2);
        REQUIRE(std::count_if(calendars.begin(), calendars.end(),
                              [](const Calendar& c) { return c.is_default; }) == 1);
        REQUIRE(f->stats().unwrap().preferences == 1);
    }

    SECTION("Merge skips equivalent events") {
        auto result = manager.restore_backup(envelope, RestoreOptions{.merge = true});
        REQUIRE(result.success);
        REQUIRE(result.restored.events == 0);
        REQUIRE(result.restored.skipped == 2);
        REQUIRE(f->events_for_owner("alice").unwrap().size() == 2);
    }

    SECTION("Restore into another owner") {
        auto result = manager.restore_backup(envelope, RestoreOptions{.target_owner = std::string("bob")});
        REQUIRE(result.success);
        auto events = f->events_for_owner("bob").unwrap();
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].owner_id == "bob");
    }

    SECTION("Restored records are not queued for sync") {
        const auto queued = f.outbox().list("alice").unwrap().size();
        REQUIRE(manager.restore_backup(envelope).success);
        REQUIRE(f.outbox().list("alice").unwrap().size() == queued);
    }

    SECTION("Restore invalidates the owner's cached queries") {
        const auto now = f.clock->now();
        const TimeRange range{now - std::chrono::hours(1), now + std::chrono::hours(72)};
        REQUIRE(f->query_events("alice", range).unwrap().size() == 2);
        REQUIRE(manager.restore_backup(envelope).success);
        REQUIRE(f->query_events("alice", range).unwrap().size() == 4);
    }

    SECTION("By id") {
        auto listed = manager.list_backups("alice").unwrap();
        auto result = manager.restore_backup_by_id(listed.at(0).id, RestoreOptions{.overwrite = true});
        REQUIRE(result.success);
        REQUIRE(result.restored.total() == 5);

        auto missing = manager.restore_backup_by_id(9999);
        REQUIRE_FALSE(missing.success);
        REQUIRE(missing.errors.at(0) == "backup 9999 not found");
    }

    SECTION("A bad record fails alone") {
        auto data = parse_body(envelope.payload).unwrap();
        data.events[1].title.clear();
        BackupEnvelope edited = envelope;
        edited.payload = serialize_body(data);
        edited.checksum.clear();

        auto result = manager.restore_backup(edited, RestoreOptions{.overwrite = true});
        REQUIRE_FALSE(result.success);
        REQUIRE(result.restored.events == 1);
        REQUIRE(result.restored.categories == 1);
        REQUIRE(result.errors == std::vector<std::string>{"Event restore failed: event title is required"});
        REQUIRE(result.warnings == std::vector<std::string>{"Backup has no checksum; integrity not verified"});
        REQUIRE_FALSE(result.checksum_verified);
    }

    SECTION("A failed commit restores nothing") {
        f->database().set_commit_hook([] { return false; });
        auto result = manager.restore_backup(envelope, RestoreOptions{.overwrite = true});
        f->database().set_commit_hook({});

        REQUIRE_FALSE(result.success);
        REQUIRE(result.restored.total() == 0);
        REQUIRE(f->events_for_owner("alice").unwrap().size() == 2);
    }

    SECTION("Delete from the catalogue") {
        auto id = manager.list_backups("alice").unwrap().at(0).id;
        REQUIRE(manager.get_backup(id).unwrap().has_value());
        REQUIRE(manager.delete_backup(id).is_ok());
        REQUIRE_FALSE(manager.get_backup(id).unwrap().has_value());
        REQUIRE(manager.delete_backup(id).unwrap_err().kind == ErrorKind::NotFound);
    }
}

TEST_CASE("Restore reproduces every field", "[backup]") {
    StoreConfig config;
    config.compression_threshold = 256;
    StoreFixture f(config);
    test::seed_full_owner(f, "alice");
    BackupManager manager(*f);

    const auto before = test::snapshot_owner(*f, "alice");
    REQUIRE(before.events.size() == 4);
    REQUIRE(before.categories.size() == 2);
    REQUIRE(before.calendars.size() == 2);

    BackupOptions backup_options{.include_deleted = true};
    RestoreOptions restore_options{.overwrite = true};

    SECTION("Plain") {
        backup_options.compress = false;
    }
    SECTION("Compressed") {
        backup_options.compress = true;
    }
    SECTION("Compressed and encrypted") {
        backup_options.encrypt = true;
        backup_options.password = "correct horse";
        restore_options.decrypt = true;
        restore_options.password = "correct horse";
    }

    auto envelope = manager.create_backup("alice", backup_options).unwrap();
    REQUIRE(envelope.compressed == backup_options.compress);
    REQUIRE(envelope.encrypted == backup_options.encrypt);

    f.clock->advance(std::chrono::hours(1));
    f.add_event("alice", "Written after the backup");
    REQUIRE(f->update_preferences("alice", PreferencesPatch{.theme = "light"}).is_ok());

    auto result = manager.restore_backup(envelope, restore_options);
    REQUIRE(result.success);
    REQUIRE(result.checksum_verified);
    REQUIRE(result.restored.events == 4);

    test::require_same_records(before, test::snapshot_owner(*f, "alice"));
}

TEST_CASE("Encrypted backups", "[backup]") {
    StoreFixture f;
    seed_owner(f, "alice");
    BackupManager manager(*f);

    auto envelope = manager.create_backup("alice", BackupOptions{.encrypt = true, .password = "hunter2"}).unwrap();
    REQUIRE(envelope.encrypted);
    REQUIRE_FALSE(envelope.payload.contains("Dentist"));

    SECTION("Restore needs the password") {
        auto refused = manager.restore_backup(envelope);
        REQUIRE_FALSE(refused.success);
        REQUIRE(refused.errors.at(0) == "Backup is encrypted; a password is required");
    }

    SECTION("Wrong password") {
        auto wrong = manager.restore_backup(envelope, RestoreOptions{.decrypt = true, .password = "letmein"});
        REQUIRE_FALSE(wrong.success);
        REQUIRE(wrong.restored.total() == 0);
    }

    SECTION("Right password") {
        auto restored = manager.restore_backup(envelope, RestoreOptions{
            .overwrite = true, .decrypt = true, .password = "hunter2"});
        REQUIRE(restored.success);
        REQUIRE(restored.checksum_verified);
        REQUIRE(restored.restored.events == 2);
    }
}

TEST_CASE("Backup files", "[backup]") {
    StoreFixture f;
    seed_owner(f, "alice");
    BackupManager manager(*f);
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    auto envelope = manager.create_backup("alice").unwrap();
    auto path = manager.export_to_file(envelope, dir.filePath(QStringLiteral("nested/backups"))).unwrap();
    REQUIRE(path.endsWith(QString::fromStdString(backup_file_name("alice", envelope.timestamp))));
    REQUIRE(QFile::exists(path));

    auto imported = manager.import_from_file(path).unwrap();
    REQUIRE(imported.checksum == envelope.checksum);

    auto result = manager.restore_backup(imported, RestoreOptions{.overwrite = true});
    REQUIRE(result.success);
    REQUIRE(result.checksum_verified);

    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly));
    auto from_bytes = manager.restore_backup(file.readAll(), RestoreOptions{.overwrite = true});
    REQUIRE(from_bytes.success);

    auto missing = manager.import_from_file(dir.filePath(QStringLiteral("absent.json")));
    REQUIRE(missing.unwrap_err().message.rfind("Failed to read file", 0) == 0);

    auto garbage = manager.restore_backup(QByteArray("{}"));
    REQUIRE_FALSE(garbage.success);
    REQUIRE(garbage.errors.at(0) == "Invalid backup file: not an almanac backup");
}

TEST_CASE("AutoBackupScheduler", "[backup]") {
    StoreFixture f;
    seed_owner(f, "alice");
    BackupManager manager(*f);

    AutoBackupScheduler scheduler(manager, "alice");
    REQUIRE(scheduler.interval() == std::chrono::hours(24));
    REQUIRE_FALSE(scheduler.isActive());

    QSignalSpy created(&scheduler, &AutoBackupScheduler::backupCreated);
    QSignalSpy failed(&scheduler, &AutoBackupScheduler::backupFailed);

    auto envelope = scheduler.runNow().unwrap();
    REQUIRE(created.count() == 1);
    REQUIRE(created.at(0).at(0).toString() == QString::fromStdString(envelope.checksum));
    REQUIRE(failed.count() == 0);

    scheduler.start();
    REQUIRE(scheduler.isActive());
    scheduler.stop();
    REQUIRE_FALSE(scheduler.isActive());

    SECTION("Failures are signalled") {
        AutoBackupScheduler broken(manager, "alice", std::chrono::minutes(5),
                                   BackupOptions{.encrypt = true});
        QSignalSpy broken_failed(&broken, &AutoBackupScheduler::backupFailed);
        REQUIRE(broken.runNow().is_err());
        REQUIRE(broken_failed.count() == 1);
    }

    SECTION("Timer ticks create backups") {
        AutoBackupScheduler fast(manager, "alice", std::chrono::milliseconds(10));
        QSignalSpy ticked(&fast, &AutoBackupScheduler::backupCreated);
        fast.start();
        REQUIRE(ticked.wait(2000));
        fast.stop();
        REQUIRE(manager.list_backups("alice").unwrap().size() >= 2);
    }
}
