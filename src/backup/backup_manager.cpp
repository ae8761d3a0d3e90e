#include "backup/backup_manager.hpp"
#include "crypto/encryption.hpp"
#include "storage/migrations.hpp"
#include "core/logging.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTimer>
#include <span>

namespace almanac::backup {

namespace {

std::span<const uint8_t> bytes_of(const QByteArray& data) {
    return {reinterpret_cast<const uint8_t*>(data.constData()), static_cast<size_t>(data.size())};
}

QByteArray to_qbytes(const std::vector<uint8_t>& data) {
    return QByteArray(reinterpret_cast<const char*>(data.data()), static_cast<qsizetype>(data.size()));
}

const std::vector<std::string> BACKED_UP_TABLES = {"events", "categories", "calendars", "preferences"};

} // namespace

// ============================================================================
// Create
// ============================================================================

Result<BackupData, Error> BackupManager::collect(const std::string& owner_id, bool include_deleted) {
    using R = Result<BackupData, Error>;
    BackupData data;

    auto events = store_.event_rows().by_owner(owner_id, include_deleted);
    if (events.is_err()) return R::err(events.unwrap_err());
    data.events = std::move(events).unwrap();

    auto categories = store_.category_rows().by_owner(owner_id);
    if (categories.is_err()) return R::err(categories.unwrap_err());
    data.categories = std::move(categories).unwrap();

    auto calendars = store_.calendar_rows().by_owner(owner_id);
    if (calendars.is_err()) return R::err(calendars.unwrap_err());
    data.calendars = std::move(calendars).unwrap();

    auto preferences = store_.preference_rows().get(owner_id);
    if (preferences.is_err()) return R::err(preferences.unwrap_err());
    data.preferences = std::move(preferences).unwrap();

    return R::ok(std::move(data));
}

Result<BackupEnvelope, Error> BackupManager::create_backup(const std::string& owner_id,
                                                           const BackupOptions& options) {
    using R = Result<BackupEnvelope, Error>;
    Stopwatch watch;

    auto failed = [&](Error error) {
        qCWarning(almanacBackupLog) << "Backup: create failed for" << to_qstring(owner_id)
                                    << ":" << to_qstring(error.message);
        store_.record_metric("backup.create", watch.elapsed_ms(), false, std::nullopt, error.message);
        return R::err(std::move(error));
    };

    if (owner_id.empty()) {
        return failed(Error{ErrorKind::Validation, "backup owner is required"});
    }
    if (options.encrypt && options.password.empty()) {
        return failed(Error{ErrorKind::Validation, "a password is required to encrypt a backup"});
    }

    // The checksum needs libsodium even when nothing is encrypted.
    auto ready = crypto::init();
    if (ready.is_err()) {
        return failed(ready.unwrap_err());
    }

    auto collected = collect(owner_id, options.include_deleted);
    if (collected.is_err()) {
        return failed(collected.unwrap_err());
    }
    const auto& data = collected.unwrap();

    storage::MigrationRunner runner(store_.database());
    auto version = runner.current_version();
    if (version.is_err()) {
        return failed(version.unwrap_err());
    }

    BackupEnvelope envelope;
    envelope.version = version.unwrap();
    envelope.timestamp = store_.clock().now();
    envelope.owner_id = owner_id;
    envelope.stats = data.stats();

    const QByteArray body = serialize_body(data);
    envelope.payload = body;
    if (options.compress && static_cast<size_t>(body.size()) > store_.config().compression_threshold) {
        envelope.payload = qCompress(body);
        envelope.compressed = true;
    }

    envelope.checksum = crypto::sha256_hex(bytes_of(envelope.payload));

    if (options.encrypt) {
        auto sealed = crypto::encrypt_with_password(bytes_of(envelope.payload), options.password);
        if (sealed.is_err()) {
            return failed(sealed.unwrap_err());
        }
        envelope.payload = to_qbytes(sealed.unwrap());
        envelope.encrypted = true;
    }

    const QByteArray file_bytes = envelope_to_json(envelope);
    int pruned = 0;
    auto persisted = store_.database().transaction([&]() -> Result<void, Error> {
        auto id = store_.backup_rows().insert(storage::BackupRecord{
            .owner_id = owner_id,
            .timestamp = envelope.timestamp,
            .version = envelope.version,
            .size = body.size(),
            .tables = BACKED_UP_TABLES,
            .record_count = envelope.stats.total_records,
            .compressed = envelope.compressed,
            .checksum = envelope.checksum,
            .encrypted = envelope.encrypted,
            .payload = std::vector<uint8_t>(file_bytes.begin(), file_bytes.end())
        });
        if (id.is_err()) {
            return Result<void, Error>::err(id.unwrap_err());
        }
        auto removed = store_.backup_rows().prune(owner_id, store_.config().max_backups);
        if (removed.is_err()) {
            return Result<void, Error>::err(removed.unwrap_err());
        }
        pruned = removed.unwrap();
        return Result<void, Error>::ok();
    });
    if (persisted.is_err()) {
        return failed(persisted.unwrap_err());
    }

    if (pruned > 0) {
        qCInfo(almanacBackupLog) << "Backup: pruned" << pruned << "old backups of" << to_qstring(owner_id);
    }
    qCInfo(almanacBackupLog).nospace()
        << "Backup: created for " << to_qstring(owner_id) << ", " << envelope.stats.total_records
        << " records, " << body.size() << " bytes"
        << (envelope.compressed ? ", compressed" : "") << (envelope.encrypted ? ", encrypted" : "");

    store_.record_metric("backup.create", watch.elapsed_ms(), true, envelope.stats.total_records);
    return R::ok(std::move(envelope));
}

// ============================================================================
// Restore
// ============================================================================

RestoreResult BackupManager::fail(RestoreResult result, const Stopwatch& watch) {
    result.success = false;
    for (const auto& e : result.errors) {
        qCWarning(almanacBackupLog) << "Backup: restore failed:" << to_qstring(e);
    }
    store_.record_metric("backup.restore", watch.elapsed_ms(), false, result.restored.total(),
                         result.errors.empty() ? std::nullopt : std::optional<std::string>(result.errors.front()));
    return result;
}

Result<QByteArray, Error> BackupManager::open_payload(const BackupEnvelope& envelope,
                                                      const RestoreOptions& options,
                                                      RestoreResult& result) {
    using R = Result<QByteArray, Error>;
    QByteArray payload = envelope.payload;

    auto ready = crypto::init();
    if (ready.is_err()) {
        return R::err(ready.unwrap_err());
    }

    if (envelope.encrypted) {
        if (!options.decrypt || options.password.empty()) {
            return R::err(Error{ErrorKind::Crypto, "Backup is encrypted; a password is required"});
        }
        auto opened = crypto::decrypt_with_password(bytes_of(payload), options.password);
        if (opened.is_err()) {
            return R::err(opened.unwrap_err());
        }
        payload = to_qbytes(opened.unwrap());
    }

    const std::string actual = crypto::sha256_hex(bytes_of(payload));
    if (envelope.checksum.empty()) {
        result.warnings.push_back("Backup has no checksum; integrity not verified");
    } else if (crypto::secure_compare(actual, envelope.checksum)) {
        result.checksum_verified = true;
    } else {
        const auto policy = options.integrity_policy.value_or(store_.config().integrity_policy);
        const std::string message = "Backup checksum mismatch - data may be corrupted (expected " +
                                    envelope.checksum + ", computed " + actual + ")";
        if (policy == IntegrityPolicy::Refuse) {
            return R::err(Error{ErrorKind::IntegrityMismatch, message});
        }
        qCWarning(almanacBackupLog) << "Backup:" << to_qstring(message);
        result.warnings.push_back(message);
    }

    if (envelope.compressed) {
        payload = qUncompress(payload);
        if (payload.isEmpty()) {
            return R::err(Error{ErrorKind::Format, "Backup payload could not be decompressed"});
        }
    }
    return R::ok(std::move(payload));
}

Result<void, Error> BackupManager::write_records(const std::string& owner_id, BackupData data,
                                                 const RestoreOptions& options, RestoreResult& result) {
    auto& db = store_.database();
    RestoreCounts counts;
    std::vector<std::string> item_errors;

    // Items run in savepoints so one bad record does not abort the rest.
    auto record_item = [&](const char* what, auto&& insert) -> bool {
        auto r = db.transaction(insert);
        if (r.is_err()) {
            item_errors.push_back(std::string(what) + " restore failed: " + r.unwrap_err().message);
            return false;
        }
        return true;
    };

    auto committed = db.transaction([&]() -> Result<void, Error> {
        if (options.overwrite) {
            for (auto removed : {store_.event_rows().remove_by_owner(owner_id),
                                 store_.category_rows().remove_by_owner(owner_id),
                                 store_.calendar_rows().remove_by_owner(owner_id),
                                 store_.preference_rows().remove(owner_id),
                                 store_.outbox().clear(owner_id)}) {
                if (removed.is_err()) {
                    return Result<void, Error>::err(removed.unwrap_err());
                }
            }
        }

        for (auto& event : data.events) {
            event.id = 0;
            event.owner_id = owner_id;
            if (options.merge) {
                auto existing = store_.event_rows().find_equivalent(owner_id, event.title, event.start_time);
                if (existing.is_err()) {
                    return Result<void, Error>::err(existing.unwrap_err());
                }
                if (existing.unwrap()) {
                    ++counts.skipped;
                    continue;
                }
            }
            if (record_item("Event", [&]() -> Result<void, Error> {
                    auto v = validate(event);
                    if (v.is_err()) return v;
                    auto id = store_.event_rows().insert(event);
                    if (id.is_err()) return Result<void, Error>::err(id.unwrap_err());
                    return Result<void, Error>::ok();
                })) {
                ++counts.events;
            }
        }

        for (auto& category : data.categories) {
            category.id = 0;
            category.owner_id = owner_id;
            if (record_item("Category", [&]() -> Result<void, Error> {
                    auto v = validate(category);
                    if (v.is_err()) return v;
                    auto id = store_.category_rows().insert(category);
                    if (id.is_err()) return Result<void, Error>::err(id.unwrap_err());
                    return Result<void, Error>::ok();
                })) {
                ++counts.categories;
            }
        }

        for (auto& calendar : data.calendars) {
            calendar.id = 0;
            calendar.owner_id = owner_id;
            if (record_item("Calendar", [&]() -> Result<void, Error> {
                    auto v = validate(calendar);
                    if (v.is_err()) return v;
                    if (calendar.is_default) {
                        // At most one default per owner; an existing one wins.
                        auto defaults = store_.calendar_rows().other_defaults(owner_id, 0);
                        if (defaults.is_err()) return Result<void, Error>::err(defaults.unwrap_err());
                        if (!defaults.unwrap().empty()) calendar.is_default = false;
                    }
                    auto id = store_.calendar_rows().insert(calendar);
                    if (id.is_err()) return Result<void, Error>::err(id.unwrap_err());
                    return Result<void, Error>::ok();
                })) {
                ++counts.calendars;
            }
        }

        if (data.preferences) {
            auto& prefs = *data.preferences;
            prefs.id = 0;
            prefs.owner_id = owner_id;
            counts.preferences = record_item("Preferences", [&]() -> Result<void, Error> {
                auto v = validate(prefs);
                if (v.is_err()) return v;
                auto id = store_.preference_rows().save(prefs);
                if (id.is_err()) return Result<void, Error>::err(id.unwrap_err());
                return Result<void, Error>::ok();
            });
        }
        return Result<void, Error>::ok();
    });

    if (committed.is_err()) {
        // Nothing was written; per-item outcomes no longer apply.
        return committed;
    }

    result.restored = counts;
    for (auto& e : item_errors) {
        result.errors.push_back(std::move(e));
    }

    auto dropped = store_.cache().invalidate_tags({cache::owner_tag(owner_id)});
    if (dropped.is_err()) {
        qCWarning(almanacBackupLog) << "Backup: cache invalidation failed:"
                                    << to_qstring(dropped.unwrap_err().message);
    }
    return Result<void, Error>::ok();
}

RestoreResult BackupManager::restore_backup(const BackupEnvelope& envelope, const RestoreOptions& options) {
    Stopwatch watch;
    RestoreResult result;

    auto payload = open_payload(envelope, options, result);
    if (payload.is_err()) {
        result.errors.push_back(payload.unwrap_err().message);
        return fail(std::move(result), watch);
    }

    auto data = parse_body(payload.unwrap());
    if (data.is_err()) {
        result.errors.push_back("Invalid backup data: " + data.unwrap_err().message);
        return fail(std::move(result), watch);
    }

    const std::string owner_id = options.target_owner.value_or(envelope.owner_id);
    if (owner_id.empty()) {
        result.errors.push_back("Backup has no owner");
        return fail(std::move(result), watch);
    }

    auto written = write_records(owner_id, std::move(data).unwrap(), options, result);
    if (written.is_err()) {
        result.errors.push_back(written.unwrap_err().message);
        return fail(std::move(result), watch);
    }

    result.success = result.errors.empty();
    store_.record_metric("backup.restore", watch.elapsed_ms(), result.success, result.restored.total(),
                         result.success ? std::nullopt : std::optional<std::string>(result.errors.front()));

    qCInfo(almanacBackupLog).nospace()
        << "Backup: restored " << result.restored.events << " events, "
        << result.restored.categories << " categories, " << result.restored.calendars
        << " calendars for " << to_qstring(owner_id) << " (" << result.restored.skipped
        << " skipped, " << result.errors.size() << " errors, " << result.warnings.size() << " warnings)";
    return result;
}

RestoreResult BackupManager::restore_backup(const QByteArray& file_bytes, const RestoreOptions& options) {
    auto envelope = envelope_from_json(file_bytes);
    if (envelope.is_err()) {
        Stopwatch watch;
        RestoreResult result;
        result.errors.push_back(envelope.unwrap_err().message);
        return fail(std::move(result), watch);
    }
    return restore_backup(envelope.unwrap(), options);
}

RestoreResult BackupManager::restore_backup_by_id(RecordId backup_id, const RestoreOptions& options) {
    Stopwatch watch;
    RestoreResult result;

    auto record = store_.backup_rows().get(backup_id);
    if (record.is_err()) {
        result.errors.push_back(record.unwrap_err().message);
        return fail(std::move(result), watch);
    }
    if (!record.unwrap()) {
        result.errors.push_back("backup " + std::to_string(backup_id) + " not found");
        return fail(std::move(result), watch);
    }

    const auto& payload = record.unwrap()->payload;
    return restore_backup(QByteArray(reinterpret_cast<const char*>(payload.data()),
                                     static_cast<qsizetype>(payload.size())),
                          options);
}

// ============================================================================
// Catalogue and files
// ============================================================================

Result<std::vector<storage::BackupRecord>, Error> BackupManager::list_backups(const std::string& owner_id) {
    return store_.backup_rows().by_owner(owner_id);
}

Result<std::optional<storage::BackupRecord>, Error> BackupManager::get_backup(RecordId backup_id) {
    return store_.backup_rows().get(backup_id);
}

Result<void, Error> BackupManager::delete_backup(RecordId backup_id) {
    auto removed = store_.backup_rows().remove(backup_id);
    if (removed.is_ok()) {
        qCInfo(almanacBackupLog) << "Backup: deleted backup" << backup_id;
    }
    return removed;
}

Result<QString, Error> BackupManager::export_to_file(const BackupEnvelope& envelope, const QString& directory) {
    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return Result<QString, Error>::err(
            Error{ErrorKind::Storage, "cannot create directory " + directory.toStdString()});
    }

    const QString path = dir.filePath(QString::fromStdString(
        backup_file_name(envelope.owner_id, envelope.timestamp)));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return Result<QString, Error>::err(
            Error{ErrorKind::Storage, "cannot write " + path.toStdString() + ": " +
                                      file.errorString().toStdString()});
    }
    const QByteArray bytes = envelope_to_json(envelope);
    if (file.write(bytes) != bytes.size()) {
        return Result<QString, Error>::err(
            Error{ErrorKind::Storage, "short write to " + path.toStdString()});
    }
    file.close();

    qCInfo(almanacBackupLog) << "Backup: exported to" << path;
    return Result<QString, Error>::ok(path);
}

Result<BackupEnvelope, Error> BackupManager::import_from_file(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<BackupEnvelope, Error>::err(
            Error{ErrorKind::Storage, "Failed to read file " + path.toStdString() + ": " +
                                      file.errorString().toStdString()});
    }
    return envelope_from_json(file.readAll());
}

// ============================================================================
// AutoBackupScheduler
// ============================================================================

AutoBackupScheduler::AutoBackupScheduler(BackupManager& manager, std::string owner_id,
                                         std::chrono::milliseconds interval,
                                         BackupOptions options, QObject* parent)
    : QObject(parent)
    , manager_(manager)
    , owner_id_(std::move(owner_id))
    , options_(std::move(options))
    , timer_(std::make_unique<QTimer>(this))
{
    timer_->setInterval(interval);
    connect(timer_.get(), &QTimer::timeout, this, &AutoBackupScheduler::onTick);
}

AutoBackupScheduler::~AutoBackupScheduler() {
    stop();
}

void AutoBackupScheduler::start() {
    qCInfo(almanacBackupLog) << "Backup: automatic backups every"
                             << timer_->intervalAsDuration().count() << "ms for" << to_qstring(owner_id_);
    timer_->start();
}

void AutoBackupScheduler::stop() {
    timer_->stop();
}

bool AutoBackupScheduler::isActive() const {
    return timer_->isActive();
}

std::chrono::milliseconds AutoBackupScheduler::interval() const {
    return timer_->intervalAsDuration();
}

Result<BackupEnvelope, Error> AutoBackupScheduler::runNow() {
    auto created = manager_.create_backup(owner_id_, options_);
    if (created.is_err()) {
        emit backupFailed(QString::fromStdString(created.unwrap_err().message));
    } else {
        emit backupCreated(QString::fromStdString(created.unwrap().checksum));
    }
    return created;
}

void AutoBackupScheduler::onTick() {
    // create_backup logs failures; runNow signals them.
    runNow();
}

} // namespace almanac::backup
