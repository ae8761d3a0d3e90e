#pragma once

#include "backup/backup_format.hpp"
#include "storage/store.hpp"
#include <QObject>
#include <QString>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class QTimer;

namespace almanac::backup {

struct BackupOptions {
    bool compress{true};          // only above the compression threshold
    bool include_deleted{false};
    bool encrypt{false};
    std::string password;
};

/**
 * Neither overwrite nor merge means append: every record is inserted.
 */
struct RestoreOptions {
    bool overwrite{false};  // delete the owner's records first
    bool merge{false};      // skip events matching owner + title + start
    bool decrypt{false};
    std::string password;
    std::optional<IntegrityPolicy> integrity_policy;  // store config when unset
    std::optional<std::string> target_owner;          // envelope owner when unset
};

struct RestoreCounts {
    int events{0};
    int categories{0};
    int calendars{0};
    bool preferences{false};
    int skipped{0};

    [[nodiscard]] int total() const { return events + categories + calendars + (preferences ? 1 : 0); }
};

struct RestoreResult {
    bool success{false};
    RestoreCounts restored;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    bool checksum_verified{false};
};

/**
 * BackupManager - snapshots of one owner's data and their restore.
 *
 * create: collect, serialize, compress above the threshold, checksum,
 * encrypt, persist, prune to the newest max_backups.
 * restore: decrypt, verify the checksum before any write, decompress,
 * parse, insert in one transaction.
 */
class BackupManager {
public:
    explicit BackupManager(storage::Store& store) : store_(store) {}

    [[nodiscard]] Result<BackupEnvelope, Error> create_backup(const std::string& owner_id,
                                                              const BackupOptions& options = {});

    /**
     * Never fails as a whole: problems are reported in the result.
     */
    [[nodiscard]] RestoreResult restore_backup(const BackupEnvelope& envelope,
                                               const RestoreOptions& options = {});
    [[nodiscard]] RestoreResult restore_backup(const QByteArray& file_bytes,
                                               const RestoreOptions& options = {});
    [[nodiscard]] RestoreResult restore_backup_by_id(RecordId backup_id,
                                                     const RestoreOptions& options = {});

    /**
     * Newest first.
     */
    [[nodiscard]] Result<std::vector<storage::BackupRecord>, Error> list_backups(const std::string& owner_id);
    [[nodiscard]] Result<std::optional<storage::BackupRecord>, Error> get_backup(RecordId backup_id);
    [[nodiscard]] Result<void, Error> delete_backup(RecordId backup_id);

    /**
     * Write the envelope to `directory` under backup_file_name(). Returns
     * the path written.
     */
    [[nodiscard]] Result<QString, Error> export_to_file(const BackupEnvelope& envelope,
                                                        const QString& directory);
    [[nodiscard]] Result<BackupEnvelope, Error> import_from_file(const QString& path);

private:
    Result<BackupData, Error> collect(const std::string& owner_id, bool include_deleted);

    // Undo encryption and compression; checksum handling per `options`.
    Result<QByteArray, Error> open_payload(const BackupEnvelope& envelope,
                                           const RestoreOptions& options,
                                           RestoreResult& result);

    Result<void, Error> write_records(const std::string& owner_id, BackupData data,
                                      const RestoreOptions& options, RestoreResult& result);

    RestoreResult fail(RestoreResult result, const Stopwatch& watch);

    storage::Store& store_;
};

/**
 * Creates a backup for one owner on a Qt timer (24 hours by default).
 */
class AutoBackupScheduler : public QObject {
    Q_OBJECT

public:
    AutoBackupScheduler(BackupManager& manager, std::string owner_id,
                        std::chrono::milliseconds interval = std::chrono::hours(24),
                        BackupOptions options = {},
                        QObject* parent = nullptr);
    ~AutoBackupScheduler() override;

    void start();
    void stop();
    [[nodiscard]] bool isActive() const;
    [[nodiscard]] std::chrono::milliseconds interval() const;

    Result<BackupEnvelope, Error> runNow();

signals:
    void backupCreated(const QString& checksum);
    void backupFailed(const QString& message);

private:
    void onTick();

    BackupManager& manager_;
    std::string owner_id_;
    BackupOptions options_;
    std::unique_ptr<QTimer> timer_;
};

} // namespace almanac::backup
