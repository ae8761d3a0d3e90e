#pragma once

#include "core/records.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <optional>
#include <string>
#include <vector>

namespace almanac::backup {

constexpr const char* BACKUP_FORMAT_NAME = "almanac-backup";

struct BackupStats {
    int64_t total_records{0};
    int64_t event_count{0};
    int64_t category_count{0};
    int64_t calendar_count{0};

    bool operator==(const BackupStats&) const = default;
};

/**
 * Everything one owner has, as collected for a backup.
 */
struct BackupData {
    std::vector<Event> events;
    std::vector<Category> categories;
    std::vector<Calendar> calendars;
    std::optional<Preferences> preferences;

    [[nodiscard]] BackupStats stats() const;
};

/**
 * A backup as it travels: metadata plus the payload bytes.
 *
 * `payload` is the serialized body, compressed when `compressed`, then
 * encrypted when `encrypted`. `checksum` is the SHA-256 (hex) of the
 * payload before encryption.
 */
struct BackupEnvelope {
    int version{0};  // schema version of the store that wrote it
    Timestamp timestamp;
    std::string owner_id;
    bool compressed{false};
    bool encrypted{false};
    std::string checksum;
    BackupStats stats;
    QByteArray payload;
};

/**
 * Canonical body bytes: compact JSON {"data": {...}, "stats": {...}} with
 * sorted keys. Equal data always gives equal bytes.
 */
[[nodiscard]] QByteArray serialize_body(const BackupData& data);

[[nodiscard]] Result<BackupData, Error> parse_body(const QByteArray& body);

/**
 * The backup file. Plain backups carry "data" and "stats" inline; compressed
 * or encrypted ones carry the payload base64-encoded under "payload".
 */
[[nodiscard]] QByteArray envelope_to_json(const BackupEnvelope& envelope);
[[nodiscard]] Result<BackupEnvelope, Error> envelope_from_json(const QByteArray& bytes);

/**
 * almanac-backup-<owner>-<20240301T093000Z>.json
 */
[[nodiscard]] std::string backup_file_name(const std::string& owner_id, Timestamp timestamp);

} // namespace almanac::backup
