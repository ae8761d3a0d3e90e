#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include <optional>
#include <string>
#include <vector>

namespace almanac::storage {

/**
 * Row of the backups table. `payload` holds the stored envelope bytes
 * (the JSON document export_to_file writes) so a backup can be restored
 * by id.
 */
struct BackupRecord {
    RecordId id{0};
    std::string owner_id;
    Timestamp timestamp;
    int version{0};
    int64_t size{0};
    std::vector<std::string> tables;
    int64_t record_count{0};
    bool compressed{false};
    std::string checksum;
    bool encrypted{false};
    std::vector<uint8_t> payload;
};

class BackupRepository {
public:
    explicit BackupRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<RecordId, Error> insert(const BackupRecord& record);
    [[nodiscard]] Result<void, Error> remove(RecordId id);

    /**
     * With payload.
     */
    [[nodiscard]] Result<std::optional<BackupRecord>, Error> get(RecordId id);

    /**
     * Newest first, without payloads.
     */
    [[nodiscard]] Result<std::vector<BackupRecord>, Error> by_owner(const std::string& owner_id);

    /**
     * Delete all but the newest `keep` backups of the owner. Returns the
     * number deleted.
     */
    [[nodiscard]] Result<int, Error> prune(const std::string& owner_id, int keep);

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;

    static BackupRecord row_to_record(Statement& stmt);
};

} // namespace almanac::storage
