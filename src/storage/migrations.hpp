#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace almanac::storage {

/**
 * One schema version: DDL plus an optional data step that reshapes
 * existing rows after the DDL has run.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::function<Result<void, Error>(Database&)> data_step;
};

/**
 * Row of migration_log. Failed attempts are recorded too.
 */
struct MigrationLogEntry {
    int64_t id;
    int version;
    std::string name;
    Timestamp applied_at;
    bool success;
    std::optional<std::string> error;
};

/**
 * Schema versions 1..4 in order.
 */
[[nodiscard]] const std::vector<Migration>& all_migrations();

/**
 * MigrationRunner - brings a database up to the newest known version.
 *
 * All pending versions run in a single transaction: either the database
 * ends at the target version or it stays at the version it started at.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db,
                             const std::vector<Migration>& migrations = all_migrations())
        : db_(db), migrations_(migrations) {}

    [[nodiscard]] Result<void, Error> migrate();
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();
    [[nodiscard]] int latest_version() const {
        return migrations_.empty() ? 0 : migrations_.back().version;
    }

    [[nodiscard]] Result<std::vector<MigrationLogEntry>, Error> history();

private:
    Database& db_;
    const std::vector<Migration>& migrations_;

    [[nodiscard]] Result<void, Error> ensure_log_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> log_attempt(const Migration& m, bool success,
                                                  const std::optional<std::string>& error);
};

/**
 * Bring a freshly opened database to the latest schema.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace almanac::storage
