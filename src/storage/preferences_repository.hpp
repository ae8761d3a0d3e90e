#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include <optional>

namespace almanac::storage {

/**
 * One preferences row per owner; save() upserts on owner_id.
 */
class PreferencesRepository {
public:
    explicit PreferencesRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Preferences>, Error> get(const std::string& owner_id);
    [[nodiscard]] Result<RecordId, Error> save(const Preferences& preferences);
    [[nodiscard]] Result<int, Error> remove(const std::string& owner_id);
    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;

    static Preferences row_to_preferences(Statement& stmt);
};

} // namespace almanac::storage
