#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include <optional>
#include <vector>

namespace almanac::storage {

class CalendarRepository {
public:
    explicit CalendarRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<RecordId, Error> insert(const Calendar& calendar);
    [[nodiscard]] Result<void, Error> update(const Calendar& calendar);
    [[nodiscard]] Result<void, Error> remove(RecordId id);

    [[nodiscard]] Result<std::optional<Calendar>, Error> get(RecordId id);
    [[nodiscard]] Result<std::vector<Calendar>, Error> by_owner(const std::string& owner_id);
    [[nodiscard]] Result<std::optional<Calendar>, Error> find_by_name(const std::string& owner_id,
                                                                      const std::string& name);

    /**
     * The owner's default calendar, or failing that the oldest one.
     */
    [[nodiscard]] Result<std::optional<Calendar>, Error> default_for(const std::string& owner_id);

    /**
     * Ids of the owner's calendars flagged default, except `keep`.
     */
    [[nodiscard]] Result<std::vector<RecordId>, Error> other_defaults(const std::string& owner_id,
                                                                      RecordId keep);

    [[nodiscard]] Result<void, Error> set_sync_state(RecordId id, SyncStatus status,
                                                     const std::optional<std::string>& remote_id);
    [[nodiscard]] Result<int, Error> reset_sync_state(const std::string& owner_id);
    [[nodiscard]] Result<int, Error> remove_by_owner(const std::string& owner_id);
    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;

    static Calendar row_to_calendar(Statement& stmt);
};

} // namespace almanac::storage
