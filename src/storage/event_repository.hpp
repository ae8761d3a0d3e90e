#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace almanac::storage {

/**
 * Row-level access to the events table. No stamping, no outbox, no cache:
 * the Store layers those on top.
 */
class EventRepository {
public:
    explicit EventRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<RecordId, Error> insert(const Event& event);
    [[nodiscard]] Result<void, Error> update(const Event& event);
    [[nodiscard]] Result<void, Error> remove(RecordId id);

    [[nodiscard]] Result<std::optional<Event>, Error> get(RecordId id);
    [[nodiscard]] Result<std::optional<Event>, Error> find_by_remote_id(const std::string& remote_id);

    [[nodiscard]] Result<std::vector<Event>, Error> by_owner(const std::string& owner_id,
                                                             bool include_deleted = false);

    /**
     * Live events whose start falls in [range.start, range.end), by start time.
     */
    [[nodiscard]] Result<std::vector<Event>, Error> in_range(const std::string& owner_id,
                                                             TimeRange range);

    [[nodiscard]] Result<std::vector<Event>, Error> by_category(const std::string& owner_id,
                                                                const std::string& category_id);

    /**
     * Events the remote has not acknowledged yet (local or pending).
     */
    [[nodiscard]] Result<std::vector<Event>, Error> pending_sync(const std::string& owner_id);

    /**
     * Case-insensitive substring match over title, description and location.
     */
    [[nodiscard]] Result<std::vector<Event>, Error> search(const std::string& owner_id,
                                                           const std::string& term,
                                                           int limit = 20);

    [[nodiscard]] Result<std::vector<Event>, Error> recurring(const std::string& owner_id);

    /**
     * A live event with the same owner, title and start time, if any.
     */
    [[nodiscard]] Result<std::optional<Event>, Error> find_equivalent(const std::string& owner_id,
                                                                      const std::string& title,
                                                                      Timestamp start_time);

    [[nodiscard]] Result<void, Error> set_sync_state(RecordId id, SyncStatus status,
                                                     const std::optional<std::string>& remote_id);

    /**
     * Forget remote identity: every event of the owner back to local.
     */
    [[nodiscard]] Result<int, Error> reset_sync_state(const std::string& owner_id);

    [[nodiscard]] Result<int, Error> remove_by_owner(const std::string& owner_id);

    /**
     * Hard-delete soft-deleted events last touched before `cutoff`.
     */
    [[nodiscard]] Result<int, Error> purge_deleted_before(Timestamp cutoff);

    [[nodiscard]] Result<int64_t, Error> count();
    [[nodiscard]] Result<std::map<SyncStatus, int>, Error> count_by_status(const std::string& owner_id);

private:
    Database& db_;

    static Event row_to_event(Statement& stmt);
    Result<std::vector<Event>, Error> select_many(const std::string& where_clause,
                                                  const std::function<void(Statement&)>& bind);
};

} // namespace almanac::storage
