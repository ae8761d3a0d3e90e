#pragma once

#include "storage/database.hpp"
#include "storage/event_repository.hpp"
#include "storage/category_repository.hpp"
#include "storage/calendar_repository.hpp"
#include "storage/preferences_repository.hpp"
#include "storage/backup_repository.hpp"
#include "storage/metrics_sink.hpp"
#include "sync/outbox.hpp"
#include "cache/query_cache.hpp"
#include "core/config.hpp"
#include "core/records.hpp"
#include <QJsonObject>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace almanac::bulk { class BulkEngine; }
namespace almanac::backup { class BackupManager; }
namespace almanac::sync {
class OutboxDrainer;
class RetentionSweeper;
}
namespace almanac::cache { class PerformanceTuner; }
namespace almanac::test { struct StoreFixture; }

namespace almanac::storage {

struct WriteOptions {
    bool skip_sync{false};  // no outbox entry
};

struct UpdateOptions {
    bool skip_sync{false};
    // Keep a synced record synced (and skip the outbox); used when applying
    // changes that came from the remote.
    bool preserve_synced{false};
};

struct DeleteOptions {
    bool hard{false};
    bool skip_sync{false};
};

struct StoreStats {
    int64_t events{0};
    int64_t categories{0};
    int64_t calendars{0};
    int64_t preferences{0};
    int64_t outbox{0};
    int64_t cache_entries{0};
    int64_t backups{0};
    int64_t metrics{0};
};

struct SyncSummary {
    int pending_sync{0};  // events still local or pending
    int queue_size{0};    // deliverable outbox entries
    int conflicts{0};
    std::optional<Timestamp> last_sync;
};

/**
 * Store - the schema store facade.
 *
 * Owns the connection and everything layered on it. Every mutation stamps
 * its timestamps, writes the row, enqueues the matching outbox entry and
 * invalidates the owner's cached queries, all in one transaction.
 *
 * The stage_* members do the same work without opening a transaction of
 * their own; the bulk engine and backup restore call them inside theirs.
 *
 * The repositories, outbox and cache behind the facade are private.
 */
class Store {
public:
    /**
     * Open (creating if needed) and migrate. A failed or impossible upgrade
     * is a SchemaUpgradeFailure and nothing is left half-applied.
     */
    [[nodiscard]] static Result<std::unique_ptr<Store>, Error> open(StoreConfig config);
    [[nodiscard]] static Result<std::unique_ptr<Store>, Error> open_memory(StoreConfig config = {});

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // Events
    /**
     * Create always starts a record Local. The caller's id, timestamps and
     * sync status are replaced; a remote id is kept. The same holds for
     * create_category, create_calendar and their stage_* forms. Only
     * mark_synced moves a record on to Synced.
     */
    [[nodiscard]] Result<Event, Error> create_event(Event event, const WriteOptions& options = {});
    [[nodiscard]] Result<std::optional<Event>, Error> get_event(RecordId id);
    [[nodiscard]] Result<std::vector<Event>, Error> query_events(const std::string& owner_id,
                                                                 TimeRange range);
    [[nodiscard]] Result<std::vector<Event>, Error> events_for_owner(const std::string& owner_id,
                                                                     bool include_deleted = false);
    [[nodiscard]] Result<std::vector<Event>, Error> events_by_category(const std::string& owner_id,
                                                                       const std::string& category_id);
    [[nodiscard]] Result<std::vector<Event>, Error> pending_sync_events(const std::string& owner_id);
    [[nodiscard]] Result<std::vector<Event>, Error> search_events(const std::string& owner_id,
                                                                  const std::string& term,
                                                                  int limit = 20);
    [[nodiscard]] Result<std::vector<Event>, Error> recurring_events(const std::string& owner_id);
    [[nodiscard]] Result<Event, Error> update_event(RecordId id, const EventPatch& patch,
                                                    const UpdateOptions& options = {});
    [[nodiscard]] Result<void, Error> delete_event(RecordId id, const DeleteOptions& options = {});

    // Categories
    [[nodiscard]] Result<Category, Error> create_category(Category category,
                                                          const WriteOptions& options = {});
    [[nodiscard]] Result<std::optional<Category>, Error> get_category(RecordId id);
    [[nodiscard]] Result<std::vector<Category>, Error> categories(const std::string& owner_id);
    [[nodiscard]] Result<Category, Error> update_category(RecordId id, const CategoryPatch& patch,
                                                          const UpdateOptions& options = {});

    /**
     * Delete a category. The owner's events pointing at it are moved to
     * `reassign_to` when given, otherwise their category is cleared.
     */
    [[nodiscard]] Result<void, Error> delete_category(RecordId id,
                                                      const std::optional<std::string>& reassign_to = std::nullopt,
                                                      const DeleteOptions& options = {});

    // Calendars
    [[nodiscard]] Result<Calendar, Error> create_calendar(Calendar calendar,
                                                          const WriteOptions& options = {});
    [[nodiscard]] Result<std::optional<Calendar>, Error> get_calendar(RecordId id);
    [[nodiscard]] Result<std::vector<Calendar>, Error> calendars(const std::string& owner_id);
    [[nodiscard]] Result<std::optional<Calendar>, Error> default_calendar(const std::string& owner_id);
    [[nodiscard]] Result<Calendar, Error> update_calendar(RecordId id, const CalendarPatch& patch,
                                                          const UpdateOptions& options = {});
    [[nodiscard]] Result<void, Error> delete_calendar(RecordId id, const DeleteOptions& options = {});

    // Preferences
    /**
     * The owner's preferences, or the defaults when none were saved.
     */
    [[nodiscard]] Result<Preferences, Error> get_preferences(const std::string& owner_id);
    [[nodiscard]] Result<Preferences, Error> save_preferences(Preferences preferences,
                                                              const WriteOptions& options = {});
    [[nodiscard]] Result<Preferences, Error> update_preferences(const std::string& owner_id,
                                                                const PreferencesPatch& patch,
                                                                const WriteOptions& options = {});

    // Sync state
    /**
     * Acknowledge a record as synced. The only way a record reaches Synced;
     * `remote_id` is kept when not given.
     */
    [[nodiscard]] Result<void, Error> mark_synced(EntityKind kind, RecordId id,
                                                  const std::optional<std::string>& remote_id = std::nullopt);

    /**
     * Flag an event as conflicting with the remote version, which is kept
     * under metadata.conflictData.
     */
    [[nodiscard]] Result<void, Error> mark_conflict(RecordId event_id, const QJsonObject& remote);

    /**
     * Every record of the owner back to local, remote ids dropped, outbox
     * cleared. Returns the number of records reset.
     */
    [[nodiscard]] Result<int, Error> reset_sync_state(const std::string& owner_id);

    [[nodiscard]] Result<SyncSummary, Error> sync_summary(const std::string& owner_id);

    // Maintenance
    [[nodiscard]] Result<StoreStats, Error> stats();
    [[nodiscard]] Result<void, Error> clear_all_data();

    /**
     * The owner's live events as CSV with a header row.
     */
    [[nodiscard]] Result<std::string, Error> export_csv(const std::string& owner_id);

    // Staging primitives: no transaction of their own.
    [[nodiscard]] Result<Event, Error> stage_event_create(Event event, const WriteOptions& options);
    [[nodiscard]] Result<Event, Error> stage_event_update(RecordId id, const EventPatch& patch,
                                                          const UpdateOptions& options);
    [[nodiscard]] Result<void, Error> stage_event_delete(RecordId id, const DeleteOptions& options);
    [[nodiscard]] Result<Category, Error> stage_category_create(Category category,
                                                                const WriteOptions& options);
    [[nodiscard]] Result<Calendar, Error> stage_calendar_create(Calendar calendar,
                                                                const WriteOptions& options);
    [[nodiscard]] Result<Calendar, Error> stage_calendar_update(RecordId id, const CalendarPatch& patch,
                                                                const UpdateOptions& options);

    /**
     * Drop cached queries tagged with the owner's `kind` or the owner.
     */
    [[nodiscard]] Result<void, Error> invalidate(const std::string& owner_id, EntityKind kind);

    /**
     * Append a metric; failures are logged, not returned.
     */
    void record_metric(const std::string& operation, double duration_ms, bool success,
                       std::optional<int64_t> record_count = std::nullopt,
                       const std::optional<std::string>& error = std::nullopt);

    [[nodiscard]] Database& database() { return db_; }
    [[nodiscard]] MetricsSink& metrics() { return metrics_; }
    [[nodiscard]] const Clock& clock() const { return *clock_; }
    [[nodiscard]] const StoreConfig& config() const { return config_; }

private:
    // Raw row access skips stamping, outbox entries and cache invalidation.
    // Only the layers that keep those invariants themselves get it.
    friend class bulk::BulkEngine;
    friend class backup::BackupManager;
    friend class sync::OutboxDrainer;
    friend class sync::RetentionSweeper;
    friend class cache::PerformanceTuner;
    friend struct test::StoreFixture;

    EventRepository& event_rows() { return events_; }
    CategoryRepository& category_rows() { return categories_; }
    CalendarRepository& calendar_rows() { return calendars_; }
    PreferencesRepository& preference_rows() { return preferences_; }
    BackupRepository& backup_rows() { return backups_; }
    sync::Outbox& outbox() { return outbox_; }
    cache::QueryCache& cache() { return cache_; }

    Store(Database db, StoreConfig config);

    static Result<std::unique_ptr<Store>, Error> finish_open(Result<Database, Error> db_result,
                                                              StoreConfig config);

    // max(now, previous + 1ms): updates always move updated_at forward.
    Timestamp next_update_stamp(Timestamp previous) const;

    Result<void, Error> enqueue(const std::string& owner_id, sync::OutboxOperation op,
                                EntityKind kind, RecordId id, const QJsonObject& payload);

    StoreConfig config_;
    std::shared_ptr<Clock> clock_;
    Database db_;
    EventRepository events_;
    CategoryRepository categories_;
    CalendarRepository calendars_;
    PreferencesRepository preferences_;
    BackupRepository backups_;
    MetricsSink metrics_;
    sync::Outbox outbox_;
    cache::QueryCache cache_;
};

} // namespace almanac::storage
