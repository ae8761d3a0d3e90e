#include "storage/store.hpp"
#include "storage/migrations.hpp"
#include "core/logging.hpp"
#include "core/record_json.hpp"
#include <QJsonArray>
#include <algorithm>
#include <sstream>

namespace almanac::storage {

using sync::OutboxOperation;

namespace {

QJsonArray events_to_array(const std::vector<Event>& events) {
    QJsonArray array;
    for (const auto& e : events) array.append(to_json(e));
    return array;
}

Result<std::vector<Event>, Error> events_from_value(const QJsonValue& value) {
    std::vector<Event> events;
    const auto array = value.toArray();
    events.reserve(static_cast<size_t>(array.size()));
    for (const auto& item : array) {
        auto parsed = event_from_json(item.toObject());
        if (parsed.is_err()) {
            return Result<std::vector<Event>, Error>::err(parsed.unwrap_err());
        }
        events.push_back(std::move(parsed).unwrap());
    }
    return Result<std::vector<Event>, Error>::ok(std::move(events));
}

Result<std::vector<Category>, Error> categories_from_value(const QJsonValue& value) {
    std::vector<Category> categories;
    for (const auto& item : value.toArray()) {
        auto parsed = category_from_json(item.toObject());
        if (parsed.is_err()) {
            return Result<std::vector<Category>, Error>::err(parsed.unwrap_err());
        }
        categories.push_back(std::move(parsed).unwrap());
    }
    return Result<std::vector<Category>, Error>::ok(std::move(categories));
}

// Stored metadata is kept in the same sorted, compact form the JSON
// snapshots use, so a record read back compares equal to its snapshot.
Result<std::string, Error> normalize_metadata(const std::string& metadata_json) {
    if (metadata_json.empty()) {
        return Result<std::string, Error>::ok("{}");
    }
    auto parsed = parse_json_object(metadata_json);
    if (parsed.is_err()) {
        return Result<std::string, Error>::err(
            Error{ErrorKind::Validation, "event metadata must be a JSON object"});
    }
    return Result<std::string, Error>::ok(to_compact_json(parsed.unwrap()));
}

std::string csv_field(std::string_view value) {
    const bool needs_quotes = value.find_first_of(",\"\n\r") != std::string_view::npos;
    if (!needs_quotes) {
        return std::string(value);
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out += "\"";
    return out;
}

QJsonObject delete_payload(RecordId id, const std::optional<std::string>& remote_id, bool hard) {
    QJsonObject payload;
    payload.insert(QStringLiteral("id"), static_cast<qint64>(id));
    payload.insert(QStringLiteral("hard"), hard);
    if (remote_id) payload.insert(QStringLiteral("remoteId"), QString::fromStdString(*remote_id));
    return payload;
}

Result<int64_t, Error> count_table(Database& db, const char* table) {
    auto stmt_result = db.prepare(std::string("SELECT COUNT(*) FROM ") + table + ";");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Store::Store(Database db, StoreConfig config)
    : config_(std::move(config))
    , clock_(config_.clock ? config_.clock : std::make_shared<SystemClock>())
    , db_(std::move(db))
    , events_(db_)
    , categories_(db_)
    , calendars_(db_)
    , preferences_(db_)
    , backups_(db_)
    , metrics_(db_)
    , outbox_(db_, *clock_, config_.outbox_max_attempts)
    , cache_(db_, *clock_, metrics_, config_.cache_ttl) {}

Result<std::unique_ptr<Store>, Error> Store::open(StoreConfig config) {
    if (config.db_path.empty() || config.db_path == ":memory:") {
        return finish_open(Database::open_memory(), std::move(config));
    }
    return finish_open(Database::open(config.db_path), std::move(config));
}

Result<std::unique_ptr<Store>, Error> Store::open_memory(StoreConfig config) {
    config.db_path = ":memory:";
    return finish_open(Database::open_memory(), std::move(config));
}

Result<std::unique_ptr<Store>, Error> Store::finish_open(Result<Database, Error> db_result,
                                                         StoreConfig config) {
    using R = Result<std::unique_ptr<Store>, Error>;

    if (db_result.is_err()) {
        return R::err(db_result.unwrap_err());
    }
    auto db = std::move(db_result).unwrap();

    auto migrated = initialize_database(db);
    if (migrated.is_err()) {
        qCWarning(almanacStoreLog) << "Store: cannot open" << to_qstring(config.db_path) << ":"
                                   << to_qstring(migrated.unwrap_err().message);
        return R::err(migrated.unwrap_err());
    }

    qCInfo(almanacStoreLog) << "Store: opened" << to_qstring(config.db_path);
    return R::ok(std::unique_ptr<Store>(new Store(std::move(db), std::move(config))));
}

Timestamp Store::next_update_stamp(Timestamp previous) const {
    const auto now = clock_->now();
    const auto bumped = previous + std::chrono::milliseconds(1);
    return now < bumped ? bumped : now;
}

Result<void, Error> Store::enqueue(const std::string& owner_id, OutboxOperation op,
                                   EntityKind kind, RecordId id, const QJsonObject& payload) {
    auto queued = outbox_.enqueue(owner_id, op, kind, id, to_compact_json(payload));
    if (queued.is_err()) {
        return Result<void, Error>::err(queued.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Store::invalidate(const std::string& owner_id, EntityKind kind) {
    auto dropped = cache_.invalidate_tags({cache::entity_tag(owner_id, kind), cache::owner_tag(owner_id)});
    if (dropped.is_err()) {
        return Result<void, Error>::err(dropped.unwrap_err());
    }
    return Result<void, Error>::ok();
}

void Store::record_metric(const std::string& operation, double duration_ms, bool success,
                          std::optional<int64_t> record_count,
                          const std::optional<std::string>& error) {
    auto result = metrics_.record(Metric{
        .operation = operation,
        .duration_ms = duration_ms,
        .record_count = record_count,
        .timestamp = clock_->now(),
        .success = success,
        .error = error
    });
    if (result.is_err()) {
        qCWarning(almanacStoreLog) << "Store: failed to record metric" << to_qstring(operation)
                                   << ":" << to_qstring(result.unwrap_err().message);
    }
}

// ============================================================================
// Events
// ============================================================================

Result<Event, Error> Store::stage_event_create(Event event, const WriteOptions& options) {
    auto valid = validate(event);
    if (valid.is_err()) {
        return Result<Event, Error>::err(valid.unwrap_err());
    }
    auto metadata = normalize_metadata(event.metadata_json);
    if (metadata.is_err()) {
        return Result<Event, Error>::err(metadata.unwrap_err());
    }

    const auto now = clock_->now();
    event.id = 0;
    event.metadata_json = std::move(metadata).unwrap();
    event.created_at = now;
    event.updated_at = now;
    event.last_modified = now;
    event.sync_status = SyncStatus::Local;
    event.is_deleted = false;

    auto inserted = events_.insert(event);
    if (inserted.is_err()) {
        return Result<Event, Error>::err(inserted.unwrap_err());
    }
    event.id = inserted.unwrap();

    if (!options.skip_sync) {
        auto queued = enqueue(event.owner_id, OutboxOperation::Create, EntityKind::Event,
                              event.id, to_json(event));
        if (queued.is_err()) {
            return Result<Event, Error>::err(queued.unwrap_err());
        }
    }

    auto invalidated = invalidate(event.owner_id, EntityKind::Event);
    if (invalidated.is_err()) {
        return Result<Event, Error>::err(invalidated.unwrap_err());
    }
    return Result<Event, Error>::ok(std::move(event));
}

Result<Event, Error> Store::stage_event_update(RecordId id, const EventPatch& patch,
                                               const UpdateOptions& options) {
    using R = Result<Event, Error>;

    auto existing = events_.get(id);
    if (existing.is_err()) {
        return R::err(existing.unwrap_err());
    }
    auto current = std::move(existing).unwrap();
    if (!current || current->is_deleted) {
        return R::err(Error{ErrorKind::NotFound, "event " + std::to_string(id) + " not found"});
    }

    auto updated = apply_patch(*current, patch);
    auto valid = validate(updated);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }
    auto metadata = normalize_metadata(updated.metadata_json);
    if (metadata.is_err()) {
        return R::err(metadata.unwrap_err());
    }
    updated.metadata_json = std::move(metadata).unwrap();

    const auto stamp = next_update_stamp(current->updated_at);
    updated.updated_at = stamp;
    updated.last_modified = stamp;
    if (!options.preserve_synced) {
        updated.sync_status = SyncStatus::Pending;
    }

    auto written = events_.update(updated);
    if (written.is_err()) {
        return R::err(written.unwrap_err());
    }

    if (!options.skip_sync && !options.preserve_synced) {
        auto queued = enqueue(updated.owner_id, OutboxOperation::Update, EntityKind::Event,
                              updated.id, to_json(updated));
        if (queued.is_err()) {
            return R::err(queued.unwrap_err());
        }
    }

    auto invalidated = invalidate(updated.owner_id, EntityKind::Event);
    if (invalidated.is_err()) {
        return R::err(invalidated.unwrap_err());
    }
    return R::ok(std::move(updated));
}

Result<void, Error> Store::stage_event_delete(RecordId id, const DeleteOptions& options) {
    auto existing = events_.get(id);
    if (existing.is_err()) {
        return Result<void, Error>::err(existing.unwrap_err());
    }
    auto current = std::move(existing).unwrap();
    if (!current || (current->is_deleted && !options.hard)) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "event " + std::to_string(id) + " not found"});
    }

    if (options.hard) {
        auto removed = events_.remove(id);
        if (removed.is_err()) {
            return removed;
        }
    } else {
        auto deleted = *current;
        deleted.is_deleted = true;
        deleted.sync_status = SyncStatus::Pending;
        deleted.updated_at = next_update_stamp(current->updated_at);
        deleted.last_modified = deleted.updated_at;
        auto written = events_.update(deleted);
        if (written.is_err()) {
            return written;
        }
    }

    if (!options.skip_sync) {
        auto queued = enqueue(current->owner_id, OutboxOperation::Delete, EntityKind::Event, id,
                              delete_payload(id, current->remote_id, options.hard));
        if (queued.is_err()) {
            return queued;
        }
    }

    return invalidate(current->owner_id, EntityKind::Event);
}

Result<Event, Error> Store::create_event(Event event, const WriteOptions& options) {
    Stopwatch watch;
    auto result = db_.transaction([&]() { return stage_event_create(std::move(event), options); });
    record_metric("event.create", watch.elapsed_ms(), result.is_ok(), 1,
                  result.is_err() ? std::optional<std::string>(result.unwrap_err().message)
                                  : std::nullopt);
    return result;
}

Result<std::optional<Event>, Error> Store::get_event(RecordId id) {
    return events_.get(id);
}

Result<std::vector<Event>, Error> Store::query_events(const std::string& owner_id, TimeRange range) {
    const std::string key = "events.range:" + std::to_string(range.start.millis()) + ":" +
                            std::to_string(range.end.millis());

    auto value = cache_.optimized_query(
        owner_id, key,
        [&]() -> Result<QJsonValue, Error> {
            auto rows = events_.in_range(owner_id, range);
            if (rows.is_err()) {
                return Result<QJsonValue, Error>::err(rows.unwrap_err());
            }
            return Result<QJsonValue, Error>::ok(events_to_array(rows.unwrap()));
        },
        cache::CacheOptions{
            .cache = true,
            .ttl = config_.cache_ttl,
            .tags = {cache::entity_tag(owner_id, EntityKind::Event), cache::owner_tag(owner_id)},
            .operation = "event.range"
        });
    if (value.is_err()) {
        return Result<std::vector<Event>, Error>::err(value.unwrap_err());
    }
    return events_from_value(value.unwrap());
}

Result<std::vector<Event>, Error> Store::events_for_owner(const std::string& owner_id,
                                                          bool include_deleted) {
    return events_.by_owner(owner_id, include_deleted);
}

Result<std::vector<Event>, Error> Store::events_by_category(const std::string& owner_id,
                                                            const std::string& category_id) {
    Stopwatch watch;
    auto rows = events_.by_category(owner_id, category_id);
    record_metric("event.by_category", watch.elapsed_ms(), rows.is_ok(),
                  rows.is_ok() ? std::optional<int64_t>(rows.unwrap().size()) : std::nullopt);
    return rows;
}

Result<std::vector<Event>, Error> Store::pending_sync_events(const std::string& owner_id) {
    return events_.pending_sync(owner_id);
}

Result<std::vector<Event>, Error> Store::search_events(const std::string& owner_id,
                                                       const std::string& term, int limit) {
    return events_.search(owner_id, term, limit);
}

Result<std::vector<Event>, Error> Store::recurring_events(const std::string& owner_id) {
    return events_.recurring(owner_id);
}

Result<Event, Error> Store::update_event(RecordId id, const EventPatch& patch,
                                         const UpdateOptions& options) {
    Stopwatch watch;
    auto result = db_.transaction([&]() { return stage_event_update(id, patch, options); });
    record_metric("event.update", watch.elapsed_ms(), result.is_ok(), 1,
                  result.is_err() ? std::optional<std::string>(result.unwrap_err().message)
                                  : std::nullopt);
    return result;
}

Result<void, Error> Store::delete_event(RecordId id, const DeleteOptions& options) {
    return db_.transaction([&]() { return stage_event_delete(id, options); });
}

// ============================================================================
// Categories
// ============================================================================

Result<Category, Error> Store::stage_category_create(Category category, const WriteOptions& options) {
    auto valid = validate(category);
    if (valid.is_err()) {
        return Result<Category, Error>::err(valid.unwrap_err());
    }

    const auto now = clock_->now();
    category.id = 0;
    category.created_at = now;
    category.updated_at = now;
    category.sync_status = SyncStatus::Local;

    auto inserted = categories_.insert(category);
    if (inserted.is_err()) {
        return Result<Category, Error>::err(inserted.unwrap_err());
    }
    category.id = inserted.unwrap();

    if (!options.skip_sync) {
        auto queued = enqueue(category.owner_id, OutboxOperation::Create, EntityKind::Category,
                              category.id, to_json(category));
        if (queued.is_err()) {
            return Result<Category, Error>::err(queued.unwrap_err());
        }
    }

    auto invalidated = invalidate(category.owner_id, EntityKind::Category);
    if (invalidated.is_err()) {
        return Result<Category, Error>::err(invalidated.unwrap_err());
    }
    return Result<Category, Error>::ok(std::move(category));
}

Result<Category, Error> Store::create_category(Category category, const WriteOptions& options) {
    return db_.transaction([&]() { return stage_category_create(std::move(category), options); });
}

Result<std::optional<Category>, Error> Store::get_category(RecordId id) {
    return categories_.get(id);
}

Result<std::vector<Category>, Error> Store::categories(const std::string& owner_id) {
    auto value = cache_.optimized_query(
        owner_id, "categories",
        [&]() -> Result<QJsonValue, Error> {
            auto rows = categories_.by_owner(owner_id);
            if (rows.is_err()) {
                return Result<QJsonValue, Error>::err(rows.unwrap_err());
            }
            QJsonArray array;
            for (const auto& c : rows.unwrap()) array.append(to_json(c));
            return Result<QJsonValue, Error>::ok(array);
        },
        cache::CacheOptions{
            .cache = true,
            .ttl = config_.reference_cache_ttl,
            .tags = {cache::entity_tag(owner_id, EntityKind::Category), cache::owner_tag(owner_id)},
            .operation = "category.list"
        });
    if (value.is_err()) {
        return Result<std::vector<Category>, Error>::err(value.unwrap_err());
    }
    return categories_from_value(value.unwrap());
}

Result<Category, Error> Store::update_category(RecordId id, const CategoryPatch& patch,
                                               const UpdateOptions& options) {
    using R = Result<Category, Error>;

    return db_.transaction([&]() -> R {
        auto existing = categories_.get(id);
        if (existing.is_err()) {
            return R::err(existing.unwrap_err());
        }
        auto current = std::move(existing).unwrap();
        if (!current) {
            return R::err(Error{ErrorKind::NotFound, "category " + std::to_string(id) + " not found"});
        }

        auto updated = apply_patch(*current, patch);
        auto valid = validate(updated);
        if (valid.is_err()) {
            return R::err(valid.unwrap_err());
        }
        updated.updated_at = next_update_stamp(current->updated_at);
        if (!options.preserve_synced) {
            updated.sync_status = SyncStatus::Pending;
        }

        auto written = categories_.update(updated);
        if (written.is_err()) {
            return R::err(written.unwrap_err());
        }

        if (!options.skip_sync && !options.preserve_synced) {
            auto queued = enqueue(updated.owner_id, OutboxOperation::Update, EntityKind::Category,
                                  updated.id, to_json(updated));
            if (queued.is_err()) {
                return R::err(queued.unwrap_err());
            }
        }

        auto invalidated = invalidate(updated.owner_id, EntityKind::Category);
        if (invalidated.is_err()) {
            return R::err(invalidated.unwrap_err());
        }
        return R::ok(std::move(updated));
    });
}

Result<void, Error> Store::delete_category(RecordId id,
                                           const std::optional<std::string>& reassign_to,
                                           const DeleteOptions& options) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto existing = categories_.get(id);
        if (existing.is_err()) {
            return Result<void, Error>::err(existing.unwrap_err());
        }
        auto current = std::move(existing).unwrap();
        if (!current) {
            return Result<void, Error>::err(
                Error{ErrorKind::NotFound, "category " + std::to_string(id) + " not found"});
        }

        // Events may point at the category by local id or, once acknowledged,
        // by remote id.
        std::vector<std::string> refs{std::to_string(current->id)};
        if (current->remote_id) refs.push_back(*current->remote_id);

        EventPatch patch;
        patch.category_id = reassign_to;
        for (const auto& ref : refs) {
            auto linked = events_.by_category(current->owner_id, ref);
            if (linked.is_err()) {
                return Result<void, Error>::err(linked.unwrap_err());
            }
            for (const auto& event : linked.unwrap()) {
                auto moved = stage_event_update(event.id, patch,
                                                UpdateOptions{.skip_sync = options.skip_sync});
                if (moved.is_err()) {
                    return Result<void, Error>::err(moved.unwrap_err());
                }
            }
        }

        auto removed = categories_.remove(id);
        if (removed.is_err()) {
            return removed;
        }

        if (!options.skip_sync) {
            auto queued = enqueue(current->owner_id, OutboxOperation::Delete, EntityKind::Category,
                                  id, delete_payload(id, current->remote_id, true));
            if (queued.is_err()) {
                return queued;
            }
        }
        return invalidate(current->owner_id, EntityKind::Category);
    });
}

// ============================================================================
// Calendars
// ============================================================================

Result<Calendar, Error> Store::stage_calendar_create(Calendar calendar, const WriteOptions& options) {
    using R = Result<Calendar, Error>;

    auto valid = validate(calendar);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }

    const auto now = clock_->now();
    calendar.id = 0;
    calendar.created_at = now;
    calendar.updated_at = now;
    calendar.sync_status = SyncStatus::Local;

    auto inserted = calendars_.insert(calendar);
    if (inserted.is_err()) {
        return R::err(inserted.unwrap_err());
    }
    calendar.id = inserted.unwrap();

    if (calendar.is_default) {
        auto others = calendars_.other_defaults(calendar.owner_id, calendar.id);
        if (others.is_err()) {
            return R::err(others.unwrap_err());
        }
        for (RecordId other : others.unwrap()) {
            auto cleared = stage_calendar_update(other, CalendarPatch{.is_default = false},
                                                 UpdateOptions{.skip_sync = options.skip_sync});
            if (cleared.is_err()) {
                return R::err(cleared.unwrap_err());
            }
        }
    }

    if (!options.skip_sync) {
        auto queued = enqueue(calendar.owner_id, OutboxOperation::Create, EntityKind::Calendar,
                              calendar.id, to_json(calendar));
        if (queued.is_err()) {
            return R::err(queued.unwrap_err());
        }
    }

    auto invalidated = invalidate(calendar.owner_id, EntityKind::Calendar);
    if (invalidated.is_err()) {
        return R::err(invalidated.unwrap_err());
    }
    return R::ok(std::move(calendar));
}

Result<Calendar, Error> Store::stage_calendar_update(RecordId id, const CalendarPatch& patch,
                                                     const UpdateOptions& options) {
    using R = Result<Calendar, Error>;

    auto existing = calendars_.get(id);
    if (existing.is_err()) {
        return R::err(existing.unwrap_err());
    }
    auto current = std::move(existing).unwrap();
    if (!current) {
        return R::err(Error{ErrorKind::NotFound, "calendar " + std::to_string(id) + " not found"});
    }

    auto updated = apply_patch(*current, patch);
    auto valid = validate(updated);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }
    updated.updated_at = next_update_stamp(current->updated_at);
    if (!options.preserve_synced) {
        updated.sync_status = SyncStatus::Pending;
    }

    auto written = calendars_.update(updated);
    if (written.is_err()) {
        return R::err(written.unwrap_err());
    }

    if (updated.is_default && !current->is_default) {
        auto others = calendars_.other_defaults(updated.owner_id, updated.id);
        if (others.is_err()) {
            return R::err(others.unwrap_err());
        }
        for (RecordId other : others.unwrap()) {
            auto cleared = stage_calendar_update(other, CalendarPatch{.is_default = false}, options);
            if (cleared.is_err()) {
                return R::err(cleared.unwrap_err());
            }
        }
    }

    if (!options.skip_sync && !options.preserve_synced) {
        auto queued = enqueue(updated.owner_id, OutboxOperation::Update, EntityKind::Calendar,
                              updated.id, to_json(updated));
        if (queued.is_err()) {
            return R::err(queued.unwrap_err());
        }
    }

    auto invalidated = invalidate(updated.owner_id, EntityKind::Calendar);
    if (invalidated.is_err()) {
        return R::err(invalidated.unwrap_err());
    }
    return R::ok(std::move(updated));
}

Result<Calendar, Error> Store::create_calendar(Calendar calendar, const WriteOptions& options) {
    return db_.transaction([&]() { return stage_calendar_create(std::move(calendar), options); });
}

Result<std::optional<Calendar>, Error> Store::get_calendar(RecordId id) {
    return calendars_.get(id);
}

Result<std::vector<Calendar>, Error> Store::calendars(const std::string& owner_id) {
    return calendars_.by_owner(owner_id);
}

Result<std::optional<Calendar>, Error> Store::default_calendar(const std::string& owner_id) {
    return calendars_.default_for(owner_id);
}

Result<Calendar, Error> Store::update_calendar(RecordId id, const CalendarPatch& patch,
                                               const UpdateOptions& options) {
    return db_.transaction([&]() { return stage_calendar_update(id, patch, options); });
}

Result<void, Error> Store::delete_calendar(RecordId id, const DeleteOptions& options) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto existing = calendars_.get(id);
        if (existing.is_err()) {
            return Result<void, Error>::err(existing.unwrap_err());
        }
        auto current = std::move(existing).unwrap();
        if (!current) {
            return Result<void, Error>::err(
                Error{ErrorKind::NotFound, "calendar " + std::to_string(id) + " not found"});
        }

        auto removed = calendars_.remove(id);
        if (removed.is_err()) {
            return removed;
        }

        if (!options.skip_sync) {
            auto queued = enqueue(current->owner_id, OutboxOperation::Delete, EntityKind::Calendar,
                                  id, delete_payload(id, current->remote_id, true));
            if (queued.is_err()) {
                return queued;
            }
        }
        return invalidate(current->owner_id, EntityKind::Calendar);
    });
}

// ============================================================================
// Preferences
// ============================================================================

Result<Preferences, Error> Store::get_preferences(const std::string& owner_id) {
    auto stored = preferences_.get(owner_id);
    if (stored.is_err()) {
        return Result<Preferences, Error>::err(stored.unwrap_err());
    }
    auto prefs = std::move(stored).unwrap();
    return Result<Preferences, Error>::ok(prefs ? std::move(*prefs) : default_preferences(owner_id));
}

Result<Preferences, Error> Store::save_preferences(Preferences preferences,
                                                   const WriteOptions& options) {
    using R = Result<Preferences, Error>;

    auto valid = validate(preferences);
    if (valid.is_err()) {
        return R::err(valid.unwrap_err());
    }

    return db_.transaction([&]() -> R {
        auto saved = preferences_.save(preferences);
        if (saved.is_err()) {
            return R::err(saved.unwrap_err());
        }
        preferences.id = saved.unwrap();

        if (!options.skip_sync) {
            auto queued = enqueue(preferences.owner_id, OutboxOperation::Update,
                                  EntityKind::Preferences, preferences.id, to_json(preferences));
            if (queued.is_err()) {
                return R::err(queued.unwrap_err());
            }
        }

        auto invalidated = invalidate(preferences.owner_id, EntityKind::Preferences);
        if (invalidated.is_err()) {
            return R::err(invalidated.unwrap_err());
        }
        return R::ok(std::move(preferences));
    });
}

Result<Preferences, Error> Store::update_preferences(const std::string& owner_id,
                                                     const PreferencesPatch& patch,
                                                     const WriteOptions& options) {
    auto current = get_preferences(owner_id);
    if (current.is_err()) {
        return current;
    }
    return save_preferences(apply_patch(std::move(current).unwrap(), patch), options);
}

// ============================================================================
// Sync state
// ============================================================================

Result<void, Error> Store::mark_synced(EntityKind kind, RecordId id,
                                       const std::optional<std::string>& remote_id) {
    std::optional<std::string> owner;
    Result<void, Error> result = Result<void, Error>::ok();

    switch (kind) {
        case EntityKind::Event: {
            auto row = events_.get(id);
            if (row.is_ok() && row.unwrap()) owner = row.unwrap()->owner_id;
            result = events_.set_sync_state(id, SyncStatus::Synced, remote_id);
            break;
        }
        case EntityKind::Category: {
            auto row = categories_.get(id);
            if (row.is_ok() && row.unwrap()) owner = row.unwrap()->owner_id;
            result = categories_.set_sync_state(id, SyncStatus::Synced, remote_id);
            break;
        }
        case EntityKind::Calendar: {
            auto row = calendars_.get(id);
            if (row.is_ok() && row.unwrap()) owner = row.unwrap()->owner_id;
            result = calendars_.set_sync_state(id, SyncStatus::Synced, remote_id);
            break;
        }
        case EntityKind::Preferences:
            // Preferences carry no sync status; the outbox entry is all there is.
            return Result<void, Error>::ok();
    }

    if (result.is_err()) {
        return result;
    }
    if (owner) {
        return invalidate(*owner, kind);
    }
    return result;
}

Result<void, Error> Store::mark_conflict(RecordId event_id, const QJsonObject& remote) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto existing = events_.get(event_id);
        if (existing.is_err()) {
            return Result<void, Error>::err(existing.unwrap_err());
        }
        auto current = std::move(existing).unwrap();
        if (!current) {
            return Result<void, Error>::err(
                Error{ErrorKind::NotFound, "event " + std::to_string(event_id) + " not found"});
        }

        auto metadata = parse_json_object(current->metadata_json);
        QJsonObject meta = metadata.is_ok() ? metadata.unwrap() : QJsonObject{};
        meta.insert(QStringLiteral("conflictData"), remote);

        auto conflicted = *current;
        conflicted.metadata_json = to_compact_json(meta);
        conflicted.sync_status = SyncStatus::Conflict;
        conflicted.updated_at = next_update_stamp(current->updated_at);
        conflicted.last_modified = conflicted.updated_at;

        auto written = events_.update(conflicted);
        if (written.is_err()) {
            return written;
        }
        qCWarning(almanacSyncLog) << "Store: event" << event_id << "conflicts with its remote version";
        return invalidate(current->owner_id, EntityKind::Event);
    });
}

Result<int, Error> Store::reset_sync_state(const std::string& owner_id) {
    auto result = db_.transaction([&]() -> Result<int, Error> {
        auto events = events_.reset_sync_state(owner_id);
        if (events.is_err()) return events;
        auto categories = categories_.reset_sync_state(owner_id);
        if (categories.is_err()) return categories;
        auto calendars = calendars_.reset_sync_state(owner_id);
        if (calendars.is_err()) return calendars;

        auto cleared = outbox_.clear(owner_id);
        if (cleared.is_err()) {
            return cleared;
        }

        auto invalidated = cache_.invalidate_tags({cache::owner_tag(owner_id),
                                                   cache::entity_tag(owner_id, EntityKind::Event),
                                                   cache::entity_tag(owner_id, EntityKind::Category),
                                                   cache::entity_tag(owner_id, EntityKind::Calendar)});
        if (invalidated.is_err()) {
            return invalidated;
        }
        return Result<int, Error>::ok(events.unwrap() + categories.unwrap() + calendars.unwrap());
    });

    if (result.is_ok()) {
        qCInfo(almanacSyncLog) << "Store: reset sync state of" << result.unwrap()
                               << "records for owner" << to_qstring(owner_id);
    }
    return result;
}

Result<SyncSummary, Error> Store::sync_summary(const std::string& owner_id) {
    using R = Result<SyncSummary, Error>;

    auto by_status = events_.count_by_status(owner_id);
    if (by_status.is_err()) {
        return R::err(by_status.unwrap_err());
    }
    auto queue = outbox_.stats(owner_id);
    if (queue.is_err()) {
        return R::err(queue.unwrap_err());
    }
    auto prefs = preferences_.get(owner_id);
    if (prefs.is_err()) {
        return R::err(prefs.unwrap_err());
    }

    const auto& counts = by_status.unwrap();
    auto count_of = [&](SyncStatus s) {
        auto it = counts.find(s);
        return it == counts.end() ? 0 : it->second;
    };

    SyncSummary summary;
    summary.pending_sync = count_of(SyncStatus::Local) + count_of(SyncStatus::Pending);
    summary.conflicts = count_of(SyncStatus::Conflict);
    summary.queue_size = queue.unwrap().pending;
    if (prefs.unwrap()) summary.last_sync = prefs.unwrap()->last_sync_time;
    return R::ok(summary);
}

// ============================================================================
// Maintenance
// ============================================================================

Result<StoreStats, Error> Store::stats() {
    StoreStats s;
    struct Counter {
        const char* table;
        int64_t* target;
    };
    const Counter counters[] = {
        {"events", &s.events},
        {"categories", &s.categories},
        {"calendars", &s.calendars},
        {"preferences", &s.preferences},
        {"sync_queue", &s.outbox},
        {"cache_entries", &s.cache_entries},
        {"backups", &s.backups},
        {"metrics", &s.metrics},
    };
    for (const auto& counter : counters) {
        auto n = count_table(db_, counter.table);
        if (n.is_err()) {
            return Result<StoreStats, Error>::err(n.unwrap_err());
        }
        *counter.target = n.unwrap();
    }
    return Result<StoreStats, Error>::ok(s);
}

Result<void, Error> Store::clear_all_data() {
    auto result = db_.transaction([&]() -> Result<void, Error> {
        return db_.execute(R"SQL(
            DELETE FROM events;
            DELETE FROM categories;
            DELETE FROM calendars;
            DELETE FROM preferences;
            DELETE FROM sync_queue;
            DELETE FROM cache_entries;
            DELETE FROM backups;
            DELETE FROM metrics;
        )SQL");
    });
    if (result.is_err()) {
        return result;
    }

    auto cleared = cache_.clear();
    if (cleared.is_err()) {
        return Result<void, Error>::err(cleared.unwrap_err());
    }
    qCInfo(almanacStoreLog) << "Store: all data cleared";
    return Result<void, Error>::ok();
}

Result<std::string, Error> Store::export_csv(const std::string& owner_id) {
    auto rows = events_.by_owner(owner_id);
    if (rows.is_err()) {
        return Result<std::string, Error>::err(rows.unwrap_err());
    }

    std::ostringstream out;
    out << "Title,Description,Start Time,End Time,All Day,Location,Category\n";
    for (const auto& e : rows.unwrap()) {
        out << csv_field(e.title) << ','
            << csv_field(e.description.value_or("")) << ','
            << e.start_time.to_iso_string() << ','
            << (e.end_time ? e.end_time->to_iso_string() : std::string()) << ','
            << (e.all_day ? "Yes" : "No") << ','
            << csv_field(e.location.value_or("")) << ','
            << csv_field(e.category_id.value_or("")) << '\n';
    }
    return Result<std::string, Error>::ok(out.str());
}

} // namespace almanac::storage
