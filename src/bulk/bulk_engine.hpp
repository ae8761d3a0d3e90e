#pragma once

#include "bulk/bulk_utils.hpp"
#include "bulk/field_mapper.hpp"
#include "storage/store.hpp"
#include <QJsonObject>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace almanac::bulk {

struct BulkError {
    size_t index{0};  // position in the caller's input
    std::string error;
};

/**
 * Outcome of a bulk operation. Partial failure is reported here, never as
 * an Err.
 */
struct BulkResult {
    int success{0};
    int failed{0};
    int skipped{0};  // duplicates left out
    std::vector<BulkError> errors;
    double duration_ms{0.0};
};

struct BulkOptions {
    size_t batch_size{0};  // 0: the store's configured default
    // Called before each batch starts: (batch index, batch count).
    std::function<void(size_t, size_t)> on_batch;
};

struct BulkCreateOptions {
    BulkOptions batching;
    bool validate_duplicates{false};  // skip events matching an existing title + start
};

struct BulkUpdateOptions {
    BulkOptions batching;
    bool skip_sync{false};  // keep sync status, no outbox entries
};

struct BulkDeleteOptions {
    BulkOptions batching;
    bool hard_delete{false};
};

struct BulkImportOptions {
    BulkOptions batching;
    bool deduplicate{true};
    const FieldMapper* mapper{nullptr};  // null: records are already canonical
};

struct EventUpdate {
    RecordId id{0};
    EventPatch changes;
};

/**
 * BulkEngine - batched writes through a Store.
 *
 * Each batch is one transaction; each item inside it runs in its own
 * savepoint, so a failing item rolls back alone while the rest of the batch
 * commits. If the batch transaction itself fails, none of its items are
 * kept and every one of them is reported failed.
 */
class BulkEngine {
public:
    explicit BulkEngine(storage::Store& store) : store_(store) {}

    BulkResult bulk_create(const std::vector<Event>& events, const BulkCreateOptions& options = {});
    BulkResult bulk_update(const std::vector<EventUpdate>& updates, const BulkUpdateOptions& options = {});
    BulkResult bulk_delete(const std::vector<RecordId>& ids, const BulkDeleteOptions& options = {});

    /**
     * Map foreign records to events of `owner_id` and create them. Records
     * that fail to map are reported failed under their input index.
     */
    BulkResult bulk_import(const std::vector<QJsonObject>& records, const std::string& owner_id,
                           const BulkImportOptions& options = {});

    BulkResult bulk_create_categories(const std::vector<Category>& categories,
                                      const BulkOptions& options = {});

    /**
     * Point every event at `category_id` (nullopt clears the category).
     */
    BulkResult bulk_update_event_categories(const std::vector<RecordId>& event_ids,
                                            const std::optional<std::string>& category_id,
                                            const BulkOptions& options = {});

    /**
     * Record the calendar in each event's metadata (calendarId).
     */
    BulkResult bulk_assign_to_calendar(const std::vector<RecordId>& event_ids, RecordId calendar_id,
                                       const BulkOptions& options = {});

    BulkResult bulk_share_calendars(const std::vector<RecordId>& calendar_ids,
                                    const BulkOptions& options = {});

    /**
     * Time event creation at each candidate batch size using `sample`
     * (repeated as needed) and report the fastest per item. Every trial
     * runs in a transaction that is rolled back, so nothing is stored and
     * nothing is queued. Pass `best` back in BulkOptions::batch_size.
     */
    [[nodiscard]] Result<BatchSizeReport, Error> calibrate_batch_size(
        const std::vector<Event>& sample,
        const std::vector<size_t>& candidates = {50, 100, 200, 500},
        int runs = 3);

private:
    struct MappedRecord {
        size_t index{0};
        std::optional<Event> event;
        std::string error;
    };

    /**
     * Map every record, up to max_parallel_batches chunks at a time.
     * Results keep input order.
     */
    std::vector<MappedRecord> map_records(const std::vector<QJsonObject>& records,
                                          const FieldMapper& mapper) const;

    using StageFn = std::function<Result<void, Error>(size_t position)>;

    /**
     * Stage `count` items in batches. `index_of` maps a position to the
     * caller's input index for error reporting.
     */
    void run_batches(size_t count, size_t batch_size, const BulkOptions& options,
                     const StageFn& stage, const std::function<size_t(size_t)>& index_of,
                     BulkResult& result);

    size_t resolve_batch_size(const BulkOptions& options, size_t fallback) const;

    /**
     * Drop events that match a live stored event or an earlier event of the
     * same input on title + start. Returns the positions kept.
     */
    Result<std::vector<size_t>, Error> deduplicate(const std::vector<Event>& events,
                                                   BulkResult& result);

    void finish(const std::string& operation, const Stopwatch& watch, BulkResult& result);

    storage::Store& store_;
};

} // namespace almanac::bulk
