#include "bulk/bulk_engine.hpp"
#include "bulk/bulk_utils.hpp"
#include "core/logging.hpp"
#include "core/record_json.hpp"
#include <algorithm>
#include <numeric>
#include <set>
#include <tuple>
#include <utility>

namespace almanac::bulk {

using storage::DeleteOptions;
using storage::UpdateOptions;
using storage::WriteOptions;

namespace {

size_t identity(size_t position) {
    return position;
}

Result<void, Error> discard_value(Result<Event, Error> r) {
    if (r.is_err()) return Result<void, Error>::err(r.unwrap_err());
    return Result<void, Error>::ok();
}

} // namespace

size_t BulkEngine::resolve_batch_size(const BulkOptions& options, size_t fallback) const {
    return options.batch_size > 0 ? options.batch_size : std::max<size_t>(fallback, 1);
}

void BulkEngine::run_batches(size_t count, size_t batch_size, const BulkOptions& options,
                             const StageFn& stage, const std::function<size_t(size_t)>& index_of,
                             BulkResult& result) {
    auto& db = store_.database();
    const size_t batch_count = (count + batch_size - 1) / batch_size;

    for (size_t b = 0; b < batch_count; ++b) {
        if (options.on_batch) {
            options.on_batch(b, batch_count);
        }

        const size_t begin = b * batch_size;
        const size_t end = std::min(count, begin + batch_size);

        // Tentative until the batch commits.
        int staged = 0;
        std::vector<BulkError> item_errors;

        auto committed = db.transaction([&]() -> Result<void, Error> {
            for (size_t pos = begin; pos < end; ++pos) {
                auto item = db.transaction([&]() { return stage(pos); });
                if (item.is_err()) {
                    item_errors.push_back(BulkError{index_of(pos), item.unwrap_err().message});
                } else {
                    ++staged;
                }
            }
            return Result<void, Error>::ok();
        });

        if (committed.is_err()) {
            const auto& error = committed.unwrap_err();
            qCWarning(almanacBulkLog) << "Bulk: batch" << b + 1 << "of" << batch_count
                                      << "rolled back:" << to_qstring(error.message);
            for (size_t pos = begin; pos < end; ++pos) {
                ++result.failed;
                result.errors.push_back(BulkError{index_of(pos), "Transaction failed: " + error.message});
            }
            continue;
        }

        result.success += staged;
        result.failed += static_cast<int>(item_errors.size());
        for (auto& e : item_errors) {
            result.errors.push_back(std::move(e));
        }
    }
}

Result<std::vector<size_t>, Error> BulkEngine::deduplicate(const std::vector<Event>& events,
                                                           BulkResult& result) {
    using DedupKey = std::tuple<std::string, std::string, int64_t>;

    std::vector<size_t> positions(events.size());
    std::iota(positions.begin(), positions.end(), size_t{0});

    // Keys need no connection, so they are built off the calling thread.
    const std::function<std::vector<DedupKey>(const std::vector<size_t>&)> build_keys =
        [&events](const std::vector<size_t>& batch) {
            std::vector<DedupKey> keys;
            keys.reserve(batch.size());
            for (size_t i : batch) {
                const auto& e = events[i];
                keys.emplace_back(e.owner_id, e.title, e.start_time.millis());
            }
            return keys;
        };
    const auto key_batches = process_parallel_batches(
        chunk(positions, store_.config().batch_size), build_keys, store_.config().max_parallel_batches);

    std::vector<size_t> kept;
    std::set<DedupKey> seen;
    size_t i = 0;

    for (const auto& keys : key_batches) {
        for (const auto& key : keys) {
            const auto& e = events[i];
            const size_t position = i++;
            if (seen.count(key) > 0) {
                ++result.skipped;
                continue;
            }

            auto existing = store_.event_rows().find_equivalent(e.owner_id, e.title, e.start_time);
            if (existing.is_err()) {
                return Result<std::vector<size_t>, Error>::err(existing.unwrap_err());
            }
            seen.insert(key);
            if (existing.unwrap()) {
                ++result.skipped;
                continue;
            }
            kept.push_back(position);
        }
    }
    return Result<std::vector<size_t>, Error>::ok(std::move(kept));
}

std::vector<BulkEngine::MappedRecord> BulkEngine::map_records(const std::vector<QJsonObject>& records,
                                                              const FieldMapper& mapper) const {
    std::vector<size_t> positions(records.size());
    std::iota(positions.begin(), positions.end(), size_t{0});

    const std::function<std::vector<MappedRecord>(const std::vector<size_t>&)> map_batch =
        [&records, &mapper](const std::vector<size_t>& batch) {
            std::vector<MappedRecord> mapped;
            mapped.reserve(batch.size());
            for (size_t i : batch) {
                auto event = mapper.map(records[i]);
                if (event.is_err()) {
                    mapped.push_back(MappedRecord{i, std::nullopt, event.unwrap_err().message});
                } else {
                    mapped.push_back(MappedRecord{i, std::move(event).unwrap(), {}});
                }
            }
            return mapped;
        };

    std::vector<MappedRecord> all;
    all.reserve(records.size());
    for (auto& batch : process_parallel_batches(chunk(positions, store_.config().batch_size), map_batch,
                                                store_.config().max_parallel_batches)) {
        for (auto& m : batch) {
            all.push_back(std::move(m));
        }
    }
    return all;
}

Result<BatchSizeReport, Error> BulkEngine::calibrate_batch_size(const std::vector<Event>& sample,
                                                                const std::vector<size_t>& candidates,
                                                                int runs) {
    using R = Result<BatchSizeReport, Error>;

    if (sample.empty()) {
        return R::err(Error{ErrorKind::Validation, "calibration needs at least one sample event"});
    }

    Stopwatch watch;
    auto& db = store_.database();

    // Every trial ends in this error so that its writes roll back.
    const Error discard{ErrorKind::ItemFailure, "calibration trial discarded"};

    auto report = find_optimal_batch_size(
        [&](size_t size) -> Result<void, Error> {
            auto trial = db.transaction([&]() -> Result<void, Error> {
                for (size_t n = 0; n < size; ++n) {
                    auto staged = store_.stage_event_create(sample[n % sample.size()],
                                                            WriteOptions{.skip_sync = true});
                    if (staged.is_err()) {
                        return Result<void, Error>::err(staged.unwrap_err());
                    }
                }
                return Result<void, Error>::err(discard);
            });
            if (trial.is_ok()) {
                return Result<void, Error>::err(Error{"calibration trial was committed"});
            }
            if (trial.unwrap_err() == discard) {
                return Result<void, Error>::ok();
            }
            return trial;
        },
        candidates, runs);

    store_.record_metric("bulk.calibrate", watch.elapsed_ms(), report.is_ok(), std::nullopt,
                         report.is_err() ? std::optional<std::string>(report.unwrap_err().message)
                                         : std::nullopt);
    if (report.is_ok()) {
        qCInfo(almanacBulkLog) << "Bulk: calibrated batch size" << report.unwrap().best;
    }
    return report;
}

void BulkEngine::finish(const std::string& operation, const Stopwatch& watch, BulkResult& result) {
    result.duration_ms = watch.elapsed_ms();

    std::optional<std::string> error;
    if (result.failed > 0) {
        error = std::to_string(result.failed) + " items failed";
    }
    store_.record_metric(operation, result.duration_ms, result.failed == 0, result.success, error);

    qCInfo(almanacBulkLog).nospace()
        << "Bulk: " << to_qstring(operation) << " success=" << result.success
        << " failed=" << result.failed << " skipped=" << result.skipped
        << " in " << result.duration_ms << "ms";
}

// ============================================================================
// Events
// ============================================================================

BulkResult BulkEngine::bulk_create(const std::vector<Event>& events, const BulkCreateOptions& options) {
    Stopwatch watch;
    BulkResult result;

    std::vector<size_t> positions(events.size());
    std::iota(positions.begin(), positions.end(), size_t{0});

    if (options.validate_duplicates) {
        auto kept = deduplicate(events, result);
        if (kept.is_err()) {
            // Without the duplicate check nothing may be written.
            result.failed = static_cast<int>(events.size());
            for (size_t i = 0; i < events.size(); ++i) {
                result.errors.push_back(BulkError{i, kept.unwrap_err().message});
            }
            finish("bulk.events.create", watch, result);
            return result;
        }
        positions = std::move(kept).unwrap();
    }

    run_batches(positions.size(),
                resolve_batch_size(options.batching, store_.config().batch_size),
                options.batching,
                [&](size_t pos) {
                    return discard_value(store_.stage_event_create(events[positions[pos]], WriteOptions{}));
                },
                [&](size_t pos) { return positions[pos]; },
                result);

    finish("bulk.events.create", watch, result);
    return result;
}

BulkResult BulkEngine::bulk_update(const std::vector<EventUpdate>& updates,
                                   const BulkUpdateOptions& options) {
    Stopwatch watch;
    BulkResult result;

    const UpdateOptions update_options{
        .skip_sync = options.skip_sync,
        .preserve_synced = options.skip_sync
    };

    run_batches(updates.size(),
                resolve_batch_size(options.batching, store_.config().batch_size),
                options.batching,
                [&](size_t pos) {
                    const auto& u = updates[pos];
                    return discard_value(store_.stage_event_update(u.id, u.changes, update_options));
                },
                identity, result);

    finish("bulk.events.update", watch, result);
    return result;
}

BulkResult BulkEngine::bulk_delete(const std::vector<RecordId>& ids, const BulkDeleteOptions& options) {
    Stopwatch watch;
    BulkResult result;

    const DeleteOptions delete_options{.hard = options.hard_delete};

    run_batches(ids.size(),
                resolve_batch_size(options.batching, store_.config().batch_size),
                options.batching,
                [&](size_t pos) { return store_.stage_event_delete(ids[pos], delete_options); },
                identity, result);

    finish("bulk.events.delete", watch, result);
    return result;
}

BulkResult BulkEngine::bulk_import(const std::vector<QJsonObject>& records,
                                   const std::string& owner_id,
                                   const BulkImportOptions& options) {
    Stopwatch watch;
    BulkResult result;

    const CanonicalFieldMapper canonical;
    const FieldMapper* mapper = options.mapper ? options.mapper : &canonical;

    // Mapped events paired with their input index.
    std::vector<Event> mapped;
    std::vector<size_t> source_index;
    for (auto& record : map_records(records, *mapper)) {
        if (!record.event) {
            ++result.failed;
            result.errors.push_back(BulkError{record.index, std::move(record.error)});
            continue;
        }
        record.event->owner_id = owner_id;
        mapped.push_back(std::move(*record.event));
        source_index.push_back(record.index);
    }

    std::vector<size_t> positions(mapped.size());
    std::iota(positions.begin(), positions.end(), size_t{0});

    if (options.deduplicate) {
        auto kept = deduplicate(mapped, result);
        if (kept.is_err()) {
            for (size_t i : source_index) {
                ++result.failed;
                result.errors.push_back(BulkError{i, kept.unwrap_err().message});
            }
            finish("bulk.events.import", watch, result);
            return result;
        }
        positions = std::move(kept).unwrap();
    }

    run_batches(positions.size(),
                resolve_batch_size(options.batching, store_.config().batch_size),
                options.batching,
                [&](size_t pos) {
                    return discard_value(store_.stage_event_create(mapped[positions[pos]], WriteOptions{}));
                },
                [&](size_t pos) { return source_index[positions[pos]]; },
                result);

    finish("bulk.events.import", watch, result);
    return result;
}

// ============================================================================
// Categories and calendars
// ============================================================================

BulkResult BulkEngine::bulk_create_categories(const std::vector<Category>& categories,
                                              const BulkOptions& options) {
    Stopwatch watch;
    BulkResult result;

    run_batches(categories.size(),
                resolve_batch_size(options, store_.config().category_batch_size),
                options,
                [&](size_t pos) -> Result<void, Error> {
                    auto created = store_.stage_category_create(categories[pos], WriteOptions{});
                    if (created.is_err()) return Result<void, Error>::err(created.unwrap_err());
                    return Result<void, Error>::ok();
                },
                identity, result);

    finish("bulk.categories.create", watch, result);
    return result;
}

BulkResult BulkEngine::bulk_update_event_categories(const std::vector<RecordId>& event_ids,
                                                    const std::optional<std::string>& category_id,
                                                    const BulkOptions& options) {
    Stopwatch watch;
    BulkResult result;

    EventPatch patch;
    patch.category_id = category_id;

    run_batches(event_ids.size(),
                resolve_batch_size(options, store_.config().batch_size),
                options,
                [&](size_t pos) {
                    return discard_value(store_.stage_event_update(event_ids[pos], patch, UpdateOptions{}));
                },
                identity, result);

    finish("bulk.events.categorize", watch, result);
    return result;
}

BulkResult BulkEngine::bulk_assign_to_calendar(const std::vector<RecordId>& event_ids,
                                               RecordId calendar_id,
                                               const BulkOptions& options) {
    Stopwatch watch;
    BulkResult result;

    auto calendar = store_.get_calendar(calendar_id);
    if (calendar.is_err() || !calendar.unwrap()) {
        const std::string message = calendar.is_err()
            ? calendar.unwrap_err().message
            : "calendar " + std::to_string(calendar_id) + " not found";
        for (size_t i = 0; i < event_ids.size(); ++i) {
            ++result.failed;
            result.errors.push_back(BulkError{i, message});
        }
        finish("bulk.events.assign_calendar", watch, result);
        return result;
    }
    const auto calendar_ref = calendar.unwrap()->remote_id.value_or(std::to_string(calendar_id));

    run_batches(event_ids.size(),
                resolve_batch_size(options, store_.config().batch_size),
                options,
                [&](size_t pos) -> Result<void, Error> {
                    auto existing = store_.get_event(event_ids[pos]);
                    if (existing.is_err()) {
                        return Result<void, Error>::err(existing.unwrap_err());
                    }
                    const auto& event = existing.unwrap();
                    if (!event) {
                        return Result<void, Error>::err(Error{
                            ErrorKind::NotFound, "event " + std::to_string(event_ids[pos]) + " not found"});
                    }

                    auto metadata = parse_json_object(event->metadata_json);
                    QJsonObject meta = metadata.is_ok() ? metadata.unwrap() : QJsonObject{};
                    meta.insert(QStringLiteral("calendarId"), QString::fromStdString(calendar_ref));

                    EventPatch patch;
                    patch.metadata_json = to_compact_json(meta);
                    return discard_value(store_.stage_event_update(event->id, patch, UpdateOptions{}));
                },
                identity, result);

    finish("bulk.events.assign_calendar", watch, result);
    return result;
}

BulkResult BulkEngine::bulk_share_calendars(const std::vector<RecordId>& calendar_ids,
                                            const BulkOptions& options) {
    Stopwatch watch;
    BulkResult result;

    run_batches(calendar_ids.size(),
                resolve_batch_size(options, store_.config().share_batch_size),
                options,
                [&](size_t pos) -> Result<void, Error> {
                    auto shared = store_.stage_calendar_update(
                        calendar_ids[pos], CalendarPatch{.is_shared = true}, UpdateOptions{});
                    if (shared.is_err()) return Result<void, Error>::err(shared.unwrap_err());
                    return Result<void, Error>::ok();
                },
                identity, result);

    finish("bulk.calendars.share", watch, result);
    return result;
}

} // namespace almanac::bulk
