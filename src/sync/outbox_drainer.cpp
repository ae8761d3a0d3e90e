#include "sync/outbox_drainer.hpp"
#include "core/logging.hpp"

namespace almanac::sync {

OutboxDrainer::OutboxDrainer(storage::Store& store, RemoteLink& link,
                             ConnectivityMonitor& connectivity, QObject* parent)
    : QObject(parent)
    , store_(store)
    , link_(link)
    , connectivity_(connectivity) {
    connect(&connectivity_, &ConnectivityMonitor::onlineChanged,
            this, &OutboxDrainer::onOnlineChanged);
}

void OutboxDrainer::onOnlineChanged(bool online) {
    if (!online || !auto_drain_) {
        return;
    }
    auto result = drainOnce();
    qCInfo(almanacSyncLog) << "OutboxDrainer: back online, delivered" << result.synced
                           << "failed" << result.failed;
}

Result<void, Error> OutboxDrainer::acknowledge(const OutboxEntry& entry,
                                               const std::optional<std::string>& remote_id) {
    auto& outbox = store_.outbox();
    return store_.database().transaction([&]() -> Result<void, Error> {
        auto removed = outbox.remove(entry.id);
        if (removed.is_err()) {
            return removed;
        }

        auto remaining = outbox.has_entries_for(entry.entity, entry.entity_id);
        if (remaining.is_err()) {
            return Result<void, Error>::err(remaining.unwrap_err());
        }
        if (remaining.unwrap()) {
            // A later mutation is still queued; the record stays pending.
            return Result<void, Error>::ok();
        }

        auto marked = store_.mark_synced(entry.entity, entry.entity_id, remote_id);
        if (marked.is_err() && marked.unwrap_err().kind == ErrorKind::NotFound &&
            entry.operation == OutboxOperation::Delete) {
            // Hard-deleted rows have nothing left to acknowledge.
            return Result<void, Error>::ok();
        }
        return marked;
    });
}

DrainResult OutboxDrainer::drainOnce(int limit) {
    DrainResult result;

    if (!connectivity_.isOnline()) {
        result.offline = true;
        return result;
    }
    if (in_progress_) {
        result.errors.push_back("drain already in progress");
        return result;
    }
    in_progress_ = true;

    Stopwatch watch;
    auto entries = store_.outbox().drain(limit);
    if (entries.is_err()) {
        in_progress_ = false;
        result.errors.push_back(entries.unwrap_err().message);
        store_.record_metric("sync.drain", watch.elapsed_ms(), false, 0, entries.unwrap_err().message);
        return result;
    }

    const auto& pending = entries.unwrap();
    for (size_t i = 0; i < pending.size(); ++i) {
        const auto& entry = pending[i];

        if (!connectivity_.isOnline()) {
            result.skipped = static_cast<int>(pending.size() - i);
            qCInfo(almanacSyncLog) << "OutboxDrainer: went offline," << result.skipped
                                   << "entries left queued";
            break;
        }

        auto delivered = link_.apply(entry);
        if (delivered.is_ok()) {
            auto acked = acknowledge(entry, delivered.unwrap());
            if (acked.is_ok()) {
                ++result.synced;
                continue;
            }
            // Delivered but not recorded: the entry stays and is redelivered.
            ++result.failed;
            result.errors.push_back("entry " + std::to_string(entry.id) + ": " +
                                    acked.unwrap_err().message);
            qCWarning(almanacSyncLog) << "OutboxDrainer: could not acknowledge entry" << entry.id
                                      << ":" << to_qstring(acked.unwrap_err().message);
            continue;
        }

        const auto& error = delivered.unwrap_err();
        ++result.failed;
        result.errors.push_back("entry " + std::to_string(entry.id) + ": " + error.message);
        auto marked = store_.outbox().mark_attempted(entry.id, error.message);
        if (marked.is_err()) {
            qCWarning(almanacSyncLog) << "OutboxDrainer: could not record attempt for entry"
                                      << entry.id << ":" << to_qstring(marked.unwrap_err().message);
        }
    }

    in_progress_ = false;

    std::optional<std::string> summary;
    if (result.failed > 0) summary = std::to_string(result.failed) + " deliveries failed";
    store_.record_metric("sync.drain", watch.elapsed_ms(), result.failed == 0,
                         result.synced, summary);

    emit drained(result.synced, result.failed);
    return result;
}

} // namespace almanac::sync
