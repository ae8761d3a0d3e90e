#pragma once

#include "storage/store.hpp"
#include <QObject>
#include <chrono>
#include <memory>
#include <vector>

class QTimer;

namespace almanac::sync {

/**
 * What one sweep removed.
 */
struct SweepReport {
    std::vector<OutboxEntry> reaped_outbox;
    int purged_events{0};
    int expired_cache_entries{0};
    int purged_metrics{0};
    Timestamp swept_at;

    [[nodiscard]] int total() const {
        return static_cast<int>(reaped_outbox.size()) + purged_events +
               expired_cache_entries + purged_metrics;
    }
};

/**
 * RetentionSweeper - compaction pass over the store.
 *
 * Reaps exhausted outbox entries, hard-deletes soft-deleted events whose
 * last update is older than the soft-delete retention, drops expired cache
 * entries and metrics older than the metrics retention.
 */
class RetentionSweeper {
public:
    explicit RetentionSweeper(storage::Store& store) : store_(store) {}

    [[nodiscard]] Result<SweepReport, Error> sweep();

private:
    storage::Store& store_;
};

/**
 * Runs a RetentionSweeper on a Qt timer.
 */
class RetentionScheduler : public QObject {
    Q_OBJECT

public:
    explicit RetentionScheduler(storage::Store& store,
                                std::chrono::milliseconds interval = std::chrono::hours(1),
                                QObject* parent = nullptr);
    ~RetentionScheduler() override;

    void start();
    void stop();
    [[nodiscard]] bool isActive() const;

    /**
     * Sweep now, outside the timer.
     */
    Result<SweepReport, Error> runNow();

signals:
    void swept(int removed);
    void sweepFailed(const QString& message);

private:
    void onTick();

    RetentionSweeper sweeper_;
    std::unique_ptr<QTimer> timer_;
};

} // namespace almanac::sync
