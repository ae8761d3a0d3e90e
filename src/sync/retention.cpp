#include "sync/retention.hpp"
#include "core/logging.hpp"
#include <QTimer>

namespace almanac::sync {

Result<SweepReport, Error> RetentionSweeper::sweep() {
    using R = Result<SweepReport, Error>;

    const auto& config = store_.config();
    Stopwatch watch;
    SweepReport report;
    report.swept_at = store_.clock().now();

    auto reaped = store_.outbox().reap(ReapPolicy{
        .max_age = config.outbox_reap_age,
        .max_attempts = config.outbox_max_attempts
    });
    if (reaped.is_err()) {
        return R::err(reaped.unwrap_err());
    }
    report.reaped_outbox = std::move(reaped).unwrap();

    auto purged = store_.database().transaction([&]() {
        return store_.event_rows().purge_deleted_before(report.swept_at - config.soft_delete_retention);
    });
    if (purged.is_err()) {
        return R::err(purged.unwrap_err());
    }
    report.purged_events = purged.unwrap();

    auto expired = store_.cache().clean_expired();
    if (expired.is_err()) {
        return R::err(expired.unwrap_err());
    }
    report.expired_cache_entries = expired.unwrap();

    auto metrics = store_.metrics().clear_older_than(report.swept_at - config.metrics_retention);
    if (metrics.is_err()) {
        return R::err(metrics.unwrap_err());
    }
    report.purged_metrics = metrics.unwrap();

    if (report.purged_events > 0) {
        // Purged rows may sit in cached range results of any owner.
        auto cleared = store_.cache().clear("events.");
        if (cleared.is_err()) {
            return R::err(cleared.unwrap_err());
        }
    }

    qCInfo(almanacStoreLog).nospace()
        << "Retention: reaped " << report.reaped_outbox.size() << " outbox entries, purged "
        << report.purged_events << " events, " << report.expired_cache_entries
        << " cache entries, " << report.purged_metrics << " metrics";

    store_.record_metric("retention.sweep", watch.elapsed_ms(), true, report.total());
    return R::ok(std::move(report));
}

RetentionScheduler::RetentionScheduler(storage::Store& store,
                                       std::chrono::milliseconds interval,
                                       QObject* parent)
    : QObject(parent)
    , sweeper_(store)
    , timer_(std::make_unique<QTimer>(this))
{
    timer_->setInterval(interval);
    connect(timer_.get(), &QTimer::timeout, this, &RetentionScheduler::onTick);
}

RetentionScheduler::~RetentionScheduler() {
    stop();
}

void RetentionScheduler::start() {
    timer_->start();
}

void RetentionScheduler::stop() {
    timer_->stop();
}

bool RetentionScheduler::isActive() const {
    return timer_->isActive();
}

Result<SweepReport, Error> RetentionScheduler::runNow() {
    auto report = sweeper_.sweep();
    if (report.is_err()) {
        qCWarning(almanacStoreLog) << "Retention: sweep failed:"
                                   << to_qstring(report.unwrap_err().message);
        emit sweepFailed(QString::fromStdString(report.unwrap_err().message));
    } else {
        emit swept(report.unwrap().total());
    }
    return report;
}

void RetentionScheduler::onTick() {
    // Failures are logged and signalled by runNow.
    runNow();
}

} // namespace almanac::sync
