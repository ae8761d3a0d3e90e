#include "cache/performance_tuner.hpp"
#include "sync/retention.hpp"
#include "core/logging.hpp"
#include <sstream>

namespace almanac::cache {

namespace {

constexpr auto DAY = std::chrono::hours(24);

} // namespace

Result<MemoryUsage, Error> PerformanceTuner::check_memory_usage() {
    auto stats = store_.stats();
    if (stats.is_err()) {
        return Result<MemoryUsage, Error>::err(stats.unwrap_err());
    }
    const auto& s = stats.unwrap();

    MemoryUsage usage;
    usage.limit_bytes = memory_limit_bytes_;
    usage.memory_cache_entries = store_.cache().memory().size();
    usage.estimated_bytes = static_cast<size_t>(s.events) * 1024 +
                            static_cast<size_t>(s.categories + s.calendars) * 512 +
                            store_.cache().memory().estimated_bytes();
    usage.percentage = memory_limit_bytes_ == 0
        ? 0.0
        : 100.0 * static_cast<double>(usage.estimated_bytes) / static_cast<double>(memory_limit_bytes_);
    return Result<MemoryUsage, Error>::ok(usage);
}

Result<int, Error> PerformanceTuner::free_memory() {
    const auto now = store_.clock().now();

    auto cache = store_.cache().remove_created_before(now - std::chrono::hours(1));
    if (cache.is_err()) {
        return cache;
    }
    auto metrics = store_.metrics().clear_older_than(now - DAY);
    if (metrics.is_err()) {
        return metrics;
    }

    const int freed = cache.unwrap() + metrics.unwrap();
    qCInfo(almanacCacheLog) << "PerformanceTuner: freed" << cache.unwrap() << "cache entries and"
                            << metrics.unwrap() << "metrics";
    return Result<int, Error>::ok(freed);
}

Result<TuneReport, Error> PerformanceTuner::auto_tune() {
    using R = Result<TuneReport, Error>;

    Stopwatch watch;
    TuneReport report;

    auto usage = check_memory_usage();
    if (usage.is_err()) {
        return R::err(usage.unwrap_err());
    }
    if (usage.unwrap().is_high()) {
        auto freed = free_memory();
        if (freed.is_err()) {
            return R::err(freed.unwrap_err());
        }
        report.actions.push_back("Freed " + std::to_string(freed.unwrap()) + " cache entries and metrics");
    }

    const auto& config = store_.config();
    IndexAdvisor advisor(store_.database(), store_.metrics(), config.slow_query_ms, config.flag_average_ms);
    auto analysis = advisor.analyze();
    if (analysis.is_err()) {
        return R::err(analysis.unwrap_err());
    }
    for (const auto& slow : analysis.unwrap().slow_operations) {
        std::ostringstream note;
        note << "Slow operation " << slow.operation << " (avg " << slow.average_ms << "ms)";
        report.actions.push_back(note.str());
    }
    for (const auto& suggestion : analysis.unwrap().suggestions) {
        report.actions.push_back("Suggested index: " + suggestion.create_sql);
    }

    auto range_average = store_.metrics().average_duration("event.range");
    if (range_average.is_err()) {
        return R::err(range_average.unwrap_err());
    }
    if (range_average.unwrap() > config.slow_query_ms) {
        std::ostringstream note;
        note << "Range queries average " << range_average.unwrap()
             << "ms; consider a longer cache TTL";
        report.actions.push_back(note.str());
    }

    sync::RetentionSweeper sweeper(store_);
    auto swept = sweeper.sweep();
    if (swept.is_err()) {
        return R::err(swept.unwrap_err());
    }
    if (swept.unwrap().total() > 0) {
        report.actions.push_back("Cleared " + std::to_string(swept.unwrap().total()) + " old records");
    }

    report.applied = !report.actions.empty();
    store_.record_metric("database.optimize", watch.elapsed_ms(), true);
    return R::ok(std::move(report));
}

Result<int, Error> PerformanceTuner::prewarm(const std::string& owner_id) {
    const auto now = store_.clock().now();

    auto upcoming = store_.query_events(owner_id, TimeRange{now, now + DAY * 30});
    if (upcoming.is_err()) {
        return Result<int, Error>::err(upcoming.unwrap_err());
    }
    auto recent = store_.query_events(owner_id, TimeRange{now - DAY * 7, now});
    if (recent.is_err()) {
        return Result<int, Error>::err(recent.unwrap_err());
    }
    auto categories = store_.categories(owner_id);
    if (categories.is_err()) {
        return Result<int, Error>::err(categories.unwrap_err());
    }

    const auto loaded = upcoming.unwrap().size() + recent.unwrap().size() + categories.unwrap().size();
    qCInfo(almanacCacheLog) << "PerformanceTuner: prewarmed" << loaded << "records for"
                            << to_qstring(owner_id);
    return Result<int, Error>::ok(static_cast<int>(loaded));
}

} // namespace almanac::cache
