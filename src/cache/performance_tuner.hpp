#pragma once

#include "cache/index_advisor.hpp"
#include "storage/store.hpp"
#include <string>
#include <vector>

namespace almanac::cache {

struct MemoryUsage {
    size_t estimated_bytes{0};
    size_t limit_bytes{0};
    size_t memory_cache_entries{0};
    double percentage{0.0};

    [[nodiscard]] bool is_high() const { return percentage > 80.0; }
};

struct TuneReport {
    std::vector<std::string> actions;
    bool applied{false};
};

/**
 * PerformanceTuner - housekeeping driven by memory estimates and metrics.
 */
class PerformanceTuner {
public:
    explicit PerformanceTuner(storage::Store& store, size_t memory_limit_bytes = 50 * 1024 * 1024)
        : store_(store), memory_limit_bytes_(memory_limit_bytes) {}

    /**
     * Rough footprint: 1 KiB per event, 512 B per category or calendar,
     * plus the in-process cache.
     */
    [[nodiscard]] Result<MemoryUsage, Error> check_memory_usage();

    /**
     * Drop cache entries older than an hour and metrics older than a day.
     * Returns the number of entries removed.
     */
    [[nodiscard]] Result<int, Error> free_memory();

    /**
     * Free memory when usage is high, report slow operations, run the
     * retention sweep.
     */
    [[nodiscard]] Result<TuneReport, Error> auto_tune();

    /**
     * Fill the cache with the owner's upcoming (30 days) and recent (7 days)
     * events and categories. Returns the number of records loaded.
     */
    [[nodiscard]] Result<int, Error> prewarm(const std::string& owner_id);

private:
    storage::Store& store_;
    size_t memory_limit_bytes_;
};

} // namespace almanac::cache
