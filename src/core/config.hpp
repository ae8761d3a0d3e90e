#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace almanac {

/**
 * What restore does when the recomputed checksum differs from the stored one.
 *
 * Warn only gets as far as applying records when the body still decodes.
 * A corrupted compressed payload usually fails to decompress, and that
 * restore fails with the checksum warning and a decompression error while
 * nothing is written.
 */
enum class IntegrityPolicy {
    Warn,    // log, report a warning, restore anyway
    Refuse   // report an error, touch nothing
};

[[nodiscard]] std::optional<IntegrityPolicy> parse_integrity_policy(std::string_view s);

/**
 * Every tunable of a Store. Defaults match the documented behavior; tests
 * shrink them or swap in a ManualClock.
 */
struct StoreConfig {
    std::string db_path{":memory:"};
    std::shared_ptr<Clock> clock;  // null means SystemClock

    // Bulk engine
    size_t batch_size{100};
    size_t category_batch_size{50};
    size_t share_batch_size{20};
    size_t max_parallel_batches{3};

    // Query cache
    std::chrono::milliseconds cache_ttl{5'000};
    std::chrono::milliseconds reference_cache_ttl{300'000};

    // Outbox
    std::chrono::milliseconds outbox_reap_age{std::chrono::hours(24 * 7)};
    int outbox_max_attempts{3};
    int outbox_pending_limit{50};

    // Retention
    std::chrono::milliseconds soft_delete_retention{std::chrono::hours(24 * 30)};
    std::chrono::milliseconds metrics_retention{std::chrono::hours(24 * 7)};

    // Backups
    size_t compression_threshold{100 * 1024};
    int max_backups{10};
    IntegrityPolicy integrity_policy{IntegrityPolicy::Warn};
    std::chrono::milliseconds auto_backup_interval{std::chrono::hours(24)};

    // Index advisor
    double slow_query_ms{100.0};
    double flag_average_ms{200.0};

    /**
     * `base` with ALMANAC_* environment variables applied on top. Values
     * that do not parse are ignored with a warning.
     */
    [[nodiscard]] static StoreConfig from_environment(StoreConfig base);
    [[nodiscard]] static StoreConfig from_environment() { return from_environment(StoreConfig{}); }
};

} // namespace almanac
