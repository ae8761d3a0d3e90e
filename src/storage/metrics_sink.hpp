#pragma once

#include "storage/database.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace almanac::storage {

/**
 * One timed operation. `operation` names a pattern ("bulk.events.create",
 * "event.range"), not a concrete query.
 */
struct Metric {
    int64_t id{0};
    std::string operation;
    double duration_ms{0.0};
    std::optional<int64_t> record_count;
    Timestamp timestamp;
    bool success{true};
    std::optional<std::string> error;
};

struct OperationSummary {
    int samples{0};
    double average_ms{0.0};
    double max_ms{0.0};
    int failures{0};
};

/**
 * Append-only log of operation timings in the metrics table.
 */
class MetricsSink {
public:
    explicit MetricsSink(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> record(const Metric& metric);

    /**
     * Newest first. An empty operation means every operation.
     */
    [[nodiscard]] Result<std::vector<Metric>, Error> recent(const std::string& operation = {},
                                                            int limit = 100);

    [[nodiscard]] Result<double, Error> average_duration(const std::string& operation);

    /**
     * Per-operation aggregates over the newest `sample_size` metrics.
     */
    [[nodiscard]] Result<std::map<std::string, OperationSummary>, Error> summarize(int sample_size = 1000);

    [[nodiscard]] Result<int, Error> clear_older_than(Timestamp cutoff);
    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;

    static Metric row_to_metric(Statement& stmt);
};

} // namespace almanac::storage
