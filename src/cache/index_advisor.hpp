#pragma once

#include "storage/database.hpp"
#include "storage/metrics_sink.hpp"
#include <string>
#include <vector>

namespace almanac::cache {

/**
 * A query shape worth indexing once it runs more than `frequency_threshold`
 * times in the sampled metrics.
 */
struct QueryPattern {
    std::string operation;  // metric name, e.g. "event.range"
    std::string table;
    std::vector<std::string> columns;
    int frequency_threshold{0};
};

struct IndexSuggestion {
    std::string operation;
    std::string table;
    std::vector<std::string> columns;
    int frequency{0};
    std::string create_sql;
};

struct SlowOperation {
    std::string operation;
    double average_ms{0.0};  // over the slow samples only
    int slow_samples{0};
};

struct AdvisorReport {
    std::vector<SlowOperation> slow_operations;
    std::vector<IndexSuggestion> suggestions;
};

/**
 * IndexAdvisor - reads recorded metrics and the live schema and reports
 * indexes that would help. It never changes the schema.
 */
class IndexAdvisor {
public:
    IndexAdvisor(storage::Database& db, storage::MetricsSink& metrics,
                 double slow_query_ms = 100.0, double flag_average_ms = 200.0,
                 std::vector<QueryPattern> patterns = default_patterns());

    /**
     * event.range over (owner_id, start_time, end_time) past 50 runs and
     * event.by_category over (owner_id, category_id, start_time) past 30.
     */
    [[nodiscard]] static std::vector<QueryPattern> default_patterns();

    [[nodiscard]] Result<AdvisorReport, Error> analyze(int sample_size = 1000);

    /**
     * True if some index on the table starts with exactly the pattern's
     * columns.
     */
    [[nodiscard]] Result<bool, Error> is_covered(const QueryPattern& pattern);

    /**
     * Column lists of every index on `table`, in key order.
     */
    [[nodiscard]] Result<std::vector<std::vector<std::string>>, Error> indexes_on(const std::string& table);

private:
    storage::Database& db_;
    storage::MetricsSink& metrics_;
    double slow_query_ms_;
    double flag_average_ms_;
    std::vector<QueryPattern> patterns_;
};

} // namespace almanac::cache
