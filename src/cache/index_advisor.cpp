#include "cache/index_advisor.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <map>

namespace almanac::cache {

using storage::Statement;

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string index_name(const QueryPattern& pattern) {
    return "idx_" + pattern.table + "_" + join(pattern.columns, "_");
}

} // namespace

IndexAdvisor::IndexAdvisor(storage::Database& db, storage::MetricsSink& metrics,
                           double slow_query_ms, double flag_average_ms,
                           std::vector<QueryPattern> patterns)
    : db_(db)
    , metrics_(metrics)
    , slow_query_ms_(slow_query_ms)
    , flag_average_ms_(flag_average_ms)
    , patterns_(std::move(patterns)) {}

std::vector<QueryPattern> IndexAdvisor::default_patterns() {
    return {
        {"event.range", "events", {"owner_id", "start_time", "end_time"}, 50},
        {"event.by_category", "events", {"owner_id", "category_id", "start_time"}, 30},
    };
}

Result<std::vector<std::vector<std::string>>, Error> IndexAdvisor::indexes_on(const std::string& table) {
    using R = Result<std::vector<std::vector<std::string>>, Error>;

    // PRAGMA arguments cannot be bound; the table-valued form can.
    auto list_result = db_.prepare("SELECT name FROM pragma_index_list(?);");
    if (list_result.is_err()) {
        return R::err(list_result.unwrap_err());
    }
    auto list = std::move(list_result).unwrap();
    list.bind_text(1, table);
    auto names = storage::collect_rows<std::string>(list, [](Statement& s) {
        return s.column_text(0);
    });
    if (names.is_err()) {
        return R::err(names.unwrap_err());
    }

    std::vector<std::vector<std::string>> indexes;
    for (const auto& name : names.unwrap()) {
        auto info_result = db_.prepare("SELECT name FROM pragma_index_info(?) ORDER BY seqno;");
        if (info_result.is_err()) {
            return R::err(info_result.unwrap_err());
        }
        auto info = std::move(info_result).unwrap();
        info.bind_text(1, name);
        auto columns = storage::collect_rows<std::string>(info, [](Statement& s) {
            return s.column_text(0);
        });
        if (columns.is_err()) {
            return R::err(columns.unwrap_err());
        }
        indexes.push_back(std::move(columns).unwrap());
    }
    return R::ok(std::move(indexes));
}

Result<bool, Error> IndexAdvisor::is_covered(const QueryPattern& pattern) {
    auto indexes = indexes_on(pattern.table);
    if (indexes.is_err()) {
        return Result<bool, Error>::err(indexes.unwrap_err());
    }
    for (const auto& columns : indexes.unwrap()) {
        if (columns.size() < pattern.columns.size()) {
            continue;
        }
        if (std::equal(pattern.columns.begin(), pattern.columns.end(), columns.begin())) {
            return Result<bool, Error>::ok(true);
        }
    }
    return Result<bool, Error>::ok(false);
}

Result<AdvisorReport, Error> IndexAdvisor::analyze(int sample_size) {
    using R = Result<AdvisorReport, Error>;

    auto recent = metrics_.recent({}, sample_size);
    if (recent.is_err()) {
        return R::err(recent.unwrap_err());
    }

    std::map<std::string, int> frequency;
    std::map<std::string, std::pair<double, int>> slow;  // total ms, samples
    for (const auto& m : recent.unwrap()) {
        ++frequency[m.operation];
        if (m.duration_ms > slow_query_ms_) {
            auto& [total, n] = slow[m.operation];
            total += m.duration_ms;
            ++n;
        }
    }

    AdvisorReport report;
    for (const auto& [operation, stats] : slow) {
        const double average = stats.first / stats.second;
        if (average > flag_average_ms_) {
            report.slow_operations.push_back(SlowOperation{operation, average, stats.second});
            qCInfo(almanacCacheLog) << "IndexAdvisor: slow operation" << to_qstring(operation)
                                    << "avg" << average << "ms";
        }
    }

    for (const auto& pattern : patterns_) {
        const auto it = frequency.find(pattern.operation);
        const int count = it == frequency.end() ? 0 : it->second;
        if (count <= pattern.frequency_threshold) {
            continue;
        }

        auto covered = is_covered(pattern);
        if (covered.is_err()) {
            return R::err(covered.unwrap_err());
        }
        if (covered.unwrap()) {
            continue;
        }

        report.suggestions.push_back(IndexSuggestion{
            .operation = pattern.operation,
            .table = pattern.table,
            .columns = pattern.columns,
            .frequency = count,
            .create_sql = "CREATE INDEX IF NOT EXISTS " + index_name(pattern) + " ON " +
                          pattern.table + "(" + join(pattern.columns, ", ") + ");"
        });
    }
    return R::ok(std::move(report));
}

} // namespace almanac::cache
