#include "storage/metrics_sink.hpp"

namespace almanac::storage {

Metric MetricsSink::row_to_metric(Statement& stmt) {
    Metric m;
    m.id = stmt.column_int64(0);
    m.operation = stmt.column_text(1);
    m.duration_ms = stmt.column_double(2);
    if (!stmt.column_is_null(3)) m.record_count = stmt.column_int64(3);
    m.timestamp = stmt.column_timestamp(4);
    m.success = stmt.column_bool(5);
    m.error = stmt.column_optional_text(6);
    return m;
}

Result<void, Error> MetricsSink::record(const Metric& m) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO metrics (operation, duration_ms, record_count, timestamp, success, error)
        VALUES (?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, m.operation)
        .bind_double(2, m.duration_ms)
        .bind_timestamp(4, m.timestamp)
        .bind_bool(5, m.success)
        .bind_optional_text(6, m.error);
    if (m.record_count) {
        stmt.bind_int64(3, *m.record_count);
    } else {
        stmt.bind_null(3);
    }
    return run(stmt);
}

Result<std::vector<Metric>, Error> MetricsSink::recent(const std::string& operation, int limit) {
    std::string sql = R"SQL(
        SELECT id, operation, duration_ms, record_count, timestamp, success, error
        FROM metrics )SQL";
    sql += operation.empty() ? "" : "WHERE operation = ?1 ";
    sql += "ORDER BY timestamp DESC, id DESC LIMIT ?2;";

    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<std::vector<Metric>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    if (!operation.empty()) {
        stmt.bind_text(1, operation);
    }
    stmt.bind_int(2, limit);
    return collect_rows<Metric>(stmt, row_to_metric);
}

Result<double, Error> MetricsSink::average_duration(const std::string& operation) {
    auto stmt_result = db_.prepare(
        "SELECT COALESCE(AVG(duration_ms), 0) FROM metrics WHERE operation = ?;");
    if (stmt_result.is_err()) {
        return Result<double, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, operation);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<double, Error>::err(step_result.unwrap_err());
    }
    return Result<double, Error>::ok(stmt.column_double(0));
}

Result<std::map<std::string, OperationSummary>, Error> MetricsSink::summarize(int sample_size) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT operation, COUNT(*), AVG(duration_ms), MAX(duration_ms),
               SUM(CASE WHEN success = 0 THEN 1 ELSE 0 END)
        FROM (SELECT operation, duration_ms, success FROM metrics
              ORDER BY timestamp DESC, id DESC LIMIT ?)
        GROUP BY operation;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::map<std::string, OperationSummary>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, sample_size);

    std::map<std::string, OperationSummary> summaries;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::map<std::string, OperationSummary>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        summaries[stmt.column_text(0)] = OperationSummary{
            .samples = stmt.column_int(1),
            .average_ms = stmt.column_double(2),
            .max_ms = stmt.column_double(3),
            .failures = stmt.column_int(4)
        };
    }
    return Result<std::map<std::string, OperationSummary>, Error>::ok(std::move(summaries));
}

Result<int, Error> MetricsSink::clear_older_than(Timestamp cutoff) {
    auto stmt_result = db_.prepare("DELETE FROM metrics WHERE timestamp < ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, cutoff);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<int64_t, Error> MetricsSink::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM metrics;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

} // namespace almanac::storage
