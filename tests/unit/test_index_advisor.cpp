#include <catch2/catch_test_macros.hpp>
#include "cache/index_advisor.hpp"
#include "cache/performance_tuner.hpp"
#include "storage/migrations.hpp"
#include "support/store_fixture.hpp"

using namespace almanac;
using namespace almanac::cache;
using namespace almanac::storage;
using almanac::test::StoreFixture;

namespace {

void record_runs(MetricsSink& sink, const std::string& operation, int runs, double duration_ms) {
    for (int i = 0; i < runs; ++i) {
        REQUIRE(sink.record(Metric{.operation = operation, .duration_ms = duration_ms,
                                   .timestamp = Timestamp(1'000 + i)}).is_ok());
    }
}

} // namespace

TEST_CASE("IndexAdvisor suggests indexes for frequent uncovered queries", "[cache]") {
    auto db = Database::open_memory().unwrap();
    MetricsSink sink(db);

    SECTION("Current schema covers range queries") {
        REQUIRE(initialize_database(db).is_ok());
        record_runs(sink, "event.range", 51, 5.0);
        record_runs(sink, "event.by_category", 31, 5.0);

        IndexAdvisor advisor(db, sink);
        auto report = advisor.analyze().unwrap();
        REQUIRE(report.slow_operations.empty());
        REQUIRE(report.suggestions.size() == 1);
        REQUIRE(report.suggestions[0].operation == "event.by_category");
        REQUIRE(report.suggestions[0].frequency == 31);
        REQUIRE(report.suggestions[0].create_sql ==
                "CREATE INDEX IF NOT EXISTS idx_events_owner_id_category_id_start_time "
                "ON events(owner_id, category_id, start_time);");
    }

    SECTION("The first schema version lacks both") {
        MigrationRunner runner(db);
        REQUIRE(runner.migrate_to(1).is_ok());
        record_runs(sink, "event.range", 51, 5.0);
        record_runs(sink, "event.by_category", 31, 5.0);

        IndexAdvisor advisor(db, sink);
        auto report = advisor.analyze().unwrap();
        REQUIRE(report.suggestions.size() == 2);
        REQUIRE(report.suggestions[0].operation == "event.range");
    }

    SECTION("Thresholds are exclusive") {
        REQUIRE(initialize_database(db).is_ok());
        record_runs(sink, "event.by_category", 30, 5.0);

        IndexAdvisor advisor(db, sink);
        REQUIRE(advisor.analyze().unwrap().suggestions.empty());
    }

    SECTION("Applying a suggestion covers the pattern") {
        REQUIRE(initialize_database(db).is_ok());
        record_runs(sink, "event.by_category", 31, 5.0);

        IndexAdvisor advisor(db, sink);
        auto report = advisor.analyze().unwrap();
        REQUIRE(db.execute(report.suggestions.at(0).create_sql).is_ok());
        REQUIRE(advisor.is_covered(IndexAdvisor::default_patterns()[1]).unwrap());
        REQUIRE(advisor.analyze().unwrap().suggestions.empty());
    }
}

TEST_CASE("IndexAdvisor flags slow operations", "[cache]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    MetricsSink sink(db);

    record_runs(sink, "event.range", 3, 300.0);
    record_runs(sink, "event.range", 3, 10.0);
    record_runs(sink, "event.search", 4, 150.0);

    IndexAdvisor advisor(db, sink);
    auto report = advisor.analyze().unwrap();

    REQUIRE(report.slow_operations.size() == 1);
    REQUIRE(report.slow_operations[0].operation == "event.range");
    REQUIRE(report.slow_operations[0].average_ms == 300.0);
    REQUIRE(report.slow_operations[0].slow_samples == 3);
}

TEST_CASE("IndexAdvisor lists index columns in key order", "[cache]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    MetricsSink sink(db);
    IndexAdvisor advisor(db, sink);

    auto indexes = advisor.indexes_on("events").unwrap();
    const std::vector<std::string> range{"owner_id", "start_time", "end_time"};
    REQUIRE(std::find(indexes.begin(), indexes.end(), range) != indexes.end());
    REQUIRE(advisor.indexes_on("no_such_table").unwrap().empty());
}

TEST_CASE("PerformanceTuner estimates memory and tunes", "[cache]") {
    StoreFixture f;
    f.add_event("alice", "A");
    f.add_event("alice", "B", std::chrono::hours(1));
    REQUIRE(f->create_category(create_category("alice", "Work")).is_ok());

    SECTION("Memory estimate") {
        PerformanceTuner tuner(*f, 4096);
        auto usage = tuner.check_memory_usage().unwrap();
        REQUIRE(usage.estimated_bytes == 2 * 1024 + 512);
        REQUIRE(usage.memory_cache_entries == 0);
        REQUIRE(usage.percentage == 100.0 * (2 * 1024 + 512) / 4096);
        REQUIRE_FALSE(usage.is_high());
    }

    SECTION("Prewarm fills the cache") {
        PerformanceTuner tuner(*f);
        REQUIRE(tuner.prewarm("alice").unwrap() == 3);  // A and B upcoming, one category
        REQUIRE(f.cache().memory().size() == 3);
    }

    SECTION("Free memory drops old cache entries and metrics") {
        PerformanceTuner tuner(*f);
        REQUIRE(tuner.prewarm("alice").is_ok());
        const auto metrics_before = f->metrics().count().unwrap();
        REQUIRE(metrics_before > 0);

        f.clock->advance(std::chrono::hours(25));
        auto freed = tuner.free_memory().unwrap();
        REQUIRE(freed == 6 + static_cast<int>(metrics_before));  // three entries in each tier
        REQUIRE(f.cache().memory().size() == 0);
    }

    SECTION("Auto tune on a high estimate") {
        PerformanceTuner tuner(*f, 1024);
        auto report = tuner.auto_tune().unwrap();
        REQUIRE(report.applied);
        REQUIRE(report.actions.front().rfind("Freed ", 0) == 0);
        REQUIRE(f->metrics().recent("database.optimize").unwrap().size() == 1);
    }
}
