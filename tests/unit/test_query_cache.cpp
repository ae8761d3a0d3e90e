#include <catch2/catch_test_macros.hpp>
#include "cache/query_cache.hpp"
#include "storage/migrations.hpp"
#include <QJsonArray>

using namespace almanac;
using namespace almanac::cache;
using namespace almanac::storage;

namespace {

struct CacheHarness {
    Database db = Database::open_memory().unwrap();
    ManualClock clock;
    MetricsSink metrics{db};
    std::unique_ptr<QueryCache> cache;
    int calls = 0;

    CacheHarness() {
        REQUIRE(initialize_database(db).is_ok());
        cache = std::make_unique<QueryCache>(db, clock, metrics, std::chrono::seconds(5));
    }

    QueryCache::QueryFn counting(int value) {
        return [this, value]() -> Result<QJsonValue, Error> {
            ++calls;
            return Result<QJsonValue, Error>::ok(QJsonArray{value, value + 1});
        };
    }
};

} // namespace

TEST_CASE("QueryCache serves hits until the TTL passes", "[cache]") {
    CacheHarness h;
    auto& cache = *h.cache;
    const CacheOptions options{.tags = {owner_tag("alice")}, .operation = "event.range"};

    auto first = cache.optimized_query("alice", "range:0:10", h.counting(1), options).unwrap();
    REQUIRE(first == QJsonValue(QJsonArray{1, 2}));
    REQUIRE(h.calls == 1);

    h.clock.advance(std::chrono::milliseconds(4'999));
    REQUIRE(cache.optimized_query("alice", "range:0:10", h.counting(9), options).unwrap() == first);
    REQUIRE(h.calls == 1);
    REQUIRE(cache.stats().memory_hits == 1);

    h.clock.advance(std::chrono::milliseconds(1));
    auto refreshed = cache.optimized_query("alice", "range:0:10", h.counting(9), options).unwrap();
    REQUIRE(refreshed == QJsonValue(QJsonArray{9, 10}));
    REQUIRE(h.calls == 2);
    REQUIRE(cache.stats().misses == 2);

    auto metrics = h.metrics.recent("event.range").unwrap();
    REQUIRE(metrics.size() == 2);
    REQUIRE(metrics[0].record_count == 2);
}

TEST_CASE("QueryCache keys are scoped by owner", "[cache]") {
    CacheHarness h;
    auto& cache = *h.cache;

    (void)cache.optimized_query("alice", "categories", h.counting(1));
    auto bobs = cache.optimized_query("bob", "categories", h.counting(5)).unwrap();
    REQUIRE(bobs == QJsonValue(QJsonArray{5, 6}));
    REQUIRE(h.calls == 2);
}

TEST_CASE("QueryCache persisted tier survives the memory tier", "[cache]") {
    CacheHarness h;
    const CacheOptions options{.ttl = std::chrono::seconds(60), .tags = {"owner:alice/event"}};

    (void)h.cache->optimized_query("alice", "range", h.counting(1), options);
    REQUIRE(h.cache->persistent().count().unwrap() == 1);

    // A second cache over the same database starts with an empty memory tier.
    QueryCache restarted(h.db, h.clock, h.metrics);
    h.clock.advance(std::chrono::seconds(30));
    auto value = restarted.optimized_query("alice", "range", h.counting(7), options).unwrap();
    REQUIRE(value == QJsonValue(QJsonArray{1, 2}));
    REQUIRE(h.calls == 1);
    REQUIRE(restarted.stats().persisted_hits == 1);

    // The promoted memory entry keeps the persisted expiry.
    h.clock.advance(std::chrono::seconds(30));
    (void)restarted.optimized_query("alice", "range", h.counting(7), options);
    REQUIRE(h.calls == 2);

    SECTION("Tags are persisted with the entry") {
        auto persisted = h.cache->persistent().get("alice", "range", h.clock.now()).unwrap();
        REQUIRE(persisted.has_value());
        REQUIRE(persisted->tags == std::vector<std::string>{"owner:alice/event"});
    }
}

TEST_CASE("QueryCache tag invalidation covers both tiers", "[cache]") {
    CacheHarness h;
    auto& cache = *h.cache;

    (void)cache.optimized_query("alice", "events", h.counting(1),
                                CacheOptions{.tags = {entity_tag("alice", EntityKind::Event), owner_tag("alice")}});
    (void)cache.optimized_query("alice", "categories", h.counting(1),
                                CacheOptions{.tags = {entity_tag("alice", EntityKind::Category)}});

    REQUIRE(cache.invalidate_tags({entity_tag("alice", EntityKind::Event)}).unwrap() == 2);
    REQUIRE(cache.memory().size() == 1);
    REQUIRE(cache.persistent().count().unwrap() == 1);

    (void)cache.optimized_query("alice", "events", h.counting(1));
    REQUIRE(h.calls == 3);

    REQUIRE(cache.invalidate_tags({}).unwrap() == 0);
}

TEST_CASE("QueryCache clear by key pattern", "[cache]") {
    CacheHarness h;
    auto& cache = *h.cache;
    (void)cache.optimized_query("alice", "events.range:1", h.counting(1));
    (void)cache.optimized_query("alice", "events.range:2", h.counting(1));
    (void)cache.optimized_query("alice", "categories", h.counting(1));

    REQUIRE(cache.clear("range").unwrap() == 4);  // two per tier
    REQUIRE(cache.memory().size() == 1);
    REQUIRE(cache.clear().unwrap() == 2);
    REQUIRE(cache.persistent().count().unwrap() == 0);
}

TEST_CASE("QueryCache cleanup", "[cache]") {
    CacheHarness h;
    auto& cache = *h.cache;
    (void)cache.optimized_query("alice", "short", h.counting(1), CacheOptions{.ttl = std::chrono::seconds(1)});
    (void)cache.optimized_query("alice", "long", h.counting(1), CacheOptions{.ttl = std::chrono::hours(2)});

    h.clock.advance(std::chrono::seconds(2));
    REQUIRE(cache.clean_expired().unwrap() == 2);
    REQUIRE(cache.memory().size() == 1);

    h.clock.advance(std::chrono::hours(1));
    REQUIRE(cache.remove_created_before(h.clock.now() - std::chrono::minutes(30)).unwrap() == 2);
    REQUIRE(cache.memory().size() == 0);
}

TEST_CASE("QueryCache does not cache failures or uncached queries", "[cache]") {
    CacheHarness h;
    auto& cache = *h.cache;

    int failures = 0;
    auto failing = [&]() -> Result<QJsonValue, Error> {
        ++failures;
        return Result<QJsonValue, Error>::err(Error{"query failed"});
    };
    REQUIRE(cache.optimized_query("alice", "bad", failing).is_err());
    REQUIRE(cache.optimized_query("alice", "bad", failing).is_err());
    REQUIRE(failures == 2);

    (void)cache.optimized_query("alice", "live", h.counting(1), CacheOptions{.cache = false});
    (void)cache.optimized_query("alice", "live", h.counting(1), CacheOptions{.cache = false});
    REQUIRE(h.calls == 2);
    REQUIRE(cache.memory().size() == 0);

    auto failed_metric = h.metrics.recent("query.bad").unwrap();
    REQUIRE(failed_metric.size() == 2);
    REQUIRE(failed_metric[0].error == "query failed");
}

TEST_CASE("QueryCache batch_query isolates failing items", "[cache]") {
    CacheHarness h;
    std::vector<QueryCache::BatchItem> items{
        {.key = "one", .query = h.counting(1)},
        {.key = "broken", .query = []() { return Result<QJsonValue, Error>::err(Error{"boom"}); }},
        {.key = "three", .query = h.counting(3)},
    };

    auto results = h.cache->batch_query("alice", items);
    REQUIRE(results.size() == 3);
    REQUIRE(results[0] == QJsonValue(QJsonArray{1, 2}));
    REQUIRE_FALSE(results[1].has_value());
    REQUIRE(results[2] == QJsonValue(QJsonArray{3, 4}));

    auto batch = h.metrics.recent("query.batch").unwrap();
    REQUIRE(batch.size() == 1);
    REQUIRE_FALSE(batch[0].success);
    REQUIRE(batch[0].record_count == 3);
    REQUIRE(batch[0].error == "1 of 3 failed");
}
