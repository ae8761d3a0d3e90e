#include <catch2/catch_test_macros.hpp>
#include "sync/retention.hpp"
#include "support/store_fixture.hpp"
#include <QSignalSpy>

using namespace almanac;
using namespace almanac::sync;
using almanac::test::StoreFixture;

namespace {

struct AgedStore {
    StoreFixture f;
    Event keep;
    Event trash;

    AgedStore() {
        keep = f.add_event("alice", "Keep");
        trash = f.add_event("alice", "Trash");
        REQUIRE(f->delete_event(trash.id).is_ok());

        // The create entry for "Keep" has used up its attempts.
        auto entries = f.outbox().list("alice").unwrap();
        REQUIRE(entries.size() == 3);
        for (int i = 0; i < 3; ++i) {
            REQUIRE(f.outbox().mark_attempted(entries[0].id, "remote unavailable").is_ok());
        }

        const auto now = f.clock->now();
        REQUIRE(f->query_events("alice", TimeRange{now, now + std::chrono::hours(1)}).is_ok());
    }
};

} // namespace

TEST_CASE("Retention: a fresh store has nothing to sweep", "[integration][retention]") {
    AgedStore s;
    RetentionSweeper sweeper(*s.f);

    auto report = sweeper.sweep().unwrap();
    REQUIRE(report.total() == 0);
    REQUIRE(report.swept_at == s.f.clock->now());
    REQUIRE(s.f->get_event(s.trash.id).unwrap().has_value());
}

TEST_CASE("Retention: old records are swept", "[integration][retention]") {
    AgedStore s;
    auto& f = s.f;
    const auto metrics_before = f->metrics().count().unwrap();
    REQUIRE(metrics_before > 0);

    f.clock->advance(std::chrono::hours(24 * 31));
    RetentionSweeper sweeper(*f);
    auto report = sweeper.sweep().unwrap();

    REQUIRE(report.reaped_outbox.size() == 1);
    REQUIRE(report.reaped_outbox[0].entity_id == s.keep.id);
    REQUIRE(report.purged_events == 1);
    REQUIRE(report.expired_cache_entries == 2);  // one entry in each tier
    REQUIRE(report.purged_metrics == static_cast<int>(metrics_before));
    REQUIRE(report.total() == 4 + static_cast<int>(metrics_before));

    REQUIRE_FALSE(f->get_event(s.trash.id).unwrap().has_value());
    REQUIRE(f->get_event(s.keep.id).unwrap().has_value());
    REQUIRE(f.outbox().list("alice").unwrap().size() == 2);

    auto sweeps = f->metrics().recent("retention.sweep").unwrap();
    REQUIRE(sweeps.size() == 1);
    REQUIRE(sweeps[0].record_count == report.total());

    SECTION("A second sweep finds nothing") {
        REQUIRE(sweeper.sweep().unwrap().total() == 0);
    }
}

TEST_CASE("Retention: scheduler signals", "[integration][retention]") {
    AgedStore s;
    auto& f = s.f;
    RetentionScheduler scheduler(*f);
    QSignalSpy swept(&scheduler, &RetentionScheduler::swept);
    QSignalSpy failed(&scheduler, &RetentionScheduler::sweepFailed);

    REQUIRE_FALSE(scheduler.isActive());
    scheduler.start();
    REQUIRE(scheduler.isActive());
    scheduler.stop();

    f.clock->advance(std::chrono::hours(24 * 31));
    auto report = scheduler.runNow().unwrap();
    REQUIRE(swept.count() == 1);
    REQUIRE(swept.at(0).at(0).toInt() == report.total());
    REQUIRE(failed.count() == 0);

    SECTION("Failures are signalled, not thrown") {
        f->database().set_commit_hook([] { return false; });
        REQUIRE(scheduler.runNow().is_err());
        f->database().set_commit_hook({});
        REQUIRE(failed.count() == 1);
        REQUIRE(swept.count() == 1);
    }

    SECTION("Timer ticks sweep") {
        RetentionScheduler fast(*f, std::chrono::milliseconds(10));
        QSignalSpy ticked(&fast, &RetentionScheduler::swept);
        fast.start();
        REQUIRE(ticked.wait(2000));
        fast.stop();
        REQUIRE(ticked.at(0).at(0).toInt() == 0);
    }
}
