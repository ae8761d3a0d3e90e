#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "support/store_fixture.hpp"

using namespace almanac;
using almanac::test::StoreFixture;

TEST_CASE("Property: updated_at strictly increases", "[property][store]") {
    rc::check("every update moves updated_at forward, whatever the clock does",
        [](const std::vector<int>& clock_steps_ms) {
            StoreFixture f;
            auto event = f.add_event("alice", "Stamped");
            auto previous = event.updated_at;
            RC_ASSERT(event.created_at == event.updated_at);
            RC_ASSERT(event.last_modified == event.updated_at);

            int n = 0;
            for (int step : clock_steps_ms) {
                // Steps may be zero or negative: the clock is not trusted.
                f.clock->advance(std::chrono::milliseconds(step % 10'000));
                auto updated = f->update_event(event.id, EventPatch{.title = "Stamped " + std::to_string(++n)});
                RC_ASSERT(updated.is_ok());

                const auto& e = updated.unwrap();
                RC_ASSERT(previous < e.updated_at);
                RC_ASSERT(e.created_at == event.created_at);
                RC_ASSERT(e.sync_status == SyncStatus::Pending);
                previous = e.updated_at;
            }
        });
}

TEST_CASE("Property: synced records return to pending on local edits", "[property][store]") {
    rc::check("a local update after mark_synced is always pending",
        [](bool preserve) {
            StoreFixture f;
            auto event = f.add_event("alice", "Synced");
            RC_ASSERT(f->mark_synced(EntityKind::Event, event.id, std::string("r-1")).is_ok());
            const auto queued = f.outbox().list("alice").unwrap().size();

            auto updated = f->update_event(event.id, EventPatch{.title = "Edited"},
                                           storage::UpdateOptions{.preserve_synced = preserve});
            RC_ASSERT(updated.is_ok());
            const auto expected = preserve ? SyncStatus::Synced : SyncStatus::Pending;
            RC_ASSERT(updated.unwrap().sync_status == expected);
            RC_ASSERT(updated.unwrap().remote_id == std::optional<std::string>("r-1"));
            RC_ASSERT(f.outbox().list("alice").unwrap().size() == queued + (preserve ? 0 : 1));
        });
}
