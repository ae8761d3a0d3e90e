#include <catch2/catch_test_macros.hpp>
#include "support/store_fixture.hpp"
#include "core/record_json.hpp"

using namespace almanac;
using namespace almanac::storage;
using namespace almanac::sync;
using almanac::test::StoreFixture;

TEST_CASE("Every mutation enqueues one outbox entry", "[outbox]") {
    StoreFixture f;
    auto event = f.add_event("alice", "Board meeting");

    auto entries = f.outbox().list("alice").unwrap();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].operation == OutboxOperation::Create);
    REQUIRE(entries[0].entity == EntityKind::Event);
    REQUIRE(entries[0].entity_id == event.id);
    REQUIRE(entries[0].attempts == 0);
    REQUIRE(entries[0].created_at == f.clock->now());

    auto payload = parse_json_object(entries[0].payload_json).unwrap();
    REQUIRE(payload.value(QStringLiteral("title")).toString() == QStringLiteral("Board meeting"));

    REQUIRE(f->update_event(event.id, EventPatch{.title = "Board"}).is_ok());
    REQUIRE(f->delete_event(event.id).is_ok());
    REQUIRE(f->save_preferences(default_preferences("alice")).is_ok());

    entries = f.outbox().list("alice").unwrap();
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[1].operation == OutboxOperation::Update);
    REQUIRE(entries[2].operation == OutboxOperation::Delete);
    REQUIRE(entries[3].entity == EntityKind::Preferences);

    auto delete_payload = parse_json_object(entries[2].payload_json).unwrap();
    REQUIRE(delete_payload.value(QStringLiteral("hard")).toBool() == false);

    auto stats = f.outbox().stats("alice").unwrap();
    REQUIRE(stats.total == 4);
    REQUIRE(stats.pending == 4);
    REQUIRE(stats.by_operation[OutboxOperation::Update] == 2);
}

TEST_CASE("skip_sync writes without an outbox entry", "[outbox]") {
    StoreFixture f;
    auto created = f->create_event(create_event("alice", "Imported", f.clock->now()),
                                   WriteOptions{.skip_sync = true}).unwrap();

    REQUIRE(f.outbox().list("alice").unwrap().empty());
    REQUIRE_FALSE(f.outbox().has_entries_for(EntityKind::Event, created.id).unwrap());
}

TEST_CASE("A rolled-back mutation leaves no outbox entry", "[outbox]") {
    StoreFixture f;
    f->database().set_commit_hook([] { return false; });
    auto result = f->create_event(create_event("alice", "Never committed", f.clock->now()));
    f->database().set_commit_hook({});

    REQUIRE(result.unwrap_err().kind == ErrorKind::TransactionFailure);
    REQUIRE(f.outbox().list("alice").unwrap().empty());
    REQUIRE(f->events_for_owner("alice").unwrap().empty());
}

TEST_CASE("Outbox attempts and delivery order", "[outbox]") {
    StoreFixture f;
    auto& outbox = f.outbox();
    auto first = outbox.enqueue("alice", OutboxOperation::Create, EntityKind::Event, 1, "{}").unwrap();
    f.clock->advance(std::chrono::seconds(1));
    auto second = outbox.enqueue("bob", OutboxOperation::Create, EntityKind::Event, 2, "{}").unwrap();

    auto drained = outbox.drain().unwrap();
    REQUIRE(drained.size() == 2);
    REQUIRE(drained[0].id == first);
    REQUIRE(drained[1].id == second);

    SECTION("Exhausted entries stop being delivered but stay queued") {
        for (int i = 0; i < 3; ++i) {
            REQUIRE(outbox.mark_attempted(first, "timeout").is_ok());
        }
        auto entry = outbox.get(first).unwrap();
        REQUIRE(entry->attempts == 3);
        REQUIRE(entry->last_error == "timeout");
        REQUIRE(entry->last_attempt == f.clock->now());

        REQUIRE(outbox.drain().unwrap().size() == 1);
        REQUIRE(outbox.pending("alice").unwrap().empty());

        auto stats = outbox.stats("alice").unwrap();
        REQUIRE(stats.total == 1);
        REQUIRE(stats.failed == 1);
    }

    SECTION("Limit") {
        REQUIRE(outbox.drain(1).unwrap().size() == 1);
    }

    SECTION("Removal") {
        REQUIRE(outbox.remove(first).is_ok());
        REQUIRE_FALSE(outbox.get(first).unwrap().has_value());
        REQUIRE(outbox.mark_attempted(first, "gone").unwrap_err().kind == ErrorKind::NotFound);
    }
}

TEST_CASE("Outbox reaping", "[outbox]") {
    StoreFixture f;
    auto& outbox = f.outbox();

    auto exhausted_old = outbox.enqueue("alice", OutboxOperation::Update, EntityKind::Event, 1, "{}").unwrap();
    auto retrying_old = outbox.enqueue("alice", OutboxOperation::Update, EntityKind::Event, 2, "{}").unwrap();
    for (int i = 0; i < 3; ++i) REQUIRE(outbox.mark_attempted(exhausted_old, "503").is_ok());
    for (int i = 0; i < 2; ++i) REQUIRE(outbox.mark_attempted(retrying_old, "503").is_ok());

    f.clock->advance(std::chrono::hours(24 * 8));
    auto exhausted_new = outbox.enqueue("alice", OutboxOperation::Update, EntityKind::Event, 3, "{}").unwrap();
    for (int i = 0; i < 3; ++i) REQUIRE(outbox.mark_attempted(exhausted_new, "503").is_ok());

    auto reaped = outbox.reap().unwrap();
    REQUIRE(reaped.size() == 1);
    REQUIRE(reaped[0].id == exhausted_old);
    REQUIRE(reaped[0].last_error == "503");

    REQUIRE_FALSE(outbox.get(exhausted_old).unwrap().has_value());
    REQUIRE(outbox.get(retrying_old).unwrap().has_value());
    REQUIRE(outbox.get(exhausted_new).unwrap().has_value());

    SECTION("A shorter age reaps the recent exhausted entry too") {
        f.clock->advance(std::chrono::hours(2));
        auto more = outbox.reap(ReapPolicy{.max_age = std::chrono::hours(1), .max_attempts = 3}).unwrap();
        REQUIRE(more.size() == 1);
        REQUIRE(more[0].id == exhausted_new);
    }
}

TEST_CASE("Outbox clear is per owner", "[outbox]") {
    StoreFixture f;
    f.add_event("alice", "A");
    f.add_event("alice", "B");
    f.add_event("bob", "C");

    REQUIRE(f.outbox().clear("alice").unwrap() == 2);
    REQUIRE(f.outbox().list("bob").unwrap().size() == 1);
}
