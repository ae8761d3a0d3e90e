#include <catch2/catch_test_macros.hpp>
#include "sync/outbox_drainer.hpp"
#include "support/store_fixture.hpp"
#include <QSignalSpy>
#include <set>

using namespace almanac;
using namespace almanac::sync;
using almanac::test::StoreFixture;

namespace {

/**
 * Accepts everything except entries for the entities in `rejected`.
 */
class FakeRemote : public RemoteLink {
public:
    Result<std::optional<std::string>, Error> apply(const OutboxEntry& entry) override {
        delivered.push_back(entry);
        if (rejected.count(entry.entity_id) > 0) {
            return Result<std::optional<std::string>, Error>::err(Error{"remote rejected the change"});
        }
        if (entry.operation == OutboxOperation::Delete) {
            return Result<std::optional<std::string>, Error>::ok(std::nullopt);
        }
        return Result<std::optional<std::string>, Error>::ok(
            std::optional<std::string>("remote-" + std::to_string(entry.entity_id)));
    }

    std::vector<OutboxEntry> delivered;
    std::set<RecordId> rejected;
};

} // namespace

TEST_CASE("Sync: drained entries acknowledge their records", "[integration][sync]") {
    StoreFixture f;
    FakeRemote remote;
    ConnectivityMonitor connectivity;
    OutboxDrainer drainer(*f, remote, connectivity);

    auto a = f.add_event("alice", "Standup");
    auto b = f.add_event("alice", "Retro");
    REQUIRE(f->update_event(b.id, EventPatch{.title = "Retro (moved)"}).is_ok());

    QSignalSpy drained(&drainer, &OutboxDrainer::drained);
    auto result = drainer.drainOnce();

    REQUIRE(result.synced == 3);
    REQUIRE(result.failed == 0);
    REQUIRE(drained.count() == 1);
    REQUIRE(drained.at(0).at(0).toInt() == 3);

    REQUIRE(remote.delivered.size() == 3);
    REQUIRE(remote.delivered[0].entity_id == a.id);
    REQUIRE(remote.delivered[2].operation == OutboxOperation::Update);

    auto synced = f->get_event(a.id).unwrap();
    REQUIRE(synced->sync_status == SyncStatus::Synced);
    REQUIRE(synced->remote_id == "remote-" + std::to_string(a.id));
    REQUIRE(f->get_event(b.id).unwrap()->sync_status == SyncStatus::Synced);
    REQUIRE(f.outbox().list("alice").unwrap().empty());

    auto summary = f->sync_summary("alice").unwrap();
    REQUIRE(summary.pending_sync == 0);
    REQUIRE(summary.queue_size == 0);
}

TEST_CASE("Sync: limit leaves the rest queued", "[integration][sync]") {
    StoreFixture f;
    FakeRemote remote;
    ConnectivityMonitor connectivity;
    OutboxDrainer drainer(*f, remote, connectivity);

    auto a = f.add_event("alice", "Create");
    REQUIRE(f->update_event(a.id, EventPatch{.title = "Then update"}).is_ok());

    auto first = drainer.drainOnce(1);
    REQUIRE(first.synced == 1);
    // The update is still queued, so the record is not yet acknowledged.
    REQUIRE(f->get_event(a.id).unwrap()->sync_status == SyncStatus::Pending);

    auto second = drainer.drainOnce();
    REQUIRE(second.synced == 1);
    REQUIRE(f->get_event(a.id).unwrap()->sync_status == SyncStatus::Synced);
}

TEST_CASE("Sync: failed deliveries count attempts", "[integration][sync]") {
    StoreFixture f;
    FakeRemote remote;
    ConnectivityMonitor connectivity;
    OutboxDrainer drainer(*f, remote, connectivity);

    auto good = f.add_event("alice", "Good");
    auto bad = f.add_event("alice", "Bad");
    remote.rejected.insert(bad.id);

    auto result = drainer.drainOnce();
    REQUIRE(result.synced == 1);
    REQUIRE(result.failed == 1);
    REQUIRE(result.errors.size() == 1);
    REQUIRE(result.errors[0].find("remote rejected the change") != std::string::npos);

    auto queued = f.outbox().list("alice").unwrap();
    REQUIRE(queued.size() == 1);
    REQUIRE(queued[0].entity_id == bad.id);
    REQUIRE(queued[0].attempts == 1);
    REQUIRE(queued[0].last_error == "remote rejected the change");
    REQUIRE(f->get_event(good.id).unwrap()->sync_status == SyncStatus::Synced);
    REQUIRE(f->get_event(bad.id).unwrap()->sync_status == SyncStatus::Local);

    SECTION("Exhausted entries are no longer delivered") {
        REQUIRE(drainer.drainOnce().failed == 1);
        REQUIRE(drainer.drainOnce().failed == 1);
        remote.delivered.clear();

        auto after = drainer.drainOnce();
        REQUIRE(after.synced == 0);
        REQUIRE(after.failed == 0);
        REQUIRE(remote.delivered.empty());

        auto stats = f.outbox().stats("alice").unwrap();
        REQUIRE(stats.failed == 1);
        REQUIRE(stats.pending == 0);
    }

    auto metrics = f->metrics().recent("sync.drain").unwrap();
    REQUIRE_FALSE(metrics.empty());
}

TEST_CASE("Sync: hard deletes acknowledge without a row", "[integration][sync]") {
    StoreFixture f;
    FakeRemote remote;
    ConnectivityMonitor connectivity;
    OutboxDrainer drainer(*f, remote, connectivity);

    auto a = f.add_event("alice", "Ephemeral");
    REQUIRE(drainer.drainOnce().synced == 1);

    REQUIRE(f->delete_event(a.id, storage::DeleteOptions{.hard = true}).is_ok());
    auto result = drainer.drainOnce();
    REQUIRE(result.synced == 1);
    REQUIRE(result.failed == 0);
    REQUIRE(remote.delivered.back().operation == OutboxOperation::Delete);
}

TEST_CASE("Sync: nothing is attempted offline", "[integration][sync]") {
    StoreFixture f;
    FakeRemote remote;
    ConnectivityMonitor connectivity(false);
    OutboxDrainer drainer(*f, remote, connectivity);

    f.add_event("alice", "Offline edit");
    auto result = drainer.drainOnce();
    REQUIRE(result.offline);
    REQUIRE(remote.delivered.empty());
    REQUIRE(f.outbox().list("alice").unwrap().size() == 1);

    SECTION("Reconnecting drains automatically") {
        QSignalSpy drained(&drainer, &OutboxDrainer::drained);
        connectivity.setOnline(true);
        REQUIRE(drained.count() == 1);
        REQUIRE(remote.delivered.size() == 1);
        REQUIRE(f.outbox().list("alice").unwrap().empty());
    }

    SECTION("Auto drain can be turned off") {
        drainer.setAutoDrain(false);
        connectivity.setOnline(true);
        REQUIRE(remote.delivered.empty());
    }
}
