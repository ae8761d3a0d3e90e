#pragma once

#include "storage/store.hpp"
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>

namespace almanac::test {

/**
 * In-memory store on a ManualClock the test can move.
 */
struct StoreFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::unique_ptr<storage::Store> store;

    explicit StoreFixture(StoreConfig config = {}) {
        config.clock = clock;
        auto opened = storage::Store::open_memory(std::move(config));
        REQUIRE(opened.is_ok());
        store = std::move(opened).unwrap();
    }

    storage::Store& operator*() { return *store; }
    storage::Store* operator->() { return store.get(); }

    // What the store queued and cached, for assertions.
    sync::Outbox& outbox() { return store->outbox(); }
    cache::QueryCache& cache() { return store->cache(); }

    Event add_event(const std::string& owner, const std::string& title,
                    Timestamp::Duration offset = Timestamp::Duration{0}) {
        auto created = store->create_event(create_event(owner, title, clock->now() + offset));
        REQUIRE(created.is_ok());
        return created.unwrap();
    }
};

} // namespace almanac::test
