#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"
#include <QtGlobal>

using namespace almanac;

namespace {

const char* const ENV_NAMES[] = {
    "ALMANAC_DB_PATH", "ALMANAC_BATCH_SIZE", "ALMANAC_MAX_BACKUPS",
    "ALMANAC_CACHE_TTL_MS", "ALMANAC_INTEGRITY_POLICY",
};

struct EnvGuard {
    EnvGuard() { reset(); }
    ~EnvGuard() { reset(); }

    static void reset() {
        for (const char* name : ENV_NAMES) {
            qunsetenv(name);
        }
    }
};

} // namespace

TEST_CASE("Integrity policy names", "[config]") {
    REQUIRE(parse_integrity_policy("warn") == IntegrityPolicy::Warn);
    REQUIRE(parse_integrity_policy("refuse") == IntegrityPolicy::Refuse);
    REQUIRE_FALSE(parse_integrity_policy("ignore").has_value());
    REQUIRE_FALSE(parse_integrity_policy("").has_value());
}

TEST_CASE("StoreConfig defaults", "[config]") {
    StoreConfig config;
    REQUIRE(config.db_path == ":memory:");
    REQUIRE(config.batch_size == 100);
    REQUIRE(config.category_batch_size == 50);
    REQUIRE(config.share_batch_size == 20);
    REQUIRE(config.cache_ttl == std::chrono::seconds(5));
    REQUIRE(config.reference_cache_ttl == std::chrono::minutes(5));
    REQUIRE(config.outbox_max_attempts == 3);
    REQUIRE(config.compression_threshold == 100 * 1024);
    REQUIRE(config.max_backups == 10);
    REQUIRE(config.integrity_policy == IntegrityPolicy::Warn);
    REQUIRE(config.clock == nullptr);
}

TEST_CASE("StoreConfig from the environment", "[config]") {
    EnvGuard guard;

    SECTION("Unset variables keep the base") {
        StoreConfig base;
        base.batch_size = 7;
        auto config = StoreConfig::from_environment(base);
        REQUIRE(config.batch_size == 7);
        REQUIRE(config.db_path == ":memory:");
    }

    SECTION("Valid values apply") {
        qputenv("ALMANAC_DB_PATH", "/tmp/almanac.db");
        qputenv("ALMANAC_BATCH_SIZE", "250");
        qputenv("ALMANAC_MAX_BACKUPS", "3");
        qputenv("ALMANAC_CACHE_TTL_MS", "1500");
        qputenv("ALMANAC_INTEGRITY_POLICY", "Refuse");

        auto config = StoreConfig::from_environment();
        REQUIRE(config.db_path == "/tmp/almanac.db");
        REQUIRE(config.batch_size == 250);
        REQUIRE(config.max_backups == 3);
        REQUIRE(config.cache_ttl == std::chrono::milliseconds(1500));
        REQUIRE(config.integrity_policy == IntegrityPolicy::Refuse);
    }

    SECTION("Values that do not parse are ignored") {
        qputenv("ALMANAC_BATCH_SIZE", "lots");
        qputenv("ALMANAC_MAX_BACKUPS", "-2");
        qputenv("ALMANAC_CACHE_TTL_MS", "0");
        qputenv("ALMANAC_INTEGRITY_POLICY", "shrug");

        auto config = StoreConfig::from_environment();
        REQUIRE(config.batch_size == 100);
        REQUIRE(config.max_backups == 10);
        REQUIRE(config.cache_ttl == std::chrono::seconds(5));
        REQUIRE(config.integrity_policy == IntegrityPolicy::Warn);
    }
}
