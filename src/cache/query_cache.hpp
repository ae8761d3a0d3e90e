#pragma once

#include "storage/database.hpp"
#include "storage/metrics_sink.hpp"
#include "core/records.hpp"
#include <QJsonValue>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace almanac::cache {

/**
 * Tag carried by every cached result derived from one entity kind of one
 * owner. Writes to that kind invalidate it.
 */
[[nodiscard]] std::string entity_tag(const std::string& owner_id, EntityKind kind);

/**
 * Tag for results that span several entity kinds of an owner. Any write by
 * the owner invalidates it.
 */
[[nodiscard]] std::string owner_tag(const std::string& owner_id);

struct CacheOptions {
    bool cache{true};
    std::optional<std::chrono::milliseconds> ttl;  // unset: the cache's default
    std::vector<std::string> tags;
    std::string operation;  // metric name; unset: "query.<key>"
};

struct CacheStats {
    int64_t memory_hits{0};
    int64_t persisted_hits{0};
    int64_t misses{0};
    size_t memory_entries{0};
};

struct CachedValue {
    QJsonValue value;
    Timestamp created_at;
    Timestamp expires_at;
    std::vector<std::string> tags;
};

/**
 * In-process tier. Thread-safe; owned by a QueryCache.
 */
class MemoryCache {
public:
    [[nodiscard]] std::optional<CachedValue> get(const std::string& owner_id,
                                                 const std::string& key,
                                                 Timestamp now);
    void put(const std::string& owner_id, const std::string& key, CachedValue value);

    int invalidate_tags(const std::vector<std::string>& tags);
    int remove_matching(std::string_view pattern);  // key substring; empty removes all
    int remove_expired(Timestamp now);
    int remove_created_before(Timestamp cutoff);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t estimated_bytes() const;

private:
    using Key = std::pair<std::string, std::string>;

    mutable std::mutex mu_;
    std::map<Key, CachedValue> entries_;
};

/**
 * SQLite tier (cache_entries + cache_tags). Survives restarts.
 */
class PersistentCache {
public:
    explicit PersistentCache(storage::Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<CachedValue>, Error> get(const std::string& owner_id,
                                                                const std::string& key,
                                                                Timestamp now);
    [[nodiscard]] Result<void, Error> put(const std::string& owner_id,
                                          const std::string& key,
                                          const CachedValue& value);

    [[nodiscard]] Result<int, Error> invalidate_tags(const std::vector<std::string>& tags);
    [[nodiscard]] Result<int, Error> remove_matching(std::string_view pattern);
    [[nodiscard]] Result<int, Error> remove_expired(Timestamp now);
    [[nodiscard]] Result<int, Error> remove_created_before(Timestamp cutoff);
    [[nodiscard]] Result<int64_t, Error> count();

private:
    storage::Database& db_;
};

/**
 * QueryCache - read-through cache in front of arbitrary queries.
 *
 * Lookup order: memory tier, persisted tier, then the query itself. An entry
 * is a hit only while now < expires_at. A memory entry filled from a
 * persisted hit keeps the persisted expiry.
 */
class QueryCache {
public:
    using QueryFn = std::function<Result<QJsonValue, Error>()>;

    struct BatchItem {
        std::string key;
        QueryFn query;
        CacheOptions options;
    };

    QueryCache(storage::Database& db, const Clock& clock, storage::MetricsSink& metrics,
               std::chrono::milliseconds default_ttl = std::chrono::milliseconds(5'000));

    QueryCache(const QueryCache&) = delete;
    QueryCache& operator=(const QueryCache&) = delete;

    [[nodiscard]] Result<QJsonValue, Error> optimized_query(const std::string& owner_id,
                                                            const std::string& key,
                                                            const QueryFn& query,
                                                            const CacheOptions& options = {});

    /**
     * Run several queries. A failing item yields nullopt in its slot and does
     * not stop the rest; one metric covers the whole batch.
     */
    [[nodiscard]] std::vector<std::optional<QJsonValue>> batch_query(const std::string& owner_id,
                                                                     const std::vector<BatchItem>& items);

    /**
     * Drop every entry (both tiers) carrying any of `tags`.
     */
    [[nodiscard]] Result<int, Error> invalidate_tags(const std::vector<std::string>& tags);

    /**
     * Drop entries whose key contains `pattern`; everything when empty.
     */
    [[nodiscard]] Result<int, Error> clear(std::string_view pattern = {});

    [[nodiscard]] Result<int, Error> clean_expired();
    [[nodiscard]] Result<int, Error> remove_created_before(Timestamp cutoff);

    [[nodiscard]] CacheStats stats() const;
    [[nodiscard]] MemoryCache& memory() { return memory_; }
    [[nodiscard]] PersistentCache& persistent() { return persistent_; }
    [[nodiscard]] std::chrono::milliseconds default_ttl() const { return default_ttl_; }

private:
    const Clock& clock_;
    storage::MetricsSink& metrics_;
    std::chrono::milliseconds default_ttl_;
    MemoryCache memory_;
    PersistentCache persistent_;

    mutable std::mutex stats_mu_;
    CacheStats stats_;

    void record_metric(const std::string& operation, double duration_ms, bool success,
                       std::optional<int64_t> count, const std::optional<std::string>& error);
};

} // namespace almanac::cache
