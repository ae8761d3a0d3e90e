#include "cache/query_cache.hpp"
#include "core/logging.hpp"
#include "core/record_json.hpp"
#include <QJsonArray>
#include <QJsonObject>
#include <algorithm>

namespace almanac::cache {

using storage::Statement;

namespace {

bool has_any_tag(const std::vector<std::string>& entry_tags, const std::vector<std::string>& tags) {
    return std::any_of(entry_tags.begin(), entry_tags.end(), [&](const std::string& t) {
        return std::find(tags.begin(), tags.end(), t) != tags.end();
    });
}

// QJsonDocument only holds objects and arrays, so scalars are wrapped.
std::string encode_payload(const QJsonValue& value) {
    QJsonObject wrapper;
    wrapper.insert(QStringLiteral("v"), value);
    return to_compact_json(wrapper);
}

Result<QJsonValue, Error> decode_payload(std::string_view text) {
    auto parsed = parse_json_object(text);
    if (parsed.is_err()) {
        return Result<QJsonValue, Error>::err(parsed.unwrap_err());
    }
    return Result<QJsonValue, Error>::ok(parsed.unwrap().value(QStringLiteral("v")));
}

std::string like_contains(std::string_view pattern) {
    std::string escaped;
    escaped.reserve(pattern.size() + 2);
    escaped.push_back('%');
    for (char c : pattern) {
        if (c == '%' || c == '_' || c == '\\') escaped.push_back('\\');
        escaped.push_back(c);
    }
    escaped.push_back('%');
    return escaped;
}

Result<int, Error> run_counted(storage::Database& db, Statement& stmt) {
    auto step_result = storage::run(stmt);
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(db.changes());
}

} // namespace

std::string entity_tag(const std::string& owner_id, EntityKind kind) {
    return "owner:" + owner_id + "/" + std::string(to_string(kind));
}

std::string owner_tag(const std::string& owner_id) {
    return "owner:" + owner_id;
}

// ============================================================================
// MemoryCache
// ============================================================================

std::optional<CachedValue> MemoryCache::get(const std::string& owner_id,
                                            const std::string& key,
                                            Timestamp now) {
    std::lock_guard lock(mu_);
    auto it = entries_.find(Key{owner_id, key});
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (!(now < it->second.expires_at)) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second;
}

void MemoryCache::put(const std::string& owner_id, const std::string& key, CachedValue value) {
    std::lock_guard lock(mu_);
    entries_[Key{owner_id, key}] = std::move(value);
}

int MemoryCache::invalidate_tags(const std::vector<std::string>& tags) {
    std::lock_guard lock(mu_);
    return static_cast<int>(std::erase_if(entries_, [&](const auto& item) {
        return has_any_tag(item.second.tags, tags);
    }));
}

int MemoryCache::remove_matching(std::string_view pattern) {
    std::lock_guard lock(mu_);
    return static_cast<int>(std::erase_if(entries_, [&](const auto& item) {
        return pattern.empty() || item.first.second.find(pattern) != std::string::npos;
    }));
}

int MemoryCache::remove_expired(Timestamp now) {
    std::lock_guard lock(mu_);
    return static_cast<int>(std::erase_if(entries_, [&](const auto& item) {
        return !(now < item.second.expires_at);
    }));
}

int MemoryCache::remove_created_before(Timestamp cutoff) {
    std::lock_guard lock(mu_);
    return static_cast<int>(std::erase_if(entries_, [&](const auto& item) {
        return item.second.created_at < cutoff;
    }));
}

size_t MemoryCache::size() const {
    std::lock_guard lock(mu_);
    return entries_.size();
}

size_t MemoryCache::estimated_bytes() const {
    std::lock_guard lock(mu_);
    size_t total = 0;
    for (const auto& [key, entry] : entries_) {
        total += key.first.size() + key.second.size();
        total += encode_payload(entry.value).size();
        for (const auto& tag : entry.tags) total += tag.size();
    }
    return total;
}

// ============================================================================
// PersistentCache
// ============================================================================

Result<std::optional<CachedValue>, Error> PersistentCache::get(const std::string& owner_id,
                                                               const std::string& key,
                                                               Timestamp now) {
    using R = Result<std::optional<CachedValue>, Error>;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, payload, created_at, expires_at FROM cache_entries
        WHERE owner_id = ? AND cache_key = ? AND expires_at > ?;
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id).bind_text(2, key).bind_timestamp(3, now);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }

    const int64_t entry_id = stmt.column_int64(0);
    auto value = decode_payload(stmt.column_text(1));
    if (value.is_err()) {
        return R::err(value.unwrap_err());
    }

    CachedValue cached{
        .value = value.unwrap(),
        .created_at = stmt.column_timestamp(2),
        .expires_at = stmt.column_timestamp(3),
        .tags = {}
    };

    auto tags_result = db_.prepare("SELECT tag FROM cache_tags WHERE entry_id = ? ORDER BY tag;");
    if (tags_result.is_err()) {
        return R::err(tags_result.unwrap_err());
    }
    auto tags_stmt = std::move(tags_result).unwrap();
    tags_stmt.bind_int64(1, entry_id);
    auto tags = storage::collect_rows<std::string>(tags_stmt, [](Statement& s) {
        return s.column_text(0);
    });
    if (tags.is_err()) {
        return R::err(tags.unwrap_err());
    }
    cached.tags = std::move(tags).unwrap();

    return R::ok(std::move(cached));
}

Result<void, Error> PersistentCache::put(const std::string& owner_id,
                                         const std::string& key,
                                         const CachedValue& value) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto upsert_result = db_.prepare(R"SQL(
            INSERT INTO cache_entries (owner_id, cache_key, payload, expires_at, created_at)
            VALUES (?, ?, ?, ?, ?)
            ON CONFLICT(owner_id, cache_key) DO UPDATE SET
                payload = excluded.payload,
                expires_at = excluded.expires_at,
                created_at = excluded.created_at;
        )SQL");
        if (upsert_result.is_err()) {
            return Result<void, Error>::err(upsert_result.unwrap_err());
        }
        auto upsert = std::move(upsert_result).unwrap();
        upsert.bind_text(1, owner_id)
            .bind_text(2, key)
            .bind_text(3, encode_payload(value.value))
            .bind_timestamp(4, value.expires_at)
            .bind_timestamp(5, value.created_at);
        auto step_result = storage::run(upsert);
        if (step_result.is_err()) {
            return step_result;
        }

        // last_insert_rowid is stale after the DO UPDATE branch.
        auto id_result = db_.prepare(
            "SELECT id FROM cache_entries WHERE owner_id = ? AND cache_key = ?;");
        if (id_result.is_err()) {
            return Result<void, Error>::err(id_result.unwrap_err());
        }
        auto id_stmt = std::move(id_result).unwrap();
        id_stmt.bind_text(1, owner_id).bind_text(2, key);
        auto id_step = id_stmt.step();
        if (id_step.is_err()) {
            return Result<void, Error>::err(id_step.unwrap_err());
        }
        if (!id_step.unwrap()) {
            return Result<void, Error>::err(Error{"cache entry vanished after upsert"});
        }
        const int64_t entry_id = id_stmt.column_int64(0);

        auto clear_result = db_.prepare("DELETE FROM cache_tags WHERE entry_id = ?;");
        if (clear_result.is_err()) {
            return Result<void, Error>::err(clear_result.unwrap_err());
        }
        auto clear = std::move(clear_result).unwrap();
        clear.bind_int64(1, entry_id);
        auto clear_step = storage::run(clear);
        if (clear_step.is_err()) {
            return clear_step;
        }

        for (const auto& tag : value.tags) {
            auto tag_result = db_.prepare(
                "INSERT OR IGNORE INTO cache_tags (entry_id, tag) VALUES (?, ?);");
            if (tag_result.is_err()) {
                return Result<void, Error>::err(tag_result.unwrap_err());
            }
            auto tag_stmt = std::move(tag_result).unwrap();
            tag_stmt.bind_int64(1, entry_id).bind_text(2, tag);
            auto tag_step = storage::run(tag_stmt);
            if (tag_step.is_err()) {
                return tag_step;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<int, Error> PersistentCache::invalidate_tags(const std::vector<std::string>& tags) {
    int removed = 0;
    for (const auto& tag : tags) {
        auto stmt_result = db_.prepare(R"SQL(
            DELETE FROM cache_entries
            WHERE id IN (SELECT entry_id FROM cache_tags WHERE tag = ?);
        )SQL");
        if (stmt_result.is_err()) {
            return Result<int, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        stmt.bind_text(1, tag);
        auto count = run_counted(db_, stmt);
        if (count.is_err()) {
            return count;
        }
        removed += count.unwrap();
    }
    return Result<int, Error>::ok(removed);
}

Result<int, Error> PersistentCache::remove_matching(std::string_view pattern) {
    if (pattern.empty()) {
        auto stmt_result = db_.prepare("DELETE FROM cache_entries;");
        if (stmt_result.is_err()) {
            return Result<int, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        return run_counted(db_, stmt);
    }

    auto stmt_result = db_.prepare("DELETE FROM cache_entries WHERE cache_key LIKE ? ESCAPE '\\';");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, like_contains(pattern));
    return run_counted(db_, stmt);
}

Result<int, Error> PersistentCache::remove_expired(Timestamp now) {
    auto stmt_result = db_.prepare("DELETE FROM cache_entries WHERE expires_at <= ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, now);
    return run_counted(db_, stmt);
}

Result<int, Error> PersistentCache::remove_created_before(Timestamp cutoff) {
    auto stmt_result = db_.prepare("DELETE FROM cache_entries WHERE created_at < ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_timestamp(1, cutoff);
    return run_counted(db_, stmt);
}

Result<int64_t, Error> PersistentCache::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM cache_entries;");
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

// ============================================================================
// QueryCache
// ============================================================================

QueryCache::QueryCache(storage::Database& db, const Clock& clock, storage::MetricsSink& metrics,
                       std::chrono::milliseconds default_ttl)
    : clock_(clock)
    , metrics_(metrics)
    , default_ttl_(default_ttl)
    , persistent_(db) {}

Result<QJsonValue, Error> QueryCache::optimized_query(const std::string& owner_id,
                                                      const std::string& key,
                                                      const QueryFn& query,
                                                      const CacheOptions& options) {
    const std::string operation = options.operation.empty() ? "query." + key : options.operation;

    if (options.cache) {
        const auto now = clock_.now();

        if (auto hit = memory_.get(owner_id, key, now)) {
            std::lock_guard lock(stats_mu_);
            ++stats_.memory_hits;
            return Result<QJsonValue, Error>::ok(hit->value);
        }

        auto persisted = persistent_.get(owner_id, key, now);
        if (persisted.is_err()) {
            // The persisted tier is an optimization; fall through to the query.
            qCWarning(almanacCacheLog) << "QueryCache: persisted lookup failed for"
                                       << to_qstring(key) << ":"
                                       << to_qstring(persisted.unwrap_err().message);
        } else if (auto hit = std::move(persisted).unwrap()) {
            {
                std::lock_guard lock(stats_mu_);
                ++stats_.persisted_hits;
            }
            auto value = hit->value;
            memory_.put(owner_id, key, std::move(*hit));
            return Result<QJsonValue, Error>::ok(std::move(value));
        }
    }

    {
        std::lock_guard lock(stats_mu_);
        ++stats_.misses;
    }

    Stopwatch watch;
    auto result = query();
    const double elapsed = watch.elapsed_ms();

    if (result.is_err()) {
        record_metric(operation, elapsed, false, std::nullopt, result.unwrap_err().message);
        return result;
    }

    const auto& value = result.unwrap();
    std::optional<int64_t> count;
    if (value.isArray()) count = value.toArray().size();
    record_metric(operation, elapsed, true, count, std::nullopt);

    if (options.cache) {
        const auto now = clock_.now();
        CachedValue cached{
            .value = value,
            .created_at = now,
            .expires_at = now + options.ttl.value_or(default_ttl_),
            .tags = options.tags
        };
        auto put_result = persistent_.put(owner_id, key, cached);
        if (put_result.is_err()) {
            qCWarning(almanacCacheLog) << "QueryCache: could not persist" << to_qstring(key)
                                       << ":" << to_qstring(put_result.unwrap_err().message);
        }
        memory_.put(owner_id, key, std::move(cached));
    }

    return result;
}

std::vector<std::optional<QJsonValue>> QueryCache::batch_query(const std::string& owner_id,
                                                               const std::vector<BatchItem>& items) {
    Stopwatch watch;
    std::vector<std::optional<QJsonValue>> results;
    results.reserve(items.size());
    int failures = 0;

    for (const auto& item : items) {
        auto result = optimized_query(owner_id, item.key, item.query, item.options);
        if (result.is_err()) {
            ++failures;
            qCWarning(almanacCacheLog) << "QueryCache: batch item" << to_qstring(item.key)
                                       << "failed:" << to_qstring(result.unwrap_err().message);
            results.push_back(std::nullopt);
        } else {
            results.push_back(std::move(result).unwrap());
        }
    }

    std::optional<std::string> error;
    if (failures > 0) error = std::to_string(failures) + " of " + std::to_string(items.size()) + " failed";
    record_metric("query.batch", watch.elapsed_ms(), failures == 0,
                  static_cast<int64_t>(items.size()), error);
    return results;
}

Result<int, Error> QueryCache::invalidate_tags(const std::vector<std::string>& tags) {
    if (tags.empty()) {
        return Result<int, Error>::ok(0);
    }
    const int from_memory = memory_.invalidate_tags(tags);
    auto from_disk = persistent_.invalidate_tags(tags);
    if (from_disk.is_err()) {
        return from_disk;
    }
    return Result<int, Error>::ok(from_memory + from_disk.unwrap());
}

Result<int, Error> QueryCache::clear(std::string_view pattern) {
    const int from_memory = memory_.remove_matching(pattern);
    auto from_disk = persistent_.remove_matching(pattern);
    if (from_disk.is_err()) {
        return from_disk;
    }
    return Result<int, Error>::ok(from_memory + from_disk.unwrap());
}

Result<int, Error> QueryCache::clean_expired() {
    const auto now = clock_.now();
    const int from_memory = memory_.remove_expired(now);
    auto from_disk = persistent_.remove_expired(now);
    if (from_disk.is_err()) {
        return from_disk;
    }
    return Result<int, Error>::ok(from_memory + from_disk.unwrap());
}

Result<int, Error> QueryCache::remove_created_before(Timestamp cutoff) {
    const int from_memory = memory_.remove_created_before(cutoff);
    auto from_disk = persistent_.remove_created_before(cutoff);
    if (from_disk.is_err()) {
        return from_disk;
    }
    return Result<int, Error>::ok(from_memory + from_disk.unwrap());
}

CacheStats QueryCache::stats() const {
    std::lock_guard lock(stats_mu_);
    CacheStats s = stats_;
    s.memory_entries = memory_.size();
    return s;
}

void QueryCache::record_metric(const std::string& operation, double duration_ms, bool success,
                               std::optional<int64_t> count, const std::optional<std::string>& error) {
    auto result = metrics_.record(storage::Metric{
        .operation = operation,
        .duration_ms = duration_ms,
        .record_count = count,
        .timestamp = clock_.now(),
        .success = success,
        .error = error
    });
    if (result.is_err()) {
        qCWarning(almanacCacheLog) << "QueryCache: failed to record metric"
                                   << to_qstring(operation) << ":"
                                   << to_qstring(result.unwrap_err().message);
    }
}

} // namespace almanac::cache
