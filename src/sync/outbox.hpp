#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace almanac::sync {

enum class OutboxOperation {
    Create,
    Update,
    Delete
};

[[nodiscard]] constexpr std::string_view to_string(OutboxOperation op) noexcept {
    switch (op) {
        case OutboxOperation::Create: return "create";
        case OutboxOperation::Update: return "update";
        case OutboxOperation::Delete: return "delete";
    }
    return "update";
}

[[nodiscard]] std::optional<OutboxOperation> parse_outbox_operation(std::string_view s);

/**
 * A mutation waiting to be propagated to the remote. `payload_json` is the
 * record snapshot for create/update and {"id", "hard"} for delete.
 */
struct OutboxEntry {
    int64_t id{0};
    std::string owner_id;
    OutboxOperation operation{OutboxOperation::Update};
    EntityKind entity{EntityKind::Event};
    RecordId entity_id{0};
    std::string payload_json{"{}"};
    int attempts{0};
    std::optional<Timestamp> last_attempt;
    std::optional<std::string> last_error;
    Timestamp created_at;
};

struct OutboxStats {
    int total{0};
    int pending{0};   // attempts below the limit
    int failed{0};    // attempts at or above the limit
    std::map<OutboxOperation, int> by_operation;
};

/**
 * Entries older than `max_age` that have used up `max_attempts` are dropped.
 */
struct ReapPolicy {
    std::chrono::milliseconds max_age{std::chrono::hours(24 * 7)};
    int max_attempts{3};
};

/**
 * Outbox - durable queue of pending remote mutations (the sync_queue table).
 *
 * The store enqueues inside the transaction of the mutation it describes,
 * so an entry exists exactly when its mutation committed.
 */
class Outbox {
public:
    Outbox(storage::Database& db, const Clock& clock, int max_attempts = 3)
        : db_(db), clock_(clock), max_attempts_(max_attempts) {}

    [[nodiscard]] Result<int64_t, Error> enqueue(const std::string& owner_id,
                                                 OutboxOperation operation,
                                                 EntityKind entity,
                                                 RecordId entity_id,
                                                 const std::string& payload_json);

    /**
     * Every entry of the owner, oldest first.
     */
    [[nodiscard]] Result<std::vector<OutboxEntry>, Error> list(const std::string& owner_id);

    /**
     * Entries of every owner still eligible for delivery, oldest first. The
     * entries stay queued until remove() is called for them.
     */
    [[nodiscard]] Result<std::vector<OutboxEntry>, Error> drain(int limit = 0);

    /**
     * The owner's deliverable entries (attempts below the limit), oldest first.
     */
    [[nodiscard]] Result<std::vector<OutboxEntry>, Error> pending(const std::string& owner_id,
                                                                  int limit = 50);

    [[nodiscard]] Result<std::optional<OutboxEntry>, Error> get(int64_t id);

    /**
     * True if any entry still refers to the entity.
     */
    [[nodiscard]] Result<bool, Error> has_entries_for(EntityKind entity, RecordId entity_id);

    [[nodiscard]] Result<void, Error> mark_attempted(int64_t id, const std::string& error);
    [[nodiscard]] Result<void, Error> remove(int64_t id);
    [[nodiscard]] Result<int, Error> clear(const std::string& owner_id);
    [[nodiscard]] Result<OutboxStats, Error> stats(const std::string& owner_id);

    /**
     * Delete exhausted entries per `policy`. Each reaped entry is logged and
     * returned.
     */
    [[nodiscard]] Result<std::vector<OutboxEntry>, Error> reap(const ReapPolicy& policy = {});

    [[nodiscard]] int max_attempts() const { return max_attempts_; }

private:
    storage::Database& db_;
    const Clock& clock_;
    int max_attempts_;

    static OutboxEntry row_to_entry(storage::Statement& stmt);
};

} // namespace almanac::sync
