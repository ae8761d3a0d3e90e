#pragma once

#include "storage/database.hpp"
#include "core/records.hpp"
#include <optional>
#include <vector>

namespace almanac::storage {

class CategoryRepository {
public:
    explicit CategoryRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<RecordId, Error> insert(const Category& category);
    [[nodiscard]] Result<void, Error> update(const Category& category);
    [[nodiscard]] Result<void, Error> remove(RecordId id);

    [[nodiscard]] Result<std::optional<Category>, Error> get(RecordId id);
    [[nodiscard]] Result<std::vector<Category>, Error> by_owner(const std::string& owner_id);
    [[nodiscard]] Result<std::optional<Category>, Error> find_by_name(const std::string& owner_id,
                                                                      const std::string& name);

    [[nodiscard]] Result<void, Error> set_sync_state(RecordId id, SyncStatus status,
                                                     const std::optional<std::string>& remote_id);
    [[nodiscard]] Result<int, Error> reset_sync_state(const std::string& owner_id);
    [[nodiscard]] Result<int, Error> remove_by_owner(const std::string& owner_id);
    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;

    static Category row_to_category(Statement& stmt);
};

} // namespace almanac::storage
