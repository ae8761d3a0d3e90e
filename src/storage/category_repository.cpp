#include "storage/category_repository.hpp"

namespace almanac::storage {

Category CategoryRepository::row_to_category(Statement& stmt) {
    return Category{
        .id = stmt.column_int64(0),
        .remote_id = stmt.column_optional_text(1),
        .owner_id = stmt.column_text(2),
        .name = stmt.column_text(3),
        .color = stmt.column_text(4),
        .icon = stmt.column_optional_text(5),
        .sync_status = parse_sync_status(stmt.column_text(6)).value_or(SyncStatus::Local),
        .created_at = stmt.column_timestamp(7),
        .updated_at = stmt.column_timestamp(8)
    };
}

Result<RecordId, Error> CategoryRepository::insert(const Category& c) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO categories (remote_id, owner_id, name, color, icon, sync_status,
                                created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<RecordId, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_optional_text(1, c.remote_id)
        .bind_text(2, c.owner_id)
        .bind_text(3, c.name)
        .bind_text(4, c.color)
        .bind_optional_text(5, c.icon)
        .bind_text(6, to_string(c.sync_status))
        .bind_timestamp(7, c.created_at)
        .bind_timestamp(8, c.updated_at);

    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<RecordId, Error>::err(step_result.unwrap_err());
    }
    return Result<RecordId, Error>::ok(db_.last_insert_rowid());
}

Result<void, Error> CategoryRepository::update(const Category& c) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE categories SET remote_id = ?, owner_id = ?, name = ?, color = ?, icon = ?,
                              sync_status = ?, created_at = ?, updated_at = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_optional_text(1, c.remote_id)
        .bind_text(2, c.owner_id)
        .bind_text(3, c.name)
        .bind_text(4, c.color)
        .bind_optional_text(5, c.icon)
        .bind_text(6, to_string(c.sync_status))
        .bind_timestamp(7, c.created_at)
        .bind_timestamp(8, c.updated_at)
        .bind_int64(9, c.id);

    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return step_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "category " + std::to_string(c.id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> CategoryRepository::remove(RecordId id) {
    auto stmt_result = db_.prepare("DELETE FROM categories WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return step_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "category " + std::to_string(id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<std::optional<Category>, Error> CategoryRepository::get(RecordId id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, remote_id, owner_id, name, color, icon, sync_status, created_at, updated_at
        FROM categories WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::optional<Category>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);
    return first_row<Category>(stmt, row_to_category);
}

Result<std::vector<Category>, Error> CategoryRepository::by_owner(const std::string& owner_id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, remote_id, owner_id, name, color, icon, sync_status, created_at, updated_at
        FROM categories WHERE owner_id = ? ORDER BY name, id;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<Category>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    return collect_rows<Category>(stmt, row_to_category);
}

Result<std::optional<Category>, Error> CategoryRepository::find_by_name(const std::string& owner_id,
                                                                        const std::string& name) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, remote_id, owner_id, name, color, icon, sync_status, created_at, updated_at
        FROM categories WHERE owner_id = ? AND name = ? ORDER BY id LIMIT 1;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::optional<Category>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id).bind_text(2, name);
    return first_row<Category>(stmt, row_to_category);
}

Result<void, Error> CategoryRepository::set_sync_state(RecordId id, SyncStatus status,
                                                       const std::optional<std::string>& remote_id) {
    auto stmt_result = db_.prepare(
        "UPDATE categories SET sync_status = ?, remote_id = COALESCE(?, remote_id) WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, to_string(status)).bind_optional_text(2, remote_id).bind_int64(3, id);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return step_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "category " + std::to_string(id) + " not found"});
    }
    return Result<void, Error>::ok();
}

Result<int, Error> CategoryRepository::reset_sync_state(const std::string& owner_id) {
    auto stmt_result = db_.prepare(
        "UPDATE categories SET sync_status = 'local', remote_id = NULL WHERE owner_id = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<int, Error> CategoryRepository::remove_by_owner(const std::string& owner_id) {
    auto stmt_result = db_.prepare("DELETE FROM categories WHERE owner_id = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, owner_id);
    auto step_result = run(stmt);
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(db_.changes());
}

Result<int64_t, Error> CategoryRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM categories;");
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

} // namespace almanac::storage
