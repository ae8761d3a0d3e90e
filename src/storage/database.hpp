#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace almanac::storage {

/**
 * SQLite statement wrapper with RAII.
 *
 * Binders chain and remember the first failure; step() reports it, so a
 * call site binds everything and checks once.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Statement& bind_text(int index, std::string_view text);
    Statement& bind_int(int index, int value);
    Statement& bind_int64(int index, int64_t value);
    Statement& bind_double(int index, double value);
    Statement& bind_blob(int index, const void* data, size_t size);
    Statement& bind_null(int index);
    Statement& bind_bool(int index, bool value) { return bind_int(index, value ? 1 : 0); }
    Statement& bind_timestamp(int index, Timestamp value) { return bind_int64(index, value.millis()); }
    Statement& bind_optional_text(int index, const std::optional<std::string>& text);
    Statement& bind_optional_timestamp(int index, const std::optional<Timestamp>& value);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] std::vector<uint8_t> column_blob(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] bool column_bool(int index) const { return column_int(index) != 0; }
    [[nodiscard]] Timestamp column_timestamp(int index) const { return Timestamp(column_int64(index)); }
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] std::optional<Timestamp> column_optional_timestamp(int index) const;

    Result<bool, Error> step();  // true if a row is available
    Result<void, Error> reset();

private:
    Statement& record_bind(int rc, const char* what);

    std::shared_ptr<sqlite3_stmt> stmt_;
    std::optional<Error> bind_error_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * - RAII connection management
 * - Transactions that nest: the outermost call is BEGIN/COMMIT, inner calls
 *   become SAVEPOINTs so a failed inner unit rolls back alone
 * - Commit hook for vetoing commits (used to inject transaction failures)
 * - Error handling via Result
 */
class Database {
public:
    // Return false to turn the pending COMMIT into a rollback.
    using CommitHook = std::function<bool()>;

    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run `sql` and hand every row to `callback`.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Run `f` atomically. Commits on Ok, rolls back on Err. A failed COMMIT
     * (including a commit-hook veto) is reported as TransactionFailure.
     * Called inside an open transaction, `f` runs in a savepoint instead.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        if (in_transaction()) {
            return in_savepoint(std::forward<F>(f));
        }

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            rollback_if_active();
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            rollback_if_active();
            return ResultType::err(commit_result.unwrap_err().with_kind(ErrorKind::TransactionFailure));
        }

        return result;
    }

    /**
     * True while a BEGIN is open on this connection.
     */
    [[nodiscard]] bool in_transaction() const;

    /**
     * Install (or with an empty function, remove) the commit hook.
     */
    void set_commit_hook(CommitHook hook);

    [[nodiscard]] int64_t last_insert_rowid() const;
    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    template<typename F>
    auto in_savepoint(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        const auto name = "sp_" + std::to_string(++savepoint_depth_);
        auto begin_result = execute("SAVEPOINT " + name + ";");
        if (begin_result.is_err()) {
            --savepoint_depth_;
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            rollback_savepoint(name);
            --savepoint_depth_;
            return result;
        }

        auto release_result = execute("RELEASE " + name + ";");
        --savepoint_depth_;
        if (release_result.is_err()) {
            return ResultType::err(release_result.unwrap_err());
        }
        return result;
    }

    void rollback_if_active();
    void rollback_savepoint(const std::string& name);

    sqlite3* db_ = nullptr;
    std::unique_ptr<CommitHook> commit_hook_;
    int savepoint_depth_ = 0;
};

/**
 * Transaction RAII guard.
 * Rolls back on destruction unless committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] Result<void, Error> commit();
    void rollback();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    Database& db_;
    bool active_ = false;
};

/**
 * Step `stmt` to completion, converting every row with `row_fn`.
 */
template<typename T, typename RowFn>
[[nodiscard]] Result<std::vector<T>, Error> collect_rows(Statement& stmt, RowFn&& row_fn) {
    std::vector<T> rows;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<T>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        rows.push_back(row_fn(stmt));
    }
    return Result<std::vector<T>, Error>::ok(std::move(rows));
}

/**
 * Step `stmt` once; nullopt when there is no row.
 */
template<typename T, typename RowFn>
[[nodiscard]] Result<std::optional<T>, Error> first_row(Statement& stmt, RowFn&& row_fn) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<T>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<T>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<T>, Error>::ok(row_fn(stmt));
}

/**
 * Step a statement that returns no rows.
 */
[[nodiscard]] inline Result<void, Error> run(Statement& stmt) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace almanac::storage
