#include "storage/database.hpp"
#include "core/logging.hpp"

namespace almanac::storage {

// ============================================================================
// Statement implementation
// ============================================================================

Statement& Statement::record_bind(int rc, const char* what) {
    if (rc != SQLITE_OK && !bind_error_) {
        bind_error_ = Error{std::string("Failed to bind ") + what, rc};
    }
    return *this;
}

Statement& Statement::bind_text(int index, std::string_view text) {
    return record_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                         static_cast<int>(text.size()), SQLITE_TRANSIENT),
                       "text");
}

Statement& Statement::bind_int(int index, int value) {
    return record_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Statement& Statement::bind_int64(int index, int64_t value) {
    return record_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Statement& Statement::bind_double(int index, double value) {
    return record_bind(sqlite3_bind_double(stmt_.get(), index, value), "double");
}

Statement& Statement::bind_blob(int index, const void* data, size_t size) {
    if (size > 0 && !data) {
        return record_bind(SQLITE_MISUSE, "blob (null data)");
    }
    const char* empty = "";
    const void* safe_data = (size == 0) ? static_cast<const void*>(empty) : data;
    return record_bind(sqlite3_bind_blob(stmt_.get(), index, safe_data,
                                         static_cast<int>(size), SQLITE_TRANSIENT),
                       "blob");
}

Statement& Statement::bind_null(int index) {
    return record_bind(sqlite3_bind_null(stmt_.get(), index), "null");
}

Statement& Statement::bind_optional_text(int index, const std::optional<std::string>& text) {
    return text ? bind_text(index, *text) : bind_null(index);
}

Statement& Statement::bind_optional_timestamp(int index, const std::optional<Timestamp>& value) {
    return value ? bind_int64(index, value->millis()) : bind_null(index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

std::vector<uint8_t> Statement::column_blob(int index) const {
    const void* data = sqlite3_column_blob(stmt_.get(), index);
    int size = sqlite3_column_bytes(stmt_.get(), index);
    if (!data || size <= 0) return {};

    const auto* bytes = static_cast<const uint8_t*>(data);
    return std::vector<uint8_t>(bytes, bytes + size);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

std::optional<Timestamp> Statement::column_optional_timestamp(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return Timestamp(column_int64(index));
}

Result<bool, Error> Statement::step() {
    if (bind_error_) {
        return Result<bool, Error>::err(*bind_error_);
    }
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(
        Error{std::string("Step failed: ") + (db ? sqlite3_errmsg(db) : "unknown"), rc});
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{"Reset failed", rc});
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_),
      commit_hook_(std::move(other.commit_hook_)),
      savepoint_depth_(other.savepoint_depth_) {
    other.db_ = nullptr;
    other.savepoint_depth_ = 0;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        commit_hook_ = std::move(other.commit_hook_);
        savepoint_depth_ = other.savepoint_depth_;
        other.db_ = nullptr;
        other.savepoint_depth_ = 0;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(Error{error, rc});
    }

    Database db(raw);

    auto fk = db.execute("PRAGMA foreign_keys = ON;");
    if (fk.is_err()) {
        return Result<Database, Error>::err(fk.unwrap_err());
    }

    // WAL is unavailable for :memory: databases; SQLite then keeps "memory".
    auto wal = db.execute("PRAGMA journal_mode = WAL;");
    if (wal.is_err()) {
        qCWarning(almanacStoreLog) << "Database: WAL not enabled:"
                                   << QString::fromStdString(wal.unwrap_err().message);
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_commit_hook(db_, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{error, rc});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

bool Database::in_transaction() const {
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

void Database::rollback_if_active() {
    // A vetoed COMMIT has already rolled back; only an open transaction needs it.
    if (!in_transaction()) return;
    auto result = rollback();
    if (result.is_err()) {
        qCWarning(almanacStoreLog) << "Database: rollback failed:"
                                   << QString::fromStdString(result.unwrap_err().message);
    }
}

void Database::rollback_savepoint(const std::string& name) {
    auto result = execute("ROLLBACK TO " + name + "; RELEASE " + name + ";");
    if (result.is_err()) {
        qCWarning(almanacStoreLog) << "Database: rollback to savepoint" << QString::fromStdString(name)
                                   << "failed:" << QString::fromStdString(result.unwrap_err().message);
    }
}

void Database::set_commit_hook(CommitHook hook) {
    if (!db_) return;
    if (!hook) {
        sqlite3_commit_hook(db_, nullptr, nullptr);
        commit_hook_.reset();
        return;
    }
    commit_hook_ = std::make_unique<CommitHook>(std::move(hook));
    sqlite3_commit_hook(
        db_,
        [](void* data) -> int {
            auto* fn = static_cast<CommitHook*>(data);
            return (*fn)() ? 0 : 1;
        },
        commit_hook_.get());
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db) : db_(db) {
    auto result = db_.begin_transaction();
    active_ = result.is_ok();
    if (!active_) {
        qCWarning(almanacStoreLog) << "TransactionGuard: begin failed:"
                                   << QString::fromStdString(result.unwrap_err().message);
    }
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        rollback();
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return Result<void, Error>::err(Error{ErrorKind::TransactionFailure, "No active transaction"});
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
        return result;
    }
    if (!db_.in_transaction()) {
        active_ = false;
    }
    return Result<void, Error>::err(result.unwrap_err().with_kind(ErrorKind::TransactionFailure));
}

void TransactionGuard::rollback() {
    if (!active_) return;
    active_ = false;
    if (!db_.in_transaction()) return;
    auto result = db_.rollback();
    if (result.is_err()) {
        qCWarning(almanacStoreLog) << "TransactionGuard: rollback failed:"
                                   << QString::fromStdString(result.unwrap_err().message);
    }
}

} // namespace almanac::storage
