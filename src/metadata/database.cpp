#include <docent/metadata/database.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>
#include <utility>

namespace docent::metadata {

namespace {

constexpr int kLockRetries = 5;
constexpr std::chrono::milliseconds kFirstLockBackoff{10};
constexpr size_t kSqlSnippetLength = 100;

bool isLockContention(int rc) {
    return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

// Steps once, retrying with doubling backoff while another connection holds the lock.
int stepWithBackoff(sqlite3_stmt* stmt) {
    auto delay = kFirstLockBackoff;
    int rc = sqlite3_step(stmt);
    for (int attempt = 1; attempt < kLockRetries && isLockContention(rc); ++attempt) {
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(delay);
        delay *= 2;
        rc = sqlite3_step(stmt);
    }
    return rc;
}

std::string describeFailure(sqlite3_stmt* stmt, int rc) {
    std::string message = sqlite3_errstr(rc);
    if (sqlite3* db = sqlite3_db_handle(stmt)) {
        const char* detail = sqlite3_errmsg(db);
        if (detail && message != detail)
            message += fmt::format(" ({})", detail);
    }
    if (const char* sql = sqlite3_sql(stmt)) {
        std::string_view text(sql);
        message += fmt::format(" [SQL: {}{}]", text.substr(0, kSqlSnippetLength),
                               text.size() > kSqlSnippetLength ? "..." : "");
    }
    return message;
}

Error notOpen() {
    return Error{ErrorCode::InvalidState, "database is not open"};
}

} // namespace

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::check(int rc, const char* what) const {
    if (rc == SQLITE_OK)
        return {};
    return Error{ErrorCode::DatabaseError,
                 fmt::format("{} failed: {}", what, describeFailure(stmt_, rc))};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return check(sqlite3_bind_null(stmt_, index), "bind null");
}

Result<void> Statement::bind(int index, int value) {
    return check(sqlite3_bind_int(stmt_, index, value), "bind int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return check(sqlite3_bind_int64(stmt_, index, value), "bind int64");
}

Result<void> Statement::bind(int index, double value) {
    return check(sqlite3_bind_double(stmt_, index, value), "bind double");
}

Result<void> Statement::bind(int index, std::string_view value) {
    // A null pointer would bind SQL NULL instead of an empty string
    const char* text = value.data() ? value.data() : "";
    return check(
        sqlite3_bind_text64(stmt_, index, text, value.size(), SQLITE_TRANSIENT, SQLITE_UTF8),
        "bind text");
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    return check(sqlite3_bind_blob64(stmt_, index, blob.data(), blob.size(), SQLITE_TRANSIENT),
                 "bind blob");
}

Result<void> Statement::execute() {
    auto more = step();
    if (!more)
        return more.error();
    return {};
}

Result<bool> Statement::step() {
    if (!stmt_)
        return Error{ErrorCode::InvalidState, "step on an empty statement"};
    int rc = stepWithBackoff(stmt_);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return Error{ErrorCode::DatabaseError, "step failed: " + describeFailure(stmt_, rc)};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    int length = sqlite3_column_bytes(stmt_, column);
    if (!text || length <= 0)
        return {};
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(length));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const auto* data = static_cast<const std::byte*>(sqlite3_column_blob(stmt_, column));
    int length = sqlite3_column_bytes(stmt_, column);
    if (!data || length <= 0)
        return {};
    return std::vector<std::byte>(data, data + length);
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Database::~Database() {
    close();
}

Result<void> Database::open(const std::string& path, const OpenOptions& options) {
    auto guard = lock();
    if (db_)
        return Error{ErrorCode::InvalidState, fmt::format("database {} is already open", path_)};

    int flags = SQLITE_OPEN_FULLMUTEX |
                (options.readOnly ? SQLITE_OPEN_READONLY
                                  : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return Error{ErrorCode::DatabaseError, fmt::format("cannot open {}: {}", path, reason)};
    }

    db_ = handle;
    path_ = path;
    sqlite3_busy_timeout(db_, options.busyTimeoutMs);
    spdlog::debug("[Database] opened {}{}", path, options.readOnly ? " (read-only)" : "");

    if (options.foreignKeys) {
        if (auto pragma = execute("PRAGMA foreign_keys = ON"); !pragma) {
            close();
            return pragma;
        }
    }
    return {};
}

void Database::close() {
    auto guard = lock();
    if (!db_)
        return;
    // Statements still alive keep the handle open until they are finalized
    sqlite3_close_v2(db_);
    db_ = nullptr;
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(std::string_view sql) {
    auto guard = lock();
    if (!db_)
        return notOpen();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError,
                     fmt::format("prepare failed: {} [SQL: {}]", sqlite3_errmsg(db_),
                                 sql.substr(0, kSqlSnippetLength))};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    auto guard = lock();
    if (!db_)
        return notOpen();

    char* message = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) == SQLITE_OK)
        return {};

    std::string reason = message ? message : sqlite3_errmsg(db_);
    sqlite3_free(message);
    spdlog::error("[Database] exec failed: {} [SQL: {}]", reason,
                  std::string_view(sql).substr(0, kSqlSnippetLength));
    return Error{ErrorCode::DatabaseError, "exec failed: " + reason};
}

Result<void> Database::beginTransaction() {
    auto guard = lock();
    if (inTransaction_)
        return Error{ErrorCode::InvalidState, "a transaction is already open"};
    auto begun = execute("BEGIN IMMEDIATE");
    inTransaction_ = static_cast<bool>(begun);
    return begun;
}

Result<void> Database::commit() {
    auto guard = lock();
    if (!inTransaction_)
        return Error{ErrorCode::InvalidState, "commit without a transaction"};
    auto committed = execute("COMMIT");
    if (committed)
        inTransaction_ = false;
    return committed;
}

Result<void> Database::rollback() {
    auto guard = lock();
    if (!inTransaction_)
        return Error{ErrorCode::InvalidState, "rollback without a transaction"};
    inTransaction_ = false;
    return execute("ROLLBACK");
}

void Database::abandonTransaction() {
    if (auto undone = rollback(); !undone)
        spdlog::warn("[Database] rollback failed: {}", undone.error().message);
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto guard = lock();
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!stmt)
        return stmt.error();
    if (auto bound = stmt.value().bind(1, table); !bound)
        return bound.error();
    return stmt.value().step();
}

Result<void> Database::enableWAL() {
    // In-memory databases keep the "memory" journal mode
    return execute("PRAGMA journal_mode = WAL");
}

} // namespace docent::metadata
