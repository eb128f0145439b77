#pragma once

#include <docent/core/types.h>

#include <sqlite3.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docent::metadata {

struct OpenOptions {
    bool readOnly = false;
    int busyTimeoutMs = 5000;
    bool foreignKeys = true;
};

/**
 * @brief Owning handle for a prepared statement.
 *
 * Statements are produced by Database::prepare and must not outlive the connection.
 * Parameters are 1-based, columns 0-based, as in SQLite.
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    Result<void> bind(int index, std::span<const std::byte> blob);

    /// Binds arguments to parameters 1..N, stopping at the first failure.
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 0;
        Result<void> status;
        auto next = [&](auto&& value) {
            if (status)
                status = bind(++index, std::forward<decltype(value)>(value));
        };
        (next(std::forward<Args>(args)), ...);
        return status;
    }

    /// Runs a statement whose rows, if any, are not needed.
    Result<void> execute();

    /// Advances to the next row; false once the statement is exhausted.
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Result<void> check(int rc, const char* what) const;

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief The single SQLite connection an engine's repositories share.
 *
 * Callers that need several statements to observe a consistent state take lock() or run
 * inside transaction(); both hold the recursive connection mutex.
 */
class Database {
public:
    using Lock = std::unique_lock<std::recursive_mutex>;

    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Opens (creating when writable) the file at path; ":memory:" gives a private database.
    Result<void> open(const std::string& path, const OpenOptions& options = {});
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    [[nodiscard]] Lock lock() { return Lock(mutex_); }

    Result<Statement> prepare(std::string_view sql);

    /// Runs one or more statements with no parameters.
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    /**
     * @brief Runs func inside BEGIN IMMEDIATE ... COMMIT.
     *
     * An error result or an exception from func rolls the transaction back; the exception is
     * rethrown after the rollback.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto guard = lock();
        if (auto begun = beginTransaction(); !begun)
            return begun;

        Result<void> outcome;
        try {
            outcome = func();
        } catch (...) {
            abandonTransaction();
            throw;
        }
        if (!outcome) {
            abandonTransaction();
            return outcome;
        }
        return commit();
    }

    int64_t lastInsertRowId() const;
    int changes() const;

    Result<bool> tableExists(const std::string& table);
    Result<void> enableWAL();

private:
    void abandonTransaction();

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
    std::recursive_mutex mutex_;
};

} // namespace docent::metadata
