#pragma once

#include <conduit/core/types.h>
#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace conduit::storage {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Existing database, read-write
    Create,    ///< Create if not exists (default)
    Memory     ///< Private in-memory database
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    /// Empty optional binds NULL.
    Result<void> bind(int index, const std::optional<std::string>& value);
    /// Stored as unix epoch seconds.
    Result<void> bind(int index, std::chrono::system_clock::time_point tp);
    Result<void> bind(int index, const std::optional<std::chrono::system_clock::time_point>& tp);

    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /// Run to completion (non-SELECT). Retries SQLITE_BUSY/LOCKED with backoff.
    Result<void> execute();

    /// @return true if a row is available, false when done.
    Result<bool> step();

    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    std::optional<std::string> getOptionalString(int column) const;
    std::chrono::system_clock::time_point getTime(int column) const;
    std::optional<std::chrono::system_clock::time_point> getOptionalTime(int column) const;
    bool isNull(int column) const;

private:
    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::Create);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /// Execute one or more statements without results.
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;
        try {
            auto result = func();
            if (!result) {
                (void)rollback();
                return result;
            }
            return commit();
        } catch (...) {
            (void)rollback();
            throw;
        }
    }

    /// Rows affected by the last INSERT/UPDATE/DELETE.
    int changes() const;

    Result<void> enableWAL();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace conduit::storage
