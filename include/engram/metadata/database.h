#pragma once

#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <engram/core/types.h>

namespace engram::metadata {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default), the file must exist
    Create     ///< Create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement (1-based index)
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, TimePoint tp);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    Result<void> bind(int index, std::size_t value) {
        return bind(index, static_cast<int64_t>(value));
    }
    Result<void> bind(int index, float value) { return bind(index, static_cast<double>(value)); }

    // Nullable columns
    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        if (!value)
            return bind(index, nullptr);
        return bind(index, *value);
    }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    TimePoint getTime(int column) const;
    std::optional<TimePoint> getOptionalTime(int column) const;
    std::optional<std::string> getOptionalString(int column) const;
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

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries, may hold several statements)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();
    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Execute within transaction; rolled back when @p func fails or throws
     */
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
            auto commitResult = commit();
            if (!commitResult) {
                (void)rollback();
            }
            return commitResult;
        } catch (...) {
            (void)rollback();
            throw;
        }
    }

    /**
     * @brief Get number of rows affected by last query
     */
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    /**
     * @brief Check if FTS5 is compiled into the linked SQLite
     */
    Result<bool> hasFTS5();

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

/**
 * @brief Query builder for the filtered listing queries
 */
class QueryBuilder {
public:
    QueryBuilder() = default;

    QueryBuilder& select(const std::vector<std::string>& columns = {});
    QueryBuilder& from(const std::string& table);
    QueryBuilder& deleteFrom(const std::string& table);
    QueryBuilder& where(const std::string& condition);
    QueryBuilder& andWhere(const std::string& condition);
    QueryBuilder& orderBy(const std::string& orderClause);
    QueryBuilder& limit(int limit);
    QueryBuilder& offset(int offset);

    [[nodiscard]] std::string build() const;

private:
    enum class QueryType { None, Select, Delete };

    QueryType type_ = QueryType::None;
    std::string table_;
    std::vector<std::string> selectColumns_;
    std::vector<std::string> whereClauses_;
    std::string orderByClause_;
    int limit_ = -1;
    int offset_ = -1;
};

} // namespace engram::metadata
