#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <engram/metadata/database.h>

namespace engram::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;      ///< Migration version number
    std::string name; ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for conditional migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Applies registered migrations in version order, one transaction each
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create history table)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations
     */
    Result<void> migrate();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
    Result<void> createMigrationTables();
};

/**
 * @brief Built-in migrations for the memory schema
 */
class MemorySchemaMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    // Version 1: banks, documents, units, entities, links, operations
    static Migration createInitialSchema();

    // Version 2: FTS5 index over unit text (skipped when FTS5 is unavailable)
    static Migration createFTS5Tables();

    // Version 3: units also asserted without a document survive document deletion
    static Migration createDirectRetainTracking();
};

} // namespace engram::metadata
