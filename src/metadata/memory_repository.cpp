#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>
#include <engram/metadata/memory_repository.h>
#include <engram/metadata/migration.h>

namespace engram::metadata {

Result<std::unique_ptr<MemoryRepository>> MemoryRepository::create(const std::string& path,
                                                                   ConnectionPoolConfig config) {
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "Database path is empty"};
    }

    if (path == ":memory:") {
        // Every in-memory connection is a separate database
        config.minConnections = 1;
        config.maxConnections = 1;
        config.enableWAL = false;
    } else {
        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return Error{ErrorCode::DatabaseError,
                             "Cannot create data directory " + parent.string() + ": " +
                                 ec.message()};
            }
        }
    }

    auto pool = std::make_unique<ConnectionPool>(path, config);
    auto init = pool->initialize();
    if (!init) {
        return init.error();
    }

    std::unique_ptr<MemoryRepository> repo(new MemoryRepository(std::move(pool)));
    auto migrated = repo->migrate();
    if (!migrated) {
        return migrated.error();
    }

    spdlog::info("[MemoryStore] Opened {}", path);
    return repo;
}

MemoryRepository::MemoryRepository(std::unique_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

MemoryRepository::~MemoryRepository() {
    shutdown();
}

void MemoryRepository::shutdown() {
    if (pool_) {
        pool_->shutdown();
    }
}

Result<void> MemoryRepository::migrate() {
    return pool_->withConnection([](Database& db) -> Result<void> {
        MigrationManager manager(db);
        auto init = manager.initialize();
        if (!init)
            return init;

        manager.registerMigrations(MemorySchemaMigrations::getAllMigrations());
        auto needs = manager.needsMigration();
        if (!needs)
            return needs.error();
        if (!needs.value())
            return {};

        spdlog::info("[MemoryStore] Migrating schema to version {}", manager.getLatestVersion());
        return manager.migrate();
    });
}

} // namespace engram::metadata
