#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <optional>
#include <thread>
#include <vector>
#include <engram/metadata/connection_pool.h>
#include <engram/metadata/database.h>
#include <engram/metadata/migration.h>

#include "../../common/test_helpers.h"

using namespace engram;
using namespace engram::metadata;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override { dbPath_ = test::tempDbPath("engram_db"); }

    void TearDown() override { test::removeDbFiles(dbPath_); }

    std::filesystem::path dbPath_;
};

TEST_F(DatabaseTest, OpenClose) {
    Database db;
    ASSERT_FALSE(db.isOpen());

    auto result = db.open(dbPath_.string(), ConnectionMode::Create);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(db.isOpen());

    db.close();
    ASSERT_FALSE(db.isOpen());
}

TEST_F(DatabaseTest, ReadWriteModeRequiresAnExistingFile) {
    Database db;
    auto missing = db.open(dbPath_.string());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::DatabaseError);
    EXPECT_FALSE(db.isOpen());

    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    db.close();
    ASSERT_TRUE(db.open(dbPath_.string()).has_value());
    EXPECT_TRUE(db.isOpen());
}

TEST_F(DatabaseTest, VerifyFTS5Support) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());

    auto fts5Result = db.hasFTS5();
    ASSERT_TRUE(fts5Result.has_value());
    EXPECT_TRUE(fts5Result.value()) << "FTS5 support is required";
}

TEST_F(DatabaseTest, PreparedStatementsBindOptionalsAndTimes) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (name TEXT, at INTEGER, maybe TEXT)").has_value());

    auto insert = db.prepare("INSERT INTO t (name, at, maybe) VALUES (?, ?, ?)");
    ASSERT_TRUE(insert.has_value());
    const auto when = fromEpochMillis(1700000000123LL);
    ASSERT_TRUE(insert.value().bindAll("alpha", when, std::optional<std::string>{}).has_value());
    ASSERT_TRUE(insert.value().execute().has_value());
    EXPECT_EQ(db.changes(), 1);

    auto select = db.prepare("SELECT name, at, maybe FROM t");
    ASSERT_TRUE(select.has_value());
    auto& stmt = select.value();
    auto step = stmt.step();
    ASSERT_TRUE(step.has_value());
    ASSERT_TRUE(step.value());
    EXPECT_EQ(stmt.getString(0), "alpha");
    EXPECT_EQ(stmt.getTime(1), when);
    EXPECT_TRUE(stmt.isNull(2));
    EXPECT_FALSE(stmt.getOptionalString(2).has_value());
}

TEST_F(DatabaseTest, TransactionRollsBackOnError) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (v INTEGER)").has_value());

    auto tx = db.transaction([&]() -> Result<void> {
        auto ins = db.execute("INSERT INTO t VALUES (1)");
        if (!ins)
            return ins;
        return Error{ErrorCode::Conflict, "abort"};
    });
    ASSERT_FALSE(tx.has_value());
    EXPECT_EQ(tx.error().code, ErrorCode::Conflict);
    EXPECT_FALSE(db.inTransaction());

    auto count = db.prepare("SELECT COUNT(*) FROM t");
    ASSERT_TRUE(count.has_value());
    ASSERT_TRUE(count.value().step().value());
    EXPECT_EQ(count.value().getInt64(0), 0);
}

TEST_F(DatabaseTest, MigrationsApplyOnceInOrder) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());

    MigrationManager manager(db);
    ASSERT_TRUE(manager.initialize().has_value());
    manager.registerMigrations(MemorySchemaMigrations::getAllMigrations());

    auto needs = manager.needsMigration();
    ASSERT_TRUE(needs.has_value());
    EXPECT_TRUE(needs.value());
    ASSERT_TRUE(manager.migrate().has_value());

    auto version = manager.getCurrentVersion();
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(version.value(), manager.getLatestVersion());

    for (const char* table : {"banks", "memory_units", "documents", "unit_sources", "entities",
                              "unit_entities", "memory_links", "async_operations"}) {
        auto exists = db.tableExists(table);
        ASSERT_TRUE(exists.has_value());
        EXPECT_TRUE(exists.value()) << table;
    }

    // Second run is a no-op
    auto again = manager.needsMigration();
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again.value());
}

TEST_F(DatabaseTest, ConnectionPoolServesConcurrentReaders) {
    ConnectionPoolConfig config;
    config.minConnections = 1;
    config.maxConnections = 3;
    ConnectionPool pool(dbPath_.string(), config);
    ASSERT_TRUE(pool.initialize().has_value());

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&]() {
            auto r = pool.withConnection([](Database& db) -> Result<void> {
                return db.execute("SELECT 1");
            });
            if (r)
                ok.fetch_add(1);
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(ok.load(), 6);
    EXPECT_LE(pool.getStats().totalConnections, 3u);
    pool.shutdown();
}
