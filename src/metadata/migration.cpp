#include <spdlog/spdlog.h>
#include <engram/metadata/migration.h>

namespace engram::metadata {

// MigrationManager implementation
MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return createMigrationTables();
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }

    return 0; // No migrations applied yet
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    const int targetVersion = getLatestVersion();
    if (currentVersion >= targetVersion) {
        spdlog::debug("Schema already at version {}", currentVersion);
        return {};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion) {
            continue;
        }
        spdlog::debug("Applying migration {} '{}'", version, migration.name);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            auto recordResult =
                recordMigration(version, migration.name, duration, false, result.error().message);
            if (!recordResult) {
                spdlog::warn("Failed to record migration failure: {}",
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;

        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        }
        return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT OR REPLACE INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(version, name, std::chrono::system_clock::now(),
                                   static_cast<int64_t>(duration.count()), success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

Result<void> MigrationManager::createMigrationTables() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT,
            UNIQUE(version)
        )
    )");
}

// MemorySchemaMigrations implementation
std::vector<Migration> MemorySchemaMigrations::getAllMigrations() {
    return {createInitialSchema(), createFTS5Tables(), createDirectRetainTracking()};
}

Migration MemorySchemaMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Create memory schema";

    m.upSQL = R"(
        CREATE TABLE banks (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            background TEXT NOT NULL DEFAULT '',
            openness REAL NOT NULL DEFAULT 0.5 CHECK (openness BETWEEN 0 AND 1),
            conscientiousness REAL NOT NULL DEFAULT 0.5
                CHECK (conscientiousness BETWEEN 0 AND 1),
            extraversion REAL NOT NULL DEFAULT 0.5 CHECK (extraversion BETWEEN 0 AND 1),
            agreeableness REAL NOT NULL DEFAULT 0.5 CHECK (agreeableness BETWEEN 0 AND 1),
            neuroticism REAL NOT NULL DEFAULT 0.5 CHECK (neuroticism BETWEEN 0 AND 1),
            bias_strength REAL NOT NULL DEFAULT 0.5 CHECK (bias_strength BETWEEN 0 AND 1),
            skepticism INTEGER NOT NULL DEFAULT 3 CHECK (skepticism BETWEEN 1 AND 5),
            literalism INTEGER NOT NULL DEFAULT 3 CHECK (literalism BETWEEN 1 AND 5),
            empathy INTEGER NOT NULL DEFAULT 3 CHECK (empathy BETWEEN 1 AND 5),
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE documents (
            bank_id TEXT NOT NULL,
            id TEXT NOT NULL,
            content TEXT NOT NULL,
            metadata TEXT NOT NULL DEFAULT '{}',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            PRIMARY KEY (bank_id, id),
            FOREIGN KEY (bank_id) REFERENCES banks(id) ON DELETE CASCADE
        );

        CREATE TABLE memory_units (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            id TEXT NOT NULL UNIQUE,
            bank_id TEXT NOT NULL,
            text TEXT NOT NULL,
            fact_type TEXT NOT NULL CHECK (fact_type IN ('world', 'agent', 'opinion')),
            confidence REAL NOT NULL CHECK (confidence BETWEEN 0 AND 1),
            embedding BLOB NOT NULL,
            occurred_start INTEGER,
            occurred_end INTEGER,
            mentioned_at INTEGER NOT NULL,
            context TEXT NOT NULL DEFAULT '',
            document_id TEXT,
            created_at INTEGER NOT NULL,
            CHECK (occurred_start IS NULL OR occurred_end IS NULL
                   OR occurred_start <= occurred_end),
            FOREIGN KEY (bank_id) REFERENCES banks(id) ON DELETE CASCADE
        );

        CREATE TABLE unit_sources (
            unit_id TEXT NOT NULL,
            bank_id TEXT NOT NULL,
            document_id TEXT NOT NULL,
            PRIMARY KEY (unit_id, document_id),
            FOREIGN KEY (unit_id) REFERENCES memory_units(id) ON DELETE CASCADE,
            FOREIGN KEY (bank_id, document_id) REFERENCES documents(bank_id, id) ON DELETE CASCADE
        );

        CREATE TABLE entities (
            id TEXT PRIMARY KEY,
            bank_id TEXT NOT NULL,
            name TEXT NOT NULL,
            type TEXT NOT NULL DEFAULT '',
            canonical_name TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            UNIQUE (bank_id, canonical_name),
            FOREIGN KEY (bank_id) REFERENCES banks(id) ON DELETE CASCADE
        );

        CREATE TABLE unit_entities (
            unit_id TEXT NOT NULL,
            entity_id TEXT NOT NULL,
            bank_id TEXT NOT NULL,
            PRIMARY KEY (unit_id, entity_id),
            FOREIGN KEY (unit_id) REFERENCES memory_units(id) ON DELETE CASCADE,
            FOREIGN KEY (entity_id) REFERENCES entities(id) ON DELETE CASCADE
        );

        CREATE TABLE memory_links (
            from_unit_id TEXT NOT NULL,
            to_unit_id TEXT NOT NULL,
            bank_id TEXT NOT NULL,
            kind TEXT NOT NULL CHECK (kind IN ('temporal-sequence', 'semantic-similarity')),
            weight REAL NOT NULL CHECK (weight BETWEEN 0 AND 1),
            created_at INTEGER NOT NULL,
            PRIMARY KEY (from_unit_id, to_unit_id, kind),
            FOREIGN KEY (from_unit_id) REFERENCES memory_units(id) ON DELETE CASCADE,
            FOREIGN KEY (to_unit_id) REFERENCES memory_units(id) ON DELETE CASCADE
        );

        CREATE TABLE async_operations (
            id TEXT PRIMARY KEY,
            bank_id TEXT NOT NULL,
            kind TEXT NOT NULL,
            state TEXT NOT NULL
                CHECK (state IN ('pending', 'processing', 'completed', 'failed', 'cancelled')),
            payload TEXT NOT NULL DEFAULT '{}',
            result TEXT,
            error TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            FOREIGN KEY (bank_id) REFERENCES banks(id) ON DELETE CASCADE
        );

        CREATE INDEX idx_units_bank_type ON memory_units(bank_id, fact_type);
        CREATE INDEX idx_units_bank_mentioned ON memory_units(bank_id, mentioned_at);
        CREATE INDEX idx_units_document ON memory_units(bank_id, document_id);
        CREATE INDEX idx_sources_document ON unit_sources(bank_id, document_id);
        CREATE INDEX idx_unit_entities_entity ON unit_entities(entity_id);
        CREATE INDEX idx_links_to ON memory_links(to_unit_id);
        CREATE INDEX idx_links_bank ON memory_links(bank_id);
        CREATE INDEX idx_operations_bank_state ON async_operations(bank_id, state);
    )";

    return m;
}

Migration MemorySchemaMigrations::createFTS5Tables() {
    Migration m;
    m.version = 2;
    m.name = "Create FTS5 tables";

    m.upFunc = [](Database& db) -> Result<void> {
        auto fts5Result = db.hasFTS5();
        if (!fts5Result)
            return fts5Result.error();

        if (!fts5Result.value()) {
            spdlog::warn("FTS5 not available, lexical recall falls back to in-process BM25");
            return {};
        }

        return db.execute(R"(
            CREATE VIRTUAL TABLE memory_units_fts USING fts5(
                text,
                content='memory_units',
                content_rowid='seq',
                tokenize='porter unicode61'
            );

            CREATE TRIGGER memory_units_fts_ai AFTER INSERT ON memory_units BEGIN
                INSERT INTO memory_units_fts(rowid, text) VALUES (new.seq, new.text);
            END;

            CREATE TRIGGER memory_units_fts_ad AFTER DELETE ON memory_units BEGIN
                INSERT INTO memory_units_fts(memory_units_fts, rowid, text)
                VALUES ('delete', old.seq, old.text);
            END;

            CREATE TRIGGER memory_units_fts_au AFTER UPDATE OF text ON memory_units BEGIN
                INSERT INTO memory_units_fts(memory_units_fts, rowid, text)
                VALUES ('delete', old.seq, old.text);
                INSERT INTO memory_units_fts(rowid, text) VALUES (new.seq, new.text);
            END;
        )");
    };

    return m;
}

Migration MemorySchemaMigrations::createDirectRetainTracking() {
    Migration m;
    m.version = 3;
    m.name = "Track directly retained units";

    m.upSQL = R"(
        ALTER TABLE memory_units ADD COLUMN retained_directly INTEGER NOT NULL DEFAULT 0;
        UPDATE memory_units SET retained_directly = 1 WHERE document_id IS NULL;
    )";

    return m;
}

} // namespace engram::metadata
