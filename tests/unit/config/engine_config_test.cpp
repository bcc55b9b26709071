#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <vector>
#include <engram/config/config_helpers.h>
#include <engram/config/engine_config.h>

#include "../../common/test_helpers.h"

using namespace engram;
using namespace engram::config;
using engram::test::ScopedEnvVar;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test::makeTempDir("engram_config_");
        for (const char* name : {"ENGRAM_CONFIG", "ENGRAM_DB_PATH", "ENGRAM_LOG_LEVEL",
                                 "ENGRAM_BANK_ID", "ENGRAM_EMBEDDING_DIM",
                                 "ENGRAM_QUEUE_CONCURRENCY"}) {
            env_.push_back(std::make_unique<ScopedEnvVar>(name, std::nullopt));
        }
        env_.push_back(std::make_unique<ScopedEnvVar>("XDG_DATA_HOME", (dir_ / "data").string()));
        env_.push_back(
            std::make_unique<ScopedEnvVar>("XDG_CONFIG_HOME", (dir_ / "config").string()));
    }

    void TearDown() override {
        env_.clear();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::vector<std::unique_ptr<ScopedEnvVar>> env_;
};

TEST_F(EngineConfigTest, DefaultsWithoutFile) {
    auto config = loadEngineConfig();
    ASSERT_TRUE(config.has_value()) << config.error().message;
    const auto& c = config.value();
    EXPECT_EQ(c.storage.dbPath, dir_ / "data" / "engram" / "engram.db");
    EXPECT_EQ(c.recall.rrfK, 60);
    EXPECT_DOUBLE_EQ(c.retain.dedupThreshold, 0.95);
    EXPECT_EQ(c.reflect.opinionBudget, 3u);
    EXPECT_EQ(c.defaultBankId, "default");
}

TEST_F(EngineConfigTest, FileOverridesDefaults) {
    auto path = test::writeFile(dir_ / "engram.toml", R"(
# engram settings
[storage]
db_path = "/tmp/engram-from-file.db"
max_connections = 4

[recall]
rrf_k = 30            # fewer ties
rerank_weight = 0.5
infer_time_from_query = false

[retain]
temporal_window_hours = 12

[logging]
level = 'debug'
)");
    auto config = loadEngineConfig(path);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    const auto& c = config.value();
    EXPECT_EQ(c.storage.dbPath, std::filesystem::path("/tmp/engram-from-file.db"));
    EXPECT_EQ(c.storage.maxConnections, 4u);
    EXPECT_EQ(c.recall.rrfK, 30);
    EXPECT_DOUBLE_EQ(c.recall.rerankWeight, 0.5);
    EXPECT_FALSE(c.recall.inferTimeFromQuery);
    EXPECT_EQ(c.retain.temporalWindow, std::chrono::hours(12));
    EXPECT_EQ(c.logLevel, "debug");
}

TEST_F(EngineConfigTest, EnvironmentOverridesFile) {
    auto path = test::writeFile(dir_ / "engram.toml", "[logging]\nlevel = \"debug\"\n");
    ScopedEnvVar level("ENGRAM_LOG_LEVEL", std::string("error"));
    ScopedEnvVar bank("ENGRAM_BANK_ID", std::string("assistant"));
    ScopedEnvVar dim("ENGRAM_EMBEDDING_DIM", std::string("128"));

    auto config = loadEngineConfig(path);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config.value().logLevel, "error");
    EXPECT_EQ(config.value().defaultBankId, "assistant");
    EXPECT_EQ(config.value().embedding.dimension, 128u);
}

TEST_F(EngineConfigTest, MalformedValuesAreValidationErrors) {
    auto path = test::writeFile(dir_ / "engram.toml", "[recall]\nrrf_k = sixty\n");
    auto config = loadEngineConfig(path);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ValidationError);
    EXPECT_NE(config.error().message.find("recall.rrf_k"), std::string::npos);
}

TEST_F(EngineConfigTest, MalformedEnvironmentIsRejected) {
    ScopedEnvVar dim("ENGRAM_EMBEDDING_DIM", std::string("-4"));
    auto config = loadEngineConfig();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ValidationError);
}

TEST_F(EngineConfigTest, MissingExplicitFileFallsBackToDefaults) {
    auto config = loadEngineConfig(dir_ / "does-not-exist.toml");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().recall.rrfK, 60);
}

TEST_F(EngineConfigTest, ValidateRejectsInconsistentThresholds) {
    EngineConfig c;
    c.storage.dbPath = dir_ / "x.db";
    ASSERT_TRUE(c.validate().has_value());

    c.retain.semanticLinkThreshold = 0.97;
    auto r = c.validate();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);

    c.retain.semanticLinkThreshold = 0.7;
    c.recall.rerankWeight = 1.5;
    EXPECT_FALSE(c.validate().has_value());

    c.recall.rerankWeight = 0.8;
    c.storage.minConnections = 4;
    c.storage.maxConnections = 2;
    EXPECT_FALSE(c.validate().has_value());
}

TEST(ConfigHelpersTest, FlatParserKeysBySection) {
    auto dir = test::makeTempDir("engram_flat_");
    auto path = test::writeFile(dir / "c.toml", "top = 1\n[a]\nx = \"quoted # not a comment\"\n"
                                                "y = 2 # trailing\n[b]\nx = 'single'\n");
    auto flat = parse_config_flat(path);
    EXPECT_EQ(flat["top"], "1");
    EXPECT_EQ(flat["a.x"], "quoted # not a comment");
    EXPECT_EQ(flat["a.y"], "2");
    EXPECT_EQ(flat["b.x"], "single");
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(ConfigHelpersTest, ScalarParsers) {
    EXPECT_EQ(parse_int(" 42 ").value_or(-1), 42);
    EXPECT_FALSE(parse_int("4x").has_value());
    EXPECT_DOUBLE_EQ(*parse_double("0.25"), 0.25);
    EXPECT_FALSE(parse_double("").has_value());
    EXPECT_TRUE(parse_bool("Yes").value_or(false));
    EXPECT_FALSE(parse_bool("off").value_or(true));
    EXPECT_FALSE(parse_bool("maybe").has_value());
}
