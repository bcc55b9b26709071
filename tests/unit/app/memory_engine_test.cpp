#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>
#include <engram/app/memory_engine.h>
#include <engram/ml/hashing_embedding_provider.h>

#include "../../common/fake_capabilities.h"
#include "../../common/test_helpers.h"

using namespace engram;
using namespace engram::app;
using metadata::FactType;
using metadata::OperationState;
using namespace std::chrono_literals;

class MemoryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = test::tempDbPath("engram_engine");
        config_ = test::testEngineConfig(dbPath_);
        open();
    }

    void TearDown() override {
        engine_.reset();
        test::removeDbFiles(dbPath_);
    }

    void open(EngineCapabilities caps = {}) {
        engine_.reset();
        auto engine = MemoryEngine::create(config_, std::move(caps));
        ASSERT_TRUE(engine.has_value()) << engine.error().message;
        engine_ = std::move(engine).value();
    }

    retain::RetainBatchResult retainTexts(const std::string& bankId,
                                          const std::vector<std::string>& texts) {
        std::vector<retain::RetainItem> items;
        for (const auto& t : texts) {
            retain::RetainItem item;
            item.content = t;
            items.push_back(item);
        }
        auto r = engine_->retain(bankId, items);
        EXPECT_TRUE(r.has_value());
        return r ? r.value() : retain::RetainBatchResult{};
    }

    std::vector<search::RecallHit> recallText(const std::string& bankId, const std::string& text) {
        search::RecallQuery q;
        q.bankId = bankId;
        q.text = text;
        auto seq = engine_->recall(q);
        EXPECT_TRUE(seq.has_value());
        if (!seq)
            return {};
        auto hits = seq.value().collect();
        EXPECT_TRUE(hits.has_value());
        return hits ? hits.value() : std::vector<search::RecallHit>{};
    }

    metadata::AsyncOperation waitForOperation(const std::string& bankId, const std::string& id) {
        const auto deadline = std::chrono::steady_clock::now() + 10s;
        metadata::AsyncOperation last;
        while (std::chrono::steady_clock::now() < deadline) {
            auto op = engine_->getOperation(bankId, id);
            EXPECT_TRUE(op.has_value());
            if (!op)
                return last;
            last = op.value();
            if (last.state != OperationState::Pending && last.state != OperationState::Processing)
                return last;
            std::this_thread::sleep_for(5ms);
        }
        ADD_FAILURE() << "operation " << id << " did not finish";
        return last;
    }

    std::filesystem::path dbPath_;
    config::EngineConfig config_;
    std::unique_ptr<MemoryEngine> engine_;
};

TEST_F(MemoryEngineTest, RejectsInvalidConfiguration) {
    auto bad = config_;
    bad.recall.rrfK = 0;
    auto engine = MemoryEngine::create(bad);
    ASSERT_FALSE(engine.has_value());
    EXPECT_EQ(engine.error().code, ErrorCode::ValidationError);
}

TEST_F(MemoryEngineTest, RejectsEmbedderOfTheWrongDimension) {
    EngineCapabilities caps;
    caps.embedder = std::make_shared<ml::HashingEmbeddingProvider>(64);
    auto other = config_;
    other.storage.dbPath = dbPath_.parent_path() / "other.db";
    auto engine = MemoryEngine::create(other, caps);
    ASSERT_FALSE(engine.has_value());
    EXPECT_EQ(engine.error().code, ErrorCode::InvalidArgument);
}

TEST_F(MemoryEngineTest, RetainThenRecall) {
    auto batch = retainTexts("alpha", {"Alice loves hiking in the Alps.",
                                       "Bob collects vintage stamps."});
    EXPECT_EQ(batch.succeeded(), 2u);

    auto hits = recallText("alpha", "hiking");
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits[0].unit.text, "Alice loves hiking in the Alps.");

    auto stats = engine_->bankStats("alpha");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().totalUnits, 2);
}

TEST_F(MemoryEngineTest, MemoriesSurviveRestart) {
    retainTexts("alpha", {"Alice loves hiking in the Alps."});
    engine_->shutdown();
    open();
    auto hits = recallText("alpha", "hiking");
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].unit.text, "Alice loves hiking in the Alps.");
}

TEST_F(MemoryEngineTest, BankProfileLifecycle) {
    auto fresh = engine_->getBank("alpha");
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(fresh.value().id, "alpha");
    EXPECT_EQ(fresh.value().disposition.skepticism, 3);
    EXPECT_DOUBLE_EQ(fresh.value().personality.openness, 0.5);

    BankProfileUpdate update;
    update.name = "Ada";
    update.background = "I am a climber.";
    auto put = engine_->putBank("alpha", update);
    ASSERT_TRUE(put.has_value());
    EXPECT_EQ(put.value().name, "Ada");
    EXPECT_EQ(put.value().background, "I am a climber.");

    metadata::DispositionTraits disposition;
    disposition.skepticism = 5;
    auto updated = engine_->updateDisposition("alpha", disposition);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated.value().disposition.skepticism, 5);
    EXPECT_EQ(updated.value().name, "Ada");

    disposition.skepticism = 9;
    auto invalid = engine_->updateDisposition("alpha", disposition);
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, ErrorCode::ValidationError);

    metadata::PersonalityTraits personality;
    personality.openness = 1.5;
    auto badTraits = engine_->updatePersonality("alpha", personality);
    ASSERT_FALSE(badTraits.has_value());
    EXPECT_EQ(badTraits.error().code, ErrorCode::ValidationError);

    auto banks = engine_->listBanks();
    ASSERT_TRUE(banks.has_value());
    ASSERT_EQ(banks.value().size(), 1u);
    EXPECT_EQ(banks.value()[0].name, "Ada");

    auto empty = engine_->getBank("");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);
}

TEST_F(MemoryEngineTest, BackgroundMergeWithoutReasonerAppends) {
    BankProfileUpdate update;
    update.background = "I live in Lisbon.";
    ASSERT_TRUE(engine_->putBank("alpha", update).has_value());

    auto merged = engine_->mergeBackground("alpha", "I live in Lisbon. I play the cello", true);
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged.value().background, "I live in Lisbon. I play the cello.");
    EXPECT_FALSE(merged.value().personality.has_value());

    auto bank = engine_->getBank("alpha");
    ASSERT_TRUE(bank.has_value());
    EXPECT_EQ(bank.value().background, "I live in Lisbon. I play the cello.");

    auto blank = engine_->mergeBackground("alpha", "   ", false);
    ASSERT_FALSE(blank.has_value());
    EXPECT_EQ(blank.error().code, ErrorCode::ValidationError);
}

TEST_F(MemoryEngineTest, BackgroundMergeWithReasonerInfersPersonality) {
    EngineCapabilities caps;
    caps.reasoner = std::make_shared<test::FakeReasoner>(
        [](const ml::ReasoningPrompt& prompt) -> Result<std::string> {
            if (prompt.user.find("Merged background:") != std::string::npos)
                return std::string("  I moved from Lisbon to Porto.  ");
            return std::string(R"({"openness": 0.9, "extraversion": 0.2})");
        });
    open(caps);

    BankProfileUpdate update;
    update.background = "I live in Lisbon.";
    ASSERT_TRUE(engine_->putBank("alpha", update).has_value());

    auto merged = engine_->mergeBackground("alpha", "I moved to Porto.", true);
    ASSERT_TRUE(merged.has_value()) << merged.error().message;
    EXPECT_EQ(merged.value().background, "I moved from Lisbon to Porto.");
    ASSERT_TRUE(merged.value().personality.has_value());
    EXPECT_DOUBLE_EQ(merged.value().personality->openness, 0.9);

    auto bank = engine_->getBank("alpha");
    ASSERT_TRUE(bank.has_value());
    EXPECT_DOUBLE_EQ(bank.value().personality.extraversion, 0.2);
    EXPECT_DOUBLE_EQ(bank.value().personality.agreeableness, 0.5);
}

TEST_F(MemoryEngineTest, ReflectNeedsAReasoner) {
    reflect::ReflectRequest request;
    request.bankId = "alpha";
    request.query = "What do I like?";
    auto result = engine_->reflect(request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ReasoningFailure);
}

TEST_F(MemoryEngineTest, ReflectAnswersThroughTheReasoner) {
    EngineCapabilities caps;
    caps.reasoner = std::make_shared<test::FakeReasoner>(
        [](const ml::ReasoningPrompt&) -> Result<std::string> {
            return std::string(R"({"answer": "You like hiking.", "opinions": []})");
        });
    open(caps);
    retainTexts("alpha", {"I love hiking in the Alps."});

    reflect::ReflectRequest request;
    request.bankId = "alpha";
    request.query = "What do I like?";
    auto result = engine_->reflect(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().answer, "You like hiking.");
    ASSERT_EQ(result.value().factsUsed.size(), 1u);
    EXPECT_EQ(result.value().factsUsed[0].unit.factType, FactType::Agent);
}

TEST_F(MemoryEngineTest, BrowseAndDeleteMemories) {
    retainTexts("alpha", {"Alice loves hiking in the Alps.", "I think hiking is great.",
                          "Bob collects vintage stamps."});

    metadata::ListQuery page;
    page.limit = 2;
    auto first = engine_->listMemories("alpha", page);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().items.size(), 2u);
    EXPECT_EQ(first.value().total, 3);

    page.limit = 0;
    auto badPage = engine_->listMemories("alpha", page);
    ASSERT_FALSE(badPage.has_value());
    EXPECT_EQ(badPage.error().code, ErrorCode::ValidationError);

    const auto victim = first.value().items[0].id;
    ASSERT_TRUE(engine_->deleteMemory("alpha", victim).has_value());
    auto again = engine_->deleteMemory("alpha", victim);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);

    auto remaining = engine_->bankStats("alpha");
    ASSERT_TRUE(remaining.has_value());
    const auto opinions = remaining.value().unitsByFactType.count("opinion")
                              ? remaining.value().unitsByFactType.at("opinion")
                              : 0;
    auto clearedOpinions = engine_->clearMemories("alpha", FactType::Opinion);
    ASSERT_TRUE(clearedOpinions.has_value());
    EXPECT_EQ(clearedOpinions.value(), opinions);

    auto clearedAll = engine_->clearMemories("alpha", std::nullopt);
    ASSERT_TRUE(clearedAll.has_value());
    EXPECT_EQ(clearedAll.value(), 2 - opinions);
    auto empty = engine_->bankStats("alpha");
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty.value().totalUnits, 0);
}

TEST_F(MemoryEngineTest, DocumentsCanBeListedFetchedAndDeleted) {
    retain::RetainItem item;
    item.content = "Alice lives in Paris. Alice works at Acme.";
    item.documentId = "profile";
    item.metadata = {{"source", "crm"}};
    auto batch = engine_->retain("alpha", {item});
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(batch.value().succeeded(), 1u);

    metadata::ListQuery q;
    auto docs = engine_->listDocuments("alpha", q);
    ASSERT_TRUE(docs.has_value());
    ASSERT_EQ(docs.value().items.size(), 1u);

    auto doc = engine_->getDocument("alpha", "profile");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc.value().content, item.content);
    EXPECT_EQ(doc.value().metadata.at("source"), "crm");
    EXPECT_EQ(doc.value().unitCount, 2);

    auto deleted = engine_->deleteDocument("alpha", "profile");
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted.value().unitsDeleted, 2);

    auto missing = engine_->getDocument("alpha", "profile");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
    auto deleteAgain = engine_->deleteDocument("alpha", "profile");
    ASSERT_FALSE(deleteAgain.has_value());
    EXPECT_EQ(deleteAgain.error().code, ErrorCode::NotFound);
}

TEST_F(MemoryEngineTest, GraphConnectsUnitsAndEntities) {
    retainTexts("alpha", {"Alice works at Google.", "Google opened an office in Zurich."});

    auto graph = engine_->graph("alpha", std::nullopt, 100);
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph.value().units.size(), 2u);
    EXPECT_EQ(graph.value().entities.size(), 3u);
    size_t entityEdges = 0;
    for (const auto& e : graph.value().edges) {
        if (e.kind == "entity")
            ++entityEdges;
    }
    EXPECT_EQ(entityEdges, 4u);
    for (const auto& u : graph.value().units)
        EXPECT_TRUE(u.embedding.empty());

    auto bad = engine_->graph("alpha", std::nullopt, 0);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::ValidationError);
}

TEST_F(MemoryEngineTest, AsyncRetainCompletes) {
    retain::RetainItem item;
    item.content = "Alice loves hiking in the Alps.";
    auto op = engine_->retainAsync("alpha", {item});
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(op.value().kind, MemoryEngine::kRetainBatchKind);

    auto done = waitForOperation("alpha", op.value().id);
    ASSERT_EQ(done.state, OperationState::Completed) << done.error.value_or("");
    auto summary = nlohmann::json::parse(done.result.value_or("{}"));
    EXPECT_EQ(summary.at("succeeded").get<int>(), 1);

    EXPECT_EQ(recallText("alpha", "hiking").size(), 1u);

    auto listed = engine_->listOperations("alpha", OperationState::Completed);
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed.value().size(), 1u);

    auto cancelLate = engine_->cancelOperation("alpha", op.value().id);
    ASSERT_TRUE(cancelLate.has_value());
    EXPECT_FALSE(cancelLate.value().cancelled);
    EXPECT_EQ(cancelLate.value().state, OperationState::Completed);
}

TEST_F(MemoryEngineTest, AsyncRetainFailsWhenEveryItemFails) {
    retain::RetainItem empty;
    auto op = engine_->retainAsync("alpha", {empty});
    ASSERT_TRUE(op.has_value());
    auto done = waitForOperation("alpha", op.value().id);
    EXPECT_EQ(done.state, OperationState::Failed);
    EXPECT_NE(done.error.value_or("").find("item 0"), std::string::npos);

    auto none = engine_->retainAsync("alpha", {});
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, ErrorCode::ValidationError);
}

TEST_F(MemoryEngineTest, InterruptedOperationsFailOnRestart) {
    metadata::AsyncOperation op;
    op.id = "op-stale";
    op.bankId = "alpha";
    op.kind = MemoryEngine::kRetainBatchKind;
    op.state = OperationState::Processing;
    op.payload = R"({"items": []})";
    op.createdAt = std::chrono::system_clock::now();
    op.updatedAt = op.createdAt;
    auto inserted = engine_->repository()->transact(
        [&](metadata::MemorySession& s) -> Result<void> {
            auto bank = s.ensureBank("alpha");
            if (!bank)
                return bank.error();
            return s.insertOperation(op);
        });
    ASSERT_TRUE(inserted.has_value());

    engine_->shutdown();
    open();

    auto stale = engine_->getOperation("alpha", "op-stale");
    ASSERT_TRUE(stale.has_value());
    EXPECT_EQ(stale.value().state, OperationState::Failed);
    EXPECT_EQ(stale.value().error.value_or(""), "interrupted");
}
