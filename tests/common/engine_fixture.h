// Fixture wiring the store, worker pools, retain pipeline and recall engine
#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <engram/daemon/components/WorkCoordinator.h>
#include <engram/extraction/fact_extractor.h>
#include <engram/metadata/memory_repository.h>
#include <engram/ml/capability_invoker.h>
#include <engram/ml/hashing_embedding_provider.h>
#include <engram/retain/bank_write_locks.h>
#include <engram/retain/retain_pipeline.h>
#include <engram/search/entity_resolver.h>
#include <engram/search/recall_engine.h>
#include <engram/search/reranker.h>
#include <engram/search/temporal_parser.h>

#include "test_helpers.h"

namespace engram::test {

struct PipelineOptions {
    std::shared_ptr<extraction::IFactExtractor> extractor;
    std::shared_ptr<ml::IEmbeddingProvider> embedder;
    std::shared_ptr<search::IReranker> reranker;
    std::shared_ptr<search::ITemporalParser> temporalParser;
    retain::RetainConfig retain;
    search::RecallConfig recall;
    std::size_t searchThreads = 4;
    std::chrono::milliseconds capabilityTimeout{2000};
};

/**
 * @brief Real store and local capabilities; tests swap single capabilities through
 * rebuild()
 */
class PipelineFixture : public ::testing::Test {
protected:
    void SetUp() override { build(PipelineOptions{}); }

    void TearDown() override { teardown(); }

    void rebuild(PipelineOptions options) {
        teardown();
        build(std::move(options));
    }

    void build(PipelineOptions options) {
        dbPath_ = tempDbPath("engram_pipeline");
        auto repo = metadata::MemoryRepository::create(dbPath_.string());
        ASSERT_TRUE(repo.has_value()) << repo.error().message;
        repository_ = std::shared_ptr<metadata::MemoryRepository>(std::move(repo).value());

        capabilityPool_ = std::make_unique<daemon::WorkCoordinator>("capability");
        capabilityPool_->start(4);
        searchPool_ = std::make_unique<daemon::WorkCoordinator>("search");
        searchPool_->start(options.searchThreads);

        ml::CapabilityPolicy policy;
        policy.timeout = options.capabilityTimeout;
        policy.retry.maxAttempts = 2;
        policy.retry.initialBackoff = std::chrono::milliseconds(1);
        policy.retry.maxBackoff = std::chrono::milliseconds(5);
        invoker_ = std::make_unique<ml::CapabilityInvoker>(capabilityPool_->getExecutor(), policy);

        temporalParser_ = options.temporalParser
                              ? options.temporalParser
                              : std::make_shared<search::HeuristicTemporalParser>();
        if (options.embedder) {
            embedder_ = options.embedder;
        } else {
            auto hashing = std::make_shared<ml::HashingEmbeddingProvider>(256);
            ASSERT_TRUE(hashing->initialize().has_value());
            embedder_ = hashing;
        }
        extractor_ = options.extractor
                         ? options.extractor
                         : std::make_shared<extraction::SentenceFactExtractor>(temporalParser_);
        reranker_ = options.reranker ? options.reranker
                                     : std::make_shared<search::LexicalOverlapReranker>();

        resolver_ = std::make_shared<search::EntityResolver>(
            std::make_shared<search::CanonicalNameStrategy>());
        locks_ = std::make_shared<retain::BankWriteLocks>();

        retain_ = std::make_shared<retain::RetainPipeline>(repository_, extractor_, embedder_,
                                                           resolver_, locks_, *invoker_,
                                                           options.retain);
        recall_ = std::make_shared<search::RecallEngine>(repository_, embedder_, reranker_,
                                                         temporalParser_, resolver_, *invoker_,
                                                         searchPool_->getExecutor(),
                                                         options.recall);
    }

    // Pools are joined before the engines go so no abandoned task outlives what it uses
    void teardown() {
        if (searchPool_) {
            searchPool_->stop();
            searchPool_->join();
            searchPool_.reset();
        }
        if (capabilityPool_) {
            capabilityPool_->stop();
            capabilityPool_->join();
            capabilityPool_.reset();
        }
        recall_.reset();
        retain_.reset();
        if (repository_) {
            repository_->shutdown();
            repository_.reset();
        }
        if (!dbPath_.empty())
            removeDbFiles(dbPath_);
    }

    retain::RetainOutcome retainOne(const std::string& bankId, const std::string& content,
                                    std::optional<std::string> documentId = std::nullopt,
                                    std::optional<metadata::TimeRange> hint = std::nullopt) {
        retain::RetainItem item;
        item.content = content;
        item.documentId = std::move(documentId);
        item.occurredHint = hint;
        auto result = retain_->retainBatch(bankId, {item});
        EXPECT_TRUE(result.has_value());
        if (!result || result.value().items.empty())
            return {};
        EXPECT_TRUE(result.value().items[0].success)
            << (result.value().items[0].error ? result.value().items[0].error->message : "");
        return result.value().items[0];
    }

    std::vector<search::RecallHit> recallHits(const search::RecallQuery& query) {
        auto seq = recall_->recall(query);
        EXPECT_TRUE(seq.has_value()) << (seq ? "" : seq.error().message);
        if (!seq)
            return {};
        auto hits = seq.value().collect();
        EXPECT_TRUE(hits.has_value());
        if (!hits)
            return {};
        return std::move(hits).value();
    }

    static std::vector<std::string> textsOf(const std::vector<search::RecallHit>& hits) {
        std::vector<std::string> texts;
        for (const auto& h : hits)
            texts.push_back(h.unit.text);
        return texts;
    }

    std::optional<metadata::MemoryUnit> loadUnit(const std::string& bankId,
                                                 const std::string& unitId) {
        auto unit = repository_->read(
            [&](metadata::MemorySession& s) { return s.getUnit(bankId, unitId); });
        EXPECT_TRUE(unit.has_value());
        if (!unit)
            return std::nullopt;
        return unit.value();
    }

    std::filesystem::path dbPath_;
    std::shared_ptr<metadata::MemoryRepository> repository_;
    std::unique_ptr<daemon::WorkCoordinator> capabilityPool_;
    std::unique_ptr<daemon::WorkCoordinator> searchPool_;
    std::unique_ptr<ml::CapabilityInvoker> invoker_;
    std::shared_ptr<search::ITemporalParser> temporalParser_;
    std::shared_ptr<ml::IEmbeddingProvider> embedder_;
    std::shared_ptr<extraction::IFactExtractor> extractor_;
    std::shared_ptr<search::IReranker> reranker_;
    std::shared_ptr<search::EntityResolver> resolver_;
    std::shared_ptr<retain::BankWriteLocks> locks_;
    std::shared_ptr<retain::RetainPipeline> retain_;
    std::shared_ptr<search::RecallEngine> recall_;
};

} // namespace engram::test
