#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <engram/metadata/memory_repository.h>
#include <engram/ml/capability_invoker.h>
#include <engram/ml/reasoner.h>
#include <engram/reflect/disposition_policy.h>
#include <engram/reflect/personality_prompt.h>
#include <engram/retain/retain_pipeline.h>
#include <engram/search/recall_engine.h>

namespace engram::reflect {

struct ReflectConfig {
    size_t contextPerType = 10;
    size_t opinionBudget = 3;
};

struct ReflectRequest {
    std::string bankId;
    std::string query;
    std::string context;
    std::optional<size_t> contextPerType;
    std::optional<size_t> opinionBudget;
};

struct ReflectResult {
    std::string answer;
    std::vector<search::RecallHit> factsUsed;
    std::vector<metadata::MemoryUnit> newOpinions;
};

/**
 * @brief Answers a question from a bank's memories and adopts new opinions.
 *
 * Gathers agent, world and opinion context through recall, asks the reasoner, filters
 * the proposed opinions through the disposition policy and appends the survivors as
 * opinion units. Existing units are never modified; when the reasoner fails nothing is
 * written.
 */
class ReflectEngine {
public:
    ReflectEngine(std::shared_ptr<metadata::MemoryRepository> repository,
                  std::shared_ptr<search::RecallEngine> recall,
                  std::shared_ptr<retain::RetainPipeline> retain,
                  std::shared_ptr<ml::IReasoner> reasoner,
                  std::shared_ptr<IDispositionPolicy> policy, ml::CapabilityInvoker invoker,
                  ReflectConfig config = {});

    Result<ReflectResult> reflect(const ReflectRequest& request) const;

    [[nodiscard]] const ReflectConfig& config() const noexcept { return config_; }

private:
    Result<std::vector<search::RecallHit>> gather(const std::string& bankId,
                                                  const std::string& query,
                                                  metadata::FactType type, size_t limit) const;

    std::shared_ptr<metadata::MemoryRepository> repository_;
    std::shared_ptr<search::RecallEngine> recall_;
    std::shared_ptr<retain::RetainPipeline> retain_;
    std::shared_ptr<ml::IReasoner> reasoner_;
    std::shared_ptr<IDispositionPolicy> policy_;
    ml::CapabilityInvoker invoker_;
    ReflectConfig config_;
};

} // namespace engram::reflect
