#include <spdlog/spdlog.h>

#include <unordered_set>
#include <engram/reflect/reflect_engine.h>

namespace engram::reflect {

ReflectEngine::ReflectEngine(std::shared_ptr<metadata::MemoryRepository> repository,
                             std::shared_ptr<search::RecallEngine> recall,
                             std::shared_ptr<retain::RetainPipeline> retain,
                             std::shared_ptr<ml::IReasoner> reasoner,
                             std::shared_ptr<IDispositionPolicy> policy,
                             ml::CapabilityInvoker invoker, ReflectConfig config)
    : repository_(std::move(repository)),
      recall_(std::move(recall)),
      retain_(std::move(retain)),
      reasoner_(std::move(reasoner)),
      policy_(std::move(policy)),
      invoker_(std::move(invoker)),
      config_(config) {
    if (!policy_)
        policy_ = std::make_shared<LinearDispositionPolicy>();
}

Result<std::vector<search::RecallHit>> ReflectEngine::gather(const std::string& bankId,
                                                             const std::string& query,
                                                             metadata::FactType type,
                                                             size_t limit) const {
    if (limit == 0)
        return std::vector<search::RecallHit>{};
    search::RecallQuery q;
    q.bankId = bankId;
    q.text = query;
    q.factTypes = {type};
    q.budget = limit;
    auto sequence = recall_->recall(q);
    if (!sequence)
        return sequence.error();
    return sequence.value().collect();
}

Result<ReflectResult> ReflectEngine::reflect(const ReflectRequest& request) const {
    if (request.bankId.empty())
        return Error{ErrorCode::ValidationError, "bank id is required"};
    if (request.query.empty())
        return Error{ErrorCode::ValidationError, "query is required"};
    if (!reasoner_)
        return Error{ErrorCode::ReasoningFailure, "no reasoner configured"};

    auto bank = repository_->transact(
        [&](metadata::MemorySession& session) { return session.ensureBank(request.bankId); });
    if (!bank)
        return bank.error();

    const size_t perType = request.contextPerType.value_or(config_.contextPerType);
    ReflectContext context;
    auto agent = gather(request.bankId, request.query, metadata::FactType::Agent, perType);
    if (!agent)
        return agent.error();
    context.agent = std::move(agent).value();
    auto world = gather(request.bankId, request.query, metadata::FactType::World, perType);
    if (!world)
        return world.error();
    context.world = std::move(world).value();
    auto opinions = gather(request.bankId, request.query, metadata::FactType::Opinion, perType);
    if (!opinions)
        return opinions.error();
    context.opinions = std::move(opinions).value();

    auto prompt = buildReflectPrompt(bank.value(), request.query, request.context, context);
    auto reasoner = reasoner_;
    auto reply = invoker_.invoke("reflect", ErrorCode::ReasoningFailure,
                                 [reasoner, prompt]() { return reasoner->complete(prompt); });
    if (!reply) {
        spdlog::warn("[Reflect] Bank '{}': reasoning failed: {}", request.bankId,
                     reply.error().message);
        return reply.error();
    }

    auto parsed = parseReflectResponse(reply.value());

    ReflectResult result;
    result.answer = std::move(parsed.answer);
    for (auto* group : {&context.agent, &context.world, &context.opinions}) {
        for (auto& hit : *group)
            result.factsUsed.push_back(std::move(hit));
    }

    std::unordered_set<std::string> retrievedIds;
    for (const auto& hit : result.factsUsed)
        retrievedIds.insert(hit.unit.id);

    const size_t budget = request.opinionBudget.value_or(config_.opinionBudget);
    auto accepted = policy_->apply(parsed.opinions, retrievedIds, bank.value().disposition, budget);

    if (!accepted.empty()) {
        std::vector<retain::OpinionDraft> drafts;
        drafts.reserve(accepted.size());
        for (const auto& a : accepted)
            drafts.push_back({a.candidate.text, a.confidence, a.candidate.entities});
        auto stored = retain_->persistOpinions(request.bankId, drafts);
        if (!stored)
            return stored.error();
        result.newOpinions = std::move(stored).value();
    }

    spdlog::info("[Reflect] Bank '{}': {} facts used, {}/{} opinions adopted", request.bankId,
                 result.factsUsed.size(), result.newOpinions.size(), parsed.opinions.size());
    return result;
}

} // namespace engram::reflect
