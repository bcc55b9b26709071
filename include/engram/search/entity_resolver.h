#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <engram/core/types.h>
#include <engram/metadata/memory_session.h>

namespace engram::search {

// A surface mention produced by extraction
struct EntityMention {
    std::string name;
    std::string type; // empty when unknown
};

struct EntityMatch {
    std::string entityId;
    double score = 0.0;
};

/**
 * @brief Decides which existing entity, if any, a mention refers to.
 *
 * Implementations must be deterministic for a given candidate list; tests substitute
 * their own strategy to pin resolution outcomes.
 */
class IEntityResolutionStrategy {
public:
    virtual ~IEntityResolutionStrategy() = default;

    // Canonical identity key for a surface name; empty when the name carries no word
    virtual std::string canonicalize(const std::string& name) const = 0;

    virtual std::optional<EntityMatch>
    resolve(const EntityMention& mention, const std::vector<metadata::Entity>& candidates) const = 0;
};

/**
 * @brief Canonical-name matching with a fuzzy fallback.
 *
 * - Normalization: lowercase, trim punctuation, collapse whitespace, singularize the
 *   last word ("companies" -> "company", "cats" -> "cat")
 * - Exact canonical match scores 1.0
 * - Otherwise score = max(Levenshtein similarity, token Jaccard), minus 0.1 when both
 *   sides are typed and the types differ; a match needs score >= threshold
 */
class CanonicalNameStrategy : public IEntityResolutionStrategy {
public:
    explicit CanonicalNameStrategy(double matchThreshold = 0.85) : threshold_(matchThreshold) {}

    std::string canonicalize(const std::string& name) const override;
    std::optional<EntityMatch> resolve(const EntityMention& mention,
                                       const std::vector<metadata::Entity>& candidates) const override;

    [[nodiscard]] double threshold() const noexcept { return threshold_; }

    static std::string normalizeName(const std::string& name);
    static double levenshteinSimilarity(const std::string& a, const std::string& b);
    static double tokenJaccard(const std::string& a, const std::string& b);

private:
    double threshold_;
};

/**
 * @brief Maintains canonical entity identities of a bank and links text to them
 */
class EntityResolver {
public:
    explicit EntityResolver(std::shared_ptr<IEntityResolutionStrategy> strategy);

    /**
     * @brief Resolve mentions to entity ids, creating entities that do not resolve.
     *
     * Runs inside the caller's write transaction. Returned ids are unique and follow
     * first-mention order.
     */
    Result<std::vector<std::string>> resolveAll(metadata::MemorySession& session,
                                                const std::string& bankId,
                                                const std::vector<EntityMention>& mentions) const;

    /**
     * @brief Entities of the bank mentioned in a query
     */
    Result<std::vector<std::string>> linkQuery(metadata::MemorySession& session,
                                               const std::string& bankId,
                                               const std::string& text) const;

    /**
     * @brief Longest-first n-gram linking (n <= 4) against known entities
     */
    std::vector<std::string> linkText(const std::string& text,
                                      const std::vector<metadata::Entity>& entities) const;

private:
    std::shared_ptr<IEntityResolutionStrategy> strategy_;
};

} // namespace engram::search
