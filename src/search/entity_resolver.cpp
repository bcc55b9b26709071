#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <engram/core/text_tokens.h>
#include <engram/core/uuid.h>
#include <engram/search/entity_resolver.h>

namespace engram::search {

namespace {

constexpr size_t kMaxNgram = 4;

std::string singularizeHeuristic(const std::string& s) {
    // simplistic heuristic: trailing "ies" -> "y"; trailing 's' (not "ss") dropped
    if (s.size() > 3 && s.compare(s.size() - 3, 3, "ies") == 0) {
        return s.substr(0, s.size() - 3) + "y";
    }
    if (s.size() > 3 && s.back() == 's' && s[s.size() - 2] != 's') {
        return s.substr(0, s.size() - 1);
    }
    return s;
}

std::vector<std::string> splitSpaces(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ' ') {
            if (!cur.empty())
                out.push_back(std::move(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty())
        out.push_back(std::move(cur));
    return out;
}

bool typesConflict(const std::string& a, const std::string& b) {
    return !a.empty() && !b.empty() && core::toLower(a) != core::toLower(b);
}

} // namespace

// ----------------------------------------------------------------------------
// CanonicalNameStrategy
// ----------------------------------------------------------------------------

std::string CanonicalNameStrategy::normalizeName(const std::string& name) {
    std::string lowered = core::toLower(name);

    std::string collapsed;
    bool pendingSpace = false;
    for (unsigned char c : lowered) {
        if (std::isspace(c)) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !collapsed.empty())
            collapsed += ' ';
        pendingSpace = false;
        collapsed += static_cast<char>(c);
    }

    auto l = collapsed.begin();
    auto r = collapsed.end();
    while (l < r && !core::isWordByte(static_cast<unsigned char>(*l)))
        ++l;
    while (r > l && !core::isWordByte(static_cast<unsigned char>(*(r - 1))))
        --r;
    std::string trimmed(l, r);
    if (trimmed.empty())
        return trimmed;

    // possessive "'s" carries no identity
    if (trimmed.size() > 2 && trimmed.compare(trimmed.size() - 2, 2, "'s") == 0)
        trimmed.resize(trimmed.size() - 2);

    auto lastSpace = trimmed.rfind(' ');
    if (lastSpace == std::string::npos)
        return singularizeHeuristic(trimmed);
    return trimmed.substr(0, lastSpace + 1) + singularizeHeuristic(trimmed.substr(lastSpace + 1));
}

double CanonicalNameStrategy::levenshteinSimilarity(const std::string& a, const std::string& b) {
    if (a.empty() && b.empty())
        return 1.0;
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j)
        prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            const size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    const double maxLen = static_cast<double>(std::max(a.size(), b.size()));
    return 1.0 - static_cast<double>(prev[b.size()]) / maxLen;
}

double CanonicalNameStrategy::tokenJaccard(const std::string& a, const std::string& b) {
    auto ta = splitSpaces(a);
    auto tb = splitSpaces(b);
    std::set<std::string> sa(ta.begin(), ta.end());
    std::set<std::string> sb(tb.begin(), tb.end());
    if (sa.empty() && sb.empty())
        return 1.0;
    size_t inter = 0;
    for (const auto& t : sa) {
        if (sb.count(t))
            ++inter;
    }
    const size_t uni = sa.size() + sb.size() - inter;
    return uni == 0 ? 0.0 : static_cast<double>(inter) / static_cast<double>(uni);
}

std::string CanonicalNameStrategy::canonicalize(const std::string& name) const {
    return normalizeName(name);
}

std::optional<EntityMatch>
CanonicalNameStrategy::resolve(const EntityMention& mention,
                               const std::vector<metadata::Entity>& candidates) const {
    const std::string canonical = normalizeName(mention.name);
    if (canonical.empty())
        return std::nullopt;

    std::optional<EntityMatch> best;
    std::string bestCanonical;
    for (const auto& candidate : candidates) {
        double score;
        if (candidate.canonicalName == canonical) {
            score = 1.0;
        } else {
            score = std::max(levenshteinSimilarity(canonical, candidate.canonicalName),
                             tokenJaccard(canonical, candidate.canonicalName));
            if (typesConflict(mention.type, candidate.type))
                score -= 0.1;
        }
        if (score < threshold_)
            continue;
        if (!best || score > best->score ||
            (score == best->score && candidate.canonicalName < bestCanonical)) {
            best = EntityMatch{candidate.id, score};
            bestCanonical = candidate.canonicalName;
        }
    }
    return best;
}

// ----------------------------------------------------------------------------
// EntityResolver
// ----------------------------------------------------------------------------

EntityResolver::EntityResolver(std::shared_ptr<IEntityResolutionStrategy> strategy)
    : strategy_(std::move(strategy)) {
    if (!strategy_) {
        strategy_ = std::make_shared<CanonicalNameStrategy>();
    }
}

Result<std::vector<std::string>>
EntityResolver::resolveAll(metadata::MemorySession& session, const std::string& bankId,
                           const std::vector<EntityMention>& mentions) const {
    std::vector<std::string> ids;
    if (mentions.empty())
        return ids;

    auto existing = session.listEntities(bankId);
    if (!existing)
        return existing.error();
    auto entities = std::move(existing).value();

    std::unordered_set<std::string> seen;
    for (const auto& mention : mentions) {
        const std::string canonical = strategy_->canonicalize(mention.name);
        if (canonical.empty())
            continue;

        std::string entityId;
        if (auto match = strategy_->resolve(mention, entities)) {
            entityId = match->entityId;
        } else {
            metadata::Entity entity;
            entity.id = core::generateId("ent");
            entity.bankId = bankId;
            entity.name = mention.name;
            entity.type = mention.type;
            entity.canonicalName = canonical;
            auto inserted = session.insertEntity(entity);
            if (!inserted)
                return inserted.error();
            spdlog::debug("[EntityResolver] New entity '{}' ({}) in bank '{}'", entity.name,
                          entity.canonicalName, bankId);
            entityId = entity.id;
            entities.push_back(std::move(entity));
        }
        if (seen.insert(entityId).second)
            ids.push_back(std::move(entityId));
    }
    return ids;
}

Result<std::vector<std::string>> EntityResolver::linkQuery(metadata::MemorySession& session,
                                                           const std::string& bankId,
                                                           const std::string& text) const {
    auto entities = session.listEntities(bankId);
    if (!entities)
        return entities.error();
    return linkText(text, entities.value());
}

std::vector<std::string>
EntityResolver::linkText(const std::string& text,
                         const std::vector<metadata::Entity>& entities) const {
    std::vector<std::string> out;
    if (entities.empty())
        return out;

    std::unordered_map<std::string, std::string> byCanonical;
    for (const auto& e : entities) {
        byCanonical.emplace(e.canonicalName, e.id);
    }

    const auto tokens = core::tokenizeWords(text);
    std::vector<bool> used(tokens.size(), false);
    std::unordered_set<std::string> seen;

    auto anyUsed = [&](size_t b, size_t e) {
        for (size_t i = b; i < e; ++i) {
            if (used[i])
                return true;
        }
        return false;
    };

    // Longest-first matching to avoid overlapping shorter phrases
    for (size_t n = std::min(kMaxNgram, tokens.size()); n >= 1; --n) {
        for (size_t i = 0; i + n <= tokens.size(); ++i) {
            if (anyUsed(i, i + n))
                continue;
            if (n == 1 && core::isStopWord(tokens[i]))
                continue;

            std::string phrase;
            for (size_t j = 0; j < n; ++j) {
                if (j)
                    phrase.push_back(' ');
                phrase.append(tokens[i + j]);
            }
            auto it = byCanonical.find(strategy_->canonicalize(phrase));
            if (it == byCanonical.end())
                continue;

            if (seen.insert(it->second).second)
                out.push_back(it->second);
            for (size_t j = i; j < i + n; ++j)
                used[j] = true;
        }
        if (n == 1)
            break;
    }

    // Fuzzy fallback for leftover content words
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (used[i] || tokens[i].size() < 4 || core::isStopWord(tokens[i]))
            continue;
        if (auto match = strategy_->resolve(EntityMention{tokens[i], ""}, entities)) {
            if (seen.insert(match->entityId).second)
                out.push_back(match->entityId);
        }
    }
    return out;
}

} // namespace engram::search
