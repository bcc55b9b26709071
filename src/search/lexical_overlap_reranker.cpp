#include <set>
#include <unordered_set>
#include <engram/core/text_tokens.h>
#include <engram/search/reranker.h>

namespace engram::search {

namespace {

std::vector<std::string> contentTerms(const std::string& text) {
    std::vector<std::string> out;
    for (auto& t : core::tokenizeWords(text)) {
        if (!core::isStopWord(t))
            out.push_back(std::move(t));
    }
    return out;
}

std::set<std::string> bigrams(const std::vector<std::string>& terms) {
    std::set<std::string> out;
    for (size_t i = 0; i + 1 < terms.size(); ++i) {
        out.insert(terms[i] + ' ' + terms[i + 1]);
    }
    return out;
}

} // namespace

Result<std::vector<float>>
LexicalOverlapReranker::scoreDocuments(const std::string& query,
                                       const std::vector<std::string>& documents) {
    const auto queryTerms = contentTerms(query);
    const std::set<std::string> queryUnigrams(queryTerms.begin(), queryTerms.end());
    const auto queryBigrams = bigrams(queryTerms);

    std::vector<float> scores;
    scores.reserve(documents.size());
    for (const auto& doc : documents) {
        if (queryUnigrams.empty()) {
            scores.push_back(0.0f);
            continue;
        }
        const auto docTerms = contentTerms(doc);
        const std::unordered_set<std::string> docUnigrams(docTerms.begin(), docTerms.end());
        const auto docBigrams = bigrams(docTerms);

        size_t hits = 0;
        for (const auto& t : queryUnigrams) {
            if (docUnigrams.count(t))
                ++hits;
        }
        size_t bigramHits = 0;
        for (const auto& b : queryBigrams) {
            if (docBigrams.count(b))
                ++bigramHits;
        }

        double score = static_cast<double>(hits) / static_cast<double>(queryUnigrams.size());
        if (!queryBigrams.empty()) {
            score += 0.5 * static_cast<double>(bigramHits) /
                     static_cast<double>(queryBigrams.size());
        }
        scores.push_back(static_cast<float>(score / 1.5));
    }
    return scores;
}

} // namespace engram::search
