#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <engram/core/types.h>
#include <engram/metadata/memory_types.h>
#include <engram/search/entity_resolver.h>
#include <engram/search/temporal_parser.h>

namespace engram::extraction {

struct ExtractionRequest {
    std::string text;
    std::string context;
    std::optional<metadata::TimeRange> occurredHint;
    TimePoint referenceTime;
};

struct ExtractedFact {
    std::string text;
    metadata::FactType factType = metadata::FactType::World;
    std::vector<search::EntityMention> entities;
    std::optional<TimePoint> occurredStart;
    std::optional<TimePoint> occurredEnd;
    std::optional<double> confidence; ///< Pipeline default when absent
};

/**
 * @brief Distills free text into typed candidate facts
 */
class IFactExtractor {
public:
    virtual ~IFactExtractor() = default;

    virtual Result<std::vector<ExtractedFact>> extract(const ExtractionRequest& request) = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Local rule-based extractor: one fact per sentence.
 *
 * - First-person sentences are agent facts; first-person sentences that hedge ("I think",
 *   "I believe", "probably") are opinions; everything else is a world fact
 * - Runs of capitalised words are entity mentions
 * - A date expression inside the sentence becomes its occurrence range, otherwise the
 *   request's occurrence hint applies
 */
class SentenceFactExtractor : public IFactExtractor {
public:
    explicit SentenceFactExtractor(std::shared_ptr<search::ITemporalParser> temporalParser);

    Result<std::vector<ExtractedFact>> extract(const ExtractionRequest& request) override;
    std::string name() const override { return "Sentence"; }

    static std::vector<std::string> splitSentences(const std::string& text);
    static metadata::FactType classify(const std::string& sentence);
    static std::vector<search::EntityMention> findEntityMentions(const std::string& sentence);

private:
    std::shared_ptr<search::ITemporalParser> temporalParser_;
};

} // namespace engram::extraction
