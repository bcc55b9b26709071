#pragma once

#include <optional>
#include <string>
#include <engram/core/types.h>
#include <engram/metadata/memory_types.h>

namespace engram::search {

/**
 * @brief Natural-language time expression to date range.
 *
 * A successful call with an empty optional means "unresolved"; errors are reserved for
 * capability failures (timeouts, transport).
 */
class ITemporalParser {
public:
    virtual ~ITemporalParser() = default;

    /**
     * @brief Resolve a complete expression ("spring 2024", "2024-03-01 to 2024-03-05")
     */
    virtual Result<std::optional<metadata::TimeRange>> parse(const std::string& expression,
                                                             TimePoint reference) = 0;

    /**
     * @brief Locate and resolve the first time expression inside free text
     */
    virtual Result<std::optional<metadata::TimeRange>> findInText(const std::string& text,
                                                                  TimePoint reference) = 0;
};

/**
 * @brief Rule-based parser for common English date expressions (UTC calendar).
 *
 * Supported forms:
 * - ISO 8601: "2024-03-01", "2024-03-01T10:30:00Z", "2024-03"
 * - Calendar: "March 2024", "March 5, 2024", "2024", "Q2 2024", "spring 2024"
 * - Relative: "today", "yesterday", "tomorrow", "this week|month|year",
 *   "last week|month|year", "3 days ago", "last 10 days", "past two weeks"
 * - Ranges: "A to B", "A until B", "between A and B", "from A to B"
 *
 * Weeks are 7 days, months 30 days and years 365 days in relative forms.
 */
class HeuristicTemporalParser : public ITemporalParser {
public:
    Result<std::optional<metadata::TimeRange>> parse(const std::string& expression,
                                                     TimePoint reference) override;
    Result<std::optional<metadata::TimeRange>> findInText(const std::string& text,
                                                          TimePoint reference) override;

    static std::optional<metadata::TimeRange> parseExpression(const std::string& expression,
                                                              TimePoint reference);
};

// "2024-03-01T10:30:00Z"
std::string formatISO8601(TimePoint tp);

// "2024-03-01"
std::string formatDate(TimePoint tp);

} // namespace engram::search
