#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <regex>
#include <string_view>
#include <engram/core/text_tokens.h>
#include <engram/search/temporal_parser.h>

namespace engram::search {

using metadata::TimeRange;
namespace chr = std::chrono;

namespace {

constexpr auto kDay = chr::hours(24);
constexpr auto kOneMs = chr::milliseconds(1);

const std::string kMonthPattern =
    "(january|february|march|april|may|june|july|august|september|october|november|"
    "december|jan|feb|mar|apr|jun|jul|aug|sept|sep|oct|nov|dec)";

// Calendar date forms accepted on either side of a range
const std::string kDatePattern = "(?:\\d{4}-\\d{2}-\\d{2}|\\d{4}-\\d{2}|" + kMonthPattern +
                                 "\\s+\\d{1,2}(?:st|nd|rd|th)?,?\\s+\\d{4}|" + kMonthPattern +
                                 "\\s+\\d{4}|\\d{4})";

std::optional<unsigned> monthFromName(std::string_view name) {
    static constexpr std::array<std::string_view, 12> kFull = {
        "january", "february", "march",     "april",   "may",      "june",
        "july",    "august",   "september", "october", "november", "december"};
    for (unsigned i = 0; i < kFull.size(); ++i) {
        if (name == kFull[i] || (name.size() >= 3 && kFull[i].substr(0, name.size()) == name))
            return i + 1;
    }
    return std::nullopt;
}

std::optional<int> numberFromWord(const std::string& word) {
    static const std::array<std::pair<std::string_view, int>, 14> kWords = {{{"a", 1},
                                                                             {"an", 1},
                                                                             {"one", 1},
                                                                             {"two", 2},
                                                                             {"three", 3},
                                                                             {"four", 4},
                                                                             {"five", 5},
                                                                             {"six", 6},
                                                                             {"seven", 7},
                                                                             {"eight", 8},
                                                                             {"nine", 9},
                                                                             {"ten", 10},
                                                                             {"eleven", 11},
                                                                             {"twelve", 12}}};
    for (const auto& [w, n] : kWords) {
        if (word == w)
            return n;
    }
    if (!word.empty() && std::all_of(word.begin(), word.end(), ::isdigit) && word.size() <= 5)
        return std::stoi(word);
    return std::nullopt;
}

std::optional<TimePoint> civil(int y, unsigned m, unsigned d) {
    chr::year_month_day ymd{chr::year{y}, chr::month{m}, chr::day{d}};
    if (!ymd.ok())
        return std::nullopt;
    return TimePoint(chr::sys_days{ymd});
}

std::optional<TimeRange> dayRange(int y, unsigned m, unsigned d) {
    auto start = civil(y, m, d);
    if (!start)
        return std::nullopt;
    return TimeRange{*start, *start + kDay - kOneMs};
}

std::optional<TimeRange> monthSpan(int y, unsigned firstMonth, unsigned months) {
    if (firstMonth < 1 || firstMonth > 12)
        return std::nullopt;
    chr::year_month first{chr::year{y}, chr::month{firstMonth}};
    auto next = first + chr::months{static_cast<int>(months)};
    TimePoint start{chr::sys_days{first / 1}};
    TimePoint end{chr::sys_days{next / 1}};
    return TimeRange{start, end - kOneMs};
}

TimePoint startOfDay(TimePoint tp) {
    return TimePoint(chr::floor<chr::days>(tp));
}

TimeRange dayOf(TimePoint tp) {
    auto start = startOfDay(tp);
    return TimeRange{start, start + kDay - kOneMs};
}

int yearOf(TimePoint tp) {
    chr::year_month_day ymd{chr::floor<chr::days>(tp)};
    return static_cast<int>(ymd.year());
}

unsigned monthOf(TimePoint tp) {
    chr::year_month_day ymd{chr::floor<chr::days>(tp)};
    return static_cast<unsigned>(ymd.month());
}

chr::hours unitLength(const std::string& unit) {
    if (unit.rfind("hour", 0) == 0)
        return chr::hours(1);
    if (unit.rfind("week", 0) == 0)
        return kDay * 7;
    if (unit.rfind("month", 0) == 0)
        return kDay * 30;
    if (unit.rfind("year", 0) == 0)
        return kDay * 365;
    return kDay;
}

std::string normalize(const std::string& text) {
    std::string out = core::toLower(text);
    auto first = out.find_first_not_of(" \t\r\n.,;!?");
    if (first == std::string::npos)
        return {};
    auto last = out.find_last_not_of(" \t\r\n.,;!?");
    out = out.substr(first, last - first + 1);
    // collapse runs of whitespace
    std::string collapsed;
    bool space = false;
    for (char c : out) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = true;
            continue;
        }
        if (space && !collapsed.empty())
            collapsed += ' ';
        space = false;
        collapsed += c;
    }
    return collapsed;
}

std::optional<TimeRange> parseSingle(const std::string& s, TimePoint reference) {
    std::smatch m;

    // ISO date-time, treated as an instant
    static const std::regex isoDateTime(
        R"(^(\d{4})-(\d{2})-(\d{2})[t ](\d{2}):(\d{2})(?::(\d{2}))?(?:\.\d+)?z?$)");
    if (std::regex_match(s, m, isoDateTime)) {
        auto day = civil(std::stoi(m[1]), std::stoul(m[2]), std::stoul(m[3]));
        if (!day)
            return std::nullopt;
        const int hh = std::stoi(m[4]);
        const int mm = std::stoi(m[5]);
        const int ss = m[6].matched ? std::stoi(m[6]) : 0;
        if (hh > 23 || mm > 59 || ss > 59)
            return std::nullopt;
        auto tp = *day + chr::hours(hh) + chr::minutes(mm) + chr::seconds(ss);
        return TimeRange{tp, tp};
    }

    static const std::regex isoDate(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    if (std::regex_match(s, m, isoDate)) {
        return dayRange(std::stoi(m[1]), std::stoul(m[2]), std::stoul(m[3]));
    }

    static const std::regex isoMonth(R"(^(\d{4})-(\d{2})$)");
    if (std::regex_match(s, m, isoMonth)) {
        return monthSpan(std::stoi(m[1]), std::stoul(m[2]), 1);
    }

    static const std::regex monthDayYear("^" + kMonthPattern +
                                         R"(\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4})$)");
    if (std::regex_match(s, m, monthDayYear)) {
        auto month = monthFromName(m[1].str());
        if (!month)
            return std::nullopt;
        return dayRange(std::stoi(m[3]), *month, std::stoul(m[2]));
    }

    static const std::regex monthYear("^" + kMonthPattern + R"(,?\s+(?:of\s+)?(\d{4})$)");
    if (std::regex_match(s, m, monthYear)) {
        auto month = monthFromName(m[1].str());
        if (!month)
            return std::nullopt;
        return monthSpan(std::stoi(m[2]), *month, 1);
    }

    static const std::regex monthOnly("^(?:in\\s+)?" + kMonthPattern + "$");
    if (std::regex_match(s, m, monthOnly)) {
        auto month = monthFromName(m[1].str());
        if (!month)
            return std::nullopt;
        return monthSpan(yearOf(reference), *month, 1);
    }

    static const std::regex yearOnly(R"(^(?:in\s+|during\s+)?(\d{4})$)");
    if (std::regex_match(s, m, yearOnly)) {
        return monthSpan(std::stoi(m[1]), 1, 12);
    }

    static const std::regex season(R"(^(?:the\s+)?(spring|summer|autumn|fall|winter)\s+(?:of\s+)?(\d{4})$)");
    if (std::regex_match(s, m, season)) {
        const std::string name = m[1].str();
        const int y = std::stoi(m[2]);
        if (name == "spring")
            return monthSpan(y, 3, 3);
        if (name == "summer")
            return monthSpan(y, 6, 3);
        if (name == "autumn" || name == "fall")
            return monthSpan(y, 9, 3);
        return monthSpan(y, 12, 3); // December through February
    }

    static const std::regex quarter(R"(^q([1-4])\s+(\d{4})$)");
    if (std::regex_match(s, m, quarter)) {
        const unsigned q = std::stoul(m[1]);
        return monthSpan(std::stoi(m[2]), 3 * q - 2, 3);
    }

    if (s == "today")
        return dayOf(reference);
    if (s == "yesterday")
        return dayOf(reference - kDay);
    if (s == "tomorrow")
        return dayOf(reference + kDay);
    if (s == "this week") {
        auto start = startOfDay(reference) - kDay * 6;
        return TimeRange{start, dayOf(reference).end};
    }
    if (s == "this month")
        return monthSpan(yearOf(reference), monthOf(reference), 1);
    if (s == "this year")
        return monthSpan(yearOf(reference), 1, 12);

    static const std::regex lastUnit(R"(^(?:last|past|previous)\s+(week|month|year)$)");
    if (std::regex_match(s, m, lastUnit)) {
        return TimeRange{reference - unitLength(m[1].str()), reference};
    }

    static const std::regex lastN(
        R"(^(?:in\s+the\s+|over\s+the\s+|during\s+the\s+)?(?:last|past|previous)\s+(\w+)\s+(hours?|days?|weeks?|months?|years?)$)");
    if (std::regex_match(s, m, lastN)) {
        auto n = numberFromWord(m[1].str());
        if (!n || *n <= 0)
            return std::nullopt;
        return TimeRange{reference - unitLength(m[2].str()) * *n, reference};
    }

    static const std::regex ago(R"(^(\w+)\s+(hours?|days?|weeks?|months?|years?)\s+ago$)");
    if (std::regex_match(s, m, ago)) {
        auto n = numberFromWord(m[1].str());
        if (!n || *n < 0)
            return std::nullopt;
        const auto unit = unitLength(m[2].str());
        auto point = reference - unit * *n;
        if (unit <= kDay)
            return dayOf(point);
        auto start = startOfDay(point);
        return TimeRange{start, start + unit - kOneMs};
    }

    return std::nullopt;
}

} // namespace

std::optional<TimeRange> HeuristicTemporalParser::parseExpression(const std::string& expression,
                                                                  TimePoint reference) {
    const std::string s = normalize(expression);
    if (s.empty())
        return std::nullopt;

    std::smatch m;
    static const std::regex between(R"(^(?:between|from)\s+(.+?)\s+(?:and|to|until|through)\s+(.+)$)");
    static const std::regex plainRange(R"(^(.+?)\s+(?:to|until|through)\s+(.+)$)");
    if (std::regex_match(s, m, between) || std::regex_match(s, m, plainRange)) {
        auto lhs = parseSingle(m[1].str(), reference);
        auto rhs = parseSingle(m[2].str(), reference);
        if (!lhs || !rhs)
            return std::nullopt;
        TimeRange range{std::min(lhs->start, rhs->start), std::max(lhs->end, rhs->end)};
        return range;
    }

    return parseSingle(s, reference);
}

Result<std::optional<TimeRange>> HeuristicTemporalParser::parse(const std::string& expression,
                                                                TimePoint reference) {
    auto range = parseExpression(expression, reference);
    if (!range) {
        spdlog::debug("[TemporalParser] Unresolved expression '{}'", expression);
    }
    return range;
}

Result<std::optional<TimeRange>> HeuristicTemporalParser::findInText(const std::string& text,
                                                                     TimePoint reference) {
    const std::string s = core::toLower(text);

    // Longest, most specific forms first
    static const std::vector<std::regex> kPatterns = {
        std::regex("(?:between|from)\\s+" + kDatePattern + "\\s+(?:and|to|until|through)\\s+" +
                   kDatePattern),
        std::regex(R"(\d{4}-\d{2}-\d{2}[t ]\d{2}:\d{2}(?::\d{2})?z?)"),
        std::regex(kDatePattern + "\\s+(?:to|until|through)\\s+" + kDatePattern),
        std::regex(R"(\d{4}-\d{2}-\d{2})"),
        std::regex(kMonthPattern + R"(\s+\d{1,2}(?:st|nd|rd|th)?,?\s+\d{4})"),
        std::regex(R"(\b(?:spring|summer|autumn|fall|winter)\s+(?:of\s+)?\d{4}\b)"),
        std::regex(R"(\bq[1-4]\s+\d{4}\b)"),
        std::regex("\\b" + kMonthPattern + R"(,?\s+(?:of\s+)?\d{4}\b)"),
        std::regex(R"(\b(?:last|past|previous)\s+\w+\s+(?:hours?|days?|weeks?|months?|years?)\b)"),
        std::regex(R"(\b\w+\s+(?:hours?|days?|weeks?|months?|years?)\s+ago\b)"),
        std::regex(R"(\b(?:last|past|previous)\s+(?:week|month|year)\b)"),
        std::regex(R"(\bthis\s+(?:week|month|year)\b)"),
        std::regex(R"(\b(?:today|yesterday|tomorrow)\b)"),
        std::regex(R"(\b(?:in|during|since)\s+(?:19|20)\d{2}\b)"),
    };

    for (const auto& pattern : kPatterns) {
        auto begin = std::sregex_iterator(s.begin(), s.end(), pattern);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            std::string candidate = it->str();
            if (candidate.rfind("since ", 0) == 0) {
                auto from = parseExpression(candidate.substr(6), reference);
                if (from)
                    return std::optional<TimeRange>{TimeRange{from->start, reference}};
                continue;
            }
            auto range = parseExpression(candidate, reference);
            if (range) {
                spdlog::debug("[TemporalParser] Found '{}' in query text", candidate);
                return range;
            }
        }
    }
    return std::optional<TimeRange>{};
}

std::string formatISO8601(TimePoint tp) {
    auto tt = chr::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string formatDate(TimePoint tp) {
    auto tt = chr::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

} // namespace engram::search
