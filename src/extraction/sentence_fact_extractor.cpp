#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string_view>
#include <engram/core/text_tokens.h>
#include <engram/extraction/fact_extractor.h>

namespace engram::extraction {

namespace {

constexpr std::string_view kFirstPerson[] = {"i", "me", "my", "mine", "myself", "we", "us", "our",
                                             "ours", "ourselves", "im", "ive", "id", "ill"};

constexpr std::string_view kHedges[] = {"think",   "believe", "feel",      "guess",   "suspect",
                                        "suppose", "probably", "maybe",    "perhaps", "seems",
                                        "opinion", "doubt",   "reckon",    "likely",  "unlikely",
                                        "imagine", "assume",  "apparently"};

// Capitalised words that start sentences or name calendar units, never entities
constexpr std::string_view kNonEntityWords[] = {
    "yesterday", "today",    "tomorrow",  "monday",  "tuesday",  "wednesday", "thursday",
    "friday",    "saturday", "sunday",    "january", "february", "march",     "april",
    "may",       "june",     "july",      "august",  "september", "october",  "november",
    "december",  "spring",   "summer",    "autumn",  "fall",     "winter",    "last",
    "next",      "after",    "before",    "also",    "then",     "but",       "however",
    "there",     "these",    "those",     "if",      "not",      "no",        "yes",
    "im",        "ive",      "id",        "ill",     "maybe",    "perhaps",   "probably"};

template <size_t N> bool contains(const std::string_view (&words)[N], std::string_view token) {
    return std::find(std::begin(words), std::end(words), token) != std::end(words);
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string(s.substr(b, e - b));
}

bool hasWord(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc >= 0x80 || std::isalpha(uc);
    });
}

// ASCII capital or a Latin-1 capital such as "É"
bool startsUpper(std::string_view w) {
    if (w.empty())
        return false;
    auto c = static_cast<unsigned char>(w[0]);
    if (c == 0xC3 && w.size() > 1) {
        auto next = static_cast<unsigned char>(w[1]);
        return next >= 0x80 && next <= 0x9E && next != 0x97;
    }
    return std::isupper(c) != 0;
}

// Words of a sentence with punctuation stripped from both ends, original case kept
std::vector<std::string> surfaceWords(const std::string& sentence) {
    std::vector<std::string> words;
    std::string cur;
    auto flush = [&]() {
        size_t b = 0;
        size_t e = cur.size();
        while (b < e && !core::isWordByte(static_cast<unsigned char>(cur[b])))
            ++b;
        while (e > b && !core::isWordByte(static_cast<unsigned char>(cur[e - 1])))
            --e;
        // Possessive suffix belongs to the name
        if (e - b > 2 && cur[e - 2] == '\'' && (cur[e - 1] == 's' || cur[e - 1] == 'S'))
            e -= 2;
        words.push_back(cur.substr(b, e - b));
        cur.clear();
    };
    for (char c : sentence) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty())
                flush();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
        flush();
    return words;
}

// A word ends the running mention when it carries trailing punctuation
bool endsClause(const std::string& raw) {
    return !raw.empty() && (raw.back() == ',' || raw.back() == ';' || raw.back() == ':');
}

} // namespace

SentenceFactExtractor::SentenceFactExtractor(
    std::shared_ptr<search::ITemporalParser> temporalParser)
    : temporalParser_(std::move(temporalParser)) {}

std::vector<std::string> SentenceFactExtractor::splitSentences(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;
    auto push = [&]() {
        auto s = trim(cur);
        if (s.size() >= 3 && hasWord(s))
            out.push_back(std::move(s));
        cur.clear();
    };
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\n' || c == '\r') {
            push();
            continue;
        }
        cur.push_back(c);
        if (c == '.' || c == '!' || c == '?') {
            const bool atBoundary =
                i + 1 >= text.size() || std::isspace(static_cast<unsigned char>(text[i + 1]));
            // "Dr. Smith": honorifics do not end a sentence
            bool abbreviation = false;
            if (c == '.' && atBoundary) {
                auto lastSpace = cur.find_last_of(' ');
                auto word = cur.substr(lastSpace == std::string::npos ? 0 : lastSpace + 1);
                abbreviation = word == "Mr." || word == "Ms." || word == "Dr." ||
                               word == "Mrs." || word == "St." || word == "Prof.";
            }
            if (atBoundary && !abbreviation)
                push();
        }
    }
    push();
    return out;
}

metadata::FactType SentenceFactExtractor::classify(const std::string& sentence) {
    bool firstPerson = false;
    bool hedged = false;
    for (const auto& token : core::tokenizeWords(sentence)) {
        if (contains(kFirstPerson, token))
            firstPerson = true;
        if (contains(kHedges, token))
            hedged = true;
    }
    if (firstPerson && hedged)
        return metadata::FactType::Opinion;
    if (firstPerson)
        return metadata::FactType::Agent;
    return metadata::FactType::World;
}

std::vector<search::EntityMention>
SentenceFactExtractor::findEntityMentions(const std::string& sentence) {
    std::vector<search::EntityMention> mentions;
    std::vector<std::string> rawWords;
    {
        std::string cur;
        for (char c : sentence) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (!cur.empty())
                    rawWords.push_back(std::move(cur));
                cur.clear();
            } else {
                cur.push_back(c);
            }
        }
        if (!cur.empty())
            rawWords.push_back(std::move(cur));
    }
    const auto words = surfaceWords(sentence);

    std::vector<std::string> run;
    auto flush = [&]() {
        if (run.empty())
            return;
        std::string name;
        for (const auto& w : run) {
            if (!name.empty())
                name.push_back(' ');
            name += w;
        }
        const bool seen = std::any_of(mentions.begin(), mentions.end(),
                                      [&](const auto& m) { return m.name == name; });
        if (!seen)
            mentions.push_back(search::EntityMention{name, ""});
        run.clear();
    };

    for (size_t i = 0; i < words.size(); ++i) {
        const auto& w = words[i];
        const bool capitalised = startsUpper(w) && hasWord(w);
        const auto lower = core::toLower(w);
        const bool excluded = w == "I" || lower.rfind("i'", 0) == 0 ||
                              contains(kNonEntityWords, lower) ||
                              contains(kFirstPerson, lower) ||
                              (i == 0 && core::isStopWord(lower));
        if (capitalised && !excluded) {
            run.push_back(w);
            if (i < rawWords.size() && endsClause(rawWords[i]))
                flush();
        } else {
            flush();
        }
    }
    flush();
    return mentions;
}

Result<std::vector<ExtractedFact>> SentenceFactExtractor::extract(const ExtractionRequest& request) {
    std::vector<ExtractedFact> facts;
    for (auto& sentence : splitSentences(request.text)) {
        ExtractedFact fact;
        fact.factType = classify(sentence);
        fact.entities = findEntityMentions(sentence);

        std::optional<metadata::TimeRange> occurred;
        if (temporalParser_) {
            auto found = temporalParser_->findInText(sentence, request.referenceTime);
            if (!found)
                return found.error();
            occurred = found.value();
        }
        if (!occurred)
            occurred = request.occurredHint;
        if (occurred) {
            fact.occurredStart = occurred->start;
            fact.occurredEnd = occurred->end;
        }
        fact.text = std::move(sentence);
        facts.push_back(std::move(fact));
    }
    spdlog::debug("[Extract] {} facts from {} chars", facts.size(), request.text.size());
    return facts;
}

} // namespace engram::extraction
