#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <engram/reflect/personality_prompt.h>
#include <engram/search/temporal_parser.h>

namespace engram::reflect {

using json = nlohmann::json;

namespace {

const char* degree(double value) {
    if (value >= 0.8)
        return "very";
    if (value >= 0.6)
        return "fairly";
    if (value > 0.4)
        return "moderately";
    if (value > 0.2)
        return "not especially";
    return "not at all";
}

// Reasoners wrap JSON in prose or code fences; take the outermost object
std::optional<json> extractJsonObject(const std::string& raw) {
    const auto open = raw.find('{');
    const auto close = raw.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open)
        return std::nullopt;
    auto j = json::parse(raw.substr(open, close - open + 1), nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    return j;
}

std::string trimmed(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

void appendFacts(std::ostringstream& out, const char* heading,
                 const std::vector<search::RecallHit>& hits, bool withConfidence) {
    out << heading << "\n";
    if (hits.empty()) {
        out << "- (none)\n";
        return;
    }
    for (const auto& hit : hits) {
        const auto& u = hit.unit;
        out << "- [" << u.id << "] " << u.text;
        if (u.occurredStart) {
            out << " (when: " << search::formatDate(*u.occurredStart);
            if (u.occurredEnd && *u.occurredEnd != *u.occurredStart)
                out << " to " << search::formatDate(*u.occurredEnd);
            out << ")";
        }
        if (withConfidence) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), " (confidence %.2f)", u.confidence);
            out << buf;
        }
        out << "\n";
    }
}

double readUnitInterval(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_number())
        return 0.5;
    return std::clamp(j.at(key).get<double>(), 0.0, 1.0);
}

} // namespace

std::string describePersonality(const metadata::PersonalityTraits& t) {
    std::ostringstream out;
    out << degree(t.openness) << " open to new ideas, " << degree(t.conscientiousness)
        << " organised and careful, " << degree(t.extraversion) << " outgoing, "
        << degree(t.agreeableness) << " agreeable, and " << degree(t.neuroticism)
        << " prone to worry";
    return out.str();
}

ml::ReasoningPrompt buildReflectPrompt(const metadata::Bank& bank, const std::string& query,
                                       const std::string& extraContext,
                                       const ReflectContext& facts) {
    ml::ReasoningPrompt prompt;
    {
        std::ostringstream sys;
        sys << "You are " << (bank.name.empty() ? bank.id : bank.name) << ".";
        if (!bank.background.empty())
            sys << " Background: " << bank.background;
        sys << "\nYour personality: " << describePersonality(bank.personality) << ".";
        if (bank.personality.biasStrength >= 0.6) {
            sys << " Let your existing opinions and personality colour your answer strongly.";
        } else if (bank.personality.biasStrength <= 0.4) {
            sys << " Keep your answer close to the facts; let personality show only lightly.";
        } else {
            sys << " Balance your personality with the facts.";
        }
        sys << "\nAnswer only from the memories provided. Reply with a single JSON object and "
               "nothing else.";
        prompt.system = sys.str();
    }

    std::ostringstream user;
    user << "Question: " << query << "\n";
    if (!extraContext.empty())
        user << "Additional context: " << extraContext << "\n";
    user << "\n";
    appendFacts(user, "What I know about the world:", facts.world, false);
    appendFacts(user, "What I have done or experienced:", facts.agent, false);
    appendFacts(user, "My existing opinions:", facts.opinions, true);
    user << "\nRespond with JSON of this shape:\n"
            "{\"answer\": \"your answer\", \"opinions\": [{\"text\": \"a new opinion\", "
            "\"confidence\": 0.0-1.0, \"evidence\": [\"ids of the memories above that support "
            "it\"], \"inferential_distance\": 0-4 (0 restates a memory, 4 is a far "
            "extrapolation), \"entities\": [{\"name\": \"...\", \"type\": \"person|organization|"
            "place|other\"}], \"about_people\": true|false}]}\n"
            "Only propose opinions you actually hold after considering these memories. Use an "
            "empty list when there are none.";
    prompt.user = user.str();
    return prompt;
}

ParsedReflection parseReflectResponse(const std::string& raw) {
    ParsedReflection parsed;
    auto j = extractJsonObject(raw);
    if (!j) {
        spdlog::warn("[Reflect] Reasoner reply is not JSON; using it as the answer");
        parsed.answer = trimmed(raw);
        return parsed;
    }
    parsed.structured = true;
    if (j->contains("answer") && j->at("answer").is_string())
        parsed.answer = j->at("answer").get<std::string>();

    if (!j->contains("opinions") || !j->at("opinions").is_array())
        return parsed;
    for (const auto& o : j->at("opinions")) {
        if (!o.is_object() || !o.contains("text") || !o.at("text").is_string())
            continue;
        OpinionCandidate c;
        c.text = trimmed(o.at("text").get<std::string>());
        if (o.contains("confidence") && o.at("confidence").is_number())
            c.confidence = std::clamp(o.at("confidence").get<double>(), 0.0, 1.0);
        if (o.contains("evidence") && o.at("evidence").is_array()) {
            for (const auto& id : o.at("evidence")) {
                if (id.is_string())
                    c.evidence.push_back(id.get<std::string>());
            }
        }
        if (o.contains("inferential_distance") && o.at("inferential_distance").is_number())
            c.inferentialDistance = std::max(0, o.at("inferential_distance").get<int>());
        if (o.contains("entities") && o.at("entities").is_array()) {
            for (const auto& e : o.at("entities")) {
                if (e.is_string()) {
                    c.entities.push_back({e.get<std::string>(), ""});
                } else if (e.is_object() && e.contains("name") && e.at("name").is_string()) {
                    search::EntityMention m{e.at("name").get<std::string>(), ""};
                    if (e.contains("type") && e.at("type").is_string())
                        m.type = e.at("type").get<std::string>();
                    c.entities.push_back(std::move(m));
                }
            }
        }
        if (o.contains("about_people") && o.at("about_people").is_boolean())
            c.aboutPeople = o.at("about_people").get<bool>();
        if (!c.text.empty())
            parsed.opinions.push_back(std::move(c));
    }
    return parsed;
}

ml::ReasoningPrompt buildBackgroundMergePrompt(const std::string& current,
                                               const std::string& addition) {
    ml::ReasoningPrompt prompt;
    prompt.system = "You maintain a short first-person background description. Merge new "
                    "information into it. When the new information conflicts with the "
                    "current background, the new information wins. Write in the first person "
                    "(\"I ...\"), keep it concise, and reply with the merged text only.";
    std::ostringstream user;
    user << "Current background:\n" << (current.empty() ? "(empty)" : current)
         << "\n\nNew information:\n"
         << addition << "\n\nMerged background:";
    prompt.user = user.str();
    return prompt;
}

ml::ReasoningPrompt buildTraitInferencePrompt(const std::string& background) {
    ml::ReasoningPrompt prompt;
    prompt.system = "You infer Big Five personality traits from a self-description. Reply "
                    "with a single JSON object and nothing else.";
    std::ostringstream user;
    user << "Background:\n"
         << background
         << "\n\nRate each trait from 0.0 to 1.0 (0.5 is neutral) as JSON: "
            "{\"openness\": x, \"conscientiousness\": x, \"extraversion\": x, "
            "\"agreeableness\": x, \"neuroticism\": x, \"bias_strength\": x}. "
            "bias_strength is how strongly this person's views colour what they say.";
    prompt.user = user.str();
    return prompt;
}

std::optional<metadata::PersonalityTraits> parseTraitInference(const std::string& raw) {
    auto j = extractJsonObject(raw);
    if (!j)
        return std::nullopt;
    // A reply that names none of the traits carries no information
    static constexpr const char* kKeys[] = {"openness",      "conscientiousness", "extraversion",
                                            "agreeableness", "neuroticism",       "bias_strength"};
    const bool anyTrait = std::any_of(std::begin(kKeys), std::end(kKeys), [&](const char* k) {
        return j->contains(k) && j->at(k).is_number();
    });
    if (!anyTrait)
        return std::nullopt;

    metadata::PersonalityTraits t;
    t.openness = readUnitInterval(*j, "openness");
    t.conscientiousness = readUnitInterval(*j, "conscientiousness");
    t.extraversion = readUnitInterval(*j, "extraversion");
    t.agreeableness = readUnitInterval(*j, "agreeableness");
    t.neuroticism = readUnitInterval(*j, "neuroticism");
    t.biasStrength = readUnitInterval(*j, "bias_strength");
    return t;
}

} // namespace engram::reflect
