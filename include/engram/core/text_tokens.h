#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace engram::core {

// ASCII alphanumerics and every byte of a multi-byte UTF-8 sequence
inline bool isWordByte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}

// ASCII letters and the Latin-1 capitals U+00C0..U+00DE (except U+00D7) fold to lowercase;
// all other bytes are copied unchanged
inline std::string toLower(std::string_view text) {
    std::string out(text);
    for (size_t i = 0; i < out.size(); ++i) {
        auto c = static_cast<unsigned char>(out[i]);
        if (c >= 'A' && c <= 'Z') {
            out[i] = static_cast<char>(c - 'A' + 'a');
        } else if (c == 0xC3 && i + 1 < out.size()) {
            auto next = static_cast<unsigned char>(out[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97)
                out[i + 1] = static_cast<char>(next + 0x20);
            ++i;
        }
    }
    return out;
}

// Lowercased word runs; ASCII punctuation and whitespace separate tokens, UTF-8
// sequences stay inside the word they belong to
inline std::vector<std::string> tokenizeWords(std::string_view text) {
    std::vector<std::string> tokens;
    tokens.reserve(text.size() / 5 + 1);
    size_t start = text.size();
    for (size_t i = 0; i <= text.size(); ++i) {
        bool word = i < text.size() && isWordByte(static_cast<unsigned char>(text[i]));
        if (word && start == text.size()) {
            start = i;
        } else if (!word && start != text.size()) {
            tokens.push_back(toLower(text.substr(start, i - start)));
            start = text.size();
        }
    }
    return tokens;
}

// Small closed-class word list shared by lexical scoring and entity linking
inline bool isStopWord(std::string_view token) {
    static constexpr std::string_view kStopWords[] = {
        "a",    "an",   "and",  "are",  "as",   "at",    "be",   "by",   "did",  "do",
        "does", "for",  "from", "had",  "has",  "have",  "he",   "her",  "his",  "how",
        "i",    "in",   "is",   "it",   "its",  "me",    "my",   "of",   "on",   "or",
        "our",  "she",  "so",   "that", "the",  "their", "them", "they", "this", "to",
        "was",  "we",   "were", "what", "when", "where", "which", "who", "why",  "will",
        "with", "you",  "your"};
    for (auto w : kStopWords) {
        if (w == token)
            return true;
    }
    return false;
}

} // namespace engram::core
