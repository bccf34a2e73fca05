#include <chunkwise/chunking/keyword_extractor.h>

#include <cctype>

namespace chunkwise::chunking {

namespace {

const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> words = {
        "the",   "a",    "an",    "and",   "or",    "but",   "in",     "on",    "at",
        "to",    "for",  "of",    "with",  "by",    "is",    "are",    "was",   "were",
        "be",    "been", "have",  "has",   "had",   "do",    "does",   "did",   "will",
        "would", "could", "should", "may", "might", "can",   "this",   "that",  "these",
        "those", "i",    "you",   "he",    "she",   "it",    "we",     "they"};
    return words;
}

bool isWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

} // namespace

bool KeywordExtractor::isStopWord(const std::string& lowered) {
    return stopWords().count(lowered) > 0;
}

KeywordSet KeywordExtractor::extract(std::string_view text) {
    KeywordSet keywords;

    // The cap counts qualifying tokens, repeats included
    size_t taken = 0;
    std::string token;
    auto flush = [&]() {
        if (taken < kMaxKeywords && token.size() >= kMinKeywordLength && !isStopWord(token)) {
            keywords.insert(token);
            ++taken;
        }
        token.clear();
    };

    for (char ch : text) {
        if (taken >= kMaxKeywords) {
            break;
        }
        auto c = static_cast<unsigned char>(ch);
        if (isWordChar(c)) {
            token.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();

    return keywords;
}

double jaccardSimilarity(const KeywordSet& a, const KeywordSet& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }

    // Iterate over smaller set
    const auto* small = &a;
    const auto* large = &b;
    if (b.size() < a.size()) {
        small = &b;
        large = &a;
    }
    size_t inter = 0;
    for (const auto& word : *small) {
        if (large->find(word) != large->end()) {
            ++inter;
        }
    }
    const size_t uni = a.size() + b.size() - inter;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

} // namespace chunkwise::chunking
