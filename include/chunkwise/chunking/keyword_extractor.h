#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace chunkwise::chunking {

using KeywordSet = std::unordered_set<std::string>;

/**
 * Reduces a text span to a bounded set of content words: lowercased, split on non-word
 * characters, tokens of length <= 2 and stop words removed. Only the first kMaxKeywords
 * qualifying tokens are considered, so repeated words use up the budget.
 */
class KeywordExtractor {
public:
    static constexpr size_t kMaxKeywords = 20;
    static constexpr size_t kMinKeywordLength = 3;

    static KeywordSet extract(std::string_view text);

    static bool isStopWord(const std::string& lowered);
};

/**
 * |a intersect b| / |a union b|; 0 when either set is empty.
 */
double jaccardSimilarity(const KeywordSet& a, const KeywordSet& b);

} // namespace chunkwise::chunking
