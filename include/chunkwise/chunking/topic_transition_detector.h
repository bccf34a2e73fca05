#pragma once

#include <string_view>

namespace chunkwise::chunking {

/**
 * Flags sentences whose leading words are a discourse marker ("however", "in conclusion",
 * "Chapter", "2." ...). Matching is case-insensitive and anchored at the start of the
 * trimmed sentence.
 */
class TopicTransitionDetector {
public:
    static bool isTransition(std::string_view sentence);
};

} // namespace chunkwise::chunking
