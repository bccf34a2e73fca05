#include <chunkwise/chunking/text_splitter.h>
#include <chunkwise/chunking/topic_transition_detector.h>

#include <regex>
#include <string>
#include <vector>

namespace chunkwise::chunking {

namespace {

const std::vector<std::regex>& transitionPatterns() {
    static const std::vector<std::regex> patterns = [] {
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        return std::vector<std::regex>{
            std::regex(R"(^(however|moreover|furthermore|additionally|meanwhile|subsequently|)"
                       R"(consequently|therefore|thus|hence))",
                       flags),
            std::regex(R"(^(in contrast|on the other hand|alternatively|conversely))", flags),
            std::regex(R"(^(first|second|third|finally|lastly|in conclusion))", flags),
            std::regex(R"(^(chapter|section|\d+\.))", flags)};
    }();
    return patterns;
}

} // namespace

bool TopicTransitionDetector::isTransition(std::string_view sentence) {
    auto trimmed = text::trimView(sentence);
    if (trimmed.empty()) {
        return false;
    }

    for (const auto& pattern : transitionPatterns()) {
        if (std::regex_search(trimmed.begin(), trimmed.end(), pattern,
                              std::regex_constants::match_continuous)) {
            return true;
        }
    }
    return false;
}

} // namespace chunkwise::chunking
