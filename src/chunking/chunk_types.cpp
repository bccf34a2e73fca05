#include <chunkwise/chunking/chunk_types.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace chunkwise::chunking {

const char* strategyName(ChunkingStrategy strategy) {
    switch (strategy) {
        case ChunkingStrategy::FIXED_SIZE:
            return "fixed";
        case ChunkingStrategy::SENTENCE_BASED:
            return "sentence";
        case ChunkingStrategy::PARAGRAPH_BASED:
            return "paragraph";
        case ChunkingStrategy::RECURSIVE:
            return "recursive";
        case ChunkingStrategy::SEMANTIC:
            return "semantic";
    }
    return "unknown";
}

const char* strategyDescription(ChunkingStrategy strategy) {
    switch (strategy) {
        case ChunkingStrategy::FIXED_SIZE:
            return "Split text into equal-sized windows with optional overlap";
        case ChunkingStrategy::SENTENCE_BASED:
            return "Group whole sentences up to the chunk size";
        case ChunkingStrategy::PARAGRAPH_BASED:
            return "Group whole paragraphs up to the chunk size";
        case ChunkingStrategy::RECURSIVE:
            return "Split by paragraphs, then sentences, then words until chunks fit";
        case ChunkingStrategy::SEMANTIC:
            return "Group sentences and break on keyword shifts and discourse markers";
    }
    return "";
}

Result<ChunkingStrategy> parseStrategy(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    for (auto strategy : kAllStrategies) {
        if (lower == strategyName(strategy)) {
            return strategy;
        }
    }

    return Error{ErrorCode::InvalidConfiguration,
                 "Unknown chunking strategy: '" + std::string(name) + "'"};
}

size_t defaultOverlapFor(size_t chunk_size) {
    return kDefaultOverlap < chunk_size ? kDefaultOverlap : chunk_size / 10;
}

Result<void> validateConfig(const ChunkConfig& config) {
    auto known = std::find(kAllStrategies.begin(), kAllStrategies.end(), config.strategy);
    if (known == kAllStrategies.end()) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Unknown chunking strategy: " +
                         std::to_string(static_cast<int>(config.strategy))};
    }

    if (config.chunkSize == 0) {
        return Error{ErrorCode::InvalidConfiguration, "Chunk size must be greater than zero"};
    }

    if (config.overlap >= config.chunkSize) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Overlap (" + std::to_string(config.overlap) +
                         ") must be smaller than chunk size (" +
                         std::to_string(config.chunkSize) + ")"};
    }

    return {};
}

} // namespace chunkwise::chunking
