#pragma once

#include <chunkwise/chunking/chunk_types.h>

#include <cstddef>
#include <string>
#include <vector>

namespace chunkwise::chunking {

struct SizeBucket {
    std::string label;
    size_t min = 0;
    size_t max = 0; // inclusive; SIZE_MAX for the open-ended bucket
    size_t count = 0;
    double percentage = 0.0;
};

/**
 * Distribution figures over a ChunkingResult
 */
struct ChunkStatistics {
    size_t minChunkSize = 0;
    size_t maxChunkSize = 0;
    size_t medianChunkSize = 0;
    double standardDeviation = 0.0;
    double consistencyScore = 0.0; // 0-100, higher is more uniform
    size_t charactersPerSecond = 0;
    size_t totalWords = 0;
    std::vector<SizeBucket> sizeDistribution;
};

ChunkStatistics computeStatistics(const ChunkingResult& result, size_t original_text_length);

/**
 * Multi-line plain text rendering, used by the command-line tool
 */
std::string formatStatistics(const ChunkingResult& result, const ChunkStatistics& stats);

} // namespace chunkwise::chunking
