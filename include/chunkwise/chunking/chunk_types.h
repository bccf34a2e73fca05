#pragma once

#include <chunkwise/core/types.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace chunkwise::chunking {

/**
 * Chunking strategies for document segmentation
 */
enum class ChunkingStrategy {
    FIXED_SIZE,      // Sliding window of fixed character count
    SENTENCE_BASED,  // Sentence boundary detection
    PARAGRAPH_BASED, // Paragraph boundaries
    RECURSIVE,       // Paragraph -> sentence -> word splitting
    SEMANTIC         // Lexical topic-shift heuristic
};

inline constexpr std::array<ChunkingStrategy, 5> kAllStrategies = {
    ChunkingStrategy::FIXED_SIZE, ChunkingStrategy::SENTENCE_BASED,
    ChunkingStrategy::PARAGRAPH_BASED, ChunkingStrategy::RECURSIVE, ChunkingStrategy::SEMANTIC};

/**
 * Wire name of a strategy ("fixed", "sentence", ...). Used for chunk ids and export.
 */
const char* strategyName(ChunkingStrategy strategy);

/**
 * One-line human description of a strategy.
 */
const char* strategyDescription(ChunkingStrategy strategy);

/**
 * Parse a wire name (case-insensitive). Unknown names yield InvalidConfiguration.
 */
Result<ChunkingStrategy> parseStrategy(std::string_view name);

inline constexpr size_t kDefaultChunkSize = 1000;
inline constexpr size_t kDefaultOverlap = 100;

/**
 * Configuration for a single chunking run
 */
struct ChunkConfig {
    size_t chunkSize = kDefaultChunkSize; // Target maximum chunk length in characters
    size_t overlap = kDefaultOverlap;     // Window overlap, fixed-size strategy only
    ChunkingStrategy strategy = ChunkingStrategy::FIXED_SIZE;
};

/**
 * Overlap used when only the chunk size was chosen: kDefaultOverlap while it fits,
 * otherwise a tenth of the chunk size.
 */
size_t defaultOverlapFor(size_t chunk_size);

/**
 * Reject configurations no strategy can run with: unknown strategy, zero chunk size,
 * or overlap that would leave a non-positive window step.
 */
Result<void> validateConfig(const ChunkConfig& config);

/**
 * A single position-tracked chunk of the input text
 */
struct TextChunk {
    std::string id;      // "<strategy>-<ordinal>"
    std::string content; // Trimmed text span
    size_t startIndex = 0;
    size_t endIndex = 0;
    size_t characterCount = 0;
    size_t wordCount = 0;
    size_t overlapWithPrevious = 0; // Non-zero for fixed-size windows only
    ChunkingStrategy strategy = ChunkingStrategy::FIXED_SIZE;
};

/**
 * Chunks produced by one engine invocation plus summary figures
 */
struct ChunkingResult {
    std::vector<TextChunk> chunks;
    size_t totalChunks = 0;
    size_t averageChunkSize = 0;
    std::chrono::milliseconds processingTimeMs{0};
    ChunkingStrategy strategy = ChunkingStrategy::FIXED_SIZE;
};

} // namespace chunkwise::chunking
