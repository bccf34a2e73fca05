#pragma once

#include <chunkwise/chunking/chunk_types.h>
#include <chunkwise/core/types.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chunkwise::chunking {

/**
 * Called with the number of units (windows, sentences, paragraphs) processed so far, every
 * kYieldInterval units. Lets a caller pump its event loop during long runs; it has no
 * influence on the produced chunks.
 */
using YieldHook = std::function<void(size_t processed)>;

inline constexpr size_t kYieldInterval = 100;

/**
 * Base class for document chunking strategies
 */
class DocumentChunker {
public:
    explicit DocumentChunker(const ChunkConfig& config);
    virtual ~DocumentChunker() = default;

    // Non-copyable but movable
    DocumentChunker(const DocumentChunker&) = delete;
    DocumentChunker& operator=(const DocumentChunker&) = delete;
    DocumentChunker(DocumentChunker&&) = default;
    DocumentChunker& operator=(DocumentChunker&&) = default;

    /**
     * Segment text into ordered chunks. Blank input yields no chunks.
     */
    std::vector<TextChunk> chunk(const std::string& text);

    virtual ChunkingStrategy strategy() const = 0;

    void setYieldHook(YieldHook hook);
    const ChunkConfig& getConfig() const;

protected:
    virtual std::vector<TextChunk> doChunking(const std::string& text) = 0;

    // Builds a chunk from an untrimmed span; characterCount is the trimmed content length
    TextChunk makeChunk(std::string_view span, size_t start_index, size_t ordinal) const;

    std::string generateChunkId(size_t ordinal) const;

    void maybeYield(size_t processed) const;

    /**
     * Greedy accumulation shared by the unit-preserving strategies. Units are joined with
     * separator; before appending unit i, splitBefore(buffer, i, joined_length) decides
     * whether a non-empty buffer is flushed first. Units larger than the chunk size are
     * emitted whole.
     */
    using SplitPredicate =
        std::function<bool(const std::string& buffer, size_t unit_index, size_t joined_length)>;

    std::vector<TextChunk> accumulateUnits(const std::vector<std::string>& units,
                                           std::string_view separator,
                                           const SplitPredicate& splitBefore) const;

    ChunkConfig config_;
    YieldHook yield_hook_;
};

/**
 * Sliding window of chunkSize characters advanced by chunkSize - overlap
 */
class FixedSizeChunker : public DocumentChunker {
public:
    explicit FixedSizeChunker(const ChunkConfig& config);

    ChunkingStrategy strategy() const override { return ChunkingStrategy::FIXED_SIZE; }

protected:
    std::vector<TextChunk> doChunking(const std::string& text) override;
};

/**
 * Sentence-based chunking strategy
 */
class SentenceBasedChunker : public DocumentChunker {
public:
    explicit SentenceBasedChunker(const ChunkConfig& config);

    ChunkingStrategy strategy() const override { return ChunkingStrategy::SENTENCE_BASED; }

protected:
    std::vector<TextChunk> doChunking(const std::string& text) override;
};

/**
 * Paragraph-based chunking strategy
 */
class ParagraphBasedChunker : public DocumentChunker {
public:
    explicit ParagraphBasedChunker(const ChunkConfig& config);

    ChunkingStrategy strategy() const override { return ChunkingStrategy::PARAGRAPH_BASED; }

protected:
    std::vector<TextChunk> doChunking(const std::string& text) override;
};

/**
 * Recursive text splitting strategy: paragraphs, then sentences, then words.
 *
 * Offsets are accumulated from consumed span lengths plus assumed separator widths, not
 * re-located in the source text, so they drift when the real separators are wider.
 */
class RecursiveTextSplitter : public DocumentChunker {
public:
    explicit RecursiveTextSplitter(const ChunkConfig& config);

    ChunkingStrategy strategy() const override { return ChunkingStrategy::RECURSIVE; }

    static constexpr size_t kParagraphSeparatorWidth = 2;
    static constexpr size_t kWordSeparatorWidth = 1;

protected:
    std::vector<TextChunk> doChunking(const std::string& text) override;

private:
    void recursiveSplit(const std::string& span, size_t start_index,
                        std::vector<TextChunk>& out) const;

    void splitByWords(const std::string& span, size_t start_index,
                      std::vector<TextChunk>& out) const;
};

/**
 * Empirically tuned constants of the semantic split heuristic
 */
struct SemanticThresholds {
    double lowSimilarity = 0.2;         // keyword overlap below this suggests a topic shift
    double minFillRatio = 0.3;          // never split a buffer shorter than this share
    double transitionFillRatio = 0.4;   // discourse marker split needs this much fill
    double contextualFillRatio = 0.5;   // lookahead split needs this much fill
    double similarityFillRatio = 0.6;   // low-similarity split needs this much fill
    double contextualAdvantage = 1.5;   // lookahead similarity must beat current by this factor
};

/**
 * Sentence accumulation that breaks on keyword shifts and discourse markers
 */
class SemanticChunker : public DocumentChunker {
public:
    explicit SemanticChunker(const ChunkConfig& config, SemanticThresholds thresholds = {});

    ChunkingStrategy strategy() const override { return ChunkingStrategy::SEMANTIC; }

    /**
     * Decide whether buffer is flushed before next_sentence is appended. total_length is the
     * length of the buffer with next_sentence joined; following_sentence may be empty.
     */
    static bool shouldSplit(const std::string& buffer, const std::string& next_sentence,
                            size_t total_length, size_t max_size,
                            const std::string& following_sentence,
                            const SemanticThresholds& thresholds = {});

    const SemanticThresholds& thresholds() const { return thresholds_; }

protected:
    std::vector<TextChunk> doChunking(const std::string& text) override;

private:
    SemanticThresholds thresholds_;
};

/**
 * Factory function for creating chunkers based on config.strategy. Invalid configurations
 * yield InvalidConfiguration.
 */
Result<std::unique_ptr<DocumentChunker>> createChunker(const ChunkConfig& config);

} // namespace chunkwise::chunking
