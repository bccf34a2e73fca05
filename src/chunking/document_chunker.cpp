#include <chunkwise/chunking/document_chunker.h>
#include <chunkwise/chunking/keyword_extractor.h>
#include <chunkwise/chunking/text_splitter.h>
#include <chunkwise/chunking/topic_transition_detector.h>
#include <chunkwise/profiling.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chunkwise::chunking {

// =============================================================================
// DocumentChunker Base Class Implementation
// =============================================================================

DocumentChunker::DocumentChunker(const ChunkConfig& config) : config_(config) {}

std::vector<TextChunk> DocumentChunker::chunk(const std::string& text) {
    if (text::isBlank(text)) {
        return {};
    }
    return doChunking(text);
}

void DocumentChunker::setYieldHook(YieldHook hook) {
    yield_hook_ = std::move(hook);
}

const ChunkConfig& DocumentChunker::getConfig() const {
    return config_;
}

std::string DocumentChunker::generateChunkId(size_t ordinal) const {
    return std::string(strategyName(strategy())) + "-" + std::to_string(ordinal);
}

TextChunk DocumentChunker::makeChunk(std::string_view span, size_t start_index,
                                     size_t ordinal) const {
    TextChunk chunk;
    chunk.id = generateChunkId(ordinal);
    chunk.content = text::trim(span);
    chunk.startIndex = start_index;
    chunk.endIndex = start_index + span.size();
    chunk.characterCount = chunk.content.size();
    chunk.wordCount = text::countWords(chunk.content);
    chunk.strategy = strategy();
    return chunk;
}

void DocumentChunker::maybeYield(size_t processed) const {
    if (yield_hook_ && processed > 0 && processed % kYieldInterval == 0) {
        yield_hook_(processed);
    }
}

std::vector<TextChunk> DocumentChunker::accumulateUnits(const std::vector<std::string>& units,
                                                        std::string_view separator,
                                                        const SplitPredicate& splitBefore) const {
    std::vector<TextChunk> chunks;
    std::string current;
    size_t current_index = 0;

    for (size_t i = 0; i < units.size(); ++i) {
        const std::string& unit = units[i];
        if (unit.empty()) {
            continue;
        }

        size_t joined_length = current.size() + (current.empty() ? 0 : separator.size()) +
                               unit.size();

        if (!current.empty() && splitBefore(current, i, joined_length)) {
            chunks.push_back(makeChunk(current, current_index, chunks.size()));
            current_index += current.size();
            current = unit;
        } else {
            if (!current.empty()) {
                current += separator;
            }
            current += unit;
        }

        maybeYield(i + 1);
    }

    if (!text::isBlank(current)) {
        chunks.push_back(makeChunk(current, current_index, chunks.size()));
    }

    return chunks;
}

// =============================================================================
// FixedSizeChunker Implementation
// =============================================================================

FixedSizeChunker::FixedSizeChunker(const ChunkConfig& config) : DocumentChunker(config) {
    config_.strategy = ChunkingStrategy::FIXED_SIZE;
}

std::vector<TextChunk> FixedSizeChunker::doChunking(const std::string& text) {
    CHUNKWISE_STRATEGY_ZONE("FixedSize");

    std::vector<TextChunk> chunks;
    const size_t chunk_size = config_.chunkSize;
    const size_t step = chunk_size - config_.overlap;
    size_t start = 0;
    size_t windows = 0;

    while (start < text.size()) {
        const size_t remaining = text.size() - start;
        const size_t end = start + std::min(chunk_size, remaining);
        std::string_view window(text.data() + start, end - start);
        maybeYield(++windows);

        if (text::isBlank(window)) {
            // A blank run restarts windowing after itself
            start = end;
            continue;
        }

        TextChunk chunk = makeChunk(window, start, chunks.size());
        // The window, not the trimmed content, is what the size contract is about
        chunk.characterCount = window.size();
        if (!chunks.empty()) {
            chunk.overlapWithPrevious = std::min(config_.overlap, chunks.back().characterCount);
        }
        chunks.push_back(std::move(chunk));

        if (step >= remaining) {
            break;
        }
        start += step;
    }

    return chunks;
}

// =============================================================================
// SentenceBasedChunker Implementation
// =============================================================================

SentenceBasedChunker::SentenceBasedChunker(const ChunkConfig& config) : DocumentChunker(config) {
    config_.strategy = ChunkingStrategy::SENTENCE_BASED;
}

std::vector<TextChunk> SentenceBasedChunker::doChunking(const std::string& text) {
    CHUNKWISE_STRATEGY_ZONE("SentenceBased");

    auto sentences = text::splitSentences(text);
    return accumulateUnits(sentences, " ", [this](const std::string&, size_t, size_t joined) {
        return joined > config_.chunkSize;
    });
}

// =============================================================================
// ParagraphBasedChunker Implementation
// =============================================================================

ParagraphBasedChunker::ParagraphBasedChunker(const ChunkConfig& config)
    : DocumentChunker(config) {
    config_.strategy = ChunkingStrategy::PARAGRAPH_BASED;
}

std::vector<TextChunk> ParagraphBasedChunker::doChunking(const std::string& text) {
    CHUNKWISE_STRATEGY_ZONE("ParagraphBased");

    auto paragraphs = text::splitParagraphs(text);
    return accumulateUnits(paragraphs, "\n\n", [this](const std::string&, size_t, size_t joined) {
        return joined > config_.chunkSize;
    });
}

// =============================================================================
// RecursiveTextSplitter Implementation
// =============================================================================

RecursiveTextSplitter::RecursiveTextSplitter(const ChunkConfig& config)
    : DocumentChunker(config) {
    config_.strategy = ChunkingStrategy::RECURSIVE;
}

std::vector<TextChunk> RecursiveTextSplitter::doChunking(const std::string& text) {
    CHUNKWISE_STRATEGY_ZONE("Recursive");

    std::vector<TextChunk> chunks;
    recursiveSplit(text, 0, chunks);
    return chunks;
}

void RecursiveTextSplitter::recursiveSplit(const std::string& span, size_t start_index,
                                           std::vector<TextChunk>& out) const {
    if (text::isBlank(span)) {
        return;
    }

    if (span.size() <= config_.chunkSize) {
        out.push_back(makeChunk(span, start_index, out.size()));
        return;
    }

    // Paragraphs first
    auto paragraphs = text::splitParagraphs(span);
    if (paragraphs.size() > 1) {
        size_t current_index = start_index;
        for (const auto& paragraph : paragraphs) {
            recursiveSplit(paragraph, current_index, out);
            current_index += paragraph.size() + kParagraphSeparatorWidth;
        }
        return;
    }

    // Then sentences, regrouped greedily up to the chunk size
    auto sentences = text::splitSentences(span);
    if (sentences.size() > 1) {
        size_t current_index = start_index;
        std::string current;

        for (size_t i = 0; i < sentences.size(); ++i) {
            const auto& sentence = sentences[i];
            size_t joined = current.size() + (current.empty() ? 0 : 1) + sentence.size();

            if (joined > config_.chunkSize && !current.empty()) {
                recursiveSplit(current, current_index, out);
                current_index += current.size();
                current = sentence;
            } else {
                if (!current.empty()) {
                    current += ' ';
                }
                current += sentence;
            }

            maybeYield(i + 1);
        }

        if (!current.empty()) {
            recursiveSplit(current, current_index, out);
        }
        return;
    }

    // A single oversized sentence: words are the guaranteed base case
    splitByWords(span, start_index, out);
}

void RecursiveTextSplitter::splitByWords(const std::string& span, size_t start_index,
                                         std::vector<TextChunk>& out) const {
    auto words = text::splitWords(span);
    if (words.size() > 1) {
        spdlog::trace("Recursive split falling back to {} words at offset {}", words.size(),
                      start_index);
    }

    size_t current_index = start_index;
    std::string current;

    for (const auto& word : words) {
        size_t joined = current.size() + (current.empty() ? 0 : kWordSeparatorWidth) + word.size();

        if (joined > config_.chunkSize && !current.empty()) {
            out.push_back(makeChunk(current, current_index, out.size()));
            current_index += current.size() + kWordSeparatorWidth;
            current = word;
        } else {
            if (!current.empty()) {
                current += ' ';
            }
            current += word;
        }
    }

    if (!current.empty()) {
        out.push_back(makeChunk(current, current_index, out.size()));
    }
}

// =============================================================================
// SemanticChunker Implementation
// =============================================================================

SemanticChunker::SemanticChunker(const ChunkConfig& config, SemanticThresholds thresholds)
    : DocumentChunker(config), thresholds_(thresholds) {
    config_.strategy = ChunkingStrategy::SEMANTIC;
}

bool SemanticChunker::shouldSplit(const std::string& buffer, const std::string& next_sentence,
                                  size_t total_length, size_t max_size,
                                  const std::string& following_sentence,
                                  const SemanticThresholds& thresholds) {
    const double total = static_cast<double>(total_length);
    const double max = static_cast<double>(max_size);

    if (total_length > max_size) {
        return true;
    }
    if (static_cast<double>(buffer.size()) < max * thresholds.minFillRatio) {
        return false;
    }

    const auto buffer_words = KeywordExtractor::extract(buffer);
    const auto next_words = KeywordExtractor::extract(next_sentence);

    const double similarity = jaccardSimilarity(buffer_words, next_words);
    double contextual_similarity = 0.0;
    if (!following_sentence.empty()) {
        contextual_similarity =
            jaccardSimilarity(next_words, KeywordExtractor::extract(following_sentence));
    }
    const bool has_transition = TopicTransitionDetector::isTransition(next_sentence);

    return (similarity < thresholds.lowSimilarity && total > max * thresholds.similarityFillRatio) ||
           (has_transition && total > max * thresholds.transitionFillRatio) ||
           (contextual_similarity > similarity * thresholds.contextualAdvantage &&
            total > max * thresholds.contextualFillRatio);
}

std::vector<TextChunk> SemanticChunker::doChunking(const std::string& text) {
    CHUNKWISE_STRATEGY_ZONE("Semantic");

    auto sentences = text::splitSentences(text);
    static const std::string kNoSentence;

    return accumulateUnits(
        sentences, " ", [this, &sentences](const std::string& buffer, size_t i, size_t joined) {
            const std::string& following = i + 1 < sentences.size() ? sentences[i + 1] : kNoSentence;
            return shouldSplit(buffer, sentences[i], joined, config_.chunkSize, following,
                               thresholds_);
        });
}

// =============================================================================
// Factory Function
// =============================================================================

Result<std::unique_ptr<DocumentChunker>> createChunker(const ChunkConfig& config) {
    if (auto valid = validateConfig(config); !valid) {
        return valid.error();
    }

    std::unique_ptr<DocumentChunker> chunker;
    switch (config.strategy) {
        case ChunkingStrategy::FIXED_SIZE:
            chunker = std::make_unique<FixedSizeChunker>(config);
            break;
        case ChunkingStrategy::SENTENCE_BASED:
            chunker = std::make_unique<SentenceBasedChunker>(config);
            break;
        case ChunkingStrategy::PARAGRAPH_BASED:
            chunker = std::make_unique<ParagraphBasedChunker>(config);
            break;
        case ChunkingStrategy::RECURSIVE:
            chunker = std::make_unique<RecursiveTextSplitter>(config);
            break;
        case ChunkingStrategy::SEMANTIC:
            chunker = std::make_unique<SemanticChunker>(config);
            break;
    }

    if (!chunker) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Unknown chunking strategy: " +
                         std::to_string(static_cast<int>(config.strategy))};
    }
    return std::move(chunker);
}

} // namespace chunkwise::chunking
