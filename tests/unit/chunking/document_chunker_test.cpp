#include <gtest/gtest.h>
#include <chunkwise/chunking/document_chunker.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace chunkwise;
using namespace chunkwise::chunking;

namespace {

std::unique_ptr<DocumentChunker> makeChunker(ChunkingStrategy strategy, size_t size,
                                             size_t overlap = 0) {
    ChunkConfig config;
    config.strategy = strategy;
    config.chunkSize = size;
    config.overlap = overlap;
    auto chunker = createChunker(config);
    EXPECT_TRUE(chunker) << chunker.error().message;
    return std::move(chunker).value();
}

} // namespace

class DocumentChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        foxText_ = "The quick brown fox jumps over the lazy dog. The dog was sleeping.";
    }

    std::string foxText_;
};

TEST_F(DocumentChunkerTest, FactoryCreatesEachStrategy) {
    for (auto strategy : kAllStrategies) {
        auto chunker = makeChunker(strategy, 100, 10);
        ASSERT_NE(chunker, nullptr);
        EXPECT_EQ(chunker->strategy(), strategy);
        EXPECT_EQ(chunker->getConfig().strategy, strategy);
        EXPECT_EQ(chunker->getConfig().chunkSize, 100u);
    }
}

TEST_F(DocumentChunkerTest, FactoryRejectsInvalidConfig) {
    ChunkConfig config;
    config.chunkSize = 0;
    auto zero = createChunker(config);
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidConfiguration);

    config.chunkSize = 10;
    config.overlap = 10;
    auto overlapping = createChunker(config);
    ASSERT_FALSE(overlapping);
    EXPECT_EQ(overlapping.error().code, ErrorCode::InvalidConfiguration);

    config.overlap = 0;
    config.strategy = static_cast<ChunkingStrategy>(42);
    auto unknown = createChunker(config);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::InvalidConfiguration);
}

TEST_F(DocumentChunkerTest, BlankInputYieldsNoChunks) {
    for (auto strategy : kAllStrategies) {
        auto chunker = makeChunker(strategy, 50, 5);
        EXPECT_TRUE(chunker->chunk("").empty());
        EXPECT_TRUE(chunker->chunk(" \n\t \n\n ").empty());
    }
}

TEST_F(DocumentChunkerTest, FixedSizeSlidingWindows) {
    auto chunker = makeChunker(ChunkingStrategy::FIXED_SIZE, 20, 5);
    auto chunks = chunker->chunk(foxText_);

    ASSERT_EQ(foxText_.size(), 66u);
    ASSERT_EQ(chunks.size(), 5u);

    const std::vector<std::string> contents{"The quick brown fox", "fox jumps over the",
                                            "the lazy dog. The d", "The dog was sleeping",
                                            "eping."};
    const std::vector<size_t> starts{0, 15, 30, 45, 60};

    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].id, "fixed-" + std::to_string(i));
        EXPECT_EQ(chunks[i].content, contents[i]);
        EXPECT_EQ(chunks[i].startIndex, starts[i]);
        EXPECT_EQ(chunks[i].strategy, ChunkingStrategy::FIXED_SIZE);
    }

    for (size_t i = 0; i + 1 < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].characterCount, 20u);
        EXPECT_EQ(chunks[i].endIndex, chunks[i].startIndex + 20);
    }
    EXPECT_EQ(chunks.back().characterCount, 6u);
    EXPECT_EQ(chunks.back().endIndex, 66u);

    EXPECT_EQ(chunks[0].overlapWithPrevious, 0u);
    for (size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].overlapWithPrevious, 5u);
    }
}

TEST_F(DocumentChunkerTest, FixedSizeWithoutOverlapTilesText) {
    auto chunker = makeChunker(ChunkingStrategy::FIXED_SIZE, 10, 0);
    auto chunks = chunker->chunk(foxText_);

    ASSERT_EQ(chunks.size(), 7u);
    for (size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].startIndex, chunks[i - 1].endIndex);
        EXPECT_EQ(chunks[i].overlapWithPrevious, 0u);
    }
    EXPECT_EQ(chunks.front().startIndex, 0u);
    EXPECT_EQ(chunks.back().endIndex, foxText_.size());

    // Only whitespace at window edges is lost
    auto squeeze = [](const std::string& s) {
        std::string out;
        for (char c : s) {
            if (c != ' ') {
                out += c;
            }
        }
        return out;
    };
    std::string joined;
    for (const auto& chunk : chunks) {
        joined += chunk.content;
    }
    EXPECT_EQ(squeeze(joined), squeeze(foxText_));
}

TEST_F(DocumentChunkerTest, FixedSizeSkipsBlankWindows) {
    std::string text = "abcde" + std::string(10, ' ') + "fghij";
    auto chunker = makeChunker(ChunkingStrategy::FIXED_SIZE, 5, 0);
    auto chunks = chunker->chunk(text);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].content, "abcde");
    EXPECT_EQ(chunks[1].content, "fghij");
    EXPECT_EQ(chunks[1].startIndex, 15u);
    EXPECT_EQ(chunks[1].id, "fixed-1");
}

TEST_F(DocumentChunkerTest, FixedSizeResumesAfterBlankWindow) {
    std::string text = "abcd" + std::string(13, ' ') + "xyzuvwrstq";
    auto chunker = makeChunker(ChunkingStrategy::FIXED_SIZE, 10, 3);
    auto chunks = chunker->chunk(text);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].content, "abcd");
    EXPECT_EQ(chunks[0].startIndex, 0u);
    EXPECT_EQ(chunks[0].endIndex, 10u);

    // Windowing restarts where the blank window [7,17) ended
    EXPECT_EQ(chunks[1].content, "xyzuvwrstq");
    EXPECT_EQ(chunks[1].startIndex, 17u);
    EXPECT_EQ(chunks[1].endIndex, 27u);

    EXPECT_EQ(chunks[2].content, "stq");
    EXPECT_EQ(chunks[2].startIndex, 24u);
    EXPECT_EQ(chunks[2].endIndex, 27u);
    EXPECT_EQ(chunks[2].overlapWithPrevious, 3u);
}

TEST_F(DocumentChunkerTest, FixedSizeHandlesHugeChunkSize) {
    auto chunker = makeChunker(ChunkingStrategy::FIXED_SIZE, SIZE_MAX, SIZE_MAX - 1);
    std::vector<TextChunk> chunks;
    ASSERT_NO_THROW(chunks = chunker->chunk("hello world"));

    ASSERT_EQ(chunks.size(), 11u);
    EXPECT_EQ(chunks.front().content, "hello world");
    EXPECT_EQ(chunks.back().content, "d");
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].startIndex, i);
        EXPECT_EQ(chunks[i].endIndex, 11u);
        EXPECT_EQ(chunks[i].characterCount, 11u - i);
    }
}

TEST_F(DocumentChunkerTest, SentenceGroupsUpToLimit) {
    auto chunker = makeChunker(ChunkingStrategy::SENTENCE_BASED, 40);
    auto chunks = chunker->chunk("First one here. Second one here. Third sentence is longer.");

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].id, "sentence-0");
    EXPECT_EQ(chunks[0].content, "First one here. Second one here.");
    EXPECT_EQ(chunks[0].startIndex, 0u);
    EXPECT_EQ(chunks[0].endIndex, 32u);
    EXPECT_EQ(chunks[0].wordCount, 6u);
    EXPECT_EQ(chunks[1].content, "Third sentence is longer.");
    EXPECT_EQ(chunks[1].startIndex, 32u);
    EXPECT_EQ(chunks[1].endIndex, 57u);
    EXPECT_EQ(chunks[1].overlapWithPrevious, 0u);
}

TEST_F(DocumentChunkerTest, SentenceEmitsOversizedSentenceWhole) {
    auto chunker = makeChunker(ChunkingStrategy::SENTENCE_BASED, 20);
    auto chunks =
        chunker->chunk("Tiny. This single sentence is far longer than the limit allows. End.");

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].content, "Tiny.");
    EXPECT_EQ(chunks[1].content, "This single sentence is far longer than the limit allows.");
    EXPECT_EQ(chunks[1].characterCount, 57u);
    EXPECT_EQ(chunks[1].startIndex, 5u);
    EXPECT_EQ(chunks[1].endIndex, 62u);
    EXPECT_EQ(chunks[2].content, "End.");
    EXPECT_EQ(chunks[2].startIndex, 62u);
}

TEST_F(DocumentChunkerTest, ParagraphJoinsWithBlankLine) {
    auto chunker = makeChunker(ChunkingStrategy::PARAGRAPH_BASED, 40);
    auto chunks = chunker->chunk("First para line.\n\nSecond para here.\n\n\n\nThird para.");

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].id, "paragraph-0");
    EXPECT_EQ(chunks[0].content, "First para line.\n\nSecond para here.");
    EXPECT_EQ(chunks[0].startIndex, 0u);
    EXPECT_EQ(chunks[0].endIndex, 35u);
    EXPECT_EQ(chunks[1].content, "Third para.");
    EXPECT_EQ(chunks[1].startIndex, 35u);
    EXPECT_EQ(chunks[1].endIndex, 46u);
}

TEST_F(DocumentChunkerTest, ParagraphSingleIsTrimmed) {
    auto chunker = makeChunker(ChunkingStrategy::PARAGRAPH_BASED, 100);
    auto chunks = chunker->chunk("  Just one short paragraph.  ");

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].content, "Just one short paragraph.");
    EXPECT_EQ(chunks[0].characterCount, 25u);
    EXPECT_EQ(chunks[0].startIndex, 0u);
    EXPECT_EQ(chunks[0].endIndex, 25u);
}

TEST_F(DocumentChunkerTest, RecursiveDescendsParagraphsThenSentences) {
    const std::string text = "Alpha paragraph one is short.\n\n"
                             "Beta paragraph has a first sentence. It also has a second sentence "
                             "that is longer. And a third.\n\n"
                             "Gamma";
    auto chunker = makeChunker(ChunkingStrategy::RECURSIVE, 50);
    auto chunks = chunker->chunk(text);

    ASSERT_EQ(chunks.size(), 5u);

    EXPECT_EQ(chunks[0].content, "Alpha paragraph one is short.");
    EXPECT_EQ(chunks[0].startIndex, 0u);
    EXPECT_EQ(chunks[0].endIndex, 29u);

    EXPECT_EQ(chunks[1].content, "Beta paragraph has a first sentence.");
    EXPECT_EQ(chunks[1].startIndex, 31u);
    EXPECT_EQ(chunks[1].endIndex, 67u);

    EXPECT_EQ(chunks[2].content, "It also has a second sentence that is longer.");
    EXPECT_EQ(chunks[2].startIndex, 67u);
    EXPECT_EQ(chunks[2].characterCount, 45u);

    EXPECT_EQ(chunks[3].content, "And a third.");
    EXPECT_EQ(chunks[3].startIndex, 112u);

    EXPECT_EQ(chunks[4].content, "Gamma");
    EXPECT_EQ(chunks[4].startIndex, 128u);
    EXPECT_EQ(chunks[4].endIndex, 133u);

    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].id, "recursive-" + std::to_string(i));
        EXPECT_LE(chunks[i].characterCount, 50u);
    }
}

TEST_F(DocumentChunkerTest, RecursiveFallsBackToWords) {
    auto chunker = makeChunker(ChunkingStrategy::RECURSIVE, 20);
    auto chunks = chunker->chunk("Supercalifragilisticexpialidocious is a long word indeed");

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].content, "Supercalifragilisticexpialidocious");
    EXPECT_EQ(chunks[0].characterCount, 34u);
    EXPECT_EQ(chunks[1].content, "is a long word");
    EXPECT_EQ(chunks[1].startIndex, 35u);
    EXPECT_EQ(chunks[1].endIndex, 49u);
    EXPECT_EQ(chunks[2].content, "indeed");
    EXPECT_EQ(chunks[2].startIndex, 50u);
}

TEST_F(DocumentChunkerTest, SemanticBreaksOnTransition) {
    const std::string text = "Solar panels convert sunlight into electricity efficiently. "
                             "However, wind turbines harvest kinetic energy.";

    auto semantic = makeChunker(ChunkingStrategy::SEMANTIC, 120);
    auto chunks = semantic->chunk(text);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].id, "semantic-0");
    EXPECT_EQ(chunks[0].content, "Solar panels convert sunlight into electricity efficiently.");
    EXPECT_EQ(chunks[0].endIndex, 59u);
    EXPECT_EQ(chunks[1].content, "However, wind turbines harvest kinetic energy.");
    EXPECT_EQ(chunks[1].startIndex, 59u);
    EXPECT_EQ(chunks[1].characterCount, 46u);

    // Size-only grouping keeps both sentences together
    auto sentence = makeChunker(ChunkingStrategy::SENTENCE_BASED, 120);
    auto grouped = sentence->chunk(text);
    ASSERT_EQ(grouped.size(), 1u);
    EXPECT_EQ(grouped[0].characterCount, 106u);
}

TEST_F(DocumentChunkerTest, SemanticKeepsShortBuffer) {
    auto chunker = makeChunker(ChunkingStrategy::SEMANTIC, 100);
    auto chunks = chunker->chunk("Hi there. However, this continues.");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].content, "Hi there. However, this continues.");
}

TEST(SemanticShouldSplitTest, SizeLimitAlwaysSplits) {
    EXPECT_TRUE(SemanticChunker::shouldSplit("anything", "else", 101, 100, ""));
    EXPECT_FALSE(SemanticChunker::shouldSplit("tiny", "however, more", 20, 100, ""));
}

TEST(SemanticShouldSplitTest, LowSimilarityNeedsFill) {
    const std::string buffer = "Solar panels convert sunlight into electricity efficiently.";
    const std::string next = "Bakers knead dough before sunrise daily.";

    EXPECT_TRUE(SemanticChunker::shouldSplit(buffer, next, 100, 150, ""));
    EXPECT_FALSE(SemanticChunker::shouldSplit(buffer, next, 100, 200, ""));
}

TEST(SemanticShouldSplitTest, LookaheadCohesion) {
    const std::string buffer = "Solar panels convert sunlight into power.";
    const std::string next = "Solar panels need sunlight and storage.";
    const std::string following = "Storage needs panels, sunlight and solar need storage.";

    EXPECT_TRUE(SemanticChunker::shouldSplit(buffer, next, 81, 120, following));
    EXPECT_FALSE(SemanticChunker::shouldSplit(buffer, next, 81, 120, ""));
    EXPECT_FALSE(SemanticChunker::shouldSplit(buffer, next, 81, 200, following));
}

TEST(SemanticShouldSplitTest, RepetitiveBufferHasNarrowKeywordSet) {
    std::string buffer;
    for (int i = 0; i < 20; ++i) {
        buffer += "alpha ";
    }
    buffer += "beta.";

    // Only "alpha" survives the token cap, so the next sentence shares nothing with it
    EXPECT_TRUE(SemanticChunker::shouldSplit(buffer, "Beta gamma delta.", 144, 200, ""));
}

TEST(SemanticShouldSplitTest, CustomThresholds) {
    const std::string buffer = "Solar panels convert sunlight into electricity efficiently.";
    const std::string next = "Bakers knead dough before sunrise daily.";

    SemanticThresholds strict;
    strict.similarityFillRatio = 0.9;
    EXPECT_FALSE(SemanticChunker::shouldSplit(buffer, next, 100, 150, "", strict));
}

TEST_F(DocumentChunkerTest, YieldHookCalledEveryInterval) {
    std::string text;
    for (int i = 0; i < 250; ++i) {
        text += "Sentence number " + std::to_string(i) + " is here. ";
    }

    auto chunker = makeChunker(ChunkingStrategy::SENTENCE_BASED, 500);
    std::vector<size_t> calls;
    chunker->setYieldHook([&calls](size_t processed) { calls.push_back(processed); });

    auto with_hook = chunker->chunk(text);
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], kYieldInterval);
    EXPECT_EQ(calls[1], 2 * kYieldInterval);

    auto plain = makeChunker(ChunkingStrategy::SENTENCE_BASED, 500)->chunk(text);
    ASSERT_EQ(plain.size(), with_hook.size());
    for (size_t i = 0; i < plain.size(); ++i) {
        EXPECT_EQ(plain[i].content, with_hook[i].content);
    }
}
