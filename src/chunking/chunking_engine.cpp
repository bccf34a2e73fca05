#include <chunkwise/chunking/chunking_engine.h>
#include <chunkwise/chunking/text_splitter.h>
#include <chunkwise/profiling.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <cstdint>

namespace chunkwise::chunking {

Result<ChunkingResult> ChunkingEngine::chunk(const std::string& text,
                                             const ChunkConfig& config) const {
    CHUNKWISE_ZONE_SCOPED_N("ChunkingEngine::chunk");

    auto chunker = createChunker(config);
    if (!chunker) {
        spdlog::error("Rejected chunking configuration: {}", chunker.error().message);
        return chunker.error();
    }

    ChunkingResult result;
    result.strategy = config.strategy;

    if (text::isBlank(text)) {
        spdlog::warn("Empty text provided for chunking");
        return result;
    }

    spdlog::debug("Starting {} chunking for text of length {}", strategyName(config.strategy),
                  text.size());

    auto& impl = chunker.value();
    impl->setYieldHook(yield_hook_);

    auto start = std::chrono::steady_clock::now();
    result.chunks = impl->chunk(text);
    auto end = std::chrono::steady_clock::now();

    result.processingTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    result.totalChunks = result.chunks.size();

    if (!result.chunks.empty()) {
        size_t total_size = 0;
        for (const auto& c : result.chunks) {
            total_size += c.characterCount;
        }
        result.averageChunkSize = static_cast<size_t>(std::llround(
            static_cast<double>(total_size) / static_cast<double>(result.chunks.size())));
    }

    CHUNKWISE_PLOT("ChunkCount", static_cast<int64_t>(result.totalChunks));
    spdlog::info("Chunking completed: {} chunks, avg size: {}, time: {}ms", result.totalChunks,
                 result.averageChunkSize, result.processingTimeMs.count());

    return result;
}

std::future<Result<ChunkingResult>> ChunkingEngine::chunkAsync(std::string text,
                                                               ChunkConfig config) const {
    return std::async(std::launch::async,
                      [hook = yield_hook_, text = std::move(text), config]() {
                          ChunkingEngine engine;
                          engine.setYieldHook(hook);
                          return engine.chunk(text, config);
                      });
}

} // namespace chunkwise::chunking
