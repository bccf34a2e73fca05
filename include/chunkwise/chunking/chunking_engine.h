#pragma once

#include <chunkwise/chunking/chunk_types.h>
#include <chunkwise/chunking/document_chunker.h>
#include <chunkwise/core/types.h>

#include <future>
#include <string>

namespace chunkwise::chunking {

/**
 * Public entry point: validates the configuration, runs the selected strategy, and wraps
 * its chunks with summary figures. Holds no state between calls apart from the optional
 * yield hook, which is passed to every strategy it runs.
 */
class ChunkingEngine {
public:
    ChunkingEngine() = default;

    /**
     * Chunk text with config. Blank text yields an empty result, not an error. Invalid
     * configurations yield InvalidConfiguration before any text is processed.
     */
    Result<ChunkingResult> chunk(const std::string& text, const ChunkConfig& config) const;

    /**
     * Run chunk() on a separate task that owns copies of its inputs
     */
    std::future<Result<ChunkingResult>> chunkAsync(std::string text, ChunkConfig config) const;

    void setYieldHook(YieldHook hook) { yield_hook_ = std::move(hook); }

private:
    YieldHook yield_hook_;
};

} // namespace chunkwise::chunking
