#pragma once

#include <chunkwise/chunking/chunk_types.h>

#include <string_view>
#include <vector>

namespace chunkwise::chunking {

// Chunks whose content contains term, ignoring ASCII case. An empty term matches all.
std::vector<TextChunk> findChunks(const ChunkingResult& result, std::string_view term);

} // namespace chunkwise::chunking
