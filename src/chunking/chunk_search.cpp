#include <chunkwise/chunking/chunk_search.h>

#include <algorithm>
#include <cctype>

namespace chunkwise::chunking {

std::vector<TextChunk> findChunks(const ChunkingResult& result, std::string_view term) {
    if (term.empty()) {
        return result.chunks;
    }

    auto equalsIgnoreCase = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    };

    std::vector<TextChunk> matches;
    for (const auto& chunk : result.chunks) {
        auto it = std::search(chunk.content.begin(), chunk.content.end(), term.begin(), term.end(),
                              equalsIgnoreCase);
        if (it != chunk.content.end()) {
            matches.push_back(chunk);
        }
    }
    return matches;
}

} // namespace chunkwise::chunking
