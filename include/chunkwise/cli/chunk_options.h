#pragma once

#include <chunkwise/chunking/chunk_types.h>
#include <chunkwise/core/types.h>

#include <optional>
#include <string>

#include <CLI/CLI.hpp>

namespace chunkwise::cli {

/**
 * Strategy, size and overlap flags shared by the commands that run the engine
 */
struct ChunkOptions {
    std::optional<std::string> strategy;
    std::optional<long long> chunkSize;
    std::optional<long long> overlap;

    void addTo(CLI::App* cmd);

    // Apply the flags given on the command line on top of base. A --size without --overlap
    // replaces an overlap that would no longer fit with defaultOverlapFor(size).
    Result<chunking::ChunkConfig> resolve(chunking::ChunkConfig base) const;
};

} // namespace chunkwise::cli
