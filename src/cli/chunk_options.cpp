#include <chunkwise/cli/chunk_options.h>

namespace chunkwise::cli {

void ChunkOptions::addTo(CLI::App* cmd) {
    cmd->add_option("-s,--strategy", strategy,
                    "Chunking strategy: fixed, sentence, paragraph, recursive, semantic");
    cmd->add_option("--size", chunkSize,
                    "Target maximum chunk size in characters; without --overlap, an overlap "
                    "that no longer fits falls back to a tenth of this size");
    cmd->add_option("--overlap", overlap, "Overlap between fixed-size windows in characters");
}

Result<chunking::ChunkConfig> ChunkOptions::resolve(chunking::ChunkConfig base) const {
    if (strategy) {
        auto parsed = chunking::parseStrategy(*strategy);
        if (!parsed) {
            return parsed.error();
        }
        base.strategy = parsed.value();
    }

    if (chunkSize) {
        if (*chunkSize <= 0) {
            return Error{ErrorCode::InvalidConfiguration,
                         "Chunk size must be greater than zero (got " +
                             std::to_string(*chunkSize) + ")"};
        }
        base.chunkSize = static_cast<size_t>(*chunkSize);
        if (!overlap && base.overlap >= base.chunkSize) {
            base.overlap = chunking::defaultOverlapFor(base.chunkSize);
        }
    }

    if (overlap) {
        if (*overlap < 0) {
            return Error{ErrorCode::InvalidConfiguration,
                         "Overlap must not be negative (got " + std::to_string(*overlap) + ")"};
        }
        base.overlap = static_cast<size_t>(*overlap);
    }

    if (auto valid = chunking::validateConfig(base); !valid) {
        return valid.error();
    }
    return base;
}

} // namespace chunkwise::cli
