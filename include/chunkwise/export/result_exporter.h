#pragma once

#include <chunkwise/chunking/chunk_types.h>
#include <chunkwise/core/types.h>

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace chunkwise::exporting {

using Clock = std::chrono::system_clock;

/**
 * ISO-8601 UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
 */
std::string formatTimestamp(Clock::time_point tp);

/**
 * Export document: {"metadata": {...}, "chunks": [...]}
 */
nlohmann::json toJson(const chunking::ChunkingResult& result, Clock::time_point exported_at);

/**
 * Write the export document (indent 2) to path, replacing any existing file
 */
Result<void> exportToFile(const chunking::ChunkingResult& result,
                          const std::filesystem::path& path,
                          Clock::time_point exported_at = Clock::now());

// rag-chunks-<strategy>-<epoch-ms>.json
std::string defaultExportFileName(chunking::ChunkingStrategy strategy, Clock::time_point now);

} // namespace chunkwise::exporting
