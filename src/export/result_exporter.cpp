#include <chunkwise/export/result_exporter.h>

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace chunkwise::exporting {

std::string formatTimestamp(Clock::time_point tp) {
    auto time_t_value = Clock::to_time_t(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm tm_utc;
#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis << 'Z';
    return oss.str();
}

nlohmann::json toJson(const chunking::ChunkingResult& result, Clock::time_point exported_at) {
    nlohmann::json j;
    j["metadata"] = {{"strategy", chunking::strategyName(result.strategy)},
                     {"totalChunks", result.totalChunks},
                     {"averageChunkSize", result.averageChunkSize},
                     {"processingTime", result.processingTimeMs.count()},
                     {"exportedAt", formatTimestamp(exported_at)}};

    auto chunks = nlohmann::json::array();
    for (const auto& chunk : result.chunks) {
        chunks.push_back({{"id", chunk.id},
                          {"content", chunk.content},
                          {"characterCount", chunk.characterCount},
                          {"wordCount", chunk.wordCount},
                          {"startIndex", chunk.startIndex},
                          {"endIndex", chunk.endIndex},
                          {"strategy", chunking::strategyName(chunk.strategy)}});
    }
    j["chunks"] = std::move(chunks);
    return j;
}

Result<void> exportToFile(const chunking::ChunkingResult& result,
                          const std::filesystem::path& path, Clock::time_point exported_at) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IOError, "Cannot open export file: " + path.string()};
    }

    // Fixed-size windows may cut through a multi-byte UTF-8 sequence
    out << toJson(result, exported_at).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
        << "\n";
    out.flush();
    if (!out) {
        return Error{ErrorCode::IOError, "Failed writing export file: " + path.string()};
    }

    spdlog::info("Exported {} chunks to {}", result.totalChunks, path.string());
    return {};
}

std::string defaultExportFileName(chunking::ChunkingStrategy strategy, Clock::time_point now) {
    auto epoch_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return "rag-chunks-" + std::string(chunking::strategyName(strategy)) + "-" +
           std::to_string(epoch_ms) + ".json";
}

} // namespace chunkwise::exporting
