#include <chunkwise/chunking/chunk_statistics.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace chunkwise::chunking {

namespace {

std::vector<SizeBucket> emptyBuckets() {
    return {{"0-500", 0, 500},
            {"501-1000", 501, 1000},
            {"1001-2000", 1001, 2000},
            {"2000+", 2001, SIZE_MAX}};
}

} // namespace

ChunkStatistics computeStatistics(const ChunkingResult& result, size_t original_text_length) {
    ChunkStatistics stats;
    stats.sizeDistribution = emptyBuckets();

    if (result.chunks.empty()) {
        return stats;
    }

    std::vector<size_t> sizes;
    sizes.reserve(result.chunks.size());
    for (const auto& chunk : result.chunks) {
        sizes.push_back(chunk.characterCount);
        stats.totalWords += chunk.wordCount;
    }
    std::sort(sizes.begin(), sizes.end());

    stats.minChunkSize = sizes.front();
    stats.maxChunkSize = sizes.back();
    stats.medianChunkSize = sizes[sizes.size() / 2];

    const double mean = static_cast<double>(result.averageChunkSize);
    double variance = 0.0;
    for (size_t size : sizes) {
        const double diff = static_cast<double>(size) - mean;
        variance += diff * diff;
    }
    variance /= static_cast<double>(sizes.size());
    stats.standardDeviation = std::sqrt(variance);

    if (mean > 0.0) {
        stats.consistencyScore = std::max(0.0, 100.0 - (stats.standardDeviation / mean) * 100.0);
    }

    const auto elapsed = result.processingTimeMs.count();
    if (elapsed > 0) {
        stats.charactersPerSecond = static_cast<size_t>(std::llround(
            static_cast<double>(original_text_length) / static_cast<double>(elapsed) * 1000.0));
    }

    for (auto& bucket : stats.sizeDistribution) {
        bucket.count = static_cast<size_t>(std::count_if(
            sizes.begin(), sizes.end(),
            [&bucket](size_t s) { return s >= bucket.min && s <= bucket.max; }));
        bucket.percentage =
            static_cast<double>(bucket.count) / static_cast<double>(sizes.size()) * 100.0;
    }

    return stats;
}

std::string formatStatistics(const ChunkingResult& result, const ChunkStatistics& stats) {
    std::ostringstream out;
    out << "Chunking Summary (" << strategyName(result.strategy) << "):\n";
    out << "  Total chunks: " << result.totalChunks << "\n";
    out << "  Average chunk size: " << result.averageChunkSize << " characters\n";
    out << "  Min / median / max: " << stats.minChunkSize << " / " << stats.medianChunkSize
        << " / " << stats.maxChunkSize << " characters\n";
    out << std::fixed << std::setprecision(1);
    out << "  Standard deviation: " << stats.standardDeviation << "\n";
    out << "  Consistency score: " << stats.consistencyScore << "%\n";
    out << "  Total words: " << stats.totalWords << "\n";
    out << "  Processing time: " << result.processingTimeMs.count() << " ms";
    if (stats.charactersPerSecond > 0) {
        out << " (" << stats.charactersPerSecond << " chars/s)";
    }
    out << "\n";
    out << "  Size distribution:\n";
    for (const auto& bucket : stats.sizeDistribution) {
        out << "    " << std::left << std::setw(10) << bucket.label << std::right
            << std::setw(6) << bucket.count << "  (" << bucket.percentage << "%)\n";
    }
    return out.str();
}

} // namespace chunkwise::chunking
