// =============================================================================
// fq-stat - Chunk and Combined Results Implementation
// =============================================================================

#include "fqs/algo/chunk_result.h"

namespace fqs::algo {

ChunkSummary summarize(const ChunkResult& result) {
    ChunkSummary summary;
    summary.sourceIdentifier = result.sourceIdentifier;
    summary.count = result.stats.count;
    summary.meanLength = result.stats.meanLength();
    summary.meanGC = result.stats.meanGC();
    summary.meanQuality = result.stats.meanQuality();
    summary.discarded = result.discards.total();
    return summary;
}

ChunkResult CombinedResult::asChunkResult(std::string sourceIdentifier) const {
    ChunkResult result;
    result.sourceIdentifier = std::move(sourceIdentifier);
    result.stats = stats;
    result.histograms = histograms;
    result.positionProfile = positionProfile;
    result.reservoir = reservoir;
    result.discards = discards;
    result.chunkCount = chunkCount;
    return result;
}

}  // namespace fqs::algo
