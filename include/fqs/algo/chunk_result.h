// =============================================================================
// fq-stat - Chunk and Combined Results
// =============================================================================
// Immutable summaries produced by the accumulator (one per chunk) and by the
// reducer (one per reduction). A CombinedResult can be re-emitted as a
// ChunkResult so reductions can be stacked: chunks -> files -> run.
// =============================================================================

#ifndef FQS_ALGO_CHUNK_RESULT_H
#define FQS_ALGO_CHUNK_RESULT_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fqs/algo/position_profile.h"
#include "fqs/algo/running_stats.h"
#include "fqs/algo/sample_reservoir.h"
#include "fqs/io/record_validator.h"

namespace fqs::algo {

// =============================================================================
// ChunkResult
// =============================================================================

/// @brief Summary of one chunk (or of a re-emitted reduction).
struct ChunkResult {
    std::string sourceIdentifier;
    RunningStats stats;
    Histograms histograms;

    /// @brief Empty when the profile was disabled (K = 0).
    std::optional<PositionProfile> positionProfile;

    SampleReservoir reservoir;
    io::DiscardCounts discards;

    /// @brief Number of leaf chunks summarised (1 for a leaf).
    std::uint64_t chunkCount = 1;

    bool operator==(const ChunkResult&) const = default;
};

// =============================================================================
// CombinedResult
// =============================================================================

/// @brief Per-input line of a reduction's trend report.
struct ChunkSummary {
    std::string sourceIdentifier;
    RecordCount count = 0;
    std::optional<double> meanLength;
    std::optional<double> meanGC;
    std::optional<double> meanQuality;
    RecordCount discarded = 0;

    bool operator==(const ChunkSummary&) const = default;
};

/// @brief Build the summary line for one reduction input.
[[nodiscard]] ChunkSummary summarize(const ChunkResult& result);

/// @brief Result of merging one or more ChunkResults.
struct CombinedResult {
    RunningStats stats;
    Histograms histograms;
    std::optional<PositionProfile> positionProfile;

    /// @brief Concatenated input samples, thinned to the combined caps.
    SampleReservoir reservoir{kDefaultCombinedReservoirCap, kDefaultCombinedReservoirCap};

    io::DiscardCounts discards;
    std::uint64_t chunkCount = 0;

    /// @brief One entry per input, ordered by source identifier.
    std::vector<ChunkSummary> chunkSummaries;

    [[nodiscard]] RecordCount count() const noexcept { return stats.count; }
    [[nodiscard]] std::optional<double> meanLength() const noexcept { return stats.meanLength(); }
    [[nodiscard]] std::optional<double> meanGC() const noexcept { return stats.meanGC(); }
    [[nodiscard]] std::optional<double> meanQuality() const noexcept { return stats.meanQuality(); }

    /// @brief Population-exact standard deviations.
    [[nodiscard]] std::optional<double> lengthStdDev() const noexcept { return stats.lengthStdDev(); }
    [[nodiscard]] std::optional<double> gcStdDev() const noexcept { return stats.gcStdDev(); }
    [[nodiscard]] std::optional<double> qualityStdDev() const noexcept {
        return stats.qualityStdDev();
    }

    /// @brief Sample-based standard deviations over the retained reservoir.
    [[nodiscard]] std::optional<double> sampleGcStdDev() const noexcept {
        return reservoir.gcStdDev();
    }
    [[nodiscard]] std::optional<double> sampleQualityStdDev() const noexcept {
        return reservoir.qualityStdDev();
    }

    /// @brief Re-emit as input for a higher-level reduction.
    [[nodiscard]] ChunkResult asChunkResult(std::string sourceIdentifier) const;

    bool operator==(const CombinedResult&) const = default;
};

}  // namespace fqs::algo

#endif  // FQS_ALGO_CHUNK_RESULT_H
