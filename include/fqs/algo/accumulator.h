// =============================================================================
// fq-stat - Accumulator
// =============================================================================
// Bounded-memory summary of one stream of validated reads.
//
// Memory is O(K + reservoir caps + histogram bins), independent of the number
// of reads folded. snapshot() produces an immutable ChunkResult without
// resetting state.
//
// Usage:
//   Accumulator acc(config);
//   for (...) acc.fold(makeObservation(record.sequence, scores));
//   ChunkResult result = acc.snapshot("chunk_001");
// =============================================================================

#ifndef FQS_ALGO_ACCUMULATOR_H
#define FQS_ALGO_ACCUMULATOR_H

#include <cstddef>
#include <optional>
#include <string>

#include "fqs/algo/chunk_result.h"
#include "fqs/algo/observation.h"
#include "fqs/common/error.h"

namespace fqs::algo {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Configuration for the per-chunk accumulator.
struct AccumulatorConfig {
    /// @brief Leading positions covered by the profile (0 disables it).
    std::size_t profilePositions = kDefaultProfilePositions;

    /// @brief Sample every Nth validated read (index % stride == 0).
    std::size_t sampleStride = kDefaultSampleStride;

    /// @brief Cap on retained GC samples.
    std::size_t gcReservoirCap = kDefaultChunkReservoirCap;

    /// @brief Cap on retained quality samples.
    std::size_t qualityReservoirCap = kDefaultChunkReservoirCap;

    /// @brief Leading quality scores taken from each sampled read.
    std::size_t qualitySamplePositions = kDefaultQualitySamplePositions;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Accumulator Class
// =============================================================================

/// @brief Folds validated observations into running stats, histograms,
///        a position profile and stride samples.
///
/// Thread Safety:
/// - Not thread-safe; owned by exactly one chunk processor.
class Accumulator {
public:
    /// @brief Construct an accumulator.
    /// @note The configuration is expected to have passed validate().
    explicit Accumulator(AccumulatorConfig config = {});

    /// @brief Fold one observation.
    void fold(const ValidatedObservation& obs);

    /// @brief Immutable summary of everything folded so far.
    [[nodiscard]] ChunkResult snapshot(std::string sourceIdentifier,
                                       const io::DiscardCounts& discards = {}) const;

    /// @brief Reads folded so far.
    [[nodiscard]] RecordCount count() const noexcept { return stats_.count; }

    [[nodiscard]] const RunningStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const AccumulatorConfig& config() const noexcept { return config_; }

private:
    void sample(const ValidatedObservation& obs);

    AccumulatorConfig config_;
    RunningStats stats_;
    Histograms histograms_;
    std::optional<PositionProfile> profile_;
    SampleReservoir reservoir_;
};

}  // namespace fqs::algo

#endif  // FQS_ALGO_ACCUMULATOR_H
