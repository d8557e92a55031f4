// =============================================================================
// fq-stat - Running Statistics and Histograms
// =============================================================================
// Exact, mergeable summary state for a stream of validated reads.
//
// RunningStats keeps counts, sums, sums of squares and min/max values; every
// mean and standard deviation is derived at read time. Histograms are fixed
// size tables merged by element-wise addition. Both are plain aggregates so
// chunk results can be combined in any order and any grouping.
// =============================================================================

#ifndef FQS_ALGO_RUNNING_STATS_H
#define FQS_ALGO_RUNNING_STATS_H

#include <array>
#include <cstddef>
#include <limits>
#include <optional>

#include "fqs/algo/observation.h"
#include "fqs/common/types.h"

namespace fqs::algo {

// =============================================================================
// RunningStats
// =============================================================================

/// @brief Sentinel for an unset minimum.
inline constexpr int kUnsetMin = std::numeric_limits<int>::max();

/// @brief Sentinel for an unset maximum.
inline constexpr int kUnsetMax = std::numeric_limits<int>::min();

/// @brief Per-read and per-base aggregate counters.
///
/// Length and GC sums are per read; quality sums are per base. Min/max fields
/// hold kUnsetMin / kUnsetMax until the first observation, which makes merge
/// a plain min/max with no special case.
struct RunningStats {
    /// @brief Number of validated reads.
    RecordCount count = 0;

    double sumLength = 0.0;
    double sumSqLength = 0.0;
    double sumGC = 0.0;
    double sumSqGC = 0.0;

    /// @brief Sum of every base quality score.
    double sumQuality = 0.0;
    double sumSqQuality = 0.0;

    /// @brief Sum of per-read mean quality (empty reads contribute nothing).
    double sumReadMeanQuality = 0.0;

    int minLength = kUnsetMin;
    int maxLength = kUnsetMax;
    int minQuality = kUnsetMin;
    int maxQuality = kUnsetMax;

    RecordCount totalBases = 0;
    RecordCount nBases = 0;
    RecordCount readsWithN = 0;
    RecordCount q20Bases = 0;
    RecordCount q30Bases = 0;

    /// @brief Fold one observation.
    void update(const ValidatedObservation& obs) noexcept;

    /// @brief Combine with another summary.
    void merge(const RunningStats& other) noexcept;

    /// @brief Whether at least one read was folded.
    [[nodiscard]] bool hasReads() const noexcept { return count > 0; }

    /// @brief Whether at least one base quality was folded.
    [[nodiscard]] bool hasBases() const noexcept { return totalBases > 0; }

    // Derived values; empty when the denominator is zero.
    [[nodiscard]] std::optional<double> meanLength() const noexcept;
    [[nodiscard]] std::optional<double> meanGC() const noexcept;
    [[nodiscard]] std::optional<double> meanQuality() const noexcept;
    [[nodiscard]] std::optional<double> meanReadQuality() const noexcept;

    /// @brief Population standard deviation of read length.
    [[nodiscard]] std::optional<double> lengthStdDev() const noexcept;

    /// @brief Population standard deviation of read GC percentage.
    [[nodiscard]] std::optional<double> gcStdDev() const noexcept;

    /// @brief Population standard deviation of per-base quality.
    [[nodiscard]] std::optional<double> qualityStdDev() const noexcept;

    [[nodiscard]] std::optional<int> minLengthValue() const noexcept;
    [[nodiscard]] std::optional<int> maxLengthValue() const noexcept;
    [[nodiscard]] std::optional<int> minQualityValue() const noexcept;
    [[nodiscard]] std::optional<int> maxQualityValue() const noexcept;

    /// @brief Fraction of bases with quality >= 20.
    [[nodiscard]] std::optional<double> q20Fraction() const noexcept;

    /// @brief Fraction of bases with quality >= 30.
    [[nodiscard]] std::optional<double> q30Fraction() const noexcept;

    /// @brief Fraction of bases called as N.
    [[nodiscard]] std::optional<double> nFraction() const noexcept;

    bool operator==(const RunningStats&) const = default;
};

// =============================================================================
// Histograms
// =============================================================================

/// @brief Exact distributions of base quality, read GC and read length.
struct Histograms {
    /// @brief Per-base Phred score counts (index = score).
    std::array<RecordCount, kPhredScoreCount> quality{};

    /// @brief Per-read GC percentage counts (index = rounded percent).
    std::array<RecordCount, kGcHistogramBins> gc{};

    /// @brief Per-read length counts; the last bin holds all longer reads.
    std::array<RecordCount, kLengthHistogramBins> length{};

    void update(const ValidatedObservation& obs) noexcept;
    void merge(const Histograms& other) noexcept;

    /// @brief Median base quality from the quality histogram.
    [[nodiscard]] std::optional<int> medianQuality() const noexcept;

    /// @brief Median read length (saturates at the overflow bin).
    [[nodiscard]] std::optional<int> medianLength() const noexcept;

    bool operator==(const Histograms&) const = default;
};

/// @brief Bin index for a length value.
[[nodiscard]] constexpr std::size_t lengthBin(std::size_t length) noexcept {
    return length < kLengthHistogramBins ? length : kLengthHistogramBins - 1;
}

/// @brief Smallest bin index whose cumulative count reaches @p fraction of the total.
/// @return nullopt if the histogram is empty.
template <std::size_t N>
[[nodiscard]] std::optional<int> histogramQuantile(const std::array<RecordCount, N>& bins,
                                                   double fraction) noexcept {
    RecordCount total = 0;
    for (RecordCount value : bins) {
        total += value;
    }
    if (total == 0) {
        return std::nullopt;
    }

    const double target = fraction * static_cast<double>(total);
    RecordCount cumulative = 0;
    for (std::size_t i = 0; i < N; ++i) {
        cumulative += bins[i];
        if (cumulative > 0 && static_cast<double>(cumulative) >= target) {
            return static_cast<int>(i);
        }
    }
    return static_cast<int>(N - 1);
}

}  // namespace fqs::algo

#endif  // FQS_ALGO_RUNNING_STATS_H
