// =============================================================================
// fq-stat - Sample Reservoir
// =============================================================================
// Bounded buffers of sampled GC percentages and quality scores.
//
// Sampling is deterministic: the caller decides which reads are sampled
// (every Nth validated read). Once a buffer reaches its cap it stops
// growing; nothing is evicted. The retained values are therefore biased
// towards the start of a chunk and are not an unbiased reservoir sample.
// =============================================================================

#ifndef FQS_ALGO_SAMPLE_RESERVOIR_H
#define FQS_ALGO_SAMPLE_RESERVOIR_H

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "fqs/common/types.h"

namespace fqs::algo {

/// @brief Capped sample buffers for GC and quality values.
class SampleReservoir {
public:
    /// @brief Create an empty reservoir.
    /// @param gcCap Maximum retained GC samples.
    /// @param qualityCap Maximum retained quality samples.
    explicit SampleReservoir(std::size_t gcCap = kDefaultChunkReservoirCap,
                             std::size_t qualityCap = kDefaultChunkReservoirCap);

    /// @brief Add a GC sample unless the GC buffer is full.
    void addGc(double gcPercent);

    /// @brief Append quality samples up to the quality cap.
    void addQualities(std::span<const PhredScore> scores);

    [[nodiscard]] const std::vector<double>& gcSamples() const noexcept { return gc_; }
    [[nodiscard]] const std::vector<PhredScore>& qualitySamples() const noexcept {
        return quality_;
    }

    [[nodiscard]] std::size_t gcCap() const noexcept { return gcCap_; }
    [[nodiscard]] std::size_t qualityCap() const noexcept { return qualityCap_; }

    /// @brief Whether both buffers are at their caps.
    [[nodiscard]] bool full() const noexcept {
        return gc_.size() >= gcCap_ && quality_.size() >= qualityCap_;
    }

    /// @brief Replace the buffers, thinning each to its cap.
    void assign(std::vector<double> gc, std::vector<PhredScore> quality);

    /// @brief Sample standard deviation (n - 1) of the retained GC values.
    [[nodiscard]] std::optional<double> gcStdDev() const noexcept;

    /// @brief Sample standard deviation (n - 1) of the retained quality values.
    [[nodiscard]] std::optional<double> qualityStdDev() const noexcept;

    bool operator==(const SampleReservoir&) const = default;

private:
    std::size_t gcCap_;
    std::size_t qualityCap_;
    std::vector<double> gc_;
    std::vector<PhredScore> quality_;
};

/// @brief Keep @p cap evenly spaced elements (indices floor(j * n / cap)).
/// @note Leaves @p values untouched when it already fits.
template <typename T>
void thinUniformly(std::vector<T>& values, std::size_t cap) {
    const std::size_t n = values.size();
    if (n <= cap) {
        return;
    }
    // Indices are strictly increasing and >= j, so compaction in place is safe
    for (std::size_t j = 0; j < cap; ++j) {
        values[j] = values[j * n / cap];
    }
    values.resize(cap);
}

}  // namespace fqs::algo

#endif  // FQS_ALGO_SAMPLE_RESERVOIR_H
