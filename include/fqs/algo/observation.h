// =============================================================================
// fq-stat - Validated Observation
// =============================================================================
// The per-read values every accumulator component consumes: a validated
// sequence, its decoded quality scores and the derived GC / N counts.
// =============================================================================

#ifndef FQS_ALGO_OBSERVATION_H
#define FQS_ALGO_OBSERVATION_H

#include <cstddef>
#include <span>
#include <string_view>

#include "fqs/common/types.h"

namespace fqs::algo {

/// @brief One validated, decoded read.
/// @note Views only; the record and decoded scores must outlive it.
struct ValidatedObservation {
    /// @brief Base sequence (ACGTN, any case).
    std::string_view sequence;

    /// @brief Decoded Phred scores, same length as sequence.
    std::span<const PhredScore> scores;

    /// @brief Count of G and C bases.
    std::size_t gcCount = 0;

    /// @brief Count of N bases.
    std::size_t nCount = 0;

    /// @brief GC percentage in [0, 100]; 0 for an empty read.
    double gcPercent = 0.0;

    [[nodiscard]] std::size_t length() const noexcept { return sequence.size(); }
};

/// @brief GC percentage of a sequence (case-insensitive); 0 for an empty sequence.
[[nodiscard]] double computeGcPercent(std::string_view sequence) noexcept;

/// @brief Build an observation, counting GC and N bases in one pass.
[[nodiscard]] ValidatedObservation makeObservation(std::string_view sequence,
                                                   std::span<const PhredScore> scores) noexcept;

}  // namespace fqs::algo

#endif  // FQS_ALGO_OBSERVATION_H
