// =============================================================================
// fq-stat - Quality Assessment
// =============================================================================
// Pass/warn verdicts derived from a CombinedResult: quality tier by mean
// Phred score, GC content range, read length uniformity, Q30 base fraction
// and discard rate.
// =============================================================================

#ifndef FQS_ALGO_ASSESSMENT_H
#define FQS_ALGO_ASSESSMENT_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fqs/algo/chunk_result.h"
#include "fqs/common/error.h"

namespace fqs::algo {

/// @brief Overall quality tier by mean base quality.
enum class QualityTier : std::uint8_t {
    kExcellent = 0,  ///< mean >= excellent threshold (Q30)
    kGood = 1,       ///< mean >= good threshold (Q20)
    kLow = 2,        ///< below the good threshold
    kUnknown = 3     ///< no bases observed
};

[[nodiscard]] std::string_view qualityTierToString(QualityTier tier) noexcept;

/// @brief Thresholds used by assess().
struct AssessmentThresholds {
    double excellentQuality = 30.0;
    double goodQuality = 20.0;

    /// @brief Inclusive range of mean GC percentage considered normal.
    double gcLow = 35.0;
    double gcHigh = 65.0;

    /// @brief Largest acceptable fraction of discarded records.
    double maxDiscardRate = 0.05;

    [[nodiscard]] VoidResult validate() const;
};

/// @brief Verdicts for one combined result.
struct Assessment {
    QualityTier tier = QualityTier::kUnknown;
    bool gcNormal = false;
    bool uniformLength = false;
    bool discardRateAcceptable = true;

    std::optional<double> q30Fraction;

    /// @brief Discarded / (validated + discarded); 0 when nothing was read.
    double discardRate = 0.0;

    /// @brief Human-readable warnings, empty when every check passed.
    std::vector<std::string> warnings;

    [[nodiscard]] bool passed() const noexcept { return warnings.empty(); }
};

/// @brief Assess a combined result.
[[nodiscard]] Assessment assess(const CombinedResult& result,
                                const AssessmentThresholds& thresholds = {});

}  // namespace fqs::algo

#endif  // FQS_ALGO_ASSESSMENT_H
