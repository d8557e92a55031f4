// =============================================================================
// fq-stat - Quality Assessment Implementation
// =============================================================================

#include "fqs/algo/assessment.h"

#include <fmt/format.h>

namespace fqs::algo {

std::string_view qualityTierToString(QualityTier tier) noexcept {
    switch (tier) {
        case QualityTier::kExcellent:
            return "excellent";
        case QualityTier::kGood:
            return "good";
        case QualityTier::kLow:
            return "low";
        case QualityTier::kUnknown:
            break;
    }
    return "unknown";
}

VoidResult AssessmentThresholds::validate() const {
    if (goodQuality > excellentQuality) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "good quality threshold exceeds excellent threshold");
    }
    if (gcLow < 0.0 || gcHigh > 100.0 || gcLow > gcHigh) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("invalid GC range [{}, {}]", gcLow, gcHigh));
    }
    if (maxDiscardRate < 0.0 || maxDiscardRate > 1.0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "max discard rate must be within [0, 1]");
    }
    return makeVoidSuccess();
}

Assessment assess(const CombinedResult& result, const AssessmentThresholds& thresholds) {
    Assessment out;
    const RunningStats& stats = result.stats;

    if (auto mean = stats.meanQuality()) {
        if (*mean >= thresholds.excellentQuality) {
            out.tier = QualityTier::kExcellent;
        } else if (*mean >= thresholds.goodQuality) {
            out.tier = QualityTier::kGood;
        } else {
            out.tier = QualityTier::kLow;
            out.warnings.push_back(fmt::format("low mean quality (Q{:.1f})", *mean));
        }
    } else {
        out.warnings.emplace_back("no bases observed");
    }

    if (auto gc = stats.meanGC()) {
        out.gcNormal = *gc >= thresholds.gcLow && *gc <= thresholds.gcHigh;
        if (!out.gcNormal) {
            out.warnings.push_back(fmt::format("unusual GC content ({:.1f}%)", *gc));
        }
    }

    if (stats.hasReads()) {
        out.uniformLength = stats.minLength == stats.maxLength;
        if (!out.uniformLength) {
            out.warnings.push_back(
                fmt::format("variable read length ({}-{})", stats.minLength, stats.maxLength));
        }
    }

    out.q30Fraction = stats.q30Fraction();

    const RecordCount discarded = result.discards.total();
    const RecordCount seen = stats.count + discarded;
    if (seen > 0) {
        out.discardRate = static_cast<double>(discarded) / static_cast<double>(seen);
    }
    out.discardRateAcceptable = out.discardRate <= thresholds.maxDiscardRate;
    if (!out.discardRateAcceptable) {
        out.warnings.push_back(
            fmt::format("{} of {} records discarded ({:.2f}%)", discarded, seen,
                        100.0 * out.discardRate));
    }

    return out;
}

}  // namespace fqs::algo
