// =============================================================================
// fq-stat - Per-position Profile Implementation
// =============================================================================

#include "fqs/algo/position_profile.h"

#include <algorithm>
#include <cmath>

namespace fqs::algo {

// =============================================================================
// PositionStats
// =============================================================================

void PositionStats::add(PhredScore score, char base) noexcept {
    const int q = score;
    ++count;
    sum += q;
    sumSq += static_cast<double>(q * q);
    min = std::min(min, q);
    max = std::max(max, q);

    if (auto column = nucleotideFromChar(base)) {
        ++bases[static_cast<std::size_t>(*column)];
    }
}

void PositionStats::merge(const PositionStats& other) noexcept {
    count += other.count;
    sum += other.sum;
    sumSq += other.sumSq;
    min = std::min(min, other.min);
    max = std::max(max, other.max);
    for (std::size_t i = 0; i < kNucleotideCount; ++i) {
        bases[i] += other.bases[i];
    }
}

std::optional<double> PositionStats::mean() const noexcept {
    if (count == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(count);
}

std::optional<double> PositionStats::stdDev() const noexcept {
    if (count == 0) {
        return std::nullopt;
    }
    const double m = sum / static_cast<double>(count);
    return std::sqrt(std::max(sumSq / static_cast<double>(count) - m * m, 0.0));
}

std::optional<double> PositionStats::gcPercent() const noexcept {
    RecordCount total = 0;
    for (RecordCount value : bases) {
        total += value;
    }
    if (total == 0) {
        return std::nullopt;
    }
    const RecordCount gc = baseCount(Nucleotide::kG) + baseCount(Nucleotide::kC);
    return 100.0 * static_cast<double>(gc) / static_cast<double>(total);
}

// =============================================================================
// PositionProfile
// =============================================================================

PositionProfile::PositionProfile(std::size_t positions) : rows_(positions) {}

void PositionProfile::update(std::string_view sequence,
                             std::span<const PhredScore> scores) noexcept {
    const std::size_t limit = std::min({rows_.size(), sequence.size(), scores.size()});
    for (std::size_t i = 0; i < limit; ++i) {
        rows_[i].add(scores[i], sequence[i]);
    }
}

void PositionProfile::merge(const PositionProfile& other) {
    if (other.rows_.size() < rows_.size()) {
        rows_.resize(other.rows_.size());
    }
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        rows_[i].merge(other.rows_[i]);
    }
}

}  // namespace fqs::algo
