// =============================================================================
// fq-stat - Per-position Profile
// =============================================================================
// Fixed-size table of quality statistics and base composition for the first
// K positions of every read. Positions >= K are ignored, so memory is
// independent of read length and read count.
// =============================================================================

#ifndef FQS_ALGO_POSITION_PROFILE_H
#define FQS_ALGO_POSITION_PROFILE_H

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "fqs/algo/running_stats.h"
#include "fqs/common/types.h"

namespace fqs::algo {

/// @brief Statistics for one base position.
struct PositionStats {
    RecordCount count = 0;
    double sum = 0.0;
    double sumSq = 0.0;
    int min = kUnsetMin;
    int max = kUnsetMax;

    /// @brief Base composition indexed by Nucleotide.
    std::array<RecordCount, kNucleotideCount> bases{};

    void add(PhredScore score, char base) noexcept;
    void merge(const PositionStats& other) noexcept;

    [[nodiscard]] std::optional<double> mean() const noexcept;
    [[nodiscard]] std::optional<double> stdDev() const noexcept;

    /// @brief Count for one nucleotide column.
    [[nodiscard]] RecordCount baseCount(Nucleotide n) const noexcept {
        return bases[static_cast<std::size_t>(n)];
    }

    /// @brief GC percentage at this position; empty when no bases were seen.
    [[nodiscard]] std::optional<double> gcPercent() const noexcept;

    bool operator==(const PositionStats&) const = default;
};

/// @brief Per-position quality and composition for positions 0..K-1.
class PositionProfile {
public:
    /// @brief Create a profile covering @p positions leading positions.
    explicit PositionProfile(std::size_t positions = kDefaultProfilePositions);

    /// @brief Fold one read.
    /// @pre sequence.size() == scores.size()
    void update(std::string_view sequence, std::span<const PhredScore> scores) noexcept;

    /// @brief Merge another profile, truncating to the shorter of the two.
    void merge(const PositionProfile& other);

    /// @brief Number of positions covered (K).
    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }

    /// @brief Row for one position.
    [[nodiscard]] const PositionStats& at(std::size_t position) const { return rows_.at(position); }

    [[nodiscard]] std::span<const PositionStats> rows() const noexcept { return rows_; }

    /// @brief Mutable rows, used when rebuilding a profile from a serialized form.
    [[nodiscard]] std::span<PositionStats> mutableRows() noexcept { return rows_; }

    bool operator==(const PositionProfile&) const = default;

private:
    std::vector<PositionStats> rows_;
};

}  // namespace fqs::algo

#endif  // FQS_ALGO_POSITION_PROFILE_H
