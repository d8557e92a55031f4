// =============================================================================
// fq-stat - Reducer
// =============================================================================
// Merges ChunkResults from any number of chunks, in any order, into a single
// CombinedResult.
//
// Exact fields (counts, sums, sums of squares, min/max, histograms, discard
// counters) are combined with commutative, associative operations, so the
// result does not depend on arrival order or grouping. Position profiles are
// merged up to the shortest input profile and are dropped if any input has
// none. Sample buffers are ordered by source identifier, concatenated, then
// thinned evenly to the combined caps; the result approximates a file-wide
// sample.
//
// Usage:
//   auto combined = Reducer::merge(results);
//
//   Reducer reducer;               // incremental
//   reducer.add(std::move(r1));
//   reducer.add(std::move(r2));
//   auto combined = reducer.finish();
// =============================================================================

#ifndef FQS_ALGO_REDUCER_H
#define FQS_ALGO_REDUCER_H

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "fqs/algo/chunk_result.h"
#include "fqs/common/error.h"

namespace fqs::algo {

/// @brief Configuration for reduction.
struct ReducerConfig {
    /// @brief Cap on GC samples kept in the combined reservoir.
    std::size_t gcReservoirCap = kDefaultCombinedReservoirCap;

    /// @brief Cap on quality samples kept in the combined reservoir.
    std::size_t qualityReservoirCap = kDefaultCombinedReservoirCap;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Order-independent merge of chunk results.
///
/// Thread Safety:
/// - Not thread-safe; a single consumer folds results.
class Reducer {
public:
    explicit Reducer(ReducerConfig config = {});

    /// @brief Fold one result.
    void add(ChunkResult result);

    /// @brief Number of results folded.
    [[nodiscard]] std::size_t size() const noexcept { return summaries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return summaries_.empty(); }

    /// @brief Build the combined result of everything folded so far.
    /// @return CombinedResult, kEmptyInput if nothing was added, or
    ///         kInvalidArgument for a bad configuration.
    [[nodiscard]] Result<CombinedResult> finish() const;

    /// @brief Merge a batch of results.
    [[nodiscard]] static Result<CombinedResult> merge(std::span<const ChunkResult> results,
                                                      ReducerConfig config = {});

private:
    struct SamplePart {
        std::string sourceIdentifier;
        std::vector<double> gc;
        std::vector<PhredScore> quality;
    };

    ReducerConfig config_;
    RunningStats stats_;
    Histograms histograms_;
    io::DiscardCounts discards_;
    std::uint64_t chunkCount_ = 0;
    std::optional<PositionProfile> profile_;
    bool profileMissing_ = false;
    std::vector<SamplePart> samples_;
    std::vector<ChunkSummary> summaries_;
};

}  // namespace fqs::algo

#endif  // FQS_ALGO_REDUCER_H
