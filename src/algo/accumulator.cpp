// =============================================================================
// fq-stat - Accumulator Implementation
// =============================================================================

#include "fqs/algo/accumulator.h"

#include <algorithm>

#include <fmt/format.h>

namespace fqs::algo {

// =============================================================================
// AccumulatorConfig
// =============================================================================

VoidResult AccumulatorConfig::validate() const {
    if (sampleStride == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "sample stride must be at least 1");
    }
    if (gcReservoirCap == 0 || qualityReservoirCap == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "reservoir caps must be at least 1");
    }
    if (profilePositions > kMaxProfilePositions) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("profile positions must not exceed {}, got {}",
                                         kMaxProfilePositions, profilePositions));
    }
    return makeVoidSuccess();
}

// =============================================================================
// Accumulator
// =============================================================================

Accumulator::Accumulator(AccumulatorConfig config)
    : config_(config), reservoir_(config.gcReservoirCap, config.qualityReservoirCap) {
    if (config_.profilePositions > 0) {
        profile_.emplace(config_.profilePositions);
    }
}

void Accumulator::fold(const ValidatedObservation& obs) {
    // Zero-based index of this read among validated reads
    const RecordCount index = stats_.count;

    stats_.update(obs);
    histograms_.update(obs);
    if (profile_) {
        profile_->update(obs.sequence, obs.scores);
    }

    if (config_.sampleStride > 0 && index % config_.sampleStride == 0) {
        sample(obs);
    }
}

void Accumulator::sample(const ValidatedObservation& obs) {
    if (reservoir_.full()) {
        return;
    }
    reservoir_.addGc(obs.gcPercent);
    const std::size_t take = std::min(config_.qualitySamplePositions, obs.scores.size());
    reservoir_.addQualities(obs.scores.first(take));
}

ChunkResult Accumulator::snapshot(std::string sourceIdentifier,
                                  const io::DiscardCounts& discards) const {
    ChunkResult result;
    result.sourceIdentifier = std::move(sourceIdentifier);
    result.stats = stats_;
    result.histograms = histograms_;
    result.positionProfile = profile_;
    result.reservoir = reservoir_;
    result.discards = discards;
    result.chunkCount = 1;
    return result;
}

}  // namespace fqs::algo
