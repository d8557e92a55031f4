// =============================================================================
// fq-stat - Reducer Implementation
// =============================================================================

#include "fqs/algo/reducer.h"

#include <algorithm>

#include "fqs/common/logger.h"

namespace fqs::algo {

VoidResult ReducerConfig::validate() const {
    if (gcReservoirCap == 0 || qualityReservoirCap == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "combined reservoir caps must be at least 1");
    }
    return makeVoidSuccess();
}

Reducer::Reducer(ReducerConfig config) : config_(config) {}

void Reducer::add(ChunkResult result) {
    stats_.merge(result.stats);
    histograms_.merge(result.histograms);
    discards_.merge(result.discards);
    chunkCount_ += result.chunkCount;

    if (!result.positionProfile) {
        profileMissing_ = true;
        profile_.reset();
    } else if (!profileMissing_) {
        if (profile_) {
            profile_->merge(*result.positionProfile);
        } else {
            profile_ = std::move(result.positionProfile);
        }
    }

    summaries_.push_back(summarize(result));

    SamplePart part;
    part.sourceIdentifier = std::move(result.sourceIdentifier);
    part.gc = result.reservoir.gcSamples();
    part.quality = result.reservoir.qualitySamples();
    samples_.push_back(std::move(part));
}

Result<CombinedResult> Reducer::finish() const {
    if (auto valid = config_.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    if (summaries_.empty()) {
        return makeError<CombinedResult>(ErrorCode::kEmptyInput, "no chunk results to reduce");
    }

    CombinedResult combined;
    combined.stats = stats_;
    combined.histograms = histograms_;
    combined.positionProfile = profile_;
    combined.discards = discards_;
    combined.chunkCount = chunkCount_;

    combined.chunkSummaries = summaries_;
    std::stable_sort(combined.chunkSummaries.begin(), combined.chunkSummaries.end(),
                     [](const ChunkSummary& a, const ChunkSummary& b) {
                         return a.sourceIdentifier < b.sourceIdentifier;
                     });

    std::vector<const SamplePart*> ordered;
    ordered.reserve(samples_.size());
    std::size_t gcTotal = 0;
    std::size_t qualityTotal = 0;
    for (const auto& part : samples_) {
        ordered.push_back(&part);
        gcTotal += part.gc.size();
        qualityTotal += part.quality.size();
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const SamplePart* a, const SamplePart* b) {
                         return a->sourceIdentifier < b->sourceIdentifier;
                     });

    std::vector<double> gc;
    std::vector<PhredScore> quality;
    gc.reserve(gcTotal);
    quality.reserve(qualityTotal);
    for (const SamplePart* part : ordered) {
        gc.insert(gc.end(), part->gc.begin(), part->gc.end());
        quality.insert(quality.end(), part->quality.begin(), part->quality.end());
    }

    combined.reservoir = SampleReservoir(config_.gcReservoirCap, config_.qualityReservoirCap);
    combined.reservoir.assign(std::move(gc), std::move(quality));

    FQS_LOG_DEBUG("Reduced {} input(s) covering {} chunk(s): {} reads, {} discarded",
                  summaries_.size(), combined.chunkCount, combined.stats.count,
                  combined.discards.total());

    return combined;
}

Result<CombinedResult> Reducer::merge(std::span<const ChunkResult> results, ReducerConfig config) {
    Reducer reducer(config);
    for (const auto& result : results) {
        reducer.add(result);
    }
    return reducer.finish();
}

}  // namespace fqs::algo
