// =============================================================================
// fq-stat - Validated Observation Implementation
// =============================================================================

#include "fqs/algo/observation.h"

namespace fqs::algo {

namespace {

struct BaseCounts {
    std::size_t gc = 0;
    std::size_t n = 0;
};

BaseCounts countBases(std::string_view sequence) noexcept {
    BaseCounts counts;
    for (char c : sequence) {
        switch (c) {
            case 'G':
            case 'g':
            case 'C':
            case 'c':
                ++counts.gc;
                break;
            case 'N':
            case 'n':
                ++counts.n;
                break;
            default:
                break;
        }
    }
    return counts;
}

double percentOf(std::size_t part, std::size_t whole) noexcept {
    if (whole == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

}  // namespace

double computeGcPercent(std::string_view sequence) noexcept {
    return percentOf(countBases(sequence).gc, sequence.size());
}

ValidatedObservation makeObservation(std::string_view sequence,
                                     std::span<const PhredScore> scores) noexcept {
    const BaseCounts counts = countBases(sequence);

    ValidatedObservation obs;
    obs.sequence = sequence;
    obs.scores = scores;
    obs.gcCount = counts.gc;
    obs.nCount = counts.n;
    obs.gcPercent = percentOf(counts.gc, sequence.size());
    return obs;
}

}  // namespace fqs::algo
