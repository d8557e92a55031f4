// =============================================================================
// fq-stat - Running Statistics and Histograms Implementation
// =============================================================================

#include "fqs/algo/running_stats.h"

#include <algorithm>
#include <cmath>
#include <functional>

namespace fqs::algo {

namespace {

std::optional<double> ratio(double numerator, RecordCount denominator) noexcept {
    if (denominator == 0) {
        return std::nullopt;
    }
    return numerator / static_cast<double>(denominator);
}

std::optional<double> populationStdDev(double sum, double sumSq, RecordCount n) noexcept {
    if (n == 0) {
        return std::nullopt;
    }
    const double mean = sum / static_cast<double>(n);
    const double variance = sumSq / static_cast<double>(n) - mean * mean;
    // Cancellation can leave a tiny negative residue for constant inputs
    return std::sqrt(std::max(variance, 0.0));
}

std::optional<int> setValue(int value, int sentinel) noexcept {
    if (value == sentinel) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

// =============================================================================
// RunningStats
// =============================================================================

void RunningStats::update(const ValidatedObservation& obs) noexcept {
    const auto length = static_cast<double>(obs.length());
    const int lengthValue = static_cast<int>(obs.length());

    ++count;
    sumLength += length;
    sumSqLength += length * length;
    sumGC += obs.gcPercent;
    sumSqGC += obs.gcPercent * obs.gcPercent;
    minLength = std::min(minLength, lengthValue);
    maxLength = std::max(maxLength, lengthValue);

    std::uint64_t readQualitySum = 0;
    for (PhredScore score : obs.scores) {
        const int q = score;
        readQualitySum += score;
        sumSqQuality += static_cast<double>(q * q);
        minQuality = std::min(minQuality, q);
        maxQuality = std::max(maxQuality, q);
        if (q >= kQ20Threshold) {
            ++q20Bases;
        }
        if (q >= kQ30Threshold) {
            ++q30Bases;
        }
    }
    sumQuality += static_cast<double>(readQualitySum);
    totalBases += obs.scores.size();

    if (!obs.scores.empty()) {
        sumReadMeanQuality +=
            static_cast<double>(readQualitySum) / static_cast<double>(obs.scores.size());
    }

    nBases += obs.nCount;
    if (obs.nCount > 0) {
        ++readsWithN;
    }
}

void RunningStats::merge(const RunningStats& other) noexcept {
    count += other.count;
    sumLength += other.sumLength;
    sumSqLength += other.sumSqLength;
    sumGC += other.sumGC;
    sumSqGC += other.sumSqGC;
    sumQuality += other.sumQuality;
    sumSqQuality += other.sumSqQuality;
    sumReadMeanQuality += other.sumReadMeanQuality;
    minLength = std::min(minLength, other.minLength);
    maxLength = std::max(maxLength, other.maxLength);
    minQuality = std::min(minQuality, other.minQuality);
    maxQuality = std::max(maxQuality, other.maxQuality);
    totalBases += other.totalBases;
    nBases += other.nBases;
    readsWithN += other.readsWithN;
    q20Bases += other.q20Bases;
    q30Bases += other.q30Bases;
}

std::optional<double> RunningStats::meanLength() const noexcept {
    return ratio(sumLength, count);
}

std::optional<double> RunningStats::meanGC() const noexcept {
    return ratio(sumGC, count);
}

std::optional<double> RunningStats::meanQuality() const noexcept {
    return ratio(sumQuality, totalBases);
}

std::optional<double> RunningStats::meanReadQuality() const noexcept {
    return ratio(sumReadMeanQuality, count);
}

std::optional<double> RunningStats::lengthStdDev() const noexcept {
    return populationStdDev(sumLength, sumSqLength, count);
}

std::optional<double> RunningStats::gcStdDev() const noexcept {
    return populationStdDev(sumGC, sumSqGC, count);
}

std::optional<double> RunningStats::qualityStdDev() const noexcept {
    return populationStdDev(sumQuality, sumSqQuality, totalBases);
}

std::optional<int> RunningStats::minLengthValue() const noexcept {
    return setValue(minLength, kUnsetMin);
}

std::optional<int> RunningStats::maxLengthValue() const noexcept {
    return setValue(maxLength, kUnsetMax);
}

std::optional<int> RunningStats::minQualityValue() const noexcept {
    return setValue(minQuality, kUnsetMin);
}

std::optional<int> RunningStats::maxQualityValue() const noexcept {
    return setValue(maxQuality, kUnsetMax);
}

std::optional<double> RunningStats::q20Fraction() const noexcept {
    return ratio(static_cast<double>(q20Bases), totalBases);
}

std::optional<double> RunningStats::q30Fraction() const noexcept {
    return ratio(static_cast<double>(q30Bases), totalBases);
}

std::optional<double> RunningStats::nFraction() const noexcept {
    return ratio(static_cast<double>(nBases), totalBases);
}

// =============================================================================
// Histograms
// =============================================================================

void Histograms::update(const ValidatedObservation& obs) noexcept {
    for (PhredScore score : obs.scores) {
        ++quality[score];
    }

    auto gcBin = static_cast<std::size_t>(std::lround(obs.gcPercent));
    ++gc[std::min(gcBin, kGcHistogramBins - 1)];

    ++length[lengthBin(obs.length())];
}

void Histograms::merge(const Histograms& other) noexcept {
    std::transform(quality.begin(), quality.end(), other.quality.begin(), quality.begin(),
                   std::plus<>{});
    std::transform(gc.begin(), gc.end(), other.gc.begin(), gc.begin(), std::plus<>{});
    std::transform(length.begin(), length.end(), other.length.begin(), length.begin(),
                   std::plus<>{});
}

std::optional<int> Histograms::medianQuality() const noexcept {
    return histogramQuantile(quality, 0.5);
}

std::optional<int> Histograms::medianLength() const noexcept {
    return histogramQuantile(length, 0.5);
}

}  // namespace fqs::algo
