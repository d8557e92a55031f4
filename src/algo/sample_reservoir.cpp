// =============================================================================
// fq-stat - Sample Reservoir Implementation
// =============================================================================

#include "fqs/algo/sample_reservoir.h"

#include <algorithm>
#include <cmath>

namespace fqs::algo {

namespace {

template <typename T>
std::optional<double> sampleStdDev(const std::vector<T>& values) noexcept {
    if (values.size() < 2) {
        return std::nullopt;
    }
    double mean = 0.0;
    for (const T& v : values) {
        mean += static_cast<double>(v);
    }
    mean /= static_cast<double>(values.size());

    double squares = 0.0;
    for (const T& v : values) {
        const double d = static_cast<double>(v) - mean;
        squares += d * d;
    }
    return std::sqrt(squares / static_cast<double>(values.size() - 1));
}

}  // namespace

SampleReservoir::SampleReservoir(std::size_t gcCap, std::size_t qualityCap)
    : gcCap_(gcCap), qualityCap_(qualityCap) {}

void SampleReservoir::addGc(double gcPercent) {
    if (gc_.size() < gcCap_) {
        gc_.push_back(gcPercent);
    }
}

void SampleReservoir::addQualities(std::span<const PhredScore> scores) {
    const std::size_t room = qualityCap_ - std::min(quality_.size(), qualityCap_);
    const std::size_t take = std::min(room, scores.size());
    quality_.insert(quality_.end(), scores.begin(), scores.begin() + static_cast<std::ptrdiff_t>(take));
}

void SampleReservoir::assign(std::vector<double> gc, std::vector<PhredScore> quality) {
    thinUniformly(gc, gcCap_);
    thinUniformly(quality, qualityCap_);
    gc_ = std::move(gc);
    quality_ = std::move(quality);
}

std::optional<double> SampleReservoir::gcStdDev() const noexcept {
    return sampleStdDev(gc_);
}

std::optional<double> SampleReservoir::qualityStdDev() const noexcept {
    return sampleStdDev(quality_);
}

}  // namespace fqs::algo
