// =============================================================================
// fq-stat - Quality Decoder Implementation
// =============================================================================

#include "fqs/io/quality_decoder.h"

namespace fqs::io {

Result<std::span<const PhredScore>, DecodeFailure> QualityDecoder::decode(
    std::string_view quality) {
    scores_.resize(quality.size());

    for (std::size_t i = 0; i < quality.size(); ++i) {
        auto score = phredFromChar(quality[i]);
        if (!score) {
            return std::unexpected(DecodeFailure{i, quality[i]});
        }
        scores_[i] = *score;
    }

    return std::span<const PhredScore>(scores_.data(), scores_.size());
}

}  // namespace fqs::io
