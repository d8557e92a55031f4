// =============================================================================
// fq-stat - Quality Decoder
// =============================================================================
// Phred+33 decoding of quality strings.
//
// Each quality character c maps to score c - 33. Only codes 33..126 are
// accepted, giving scores 0..93. A character outside that range rejects the
// whole record (RejectReason::kDecodeError); no partial decode is exposed.
// =============================================================================

#ifndef FQS_IO_QUALITY_DECODER_H
#define FQS_IO_QUALITY_DECODER_H

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "fqs/common/error.h"
#include "fqs/common/types.h"

namespace fqs::io {

// =============================================================================
// Single-character Conversion
// =============================================================================

/// @brief Check if a character is a valid Phred+33 quality character.
[[nodiscard]] constexpr bool isValidQualityChar(char c) noexcept {
    const int code = static_cast<unsigned char>(c);
    return code >= kMinQualityCharCode && code <= kMaxQualityCharCode;
}

/// @brief Decode one Phred+33 character.
/// @return The score, or nullopt if the character is out of range.
[[nodiscard]] constexpr std::optional<PhredScore> phredFromChar(char c) noexcept {
    if (!isValidQualityChar(c)) {
        return std::nullopt;
    }
    return static_cast<PhredScore>(static_cast<unsigned char>(c) - kPhredOffset);
}

/// @brief Encode a Phred score as a Phred+33 character (score clamped to 0..93).
[[nodiscard]] constexpr char phredToChar(int score) noexcept {
    if (score < 0) {
        score = 0;
    } else if (score > kMaxPhredScore) {
        score = kMaxPhredScore;
    }
    return static_cast<char>(score + kPhredOffset);
}

// =============================================================================
// QualityDecoder Class
// =============================================================================

/// @brief Position and value of the first undecodable quality character.
struct DecodeFailure {
    std::size_t position = 0;
    char character = '\0';
};

/// @brief Decodes quality strings into a reusable score buffer.
///
/// Thread Safety:
/// - Not thread-safe; one decoder per chunk and worker.
class QualityDecoder {
public:
    QualityDecoder() = default;

    /// @brief Decode a whole quality string.
    /// @return View of the decoded scores, valid until the next decode() call,
    ///         or the first invalid character.
    [[nodiscard]] Result<std::span<const PhredScore>, DecodeFailure> decode(
        std::string_view quality);

private:
    std::vector<PhredScore> scores_;
};

}  // namespace fqs::io

#endif  // FQS_IO_QUALITY_DECODER_H
