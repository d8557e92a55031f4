// =============================================================================
// fq-stat - Common Type Definitions
// =============================================================================
// Core type aliases, constants and small enums shared by every module.
//
// This module defines:
// - PhredScore, RecordCount: Type aliases for observations and counters
// - Default limits for position profiles, sampling and histograms
// - Nucleotide: Enum indexing the per-position composition table
// - recommendedThreadCount(): worker pool sizing helper
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef FQS_COMMON_TYPES_H
#define FQS_COMMON_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace fqs {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Decoded Phred quality score (0-93 for Phred+33).
using PhredScore = std::uint8_t;

/// @brief Counter type for records, bases and histogram bins.
using RecordCount = std::uint64_t;

// =============================================================================
// Quality Encoding Constants
// =============================================================================

/// @brief ASCII offset of the Phred+33 ("Sanger") encoding.
inline constexpr int kPhredOffset = 33;

/// @brief Lowest accepted quality character code ('!').
inline constexpr int kMinQualityCharCode = 33;

/// @brief Highest accepted quality character code ('~').
inline constexpr int kMaxQualityCharCode = 126;

/// @brief Highest Phred score representable in Phred+33.
inline constexpr int kMaxPhredScore = kMaxQualityCharCode - kPhredOffset;  // 93

/// @brief Number of distinct Phred scores (0..93).
inline constexpr std::size_t kPhredScoreCount = static_cast<std::size_t>(kMaxPhredScore) + 1;

/// @brief Phred threshold for "Q20" bases (99% base-call accuracy).
inline constexpr int kQ20Threshold = 20;

/// @brief Phred threshold for "Q30" bases (99.9% base-call accuracy).
inline constexpr int kQ30Threshold = 30;

// =============================================================================
// Accumulation Defaults
// =============================================================================

/// @brief Default number of leading base positions kept in the position profile.
inline constexpr std::size_t kDefaultProfilePositions = 100;

/// @brief Upper bound accepted for the position profile size.
inline constexpr std::size_t kMaxProfilePositions = 100'000;

/// @brief Default sampling stride (every Nth validated record is sampled).
inline constexpr std::size_t kDefaultSampleStride = 100;

/// @brief Default per-chunk cap on each sample buffer.
inline constexpr std::size_t kDefaultChunkReservoirCap = 1'000;

/// @brief Default cap on each sample buffer after a reduction.
inline constexpr std::size_t kDefaultCombinedReservoirCap = 10'000;

/// @brief Default number of leading quality scores taken from a sampled record.
inline constexpr std::size_t kDefaultQualitySamplePositions = 10;

/// @brief Number of GC-percent histogram bins (0..100, rounded).
inline constexpr std::size_t kGcHistogramBins = 101;

/// @brief Number of read-length histogram bins.
/// @note The last bin collects every read of length >= kLengthHistogramBins - 1.
inline constexpr std::size_t kLengthHistogramBins = 1'024;

// =============================================================================
// Nucleotide Enumeration
// =============================================================================

/// @brief Column index of the per-position composition table.
enum class Nucleotide : std::uint8_t {
    kA = 0,
    kC = 1,
    kG = 2,
    kT = 3,
    kN = 4
};

/// @brief Number of tracked nucleotide classes.
inline constexpr std::size_t kNucleotideCount = 5;

/// @brief Map a base character (any case) to its composition column.
/// @return The column, or nullopt for characters outside {A,C,G,T,N}.
[[nodiscard]] constexpr std::optional<Nucleotide> nucleotideFromChar(char c) noexcept {
    switch (c) {
        case 'A':
        case 'a':
            return Nucleotide::kA;
        case 'C':
        case 'c':
            return Nucleotide::kC;
        case 'G':
        case 'g':
            return Nucleotide::kG;
        case 'T':
        case 't':
            return Nucleotide::kT;
        case 'N':
        case 'n':
            return Nucleotide::kN;
        default:
            return std::nullopt;
    }
}

/// @brief Upper-case character for a composition column.
[[nodiscard]] constexpr char nucleotideToChar(Nucleotide n) noexcept {
    constexpr std::array<char, kNucleotideCount> kChars{'A', 'C', 'G', 'T', 'N'};
    return kChars[static_cast<std::size_t>(n)];
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Recommended worker count for the current machine.
/// @return hardware_concurrency() capped at 32, or 4 if unknown.
[[nodiscard]] std::size_t recommendedThreadCount() noexcept;

}  // namespace fqs

#endif  // FQS_COMMON_TYPES_H
