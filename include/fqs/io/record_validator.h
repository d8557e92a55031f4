// =============================================================================
// fq-stat - FASTQ Record Validator
// =============================================================================
// Structural validation of raw 4-line groups.
//
// Rules are checked in order and the first failure wins:
//   1. header starts with '@'                    -> kInvalidHeader
//   2. separator is exactly "+"                   -> kInvalidSeparator
//      (SeparatorPolicy::kAllowHeaderRepeat also accepts "+<header id>")
//   3. every base is one of ACGTN, any case       -> kInvalidBases
//   4. sequence and quality have equal length     -> kLengthMismatch
//
// Validation is pure and never throws; rejected records are tallied in a
// DiscardCounts owned by the caller.
// =============================================================================

#ifndef FQS_IO_RECORD_VALIDATOR_H
#define FQS_IO_RECORD_VALIDATOR_H

#include <cstdint>
#include <string_view>

#include "fqs/common/error.h"
#include "fqs/common/types.h"
#include "fqs/io/record_parser.h"

namespace fqs::io {

// =============================================================================
// Rejection Reasons
// =============================================================================

/// @brief Why a raw record was excluded from statistics.
enum class RejectReason : std::uint8_t {
    kInvalidHeader = 0,
    kInvalidSeparator = 1,
    kInvalidBases = 2,
    kLengthMismatch = 3,
    /// @brief Quality character outside Phred+33 range (see QualityDecoder).
    kDecodeError = 4
};

/// @brief Number of distinct rejection reasons.
inline constexpr std::size_t kRejectReasonCount = 5;

/// @brief Convert RejectReason to string representation.
[[nodiscard]] constexpr std::string_view rejectReasonToString(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::kInvalidHeader:
            return "invalid_header";
        case RejectReason::kInvalidSeparator:
            return "invalid_separator";
        case RejectReason::kInvalidBases:
            return "invalid_bases";
        case RejectReason::kLengthMismatch:
            return "length_mismatch";
        case RejectReason::kDecodeError:
            return "decode_error";
    }
    return "unknown";
}

// =============================================================================
// Discard Counters
// =============================================================================

/// @brief Per-reason tally of rejected records.
struct DiscardCounts {
    RecordCount invalidHeader = 0;
    RecordCount invalidSeparator = 0;
    RecordCount invalidBases = 0;
    RecordCount lengthMismatch = 0;
    RecordCount decodeError = 0;

    /// @brief Count one rejection.
    void record(RejectReason reason) noexcept {
        switch (reason) {
            case RejectReason::kInvalidHeader:
                ++invalidHeader;
                break;
            case RejectReason::kInvalidSeparator:
                ++invalidSeparator;
                break;
            case RejectReason::kInvalidBases:
                ++invalidBases;
                break;
            case RejectReason::kLengthMismatch:
                ++lengthMismatch;
                break;
            case RejectReason::kDecodeError:
                ++decodeError;
                break;
        }
    }

    /// @brief Count for a single reason.
    [[nodiscard]] RecordCount count(RejectReason reason) const noexcept {
        switch (reason) {
            case RejectReason::kInvalidHeader:
                return invalidHeader;
            case RejectReason::kInvalidSeparator:
                return invalidSeparator;
            case RejectReason::kInvalidBases:
                return invalidBases;
            case RejectReason::kLengthMismatch:
                return lengthMismatch;
            case RejectReason::kDecodeError:
                return decodeError;
        }
        return 0;
    }

    /// @brief Total rejected records.
    [[nodiscard]] RecordCount total() const noexcept {
        return invalidHeader + invalidSeparator + invalidBases + lengthMismatch + decodeError;
    }

    /// @brief Add another tally into this one.
    void merge(const DiscardCounts& other) noexcept {
        invalidHeader += other.invalidHeader;
        invalidSeparator += other.invalidSeparator;
        invalidBases += other.invalidBases;
        lengthMismatch += other.lengthMismatch;
        decodeError += other.decodeError;
    }

    bool operator==(const DiscardCounts&) const = default;
};

// =============================================================================
// Validated Record
// =============================================================================

/// @brief A record that passed structural validation.
/// @note Views into the RawRecord it was validated from; valid only while
///       that RawRecord is alive and unmodified.
struct Record {
    std::string_view header;
    std::string_view sequence;
    std::string_view separator;
    std::string_view quality;

    /// @brief Read length.
    [[nodiscard]] std::size_t length() const noexcept { return sequence.size(); }
};

// =============================================================================
// Validator Options
// =============================================================================

/// @brief Accepted forms of the separator line.
enum class SeparatorPolicy : std::uint8_t {
    /// @brief Only a bare "+" is accepted.
    kStrict = 0,

    /// @brief "+" alone, or "+" followed by the header text without '@'.
    kAllowHeaderRepeat = 1
};

/// @brief Configuration options for the record validator.
struct ValidatorOptions {
    /// @brief Separator line policy.
    SeparatorPolicy separatorPolicy = SeparatorPolicy::kStrict;
};

// =============================================================================
// RecordValidator Class
// =============================================================================

/// @brief Pure structural validator for raw 4-line groups.
class RecordValidator {
public:
    explicit RecordValidator(ValidatorOptions options = {}) : options_(options) {}

    /// @brief Validate a raw group.
    /// @return A Record viewing into @p raw, or the first failing rule.
    [[nodiscard]] Result<Record, RejectReason> validate(const RawRecord& raw) const noexcept;

    /// @brief Get the validator options.
    [[nodiscard]] const ValidatorOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] bool isValidSeparator(std::string_view separator,
                                        std::string_view header) const noexcept;

    ValidatorOptions options_;
};

/// @brief Check if every character is one of ACGTN (any case).
[[nodiscard]] bool isValidSequence(std::string_view sequence) noexcept;

}  // namespace fqs::io

#endif  // FQS_IO_RECORD_VALIDATOR_H
