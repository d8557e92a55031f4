// =============================================================================
// fq-stat - FASTQ Record Validator Implementation
// =============================================================================

#include "fqs/io/record_validator.h"

#include <algorithm>

namespace fqs::io {

Result<Record, RejectReason> RecordValidator::validate(const RawRecord& raw) const noexcept {
    if (raw.header.empty() || raw.header.front() != '@') {
        return std::unexpected(RejectReason::kInvalidHeader);
    }

    if (!isValidSeparator(raw.separator, raw.header)) {
        return std::unexpected(RejectReason::kInvalidSeparator);
    }

    if (!isValidSequence(raw.sequence)) {
        return std::unexpected(RejectReason::kInvalidBases);
    }

    if (raw.sequence.size() != raw.quality.size()) {
        return std::unexpected(RejectReason::kLengthMismatch);
    }

    return Record{raw.header, raw.sequence, raw.separator, raw.quality};
}

bool RecordValidator::isValidSeparator(std::string_view separator,
                                       std::string_view header) const noexcept {
    if (separator == "+") {
        return true;
    }
    if (options_.separatorPolicy != SeparatorPolicy::kAllowHeaderRepeat) {
        return false;
    }
    // "+" followed by the header without its leading '@'
    return separator.size() > 1 && separator.front() == '+' &&
           separator.substr(1) == header.substr(1);
}

bool isValidSequence(std::string_view sequence) noexcept {
    return std::all_of(sequence.begin(), sequence.end(),
                       [](char c) { return nucleotideFromChar(c).has_value(); });
}

}  // namespace fqs::io
