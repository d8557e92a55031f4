// =============================================================================
// fq-stat - Error Handling Framework Implementation
// =============================================================================

#include "fqs/common/error.h"

#include <sstream>

namespace fqs {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!source.empty()) {
        oss << "source: " << source;
        hasContent = true;
    }

    if (lineNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "line: " << *lineNumber;
        hasContent = true;
    }

    if (recordNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "record: " << *recordNumber;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// FQSException Implementation
// =============================================================================

void FQSException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kChunkIOError:
            throw ChunkIOError(message_);
        case ErrorCode::kEmptyInput:
            throw EmptyInputError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kDecompressionFailed:
            throw DecompressionError(message_);
        case ErrorCode::kCancelled:
            throw CancelledError(message_);
        default:
            break;
    }
    throw FQSException(code_, message_);
}

}  // namespace fqs
