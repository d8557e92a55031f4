// =============================================================================
// fq-stat - Error Handling Framework
// =============================================================================
// Error handling for the fq-stat library.
//
// This module provides:
// - ErrorCode enum for chunk-level and reduction-level failures
// - FQSException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Per-record problems (bad header, bad bases, ...) are NOT errors in this
// framework: they are counted as discards by the chunk processor. Only
// failures that abandon a whole chunk or a whole reduction surface here.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef FQS_COMMON_ERROR_H
#define FQS_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace fqs {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes for chunk-level and reduction-level failures.
enum class ErrorCode : std::uint8_t {
    /// @brief Invalid configuration or argument value.
    kInvalidArgument = 1,

    /// @brief Generic I/O error (file not found, permission denied, ...).
    kIOError = 2,

    /// @brief Stream read failure in the middle of a chunk.
    /// @note The partial state of the chunk is discarded.
    kChunkIOError = 3,

    /// @brief A reduction was requested over zero chunk results.
    kEmptyInput = 4,

    /// @brief Malformed serialized document.
    kFormatError = 5,

    /// @brief Operation was cancelled.
    kCancelled = 6,

    /// @brief Decompression of the input stream failed.
    kDecompressionFailed = 7,

    /// @brief Unsupported input format.
    kUnsupportedFormat = 8,

    /// @brief Invalid state for operation.
    kInvalidState = 9
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kChunkIOError:
            return "chunk I/O error";
        case ErrorCode::kEmptyInput:
            return "empty input";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
        case ErrorCode::kUnsupportedFormat:
            return "unsupported format";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Chunk source identifier (file path or caller-chosen name).
    std::string source;

    /// @brief Line number (1-based) where the error occurred, if known.
    std::optional<std::uint64_t> lineNumber;

    /// @brief Record (1-based) that was being read when the error occurred.
    std::optional<std::uint64_t> recordNumber;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with source identifier.
    explicit ErrorContext(std::string sourceId,
                          std::source_location loc = std::source_location::current())
        : source(std::move(sourceId)), location(loc) {}

    /// @brief Set the line number.
    /// @return Reference to this for method chaining.
    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    /// @brief Set the record number.
    /// @return Reference to this for method chaining.
    ErrorContext& withRecord(std::uint64_t record) {
        recordNumber = record;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all fq-stat errors.
/// @note Provides error code, message, and optional context.
class FQSException : public std::exception {
public:
    /// @brief Construct with error code and message.
    FQSException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    FQSException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~FQSException() override = default;

    FQSException(const FQSException&) = default;
    FQSException(FQSException&&) noexcept = default;
    FQSException& operator=(const FQSException&) = default;
    FQSException& operator=(FQSException&&) noexcept = default;

    /// @brief Get the formatted error message.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for invalid configuration or argument values.
class InvalidArgumentError : public FQSException {
public:
    explicit InvalidArgumentError(std::string message)
        : FQSException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : FQSException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors outside of chunk streaming.
/// @note Thrown for file not found, permission denied, write failures, etc.
class IOError : public FQSException {
public:
    /// @brief Construct with message.
    explicit IOError(std::string message)
        : FQSException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct with message and context.
    IOError(std::string message, ErrorContext context)
        : FQSException(ErrorCode::kIOError, std::move(message), std::move(context)) {}
};

/// @brief Exception for a stream failure in the middle of a chunk.
/// @note The chunk is abandoned as a whole; the core never retries it.
class ChunkIOError : public FQSException {
public:
    explicit ChunkIOError(std::string message)
        : FQSException(ErrorCode::kChunkIOError, std::move(message)) {}

    ChunkIOError(std::string message, ErrorContext context)
        : FQSException(ErrorCode::kChunkIOError, std::move(message), std::move(context)) {}
};

/// @brief Exception for a reduction over zero chunk results.
class EmptyInputError : public FQSException {
public:
    explicit EmptyInputError(std::string message)
        : FQSException(ErrorCode::kEmptyInput, std::move(message)) {}
};

/// @brief Exception for malformed serialized documents.
class FormatError : public FQSException {
public:
    explicit FormatError(std::string message)
        : FQSException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : FQSException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for decompression failures.
class DecompressionError : public FQSException {
public:
    explicit DecompressionError(std::string message)
        : FQSException(ErrorCode::kDecompressionFailed, std::move(message)) {}
};

/// @brief Exception raised when a cancellation request is observed.
class CancelledError : public FQSException {
public:
    explicit CancelledError(std::string message)
        : FQSException(ErrorCode::kCancelled, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an FQSException.
    explicit Error(const FQSException& ex) : code_(ex.code()), message_(ex.what()) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
/// @tparam T The success value type.
/// @tparam E The error type (defaults to Error).
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const FQSException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value of a Result or throw the matching exception.
/// @throws FQSException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if a VoidResult contains an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @note std::exception that is not an FQSException maps to kIOError.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<
    std::conditional_t<std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const FQSException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace fqs

#endif  // FQS_COMMON_ERROR_H
