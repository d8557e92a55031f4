// =============================================================================
// fq-stat - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging (Quill is inherently thread-safe)
//
// The library never creates a logger by itself. Until the embedding
// application calls init(), the FQS_LOG_* macros are no-ops, so the core
// stays silent unless its caller opts into log output. Sinks are always
// chosen by the caller; a configuration naming none is rejected.
//
// The Quill backend thread is started once per process. After shutdown()
// logging stays off for the rest of the process.
//
// Usage:
//   if (auto ok = fqs::log::init("qc.log", fqs::log::Level::kInfo); !ok) { ... }
//   FQS_LOG_INFO("Merged {} chunks", 42);
// =============================================================================

#ifndef FQS_COMMON_LOGGER_H
#define FQS_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include "fqs/common/error.h"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace fqs::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stdout) output.
    bool enableConsole = false;

    /// @brief Logger name for identification.
    std::string loggerName = "fqs";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @return kInvalidArgument if no sink is enabled or logging was already shut
///         down, kIOError if the log file cannot be opened.
/// @note Calls made while a logger is active succeed without changing it.
[[nodiscard]] VoidResult init(const Config& config);

/// @brief Initialize the global logger writing to a file, or to the console
///        when @p logFile is empty.
[[nodiscard]] VoidResult init(std::string_view logFile, Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages, releases the file sink and stops the
///       backend thread. Later init() calls fail.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace fqs::log

// =============================================================================
// Convenience Macros
// =============================================================================
// Each macro resolves the global logger once and skips the call entirely
// when logging has not been initialized.

#define FQS_LOG_IMPL(quillMacro, fmt, ...)                                    \
    do {                                                                      \
        if (quill::Logger* fqsLogger = ::fqs::log::logger(); fqsLogger) {      \
            quillMacro(fqsLogger, fmt __VA_OPT__(, ) __VA_ARGS__);            \
        }                                                                     \
    } while (false)

/// @brief Log a trace message.
#define FQS_LOG_TRACE(fmt, ...) FQS_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define FQS_LOG_DEBUG(fmt, ...) FQS_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define FQS_LOG_INFO(fmt, ...) FQS_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define FQS_LOG_WARNING(fmt, ...) FQS_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define FQS_LOG_ERROR(fmt, ...) FQS_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define FQS_LOG_CRITICAL(fmt, ...) FQS_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // FQS_COMMON_LOGGER_H
