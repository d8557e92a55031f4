// =============================================================================
// fq-stat - Logger Module Implementation
// =============================================================================

#include "fqs/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace fqs::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};
std::atomic<bool> gInitialized{false};

/// @brief Set once shutdown() has stopped the backend thread.
std::atomic<bool> gShutdown{false};

std::mutex gInitMutex;

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

/// @brief Build the sinks named by @p config and register the logger.
/// @throws quill::QuillError if the log file cannot be opened.
quill::Logger* createLogger(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (!config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('w');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{}));
    }
    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));
    return loggerPtr;
}

}  // namespace

// =============================================================================
// Level Conversion Implementation
// =============================================================================

Level levelFromString(std::string_view levelStr) noexcept {
    const std::string lower = toLower(levelStr);

    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "info") {
        return Level::kInfo;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    if (lower == "critical" || lower == "fatal") {
        return Level::kCritical;
    }

    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
    }
    return "info";
}

// =============================================================================
// Logger Lifecycle
// =============================================================================

VoidResult init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (gInitialized.load(std::memory_order_acquire)) {
        return makeVoidSuccess();
    }
    if (gShutdown.load(std::memory_order_acquire)) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "logging cannot be restarted after shutdown");
    }
    if (config.logFile.empty() && !config.enableConsole) {
        return makeVoidError(ErrorCode::kInvalidArgument, "no log sink configured");
    }

    auto created = tryExecute([&config] { return createLogger(config); });
    if (!created) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to initialize logging: {}",
                                         created.error().message()));
    }

    gLogger.store(*created, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
    return makeVoidSuccess();
}

VoidResult init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    config.enableConsole = logFile.empty();
    return init(config);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* loggerPtr = logger(); loggerPtr != nullptr) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (!isInitialized()) {
        return;
    }

    quill::Logger* loggerPtr = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    gInitialized.store(false, std::memory_order_release);

    loggerPtr->flush_log();
    quill::Frontend::remove_logger(loggerPtr);
    quill::Backend::stop();
    gShutdown.store(true, std::memory_order_release);
}

}  // namespace fqs::log
