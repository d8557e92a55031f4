// =============================================================================
// fq-stat - TBB Chunk Pipeline
// =============================================================================
// Runs one ChunkProcessor per chunk on a bounded oneTBB worker pool and folds
// the results into a CombinedResult as they complete.
//
// Execution model:
// 1. Chunk tasks (Parallel) - each task owns its ChunkProcessor; no mutable
//    state is shared between tasks
// 2. Completion queue - tbb::concurrent_bounded_queue; workers block when it
//    is full
// 3. Reducer (Serial, calling thread) - folds successes in arrival order
//
// Cancellation: once more than maxChunkFailures chunks have failed, or
// cancel() is called, tasks that have not started are skipped and running
// tasks stop at their next poll. Cancelled chunks contribute nothing.
// =============================================================================

#ifndef FQS_PIPELINE_PIPELINE_H
#define FQS_PIPELINE_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "fqs/algo/chunk_result.h"
#include "fqs/algo/reducer.h"
#include "fqs/common/error.h"
#include "fqs/pipeline/chunk_processor.h"

namespace fqs::pipeline {

// =============================================================================
// Forward Declarations
// =============================================================================

class QcPipelineImpl;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default capacity of the completion queue.
inline constexpr std::size_t kDefaultQueueCapacity = 16;

/// @brief Default number of failed chunks tolerated before the run is cancelled.
inline constexpr std::size_t kDefaultMaxChunkFailures = 3;

// =============================================================================
// Chunk Sources
// =============================================================================

/// @brief A named chunk and a way to open its byte stream.
struct ChunkSource {
    std::string sourceIdentifier;

    /// @brief Opens the chunk; may throw FQSException (e.g. IOError).
    std::function<std::unique_ptr<std::istream>()> open;

    /// @brief Plain or gzip file; the path is the identifier.
    [[nodiscard]] static ChunkSource fromFile(const std::filesystem::path& path);

    /// @brief In-memory FASTQ text.
    [[nodiscard]] static ChunkSource fromText(std::string sourceIdentifier, std::string text);
};

/// @brief A chunk that failed and was excluded from the combined result.
struct ChunkFailure {
    std::string sourceIdentifier;
    Error error;
};

// =============================================================================
// Statistics and Progress
// =============================================================================

/// @brief Statistics collected during a run.
struct PipelineStats {
    std::size_t totalChunks = 0;
    std::size_t succeededChunks = 0;
    std::size_t failedChunks = 0;
    std::size_t cancelledChunks = 0;

    /// @brief Validated reads across succeeded chunks.
    std::uint64_t totalReads = 0;

    /// @brief Discarded records across succeeded chunks.
    std::uint64_t discardedRecords = 0;

    std::uint64_t processingTimeMs = 0;
    std::size_t threadsUsed = 0;

    /// @brief Reads per second.
    [[nodiscard]] double throughputReadsPerSec() const noexcept {
        if (processingTimeMs == 0) return 0.0;
        return static_cast<double>(totalReads) * 1000.0 / static_cast<double>(processingTimeMs);
    }
};

/// @brief Progress information for callbacks.
struct ProgressInfo {
    std::size_t chunksCompleted = 0;
    std::size_t totalChunks = 0;
    std::uint64_t readsProcessed = 0;
    std::uint64_t elapsedMs = 0;

    /// @brief Get progress ratio (0.0-1.0).
    [[nodiscard]] double ratio() const noexcept {
        if (totalChunks == 0) return 0.0;
        return static_cast<double>(chunksCompleted) / static_cast<double>(totalChunks);
    }
};

/// @brief Progress callback, invoked on the calling thread after each chunk.
/// @return true to continue, false to cancel
using ProgressCallback = std::function<bool(const ProgressInfo& info)>;

// =============================================================================
// Configuration and Report
// =============================================================================

/// @brief Configuration for a pipeline run.
struct PipelineConfig {
    /// @brief Number of threads (0 = auto-detect).
    std::size_t numThreads = 0;

    /// @brief Completion queue capacity (backpressure on workers).
    std::size_t queueCapacity = kDefaultQueueCapacity;

    /// @brief Failed chunks tolerated; one more cancels the run.
    std::size_t maxChunkFailures = kDefaultMaxChunkFailures;

    ChunkProcessorConfig processor;
    algo::ReducerConfig reducer;

    /// @brief Progress callback (optional).
    ProgressCallback progressCallback;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Thread count after resolving 0 to the recommended count.
    [[nodiscard]] std::size_t effectiveThreads() const noexcept;
};

/// @brief Outcome of a completed run.
struct PipelineReport {
    algo::CombinedResult combined;

    /// @brief Chunks that failed but stayed under the failure threshold.
    std::vector<ChunkFailure> failures;

    PipelineStats stats;
};

// =============================================================================
// QcPipeline Class
// =============================================================================

/// @brief Parallel QC over a set of chunks.
///
/// Usage:
/// @code
/// QcPipeline pipeline(config);
/// auto report = pipeline.runFiles(paths);
/// if (report) {
///     auto meanQ = report->combined.meanQuality();
/// }
/// @endcode
class QcPipeline {
public:
    explicit QcPipeline(PipelineConfig config = {});
    ~QcPipeline();

    // Non-copyable, movable
    QcPipeline(const QcPipeline&) = delete;
    QcPipeline& operator=(const QcPipeline&) = delete;
    QcPipeline(QcPipeline&&) noexcept;
    QcPipeline& operator=(QcPipeline&&) noexcept;

    /// @brief Process chunks and reduce them.
    /// @return Report, or kCancelled (failure threshold or cancel()),
    ///         kEmptyInput (no chunk succeeded), kInvalidArgument, kInvalidState.
    [[nodiscard]] Result<PipelineReport> run(std::span<const ChunkSource> chunks);

    /// @brief Process files (plain or gzip) and reduce them.
    [[nodiscard]] Result<PipelineReport> runFiles(std::span<const std::filesystem::path> paths);

    /// @brief Cancel a running pipeline (callable from any thread).
    /// @note A cancel issued while no run is active is kept until the next
    ///       run starts, which then returns kCancelled.
    void cancel() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    /// @brief Whether a cancel is pending or the last run ended cancelled.
    [[nodiscard]] bool isCancelled() const noexcept;

    /// @brief Statistics of the last run, including a cancelled one.
    [[nodiscard]] const PipelineStats& stats() const noexcept;

    /// @brief Chunk failures of the last run, including a cancelled one.
    [[nodiscard]] const std::vector<ChunkFailure>& failures() const noexcept;

    [[nodiscard]] const PipelineConfig& config() const noexcept;

private:
    std::unique_ptr<QcPipelineImpl> impl_;
};

}  // namespace fqs::pipeline

#endif  // FQS_PIPELINE_PIPELINE_H
