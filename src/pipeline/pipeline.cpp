// =============================================================================
// fq-stat - TBB Chunk Pipeline Implementation
// =============================================================================

#include "fqs/pipeline/pipeline.h"

#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>

#include <fmt/format.h>
#include <tbb/concurrent_queue.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include "fqs/common/logger.h"
#include "fqs/io/compressed_stream.h"

namespace fqs::pipeline {

// =============================================================================
// ChunkSource Implementation
// =============================================================================

ChunkSource ChunkSource::fromFile(const std::filesystem::path& path) {
    ChunkSource source;
    source.sourceIdentifier = path.string();
    source.open = [path]() -> std::unique_ptr<std::istream> { return io::openInputFile(path); };
    return source;
}

ChunkSource ChunkSource::fromText(std::string sourceIdentifier, std::string text) {
    ChunkSource source;
    source.sourceIdentifier = std::move(sourceIdentifier);
    auto shared = std::make_shared<const std::string>(std::move(text));
    source.open = [shared]() -> std::unique_ptr<std::istream> {
        return std::make_unique<std::istringstream>(*shared);
    };
    return source;
}

// =============================================================================
// PipelineConfig Implementation
// =============================================================================

VoidResult PipelineConfig::validate() const {
    if (queueCapacity == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Queue capacity must be > 0");
    }
    if (auto result = processor.validate(); !result) {
        return result;
    }
    return reducer.validate();
}

std::size_t PipelineConfig::effectiveThreads() const noexcept {
    return numThreads > 0 ? numThreads : recommendedThreadCount();
}

// =============================================================================
// QcPipelineImpl
// =============================================================================

class QcPipelineImpl {
public:
    explicit QcPipelineImpl(PipelineConfig config) : config_(std::move(config)) {}

    Result<PipelineReport> run(std::span<const ChunkSource> chunks) {
        if (auto result = config_.validate(); !result) {
            return std::unexpected(result.error());
        }
        if (running_.exchange(true)) {
            return makeError<PipelineReport>(ErrorCode::kInvalidState,
                                             "Pipeline is already running");
        }

        // A cancel() issued while idle is kept and stops this run
        lastRunCancelled_.store(false, std::memory_order_release);
        stats_ = PipelineStats{};
        failures_.clear();

        auto result = execute(chunks);
        lastRunCancelled_.store(cancelled_.exchange(false, std::memory_order_acq_rel),
                                std::memory_order_release);
        running_.store(false);
        return result;
    }

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] bool isCancelled() const noexcept {
        return cancelRequested() || lastRunCancelled_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const PipelineStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const std::vector<ChunkFailure>& failures() const noexcept { return failures_; }
    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    struct ChunkOutcome {
        std::size_t index = 0;
        Result<algo::ChunkResult> result;
    };

    using OutcomeQueue = tbb::concurrent_bounded_queue<ChunkOutcome>;

    /// @brief Joins the producer if the consumer loop unwinds early.
    /// Outstanding tasks are cancelled and their outcomes drained so none
    /// stays blocked on the bounded queue.
    class ProducerGuard {
    public:
        ProducerGuard(QcPipelineImpl& owner, std::thread& producer,
                      const std::atomic<bool>& producerDone, OutcomeQueue& completions)
            : owner_(owner), producer_(producer), producerDone_(producerDone),
              completions_(completions) {}

        ~ProducerGuard() {
            if (!producer_.joinable()) {
                return;
            }
            owner_.cancel();
            ChunkOutcome discarded;
            while (!producerDone_.load(std::memory_order_acquire)) {
                if (!completions_.try_pop(discarded)) {
                    std::this_thread::yield();
                }
            }
            producer_.join();
        }

        ProducerGuard(const ProducerGuard&) = delete;
        ProducerGuard& operator=(const ProducerGuard&) = delete;

    private:
        QcPipelineImpl& owner_;
        std::thread& producer_;
        const std::atomic<bool>& producerDone_;
        OutcomeQueue& completions_;
    };

    [[nodiscard]] bool cancelRequested() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    Result<PipelineReport> execute(std::span<const ChunkSource> chunks) {
        if (chunks.empty()) {
            return makeError<PipelineReport>(ErrorCode::kEmptyInput, "No chunks to process");
        }

        const auto startTime = std::chrono::steady_clock::now();
        const std::size_t threads = config_.effectiveThreads();
        stats_.totalChunks = chunks.size();
        stats_.threadsUsed = threads;

        FQS_LOG_DEBUG("Processing {} chunk(s) on {} thread(s)", chunks.size(), threads);

        OutcomeQueue completions;
        completions.set_capacity(static_cast<std::ptrdiff_t>(config_.queueCapacity));
        std::atomic<std::size_t> failureCount{0};

        auto processOne = [&](std::size_t index) {
            ChunkOutcome outcome;
            outcome.index = index;
            try {
                outcome.result = processChunk(chunks[index]);
            } catch (...) {
                // Non-standard exception types escape tryExecute
                outcome.result = makeError<algo::ChunkResult>(
                    ErrorCode::kChunkIOError,
                    fmt::format("{}: unknown exception while processing chunk",
                                chunks[index].sourceIdentifier));
            }
            if (!outcome.result && outcome.result.error().code() != ErrorCode::kCancelled) {
                const std::size_t failed = failureCount.fetch_add(1) + 1;
                if (failed > config_.maxChunkFailures && !cancelled_.exchange(true)) {
                    FQS_LOG_WARNING("{} chunk failure(s) exceed the limit of {}; cancelling",
                                    failed, config_.maxChunkFailures);
                }
            }
            completions.push(std::move(outcome));
        };

        // The producer thread joins the arena and waits on the task group, so
        // chunks make progress even when TBB has no worker threads to spare.
        tbb::task_arena arena(static_cast<int>(threads));
        tbb::task_group group;
        std::atomic<bool> producerDone{false};
        std::thread producer([&] {
            arena.execute([&] {
                for (std::size_t i = 0; i < chunks.size(); ++i) {
                    group.run([&processOne, i] { processOne(i); });
                }
                group.wait();
            });
            producerDone.store(true, std::memory_order_release);
        });
        ProducerGuard guard(*this, producer, producerDone, completions);

        algo::Reducer reducer(config_.reducer);
        for (std::size_t received = 0; received < chunks.size(); ++received) {
            ChunkOutcome outcome;
            completions.pop(outcome);
            collect(std::move(outcome), chunks, reducer);
            reportProgress(received + 1, startTime);
        }
        producer.join();

        stats_.processingTimeMs = elapsedMs(startTime);

        if (cancelRequested()) {
            return makeError<PipelineReport>(
                ErrorCode::kCancelled,
                fmt::format("Run cancelled: {} chunk(s) succeeded, {} failed, {} cancelled",
                            stats_.succeededChunks, stats_.failedChunks,
                            stats_.cancelledChunks));
        }
        if (reducer.empty()) {
            return makeError<PipelineReport>(
                ErrorCode::kEmptyInput,
                fmt::format("No chunk succeeded ({} failed)", stats_.failedChunks));
        }

        auto combined = reducer.finish();
        if (!combined) {
            return std::unexpected(combined.error());
        }

        FQS_LOG_INFO("QC complete: {} chunk(s), {} reads, {} discarded, {} failed chunk(s), {} ms",
                     stats_.succeededChunks, stats_.totalReads, stats_.discardedRecords,
                     stats_.failedChunks, stats_.processingTimeMs);

        PipelineReport report;
        report.combined = std::move(*combined);
        report.failures = failures_;
        report.stats = stats_;
        return report;
    }

    Result<algo::ChunkResult> processChunk(const ChunkSource& chunk) {
        if (cancelRequested()) {
            return makeError<algo::ChunkResult>(
                ErrorCode::kCancelled,
                fmt::format("{}: skipped after cancellation", chunk.sourceIdentifier));
        }

        auto stream = tryExecute([&] {
            if (!chunk.open) {
                throw InvalidArgumentError("chunk source has no opener");
            }
            auto opened = chunk.open();
            if (!opened) {
                throw IOError("chunk source returned no stream");
            }
            return opened;
        });
        if (!stream) {
            return makeError<algo::ChunkResult>(
                ErrorCode::kChunkIOError,
                fmt::format("{}: {}", chunk.sourceIdentifier, stream.error().message()));
        }

        ChunkProcessor processor(config_.processor);
        return processor.process(**stream, chunk.sourceIdentifier, &cancelled_);
    }

    void collect(ChunkOutcome outcome, std::span<const ChunkSource> chunks,
                 algo::Reducer& reducer) {
        const std::string& id = chunks[outcome.index].sourceIdentifier;

        if (!outcome.result) {
            if (outcome.result.error().code() == ErrorCode::kCancelled) {
                ++stats_.cancelledChunks;
                return;
            }
            FQS_LOG_WARNING("Chunk failed: {}", outcome.result.error().message());
            recordFailure(id, outcome.result.error());
            return;
        }

        const RecordCount reads = outcome.result->stats.count;
        const RecordCount discarded = outcome.result->discards.total();
        auto added = tryExecute([&] { reducer.add(std::move(*outcome.result)); });
        if (!added) {
            recordFailure(id, added.error());
            return;
        }

        ++stats_.succeededChunks;
        stats_.totalReads += reads;
        stats_.discardedRecords += discarded;
    }

    void recordFailure(const std::string& id, const Error& error) {
        ++stats_.failedChunks;
        failures_.push_back(ChunkFailure{id, error});
    }

    void reportProgress(std::size_t completed,
                        std::chrono::steady_clock::time_point startTime) {
        if (!config_.progressCallback) {
            return;
        }

        ProgressInfo info;
        info.chunksCompleted = completed;
        info.totalChunks = stats_.totalChunks;
        info.readsProcessed = stats_.totalReads;
        info.elapsedMs = elapsedMs(startTime);

        auto keepGoing = invokeProgress(info);
        if (!keepGoing) {
            FQS_LOG_WARNING("Progress callback failed: {}", keepGoing.error().message());
            cancel();
        } else if (!*keepGoing) {
            cancel();
        }
    }

    Result<bool> invokeProgress(const ProgressInfo& info) const {
        try {
            return tryExecute([&] { return config_.progressCallback(info); });
        } catch (...) {
            // Non-standard exception types escape tryExecute
            return makeError<bool>(ErrorCode::kInvalidState,
                                   "progress callback threw an unknown exception");
        }
    }

    static std::uint64_t elapsedMs(std::chrono::steady_clock::time_point startTime) {
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startTime)
                .count());
    }

    PipelineConfig config_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};

    /// @brief Whether the finished run ended cancelled.
    std::atomic<bool> lastRunCancelled_{false};
    PipelineStats stats_;
    std::vector<ChunkFailure> failures_;
};

// =============================================================================
// QcPipeline Implementation
// =============================================================================

QcPipeline::QcPipeline(PipelineConfig config)
    : impl_(std::make_unique<QcPipelineImpl>(std::move(config))) {}

QcPipeline::~QcPipeline() = default;

QcPipeline::QcPipeline(QcPipeline&&) noexcept = default;
QcPipeline& QcPipeline::operator=(QcPipeline&&) noexcept = default;

Result<PipelineReport> QcPipeline::run(std::span<const ChunkSource> chunks) {
    return impl_->run(chunks);
}

Result<PipelineReport> QcPipeline::runFiles(std::span<const std::filesystem::path> paths) {
    std::vector<ChunkSource> sources;
    sources.reserve(paths.size());
    for (const auto& path : paths) {
        sources.push_back(ChunkSource::fromFile(path));
    }
    return impl_->run(sources);
}

void QcPipeline::cancel() noexcept {
    impl_->cancel();
}

bool QcPipeline::isRunning() const noexcept {
    return impl_->isRunning();
}

bool QcPipeline::isCancelled() const noexcept {
    return impl_->isCancelled();
}

const PipelineStats& QcPipeline::stats() const noexcept {
    return impl_->stats();
}

const std::vector<ChunkFailure>& QcPipeline::failures() const noexcept {
    return impl_->failures();
}

const PipelineConfig& QcPipeline::config() const noexcept {
    return impl_->config();
}

}  // namespace fqs::pipeline
