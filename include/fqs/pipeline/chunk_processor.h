// =============================================================================
// fq-stat - Chunk Processor
// =============================================================================
// Drives RecordParser -> RecordValidator -> QualityDecoder -> Accumulator over
// one chunk and emits its ChunkResult.
//
// Malformed records are counted per reason and skipped. A stream failure
// abandons the whole chunk: no partial result is ever returned.
//
// Usage:
//   ChunkProcessor processor(config);
//   auto result = processor.processFile("reads_chunk_001.fastq.gz");
//   if (!result) { /* result.error().code() == ErrorCode::kChunkIOError */ }
// =============================================================================

#ifndef FQS_PIPELINE_CHUNK_PROCESSOR_H
#define FQS_PIPELINE_CHUNK_PROCESSOR_H

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>

#include "fqs/algo/accumulator.h"
#include "fqs/algo/chunk_result.h"
#include "fqs/common/error.h"
#include "fqs/io/record_validator.h"

namespace fqs::pipeline {

/// @brief Default number of records between cancellation checks.
inline constexpr std::size_t kDefaultCancelPollInterval = 1024;

/// @brief Configuration for one chunk's processing chain.
struct ChunkProcessorConfig {
    io::ValidatorOptions validator;
    algo::AccumulatorConfig accumulator;

    /// @brief Records processed between polls of the cancel flag.
    std::size_t cancelPollInterval = kDefaultCancelPollInterval;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Processes one chunk at a time.
///
/// Each call owns a fresh Accumulator, so a processor can be reused for
/// consecutive chunks. Not thread-safe; use one processor per worker.
class ChunkProcessor {
public:
    explicit ChunkProcessor(ChunkProcessorConfig config = {});

    /// @brief Process a stream bounded to one chunk.
    /// @param stream Input stream (plain FASTQ text).
    /// @param sourceIdentifier Identifier copied into the result.
    /// @param cancelFlag Optional flag polled between records.
    /// @return ChunkResult, or kChunkIOError / kCancelled / kInvalidArgument.
    [[nodiscard]] Result<algo::ChunkResult> process(std::istream& stream,
                                                    std::string sourceIdentifier,
                                                    const std::atomic<bool>* cancelFlag = nullptr);

    /// @brief Open a plain or gzip file and process it.
    /// @note The path is used as the source identifier.
    [[nodiscard]] Result<algo::ChunkResult> processFile(
        const std::filesystem::path& path, const std::atomic<bool>* cancelFlag = nullptr);

    [[nodiscard]] const ChunkProcessorConfig& config() const noexcept { return config_; }

private:
    /// @brief Throwing core of process().
    algo::ChunkResult run(std::istream& stream, std::string sourceIdentifier,
                          const std::atomic<bool>* cancelFlag);

    ChunkProcessorConfig config_;
};

}  // namespace fqs::pipeline

#endif  // FQS_PIPELINE_CHUNK_PROCESSOR_H
