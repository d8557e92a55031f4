// =============================================================================
// fq-stat - Chunk Processor Implementation
// =============================================================================

#include "fqs/pipeline/chunk_processor.h"

#include <fmt/format.h>

#include "fqs/algo/observation.h"
#include "fqs/common/logger.h"
#include "fqs/io/compressed_stream.h"
#include "fqs/io/quality_decoder.h"
#include "fqs/io/record_parser.h"

namespace fqs::pipeline {

namespace {

bool cancelRequested(const std::atomic<bool>* flag) noexcept {
    return flag != nullptr && flag->load(std::memory_order_acquire);
}

/// @brief Map any chunk-level failure to a ChunkIOError, keeping cancellation.
Error asChunkError(const Error& error, const std::string& sourceIdentifier) {
    if (error.code() == ErrorCode::kCancelled || error.code() == ErrorCode::kChunkIOError ||
        error.code() == ErrorCode::kInvalidArgument) {
        return error;
    }
    return Error{ErrorCode::kChunkIOError,
                 fmt::format("{}: {}", sourceIdentifier, error.message())};
}

}  // namespace

VoidResult ChunkProcessorConfig::validate() const {
    if (cancelPollInterval == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "cancel poll interval must be at least 1");
    }
    return accumulator.validate();
}

ChunkProcessor::ChunkProcessor(ChunkProcessorConfig config) : config_(std::move(config)) {}

Result<algo::ChunkResult> ChunkProcessor::process(std::istream& stream,
                                                  std::string sourceIdentifier,
                                                  const std::atomic<bool>* cancelFlag) {
    if (auto valid = config_.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    auto result = tryExecute([&] { return run(stream, sourceIdentifier, cancelFlag); });
    if (!result) {
        return std::unexpected(asChunkError(result.error(), sourceIdentifier));
    }
    return result;
}

Result<algo::ChunkResult> ChunkProcessor::processFile(const std::filesystem::path& path,
                                                      const std::atomic<bool>* cancelFlag) {
    if (auto valid = config_.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    const std::string sourceIdentifier = path.string();
    auto result = tryExecute([&] {
        auto stream = io::openInputFile(path);
        return run(*stream, sourceIdentifier, cancelFlag);
    });
    if (!result) {
        return std::unexpected(asChunkError(result.error(), sourceIdentifier));
    }
    return result;
}

algo::ChunkResult ChunkProcessor::run(std::istream& stream, std::string sourceIdentifier,
                                      const std::atomic<bool>* cancelFlag) {
    io::RecordParser parser(stream, sourceIdentifier);
    io::RecordValidator validator(config_.validator);
    io::QualityDecoder decoder;
    algo::Accumulator accumulator(config_.accumulator);
    io::DiscardCounts discards;

    io::RawRecord raw;
    std::size_t sincePoll = 0;
    while (parser.next(raw)) {
        if (sincePoll == 0 && cancelRequested(cancelFlag)) {
            throw CancelledError(fmt::format("{}: cancelled after {} record(s)",
                                             sourceIdentifier, parser.recordsRead()));
        }
        if (++sincePoll >= config_.cancelPollInterval) {
            sincePoll = 0;
        }

        auto record = validator.validate(raw);
        if (!record) {
            discards.record(record.error());
            continue;
        }

        auto scores = decoder.decode(record->quality);
        if (!scores) {
            discards.record(io::RejectReason::kDecodeError);
            continue;
        }

        accumulator.fold(algo::makeObservation(record->sequence, *scores));
    }

    // A cancel raised while the last records were read still drops the chunk
    if (cancelRequested(cancelFlag)) {
        throw CancelledError(fmt::format("{}: cancelled", sourceIdentifier));
    }

    FQS_LOG_DEBUG("{}: {} record(s) read, {} validated, {} discarded, {} trailing line(s)",
                  sourceIdentifier, parser.recordsRead(), accumulator.count(), discards.total(),
                  parser.trailingLines());

    return accumulator.snapshot(std::move(sourceIdentifier), discards);
}

}  // namespace fqs::pipeline
