// =============================================================================
// fq-stat - FASTQ Record Parser
// =============================================================================
// Single-pass grouping of a line stream into raw 4-line FASTQ candidates.
//
// The parser performs no validation: it groups lines strictly by position
// modulo 4 and hands each group to the caller. Validation lives in
// RecordValidator so that malformed groups are counted, not thrown.
//
// Leading and trailing whitespace (including CR) is stripped from every line.
// If the stream ends in the middle of a group, that partial group is
// dropped and reported through trailingLines(). A stream failure (bad bit,
// decompression error) raises ChunkIOError.
//
// Usage:
//   RecordParser parser(stream, "reads_chunk_001.fastq");
//   RawRecord raw;
//   while (parser.next(raw)) {
//       // validate raw...
//   }
// =============================================================================

#ifndef FQS_IO_RECORD_PARSER_H
#define FQS_IO_RECORD_PARSER_H

#include <cstdint>
#include <functional>
#include <istream>
#include <string>

#include "fqs/common/error.h"

namespace fqs::io {

// =============================================================================
// Raw Record
// =============================================================================

/// @brief Four consecutive lines of a FASTQ stream, not yet validated.
struct RawRecord {
    /// @brief Line 0: identifier line (expected to start with '@').
    std::string header;

    /// @brief Line 1: base sequence.
    std::string sequence;

    /// @brief Line 2: separator line (expected to be "+").
    std::string separator;

    /// @brief Line 3: quality string.
    std::string quality;

    /// @brief Clear all lines, keeping capacity.
    void clear() noexcept {
        header.clear();
        sequence.clear();
        separator.clear();
        quality.clear();
    }
};

// =============================================================================
// RecordParser Class
// =============================================================================

/// @brief Lazy, non-restartable 4-line grouping over an input stream.
///
/// Thread Safety:
/// - Not thread-safe; one parser per chunk and worker.
class RecordParser {
public:
    /// @brief Callback for record processing. Return false to stop.
    using RecordCallback = std::function<bool(const RawRecord&)>;

    /// @brief Construct a parser over a stream owned by the caller.
    /// @param stream Input stream; must outlive the parser.
    /// @param sourceId Identifier used in error messages.
    explicit RecordParser(std::istream& stream, std::string sourceId = "<stream>");

    // Non-copyable, non-movable (holds a reference to the stream)
    RecordParser(const RecordParser&) = delete;
    RecordParser& operator=(const RecordParser&) = delete;

    /// @brief Read the next 4-line group.
    /// @param record Output record; its buffers are reused.
    /// @return true if a complete group was read, false at end of stream.
    /// @throws ChunkIOError if the stream fails while reading.
    [[nodiscard]] bool next(RawRecord& record);

    /// @brief Feed every remaining group to a callback.
    /// @return Number of groups delivered.
    /// @throws ChunkIOError if the stream fails while reading.
    std::uint64_t forEach(const RecordCallback& callback);

    /// @brief Check if end of stream has been reached.
    [[nodiscard]] bool eof() const noexcept { return eof_; }

    /// @brief Total lines consumed so far.
    [[nodiscard]] std::uint64_t linesRead() const noexcept { return linesRead_; }

    /// @brief Complete 4-line groups delivered so far.
    [[nodiscard]] std::uint64_t recordsRead() const noexcept { return recordsRead_; }

    /// @brief Lines of the trailing partial group that was discarded (0-3).
    [[nodiscard]] std::uint32_t trailingLines() const noexcept { return trailingLines_; }

    /// @brief Source identifier used in error messages.
    [[nodiscard]] const std::string& sourceId() const noexcept { return sourceId_; }

private:
    /// @brief Read one line, stripping surrounding whitespace.
    [[nodiscard]] bool readLine(std::string& line);

    /// @brief Strip leading and trailing whitespace (CR/LF, spaces, tabs).
    static void trim(std::string& str);

    std::istream& stream_;
    std::string sourceId_;
    bool eof_ = false;
    std::uint64_t linesRead_ = 0;
    std::uint64_t recordsRead_ = 0;
    std::uint32_t trailingLines_ = 0;
};

}  // namespace fqs::io

#endif  // FQS_IO_RECORD_PARSER_H
