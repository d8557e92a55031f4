// =============================================================================
// fq-stat - Compressed Stream Support
// =============================================================================
// Transparent gzip decompression for chunk input streams.
//
// This module provides:
// - GzipStreamBuf: zlib-backed streambuf (multi-member / BGZF aware)
// - CompressedInputStream: std::istream that detects gzip by magic bytes
// - openInputFile(): path -> stream factory used by the chunk processor
//
// Decompression failures thrown from the stream buffer are turned into the
// stream's bad bit by std::istream, which the record parser reports as a
// ChunkIOError.
//
// Usage:
//   auto stream = fqs::io::openInputFile("reads_chunk_001.fastq.gz");
//   RecordParser parser(*stream);
// =============================================================================

#ifndef FQS_IO_COMPRESSED_STREAM_H
#define FQS_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <span>
#include <streambuf>
#include <string_view>
#include <vector>

#include "fqs/common/error.h"

namespace fqs::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Input compression formats recognised by magic bytes.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,   ///< Uncompressed (plain text)
    kGzip = 1,   ///< gzip / BGZF (.gz)
    kBzip2 = 2,  ///< bzip2 (.bz2), recognised but not supported
    kXz = 3,     ///< xz (.xz), recognised but not supported
    kZstd = 4,   ///< zstd (.zst), recognised but not supported
    kUnknown = 255
};

/// @brief Detect compression format from leading bytes.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) noexcept;

/// @brief Human-readable name of a compression format.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format) noexcept;

/// @brief Check if a format can be decompressed.
[[nodiscard]] bool isCompressionSupported(CompressionFormat format) noexcept;

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Read-only stream buffer inflating a gzip source.
/// @note Concatenated gzip members (as written by bgzip) are read through.
class GzipStreamBuf : public std::streambuf {
public:
    /// @brief Construct over a source stream owned by the caller.
    /// @param source Compressed source stream.
    /// @param bufferSize Size of the compressed and decompressed buffers.
    /// @throws DecompressionError if zlib cannot be initialized.
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = 64 * 1024);

    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;
    GzipStreamBuf(GzipStreamBuf&&) = delete;
    GzipStreamBuf& operator=(GzipStreamBuf&&) = delete;

protected:
    /// @brief Refill the get area.
    /// @throws DecompressionError on corrupt or truncated input.
    int_type underflow() override;

private:
    /// @brief Inflate into the output buffer.
    /// @return Number of bytes produced (0 at clean end of input).
    std::size_t decompress();

    /// @brief Refill the compressed input buffer from the source.
    /// @return Number of bytes read.
    std::size_t refillInput();

    std::istream* source_ = nullptr;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer keeps zlib.h out of the header).
    void* zlibStream_ = nullptr;

    /// @brief Whether the current gzip member has ended.
    bool memberEnd_ = false;

    /// @brief Whether all input has been consumed.
    bool finished_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input stream with transparent gzip decompression.
class CompressedInputStream : public std::istream {
public:
    /// @brief Open a file, detecting compression from its magic bytes.
    /// @throws IOError if the file cannot be opened.
    /// @throws FQSException (kUnsupportedFormat) for recognised but unsupported formats.
    explicit CompressedInputStream(const std::filesystem::path& path);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;
    CompressedInputStream(CompressedInputStream&&) = delete;
    CompressedInputStream& operator=(CompressedInputStream&&) = delete;

    /// @brief Get the detected compression format.
    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

private:
    std::unique_ptr<std::ifstream> fileStream_;
    std::unique_ptr<std::streambuf> decompressBuf_;
    CompressionFormat format_ = CompressionFormat::kUnknown;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Open a plain or gzip-compressed file for reading.
/// @throws IOError if the file cannot be opened.
[[nodiscard]] std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path);

}  // namespace fqs::io

#endif  // FQS_IO_COMPRESSED_STREAM_H
