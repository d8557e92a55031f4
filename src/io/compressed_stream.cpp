// =============================================================================
// fq-stat - Compressed Stream Implementation
// =============================================================================

#include "fqs/io/compressed_stream.h"

#include <zlib.h>

#include <cstring>

#include <fmt/format.h>

#include "fqs/common/logger.h"

namespace fqs::io {

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Bzip2 magic: 'B' 'Z' 'h'
constexpr std::uint8_t kBzip2Magic[] = {0x42, 0x5a, 0x68};

// XZ magic: 0xfd '7' 'z' 'X' 'Z' 0x00
constexpr std::uint8_t kXzMagic[] = {0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00};

// Zstd magic: 0x28 0xb5 0x2f 0xfd
constexpr std::uint8_t kZstdMagic[] = {0x28, 0xb5, 0x2f, 0xfd};

template <std::size_t N>
bool hasMagic(std::span<const std::uint8_t> data, const std::uint8_t (&magic)[N]) noexcept {
    return data.size() >= N && std::memcmp(data.data(), magic, N) == 0;
}

z_stream* asZStream(void* p) noexcept { return static_cast<z_stream*>(p); }

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) noexcept {
    if (hasMagic(data, kGzipMagic)) {
        return CompressionFormat::kGzip;
    }
    if (hasMagic(data, kBzip2Magic)) {
        return CompressionFormat::kBzip2;
    }
    if (hasMagic(data, kXzMagic)) {
        return CompressionFormat::kXz;
    }
    if (hasMagic(data, kZstdMagic)) {
        return CompressionFormat::kZstd;
    }
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) noexcept {
    switch (format) {
        case CompressionFormat::kNone:
            return "none";
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kBzip2:
            return "bzip2";
        case CompressionFormat::kXz:
            return "xz";
        case CompressionFormat::kZstd:
            return "zstd";
        case CompressionFormat::kUnknown:
            break;
    }
    return "unknown";
}

bool isCompressionSupported(CompressionFormat format) noexcept {
    return format == CompressionFormat::kNone || format == CompressionFormat::kGzip;
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    auto stream = std::make_unique<z_stream>();
    std::memset(stream.get(), 0, sizeof(z_stream));

    // 16 + MAX_WBITS selects gzip framing
    int ret = inflateInit2(stream.get(), 16 + MAX_WBITS);
    if (ret != Z_OK) {
        throw DecompressionError(fmt::format("failed to initialize zlib: {}", zError(ret)));
    }
    zlibStream_ = stream.release();
}

GzipStreamBuf::~GzipStreamBuf() {
    if (zlibStream_ != nullptr) {
        auto* stream = asZStream(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    std::size_t produced = decompress();
    if (produced == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + produced);
    return traits_type::to_int_type(*gptr());
}

std::size_t GzipStreamBuf::refillInput() {
    auto* stream = asZStream(zlibStream_);
    source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                  static_cast<std::streamsize>(inputBuffer_.size()));
    if (source_->bad()) {
        throw DecompressionError("read failure on compressed source");
    }
    auto bytesRead = static_cast<std::size_t>(source_->gcount());
    stream->next_in = inputBuffer_.data();
    stream->avail_in = static_cast<uInt>(bytesRead);
    return bytesRead;
}

std::size_t GzipStreamBuf::decompress() {
    if (finished_) {
        return 0;
    }

    auto* stream = asZStream(zlibStream_);

    while (true) {
        if (memberEnd_) {
            // Another gzip member may follow (bgzip writes many)
            if (stream->avail_in == 0 && refillInput() == 0) {
                finished_ = true;
                return 0;
            }
            int resetRet = inflateReset(stream);
            if (resetRet != Z_OK) {
                throw DecompressionError(fmt::format("gzip reset failed: {}", zError(resetRet)));
            }
            memberEnd_ = false;
        }

        if (stream->avail_in == 0 && refillInput() == 0) {
            throw DecompressionError("truncated gzip stream");
        }

        stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());
        stream->avail_out = static_cast<uInt>(outputBuffer_.size());

        int ret = inflate(stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            memberEnd_ = true;
        } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
            const char* detail = stream->msg != nullptr ? stream->msg : zError(ret);
            throw DecompressionError(fmt::format("gzip decompression failed: {}", detail));
        }

        std::size_t produced = outputBuffer_.size() - stream->avail_out;
        if (produced > 0) {
            return produced;
        }
    }
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr) {
    fileStream_ = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!fileStream_->is_open()) {
        throw IOError(fmt::format("failed to open input file: {}", path.string()));
    }

    std::uint8_t magic[8];
    fileStream_->read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(fileStream_->gcount());
    fileStream_->clear();
    fileStream_->seekg(0, std::ios::beg);

    format_ = detectCompressionFormat({magic, bytesRead});

    if (!isCompressionSupported(format_)) {
        throw FQSException(ErrorCode::kUnsupportedFormat,
                           fmt::format("unsupported compression format '{}' for {}",
                                       compressionFormatName(format_), path.string()));
    }

    if (format_ == CompressionFormat::kGzip) {
        decompressBuf_ = std::make_unique<GzipStreamBuf>(*fileStream_);
        rdbuf(decompressBuf_.get());
        FQS_LOG_DEBUG("Opened gzip compressed input: {}", path.string());
    } else {
        rdbuf(fileStream_->rdbuf());
    }
}

CompressedInputStream::~CompressedInputStream() = default;

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path) {
    return std::make_unique<CompressedInputStream>(path);
}

}  // namespace fqs::io
