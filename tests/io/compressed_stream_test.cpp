// =============================================================================
// fq-stat - Compressed Stream Tests
// =============================================================================
// Unit tests for magic-byte detection and transparent gzip input, including
// concatenated members and truncated streams.
// =============================================================================

#include "fqs/io/compressed_stream.h"

#include <gtest/gtest.h>
#include <zlib.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "fqs/io/record_parser.h"

namespace fqs::io {
namespace {

// =============================================================================
// Helpers
// =============================================================================

[[nodiscard]] std::filesystem::path tempFilePath(const std::string& suffix) {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("fqs_stream_test_" + std::to_string(counter++) + "_" +
            std::to_string(std::random_device{}()) + suffix);
}

class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

void writeFile(const std::filesystem::path& path, std::string_view content) {
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/// @brief Compress into a single gzip member.
[[nodiscard]] std::string gzipCompress(std::string_view data) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buffer[16384];
    int ret = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = deflate(&zs, Z_FINISH);
        out.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (ret == Z_OK);
    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    return out;
}

/// @brief Deterministic FASTQ text with @p count records.
[[nodiscard]] std::string makeFastq(std::size_t count, unsigned seed = 7) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> base(0, 3);
    std::uniform_int_distribution<int> qual('#', 'J');
    constexpr char kBases[] = {'A', 'C', 'G', 'T'};

    std::string text;
    for (std::size_t i = 0; i < count; ++i) {
        std::string seq;
        std::string q;
        for (int j = 0; j < 100; ++j) {
            seq.push_back(kBases[base(rng)]);
            q.push_back(static_cast<char>(qual(rng)));
        }
        text += "@read" + std::to_string(i) + "\n" + seq + "\n+\n" + q + "\n";
    }
    return text;
}

[[nodiscard]] std::uint64_t countRecords(std::istream& stream) {
    RecordParser parser(stream);
    RawRecord raw;
    std::uint64_t count = 0;
    while (parser.next(raw)) {
        ++count;
    }
    return count;
}

// =============================================================================
// Detection Tests
// =============================================================================

TEST(CompressionDetectionTest, MagicBytes) {
    const std::vector<std::uint8_t> gzip{0x1f, 0x8b, 0x08, 0x00};
    const std::vector<std::uint8_t> bzip2{'B', 'Z', 'h', '9'};
    const std::vector<std::uint8_t> xz{0xfd, '7', 'z', 'X', 'Z', 0x00};
    const std::vector<std::uint8_t> zstd{0x28, 0xb5, 0x2f, 0xfd};
    const std::vector<std::uint8_t> fastq{'@', 'r', '1', '\n'};

    EXPECT_EQ(detectCompressionFormat(gzip), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormat(bzip2), CompressionFormat::kBzip2);
    EXPECT_EQ(detectCompressionFormat(xz), CompressionFormat::kXz);
    EXPECT_EQ(detectCompressionFormat(zstd), CompressionFormat::kZstd);
    EXPECT_EQ(detectCompressionFormat(fastq), CompressionFormat::kNone);
    EXPECT_EQ(detectCompressionFormat({}), CompressionFormat::kNone);
}

TEST(CompressionDetectionTest, SupportedFormats) {
    EXPECT_TRUE(isCompressionSupported(CompressionFormat::kNone));
    EXPECT_TRUE(isCompressionSupported(CompressionFormat::kGzip));
    EXPECT_FALSE(isCompressionSupported(CompressionFormat::kBzip2));
    EXPECT_EQ(compressionFormatName(CompressionFormat::kGzip), "gzip");
}

// =============================================================================
// Stream Tests
// =============================================================================

TEST(CompressedInputStreamTest, PlainFile) {
    TempFileGuard guard(tempFilePath(".fastq"));
    writeFile(guard.path(), makeFastq(25));

    CompressedInputStream stream(guard.path());
    EXPECT_EQ(stream.format(), CompressionFormat::kNone);
    EXPECT_EQ(countRecords(stream), 25u);
}

TEST(CompressedInputStreamTest, GzipFileMatchesPlainText) {
    const std::string text = makeFastq(300);
    TempFileGuard guard(tempFilePath(".fastq.gz"));
    writeFile(guard.path(), gzipCompress(text));

    auto stream = openInputFile(guard.path());
    std::string decoded((std::istreambuf_iterator<char>(*stream)),
                        std::istreambuf_iterator<char>());
    EXPECT_EQ(decoded, text);
}

TEST(CompressedInputStreamTest, ConcatenatedGzipMembers) {
    const std::string first = makeFastq(40, 1);
    const std::string second = makeFastq(60, 2);
    TempFileGuard guard(tempFilePath(".fastq.gz"));
    writeFile(guard.path(), gzipCompress(first) + gzipCompress(second));

    CompressedInputStream stream(guard.path());
    EXPECT_EQ(stream.format(), CompressionFormat::kGzip);
    EXPECT_EQ(countRecords(stream), 100u);
}

TEST(CompressedInputStreamTest, TruncatedGzipRaisesChunkIOError) {
    const std::string compressed = gzipCompress(makeFastq(500));
    TempFileGuard guard(tempFilePath(".fastq.gz"));
    writeFile(guard.path(), std::string_view(compressed).substr(0, compressed.size() / 2));

    auto stream = openInputFile(guard.path());
    EXPECT_THROW((void)countRecords(*stream), ChunkIOError);
}

TEST(CompressedInputStreamTest, MissingFileRaisesIOError) {
    EXPECT_THROW(CompressedInputStream(tempFilePath(".missing")), IOError);
}

TEST(CompressedInputStreamTest, UnsupportedFormatRejected) {
    TempFileGuard guard(tempFilePath(".fastq.bz2"));
    writeFile(guard.path(), "BZh91AY&SY");

    try {
        CompressedInputStream stream(guard.path());
        FAIL() << "expected unsupported format";
    } catch (const FQSException& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kUnsupportedFormat);
    }
}

}  // namespace
}  // namespace fqs::io
