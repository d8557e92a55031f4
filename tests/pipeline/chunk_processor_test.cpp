// =============================================================================
// fq-stat - Chunk Processor Tests
// =============================================================================
// Unit tests for the per-chunk parse -> validate -> decode -> accumulate chain.
// =============================================================================

#include "fqs/pipeline/chunk_processor.h"

#include <gtest/gtest.h>
#include <zlib.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fqs::pipeline::test {
namespace {

// =============================================================================
// Helpers
// =============================================================================

/// @brief Serves a fixed prefix, then fails like a broken device.
class FailingStreamBuf : public std::streambuf {
public:
    explicit FailingStreamBuf(std::string prefix) : prefix_(std::move(prefix)) {
        setg(prefix_.data(), prefix_.data(), prefix_.data() + prefix_.size());
    }

protected:
    int_type underflow() override { throw std::runtime_error("device error"); }

private:
    std::string prefix_;
};

[[nodiscard]] std::filesystem::path tempFilePath(const std::string& suffix) {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("fqs_processor_test_" + std::to_string(counter++) + "_" +
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

Result<algo::ChunkResult> processText(std::string_view text, ChunkProcessorConfig config = {}) {
    std::istringstream input{std::string(text)};
    ChunkProcessor processor(std::move(config));
    return processor.process(input, "text_chunk");
}

// =============================================================================
// Record Handling
// =============================================================================

TEST(ChunkProcessorTest, SingleValidRecord) {
    auto result = processText("@r1\nACGT\n+\n!!!!\n");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sourceIdentifier, "text_chunk");
    EXPECT_EQ(result->stats.count, 1u);
    EXPECT_DOUBLE_EQ(*result->stats.meanQuality(), 0.0);
    EXPECT_DOUBLE_EQ(*result->stats.meanGC(), 50.0);
    EXPECT_EQ(result->discards.total(), 0u);
}

TEST(ChunkProcessorTest, IndentedHeaderIsAccepted) {
    auto result = processText("  @r1\n\tACGT \n+\n!!!!\n");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stats.count, 1u);
    EXPECT_EQ(result->discards.total(), 0u);
}

TEST(ChunkProcessorTest, InvalidBaseIsDiscarded) {
    auto result = processText("@r1\nACGTX\n+\n!!!!!\n");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stats.count, 0u);
    EXPECT_EQ(result->discards.invalidBases, 1u);
    EXPECT_EQ(result->discards.total(), 1u);
}

TEST(ChunkProcessorTest, EachRejectionReasonIsCounted) {
    const std::string text =
        "r0\nACGT\n+\nIIII\n"        // no '@'
        "@r1\nACGT\n-\nIIII\n"       // bad separator
        "@r2\nACGU\n+\nIIII\n"       // bad base
        "@r3\nACGT\n+\nIII\n"        // length mismatch
        "@r4\nACGT\n+\nII\x7fI\n"    // quality out of range
        "@r5\nACGT\n+\nIIII\n";

    auto result = processText(text);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stats.count, 1u);
    EXPECT_EQ(result->discards.invalidHeader, 1u);
    EXPECT_EQ(result->discards.invalidSeparator, 1u);
    EXPECT_EQ(result->discards.invalidBases, 1u);
    EXPECT_EQ(result->discards.lengthMismatch, 1u);
    EXPECT_EQ(result->discards.decodeError, 1u);
}

TEST(ChunkProcessorTest, SeparatorPolicyIsApplied) {
    const std::string text = "@r1 sample\nACGT\n+r1 sample\nIIII\n";

    auto strict = processText(text);
    ASSERT_TRUE(strict.has_value());
    EXPECT_EQ(strict->discards.invalidSeparator, 1u);

    ChunkProcessorConfig config;
    config.validator.separatorPolicy = io::SeparatorPolicy::kAllowHeaderRepeat;
    auto lenient = processText(text, config);
    ASSERT_TRUE(lenient.has_value());
    EXPECT_EQ(lenient->stats.count, 1u);
}

TEST(ChunkProcessorTest, TrailingPartialRecordIsIgnored) {
    auto result = processText("@r1\nACGT\n+\nIIII\n@r2\nAC\n");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stats.count, 1u);
    EXPECT_EQ(result->discards.total(), 0u);
}

TEST(ChunkProcessorTest, EmptyChunkSucceeds) {
    auto result = processText("");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stats.count, 0u);
    EXPECT_FALSE(result->stats.meanGC().has_value());
}

// =============================================================================
// Failures and Cancellation
// =============================================================================

TEST(ChunkProcessorTest, StreamFailureIsChunkIOError) {
    FailingStreamBuf buffer("@r1\nACGT\n+\n!!!!\n@r2\nAC");
    std::istream input(&buffer);
    ChunkProcessor processor;

    auto result = processor.process(input, "failing_chunk");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kChunkIOError);
}

TEST(ChunkProcessorTest, GzipFileIsProcessed) {
    TempFileGuard file(tempFilePath(".fastq.gz"));
    writeFile(file.path(), gzipCompress("@r1\nGGCC\n+\nIIII\n@r2\nAATT\n+\n5555\n"));
    ChunkProcessor processor;

    auto result = processor.processFile(file.path());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sourceIdentifier, file.path().string());
    EXPECT_EQ(result->stats.count, 2u);
    EXPECT_DOUBLE_EQ(*result->stats.meanGC(), 50.0);
}

TEST(ChunkProcessorTest, TruncatedGzipIsChunkIOError) {
    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "@r" + std::to_string(i) + "\nACGTACGTACGTACGTACGT\n+\nIIIIIIIIIIIIIIIIIIII\n";
    }
    auto compressed = gzipCompress(text);
    compressed.resize(compressed.size() / 2);

    TempFileGuard file(tempFilePath(".fastq.gz"));
    writeFile(file.path(), compressed);
    ChunkProcessor processor;

    auto result = processor.processFile(file.path());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kChunkIOError);
}

TEST(ChunkProcessorTest, MissingFileIsChunkIOError) {
    ChunkProcessor processor;
    auto result = processor.processFile(tempFilePath(".missing.fastq"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kChunkIOError);
}

TEST(ChunkProcessorTest, CancelFlagStopsChunk) {
    std::istringstream input("@r1\nACGT\n+\nIIII\n@r2\nACGT\n+\nIIII\n");
    std::atomic<bool> cancel{true};
    ChunkProcessor processor;

    auto result = processor.process(input, "cancelled_chunk", &cancel);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
}

TEST(ChunkProcessorTest, InvalidConfigIsRejected) {
    ChunkProcessorConfig config;
    config.cancelPollInterval = 0;
    EXPECT_FALSE(config.validate().has_value());

    auto result = processText("@r1\nACGT\n+\nIIII\n", config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

}  // namespace
}  // namespace fqs::pipeline::test
