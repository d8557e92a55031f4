// =============================================================================
// fq-stat - Result JSON Tests
// =============================================================================
// Tests for chunk and combined result documents.
//
// **Property: decoding an encoded result reproduces every exact field**
// so that a result read back from disk reduces exactly like the original.
// =============================================================================

#include "fqs/format/result_json.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "fqs/algo/accumulator.h"
#include "fqs/algo/reducer.h"
#include "fqs/io/quality_decoder.h"

namespace fqs::format::test {
namespace {

// =============================================================================
// Helpers
// =============================================================================

struct Read {
    std::string sequence;
    std::string quality;
};

algo::ChunkResult accumulate(std::string id, const std::vector<Read>& reads,
                             algo::AccumulatorConfig config = {}) {
    algo::Accumulator acc(config);
    io::QualityDecoder decoder;
    for (const auto& read : reads) {
        auto scores = decoder.decode(read.quality);
        if (!scores) {
            throw std::invalid_argument("test read has an invalid quality string");
        }
        acc.fold(algo::makeObservation(read.sequence, *scores));
    }
    return acc.snapshot(std::move(id));
}

algo::ChunkResult sampleChunk(std::string id) {
    algo::AccumulatorConfig config;
    config.sampleStride = 2;
    config.profilePositions = 6;
    auto chunk = accumulate(std::move(id), {{"ACGTNACGTA", "IIII#5?+!J"},
                                            {"GGCC", "5555"},
                                            {"", ""},
                                            {"acgt", "IIII"}},
                            config);
    chunk.discards.invalidHeader = 1;
    chunk.discards.decodeError = 2;
    return chunk;
}

[[nodiscard]] std::filesystem::path tempFilePath(const std::string& suffix) {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("fqs_json_test_" + std::to_string(counter++) + "_" +
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

namespace gen {

rc::Gen<Read> read(std::size_t maxLen = 60) {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(0, maxLen + 1), [](std::size_t len) {
        return rc::gen::map(
            rc::gen::tuple(
                rc::gen::container<std::string>(len, rc::gen::elementOf('A', 'C', 'G', 'T', 'N')),
                rc::gen::container<std::string>(len, rc::gen::inRange<char>('!', '~' + 1))),
            [](std::tuple<std::string, std::string> t) {
                return Read{std::move(std::get<0>(t)), std::move(std::get<1>(t))};
            });
    });
}

}  // namespace gen

// =============================================================================
// Chunk Documents
// =============================================================================

TEST(ResultJsonTest, ChunkDocumentLayout) {
    auto doc = toJson(sampleChunk("reads_001.fastq"));

    EXPECT_EQ(doc.at("kind").get<std::string>(), "chunk");
    EXPECT_EQ(doc.at("formatVersion").get<std::uint32_t>(), kResultFormatVersion);
    EXPECT_EQ(doc.at("sourceIdentifier").get<std::string>(), "reads_001.fastq");
    EXPECT_EQ(doc.at("chunkCount").get<std::uint64_t>(), 1u);
    EXPECT_EQ(doc.at("stats").at("count").get<RecordCount>(), 4u);
    EXPECT_EQ(doc.at("histograms").at("quality").size(), kPhredScoreCount);
    EXPECT_EQ(doc.at("histograms").at("gc").size(), 101u);
    EXPECT_EQ(doc.at("positionProfile").size(), 6u);
    EXPECT_EQ(doc.at("discards").at("invalid_header").get<RecordCount>(), 1u);
    EXPECT_EQ(doc.at("discards").at("decode_error").get<RecordCount>(), 2u);
    EXPECT_DOUBLE_EQ(doc.at("summary").at("meanLength").get<double>(), 4.5);
}

TEST(ResultJsonTest, UnsetBoundsAreNull) {
    auto doc = toJson(accumulate("empty", {}));

    EXPECT_TRUE(doc.at("stats").at("minLength").is_null());
    EXPECT_TRUE(doc.at("stats").at("maxQuality").is_null());
    EXPECT_TRUE(doc.at("summary").at("meanGC").is_null());

    auto decoded = chunkResultFromJson(doc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->stats.minLength, algo::kUnsetMin);
    EXPECT_EQ(decoded->stats.maxQuality, algo::kUnsetMax);
    EXPECT_FALSE(decoded->stats.hasReads());
}

TEST(ResultJsonTest, ChunkRoundTripIsExact) {
    auto chunk = sampleChunk("reads_001.fastq");

    auto decoded = chunkResultFromJson(toJson(chunk));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, chunk);
}

TEST(ResultJsonTest, MissingProfileRoundTrips) {
    algo::AccumulatorConfig config;
    config.profilePositions = 0;
    auto chunk = accumulate("no_profile", {{"ACGT", "IIII"}}, config);

    auto doc = toJson(chunk);
    EXPECT_TRUE(doc.at("positionProfile").is_null());

    auto decoded = chunkResultFromJson(doc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->positionProfile.has_value());
}

// =============================================================================
// Malformed Documents
// =============================================================================

TEST(ResultJsonTest, WrongKindIsFormatError) {
    std::vector<algo::ChunkResult> inputs{sampleChunk("a")};
    auto combined = algo::Reducer::merge(inputs);
    ASSERT_TRUE(combined.has_value());

    auto decoded = chunkResultFromJson(toJson(*combined));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);

    auto decodedCombined = combinedResultFromJson(toJson(sampleChunk("a")));
    ASSERT_FALSE(decodedCombined.has_value());
    EXPECT_EQ(decodedCombined.error().code(), ErrorCode::kFormatError);
}

TEST(ResultJsonTest, MissingFieldIsFormatError) {
    auto doc = toJson(sampleChunk("a"));
    doc["stats"].erase("sumGC");

    auto decoded = chunkResultFromJson(doc);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);
}

TEST(ResultJsonTest, WrongHistogramSizeIsFormatError) {
    auto doc = toJson(sampleChunk("a"));
    doc["histograms"]["gc"].push_back(0);

    auto decoded = chunkResultFromJson(doc);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);
}

TEST(ResultJsonTest, OutOfRangeSampleIsFormatError) {
    auto doc = toJson(sampleChunk("a"));
    doc["reservoir"]["quality"].push_back(200);

    auto decoded = chunkResultFromJson(doc);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);
}

TEST(ResultJsonTest, UnsupportedVersionIsFormatError) {
    auto doc = toJson(sampleChunk("a"));
    doc["formatVersion"] = kResultFormatVersion + 1;

    auto decoded = chunkResultFromJson(doc);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);
}

TEST(ResultJsonTest, NonObjectIsFormatError) {
    auto decoded = chunkResultFromJson(Json::array({1, 2, 3}));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);
}

// =============================================================================
// Combined Documents and Files
// =============================================================================

TEST(ResultJsonTest, CombinedRoundTripIsExact) {
    std::vector<algo::ChunkResult> inputs{sampleChunk("b"), sampleChunk("a")};
    auto combined = algo::Reducer::merge(inputs);
    ASSERT_TRUE(combined.has_value());

    auto doc = toJson(*combined);
    EXPECT_EQ(doc.at("kind").get<std::string>(), "combined");
    EXPECT_EQ(doc.at("chunkSummaries").size(), 2u);
    EXPECT_EQ(doc.at("chunkSummaries")[0].at("sourceIdentifier").get<std::string>(), "a");
    EXPECT_TRUE(doc.at("summary").contains("sampleGcStdDev"));

    auto decoded = combinedResultFromJson(doc);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, *combined);
}

TEST(ResultJsonTest, FileRoundTrip) {
    TempFileGuard file(tempFilePath(".json"));
    auto chunk = sampleChunk("reads_002.fastq.gz");

    ASSERT_TRUE(writeJsonFile(file.path(), toJson(chunk)).has_value());

    auto decoded = readChunkResultFile(file.path());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, chunk);
}

TEST(ResultJsonTest, CombinedFileReadsAsChunkInput) {
    TempFileGuard file(tempFilePath(".json"));
    std::vector<algo::ChunkResult> inputs{sampleChunk("a"), sampleChunk("b")};
    auto combined = algo::Reducer::merge(inputs);
    ASSERT_TRUE(combined.has_value());
    ASSERT_TRUE(writeJsonFile(file.path(), toJson(*combined)).has_value());

    auto decoded = readChunkResultFile(file.path());

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->sourceIdentifier, file.path().string());
    EXPECT_EQ(decoded->chunkCount, 2u);
    EXPECT_EQ(decoded->stats, combined->stats);
    EXPECT_EQ(decoded->discards.total(), 6u);
}

TEST(ResultJsonTest, MissingFileIsIOError) {
    auto decoded = readChunkResultFile(tempFilePath(".missing.json"));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kIOError);
}

TEST(ResultJsonTest, InvalidJsonIsFormatError) {
    TempFileGuard file(tempFilePath(".json"));
    {
        std::ofstream out(file.path());
        out << "{\"kind\": \"chunk\", ";
    }

    auto decoded = readJsonFile(file.path());
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kFormatError);
}

TEST(ResultJsonTest, UnwritablePathIsIOError) {
    auto path = tempFilePath("_missing_dir") / "out.json";
    auto written = writeJsonFile(path, toJson(sampleChunk("a")));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code(), ErrorCode::kIOError);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(ResultJsonProperty, SerializedChunkReducesLikeOriginal, ()) {
    const auto reads = *rc::gen::container<std::vector<Read>>(gen::read());
    auto chunk = accumulate("chunk", reads);

    auto text = toJson(chunk).dump();
    auto decoded = chunkResultFromJson(Json::parse(text));

    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == chunk);
}

}  // namespace
}  // namespace fqs::format::test
