// =============================================================================
// fq-stat - Record Parser Tests
// =============================================================================
// Unit tests for 4-line grouping, trailing partial groups and stream failures.
// =============================================================================

#include "fqs/io/record_parser.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fqs::io {
namespace {

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

std::vector<RawRecord> readAll(RecordParser& parser) {
    std::vector<RawRecord> records;
    RawRecord raw;
    while (parser.next(raw)) {
        records.push_back(raw);
    }
    return records;
}

TEST(RecordParserTest, GroupsLinesByFour) {
    std::istringstream input("@r1\nACGT\n+\n!!!!\n@r2\nGG\n+\nII\n");
    RecordParser parser(input, "two_records");

    auto records = readAll(parser);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].header, "@r1");
    EXPECT_EQ(records[0].sequence, "ACGT");
    EXPECT_EQ(records[0].separator, "+");
    EXPECT_EQ(records[0].quality, "!!!!");
    EXPECT_EQ(records[1].header, "@r2");
    EXPECT_EQ(records[1].quality, "II");
    EXPECT_EQ(parser.recordsRead(), 2u);
    EXPECT_EQ(parser.linesRead(), 8u);
    EXPECT_EQ(parser.trailingLines(), 0u);
    EXPECT_TRUE(parser.eof());
}

TEST(RecordParserTest, LastLineWithoutNewline) {
    std::istringstream input("@r1\nACGT\n+\n!!!!");
    RecordParser parser(input);

    auto records = readAll(parser);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].quality, "!!!!");
}

TEST(RecordParserTest, TrailingPartialGroupIsDropped) {
    std::istringstream input("@r1\nACGT\n+\n!!!!\n@r2\nACGT\n");
    RecordParser parser(input);

    auto records = readAll(parser);

    EXPECT_EQ(records.size(), 1u);
    EXPECT_EQ(parser.trailingLines(), 2u);
}

TEST(RecordParserTest, DoesNotValidate) {
    std::istringstream input("not a header\nXYZ\n-\n\x01\n");
    RecordParser parser(input);

    auto records = readAll(parser);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].header, "not a header");
    EXPECT_EQ(records[0].separator, "-");
}

TEST(RecordParserTest, StripsCarriageReturns) {
    std::istringstream input("@r1\r\nACGT\r\n+\r\n!!!!\r\n");
    RecordParser parser(input);

    auto records = readAll(parser);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].header, "@r1");
    EXPECT_EQ(records[0].sequence, "ACGT");
    EXPECT_EQ(records[0].separator, "+");
    EXPECT_EQ(records[0].quality, "!!!!");
}

TEST(RecordParserTest, StripsSurroundingWhitespace) {
    std::istringstream input("  @r1 sample\t\n\tACGT \n +\n!!!! \r\n");
    RecordParser parser(input);

    auto records = readAll(parser);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].header, "@r1 sample");
    EXPECT_EQ(records[0].sequence, "ACGT");
    EXPECT_EQ(records[0].separator, "+");
    EXPECT_EQ(records[0].quality, "!!!!");
}

TEST(RecordParserTest, EmptyStream) {
    std::istringstream input("");
    RecordParser parser(input);

    RawRecord raw;
    EXPECT_FALSE(parser.next(raw));
    EXPECT_EQ(parser.recordsRead(), 0u);
    EXPECT_EQ(parser.trailingLines(), 0u);
}

TEST(RecordParserTest, ForEachStopsWhenCallbackReturnsFalse) {
    std::istringstream input("@a\nA\n+\n!\n@b\nC\n+\n!\n@c\nG\n+\n!\n");
    RecordParser parser(input);

    std::vector<std::string> headers;
    auto delivered = parser.forEach([&](const RawRecord& raw) {
        headers.push_back(raw.header);
        return headers.size() < 2;
    });

    EXPECT_EQ(delivered, 2u);
    EXPECT_EQ(headers, (std::vector<std::string>{"@a", "@b"}));
}

TEST(RecordParserTest, StreamFailureRaisesChunkIOError) {
    FailingStreamBuf buffer("@r1\nACGT\n+\n!!!!\n@r2\nAC");
    std::istream input(&buffer);
    RecordParser parser(input, "failing_chunk");

    RawRecord raw;
    ASSERT_TRUE(parser.next(raw));
    EXPECT_EQ(raw.header, "@r1");

    try {
        (void)parser.next(raw);
        FAIL() << "expected ChunkIOError";
    } catch (const ChunkIOError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kChunkIOError);
        ASSERT_TRUE(ex.context().has_value());
        EXPECT_EQ(ex.context()->source, "failing_chunk");
        EXPECT_EQ(ex.context()->lineNumber, 5u);
        EXPECT_EQ(ex.context()->recordNumber, 2u);
    }
}

}  // namespace
}  // namespace fqs::io
