// =============================================================================
// fq-stat - FASTQ Record Parser Implementation
// =============================================================================

#include "fqs/io/record_parser.h"

#include <algorithm>
#include <array>
#include <cctype>

#include <fmt/format.h>

#include "fqs/common/logger.h"

namespace fqs::io {

RecordParser::RecordParser(std::istream& stream, std::string sourceId)
    : stream_(stream), sourceId_(std::move(sourceId)) {}

bool RecordParser::next(RawRecord& record) {
    if (eof_) {
        return false;
    }

    record.clear();
    const std::array<std::string*, 4> lines{&record.header, &record.sequence,
                                            &record.separator, &record.quality};

    for (std::uint32_t i = 0; i < lines.size(); ++i) {
        if (!readLine(*lines[i])) {
            trailingLines_ = i;
            if (i > 0) {
                FQS_LOG_DEBUG("{}: dropped trailing partial record of {} line(s)", sourceId_, i);
            }
            return false;
        }
    }

    ++recordsRead_;
    return true;
}

std::uint64_t RecordParser::forEach(const RecordCallback& callback) {
    std::uint64_t delivered = 0;
    RawRecord record;
    while (next(record)) {
        ++delivered;
        if (!callback(record)) {
            break;
        }
    }
    return delivered;
}

bool RecordParser::readLine(std::string& line) {
    if (!std::getline(stream_, line)) {
        if (stream_.bad()) {
            eof_ = true;
            throw ChunkIOError(
                fmt::format("stream read failure after {} line(s)", linesRead_),
                ErrorContext(sourceId_).withLine(linesRead_ + 1).withRecord(recordsRead_ + 1));
        }
        eof_ = true;
        return false;
    }

    ++linesRead_;
    trim(line);
    return true;
}

void RecordParser::trim(std::string& str) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    str.erase(std::find_if(str.rbegin(), str.rend(), notSpace).base(), str.end());
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), notSpace));
}

}  // namespace fqs::io
