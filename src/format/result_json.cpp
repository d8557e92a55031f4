// =============================================================================
// fq-stat - Result Serialization Implementation
// =============================================================================

#include "fqs/format/result_json.h"

#include <fstream>

#include <fmt/format.h>

#include "fqs/common/logger.h"

namespace fqs::format {

namespace {

// =============================================================================
// Encoding Helpers
// =============================================================================

Json optionalToJson(const std::optional<double>& value) {
    return value ? Json(*value) : Json(nullptr);
}

Json boundToJson(int value, int sentinel) {
    return value == sentinel ? Json(nullptr) : Json(value);
}

Json statsToJson(const algo::RunningStats& stats) {
    Json j;
    j["count"] = stats.count;
    j["sumLength"] = stats.sumLength;
    j["sumSqLength"] = stats.sumSqLength;
    j["sumGC"] = stats.sumGC;
    j["sumSqGC"] = stats.sumSqGC;
    j["sumQuality"] = stats.sumQuality;
    j["sumSqQuality"] = stats.sumSqQuality;
    j["sumReadMeanQuality"] = stats.sumReadMeanQuality;
    j["minLength"] = boundToJson(stats.minLength, algo::kUnsetMin);
    j["maxLength"] = boundToJson(stats.maxLength, algo::kUnsetMax);
    j["minQuality"] = boundToJson(stats.minQuality, algo::kUnsetMin);
    j["maxQuality"] = boundToJson(stats.maxQuality, algo::kUnsetMax);
    j["totalBases"] = stats.totalBases;
    j["nBases"] = stats.nBases;
    j["readsWithN"] = stats.readsWithN;
    j["q20Bases"] = stats.q20Bases;
    j["q30Bases"] = stats.q30Bases;
    return j;
}

Json derivedSummaryToJson(const algo::RunningStats& stats, const algo::Histograms& histograms) {
    Json j;
    j["meanLength"] = optionalToJson(stats.meanLength());
    j["meanGC"] = optionalToJson(stats.meanGC());
    j["meanQuality"] = optionalToJson(stats.meanQuality());
    j["meanReadQuality"] = optionalToJson(stats.meanReadQuality());
    j["lengthStdDev"] = optionalToJson(stats.lengthStdDev());
    j["gcStdDev"] = optionalToJson(stats.gcStdDev());
    j["qualityStdDev"] = optionalToJson(stats.qualityStdDev());
    j["q20Fraction"] = optionalToJson(stats.q20Fraction());
    j["q30Fraction"] = optionalToJson(stats.q30Fraction());
    auto median = histograms.medianQuality();
    j["medianQuality"] = median ? Json(*median) : Json(nullptr);
    return j;
}

Json histogramsToJson(const algo::Histograms& histograms) {
    Json j;
    j["quality"] = histograms.quality;
    j["gc"] = histograms.gc;
    j["length"] = histograms.length;
    return j;
}

Json profileToJson(const std::optional<algo::PositionProfile>& profile) {
    if (!profile) {
        return Json(nullptr);
    }
    Json rows = Json::array();
    for (const auto& row : profile->rows()) {
        Json r;
        r["count"] = row.count;
        r["sum"] = row.sum;
        r["sumSq"] = row.sumSq;
        r["min"] = boundToJson(row.min, algo::kUnsetMin);
        r["max"] = boundToJson(row.max, algo::kUnsetMax);
        r["bases"] = row.bases;
        rows.push_back(std::move(r));
    }
    return rows;
}

Json reservoirToJson(const algo::SampleReservoir& reservoir) {
    Json j;
    j["gcCap"] = reservoir.gcCap();
    j["qualityCap"] = reservoir.qualityCap();
    j["gc"] = reservoir.gcSamples();
    j["quality"] = reservoir.qualitySamples();
    return j;
}

Json discardsToJson(const io::DiscardCounts& discards) {
    Json j;
    for (std::size_t i = 0; i < io::kRejectReasonCount; ++i) {
        auto reason = static_cast<io::RejectReason>(i);
        j[std::string(io::rejectReasonToString(reason))] = discards.count(reason);
    }
    return j;
}

Json summaryToJson(const algo::ChunkSummary& summary) {
    Json j;
    j["sourceIdentifier"] = summary.sourceIdentifier;
    j["count"] = summary.count;
    j["meanLength"] = optionalToJson(summary.meanLength);
    j["meanGC"] = optionalToJson(summary.meanGC);
    j["meanQuality"] = optionalToJson(summary.meanQuality);
    j["discarded"] = summary.discarded;
    return j;
}

// =============================================================================
// Decoding Helpers (throw FormatError or nlohmann::json::exception)
// =============================================================================

void expectKind(const Json& doc, std::string_view kind) {
    if (!doc.is_object()) {
        throw FormatError("result document is not a JSON object");
    }
    const auto& actual = doc.at("kind").get_ref<const std::string&>();
    if (actual != kind) {
        throw FormatError(fmt::format("expected a '{}' document, got '{}'", kind, actual));
    }
    auto version = doc.at("formatVersion").get<std::uint32_t>();
    if (version != kResultFormatVersion) {
        throw FormatError(fmt::format("unsupported result format version {}", version));
    }
}

std::optional<double> optionalFromJson(const Json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    return j.get<double>();
}

int boundFromJson(const Json& j, int sentinel) {
    return j.is_null() ? sentinel : j.get<int>();
}

template <std::size_t N>
void arrayFromJson(const Json& j, std::array<RecordCount, N>& out, std::string_view name) {
    if (!j.is_array() || j.size() != N) {
        throw FormatError(fmt::format("'{}' must be an array of {} counts", name, N));
    }
    for (std::size_t i = 0; i < N; ++i) {
        out[i] = j[i].get<RecordCount>();
    }
}

algo::RunningStats statsFromJson(const Json& j) {
    algo::RunningStats stats;
    stats.count = j.at("count").get<RecordCount>();
    stats.sumLength = j.at("sumLength").get<double>();
    stats.sumSqLength = j.at("sumSqLength").get<double>();
    stats.sumGC = j.at("sumGC").get<double>();
    stats.sumSqGC = j.at("sumSqGC").get<double>();
    stats.sumQuality = j.at("sumQuality").get<double>();
    stats.sumSqQuality = j.at("sumSqQuality").get<double>();
    stats.sumReadMeanQuality = j.at("sumReadMeanQuality").get<double>();
    stats.minLength = boundFromJson(j.at("minLength"), algo::kUnsetMin);
    stats.maxLength = boundFromJson(j.at("maxLength"), algo::kUnsetMax);
    stats.minQuality = boundFromJson(j.at("minQuality"), algo::kUnsetMin);
    stats.maxQuality = boundFromJson(j.at("maxQuality"), algo::kUnsetMax);
    stats.totalBases = j.at("totalBases").get<RecordCount>();
    stats.nBases = j.at("nBases").get<RecordCount>();
    stats.readsWithN = j.at("readsWithN").get<RecordCount>();
    stats.q20Bases = j.at("q20Bases").get<RecordCount>();
    stats.q30Bases = j.at("q30Bases").get<RecordCount>();
    return stats;
}

algo::Histograms histogramsFromJson(const Json& j) {
    algo::Histograms histograms;
    arrayFromJson(j.at("quality"), histograms.quality, "histograms.quality");
    arrayFromJson(j.at("gc"), histograms.gc, "histograms.gc");
    arrayFromJson(j.at("length"), histograms.length, "histograms.length");
    return histograms;
}

std::optional<algo::PositionProfile> profileFromJson(const Json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    if (!j.is_array() || j.size() > kMaxProfilePositions) {
        throw FormatError("'positionProfile' must be null or an array of rows");
    }

    algo::PositionProfile profile(j.size());
    auto rows = profile.mutableRows();
    for (std::size_t i = 0; i < j.size(); ++i) {
        const Json& r = j[i];
        auto& row = rows[i];
        row.count = r.at("count").get<RecordCount>();
        row.sum = r.at("sum").get<double>();
        row.sumSq = r.at("sumSq").get<double>();
        row.min = boundFromJson(r.at("min"), algo::kUnsetMin);
        row.max = boundFromJson(r.at("max"), algo::kUnsetMax);
        arrayFromJson(r.at("bases"), row.bases, "positionProfile.bases");
    }
    return profile;
}

algo::SampleReservoir reservoirFromJson(const Json& j) {
    auto gcCap = j.at("gcCap").get<std::size_t>();
    auto qualityCap = j.at("qualityCap").get<std::size_t>();
    if (gcCap == 0 || qualityCap == 0) {
        throw FormatError("reservoir caps must be at least 1");
    }

    auto gc = j.at("gc").get<std::vector<double>>();

    const Json& qualityJson = j.at("quality");
    if (!qualityJson.is_array()) {
        throw FormatError("'reservoir.quality' must be an array");
    }
    std::vector<PhredScore> quality;
    quality.reserve(qualityJson.size());
    for (const auto& value : qualityJson) {
        auto score = value.get<int>();
        if (score < 0 || score > kMaxPhredScore) {
            throw FormatError(fmt::format("sampled quality score {} out of range", score));
        }
        quality.push_back(static_cast<PhredScore>(score));
    }

    algo::SampleReservoir reservoir(gcCap, qualityCap);
    reservoir.assign(std::move(gc), std::move(quality));
    return reservoir;
}

io::DiscardCounts discardsFromJson(const Json& j) {
    io::DiscardCounts discards;
    discards.invalidHeader = j.at("invalid_header").get<RecordCount>();
    discards.invalidSeparator = j.at("invalid_separator").get<RecordCount>();
    discards.invalidBases = j.at("invalid_bases").get<RecordCount>();
    discards.lengthMismatch = j.at("length_mismatch").get<RecordCount>();
    discards.decodeError = j.at("decode_error").get<RecordCount>();
    return discards;
}

algo::ChunkSummary summaryFromJson(const Json& j) {
    algo::ChunkSummary summary;
    summary.sourceIdentifier = j.at("sourceIdentifier").get<std::string>();
    summary.count = j.at("count").get<RecordCount>();
    summary.meanLength = optionalFromJson(j.at("meanLength"));
    summary.meanGC = optionalFromJson(j.at("meanGC"));
    summary.meanQuality = optionalFromJson(j.at("meanQuality"));
    summary.discarded = j.at("discarded").get<RecordCount>();
    return summary;
}

template <typename T, typename F>
Result<T> decodeDocument(std::string_view what, F&& decode) {
    try {
        return decode();
    } catch (const nlohmann::json::exception& ex) {
        return makeError<T>(ErrorCode::kFormatError,
                            fmt::format("malformed {} document: {}", what, ex.what()));
    } catch (const FQSException& ex) {
        return makeError<T>(ex);
    }
}

}  // namespace

// =============================================================================
// Public API
// =============================================================================

Json toJson(const algo::ChunkResult& result) {
    Json doc;
    doc["kind"] = std::string(kChunkKind);
    doc["formatVersion"] = kResultFormatVersion;
    doc["sourceIdentifier"] = result.sourceIdentifier;
    doc["chunkCount"] = result.chunkCount;
    doc["summary"] = derivedSummaryToJson(result.stats, result.histograms);
    doc["stats"] = statsToJson(result.stats);
    doc["histograms"] = histogramsToJson(result.histograms);
    doc["positionProfile"] = profileToJson(result.positionProfile);
    doc["reservoir"] = reservoirToJson(result.reservoir);
    doc["discards"] = discardsToJson(result.discards);
    return doc;
}

Json toJson(const algo::CombinedResult& result) {
    Json doc;
    doc["kind"] = std::string(kCombinedKind);
    doc["formatVersion"] = kResultFormatVersion;
    doc["chunkCount"] = result.chunkCount;

    Json summary = derivedSummaryToJson(result.stats, result.histograms);
    summary["sampleGcStdDev"] = optionalToJson(result.sampleGcStdDev());
    summary["sampleQualityStdDev"] = optionalToJson(result.sampleQualityStdDev());
    doc["summary"] = std::move(summary);

    doc["stats"] = statsToJson(result.stats);
    doc["histograms"] = histogramsToJson(result.histograms);
    doc["positionProfile"] = profileToJson(result.positionProfile);
    doc["reservoir"] = reservoirToJson(result.reservoir);
    doc["discards"] = discardsToJson(result.discards);

    Json summaries = Json::array();
    for (const auto& chunk : result.chunkSummaries) {
        summaries.push_back(summaryToJson(chunk));
    }
    doc["chunkSummaries"] = std::move(summaries);
    return doc;
}

Result<algo::ChunkResult> chunkResultFromJson(const Json& doc) {
    return decodeDocument<algo::ChunkResult>("chunk result", [&] {
        expectKind(doc, kChunkKind);
        algo::ChunkResult result;
        result.sourceIdentifier = doc.at("sourceIdentifier").get<std::string>();
        result.chunkCount = doc.at("chunkCount").get<std::uint64_t>();
        result.stats = statsFromJson(doc.at("stats"));
        result.histograms = histogramsFromJson(doc.at("histograms"));
        result.positionProfile = profileFromJson(doc.at("positionProfile"));
        result.reservoir = reservoirFromJson(doc.at("reservoir"));
        result.discards = discardsFromJson(doc.at("discards"));
        return result;
    });
}

Result<algo::CombinedResult> combinedResultFromJson(const Json& doc) {
    return decodeDocument<algo::CombinedResult>("combined result", [&] {
        expectKind(doc, kCombinedKind);
        algo::CombinedResult result;
        result.chunkCount = doc.at("chunkCount").get<std::uint64_t>();
        result.stats = statsFromJson(doc.at("stats"));
        result.histograms = histogramsFromJson(doc.at("histograms"));
        result.positionProfile = profileFromJson(doc.at("positionProfile"));
        result.reservoir = reservoirFromJson(doc.at("reservoir"));
        result.discards = discardsFromJson(doc.at("discards"));
        for (const auto& chunk : doc.at("chunkSummaries")) {
            result.chunkSummaries.push_back(summaryFromJson(chunk));
        }
        return result;
    });
}

VoidResult writeJsonFile(const std::filesystem::path& path, const Json& doc) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to open output file: {}", path.string()));
    }
    out << doc.dump(2) << '\n';
    out.flush();
    if (!out) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to write output file: {}", path.string()));
    }
    FQS_LOG_DEBUG("Wrote {} document: {}", doc.value("kind", std::string("unknown")),
                  path.string());
    return makeVoidSuccess();
}

Result<Json> readJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return makeError<Json>(ErrorCode::kIOError,
                               fmt::format("failed to open input file: {}", path.string()));
    }
    return decodeDocument<Json>("JSON", [&] { return Json::parse(in); });
}

Result<algo::ChunkResult> readChunkResultFile(const std::filesystem::path& path) {
    auto doc = readJsonFile(path);
    if (!doc) {
        return std::unexpected(doc.error());
    }

    const Json* kind = doc->is_object() && doc->contains("kind") ? &doc->at("kind") : nullptr;
    if (kind != nullptr && kind->is_string() && kind->get<std::string>() == kCombinedKind) {
        auto combined = combinedResultFromJson(*doc);
        if (!combined) {
            return std::unexpected(combined.error());
        }
        return combined->asChunkResult(path.string());
    }
    return chunkResultFromJson(*doc);
}

}  // namespace fqs::format
