// =============================================================================
// fq-stat - Result Serialization
// =============================================================================
// JSON encoding of ChunkResult and CombinedResult.
//
// Documents carry a "kind" ("chunk" or "combined") and a format version.
// Every exact field (counts, sums, sums of squares, min/max, histograms,
// profile rows, samples, discard counters) is written so that a decoded
// result reduces exactly like the original. A "summary" object with derived
// means and deviations is written for readers and ignored on decode.
//
// Usage:
//   writeJsonFile("chunk_001.json", toJson(chunkResult));
//   auto input = readChunkResultFile("chunk_001.json");   // chunk or combined
// =============================================================================

#ifndef FQS_FORMAT_RESULT_JSON_H
#define FQS_FORMAT_RESULT_JSON_H

#include <cstdint>
#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

#include "fqs/algo/chunk_result.h"
#include "fqs/common/error.h"

namespace fqs::format {

/// @brief JSON document type (keys keep insertion order).
using Json = nlohmann::ordered_json;

/// @brief Current document format version.
inline constexpr std::uint32_t kResultFormatVersion = 1;

inline constexpr std::string_view kChunkKind = "chunk";
inline constexpr std::string_view kCombinedKind = "combined";

/// @brief Encode a chunk result.
[[nodiscard]] Json toJson(const algo::ChunkResult& result);

/// @brief Encode a combined result, including its chunk summaries.
[[nodiscard]] Json toJson(const algo::CombinedResult& result);

/// @brief Decode a "chunk" document.
/// @return ChunkResult, or kFormatError for a malformed document.
[[nodiscard]] Result<algo::ChunkResult> chunkResultFromJson(const Json& doc);

/// @brief Decode a "combined" document.
/// @return CombinedResult, or kFormatError for a malformed document.
[[nodiscard]] Result<algo::CombinedResult> combinedResultFromJson(const Json& doc);

/// @brief Write a document to a file (pretty-printed).
[[nodiscard]] VoidResult writeJsonFile(const std::filesystem::path& path, const Json& doc);

/// @brief Read a document from a file.
/// @return Parsed JSON, kIOError if unreadable, kFormatError if not JSON.
[[nodiscard]] Result<Json> readJsonFile(const std::filesystem::path& path);

/// @brief Read a chunk or combined document as reduction input.
/// @note A combined document is re-emitted via CombinedResult::asChunkResult
///       using the file path as its source identifier.
[[nodiscard]] Result<algo::ChunkResult> readChunkResultFile(const std::filesystem::path& path);

}  // namespace fqs::format

#endif  // FQS_FORMAT_RESULT_JSON_H
