#pragma once

#include "splitpack/progress.hpp"
#include "splitpack/types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace splitpack {

// External spellings: "split-then-zip" / "zip-then-split".
std::expected<PackMode, std::string> ParsePackMode(std::string_view s);
const char* PackModeName(PackMode mode);

// External spellings: "compress-split-store" / "store-split-compress".
std::expected<DirSplitMode, std::string> ParseDirSplitMode(std::string_view s);
const char* DirSplitModeName(DirSplitMode mode);

// "<digits>[B|K|KB|M|MB|G|GB]", case-insensitive, 1024-based. A bare number
// is bytes. Byte-denominated sizes below 1024 are rejected.
std::expected<std::uint64_t, std::string> ParseSizeWithUnit(std::string_view s);

nlohmann::json ProgressEventToJson(const ProgressEvent& e);

// {"ok":false,"error":"<kind>","message":...} plus phase/partIndex/path when set.
nlohmann::json ResultToJson(const Result& r);

// Pack call: {inputPath, outputDir, splitBy:"size"|"count", sizeBytes|count,
// packMode, dirSplitMode, password?, compressionLevel, overwriteParts}.
// Only input.path is filled; Packer::ResolveInput completes the InputItem.
std::expected<PackRequest, std::string> PackRequestFromJson(const nlohmann::json& j);

// {parts: count, outputFiles, isDir, baseName, partSha256s:[{path, sha256}]}
// partSha256s is empty for ZipThenSplit.
nlohmann::json PackResultToJson(const PackResult& r);

struct RestoreCall {
    // One part file or the directory holding the parts.
    std::string input_path;
    RestoreRequest request;
};

// Restore call: {inputPath, outputDir, mergeMode, password?, autoExtract,
// outputFile?, keepTemp, keepZip}. `request.source` is left for
// PartDiscovery::ResolveInputPath.
std::expected<RestoreCall, std::string> RestoreCallFromJson(const nlohmann::json& j);

// {mergedFile?, extractedDir?, outputFiles}
nlohmann::json RestoreResultToJson(const RestoreResult& r);

// Full translation round: parse, run the engine, render. Parse failures
// become InvalidSpec. `out` holds the response on success.
Result PackFromJson(const nlohmann::json& in, IProgress* progress, nlohmann::json& out);
Result RestoreFromJson(const nlohmann::json& in, IProgress* progress, nlohmann::json& out);

} // namespace splitpack
