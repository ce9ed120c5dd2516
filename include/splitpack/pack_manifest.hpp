#pragma once

#include "splitpack/types.hpp"
#include "util/result.hpp"

#include <expected>
#include <string>
#include <vector>

namespace splitpack {

struct ManifestPart {
    // Relative to the pack output directory.
    std::string path;
    // Empty for zip-then-split parts.
    std::string sha256;
};

// "{base}.parts.json": what a consumer needs to fetch, check and restore a
// part set without re-parsing file names.
struct PackManifest {
    std::string base_name;
    PackMode mode = PackMode::SplitThenZip;
    bool is_dir = false;
    std::vector<ManifestPart> parts;

    static PackManifest FromResult(const PackResult& r, const std::string& output_dir);
    static std::string FileName(const std::string& base);

    bool HasDigests() const;
    std::vector<std::string> ResolvedPaths(const std::string& base_dir) const;
    std::vector<std::string> Digests() const;

    std::string ToJson() const;
};

class PackManifestParser {
public:
    std::expected<PackManifest, std::string> Parse(const std::string& json_input) const;
};

// Written via tmp + rename.
Result SavePackManifest(const PackManifest& m, const std::string& path);
// Unreadable file: IOFailure. Bad JSON or shape: InvalidSpec.
Result LoadPackManifest(const std::string& path, PackManifest& out);

} // namespace splitpack
