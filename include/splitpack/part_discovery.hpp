#pragma once

#include "splitpack/types.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace splitpack {

struct DiscoveredParts {
    std::string base;
    // Ascending numeric index.
    std::vector<PartDescriptor> parts;
};

// Finds the ordered part set of one pack operation from file names alone.
// The From* functions are pure: they never touch the file system.
class PartDiscovery {
public:
    // Names that do not parse are dropped; mixed bases fail InconsistentBase;
    // nothing left fails NoPartsFound.
    static Result FromPaths(PackMode mode, const std::vector<std::string>& paths, DiscoveredParts& out);

    // Keeps the names in `names` (entries of `dir`) that parse with `base`.
    // Without a base, the directory must hold exactly one part group.
    static Result FromDirectoryListing(PackMode mode,
                                       const std::string& dir,
                                       const std::optional<std::string>& base,
                                       const std::vector<std::string>& names,
                                       DiscoveredParts& out);

    // Indices must be exactly 1..N.
    static Result CheckContiguous(const DiscoveredParts& parts);

    // Regular-file names in `dir`, unsorted.
    static Result ListDirectory(const std::string& dir, std::vector<std::string>& names);

    // Resolves `source` (listing directories as needed), then checks contiguity.
    static Result Discover(PackMode mode, const PartSource& source, DiscoveredParts& out);

    // A directory becomes a scan with an inferred base; a part file becomes a
    // scan of its parent restricted to the file's base.
    static Result ResolveInputPath(PackMode mode, const std::string& input_path, PartSource& out);
};

} // namespace splitpack
