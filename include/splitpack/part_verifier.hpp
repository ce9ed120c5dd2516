#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace splitpack {

class PartVerifier {
public:
    // SHA-256 of one part file, lowercase hex.
    static Result Digest(const std::string& path, std::string& out_hex);

    // Paths (in input order) whose digest does not match the expected entry at
    // the same position, whose expected entry is missing or empty, or which
    // cannot be read. Empty when everything matches.
    static std::vector<std::string> Verify(const std::vector<std::string>& ordered_paths,
                                           const std::vector<std::string>& ordered_expected);
};

} // namespace splitpack
