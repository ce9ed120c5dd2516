#pragma once

#include "util/result.hpp"

#include <string>

namespace splitpack {

class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    // Cleans a raw zip entry name into a relative path ("" for the root).
    // With safe_paths_only, absolute names and ".." segments are rejected.
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);

  private:
    bool safe_paths_only_ = true;
};

} // namespace splitpack
