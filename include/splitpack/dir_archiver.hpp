#pragma once

#include "splitpack/progress.hpp"
#include "splitpack/zip_codec.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace splitpack {

struct TreeEntry {
    // Path relative to the scanned root, '/'-separated.
    std::string rel;
    std::string abs;
    bool is_dir = false;
    std::uint64_t size = 0;
    std::time_t mtime = 0;
};

// Zips a directory tree into one archive with every entry rooted under the
// directory's own name. Entries are visited in sorted order; directories get
// explicit entries so empty ones survive. Symlinks and special files are
// skipped.
class DirectoryArchiver {
  public:
    struct Options {
        ZipOptions zip;
        IProgress* progress_sink = nullptr;
        std::string phase = phase::kZipping;
        const std::atomic_bool* cancel = nullptr;
    };

    DirectoryArchiver() = default;
    explicit DirectoryArchiver(const Options& opt) : opt_(opt) {}

    static Result Scan(const std::string& root, std::vector<TreeEntry>& out, std::uint64_t& total_bytes);

    Result ZipTree(const std::string& root, const std::string& zip_path) const;

  private:
    Options opt_{};
};

} // namespace splitpack
