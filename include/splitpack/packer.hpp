#pragma once

#include "splitpack/chunk_planner.hpp"
#include "splitpack/progress.hpp"
#include "splitpack/types.hpp"
#include "splitpack/zip_codec.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace splitpack {

// Pack engine: turns one file or directory into
// "<output_dir>/<base>.parts/<part files>".
//
//   file + split-then-zip         chunk the file, deflate each chunk into a part
//   file + zip-then-split         deflate the file into one zip, raw-slice it
//   dir  + split-then-zip (CSS)   deflate the tree, store-wrap each slice
//   dir  + split-then-zip (SSC)   store the tree, deflate-wrap each slice
//   dir  + zip-then-split         deflate the tree, raw-slice it
//
// Split-then-zip parts also get a SHA-256 each.
class Packer {
public:
    Packer() = default;

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    // Stats `path` into an InputItem (directory size = sum of regular files).
    static Result ResolveInput(const std::string& path, InputItem& out);

    Result Run(const PackRequest& req, PackResult& out);

private:
    struct Job;

    Result PreparePartsDir(const std::string& parts_dir, bool overwrite) const;
    Result WriteZipParts(Job& job,
                         const std::string& source,
                         std::uint64_t source_size,
                         const ZipOptions& part_opt);
    Result WriteRawParts(Job& job, const std::string& blob, std::uint64_t blob_size);
    Result ZipSingleFile(Job& job, const std::string& blob);
    Result HashParts(Job& job);

    bool Cancelled(const Job& job) const;
    void Emit(const char* phase,
              std::uint64_t processed,
              std::uint64_t total,
              std::uint64_t part_index,
              std::uint64_t part_total,
              std::string message) const;

    IProgress* progress_sink_ = nullptr;
};

} // namespace splitpack
