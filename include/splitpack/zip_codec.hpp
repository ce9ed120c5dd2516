#pragma once

#include "io/copy.hpp"
#include "io/io.hpp"
#include "splitpack/progress.hpp"
#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace splitpack {

enum class ZipMethod {
    Store,
    Deflate,
};

struct ZipOptions {
    ZipMethod method = ZipMethod::Deflate;
    // 1..9, only used by Deflate.
    int level = 6;
    // AES-256 entry encryption when set and non-empty.
    std::optional<std::string> password;
};

// Writes one zip archive to a file. All entries share the archive's options.
class ZipWriter {
public:
    ZipWriter() = default;
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    Result Open(const std::string& zip_path, const ZipOptions& opt);

    // Streams exactly `size` bytes from `src` into a regular-file entry.
    Result AddFile(const std::string& entry_name,
                   IReader& src,
                   std::uint64_t size,
                   std::time_t mtime,
                   const CopyProgressFn& on_progress = {});

    // `entry_name` without trailing slash; one is appended.
    Result AddDirectory(const std::string& entry_name, std::time_t mtime);

    // Finalizes the central directory. Must be called for a valid archive.
    Result Close();

private:
    Result Fail(const std::string& what) const;

    struct archive* aw_ = nullptr;
    std::string path_;
};

// Unpacks a zip archive into an existing directory.
class ZipExtractor {
public:
    struct Options {
        std::optional<std::string> password;
        bool safe_paths_only = true;

        IProgress* progress_sink = nullptr;
        std::string phase = phase::kExtracting;
        std::uint64_t part_index = 0;
        std::uint64_t part_total = 0;
    };

    ZipExtractor() = default;
    explicit ZipExtractor(const Options& opt) : opt_(opt) {}

    // Relative paths of the extracted entries are appended to `out_entries`
    // when non-null.
    Result ExtractToDir(const std::string& zip_path,
                        const std::string& dst_dir,
                        std::vector<std::string>* out_entries = nullptr) const;

    // Sum of declared uncompressed entry sizes.
    Result UncompressedSize(const std::string& zip_path, std::uint64_t& out_total) const;

private:
    Options opt_{};
};

// True when the file starts with a zip local-header, empty-archive or
// spanned-archive signature.
bool LooksLikeZip(const std::string& path);

std::string ArchiveErr(struct archive* ar);

} // namespace splitpack
