#include "splitpack/zip_codec.hpp"

#include "splitpack/archive_path_policy.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>

namespace splitpack {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

constexpr size_t kZipBlockSize = 10240;
constexpr size_t kCopyBufferSize = 256 * 1024;

bool HasPassword(const std::optional<std::string>& pw) { return pw.has_value() && !pw->empty(); }

// Format options below ARCHIVE_WARN are fatal; WARN means the option is not
// known to this libarchive build and is only logged.
Result SetZipOption(archive* aw, const char* key, const std::string& value) {
    const int rc = archive_write_set_format_option(aw, "zip", key, value.c_str());
    if (rc == ARCHIVE_OK) return Result::Ok();
    if (rc == ARCHIVE_WARN) {
        LogWarn("zip option %s=%s ignored: %s", key, value.c_str(), ArchiveErr(aw).c_str());
        return Result::Ok();
    }
    return Result::Fail(ErrorKind::CodecFailure,
                        std::string("zip option ") + key + "=" + value + ": " + ArchiveErr(aw));
}

std::unique_ptr<archive, ArchiveReadDeleter> OpenZipForRead(const std::string& zip_path,
                                                            const std::optional<std::string>& password,
                                                            Result& res) {
    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) {
        res = Result::Fail(ErrorKind::CodecFailure, "archive_read_new failed");
        return nullptr;
    }

    archive_read_support_format_zip(ar.get());
    if (HasPassword(password)) {
        archive_read_add_passphrase(ar.get(), password->c_str());
    }

    if (archive_read_open_filename(ar.get(), zip_path.c_str(), kZipBlockSize) != ARCHIVE_OK) {
        res = Result::Fail(ErrorKind::CodecFailure, "cannot open zip " + zip_path + ": " + ArchiveErr(ar.get()))
                  .WithPath(zip_path);
        return nullptr;
    }
    res = Result::Ok();
    return ar;
}

} // namespace

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

bool LooksLikeZip(const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return false;
    unsigned char sig[4]{};
    const size_t n = std::fread(sig, 1, sizeof(sig), f);
    std::fclose(f);
    if (n < sizeof(sig) || sig[0] != 0x50 || sig[1] != 0x4b) return false;
    return (sig[2] == 0x03 && sig[3] == 0x04) ||
           (sig[2] == 0x05 && sig[3] == 0x06) ||
           (sig[2] == 0x07 && sig[3] == 0x08);
}

ZipWriter::~ZipWriter() {
    if (aw_) {
        // Not closed: the archive is incomplete either way, just release it.
        archive_write_free(aw_);
        aw_ = nullptr;
    }
}

Result ZipWriter::Fail(const std::string& what) const {
    return Result::Fail(ErrorKind::CodecFailure, what + ": " + ArchiveErr(aw_)).WithPath(path_);
}

Result ZipWriter::Open(const std::string& zip_path, const ZipOptions& opt) {
    if (aw_) return Result::Fail(ErrorKind::CodecFailure, "zip writer already open");
    path_ = zip_path;

    aw_ = archive_write_new();
    if (!aw_) return Result::Fail(ErrorKind::CodecFailure, "archive_write_new failed");

    if (archive_write_set_format_zip(aw_) != ARCHIVE_OK) return Fail("archive_write_set_format_zip");

    if (opt.method == ZipMethod::Store) {
        auto r = SetZipOption(aw_, "compression", "store");
        if (!r.is_ok()) return r;
    } else {
        auto r = SetZipOption(aw_, "compression", "deflate");
        if (!r.is_ok()) return r;
        const int level = std::clamp(opt.level, 1, 9);
        r = SetZipOption(aw_, "compression-level", std::to_string(level));
        if (!r.is_ok()) return r;
    }

    if (HasPassword(opt.password)) {
        auto r = SetZipOption(aw_, "encryption", "aes256");
        if (!r.is_ok()) return r;
        if (archive_write_set_passphrase(aw_, opt.password->c_str()) != ARCHIVE_OK) {
            return Fail("archive_write_set_passphrase");
        }
    }

    archive_write_set_bytes_in_last_block(aw_, 1);
    if (archive_write_open_filename(aw_, zip_path.c_str()) != ARCHIVE_OK) {
        return Fail("cannot create " + zip_path);
    }
    return Result::Ok();
}

Result ZipWriter::AddFile(const std::string& entry_name,
                          IReader& src,
                          std::uint64_t size,
                          std::time_t mtime,
                          const CopyProgressFn& on_progress) {
    if (!aw_) return Result::Fail(ErrorKind::CodecFailure, "zip writer not open");

    std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
    if (!entry) return Result::Fail(ErrorKind::CodecFailure, "archive_entry_new failed");
    archive_entry_set_pathname(entry.get(), entry_name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
    archive_entry_set_mtime(entry.get(), mtime, 0);

    if (archive_write_header(aw_, entry.get()) != ARCHIVE_OK) {
        return Fail("archive_write_header " + entry_name);
    }

    std::vector<std::uint8_t> buf(static_cast<size_t>(std::min<std::uint64_t>(kCopyBufferSize, std::max<std::uint64_t>(size, 1))));
    std::uint64_t remaining = size;
    while (remaining > 0) {
        const size_t want = static_cast<size_t>(std::min<std::uint64_t>(buf.size(), remaining));
        const ssize_t n = src.Read(std::span<std::uint8_t>(buf.data(), want));
        if (n < 0) return Result::Fail(EIO, "read failed while adding " + entry_name);
        if (n == 0) return Result::Fail(EIO, "unexpected end of input while adding " + entry_name);

        size_t off = 0;
        while (off < static_cast<size_t>(n)) {
            const la_ssize_t w = archive_write_data(aw_, buf.data() + off, static_cast<size_t>(n) - off);
            if (w <= 0) return Fail("archive_write_data " + entry_name);
            off += static_cast<size_t>(w);
        }

        remaining -= static_cast<std::uint64_t>(n);
        if (on_progress) on_progress(static_cast<std::uint64_t>(n));
    }

    if (archive_write_finish_entry(aw_) != ARCHIVE_OK) {
        return Fail("archive_write_finish_entry " + entry_name);
    }
    return Result::Ok();
}

Result ZipWriter::AddDirectory(const std::string& entry_name, std::time_t mtime) {
    if (!aw_) return Result::Fail(ErrorKind::CodecFailure, "zip writer not open");

    std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
    if (!entry) return Result::Fail(ErrorKind::CodecFailure, "archive_entry_new failed");
    const std::string name = entry_name + "/";
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFDIR);
    archive_entry_set_perm(entry.get(), 0755);
    archive_entry_set_size(entry.get(), 0);
    archive_entry_set_mtime(entry.get(), mtime, 0);

    if (archive_write_header(aw_, entry.get()) != ARCHIVE_OK) {
        return Fail("archive_write_header " + name);
    }
    if (archive_write_finish_entry(aw_) != ARCHIVE_OK) {
        return Fail("archive_write_finish_entry " + name);
    }
    return Result::Ok();
}

Result ZipWriter::Close() {
    if (!aw_) return Result::Fail(ErrorKind::CodecFailure, "zip writer not open");

    const int rc = archive_write_close(aw_);
    Result res = Result::Ok();
    if (rc != ARCHIVE_OK) {
        res = Fail("archive_write_close");
    }
    archive_write_free(aw_);
    aw_ = nullptr;
    return res;
}

Result ZipExtractor::UncompressedSize(const std::string& zip_path, std::uint64_t& out_total) const {
    out_total = 0;
    Result res;
    auto ar = OpenZipForRead(zip_path, opt_.password, res);
    if (!ar) return res;

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::CodecFailure, "archive_read_next_header: " + ArchiveErr(ar.get()))
                .WithPath(zip_path);
        }
        if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
            out_total += static_cast<std::uint64_t>(archive_entry_size(entry));
        }
    }
    return Result::Ok();
}

Result ZipExtractor::ExtractToDir(const std::string& zip_path,
                                  const std::string& dst_dir,
                                  std::vector<std::string>* out_entries) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ENOTDIR, "Destination is not a directory: " + dst_dir).WithPath(dst_dir);
    }

    std::uint64_t declared_total = 0;
    if (opt_.progress_sink) {
        auto sr = UncompressedSize(zip_path, declared_total);
        if (!sr.is_ok()) return sr;
    }

    Result res;
    auto ar = OpenZipForRead(zip_path, opt_.password, res);
    if (!ar) return res;

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(ErrorKind::CodecFailure, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.
    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    std::uint64_t extracted = 0;

    auto emit_progress = [&]() {
        if (!opt_.progress_sink) return;
        ProgressEvent event{};
        event.phase = opt_.phase;
        event.processed_bytes = extracted;
        event.total_bytes = declared_total;
        event.part_index = opt_.part_index;
        event.part_total = opt_.part_total;
        event.message = "extracting " + fs::path(zip_path).filename().string();
        opt_.progress_sink->OnProgress(event);
    };

    auto codec_fail = [&](const std::string& what, archive* a) {
        return Result::Fail(ErrorKind::CodecFailure, what + ": " + ArchiveErr(a)).WithPath(zip_path);
    };

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) return codec_fail("archive_read_next_header", ar.get());

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res.WithPath(zip_path);
        if (rel.empty() || rel == ".") {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        LogDebug("extract %s -> %s", rel.c_str(), target_path.c_str());

        if (archive_write_header(aw.get(), entry) != ARCHIVE_OK) {
            return codec_fail("archive_write_header " + rel, aw.get());
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK && rr != ARCHIVE_WARN) {
                return codec_fail("cannot read " + rel + " (wrong password or corrupt archive?)", ar.get());
            }

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return codec_fail("archive_write_data_block " + rel, aw.get());

            extracted += static_cast<std::uint64_t>(size);
        }

        if (archive_write_finish_entry(aw.get()) != ARCHIVE_OK) {
            return codec_fail("archive_write_finish_entry " + rel, aw.get());
        }
        if (out_entries) out_entries->push_back(rel);
        emit_progress();
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return codec_fail("archive_write_close", aw.get());
    }
    return Result::Ok();
}

} // namespace splitpack
