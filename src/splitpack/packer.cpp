#include "splitpack/packer.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/copy.hpp"
#include "splitpack/dir_archiver.hpp"
#include "splitpack/part_namer.hpp"
#include "splitpack/part_verifier.hpp"
#include "splitpack/scratch_dir.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace splitpack {

namespace fs = std::filesystem;

struct Packer::Job {
    const PackRequest& req;
    std::string base;
    std::string parts_dir;
    std::time_t mtime = 0;
    std::vector<PartDescriptor> parts;
};

namespace {

const char* ModeName(PackMode mode) {
    return mode == PackMode::SplitThenZip ? "split-then-zip" : "zip-then-split";
}

Result FileSize(const std::string& path, std::uint64_t& out) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return Result::Fail(errno, "stat failed: " + path + " (" + std::strerror(errno) + ")").WithPath(path);
    }
    out = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

Result ValidateRequest(const PackRequest& req) {
    if (req.compression_level < 1 || req.compression_level > 9) {
        return Result::Fail(ErrorKind::InvalidSpec,
                            "compression level must be within 1..9, got " + std::to_string(req.compression_level));
    }
    if (const auto* s = std::get_if<SplitBySize>(&req.split); s && s->bytes == 0) {
        return Result::Fail(ErrorKind::InvalidSpec, "part size must be greater than 0");
    }
    if (const auto* c = std::get_if<SplitByCount>(&req.split); c && c->count == 0) {
        return Result::Fail(ErrorKind::InvalidSpec, "part count must be greater than 0");
    }
    if (const auto* c = std::get_if<SplitByCount>(&req.split); c && c->count > ChunkPlanner::kMaxParts) {
        return Result::Fail(ErrorKind::InvalidSpec,
                            "part count " + std::to_string(c->count) + " exceeds limit " +
                                std::to_string(ChunkPlanner::kMaxParts));
    }
    if (req.output_dir.empty()) {
        return Result::Fail(ErrorKind::InvalidSpec, "output directory is required");
    }
    return Result::Ok();
}

} // namespace

Result Packer::ResolveInput(const std::string& path, InputItem& out) {
    out = InputItem{};
    out.path = path;

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return Result::Fail(errno, "input does not exist: " + path + " (" + std::strerror(errno) + ")")
            .WithPath(path);
    }

    if (S_ISDIR(st.st_mode)) {
        std::vector<TreeEntry> entries;
        std::uint64_t total = 0;
        auto r = DirectoryArchiver::Scan(path, entries, total);
        if (!r.is_ok()) return r;
        out.is_directory = true;
        out.size_bytes = total;
        return Result::Ok();
    }
    if (S_ISREG(st.st_mode)) {
        out.size_bytes = static_cast<std::uint64_t>(st.st_size);
        return Result::Ok();
    }
    return Result::Fail(ErrorKind::InvalidSpec, "input is neither a file nor a directory: " + path).WithPath(path);
}

bool Packer::Cancelled(const Job& job) const {
    return job.req.cancel && job.req.cancel->load(std::memory_order_relaxed);
}

void Packer::Emit(const char* phase,
                  std::uint64_t processed,
                  std::uint64_t total,
                  std::uint64_t part_index,
                  std::uint64_t part_total,
                  std::string message) const {
    if (!progress_sink_) return;
    ProgressEvent ev{};
    ev.phase = phase;
    ev.processed_bytes = processed;
    ev.total_bytes = total;
    ev.part_index = part_index;
    ev.part_total = part_total;
    ev.message = std::move(message);
    progress_sink_->OnProgress(ev);
}

Result Packer::PreparePartsDir(const std::string& parts_dir, bool overwrite) const {
    std::error_code ec;
    const auto st = fs::symlink_status(parts_dir, ec);
    if (fs::exists(st)) {
        if (!fs::is_directory(st)) {
            return Result::Fail(ENOTDIR, "parts path exists and is not a directory: " + parts_dir)
                .WithPath(parts_dir);
        }
        const bool empty = fs::is_empty(parts_dir, ec);
        if (ec) {
            return Result::Fail(ec.value(), "cannot inspect " + parts_dir + ": " + ec.message()).WithPath(parts_dir);
        }
        if (!empty && !overwrite) {
            return Result::Fail(ErrorKind::ConfirmationRequired,
                                "parts directory already exists and is not empty; overwrite must be confirmed")
                .WithPath(parts_dir);
        }
        if (!empty) {
            LogWarn("removing existing parts in %s", parts_dir.c_str());
            fs::remove_all(parts_dir, ec);
            if (ec) {
                return Result::Fail(ec.value(), "cannot clear " + parts_dir + ": " + ec.message()).WithPath(parts_dir);
            }
        }
    }

    fs::create_directories(parts_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create " + parts_dir + ": " + ec.message()).WithPath(parts_dir);
    }
    return Result::Ok();
}

Result Packer::WriteZipParts(Job& job,
                             const std::string& source,
                             std::uint64_t source_size,
                             const ZipOptions& part_opt) {
    std::vector<ChunkRange> chunks;
    auto r = ChunkPlanner::Plan(source_size, job.req.split, chunks);
    if (!r.is_ok()) return r.WithPhase(phase::kSplitting);

    const std::uint64_t part_total = chunks.size();
    LogInfo("writing %llu zip parts (%s) from %llu bytes",
            (unsigned long long)part_total,
            part_opt.method == ZipMethod::Store ? "store" : "deflate",
            (unsigned long long)source_size);
    Emit(phase::kSplitting, 0, source_size, 0, part_total, "splitting");

    std::uint64_t processed = 0;
    for (std::uint64_t i = 0; i < part_total; ++i) {
        const std::uint64_t index = i + 1;
        if (Cancelled(job)) {
            return Result::Fail(ErrorKind::Cancelled, "cancelled before part " + std::to_string(index))
                .WithPhase(phase::kSplitting);
        }

        PartDescriptor part;
        part.index = index;
        part.label = PartNamer::FormatLabel(index);
        part.path = job.parts_dir + "/" + PartNamer::PartFileName(PackMode::SplitThenZip, job.base, index);

        FileReader reader;
        r = FileReader::OpenRange(source, chunks[i].offset, chunks[i].length, reader);
        if (!r.is_ok()) return r.WithPhase(phase::kSplitting).WithPart(index).WithPath(source);

        ZipWriter zip;
        r = zip.Open(part.path, part_opt);
        if (!r.is_ok()) return r.WithPhase(phase::kSplitting).WithPart(index).WithPath(part.path);
        r = zip.AddFile(PartNamer::ChunkEntryName(job.base, part.label), reader, chunks[i].length, job.mtime);
        if (!r.is_ok()) return r.WithPhase(phase::kSplitting).WithPart(index).WithPath(part.path);
        r = zip.Close();
        if (!r.is_ok()) return r.WithPhase(phase::kSplitting).WithPart(index).WithPath(part.path);

        processed += chunks[i].length;
        LogDebug("part %s: %llu bytes", part.path.c_str(), (unsigned long long)chunks[i].length);
        Emit(phase::kSplitting, processed, source_size, index, part_total, "wrote part " + part.label);
        job.parts.push_back(std::move(part));
    }
    return Result::Ok();
}

Result Packer::WriteRawParts(Job& job, const std::string& blob, std::uint64_t blob_size) {
    std::vector<ChunkRange> chunks;
    auto r = ChunkPlanner::Plan(blob_size, job.req.split, chunks);
    if (!r.is_ok()) return r.WithPhase(phase::kSplitting);

    const std::uint64_t part_total = chunks.size();
    LogInfo("slicing %llu bytes into %llu raw parts",
            (unsigned long long)blob_size, (unsigned long long)part_total);
    Emit(phase::kSplitting, 0, blob_size, 0, part_total, "splitting");

    FileReader reader;
    r = FileReader::Open(blob, reader);
    if (!r.is_ok()) return r.WithPhase(phase::kSplitting).WithPath(blob);

    std::uint64_t processed = 0;
    for (std::uint64_t i = 0; i < part_total; ++i) {
        const std::uint64_t index = i + 1;
        if (Cancelled(job)) {
            return Result::Fail(ErrorKind::Cancelled, "cancelled before part " + std::to_string(index))
                .WithPhase(phase::kSplitting);
        }

        PartDescriptor part;
        part.index = index;
        part.label = PartNamer::FormatLabel(index);
        part.path = job.parts_dir + "/" + PartNamer::PartFileName(PackMode::ZipThenSplit, job.base, index);

        FileWriter writer;
        r = FileWriter::Open(part.path, writer);
        if (!r.is_ok()) return r.WithPhase(phase::kSplitting).WithPart(index).WithPath(part.path);
        r = CopyN(reader, writer, chunks[i].length);
        if (!r.is_ok()) return r.WithPhase(phase::kSplitting).WithPart(index).WithPath(part.path);
        r = writer.Finish();
        if (!r.is_ok()) return r.WithPhase(phase::kSplitting).WithPart(index).WithPath(part.path);

        processed += chunks[i].length;
        LogDebug("part %s: %llu bytes", part.path.c_str(), (unsigned long long)chunks[i].length);
        Emit(phase::kSplitting, processed, blob_size, index, part_total, "wrote part " + part.label);
        job.parts.push_back(std::move(part));
    }
    return Result::Ok();
}

Result Packer::ZipSingleFile(Job& job, const std::string& blob) {
    const InputItem& in = job.req.input;

    ZipOptions opt;
    opt.method = ZipMethod::Deflate;
    opt.level = job.req.compression_level;
    opt.password = job.req.password;

    FileReader reader;
    auto r = FileReader::Open(in.path, reader);
    if (!r.is_ok()) return r.WithPhase(phase::kZipping);

    Emit(phase::kZipping, 0, in.size_bytes, 0, 0, "zipping " + job.base);

    ZipWriter zip;
    r = zip.Open(blob, opt);
    if (!r.is_ok()) return r.WithPhase(phase::kZipping);

    std::uint64_t processed = 0;
    std::uint64_t next_emit = 0;
    r = zip.AddFile(job.base, reader, in.size_bytes, job.mtime, [&](std::uint64_t delta) {
        processed += delta;
        if (processed >= next_emit || processed == in.size_bytes) {
            next_emit = processed + 4 * 1024 * 1024ULL;
            Emit(phase::kZipping, processed, in.size_bytes, 0, 0, "zipping " + job.base);
        }
    });
    if (!r.is_ok()) return r.WithPhase(phase::kZipping);
    r = zip.Close();
    if (!r.is_ok()) return r.WithPhase(phase::kZipping);
    return Result::Ok();
}

Result Packer::HashParts(Job& job) {
    std::uint64_t total = 0;
    for (const auto& p : job.parts) {
        std::uint64_t sz = 0;
        auto r = FileSize(p.path, sz);
        if (!r.is_ok()) return r.WithPhase(phase::kHashing).WithPart(p.index);
        total += sz;
    }

    const std::uint64_t part_total = job.parts.size();
    std::uint64_t processed = 0;
    for (auto& p : job.parts) {
        if (Cancelled(job)) {
            return Result::Fail(ErrorKind::Cancelled, "cancelled while hashing").WithPhase(phase::kHashing);
        }
        auto r = PartVerifier::Digest(p.path, p.sha256);
        if (!r.is_ok()) return r.WithPhase(phase::kHashing).WithPart(p.index);

        std::uint64_t sz = 0;
        r = FileSize(p.path, sz);
        if (!r.is_ok()) return r.WithPhase(phase::kHashing).WithPart(p.index);
        processed += sz;
        Emit(phase::kHashing, processed, total, p.index, part_total, "sha256 " + p.label);
    }
    return Result::Ok();
}

Result Packer::Run(const PackRequest& req, PackResult& out) {
    out = PackResult{};

    auto r = ValidateRequest(req);
    if (!r.is_ok()) return r;

    const InputItem& in = req.input;
    Job job{req, BaseNameOf(in.path), {}, 0, {}};
    if (job.base.empty() || job.base == "." || job.base == "..") {
        return Result::Fail(ErrorKind::InvalidSpec, "cannot derive a base name from " + in.path).WithPath(in.path);
    }

    struct stat st{};
    if (::stat(in.path.c_str(), &st) != 0) {
        return Result::Fail(errno, "input does not exist: " + in.path + " (" + std::strerror(errno) + ")")
            .WithPath(in.path);
    }
    if (static_cast<bool>(S_ISDIR(st.st_mode)) != in.is_directory) {
        return Result::Fail(ErrorKind::InvalidSpec, "input kind changed since it was resolved: " + in.path)
            .WithPath(in.path);
    }
    job.mtime = st.st_mtime;

    if (in.is_directory && IsWithin(req.output_dir, in.path)) {
        return Result::Fail(ErrorKind::InvalidSpec, "output directory must not be inside the input directory")
            .WithPath(req.output_dir);
    }
    std::error_code ec;
    fs::create_directories(req.output_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create " + req.output_dir + ": " + ec.message())
            .WithPath(req.output_dir);
    }

    job.parts_dir = (fs::path(req.output_dir) / PartNamer::PartsDirName(job.base)).string();
    r = PreparePartsDir(job.parts_dir, req.overwrite_parts);
    if (!r.is_ok()) return r;

    LogInfo("packing %s %s (%llu bytes) into %s [%s]",
            in.is_directory ? "directory" : "file",
            in.path.c_str(),
            (unsigned long long)in.size_bytes,
            job.parts_dir.c_str(),
            ModeName(req.mode));

    ScratchDirectory scratch;
    r = ScratchDirectory::Create(req.output_dir, job.base + ".pack", scratch);
    if (!r.is_ok()) return r;
    const std::string blob = scratch.Join(job.base + ".zip");

    switch (req.mode) {
        case PackMode::SplitThenZip: {
            ZipOptions part_opt;
            part_opt.password = req.password;
            part_opt.level = req.compression_level;

            if (!in.is_directory) {
                part_opt.method = ZipMethod::Deflate;
                r = WriteZipParts(job, in.path, in.size_bytes, part_opt);
                if (!r.is_ok()) return r;
                break;
            }

            DirectoryArchiver::Options dopt;
            dopt.progress_sink = progress_sink_;
            dopt.cancel = req.cancel;
            dopt.zip.level = req.compression_level;
            if (req.dir_mode == DirSplitMode::CompressSplitStore) {
                // The tree is compressed once; parts only wrap it.
                dopt.zip.method = ZipMethod::Deflate;
                part_opt.method = ZipMethod::Store;
            } else {
                dopt.zip.method = ZipMethod::Store;
                part_opt.method = ZipMethod::Deflate;
            }

            r = DirectoryArchiver(dopt).ZipTree(in.path, blob);
            if (!r.is_ok()) return r;

            std::uint64_t blob_size = 0;
            r = FileSize(blob, blob_size);
            if (!r.is_ok()) return r.WithPhase(phase::kSplitting);
            r = WriteZipParts(job, blob, blob_size, part_opt);
            if (!r.is_ok()) return r;
            break;
        }
        case PackMode::ZipThenSplit: {
            if (in.is_directory) {
                DirectoryArchiver::Options dopt;
                dopt.progress_sink = progress_sink_;
                dopt.cancel = req.cancel;
                dopt.zip.method = ZipMethod::Deflate;
                dopt.zip.level = req.compression_level;
                dopt.zip.password = req.password;
                r = DirectoryArchiver(dopt).ZipTree(in.path, blob);
            } else {
                r = ZipSingleFile(job, blob);
            }
            if (!r.is_ok()) return r;

            std::uint64_t blob_size = 0;
            r = FileSize(blob, blob_size);
            if (!r.is_ok()) return r.WithPhase(phase::kSplitting);
            r = WriteRawParts(job, blob, blob_size);
            if (!r.is_ok()) return r;
            break;
        }
    }

    if (req.mode == PackMode::SplitThenZip) {
        r = HashParts(job);
        if (!r.is_ok()) return r;
    }

    out.part_count = job.parts.size();
    out.parts = std::move(job.parts);
    out.is_directory_input = in.is_directory;
    out.base_name = job.base;
    out.parts_dir = job.parts_dir;
    out.mode = req.mode;

    LogInfo("packed %s into %zu parts", job.base.c_str(), out.part_count);
    return Result::Ok();
}

} // namespace splitpack
