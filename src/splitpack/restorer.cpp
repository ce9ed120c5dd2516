#include "splitpack/restorer.hpp"

#include "io/copy.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "splitpack/part_namer.hpp"
#include "splitpack/part_verifier.hpp"
#include "splitpack/scratch_dir.hpp"
#include "splitpack/zip_codec.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace splitpack {

namespace fs = std::filesystem;

namespace {

// Removes a partially written file unless Release() was called.
class RemoveOnFailure {
public:
    explicit RemoveOnFailure(std::string path) : path_(std::move(path)) {}
    ~RemoveOnFailure() {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove(path_, ec);
    }
    RemoveOnFailure(const RemoveOnFailure&) = delete;
    RemoveOnFailure& operator=(const RemoveOnFailure&) = delete;

    void Release() { path_.clear(); }

private:
    std::string path_;
};

Result FileSize(const std::string& path, std::uint64_t& out) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return Result::Fail(errno, "stat failed: " + path + " (" + std::strerror(errno) + ")").WithPath(path);
    }
    out = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

Result TotalSize(const std::vector<std::string>& paths, std::uint64_t& out) {
    out = 0;
    for (const auto& p : paths) {
        std::uint64_t sz = 0;
        auto r = FileSize(p, sz);
        if (!r.is_ok()) return r;
        out += sz;
    }
    return Result::Ok();
}

bool HasZipSuffix(const std::string& name) {
    return StripZipExtension(name).size() != name.size();
}

// Moves `src` onto `dst`, replacing what is there. A directory is only ever
// replaced by a directory.
Result MoveReplacing(const std::string& src, const std::string& dst) {
    if (src == dst) return Result::Ok();
    std::error_code ec;
    const auto dst_st = fs::symlink_status(dst, ec);
    if (fs::is_directory(dst_st)) {
        if (!fs::is_directory(fs::symlink_status(src, ec))) {
            return Result::Fail(EISDIR, "destination is a directory: " + dst).WithPath(dst);
        }
        fs::remove_all(dst, ec);
        if (ec) return Result::Fail(ec.value(), "cannot replace " + dst + ": " + ec.message()).WithPath(dst);
    }
    const fs::path parent = fs::path(dst).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) return Result::Fail(ec.value(), "cannot create " + parent.string() + ": " + ec.message());
    }
    fs::rename(src, dst, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot move " + src + " to " + dst + ": " + ec.message()).WithPath(dst);
    }
    return Result::Ok();
}

// Every entry below `dir`, sorted. An empty directory lists itself.
std::vector<std::string> ListTree(const std::string& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        out.push_back(it->path().string());
    }
    std::sort(out.begin(), out.end());
    if (out.empty()) out.push_back(dir);
    return out;
}

} // namespace

bool Restorer::Cancelled(const RestoreRequest& req) const {
    return req.cancel && req.cancel->load(std::memory_order_relaxed);
}

void Restorer::Emit(const char* phase,
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

Result Restorer::VerifyHashes(const RestoreRequest& req, const DiscoveredParts& found) {
    const auto& expected = *req.expected_hashes;
    if (expected.size() != found.parts.size()) {
        return Result::Fail(ErrorKind::HashMismatch,
                            "expected " + std::to_string(expected.size()) + " digests for " +
                                std::to_string(found.parts.size()) + " parts")
            .WithPhase(phase::kVerifying);
    }

    std::vector<std::string> paths;
    paths.reserve(found.parts.size());
    for (const auto& p : found.parts) paths.push_back(p.path);

    std::uint64_t total = 0;
    auto r = TotalSize(paths, total);
    if (!r.is_ok()) return r.WithPhase(phase::kVerifying);

    const std::uint64_t part_total = found.parts.size();
    std::uint64_t processed = 0;
    std::vector<std::string> bad;
    for (std::size_t i = 0; i < found.parts.size(); ++i) {
        if (Cancelled(req)) {
            return Result::Fail(ErrorKind::Cancelled, "cancelled while verifying").WithPhase(phase::kVerifying);
        }
        const auto failed = PartVerifier::Verify({paths[i]}, {expected[i]});
        bad.insert(bad.end(), failed.begin(), failed.end());

        std::uint64_t sz = 0;
        if (FileSize(paths[i], sz).is_ok()) processed += sz;
        Emit(phase::kVerifying, processed, total, i + 1, part_total, "sha256 " + found.parts[i].label);
    }

    if (!bad.empty()) {
        std::string list;
        for (const auto& b : bad) {
            if (!list.empty()) list += ", ";
            list += b;
        }
        return Result::Fail(ErrorKind::HashMismatch, "digest mismatch: " + list)
            .WithPhase(phase::kVerifying)
            .WithPath(bad.front());
    }
    LogInfo("verified %zu part digests", found.parts.size());
    return Result::Ok();
}

Result Restorer::Concatenate(const RestoreRequest& req,
                             const std::vector<std::string>& inputs,
                             const std::string& dst) {
    std::uint64_t total = 0;
    auto r = TotalSize(inputs, total);
    if (!r.is_ok()) return r.WithPhase(phase::kMerging);

    FileWriter writer;
    r = FileWriter::Open(dst, writer);
    if (!r.is_ok()) return r.WithPhase(phase::kMerging).WithPath(dst);

    const std::uint64_t part_total = inputs.size();
    Emit(phase::kMerging, 0, total, 0, part_total, "merging");

    std::uint64_t processed = 0;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        const std::uint64_t index = i + 1;
        if (Cancelled(req)) {
            return Result::Fail(ErrorKind::Cancelled, "cancelled before part " + std::to_string(index))
                .WithPhase(phase::kMerging);
        }

        FileReader reader;
        r = FileReader::Open(inputs[i], reader);
        if (!r.is_ok()) return r.WithPhase(phase::kMerging).WithPart(index).WithPath(inputs[i]);

        std::uint64_t copied = 0;
        r = CopyAll(reader, writer, copied);
        if (!r.is_ok()) return r.WithPhase(phase::kMerging).WithPart(index).WithPath(dst);

        processed += copied;
        Emit(phase::kMerging, processed, total, index, part_total, "merged " + fs::path(inputs[i]).filename().string());
    }

    r = writer.Finish();
    if (!r.is_ok()) return r.WithPhase(phase::kMerging).WithPath(dst);
    return Result::Ok();
}

Result Restorer::ExtractMerged(const RestoreRequest& req,
                               const std::string& zip_path,
                               MergedZip policy,
                               RestoreResult& out) {
    ZipExtractor::Options opt;
    opt.password = req.password;
    opt.progress_sink = progress_sink_;
    opt.phase = phase::kExtracting;

    LogInfo("extracting %s into %s", zip_path.c_str(), req.output_dir.c_str());
    std::vector<std::string> entries;
    auto r = ZipExtractor(opt).ExtractToDir(zip_path, req.output_dir, &entries);
    if (!r.is_ok()) {
        LogError("extraction failed, keeping %s", zip_path.c_str());
        return r.WithPhase(phase::kExtracting).WithPath(zip_path);
    }

    const std::string natural =
        (fs::path(req.output_dir) / StripZipExtension(fs::path(zip_path).filename().string())).string();
    std::error_code ec;
    const auto st = fs::symlink_status(natural, ec);

    const bool remove_zip = policy == MergedZip::Remove ||
                            (policy == MergedZip::RemoveIfDirectory && fs::is_directory(st));
    if (remove_zip) {
        std::error_code rm_ec;
        if (!fs::remove(zip_path, rm_ec) || rm_ec) {
            LogWarn("could not remove %s: %s", zip_path.c_str(), rm_ec ? rm_ec.message().c_str() : "not found");
        }
    }

    out.merged_file.reset();
    out.extracted_dir.reset();
    out.output_files.clear();
    if (!remove_zip) out.merged_file = zip_path;

    if (fs::is_directory(st)) {
        std::string final_dir = natural;
        if (req.output_file && *req.output_file != natural) {
            r = MoveReplacing(natural, *req.output_file);
            if (!r.is_ok()) return r.WithPhase(phase::kExtracting);
            final_dir = *req.output_file;
        }
        out.extracted_dir = final_dir;
        out.output_files = ListTree(final_dir);
    } else if (fs::is_regular_file(st)) {
        std::string final_path = natural;
        if (req.output_file && *req.output_file != natural) {
            r = MoveReplacing(natural, *req.output_file);
            if (!r.is_ok()) return r.WithPhase(phase::kExtracting);
            final_path = *req.output_file;
        }
        out.merged_file = final_path;
        out.output_files.push_back(final_path);
    } else {
        // Entries were not rooted at the archive's own name.
        out.extracted_dir = req.output_dir;
        for (const auto& e : entries) {
            out.output_files.push_back((fs::path(req.output_dir) / e).string());
        }
        std::sort(out.output_files.begin(), out.output_files.end());
    }

    if (!remove_zip && policy == MergedZip::RemoveIfDirectory) {
        out.merged_file = zip_path;
        out.output_files.push_back(zip_path);
        std::sort(out.output_files.begin(), out.output_files.end());
    }
    return Result::Ok();
}

Result Restorer::RestoreSplitThenZip(const RestoreRequest& req, const DiscoveredParts& found, RestoreResult& out) {
    ScratchDirectory scratch;
    auto r = ScratchDirectory::Create(req.output_dir, found.base + ".restore", scratch);
    if (!r.is_ok()) return r;
    if (req.keep_scratch) scratch.Keep();

    std::vector<std::string> part_paths;
    for (const auto& p : found.parts) part_paths.push_back(p.path);
    std::uint64_t parts_total = 0;
    r = TotalSize(part_paths, parts_total);
    if (!r.is_ok()) return r.WithPhase(phase::kUnzipping);

    const std::uint64_t part_total = found.parts.size();
    Emit(phase::kUnzipping, 0, parts_total, 0, part_total, "unzipping");

    // Every part is opened before any output is written, so a bad password
    // leaves nothing behind.
    std::vector<std::string> chunks;
    std::uint64_t processed = 0;
    for (const auto& part : found.parts) {
        if (Cancelled(req)) {
            return Result::Fail(ErrorKind::Cancelled, "cancelled before part " + std::to_string(part.index))
                .WithPhase(phase::kUnzipping);
        }

        ZipExtractor::Options opt;
        opt.password = req.password;
        r = ZipExtractor(opt).ExtractToDir(part.path, scratch.Path());
        if (!r.is_ok()) return r.WithPhase(phase::kUnzipping).WithPart(part.index).WithPath(part.path);

        const std::string chunk = scratch.Join(PartNamer::ChunkEntryName(found.base, part.label));
        std::error_code ec;
        if (!fs::is_regular_file(chunk, ec)) {
            return Result::Fail(ErrorKind::CodecFailure,
                                "part does not contain " + PartNamer::ChunkEntryName(found.base, part.label))
                .WithPhase(phase::kUnzipping)
                .WithPart(part.index)
                .WithPath(part.path);
        }
        chunks.push_back(chunk);

        std::uint64_t sz = 0;
        if (FileSize(part.path, sz).is_ok()) processed += sz;
        Emit(phase::kUnzipping, processed, parts_total, part.index, part_total, "unzipped part " + part.label);
    }

    const std::string tmp = (fs::path(req.output_dir) / (found.base + ".merge.tmp")).string();
    RemoveOnFailure tmp_guard(tmp);
    r = Concatenate(req, chunks, tmp);
    if (!r.is_ok()) return r;

    const bool is_zip = LooksLikeZip(tmp);
    const bool extract = req.auto_extract && is_zip;
    std::string final_path;
    // When extracting, outputFile names the extracted item instead of the zip.
    if (req.output_file && !extract) {
        final_path = *req.output_file;
    } else {
        std::string name = found.base;
        if (is_zip && !HasZipSuffix(name)) name += ".zip";
        final_path = (fs::path(req.output_dir) / name).string();
    }

    r = MoveReplacing(tmp, final_path);
    if (!r.is_ok()) return r.WithPhase(phase::kMerging);
    tmp_guard.Release();
    LogInfo("merged %zu parts into %s", found.parts.size(), final_path.c_str());

    out.merged_file = final_path;
    out.output_files = {final_path};

    if (extract) {
        // A packed directory comes back as {base}.zip holding {base}/; a packed
        // file that was itself a zip comes back as that zip and stays.
        return ExtractMerged(req,
                             final_path,
                             req.keep_intermediate_zip ? MergedZip::Keep : MergedZip::RemoveIfDirectory,
                             out);
    }
    return Result::Ok();
}

Result Restorer::RestoreZipThenSplit(const RestoreRequest& req, const DiscoveredParts& found, RestoreResult& out) {
    std::vector<std::string> part_paths;
    for (const auto& p : found.parts) part_paths.push_back(p.path);

    const std::string blob = (fs::path(req.output_dir) / (found.base + ".zip")).string();
    RemoveOnFailure blob_guard(blob);
    auto r = Concatenate(req, part_paths, blob);
    if (!r.is_ok()) return r;
    blob_guard.Release();
    LogInfo("merged %zu parts into %s", found.parts.size(), blob.c_str());

    if (!req.auto_extract) {
        std::string final_path = blob;
        if (req.output_file) {
            r = MoveReplacing(blob, *req.output_file);
            if (!r.is_ok()) return r.WithPhase(phase::kMerging);
            final_path = *req.output_file;
        }
        out.merged_file = final_path;
        out.output_files = {final_path};
        return Result::Ok();
    }

    return ExtractMerged(req, blob, req.keep_intermediate_zip ? MergedZip::Keep : MergedZip::Remove, out);
}

Result Restorer::Run(const RestoreRequest& req, RestoreResult& out) {
    out = RestoreResult{};

    if (req.output_dir.empty()) {
        return Result::Fail(ErrorKind::InvalidSpec, "output directory is required");
    }

    DiscoveredParts found;
    auto r = PartDiscovery::Discover(req.mode, req.source, found);
    if (!r.is_ok()) return r;
    LogInfo("restoring %s from %zu parts", found.base.c_str(), found.parts.size());

    std::error_code ec;
    fs::create_directories(req.output_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create " + req.output_dir + ": " + ec.message())
            .WithPath(req.output_dir);
    }

    if (req.expected_hashes) {
        r = VerifyHashes(req, found);
        if (!r.is_ok()) return r;
    }

    switch (req.mode) {
        case PackMode::SplitThenZip:
            r = RestoreSplitThenZip(req, found, out);
            break;
        case PackMode::ZipThenSplit:
            r = RestoreZipThenSplit(req, found, out);
            break;
    }
    if (!r.is_ok()) {
        out = RestoreResult{};
        return r;
    }
    return Result::Ok();
}

} // namespace splitpack
