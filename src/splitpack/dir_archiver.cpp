#include "splitpack/dir_archiver.hpp"

#include "io/file_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace splitpack {

namespace {

Result ScanInto(const std::filesystem::path& root,
                const std::filesystem::path& dir,
                std::vector<TreeEntry>& out,
                std::uint64_t& total_bytes) {
    namespace fs = std::filesystem;

    std::error_code ec;
    std::vector<fs::path> children;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        return Result::Fail(ec.value(), "cannot list " + dir.string() + ": " + ec.message())
            .WithPath(dir.string());
    }
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        struct stat st{};
        if (::lstat(child.c_str(), &st) != 0) {
            return Result::Fail(errno, "stat failed: " + child.string() + " (" + std::strerror(errno) + ")")
                .WithPath(child.string());
        }

        TreeEntry e;
        e.abs = child.string();
        e.rel = fs::relative(child, root, ec).generic_string();
        if (ec) {
            return Result::Fail(ec.value(), "cannot relativize " + child.string()).WithPath(child.string());
        }
        e.mtime = st.st_mtime;

        if (S_ISDIR(st.st_mode)) {
            e.is_dir = true;
            out.push_back(e);
            auto r = ScanInto(root, child, out, total_bytes);
            if (!r.is_ok()) return r;
        } else if (S_ISREG(st.st_mode)) {
            e.size = static_cast<std::uint64_t>(st.st_size);
            total_bytes += e.size;
            out.push_back(e);
        } else {
            LogWarn("skipping non-regular entry %s", child.c_str());
        }
    }
    return Result::Ok();
}

std::time_t MtimeOf(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    return st.st_mtime;
}

} // namespace

Result DirectoryArchiver::Scan(const std::string& root, std::vector<TreeEntry>& out, std::uint64_t& total_bytes) {
    out.clear();
    total_bytes = 0;
    return ScanInto(std::filesystem::path(root), std::filesystem::path(root), out, total_bytes);
}

Result DirectoryArchiver::ZipTree(const std::string& root, const std::string& zip_path) const {
    const std::string root_name = BaseNameOf(root);

    std::vector<TreeEntry> entries;
    std::uint64_t total = 0;
    auto sr = Scan(root, entries, total);
    if (!sr.is_ok()) return sr.WithPhase(opt_.phase);

    LogInfo("zipping directory %s: %zu entries, %llu bytes",
            root.c_str(), entries.size(), (unsigned long long)total);

    ZipWriter zip;
    auto r = zip.Open(zip_path, opt_.zip);
    if (!r.is_ok()) return r.WithPhase(opt_.phase);

    std::uint64_t processed = 0;
    auto emit = [&](const std::string& msg) {
        if (!opt_.progress_sink) return;
        ProgressEvent ev{};
        ev.phase = opt_.phase;
        ev.processed_bytes = processed;
        ev.total_bytes = total;
        ev.message = msg;
        opt_.progress_sink->OnProgress(ev);
    };

    emit("zipping " + root_name);

    // Root entry first so an empty tree still yields "<root>/".
    r = zip.AddDirectory(root_name, MtimeOf(root));
    if (!r.is_ok()) return r.WithPhase(opt_.phase);

    for (const auto& e : entries) {
        if (opt_.cancel && opt_.cancel->load(std::memory_order_relaxed)) {
            return Result::Fail(ErrorKind::Cancelled, "cancelled while zipping").WithPhase(opt_.phase);
        }

        const std::string name = root_name + "/" + e.rel;
        if (e.is_dir) {
            r = zip.AddDirectory(name, e.mtime);
            if (!r.is_ok()) return r.WithPhase(opt_.phase);
            continue;
        }

        FileReader reader;
        r = FileReader::Open(e.abs, reader);
        if (!r.is_ok()) return r.WithPhase(opt_.phase).WithPath(e.abs);

        LogDebug("zip entry %s (%llu bytes)", name.c_str(), (unsigned long long)e.size);
        r = zip.AddFile(name, reader, e.size, e.mtime, [&](std::uint64_t delta) { processed += delta; });
        if (!r.is_ok()) return r.WithPhase(opt_.phase).WithPath(e.abs);
        emit(e.rel);
    }

    r = zip.Close();
    if (!r.is_ok()) return r.WithPhase(opt_.phase);
    return Result::Ok();
}

} // namespace splitpack
