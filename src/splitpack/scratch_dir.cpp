#include "splitpack/scratch_dir.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace splitpack {

Result ScratchDirectory::Create(const std::string& parent, const std::string& prefix, ScratchDirectory& out) {
    std::string tmpl = parent + "/." + prefix + "-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (!::mkdtemp(buf.data())) {
        return Result::Fail(errno, "mkdtemp failed in " + parent + " (" + std::strerror(errno) + ")")
            .WithPath(parent);
    }
    out.Cleanup();
    out.path_ = buf.data();
    out.keep_ = false;
    return Result::Ok();
}

ScratchDirectory::ScratchDirectory() = default;
ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept { *this = std::move(other); }
ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        keep_ = other.keep_;
        other.path_.clear();
    }
    return *this;
}
ScratchDirectory::~ScratchDirectory() { Cleanup(); }

const std::string& ScratchDirectory::Path() const { return path_; }

std::string ScratchDirectory::Join(const std::string& name) const { return path_ + "/" + name; }

void ScratchDirectory::Cleanup() {
    if (path_.empty()) return;
    if (keep_) {
        LogInfo("keeping scratch directory %s", path_.c_str());
    } else {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LogWarn("cannot remove scratch directory %s: %s", path_.c_str(), ec.message().c_str());
        }
    }
    path_.clear();
}

} // namespace splitpack
