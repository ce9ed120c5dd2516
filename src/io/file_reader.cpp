#include "io/file_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace splitpack {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);
    out.remaining_.reset();

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open input: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return Result::Fail(errno, "fstat failed: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(EINVAL, "Not a regular file: " + out.path_);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);

    return Result::Ok();
}

Result FileReader::OpenRange(std::string path,
                             std::uint64_t offset,
                             std::uint64_t length,
                             FileReader& out) {
    auto r = Open(std::move(path), out);
    if (!r.is_ok()) return r;

    if (offset > *out.size_ || length > *out.size_ - offset) {
        return Result::Fail(EINVAL, "Range beyond end of file: " + out.path_);
    }
    if (::lseek(out.fd_.Get(), static_cast<off_t>(offset), SEEK_SET) < 0) {
        return Result::Fail(errno, "lseek failed: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.size_ = length;
    out.remaining_ = length;
    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    size_t want = out.size();
    if (remaining_) {
        if (*remaining_ == 0) return 0;
        want = static_cast<size_t>(std::min<std::uint64_t>(want, *remaining_));
    }

    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), want);
        if (n >= 0) {
            if (remaining_) *remaining_ -= static_cast<std::uint64_t>(n);
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace splitpack
