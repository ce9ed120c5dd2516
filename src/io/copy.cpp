#include "io/copy.hpp"

#include <algorithm>
#include <cerrno>
#include <vector>

namespace splitpack {

namespace {
constexpr size_t kCopyBufferSize = 1024 * 1024;
} // namespace

Result CopyN(IReader& src, IWriter& dst, std::uint64_t count, const CopyProgressFn& on_progress) {
    std::vector<std::uint8_t> buf(static_cast<size_t>(std::min<std::uint64_t>(kCopyBufferSize, count)));
    std::uint64_t remaining = count;

    while (remaining > 0) {
        const size_t want = static_cast<size_t>(std::min<std::uint64_t>(buf.size(), remaining));
        const ssize_t n = src.Read(std::span<std::uint8_t>(buf.data(), want));
        if (n < 0) return Result::Fail(errno ? errno : EIO, "read failed");
        if (n == 0) return Result::Fail(EIO, "unexpected end of input");

        auto w = dst.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!w.is_ok()) return w;

        remaining -= static_cast<std::uint64_t>(n);
        if (on_progress) on_progress(static_cast<std::uint64_t>(n));
    }
    return Result::Ok();
}

Result CopyAll(IReader& src, IWriter& dst, std::uint64_t& copied, const CopyProgressFn& on_progress) {
    std::vector<std::uint8_t> buf(kCopyBufferSize);
    copied = 0;

    while (true) {
        const ssize_t n = src.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) return Result::Fail(errno ? errno : EIO, "read failed");
        if (n == 0) break;

        auto w = dst.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!w.is_ok()) return w;

        copied += static_cast<std::uint64_t>(n);
        if (on_progress) on_progress(static_cast<std::uint64_t>(n));
    }
    return Result::Ok();
}

} // namespace splitpack
