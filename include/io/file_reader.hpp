#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace splitpack {

// Reads a regular file, optionally limited to the byte window
// [offset, offset + length).
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);
    static Result OpenRange(std::string path,
                            std::uint64_t offset,
                            std::uint64_t length,
                            FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string &Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    std::optional<std::uint64_t> remaining_;
};

} // namespace splitpack
