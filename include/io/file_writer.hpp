#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace splitpack {

// Writer for a regular output file. Open() creates or truncates.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    // fsync + close; reports deferred write errors.
    Result Finish();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace splitpack
