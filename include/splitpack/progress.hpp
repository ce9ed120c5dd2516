#pragma once
#include <cstdint>
#include <string>

namespace splitpack {

namespace phase {
inline constexpr const char kZipping[] = "zipping";
inline constexpr const char kSplitting[] = "splitting";
inline constexpr const char kHashing[] = "hashing";
inline constexpr const char kVerifying[] = "verifying";
inline constexpr const char kUnzipping[] = "unzipping";
inline constexpr const char kMerging[] = "merging";
inline constexpr const char kExtracting[] = "extracting";
} // namespace phase

struct ProgressEvent {
    std::string phase;
    std::uint64_t processed_bytes = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t part_index = 0;
    std::uint64_t part_total = 0;
    std::string message;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace splitpack
