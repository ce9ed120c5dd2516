#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace splitpack {

enum class PackMode {
    SplitThenZip,
    ZipThenSplit,
};

// Only meaningful for directory input under SplitThenZip.
enum class DirSplitMode {
    CompressSplitStore,
    StoreSplitCompress,
};

struct InputItem {
    std::string path;
    bool is_directory = false;
    std::uint64_t size_bytes = 0;
};

struct SplitBySize {
    std::uint64_t bytes = 0;
};

struct SplitByCount {
    std::uint64_t count = 0;
};

using SplitSpec = std::variant<SplitBySize, SplitByCount>;

struct PartDescriptor {
    std::uint64_t index = 0;
    std::string label;
    std::string path;
    std::string sha256;
};

struct PackRequest {
    InputItem input;
    std::string output_dir;
    SplitSpec split = SplitBySize{};
    PackMode mode = PackMode::SplitThenZip;
    DirSplitMode dir_mode = DirSplitMode::CompressSplitStore;
    std::optional<std::string> password;
    int compression_level = 6;
    bool overwrite_parts = false;
    // Polled between chunks; nullptr disables cancellation.
    const std::atomic_bool* cancel = nullptr;
};

struct PackResult {
    std::size_t part_count = 0;
    std::vector<PartDescriptor> parts;
    bool is_directory_input = false;
    std::string base_name;
    std::string parts_dir;
    PackMode mode = PackMode::SplitThenZip;

    std::vector<std::string> OrderedPartPaths() const;
};

struct ExplicitPartList {
    std::vector<std::string> paths;
};

struct DirectoryScan {
    std::string dir;
    // Inferred from the single part group in `dir` when absent.
    std::optional<std::string> base;
};

using PartSource = std::variant<ExplicitPartList, DirectoryScan>;

struct RestoreRequest {
    PartSource source = DirectoryScan{};
    PackMode mode = PackMode::SplitThenZip;
    std::string output_dir;
    std::optional<std::string> password;
    bool auto_extract = false;

    std::optional<std::string> output_file;
    bool keep_scratch = false;
    bool keep_intermediate_zip = false;
    // Ordered per-part digests (SplitThenZip packs); verified before reassembly.
    std::optional<std::vector<std::string>> expected_hashes;
    const std::atomic_bool* cancel = nullptr;
};

struct RestoreResult {
    std::optional<std::string> merged_file;
    std::optional<std::string> extracted_dir;
    std::vector<std::string> output_files;
};

} // namespace splitpack
