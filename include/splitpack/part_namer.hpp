#pragma once

#include "splitpack/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace splitpack {

struct ParsedPartName {
    std::string base;
    std::uint64_t index = 0;
    // Digits exactly as they appear in the file name.
    std::string label;

    bool operator==(const ParsedPartName&) const = default;
};

// Naming scheme:
//   SplitThenZip: {base}.part-{label}.zip
//   ZipThenSplit: {base}.zip.part-{label}
// where label is the index zero-padded to four digits (wider when needed).
class PartNamer {
public:
    static constexpr int kLabelWidth = 4;

    static std::string FormatLabel(std::uint64_t index);
    static std::string PartFileName(PackMode mode, std::string_view base, std::uint64_t index);
    static std::optional<ParsedPartName> Parse(PackMode mode, std::string_view file_name);

    // Name of the chunk entry stored inside a SplitThenZip part.
    static std::string ChunkEntryName(std::string_view base, std::string_view label);
    static std::string PartsDirName(std::string_view base);
};

} // namespace splitpack
