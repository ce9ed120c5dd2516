#include "splitpack/part_namer.hpp"

#include <charconv>
#include <cstdio>

namespace splitpack {

namespace {

constexpr std::string_view kPartTag = ".part-";
constexpr std::string_view kZipExt = ".zip";
constexpr std::string_view kZipPartTag = ".zip.part-";

bool AllDigits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// Splits "<base><tag><digits>" at the last occurrence of tag.
std::optional<ParsedPartName> SplitAtTag(std::string_view stem, std::string_view tag) {
    const auto pos = stem.rfind(tag);
    if (pos == std::string_view::npos || pos == 0) return std::nullopt;

    const std::string_view digits = stem.substr(pos + tag.size());
    if (!AllDigits(digits)) return std::nullopt;

    std::uint64_t index = 0;
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || end != digits.data() + digits.size() || index == 0) {
        return std::nullopt;
    }

    ParsedPartName out;
    out.base = std::string(stem.substr(0, pos));
    out.index = index;
    out.label = std::string(digits);
    return out;
}

} // namespace

std::string PartNamer::FormatLabel(std::uint64_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0*llu", kLabelWidth, static_cast<unsigned long long>(index));
    return buf;
}

std::string PartNamer::PartFileName(PackMode mode, std::string_view base, std::uint64_t index) {
    std::string name(base);
    switch (mode) {
        case PackMode::SplitThenZip:
            name += kPartTag;
            name += FormatLabel(index);
            name += kZipExt;
            break;
        case PackMode::ZipThenSplit:
            name += kZipPartTag;
            name += FormatLabel(index);
            break;
    }
    return name;
}

std::optional<ParsedPartName> PartNamer::Parse(PackMode mode, std::string_view file_name) {
    switch (mode) {
        case PackMode::SplitThenZip: {
            if (file_name.size() <= kZipExt.size() || !file_name.ends_with(kZipExt)) {
                return std::nullopt;
            }
            file_name.remove_suffix(kZipExt.size());
            return SplitAtTag(file_name, kPartTag);
        }
        case PackMode::ZipThenSplit:
            return SplitAtTag(file_name, kZipPartTag);
    }
    return std::nullopt;
}

std::string PartNamer::ChunkEntryName(std::string_view base, std::string_view label) {
    std::string name(base);
    name += kPartTag;
    name += label;
    return name;
}

std::string PartNamer::PartsDirName(std::string_view base) {
    return std::string(base) + ".parts";
}

} // namespace splitpack
