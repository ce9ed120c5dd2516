#include "splitpack/part_discovery.hpp"

#include "splitpack/part_namer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <map>

namespace splitpack {

namespace {

Result SortAndCheckDuplicates(DiscoveredParts& out) {
    std::sort(out.parts.begin(), out.parts.end(), [](const PartDescriptor& a, const PartDescriptor& b) {
        return a.index < b.index;
    });
    for (size_t i = 1; i < out.parts.size(); ++i) {
        if (out.parts[i].index == out.parts[i - 1].index) {
            return Result::Fail(ErrorKind::InconsistentBase,
                                "two files claim part " + std::to_string(out.parts[i].index) + ": " +
                                    out.parts[i - 1].path + ", " + out.parts[i].path)
                .WithPart(out.parts[i].index);
        }
    }
    return Result::Ok();
}

std::string JoinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace

Result PartDiscovery::FromPaths(PackMode mode, const std::vector<std::string>& paths, DiscoveredParts& out) {
    out = DiscoveredParts{};
    bool have_base = false;

    for (const auto& path : paths) {
        auto parsed = PartNamer::Parse(mode, BaseNameOf(path));
        if (!parsed) {
            LogDebug("ignoring non-part file %s", path.c_str());
            continue;
        }
        if (!have_base) {
            out.base = parsed->base;
            have_base = true;
        } else if (parsed->base != out.base) {
            return Result::Fail(ErrorKind::InconsistentBase,
                                "part list mixes base names '" + out.base + "' and '" + parsed->base + "'")
                .WithPath(path);
        }
        out.parts.push_back({parsed->index, parsed->label, path, {}});
    }

    if (out.parts.empty()) {
        return Result::Fail(ErrorKind::NoPartsFound, "no part files in the given list");
    }
    return SortAndCheckDuplicates(out);
}

Result PartDiscovery::FromDirectoryListing(PackMode mode,
                                           const std::string& dir,
                                           const std::optional<std::string>& base,
                                           const std::vector<std::string>& names,
                                           DiscoveredParts& out) {
    out = DiscoveredParts{};

    std::map<std::string, std::vector<PartDescriptor>> groups;
    for (const auto& name : names) {
        auto parsed = PartNamer::Parse(mode, name);
        if (!parsed) continue;
        if (base && parsed->base != *base) continue;
        groups[parsed->base].push_back({parsed->index, parsed->label, JoinPath(dir, name), {}});
    }

    if (groups.empty()) {
        return Result::Fail(ErrorKind::NoPartsFound,
                            base ? "no parts of '" + *base + "' in " + dir : "no part files in " + dir)
            .WithPath(dir);
    }
    if (groups.size() > 1) {
        std::string bases;
        for (const auto& [b, _] : groups) {
            if (!bases.empty()) bases += ", ";
            bases += "'" + b + "'";
        }
        return Result::Fail(ErrorKind::InconsistentBase,
                            "directory holds several part sets (" + bases + "); pick one part file")
            .WithPath(dir);
    }

    out.base = groups.begin()->first;
    out.parts = std::move(groups.begin()->second);
    return SortAndCheckDuplicates(out);
}

Result PartDiscovery::CheckContiguous(const DiscoveredParts& parts) {
    for (size_t i = 0; i < parts.parts.size(); ++i) {
        const std::uint64_t expected = i + 1;
        if (parts.parts[i].index != expected) {
            return Result::Fail(ErrorKind::MissingPart,
                                "part sequence of '" + parts.base + "' is missing part " + std::to_string(expected))
                .WithPart(expected);
        }
    }
    return Result::Ok();
}

Result PartDiscovery::ListDirectory(const std::string& dir, std::vector<std::string>& names) {
    namespace fs = std::filesystem;
    names.clear();

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) continue;
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return Result::Fail(ec.value(), "cannot list " + dir + ": " + ec.message()).WithPath(dir);
    }
    return Result::Ok();
}

Result PartDiscovery::Discover(PackMode mode, const PartSource& source, DiscoveredParts& out) {
    Result r;
    if (const auto* list = std::get_if<ExplicitPartList>(&source)) {
        r = FromPaths(mode, list->paths, out);
    } else {
        const auto& scan = std::get<DirectoryScan>(source);
        std::vector<std::string> names;
        r = ListDirectory(scan.dir, names);
        if (!r.is_ok()) return r;
        r = FromDirectoryListing(mode, scan.dir, scan.base, names, out);
    }
    if (!r.is_ok()) return r;

    r = CheckContiguous(out);
    if (!r.is_ok()) return r;

    LogInfo("found %zu parts of '%s'", out.parts.size(), out.base.c_str());
    return Result::Ok();
}

Result PartDiscovery::ResolveInputPath(PackMode mode, const std::string& input_path, PartSource& out) {
    namespace fs = std::filesystem;
    if (input_path.empty()) {
        return Result::Fail(ErrorKind::InvalidSpec, "input path is required");
    }

    std::error_code ec;
    const auto st = fs::status(input_path, ec);
    if (fs::is_directory(st)) {
        out = DirectoryScan{input_path, std::nullopt};
        return Result::Ok();
    }
    if (!fs::exists(st)) {
        return Result::Fail(ENOENT, "input does not exist: " + input_path).WithPath(input_path);
    }

    auto parsed = PartNamer::Parse(mode, BaseNameOf(input_path));
    if (!parsed) {
        return Result::Fail(ErrorKind::NoPartsFound, "not a part file name: " + input_path).WithPath(input_path);
    }
    std::string parent = fs::path(input_path).parent_path().string();
    if (parent.empty()) parent = ".";
    out = DirectoryScan{parent, parsed->base};
    return Result::Ok();
}

} // namespace splitpack
