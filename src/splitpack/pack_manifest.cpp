#include "splitpack/pack_manifest.hpp"

#include "splitpack/api_json.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace splitpack {

namespace fs = std::filesystem;
using json = nlohmann::json;

PackManifest PackManifest::FromResult(const PackResult& r, const std::string& output_dir) {
    PackManifest m;
    m.base_name = r.base_name;
    m.mode = r.mode;
    m.is_dir = r.is_directory_input;
    for (const auto& p : r.parts) {
        std::error_code ec;
        fs::path rel = fs::relative(p.path, output_dir, ec);
        if (ec || rel.empty()) rel = p.path;
        m.parts.push_back({rel.generic_string(), p.sha256});
    }
    return m;
}

std::string PackManifest::FileName(const std::string& base) {
    return base + ".parts.json";
}

bool PackManifest::HasDigests() const {
    if (parts.empty()) return false;
    for (const auto& p : parts) {
        if (p.sha256.empty()) return false;
    }
    return true;
}

std::vector<std::string> PackManifest::ResolvedPaths(const std::string& base_dir) const {
    std::vector<std::string> out;
    out.reserve(parts.size());
    for (const auto& p : parts) {
        const fs::path rel(p.path);
        out.push_back(rel.is_absolute() ? rel.string() : (fs::path(base_dir) / rel).string());
    }
    return out;
}

std::vector<std::string> PackManifest::Digests() const {
    std::vector<std::string> out;
    out.reserve(parts.size());
    for (const auto& p : parts) out.push_back(p.sha256);
    return out;
}

std::string PackManifest::ToJson() const {
    json arr = json::array();
    for (const auto& p : parts) {
        arr.push_back(json{{"path", p.path}, {"sha256", p.sha256}});
    }
    json j{
        {"baseName", base_name},
        {"packMode", PackModeName(mode)},
        {"isDir", is_dir},
        {"parts", arr},
    };
    return j.dump(2);
}

std::expected<PackManifest, std::string> PackManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        PackManifest m;
        m.base_name = j.value("baseName", "");
        if (m.base_name.empty()) {
            return std::unexpected("'baseName' is required");
        }

        auto mode = ParsePackMode(j.value("packMode", "split-then-zip"));
        if (!mode) return std::unexpected(mode.error());
        m.mode = *mode;
        m.is_dir = j.value("isDir", false);

        if (!j.contains("parts") || !j["parts"].is_array()) {
            return std::unexpected("'parts' must be an array");
        }
        for (const auto& item : j["parts"]) {
            if (!item.is_object()) {
                return std::unexpected("part entries must be objects");
            }
            ManifestPart p;
            p.path = item.value("path", "");
            p.sha256 = item.value("sha256", "");
            if (p.path.empty()) {
                return std::unexpected("part entry without 'path'");
            }
            m.parts.push_back(std::move(p));
        }
        return m;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid manifest JSON: ") + e.what());
    }
}

Result SavePackManifest(const PackManifest& m, const std::string& path) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream os(tmp_path, std::ios::trunc);
        if (!os.good()) {
            return Result::Fail(errno, "cannot write " + tmp_path).WithPath(tmp_path);
        }
        os << m.ToJson() << "\n";
        os.close();
        if (!os.good()) {
            return Result::Fail(EIO, "write failed: " + tmp_path).WithPath(tmp_path);
        }
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int e = errno;
        std::remove(tmp_path.c_str());
        return Result::Fail(e, "rename failed: " + path + " (" + std::strerror(e) + ")").WithPath(path);
    }
    LogDebug("wrote manifest %s", path.c_str());
    return Result::Ok();
}

Result LoadPackManifest(const std::string& path, PackManifest& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(ENOENT, "cannot open manifest " + path).WithPath(path);
    }
    std::stringstream ss;
    ss << is.rdbuf();

    auto parsed = PackManifestParser{}.Parse(ss.str());
    if (!parsed) {
        return Result::Fail(ErrorKind::InvalidSpec, parsed.error() + " in " + path).WithPath(path);
    }
    out = std::move(*parsed);
    return Result::Ok();
}

} // namespace splitpack
