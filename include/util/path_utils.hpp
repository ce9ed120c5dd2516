#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace splitpack {

// Normalize an archive entry path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
// - drop a trailing "/" (directory marker)
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

// Last path component, ignoring trailing slashes ("a/b/" -> "b").
inline std::string BaseNameOf(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
    const auto pos = path.rfind('/');
    if (pos == std::string_view::npos) return std::string(path);
    return std::string(path.substr(pos + 1));
}

inline std::string StripZipExtension(std::string_view name) {
    if (name.size() > 4 && name.ends_with(".zip")) name.remove_suffix(4);
    return std::string(name);
}

// `inner` equals `outer` or lives below it, after resolving symlinks and
// "..". Paths that cannot be resolved are never within.
inline bool IsWithin(const std::filesystem::path& inner, const std::filesystem::path& outer) {
    std::error_code ec;
    const auto a = std::filesystem::weakly_canonical(inner, ec);
    if (ec) return false;
    const auto b = std::filesystem::weakly_canonical(outer, ec);
    if (ec) return false;
    auto ai = a.begin();
    for (auto bi = b.begin(); bi != b.end(); ++bi, ++ai) {
        if (ai == a.end() || *ai != *bi) return false;
    }
    return true;
}

} // namespace splitpack
