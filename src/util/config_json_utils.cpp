#include "util/config_json_utils.hpp"

#include "splitpack/api_json.hpp"

#include <fstream>

namespace splitpack::config::detail {

namespace {

// Returns false when the key is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetIntIfPresent(const nlohmann::json& j, const char* key, std::optional<long long>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return false;
    out = it->get<long long>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ToolConfigFromFile& cfg, std::string& err) {
    {
        std::optional<long long> v;
        if (!GetIntIfPresent(j, "CompressionLevel", v)) {
            err = "CompressionLevel must be an integer";
            return false;
        }
        if (v) {
            if (*v < 1 || *v > 9) {
                err = "CompressionLevel must be within 1..9";
                return false;
            }
            cfg.compression_level = static_cast<int>(*v);
        }
    }
    {
        std::optional<std::string> s;
        if (!GetStringIfPresent(j, "PackMode", s)) {
            err = "PackMode must be a string";
            return false;
        }
        if (s) {
            auto mode = ParsePackMode(*s);
            if (!mode) {
                err = mode.error();
                return false;
            }
            cfg.pack_mode = *mode;
        }
    }
    {
        std::optional<std::string> s;
        if (!GetStringIfPresent(j, "DirSplitMode", s)) {
            err = "DirSplitMode must be a string";
            return false;
        }
        if (s) {
            auto mode = ParseDirSplitMode(*s);
            if (!mode) {
                err = mode.error();
                return false;
            }
            cfg.dir_split_mode = *mode;
        }
    }
    {
        std::optional<std::string> s;
        if (!GetStringIfPresent(j, "DefaultPartSize", s)) {
            err = "DefaultPartSize must be a string such as \"64M\"";
            return false;
        }
        if (s) {
            auto size = ParseSizeWithUnit(*s);
            if (!size) {
                err = "DefaultPartSize: " + size.error();
                return false;
            }
            cfg.default_part_size = *size;
        }
    }
    if (!GetBoolIfPresent(j, "Progress", cfg.progress)) {
        err = "Progress must be a boolean";
        return false;
    }
    {
        std::optional<std::string> s;
        if (!GetStringIfPresent(j, "LogLevel", s)) {
            err = "LogLevel must be a string";
            return false;
        }
        if (s) {
            auto lvl = ParseLogLevel(*s);
            if (!lvl) {
                err = "unknown LogLevel '" + *s + "'";
                return false;
            }
            cfg.log_level = *lvl;
        }
    }

    return true;
}

} // namespace splitpack::config::detail
