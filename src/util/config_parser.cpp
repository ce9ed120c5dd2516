#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <cerrno>
#include <cstdlib>

namespace splitpack::config {

void ToolConfigFromFile::Reset() {
    compression_level.reset();
    pack_mode.reset();
    dir_split_mode.reset();
    default_part_size.reset();
    progress.reset();
    log_level.reset();
}

Result ToolConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        LogError("Config: %s", err.c_str());
        if (err.rfind("cannot open", 0) == 0) {
            return Result::Fail(ENOENT, "config: " + err).WithPath(path);
        }
        return Result::Fail(ErrorKind::InvalidSpec, "config: " + err).WithPath(path);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        LogError("Config: %s in %s", err.c_str(), path.c_str());
        Reset();
        return Result::Fail(ErrorKind::InvalidSpec, "config: " + err + " in " + path).WithPath(path);
    }

    return Result::Ok();
}

std::string ToolConfigFromFile::DefaultPath() {
    const char* env = std::getenv(kConfigEnvVar);
    return env ? std::string(env) : std::string();
}

} // namespace splitpack::config
