#pragma once

#include "splitpack/types.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace splitpack::config {

// Environment variable naming the default config file.
inline constexpr const char* kConfigEnvVar = "SPLITPACK_CONFIG";

// Defaults read from the optional JSON config file. Every key is optional;
// command-line flags override what is set here.
struct ToolConfigFromFile {
    std::optional<int> compression_level;
    std::optional<PackMode> pack_mode;
    std::optional<DirSplitMode> dir_split_mode;
    std::optional<std::uint64_t> default_part_size;
    std::optional<bool> progress;
    std::optional<LogLevel> log_level;

    void Reset();

    // Missing or unreadable file: IOFailure. Invalid JSON or values: InvalidSpec.
    Result LoadFile(const std::string& path);

    // Value of SPLITPACK_CONFIG, empty when unset.
    static std::string DefaultPath();
};

} // namespace splitpack::config
