#define _FILE_OFFSET_BITS 64

#include "splitpack/api_json.hpp"
#include "splitpack/pack_manifest.hpp"
#include "splitpack/packer.hpp"
#include "splitpack/part_discovery.hpp"
#include "splitpack/part_verifier.hpp"
#include "splitpack/progress_reporter.hpp"
#include "splitpack/progress_sinks.hpp"
#include "splitpack/restorer.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>

namespace {

namespace fs = std::filesystem;
using splitpack::ErrorKind;
using splitpack::Result;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitConfirm = 3;
constexpr int kExitHashMismatch = 4;
constexpr int kExitCancelled = 130;

enum LongOnly {
    kOptSize = 1000,
    kOptCount,
    kOptMode,
    kOptDirMode,
    kOptPassword,
    kOptLevel,
    kOptOverwrite,
    kOptManifest,
    kOptJson,
    kOptOutputFile,
    kOptKeepTemp,
    kOptExtract,
    kOptConfig,
    kOptProgressFile,
    kOptQuiet,
};

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s pack -i <path> -o <dir> (--size <N[B|K|M|G]> | --count <n>) [options]\n"
        "   %s restore -i <part|dir> -o <dir> [options]\n"
        "   %s verify --manifest <file> [-d <dir>]\n"
        "\n"
        "Pack options:\n"
        "      --mode             split-then-zip (default) or zip-then-split\n"
        "      --dir-mode         compress-split-store (default) or store-split-compress\n"
        "      --password         Encrypt parts (AES-256)\n"
        "      --level            Deflate level 1-9 (default 6)\n"
        "      --overwrite        Replace an existing non-empty parts directory\n"
        "      --manifest         Where to write the manifest (default <dir>/<base>.parts.json)\n"
        "\n"
        "Restore options:\n"
        "      --mode             Mode the parts were packed with\n"
        "      --password         Part password\n"
        "      --extract          Unzip the merged archive\n"
        "      --output-file      Final path of the restored item\n"
        "      --keep-temp        Keep scratch files and the intermediate zip\n"
        "      --manifest         Verify part digests from a pack manifest first\n"
        "\n"
        "Common options:\n"
        "      --json             Print the result as JSON on stdout\n"
        "      --config           Config file (default $%s)\n"
        "      --progress-file    Keep the latest progress event in this JSON file\n"
        "      --quiet            Warnings and errors only, no progress line\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv0, argv0, argv0, splitpack::config::kConfigEnvVar);
}

int ExitCodeFor(const Result& r) {
    if (r.is_ok()) return kExitOk;
    switch (r.kind) {
        case ErrorKind::InvalidSpec: return kExitUsage;
        case ErrorKind::ConfirmationRequired: return kExitConfirm;
        case ErrorKind::HashMismatch: return kExitHashMismatch;
        case ErrorKind::Cancelled: return kExitCancelled;
        default: return kExitFailure;
    }
}

struct CommonOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> progress_file;
    bool json = false;
    bool quiet = false;
    bool verbose = false;
};

// Returns true when `c` was one of the shared options.
bool HandleCommonOption(int c, CommonOptions& common) {
    switch (c) {
        case kOptJson: common.json = true; return true;
        case kOptConfig: common.config_path = optarg; return true;
        case kOptProgressFile: common.progress_file = optarg; return true;
        case kOptQuiet: common.quiet = true; return true;
        case 'v': common.verbose = true; return true;
        default: return false;
    }
}

#define SPLITPACK_COMMON_LONG_OPTS                                   \
    {"json", no_argument, nullptr, kOptJson},                        \
    {"config", required_argument, nullptr, kOptConfig},              \
    {"progress-file", required_argument, nullptr, kOptProgressFile}, \
    {"quiet", no_argument, nullptr, kOptQuiet},                      \
    {"verbose", no_argument, nullptr, 'v'},                          \
    {"help", no_argument, nullptr, 'h'}

// Loads the config file and applies log settings. A missing file at the
// default location is fine; an explicitly named one must load.
Result LoadConfig(const CommonOptions& common, splitpack::config::ToolConfigFromFile& cfg) {
    std::string path;
    if (common.config_path) {
        path = *common.config_path;
    } else {
        path = splitpack::config::ToolConfigFromFile::DefaultPath();
        std::error_code ec;
        if (path.empty() || !fs::exists(path, ec)) path.clear();
    }

    if (!path.empty()) {
        auto r = cfg.LoadFile(path);
        if (!r.is_ok()) return r;
    }

    auto& logger = splitpack::Logger::Instance();
    if (cfg.log_level) logger.SetLevel(*cfg.log_level);
    if (common.quiet) logger.SetLevel(splitpack::LogLevel::Warn);
    if (common.verbose) logger.SetLevel(splitpack::LogLevel::Debug);
    return Result::Ok();
}

// Console and file sinks behind one reporter.
class ProgressSetup {
public:
    ProgressSetup(const CommonOptions& common, const splitpack::config::ToolConfigFromFile& cfg) {
        const bool console = !common.quiet && !common.json && cfg.progress.value_or(true);
        if (console) {
            console_ = std::make_unique<splitpack::ConsoleProgressSink>();
            reporter_.Subscribe(console_.get());
        }
        if (common.progress_file) {
            file_ = std::make_unique<splitpack::FileProgressSink>(*common.progress_file);
            reporter_.Subscribe(file_.get());
        }
    }
    ~ProgressSetup() { splitpack::ClearProgressLine(); }

    splitpack::IProgress* Sink() { return &reporter_; }

private:
    splitpack::ProgressReporter reporter_;
    std::unique_ptr<splitpack::ConsoleProgressSink> console_;
    std::unique_ptr<splitpack::FileProgressSink> file_;
};

int Fail(const Result& r, const CommonOptions& common) {
    splitpack::ClearProgressLine();
    if (common.json) {
        std::printf("%s\n", splitpack::ResultToJson(r).dump().c_str());
    }
    if (r.kind == ErrorKind::ConfirmationRequired) {
        std::fprintf(stderr, "ERROR: %s (re-run with --overwrite)\n", r.Describe().c_str());
    } else {
        std::fprintf(stderr, "ERROR: %s\n", r.Describe().c_str());
    }
    return ExitCodeFor(r);
}

int UsageError(const char* argv0, const std::string& msg) {
    std::fprintf(stderr, "ERROR: %s\n", msg.c_str());
    PrintUsage(argv0);
    return kExitUsage;
}

int RunPack(const char* argv0, int argc, char** argv) {
    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"size", required_argument, nullptr, kOptSize},
        {"count", required_argument, nullptr, kOptCount},
        {"mode", required_argument, nullptr, kOptMode},
        {"dir-mode", required_argument, nullptr, kOptDirMode},
        {"password", required_argument, nullptr, kOptPassword},
        {"level", required_argument, nullptr, kOptLevel},
        {"overwrite", no_argument, nullptr, kOptOverwrite},
        {"manifest", required_argument, nullptr, kOptManifest},
        SPLITPACK_COMMON_LONG_OPTS,
        {nullptr, 0, nullptr, 0},
    };

    CommonOptions common;
    std::string in;
    std::string out;
    std::optional<std::uint64_t> size;
    std::optional<std::uint64_t> count;
    std::optional<splitpack::PackMode> mode;
    std::optional<splitpack::DirSplitMode> dir_mode;
    std::optional<std::string> password;
    std::optional<int> level;
    std::optional<std::string> manifest_path;
    bool overwrite = false;

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvi:o:", long_opts, &idx)) != -1) {
        if (HandleCommonOption(c, common)) continue;
        switch (c) {
            case 'h':
                PrintUsage(argv0);
                return kExitOk;

            case 'i':
                in = optarg;
                break;

            case 'o':
                out = optarg;
                break;

            case kOptSize: {
                auto v = splitpack::ParseSizeWithUnit(optarg);
                if (!v) return UsageError(argv0, "invalid --size: " + v.error());
                size = *v;
                break;
            }

            case kOptCount: {
                char* end = nullptr;
                errno = 0;
                unsigned long long v = std::strtoull(optarg, &end, 10);
                if (!end || *end != '\0' || errno != 0 || v == 0 || optarg[0] == '-') {
                    return UsageError(argv0, std::string("invalid --count: ") + optarg);
                }
                count = static_cast<std::uint64_t>(v);
                break;
            }

            case kOptMode: {
                auto v = splitpack::ParsePackMode(optarg);
                if (!v) return UsageError(argv0, v.error());
                mode = *v;
                break;
            }

            case kOptDirMode: {
                auto v = splitpack::ParseDirSplitMode(optarg);
                if (!v) return UsageError(argv0, v.error());
                dir_mode = *v;
                break;
            }

            case kOptPassword:
                password = optarg;
                break;

            case kOptLevel: {
                char* end = nullptr;
                long v = std::strtol(optarg, &end, 10);
                if (!end || *end != '\0' || v < 1 || v > 9) {
                    return UsageError(argv0, std::string("invalid --level: ") + optarg);
                }
                level = static_cast<int>(v);
                break;
            }

            case kOptOverwrite:
                overwrite = true;
                break;

            case kOptManifest:
                manifest_path = optarg;
                break;

            default:
                PrintUsage(argv0);
                return kExitUsage;
        }
    }

    if (in.empty() || out.empty()) return UsageError(argv0, "pack needs -i and -o");
    if (size && count) return UsageError(argv0, "--size and --count are mutually exclusive");

    splitpack::config::ToolConfigFromFile cfg;
    if (auto r = LoadConfig(common, cfg); !r.is_ok()) return Fail(r, common);

    splitpack::PackRequest req;
    if (count) {
        req.split = splitpack::SplitByCount{*count};
    } else if (size) {
        req.split = splitpack::SplitBySize{*size};
    } else if (cfg.default_part_size) {
        req.split = splitpack::SplitBySize{*cfg.default_part_size};
    } else {
        return UsageError(argv0, "pack needs --size or --count");
    }
    req.output_dir = out;
    req.mode = mode.value_or(cfg.pack_mode.value_or(splitpack::PackMode::SplitThenZip));
    req.dir_mode = dir_mode.value_or(cfg.dir_split_mode.value_or(splitpack::DirSplitMode::CompressSplitStore));
    if (password && !password->empty()) req.password = password;
    req.compression_level = level.value_or(cfg.compression_level.value_or(6));
    req.overwrite_parts = overwrite;
    req.cancel = &splitpack::g_cancel;

    if (auto r = splitpack::Packer::ResolveInput(in, req.input); !r.is_ok()) return Fail(r, common);

    splitpack::PackResult result;
    {
        ProgressSetup progress(common, cfg);
        splitpack::Packer packer;
        packer.SetProgressSink(progress.Sink());
        if (auto r = packer.Run(req, result); !r.is_ok()) return Fail(r, common);
    }

    const auto manifest = splitpack::PackManifest::FromResult(result, out);
    const std::string mpath =
        manifest_path.value_or((fs::path(out) / splitpack::PackManifest::FileName(result.base_name)).string());
    if (auto r = splitpack::SavePackManifest(manifest, mpath); !r.is_ok()) return Fail(r, common);

    if (common.json) {
        auto j = splitpack::PackResultToJson(result);
        j["manifest"] = mpath;
        std::printf("%s\n", j.dump().c_str());
    } else {
        for (const auto& p : result.parts) {
            std::printf("%s\n", p.path.c_str());
        }
    }
    return kExitOk;
}

int RunRestore(const char* argv0, int argc, char** argv) {
    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"mode", required_argument, nullptr, kOptMode},
        {"password", required_argument, nullptr, kOptPassword},
        {"extract", no_argument, nullptr, kOptExtract},
        {"output-file", required_argument, nullptr, kOptOutputFile},
        {"keep-temp", no_argument, nullptr, kOptKeepTemp},
        {"manifest", required_argument, nullptr, kOptManifest},
        SPLITPACK_COMMON_LONG_OPTS,
        {nullptr, 0, nullptr, 0},
    };

    CommonOptions common;
    std::string in;
    std::string out;
    std::optional<splitpack::PackMode> mode;
    std::optional<std::string> manifest_path;
    splitpack::RestoreRequest req;

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvi:o:", long_opts, &idx)) != -1) {
        if (HandleCommonOption(c, common)) continue;
        switch (c) {
            case 'h':
                PrintUsage(argv0);
                return kExitOk;

            case 'i':
                in = optarg;
                break;

            case 'o':
                out = optarg;
                break;

            case kOptMode: {
                auto v = splitpack::ParsePackMode(optarg);
                if (!v) return UsageError(argv0, v.error());
                mode = *v;
                break;
            }

            case kOptPassword:
                if (optarg[0] != '\0') req.password = std::string(optarg);
                break;

            case kOptExtract:
                req.auto_extract = true;
                break;

            case kOptOutputFile:
                req.output_file = std::string(optarg);
                break;

            case kOptKeepTemp:
                req.keep_scratch = true;
                req.keep_intermediate_zip = true;
                break;

            case kOptManifest:
                manifest_path = optarg;
                break;

            default:
                PrintUsage(argv0);
                return kExitUsage;
        }
    }

    if (in.empty() || out.empty()) return UsageError(argv0, "restore needs -i and -o");

    splitpack::config::ToolConfigFromFile cfg;
    if (auto r = LoadConfig(common, cfg); !r.is_ok()) return Fail(r, common);

    std::optional<splitpack::PackManifest> manifest;
    if (manifest_path) {
        splitpack::PackManifest m;
        if (auto r = splitpack::LoadPackManifest(*manifest_path, m); !r.is_ok()) return Fail(r, common);
        if (m.HasDigests()) req.expected_hashes = m.Digests();
        manifest = std::move(m);
    }

    if (mode) {
        req.mode = *mode;
    } else if (manifest) {
        req.mode = manifest->mode;
    } else {
        req.mode = cfg.pack_mode.value_or(splitpack::PackMode::SplitThenZip);
    }
    req.output_dir = out;
    req.cancel = &splitpack::g_cancel;

    if (auto r = splitpack::PartDiscovery::ResolveInputPath(req.mode, in, req.source); !r.is_ok()) {
        return Fail(r, common);
    }

    splitpack::RestoreResult result;
    {
        ProgressSetup progress(common, cfg);
        splitpack::Restorer restorer;
        restorer.SetProgressSink(progress.Sink());
        if (auto r = restorer.Run(req, result); !r.is_ok()) return Fail(r, common);
    }

    if (common.json) {
        std::printf("%s\n", splitpack::RestoreResultToJson(result).dump().c_str());
    } else {
        for (const auto& f : result.output_files) {
            std::printf("%s\n", f.c_str());
        }
    }
    return kExitOk;
}

int RunVerify(const char* argv0, int argc, char** argv) {
    static option long_opts[] = {
        {"manifest", required_argument, nullptr, kOptManifest},
        {"dir", required_argument, nullptr, 'd'},
        SPLITPACK_COMMON_LONG_OPTS,
        {nullptr, 0, nullptr, 0},
    };

    CommonOptions common;
    std::string manifest_path;
    std::string base_dir;

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvd:", long_opts, &idx)) != -1) {
        if (HandleCommonOption(c, common)) continue;
        switch (c) {
            case 'h':
                PrintUsage(argv0);
                return kExitOk;

            case kOptManifest:
                manifest_path = optarg;
                break;

            case 'd':
                base_dir = optarg;
                break;

            default:
                PrintUsage(argv0);
                return kExitUsage;
        }
    }

    if (manifest_path.empty()) return UsageError(argv0, "verify needs --manifest");

    splitpack::config::ToolConfigFromFile cfg;
    if (auto r = LoadConfig(common, cfg); !r.is_ok()) return Fail(r, common);

    splitpack::PackManifest m;
    if (auto r = splitpack::LoadPackManifest(manifest_path, m); !r.is_ok()) return Fail(r, common);
    if (!m.HasDigests()) {
        return Fail(Result::Fail(ErrorKind::InvalidSpec, "manifest carries no part digests").WithPath(manifest_path),
                    common);
    }
    if (base_dir.empty()) {
        base_dir = fs::path(manifest_path).parent_path().string();
        if (base_dir.empty()) base_dir = ".";
    }

    const auto failed = splitpack::PartVerifier::Verify(m.ResolvedPaths(base_dir), m.Digests());

    if (common.json) {
        nlohmann::json j{{"ok", failed.empty()}, {"failed", failed}};
        std::printf("%s\n", j.dump().c_str());
    } else {
        for (const auto& f : failed) {
            std::printf("MISMATCH %s\n", f.c_str());
        }
    }
    if (!failed.empty()) {
        std::fprintf(stderr, "ERROR: %zu of %zu parts failed verification\n", failed.size(), m.parts.size());
        return kExitHashMismatch;
    }
    LogInfo("all %zu parts match %s", m.parts.size(), manifest_path.c_str());
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    splitpack::InstallSignalHandlers();

    if (argc < 2) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    const std::string cmd = argv[1];
    if (cmd == "-h" || cmd == "--help") {
        PrintUsage(argv[0]);
        return kExitOk;
    }

    // Subcommand options are parsed with the subcommand as argv[0].
    if (cmd == "pack") return RunPack(argv[0], argc - 1, argv + 1);
    if (cmd == "restore") return RunRestore(argv[0], argc - 1, argv + 1);
    if (cmd == "verify") return RunVerify(argv[0], argc - 1, argv + 1);

    std::fprintf(stderr, "ERROR: unknown command '%s'\n", cmd.c_str());
    PrintUsage(argv[0]);
    return kExitUsage;
}
