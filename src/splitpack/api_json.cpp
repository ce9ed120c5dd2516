#include "splitpack/api_json.hpp"

#include "splitpack/packer.hpp"
#include "splitpack/part_discovery.hpp"
#include "splitpack/restorer.hpp"

#include <cctype>
#include <charconv>
#include <limits>

namespace splitpack {

using json = nlohmann::json;

namespace {

std::string Lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::expected<std::string, std::string> GetString(const json& j, const char* key, std::string def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (!it->is_string()) return std::unexpected(std::string("'") + key + "' must be a string");
    return it->get<std::string>();
}

std::expected<bool, std::string> GetBool(const json& j, const char* key, bool def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (!it->is_boolean()) return std::unexpected(std::string("'") + key + "' must be a boolean");
    return it->get<bool>();
}

std::expected<std::uint64_t, std::string> GetU64(const json& j, const char* key, std::uint64_t def) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (it->is_number_unsigned()) return it->get<std::uint64_t>();
    if (it->is_number_integer()) {
        const auto v = it->get<long long>();
        if (v < 0) return std::unexpected(std::string("'") + key + "' must not be negative");
        return static_cast<std::uint64_t>(v);
    }
    return std::unexpected(std::string("'") + key + "' must be an integer");
}

// Empty strings mean "no password".
std::optional<std::string> PasswordOrNone(const std::string& pw) {
    if (pw.empty()) return std::nullopt;
    return pw;
}

} // namespace

std::expected<PackMode, std::string> ParsePackMode(std::string_view s) {
    const std::string v = Lower(s);
    if (v == "split-then-zip") return PackMode::SplitThenZip;
    if (v == "zip-then-split") return PackMode::ZipThenSplit;
    return std::unexpected("unknown pack mode '" + std::string(s) + "'");
}

const char* PackModeName(PackMode mode) {
    switch (mode) {
        case PackMode::SplitThenZip: return "split-then-zip";
        case PackMode::ZipThenSplit: return "zip-then-split";
    }
    return "split-then-zip";
}

std::expected<DirSplitMode, std::string> ParseDirSplitMode(std::string_view s) {
    const std::string v = Lower(s);
    if (v == "compress-split-store") return DirSplitMode::CompressSplitStore;
    if (v == "store-split-compress") return DirSplitMode::StoreSplitCompress;
    return std::unexpected("unknown directory split mode '" + std::string(s) + "'");
}

const char* DirSplitModeName(DirSplitMode mode) {
    switch (mode) {
        case DirSplitMode::CompressSplitStore: return "compress-split-store";
        case DirSplitMode::StoreSplitCompress: return "store-split-compress";
    }
    return "compress-split-store";
}

std::expected<std::uint64_t, std::string> ParseSizeWithUnit(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    if (s.empty()) return std::unexpected("empty size");

    std::uint64_t value = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range) return std::unexpected("size out of range: " + std::string(s));
    if (ec != std::errc{} || ptr == first) return std::unexpected("size must start with digits: " + std::string(s));

    const std::string unit = Lower(std::string_view(ptr, static_cast<std::size_t>(last - ptr)));
    std::uint64_t mult = 0;
    if (unit.empty() || unit == "b") {
        mult = 1;
    } else if (unit == "k" || unit == "kb") {
        mult = 1024ULL;
    } else if (unit == "m" || unit == "mb") {
        mult = 1024ULL * 1024;
    } else if (unit == "g" || unit == "gb") {
        mult = 1024ULL * 1024 * 1024;
    } else {
        return std::unexpected("unknown size unit '" + unit + "'");
    }

    if (value == 0) return std::unexpected("size must be greater than 0");
    if (mult == 1 && value < 1024) return std::unexpected("sizes in bytes must be at least 1024");
    if (value > std::numeric_limits<std::uint64_t>::max() / mult) {
        return std::unexpected("size out of range: " + std::string(s));
    }
    return value * mult;
}

json ProgressEventToJson(const ProgressEvent& e) {
    return json{
        {"phase", e.phase},
        {"processedBytes", e.processed_bytes},
        {"totalBytes", e.total_bytes},
        {"partIndex", e.part_index},
        {"partTotal", e.part_total},
        {"message", e.message},
    };
}

json ResultToJson(const Result& r) {
    if (r.is_ok()) return json{{"ok", true}};
    json j{{"ok", false}, {"error", ErrorKindName(r.kind)}, {"message", r.msg}};
    if (!r.phase.empty()) j["phase"] = r.phase;
    if (r.part_index != 0) j["partIndex"] = r.part_index;
    if (!r.path.empty()) j["path"] = r.path;
    return j;
}

std::expected<PackRequest, std::string> PackRequestFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("pack request must be a JSON object");

    PackRequest req;

    auto input = GetString(j, "inputPath", "");
    if (!input) return std::unexpected(input.error());
    if (input->empty()) return std::unexpected("'inputPath' is required");
    req.input.path = *input;

    auto output = GetString(j, "outputDir", "");
    if (!output) return std::unexpected(output.error());
    if (output->empty()) return std::unexpected("'outputDir' is required");
    req.output_dir = *output;

    auto split_by = GetString(j, "splitBy", "size");
    if (!split_by) return std::unexpected(split_by.error());
    if (*split_by == "size") {
        auto it = j.find("sizeBytes");
        if (it == j.end()) return std::unexpected("'sizeBytes' is required when splitting by size");
        std::uint64_t bytes = 0;
        if (it->is_string()) {
            auto parsed = ParseSizeWithUnit(it->get<std::string>());
            if (!parsed) return std::unexpected(parsed.error());
            bytes = *parsed;
        } else {
            auto parsed = GetU64(j, "sizeBytes", 0);
            if (!parsed) return std::unexpected(parsed.error());
            bytes = *parsed;
        }
        if (bytes == 0) return std::unexpected("'sizeBytes' must be greater than 0");
        req.split = SplitBySize{bytes};
    } else if (*split_by == "count") {
        auto count = GetU64(j, "count", 0);
        if (!count) return std::unexpected(count.error());
        if (*count == 0) return std::unexpected("'count' must be greater than 0");
        req.split = SplitByCount{*count};
    } else {
        return std::unexpected("'splitBy' must be \"size\" or \"count\"");
    }

    auto mode = GetString(j, "packMode", PackModeName(PackMode::SplitThenZip));
    if (!mode) return std::unexpected(mode.error());
    auto pack_mode = ParsePackMode(*mode);
    if (!pack_mode) return std::unexpected(pack_mode.error());
    req.mode = *pack_mode;

    auto dir_mode = GetString(j, "dirSplitMode", DirSplitModeName(DirSplitMode::CompressSplitStore));
    if (!dir_mode) return std::unexpected(dir_mode.error());
    auto dsm = ParseDirSplitMode(*dir_mode);
    if (!dsm) return std::unexpected(dsm.error());
    req.dir_mode = *dsm;

    auto password = GetString(j, "password", "");
    if (!password) return std::unexpected(password.error());
    req.password = PasswordOrNone(*password);

    auto level = GetU64(j, "compressionLevel", 6);
    if (!level) return std::unexpected(level.error());
    if (*level < 1 || *level > 9) return std::unexpected("'compressionLevel' must be within 1..9");
    req.compression_level = static_cast<int>(*level);

    auto overwrite = GetBool(j, "overwriteParts", false);
    if (!overwrite) return std::unexpected(overwrite.error());
    req.overwrite_parts = *overwrite;

    return req;
}

json PackResultToJson(const PackResult& r) {
    json files = json::array();
    json hashes = json::array();
    for (const auto& p : r.parts) {
        files.push_back(p.path);
        // Raw ZipThenSplit slices carry no digest.
        if (r.mode == PackMode::SplitThenZip) {
            hashes.push_back(json{{"path", p.path}, {"sha256", p.sha256}});
        }
    }
    return json{
        {"parts", r.part_count},
        {"outputFiles", files},
        {"isDir", r.is_directory_input},
        {"baseName", r.base_name},
        {"partSha256s", hashes},
    };
}

std::expected<RestoreCall, std::string> RestoreCallFromJson(const json& j) {
    if (!j.is_object()) return std::unexpected("restore request must be a JSON object");

    RestoreCall call;
    RestoreRequest& req = call.request;

    auto input = GetString(j, "inputPath", "");
    if (!input) return std::unexpected(input.error());
    if (input->empty()) return std::unexpected("'inputPath' is required");
    call.input_path = *input;

    auto output = GetString(j, "outputDir", "");
    if (!output) return std::unexpected(output.error());
    if (output->empty()) return std::unexpected("'outputDir' is required");
    req.output_dir = *output;

    auto mode = GetString(j, "mergeMode", PackModeName(PackMode::SplitThenZip));
    if (!mode) return std::unexpected(mode.error());
    auto pack_mode = ParsePackMode(*mode);
    if (!pack_mode) return std::unexpected(pack_mode.error());
    req.mode = *pack_mode;

    auto password = GetString(j, "password", "");
    if (!password) return std::unexpected(password.error());
    req.password = PasswordOrNone(*password);

    auto extract = GetBool(j, "autoExtract", false);
    if (!extract) return std::unexpected(extract.error());
    req.auto_extract = *extract;

    auto output_file = GetString(j, "outputFile", "");
    if (!output_file) return std::unexpected(output_file.error());
    if (!output_file->empty()) req.output_file = *output_file;

    auto keep_temp = GetBool(j, "keepTemp", false);
    if (!keep_temp) return std::unexpected(keep_temp.error());
    req.keep_scratch = *keep_temp;

    auto keep_zip = GetBool(j, "keepZip", false);
    if (!keep_zip) return std::unexpected(keep_zip.error());
    req.keep_intermediate_zip = *keep_zip;

    return call;
}

json RestoreResultToJson(const RestoreResult& r) {
    json j{{"outputFiles", r.output_files}};
    if (r.merged_file) j["mergedFile"] = *r.merged_file;
    if (r.extracted_dir) j["extractedDir"] = *r.extracted_dir;
    return j;
}

Result PackFromJson(const json& in, IProgress* progress, json& out) {
    auto req = PackRequestFromJson(in);
    if (!req) return Result::Fail(ErrorKind::InvalidSpec, req.error());

    auto r = Packer::ResolveInput(req->input.path, req->input);
    if (!r.is_ok()) return r;

    Packer packer;
    packer.SetProgressSink(progress);
    PackResult result;
    r = packer.Run(*req, result);
    if (!r.is_ok()) return r;

    out = PackResultToJson(result);
    return Result::Ok();
}

Result RestoreFromJson(const json& in, IProgress* progress, json& out) {
    auto call = RestoreCallFromJson(in);
    if (!call) return Result::Fail(ErrorKind::InvalidSpec, call.error());

    auto r = PartDiscovery::ResolveInputPath(call->request.mode, call->input_path, call->request.source);
    if (!r.is_ok()) return r;

    Restorer restorer;
    restorer.SetProgressSink(progress);
    RestoreResult result;
    r = restorer.Run(call->request, result);
    if (!r.is_ok()) return r;

    out = RestoreResultToJson(result);
    return Result::Ok();
}

} // namespace splitpack
