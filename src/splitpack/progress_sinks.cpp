#include "splitpack/progress_sinks.hpp"

#include "splitpack/api_json.hpp"

#include <cstdio>
#include <fstream>
#include <string>

namespace splitpack {

namespace {
bool g_progress_line_active = false;

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    const int pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}
} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressEvent& e) {
    nlohmann::json j = ProgressEventToJson(e);
    j["percent"] = Percent(e.processed_bytes, e.total_bytes);

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;
    os << j.dump();
    os.close();
    if (!os.good())
        return;

    std::rename(tmp_path.c_str(), path_.c_str());
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    if (e.phase != last_phase_) {
        if (g_progress_line_active) {
            std::fprintf(stderr, "\n");
            g_progress_line_active = false;
        }
        phase_finished_ = false;
        last_phase_ = e.phase;
    }
    if (phase_finished_)
        return;

    const int pct = Percent(e.processed_bytes, e.total_bytes);
    if (e.part_total > 0) {
        std::fprintf(stderr,
                     "\r[%s] %3d%% | part %llu/%llu",
                     e.phase.c_str(),
                     pct,
                     (unsigned long long)e.part_index,
                     (unsigned long long)e.part_total);
    } else {
        std::fprintf(stderr, "\r[%s] %3d%%", e.phase.c_str(), pct);
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.total_bytes > 0 && e.processed_bytes >= e.total_bytes &&
        (e.part_total == 0 || e.part_index >= e.part_total)) {
        std::fprintf(stderr, "\n");
        phase_finished_ = true;
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace splitpack
