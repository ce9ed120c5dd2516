#pragma once

#include "splitpack/progress.hpp"

#include <string>

namespace splitpack {

// Rewrites `path` atomically (tmp + rename) with the latest event as JSON.
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string path_;
};

// Single self-overwriting stderr line per phase.
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string last_phase_;
    bool phase_finished_ = false;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace splitpack
