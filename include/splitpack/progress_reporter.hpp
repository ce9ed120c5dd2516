#pragma once

#include "splitpack/progress.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace splitpack {

// Ordered broadcast of one operation's events. The operation thread is the only
// writer; subscribers are called in emission order under the reporter's lock,
// so a subscriber never sees a partially written event. Events emitted before
// Subscribe() are not replayed; only the latest one is queryable.
//
// Within a phase processed_bytes is clamped to be non-decreasing and
// part_index is clamped to part_total.
class ProgressReporter final : public IProgress {
public:
    void Subscribe(IProgress* sink);
    void Unsubscribe(IProgress* sink);

    void OnProgress(const ProgressEvent& e) override;

    std::optional<ProgressEvent> Latest() const;
    std::uint64_t EmittedCount() const;

private:
    mutable std::mutex mu_;
    std::vector<IProgress*> sinks_;
    std::optional<ProgressEvent> latest_;
    std::uint64_t emitted_ = 0;
};

// Subscriber that hands events to another thread.
class ProgressQueue final : public IProgress {
public:
    void OnProgress(const ProgressEvent& e) override;

    // Blocks until an event is available, the queue is closed, or the timeout
    // expires. Returns nullopt on close (once drained) or timeout.
    std::optional<ProgressEvent> WaitPop(std::chrono::milliseconds timeout);
    std::optional<ProgressEvent> TryPop();

    void Close();
    bool Closed() const;

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool closed_ = false;
};

} // namespace splitpack
