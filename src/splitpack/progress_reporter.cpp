#include "splitpack/progress_reporter.hpp"

#include <algorithm>

namespace splitpack {

void ProgressReporter::Subscribe(IProgress* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lk(mu_);
    if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
        sinks_.push_back(sink);
    }
}

void ProgressReporter::Unsubscribe(IProgress* sink) {
    std::lock_guard<std::mutex> lk(mu_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void ProgressReporter::OnProgress(const ProgressEvent& e) {
    ProgressEvent ev = e;
    if (ev.part_total > 0 && ev.part_index > ev.part_total) {
        ev.part_index = ev.part_total;
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (latest_ && latest_->phase == ev.phase && ev.processed_bytes < latest_->processed_bytes) {
        ev.processed_bytes = latest_->processed_bytes;
    }
    latest_ = ev;
    ++emitted_;

    for (IProgress* sink : sinks_) {
        sink->OnProgress(ev);
    }
}

std::optional<ProgressEvent> ProgressReporter::Latest() const {
    std::lock_guard<std::mutex> lk(mu_);
    return latest_;
}

std::uint64_t ProgressReporter::EmittedCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return emitted_;
}

void ProgressQueue::OnProgress(const ProgressEvent& e) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return;
        events_.push_back(e);
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressQueue::WaitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) return std::nullopt;
    ProgressEvent ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

std::optional<ProgressEvent> ProgressQueue::TryPop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (events_.empty()) return std::nullopt;
    ProgressEvent ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

void ProgressQueue::Close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressQueue::Closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

} // namespace splitpack
