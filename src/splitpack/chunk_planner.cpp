#include "splitpack/chunk_planner.hpp"

#include <algorithm>
#include <string>

namespace splitpack {

namespace {

void PlanBySize(std::uint64_t total, std::uint64_t target, std::vector<ChunkRange>& out) {
    if (total == 0) {
        out.push_back({0, 0});
        return;
    }
    for (std::uint64_t off = 0; off < total; off += target) {
        out.push_back({off, std::min(target, total - off)});
    }
}

void PlanByCount(std::uint64_t total, std::uint64_t n, std::vector<ChunkRange>& out) {
    const std::uint64_t base = total / n;
    const std::uint64_t extra = total % n;

    std::uint64_t off = 0;
    for (std::uint64_t i = 0; i < n; ++i) {
        const std::uint64_t len = base + (i < extra ? 1 : 0);
        out.push_back({off, len});
        off += len;
    }
}

} // namespace

Result ChunkPlanner::Plan(std::uint64_t total_bytes, const SplitSpec& spec, std::vector<ChunkRange>& out) {
    out.clear();

    if (const auto* by_size = std::get_if<SplitBySize>(&spec)) {
        if (by_size->bytes == 0) {
            return Result::Fail(ErrorKind::InvalidSpec, "part size must be greater than 0");
        }
        const std::uint64_t n = total_bytes / by_size->bytes + (total_bytes % by_size->bytes != 0 ? 1 : 0);
        if (n > kMaxParts) {
            return Result::Fail(ErrorKind::InvalidSpec,
                                "part size " + std::to_string(by_size->bytes) + " would produce " +
                                    std::to_string(n) + " parts, limit is " + std::to_string(kMaxParts));
        }
        PlanBySize(total_bytes, by_size->bytes, out);
        return Result::Ok();
    }

    const auto& by_count = std::get<SplitByCount>(spec);
    if (by_count.count == 0) {
        return Result::Fail(ErrorKind::InvalidSpec, "part count must be greater than 0");
    }
    if (by_count.count > kMaxParts) {
        return Result::Fail(ErrorKind::InvalidSpec,
                            "part count " + std::to_string(by_count.count) + " exceeds limit " +
                                std::to_string(kMaxParts));
    }
    PlanByCount(total_bytes, by_count.count, out);
    return Result::Ok();
}

} // namespace splitpack
