#pragma once

#include "splitpack/types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <vector>

namespace splitpack {

struct ChunkRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    bool operator==(const ChunkRange&) const = default;
};

class ChunkPlanner {
public:
    // Upper bound on the number of chunks a single plan may produce.
    static constexpr std::uint64_t kMaxParts = 1000000;

    // Ordered, contiguous ranges covering [0, total_bytes).
    //  - BySize: full chunks plus a remainder; no zero-length tail, except that
    //    an empty input yields one empty chunk.
    //  - ByCount: exactly n chunks; the first (total % n) are one byte longer.
    // Fails with InvalidSpec for a zero target or a plan above kMaxParts.
    static Result Plan(std::uint64_t total_bytes, const SplitSpec& spec, std::vector<ChunkRange>& out);
};

} // namespace splitpack
