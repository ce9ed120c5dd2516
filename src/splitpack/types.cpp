#include "splitpack/types.hpp"

namespace splitpack {

std::vector<std::string> PackResult::OrderedPartPaths() const {
    std::vector<std::string> out;
    out.reserve(parts.size());
    for (const auto& p : parts) out.push_back(p.path);
    return out;
}

} // namespace splitpack
