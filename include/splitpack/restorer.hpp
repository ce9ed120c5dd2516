#pragma once

#include "splitpack/part_discovery.hpp"
#include "splitpack/progress.hpp"
#include "splitpack/types.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace splitpack {

// Restore engine: rebuilds the original file or directory from a part set.
// Everything is derived from part file names, so it does not need the pack
// run that produced them.
class Restorer {
public:
    Restorer() = default;

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    Result Run(const RestoreRequest& req, RestoreResult& out);

private:
    Result VerifyHashes(const RestoreRequest& req, const DiscoveredParts& found);
    Result RestoreSplitThenZip(const RestoreRequest& req, const DiscoveredParts& found, RestoreResult& out);
    Result RestoreZipThenSplit(const RestoreRequest& req, const DiscoveredParts& found, RestoreResult& out);

    // Concatenates `inputs` into `dst` (created or truncated).
    Result Concatenate(const RestoreRequest& req,
                       const std::vector<std::string>& inputs,
                       const std::string& dst);

    // What happens to the merged zip once extraction succeeded.
    enum class MergedZip {
        Keep,
        Remove,
        // Removed only when it unpacked into its own directory; any other zip
        // is a restored file in its own right.
        RemoveIfDirectory,
    };

    // Unzips `zip_path` into the output directory and fills `out`. The zip is
    // never touched when extraction fails.
    Result ExtractMerged(const RestoreRequest& req,
                         const std::string& zip_path,
                         MergedZip policy,
                         RestoreResult& out);

    bool Cancelled(const RestoreRequest& req) const;
    void Emit(const char* phase,
              std::uint64_t processed,
              std::uint64_t total,
              std::uint64_t part_index,
              std::uint64_t part_total,
              std::string message) const;

    IProgress* progress_sink_ = nullptr;
};

} // namespace splitpack
