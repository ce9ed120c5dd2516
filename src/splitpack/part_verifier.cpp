#include "splitpack/part_verifier.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"

namespace splitpack {

Result PartVerifier::Digest(const std::string& path, std::string& out_hex) {
    return Sha256HexFile(path, out_hex);
}

std::vector<std::string> PartVerifier::Verify(const std::vector<std::string>& ordered_paths,
                                              const std::vector<std::string>& ordered_expected) {
    std::vector<std::string> failed;

    for (size_t i = 0; i < ordered_paths.size(); ++i) {
        const std::string& path = ordered_paths[i];
        if (i >= ordered_expected.size() || ordered_expected[i].empty()) {
            LogWarn("no expected sha256 for %s", path.c_str());
            failed.push_back(path);
            continue;
        }

        std::string actual;
        auto r = Digest(path, actual);
        if (!r.is_ok()) {
            LogWarn("cannot hash %s: %s", path.c_str(), r.msg.c_str());
            failed.push_back(path);
            continue;
        }
        if (!DigestEquals(actual, ordered_expected[i])) {
            LogWarn("sha256 mismatch: %s expected=%s actual=%s",
                    path.c_str(), ordered_expected[i].c_str(), actual.c_str());
            failed.push_back(path);
        }
    }

    return failed;
}

} // namespace splitpack
