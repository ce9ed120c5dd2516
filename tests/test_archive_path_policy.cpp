#include <gtest/gtest.h>

#include "splitpack/archive_path_policy.hpp"

namespace splitpack {

TEST(ArchivePathPolicyTest, NormalizesSafeEntryPath) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out;

    auto res = policy.NormalizeEntryPath("./dir//file.txt", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "dir/file.txt");
}

TEST(ArchivePathPolicyTest, DirectoryEntryLosesTrailingSlash) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out;

    ASSERT_TRUE(policy.NormalizeEntryPath("photos/", out).is_ok());
    EXPECT_EQ(out, "photos");
}

TEST(ArchivePathPolicyTest, RejectsParentSegments) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out;

    auto res = policy.NormalizeEntryPath("a/../../escape.txt", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::CodecFailure);
    EXPECT_NE(res.msg.find("Unsafe path in archive"), std::string::npos);
}

TEST(ArchivePathPolicyTest, RejectsAbsolutePath) {
    ArchivePathPolicy policy(/*safe_paths_only=*/true);
    std::string out;

    auto res = policy.NormalizeEntryPath("/etc/passwd", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::CodecFailure);
}

TEST(ArchivePathPolicyTest, UnsafeModeOnlyNormalizes) {
    ArchivePathPolicy policy(/*safe_paths_only=*/false);
    std::string out;

    ASSERT_TRUE(policy.NormalizeEntryPath("/abs//x", out).is_ok());
    EXPECT_EQ(out, "abs/x");
}

} // namespace splitpack
