#include <gtest/gtest.h>

#include "splitpack/dir_archiver.hpp"
#include "testing.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace splitpack {

namespace fs = std::filesystem;

class DirArchiverTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory tmp;

    std::string MakeTree() {
        const std::string root = tmp.Join("photos");
        testutil::WriteFile(root + "/b.jpg", testutil::PatternBytes(3000, 1));
        testutil::WriteFile(root + "/a.jpg", testutil::PatternBytes(2000, 2));
        testutil::WriteFile(root + "/2024/c.jpg", testutil::PatternBytes(1000, 3));
        fs::create_directories(root + "/empty");
        return root;
    }
};

TEST_F(DirArchiverTest, ScanIsSortedAndSumsRegularFiles) {
    const std::string root = MakeTree();
    fs::create_symlink(root + "/a.jpg", root + "/link.jpg");

    std::vector<TreeEntry> entries;
    std::uint64_t total = 0;
    ASSERT_TRUE(DirectoryArchiver::Scan(root, entries, total).is_ok());

    std::vector<std::string> rels;
    for (const auto& e : entries) rels.push_back(e.rel);
    EXPECT_EQ(rels, (std::vector<std::string>{"2024", "2024/c.jpg", "a.jpg", "b.jpg", "empty"}));
    EXPECT_EQ(total, 6000u);
}

TEST_F(DirArchiverTest, ZipTreeRootsEntriesUnderDirectoryName) {
    const std::string root = MakeTree();
    const std::string zip = tmp.Join("photos.zip");

    ASSERT_TRUE(DirectoryArchiver().ZipTree(root, zip).is_ok());

    const std::string out = tmp.Join("out");
    fs::create_directories(out);
    std::vector<std::string> entries;
    ASSERT_TRUE(ZipExtractor().ExtractToDir(zip, out, &entries).is_ok());

    EXPECT_EQ(entries.front(), "photos");
    EXPECT_EQ(testutil::ReadFile(out + "/photos/a.jpg"), testutil::ReadFile(root + "/a.jpg"));
    EXPECT_EQ(testutil::ReadFile(out + "/photos/2024/c.jpg"), testutil::ReadFile(root + "/2024/c.jpg"));
    EXPECT_TRUE(fs::is_directory(out + "/photos/empty"));
}

TEST_F(DirArchiverTest, EmptyDirectoryYieldsSingleRootEntry) {
    const std::string root = tmp.Join("nothing");
    fs::create_directories(root);
    const std::string zip = tmp.Join("nothing.zip");
    ASSERT_TRUE(DirectoryArchiver().ZipTree(root, zip).is_ok());

    const std::string out = tmp.Join("out");
    fs::create_directories(out);
    std::vector<std::string> entries;
    ASSERT_TRUE(ZipExtractor().ExtractToDir(zip, out, &entries).is_ok());
    EXPECT_EQ(entries, (std::vector<std::string>{"nothing"}));
    EXPECT_TRUE(fs::is_directory(out + "/nothing"));
}

TEST_F(DirArchiverTest, SameTreeGivesSameBytes) {
    const std::string root = MakeTree();
    ASSERT_TRUE(DirectoryArchiver().ZipTree(root, tmp.Join("one.zip")).is_ok());
    ASSERT_TRUE(DirectoryArchiver().ZipTree(root, tmp.Join("two.zip")).is_ok());
    EXPECT_EQ(testutil::ReadFile(tmp.Join("one.zip")), testutil::ReadFile(tmp.Join("two.zip")));
}

TEST_F(DirArchiverTest, CancelStopsZipping) {
    const std::string root = MakeTree();
    std::atomic_bool cancel{true};
    DirectoryArchiver::Options opt;
    opt.cancel = &cancel;

    auto r = DirectoryArchiver(opt).ZipTree(root, tmp.Join("c.zip"));
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
}

} // namespace splitpack
