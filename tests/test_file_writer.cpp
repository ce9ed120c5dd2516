#include "io/copy.hpp"
#include "io/file_writer.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class FileWriterTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }
};

TEST_F(FileWriterTests, OpenNonexistentPath_Fails) {
    splitpack::FileWriter w;
    auto res = splitpack::FileWriter::Open(tmp.Path() + "/no_such_dir/out.bin", w);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, splitpack::ErrorKind::IOFailure);
}

TEST_F(FileWriterTests, WriteAll_WritesExactBytes) {
    const std::string out_path = MakePath("out.bin");

    splitpack::FileWriter w;
    auto res = splitpack::FileWriter::Open(out_path, w);
    ASSERT_TRUE(res.ok) << res.msg;

    const std::string data = testutil::PatternBytes(1024 * 1024 + 123, 9);
    auto wr = w.WriteAll(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
    ASSERT_TRUE(wr.ok) << wr.msg;

    auto fin = w.Finish();
    ASSERT_TRUE(fin.ok) << fin.msg;

    EXPECT_EQ(testutil::ReadFile(out_path), data);
}

TEST_F(FileWriterTests, Open_TruncatesExistingFile) {
    const std::string out_path = MakePath("stale.bin");
    testutil::WriteFile(out_path, "old contents that are long");

    splitpack::FileWriter w;
    ASSERT_TRUE(splitpack::FileWriter::Open(out_path, w).ok);
    testutil::MemoryReader src(std::string("new"));
    ASSERT_TRUE(splitpack::CopyN(src, w, 3).ok);
    ASSERT_TRUE(w.Finish().ok);

    EXPECT_EQ(testutil::ReadFile(out_path), "new");
}

TEST_F(FileWriterTests, CopyN_FailsOnShortInput) {
    splitpack::FileWriter w;
    ASSERT_TRUE(splitpack::FileWriter::Open(MakePath("short.bin"), w).ok);

    testutil::MemoryReader src(std::string("abc"));
    auto res = splitpack::CopyN(src, w, 10);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, splitpack::ErrorKind::IOFailure);
}

TEST_F(FileWriterTests, CopyAll_ReportsCopiedBytesAndProgress) {
    splitpack::FileWriter w;
    ASSERT_TRUE(splitpack::FileWriter::Open(MakePath("all.bin"), w).ok);

    const std::string data = testutil::PatternBytes(3 * 1024 * 1024 + 17);
    testutil::MemoryReader src(data);
    std::uint64_t copied = 0;
    std::uint64_t reported = 0;
    auto res = splitpack::CopyAll(src, w, copied, [&](std::uint64_t n) { reported += n; });
    ASSERT_TRUE(res.ok) << res.msg;
    ASSERT_TRUE(w.Finish().ok);

    EXPECT_EQ(copied, data.size());
    EXPECT_EQ(reported, data.size());
    EXPECT_EQ(testutil::ReadFile(MakePath("all.bin")), data);
}

} // namespace
