#include <gtest/gtest.h>

#include "util/path_utils.hpp"

#include "testing.hpp"

#include <filesystem>

TEST(PathUtilsTest, NormalizeArchivePathCleansInput) {
    EXPECT_EQ(splitpack::NormalizeArchivePath("./photos/a.jpg"), "photos/a.jpg");
    EXPECT_EQ(splitpack::NormalizeArchivePath("/photos//2024///"), "photos/2024");
    EXPECT_EQ(splitpack::NormalizeArchivePath("photos/"), "photos");
    EXPECT_EQ(splitpack::NormalizeArchivePath(""), "");
}

TEST(PathUtilsTest, BaseNameOf) {
    EXPECT_EQ(splitpack::BaseNameOf("/data/file.bin"), "file.bin");
    EXPECT_EQ(splitpack::BaseNameOf("/data/photos/"), "photos");
    EXPECT_EQ(splitpack::BaseNameOf("file.bin"), "file.bin");
}

TEST(PathUtilsTest, StripZipExtension) {
    EXPECT_EQ(splitpack::StripZipExtension("photos.zip"), "photos");
    EXPECT_EQ(splitpack::StripZipExtension("file.bin"), "file.bin");
    EXPECT_EQ(splitpack::StripZipExtension(".zip"), ".zip");
}

TEST(PathUtilsTest, IsWithin) {
    testutil::TemporaryDirectory tmp;
    std::filesystem::create_directories(tmp.Join("in/photos/2024"));
    std::filesystem::create_directories(tmp.Join("in/photos-old"));

    EXPECT_TRUE(splitpack::IsWithin(tmp.Join("in/photos"), tmp.Join("in/photos")));
    EXPECT_TRUE(splitpack::IsWithin(tmp.Join("in/photos/2024"), tmp.Join("in/photos")));
    EXPECT_TRUE(splitpack::IsWithin(tmp.Join("in/photos/not-yet/out"), tmp.Join("in/photos")));
    EXPECT_TRUE(splitpack::IsWithin(tmp.Join("in/photos-old/../photos/x"), tmp.Join("in/photos")));

    // Component-wise, not a string prefix.
    EXPECT_FALSE(splitpack::IsWithin(tmp.Join("in/photos-old"), tmp.Join("in/photos")));
    EXPECT_FALSE(splitpack::IsWithin(tmp.Join("in"), tmp.Join("in/photos")));
    EXPECT_FALSE(splitpack::IsWithin(tmp.Join("in/photos/../out"), tmp.Join("in/photos")));
}
