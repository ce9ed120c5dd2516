#include <gtest/gtest.h>

#include "splitpack/part_namer.hpp"

#include <string>

namespace splitpack {

TEST(PartNamerTest, SplitThenZipNames) {
    EXPECT_EQ(PartNamer::PartFileName(PackMode::SplitThenZip, "file.bin", 1), "file.bin.part-0001.zip");
    EXPECT_EQ(PartNamer::PartFileName(PackMode::SplitThenZip, "file.bin", 42), "file.bin.part-0042.zip");
}

TEST(PartNamerTest, ZipThenSplitNames) {
    EXPECT_EQ(PartNamer::PartFileName(PackMode::ZipThenSplit, "photos", 1), "photos.zip.part-0001");
    EXPECT_EQ(PartNamer::PartFileName(PackMode::ZipThenSplit, "photos", 3), "photos.zip.part-0003");
}

TEST(PartNamerTest, LabelGrowsPastFourDigits) {
    EXPECT_EQ(PartNamer::FormatLabel(9999), "9999");
    EXPECT_EQ(PartNamer::FormatLabel(10000), "10000");
    EXPECT_EQ(PartNamer::PartFileName(PackMode::SplitThenZip, "a", 12345), "a.part-12345.zip");
}

TEST(PartNamerTest, ParseInvertsNameForBothModes) {
    const std::string bases[] = {"file.bin", "photos", "my archive.tar.gz", "a.part-0003", "x.zip"};
    const std::uint64_t indices[] = {1, 2, 9, 10, 999, 9999, 10000, 123456};
    for (auto mode : {PackMode::SplitThenZip, PackMode::ZipThenSplit}) {
        for (const auto& base : bases) {
            for (auto index : indices) {
                const std::string name = PartNamer::PartFileName(mode, base, index);
                auto parsed = PartNamer::Parse(mode, name);
                ASSERT_TRUE(parsed.has_value()) << name;
                EXPECT_EQ(parsed->base, base) << name;
                EXPECT_EQ(parsed->index, index) << name;
                EXPECT_EQ(parsed->label, PartNamer::FormatLabel(index)) << name;
            }
        }
    }
}

TEST(PartNamerTest, ParseKeepsLabelTextAsFound) {
    auto parsed = PartNamer::Parse(PackMode::SplitThenZip, "file.bin.part-01.zip");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->index, 1u);
    EXPECT_EQ(parsed->label, "01");
}

TEST(PartNamerTest, ParseRejectsOtherModesNames) {
    EXPECT_FALSE(PartNamer::Parse(PackMode::SplitThenZip, "photos.zip.part-0001").has_value());
    EXPECT_FALSE(PartNamer::Parse(PackMode::ZipThenSplit, "file.bin.part-0001.zip").has_value());
}

TEST(PartNamerTest, ParseRejectsMalformedNames) {
    EXPECT_FALSE(PartNamer::Parse(PackMode::SplitThenZip, "file.bin").has_value());
    EXPECT_FALSE(PartNamer::Parse(PackMode::SplitThenZip, "file.bin.part-.zip").has_value());
    EXPECT_FALSE(PartNamer::Parse(PackMode::SplitThenZip, "file.bin.part-00a1.zip").has_value());
    EXPECT_FALSE(PartNamer::Parse(PackMode::SplitThenZip, "file.bin.part-0000.zip").has_value());
    EXPECT_FALSE(PartNamer::Parse(PackMode::SplitThenZip, ".part-0001.zip").has_value());
    EXPECT_FALSE(PartNamer::Parse(PackMode::SplitThenZip, "file.bin.part-99999999999999999999999.zip").has_value());
    EXPECT_FALSE(PartNamer::Parse(PackMode::ZipThenSplit, "photos.zip.part-0001.tmp").has_value());
    EXPECT_FALSE(PartNamer::Parse(PackMode::ZipThenSplit, ".zip.part-0001").has_value());
}

TEST(PartNamerTest, ChunkAndDirectoryNames) {
    EXPECT_EQ(PartNamer::ChunkEntryName("file.bin", "0002"), "file.bin.part-0002");
    EXPECT_EQ(PartNamer::PartsDirName("file.bin"), "file.bin.parts");
}

} // namespace splitpack
