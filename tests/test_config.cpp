#include "util/config_json_utils.hpp"
#include "util/config_parser.hpp"

#include "testing.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace splitpack;
using namespace splitpack::config;

TEST(ConfigTest, FullFileIsApplied) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("splitpack.json");
    testutil::WriteFile(path, R"({
        "CompressionLevel": 3,
        "PackMode": "zip-then-split",
        "DirSplitMode": "store-split-compress",
        "DefaultPartSize": "64M",
        "Progress": false,
        "LogLevel": "debug"
    })");

    ToolConfigFromFile cfg;
    auto r = cfg.LoadFile(path);
    ASSERT_TRUE(r.is_ok()) << r.Describe();
    EXPECT_EQ(cfg.compression_level, 3);
    EXPECT_EQ(cfg.pack_mode, PackMode::ZipThenSplit);
    EXPECT_EQ(cfg.dir_split_mode, DirSplitMode::StoreSplitCompress);
    EXPECT_EQ(cfg.default_part_size, 64ULL * 1024 * 1024);
    EXPECT_EQ(cfg.progress, false);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST(ConfigTest, EmptyObjectLeavesEverythingUnset) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Join("c.json"), "{}");

    ToolConfigFromFile cfg;
    cfg.compression_level = 9;
    ASSERT_TRUE(cfg.LoadFile(tmp.Join("c.json")).is_ok());
    EXPECT_FALSE(cfg.compression_level.has_value());
    EXPECT_FALSE(cfg.pack_mode.has_value());
    EXPECT_FALSE(cfg.default_part_size.has_value());
    EXPECT_FALSE(cfg.progress.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(ConfigTest, FillRejectsBadValues) {
    struct FailCase {
        const char* json;
        const char* expected_error_substr;
    };
    const FailCase cases[] = {
        {R"({"CompressionLevel": "high"})", "must be an integer"},
        {R"({"CompressionLevel": 12})", "within 1..9"},
        {R"({"PackMode": 1})", "PackMode must be a string"},
        {R"({"PackMode": "shuffle"})", "unknown pack mode"},
        {R"({"DirSplitMode": "both"})", "unknown directory split mode"},
        {R"({"DefaultPartSize": 4096})", "DefaultPartSize must be a string"},
        {R"({"DefaultPartSize": "10"})", "DefaultPartSize:"},
        {R"({"Progress": "yes"})", "Progress must be a boolean"},
        {R"({"LogLevel": "loud"})", "unknown LogLevel"},
    };
    for (const auto& c : cases) {
        ToolConfigFromFile cfg;
        std::string err;
        EXPECT_FALSE(detail::FillConfigFromJson(nlohmann::json::parse(c.json), cfg, err)) << c.json;
        EXPECT_NE(err.find(c.expected_error_substr), std::string::npos) << c.json << " -> " << err;
    }
}

TEST(ConfigTest, LoadJsonObjectErrors) {
    testutil::TemporaryDirectory tmp;
    nlohmann::json j;
    std::string err;

    EXPECT_FALSE(detail::LoadJsonObjectFromFile(tmp.Join("none.json"), j, err));
    EXPECT_NE(err.find("cannot open"), std::string::npos);

    testutil::WriteFile(tmp.Join("list.json"), "[1,2]");
    EXPECT_FALSE(detail::LoadJsonObjectFromFile(tmp.Join("list.json"), j, err));
    EXPECT_NE(err.find("root must be JSON object"), std::string::npos);

    testutil::WriteFile(tmp.Join("broken.json"), "{\"a\":");
    EXPECT_FALSE(detail::LoadJsonObjectFromFile(tmp.Join("broken.json"), j, err));
    EXPECT_NE(err.find("invalid JSON"), std::string::npos);
}

TEST(ConfigTest, LoadFileErrorKinds) {
    testutil::TemporaryDirectory tmp;
    ToolConfigFromFile cfg;

    auto r = cfg.LoadFile(tmp.Join("missing.json"));
    EXPECT_EQ(r.kind, ErrorKind::IOFailure);
    EXPECT_EQ(r.path, tmp.Join("missing.json"));

    testutil::WriteFile(tmp.Join("bad.json"), R"({"CompressionLevel": 2, "PackMode": "nope"})");
    r = cfg.LoadFile(tmp.Join("bad.json"));
    EXPECT_EQ(r.kind, ErrorKind::InvalidSpec);
    // A rejected file leaves nothing half-applied.
    EXPECT_FALSE(cfg.compression_level.has_value());
}

TEST(ConfigTest, DefaultPathFollowsEnvironment) {
    ::setenv(kConfigEnvVar, "/etc/splitpack.json", 1);
    EXPECT_EQ(ToolConfigFromFile::DefaultPath(), "/etc/splitpack.json");
    ::unsetenv(kConfigEnvVar);
    EXPECT_EQ(ToolConfigFromFile::DefaultPath(), "");
}
