#include "splitpack/pack_manifest.hpp"
#include "testing.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/wait.h>

namespace splitpack {
namespace {

namespace fs = std::filesystem;

std::string ShellQuote(const std::string& s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

int ExitCodeFromSystem(int rc) {
    if (rc == -1) {
        return -1;
    }
    if (WIFEXITED(rc)) {
        return WEXITSTATUS(rc);
    }
    return -1;
}

// Runs the CLI with `args` (already quoted), stdout captured into `out`.
int RunCli(const std::string& args, std::string* out = nullptr) {
    const std::string cmd = "SPLITPACK_CONFIG= " + ShellQuote(SPLITPACK_CLI_BIN) + " " + args + " 2>/dev/null";
    FILE* p = ::popen(cmd.c_str(), "r");
    if (!p) {
        return -1;
    }
    std::string captured;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), p)) > 0) {
        captured.append(buf, n);
    }
    const int rc = ::pclose(p);
    if (out) {
        *out = captured;
    }
    return ExitCodeFromSystem(rc);
}

TEST(MainCliTest, PackRestoreAndVerifyFile) {
    testutil::TemporaryDirectory tmp;
    const std::string input = tmp.Join("in/video.bin");
    const std::string data = testutil::PatternBytes(3 * 1024 * 1024 + 17, 5);
    testutil::WriteFile(input, data);

    std::string out;
    ASSERT_EQ(RunCli("pack --quiet --json -i " + ShellQuote(input) + " -o " + ShellQuote(tmp.Join("out")) +
                         " --size 1M",
                     &out),
              0);
    const auto j = nlohmann::json::parse(out);
    EXPECT_EQ(j["parts"], 4);
    ASSERT_EQ(j["outputFiles"].size(), 4u);
    EXPECT_EQ(j["outputFiles"][3], tmp.Join("out/video.bin.parts/video.bin.part-0004.zip"));
    EXPECT_EQ(j["baseName"], "video.bin");
    const std::string manifest = tmp.Join("out/video.bin.parts.json");
    EXPECT_EQ(j["manifest"], manifest);
    ASSERT_TRUE(fs::is_regular_file(manifest));

    ASSERT_EQ(RunCli("verify --quiet --manifest " + ShellQuote(manifest)), 0);

    ASSERT_EQ(RunCli("restore --quiet -i " + ShellQuote(tmp.Join("out/video.bin.parts")) + " -o " +
                     ShellQuote(tmp.Join("restored")) + " --manifest " + ShellQuote(manifest)),
              0);
    EXPECT_EQ(testutil::ReadFile(tmp.Join("restored/video.bin")), data);
}

TEST(MainCliTest, ZipThenSplitDirectoryWithExtract) {
    testutil::TemporaryDirectory tmp;
    const std::string root = tmp.Join("in/docs");
    testutil::WriteFile(root + "/a.txt", "alpha");
    testutil::WriteFile(root + "/sub/b.bin", testutil::PatternBytes(70000, 8));

    ASSERT_EQ(RunCli("pack --quiet --mode zip-then-split -i " + ShellQuote(root) + " -o " +
                     ShellQuote(tmp.Join("out")) + " --count 3"),
              0);
    EXPECT_TRUE(fs::is_regular_file(tmp.Join("out/docs.parts/docs.zip.part-0003")));

    std::string out;
    ASSERT_EQ(RunCli("restore --quiet --mode zip-then-split --extract -i " +
                         ShellQuote(tmp.Join("out/docs.parts/docs.zip.part-0002")) + " -o " +
                         ShellQuote(tmp.Join("restored")),
                     &out),
              0);
    EXPECT_NE(out.find(tmp.Join("restored/docs/a.txt")), std::string::npos);
    EXPECT_EQ(testutil::ReadFile(tmp.Join("restored/docs/a.txt")), "alpha");
    EXPECT_EQ(testutil::ReadFile(tmp.Join("restored/docs/sub/b.bin")), testutil::PatternBytes(70000, 8));
    EXPECT_FALSE(fs::exists(tmp.Join("restored/docs.zip")));
}

TEST(MainCliTest, ExitCodes) {
    testutil::TemporaryDirectory tmp;
    const std::string input = tmp.Join("in/data.bin");
    testutil::WriteFile(input, testutil::PatternBytes(50000, 2));
    const std::string pack = "pack --quiet -i " + ShellQuote(input) + " -o " + ShellQuote(tmp.Join("out"));

    EXPECT_EQ(RunCli(""), 2);
    EXPECT_EQ(RunCli("frobnicate"), 2);
    EXPECT_EQ(RunCli("pack --quiet -i " + ShellQuote(input)), 2);
    EXPECT_EQ(RunCli(pack + " --size 100"), 2);
    EXPECT_EQ(RunCli(pack + " --size 4K --count 2"), 2);
    EXPECT_EQ(RunCli(pack + " --count 2 --mode sideways"), 2);

    ASSERT_EQ(RunCli(pack + " --count 2"), 0);
    // Non-empty parts directory without --overwrite.
    EXPECT_EQ(RunCli(pack + " --count 2"), 3);
    EXPECT_EQ(RunCli(pack + " --count 3 --overwrite"), 0);

    // Tamper with one part, then verify and digest-checked restore both fail.
    const std::string manifest = tmp.Join("out/data.bin.parts.json");
    PackManifest m;
    ASSERT_TRUE(LoadPackManifest(manifest, m).is_ok());
    ASSERT_EQ(m.parts.size(), 3u);
    const auto paths = m.ResolvedPaths(tmp.Join("out"));
    testutil::WriteFile(paths[1], "tampered");

    std::string out;
    EXPECT_EQ(RunCli("verify --manifest " + ShellQuote(manifest), &out), 4);
    EXPECT_NE(out.find("MISMATCH " + paths[1]), std::string::npos);
    EXPECT_EQ(RunCli("restore --quiet -i " + ShellQuote(paths[0]) + " -o " + ShellQuote(tmp.Join("r")) +
                     " --manifest " + ShellQuote(manifest)),
              4);
    EXPECT_FALSE(fs::exists(tmp.Join("r/data.bin")));

    // Missing part.
    fs::remove(paths[1]);
    EXPECT_EQ(RunCli("restore --quiet -i " + ShellQuote(paths[0]) + " -o " + ShellQuote(tmp.Join("r"))), 1);
}

TEST(MainCliTest, JsonErrorOutput) {
    testutil::TemporaryDirectory tmp;
    fs::create_directories(tmp.Join("empty"));

    std::string out;
    EXPECT_EQ(RunCli("restore --json -i " + ShellQuote(tmp.Join("empty")) + " -o " + ShellQuote(tmp.Join("r")),
                     &out),
              1);
    const auto j = nlohmann::json::parse(out);
    EXPECT_EQ(j["ok"], false);
    EXPECT_EQ(j["error"], ErrorKindName(ErrorKind::NoPartsFound));
}

TEST(MainCliTest, ExplicitConfigFileMustLoad) {
    testutil::TemporaryDirectory tmp;
    const std::string input = tmp.Join("in/data.bin");
    testutil::WriteFile(input, testutil::PatternBytes(9000, 2));
    const std::string pack = "pack --quiet -i " + ShellQuote(input) + " -o " + ShellQuote(tmp.Join("out"));

    EXPECT_EQ(RunCli(pack + " --config " + ShellQuote(tmp.Join("nope.json"))), 1);

    testutil::WriteFile(tmp.Join("bad.json"), R"({"CompressionLevel": 42})");
    EXPECT_EQ(RunCli(pack + " --config " + ShellQuote(tmp.Join("bad.json"))), 2);

    // DefaultPartSize stands in for --size.
    testutil::WriteFile(tmp.Join("good.json"), R"({"DefaultPartSize": "4K", "Progress": false})");
    ASSERT_EQ(RunCli(pack + " --config " + ShellQuote(tmp.Join("good.json"))), 0);
    EXPECT_EQ(testutil::ListNames(tmp.Join("out/data.bin.parts")).size(), 3u);
}

} // namespace
} // namespace splitpack
