/**
 * @file test_cli.cpp
 * @brief Unit tests for the command-line front end (GoogleTest)
 *
 * run_cli() is driven with an argument vector and string streams, so the
 * full flow (argument parsing, file I/O, merge, reporting, exit codes) is
 * exercised without spawning the binary.
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "inimerge/Cli.hpp"
#include "inimerge/Loader.hpp"
#include "inimerge/Result.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace inimerge;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/**
 * @brief RAII wrapper for a scratch directory with helper writers
 */
class Workspace {
public:
    Workspace() : path_(fs::temp_directory_path() /
                        ("inimerge_cli_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~Workspace() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

    std::string write(const std::string& name, const std::string& content) const {
        std::ofstream f(file(name), std::ios::binary);
        f << content;
        return file(name);
    }

private:
    fs::path path_;
};

/**
 * @brief Captured result of one run_cli() call
 */
struct Run {
    int code;
    std::string out;
    std::string err;
};

Run run(std::vector<std::string> args) {
    args.insert(args.begin(), "inimerge");
    std::ostringstream out, err;
    int code = run_cli(args, out, err);
    return {code, out.str(), err.str()};
}

const char* kBase =
    "[env]\n"
    "build_flags =\n"
    "\t-DDEBUG\n"
    "\t-DVERBOSE\n"
    "monitor_speed = 9600\n";

const char* kOverlay =
    "; === REMOVE ===\n"
    "[env]\n"
    "build_flags = -DDEBUG\n"
    "; === SUBSTITUTE ===\n"
    "[env]\n"
    "monitor_speed = 115200\n";

const char* kMerged =
    "[env]\n"
    "build_flags =\n"
    "\t-DVERBOSE\n"
    "monitor_speed = 115200\n";

} // anonymous namespace

// ============================================================================
// Help, version, usage errors
// ============================================================================

TEST(CliUsage, Help) {
    auto r = run({"--help"});
    EXPECT_EQ(r.code, 0);
    EXPECT_NE(r.out.find("--create-example"), std::string::npos);
}

TEST(CliUsage, Version) {
    auto r = run({"--version"});
    EXPECT_EQ(r.code, 0);
    EXPECT_EQ(r.out, std::string("inimerge ") + INIMERGE_VERSION + "\n");
}

TEST(CliUsage, MissingArguments) {
    EXPECT_EQ(run({}).code, static_cast<int>(ExitCode::Usage));
    EXPECT_EQ(run({"base.ini", "overlay.ini"}).code, static_cast<int>(ExitCode::Usage));
}

TEST(CliUsage, ExtraPositionalArgument) {
    auto r = run({"a.ini", "b.ini", "c.ini", "d.ini"});
    EXPECT_EQ(r.code, static_cast<int>(ExitCode::Usage));
    EXPECT_NE(r.err.find("unexpected argument 'd.ini'"), std::string::npos);
}

TEST(CliUsage, UnknownOption) {
    auto r = run({"--no-such-option", "a", "b", "c"});
    EXPECT_EQ(r.code, static_cast<int>(ExitCode::Usage));
    EXPECT_NE(r.err.find("Error:"), std::string::npos);
}

TEST(CliUsage, InvalidReportFormat) {
    EXPECT_EQ(run({"--report", "xml", "a", "b", "c"}).code, static_cast<int>(ExitCode::Usage));
}

TEST(CliUsage, QuietAndVerboseConflict) {
    EXPECT_EQ(run({"-q", "-v", "a", "b", "c"}).code, static_cast<int>(ExitCode::Usage));
}

// ============================================================================
// Merging
// ============================================================================

TEST(CliMerge, WritesOutput) {
    Workspace ws;
    auto base = ws.write("platformio.ini", kBase);
    auto overlay = ws.write("overlay.ini", kOverlay);
    auto output = ws.file("merged.ini");

    auto r = run({base, overlay, output});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_EQ(read_text_file(output), kMerged);
    EXPECT_NE(r.out.find("Merge succeeded"), std::string::npos);
}

TEST(CliMerge, OutputExistsWithoutForce) {
    Workspace ws;
    auto base = ws.write("platformio.ini", kBase);
    auto overlay = ws.write("overlay.ini", kOverlay);
    auto output = ws.write("merged.ini", "keep me");

    auto r = run({base, overlay, output});
    EXPECT_EQ(r.code, static_cast<int>(ExitCode::OutputExists));
    EXPECT_EQ(read_text_file(output), "keep me");

    auto forced = run({"--force", base, overlay, output});
    EXPECT_EQ(forced.code, 0);
    EXPECT_EQ(read_text_file(output), kMerged);
}

TEST(CliMerge, DryRunPrintsMergedText) {
    Workspace ws;
    auto base = ws.write("platformio.ini", kBase);
    auto overlay = ws.write("overlay.ini", kOverlay);

    auto r = run({"--dry-run", base, overlay});
    EXPECT_EQ(r.code, 0);
    EXPECT_EQ(r.out, kMerged);
    EXPECT_FALSE(fs::exists(ws.file("merged.ini")));
}

TEST(CliMerge, MissingInputIsFailure) {
    Workspace ws;
    auto overlay = ws.write("overlay.ini", kOverlay);

    auto r = run({ws.file("missing.ini"), overlay, ws.file("out.ini")});
    EXPECT_EQ(r.code, static_cast<int>(ExitCode::Failure));
    EXPECT_NE(r.err.find("File not found"), std::string::npos);
    EXPECT_FALSE(fs::exists(ws.file("out.ini")));
}

TEST(CliMerge, ParseErrorIsFailureAndWritesNothing) {
    Workspace ws;
    auto base = ws.write("platformio.ini", "[env\n");
    auto overlay = ws.write("overlay.ini", kOverlay);

    auto r = run({base, overlay, ws.file("out.ini")});
    EXPECT_EQ(r.code, static_cast<int>(ExitCode::Failure));
    EXPECT_NE(r.err.find("Parse error in base at line 1"), std::string::npos);
    EXPECT_FALSE(fs::exists(ws.file("out.ini")));
}

TEST(CliMerge, WarningsGoToStderrUnlessQuiet) {
    Workspace ws;
    auto base = ws.write("platformio.ini", kBase);
    auto overlay = ws.write("overlay.ini", "; === REMOVE ===\n[ghost]\nk =\n");

    auto r = run({base, overlay, ws.file("a.ini")});
    EXPECT_EQ(r.code, 0);
    EXPECT_NE(r.err.find("Warning: REMOVE [ghost]"), std::string::npos);

    auto quiet = run({"--quiet", base, overlay, ws.file("b.ini")});
    EXPECT_EQ(quiet.code, 0);
    EXPECT_TRUE(quiet.err.empty());
    EXPECT_TRUE(quiet.out.empty());
}

TEST(CliMerge, JsonReport) {
    Workspace ws;
    auto base = ws.write("platformio.ini", kBase);
    auto overlay = ws.write("overlay.ini", kOverlay);

    auto r = run({"--report", "json", base, overlay, ws.file("out.ini")});
    EXPECT_EQ(r.code, 0);
    auto j = nlohmann::json::parse(r.out);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["stats"]["lines_removed"], 1);
    EXPECT_EQ(j["stats"]["keys_substituted"], 1);
}

TEST(CliMerge, PolicyFile) {
    Workspace ws;
    auto base = ws.write("platformio.ini", "[env]\nboard = uno\n");
    auto overlay = ws.write("overlay.ini", "[env]\nboard = mega\n");
    auto policy = ws.write("policy.toml", "scalar_insert = \"overwrite\"\n");

    auto r = run({"--policy", policy, "--dry-run", base, overlay});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_EQ(r.out, "[env]\nboard = mega\n");

    auto missing = run({"--policy", ws.file("nope.toml"), "--dry-run", base, overlay});
    EXPECT_EQ(missing.code, static_cast<int>(ExitCode::Failure));
}

// ============================================================================
// Example generation
// ============================================================================

TEST(CliExample, CreatesAndRefusesToClobber) {
    Workspace ws;
    auto dir = ws.file("example");

    auto r = run({"--create-example", dir});
    EXPECT_EQ(r.code, 0);
    EXPECT_TRUE(fs::exists(fs::path(dir) / "platformio.ini"));
    EXPECT_TRUE(fs::exists(fs::path(dir) / "overlay.ini"));

    EXPECT_EQ(run({"--create-example", dir}).code, static_cast<int>(ExitCode::OutputExists));
    EXPECT_EQ(run({"--create-example", dir, "--force"}).code, 0);
}

TEST(CliExample, GeneratedFilesMerge) {
    Workspace ws;
    auto dir = ws.file("example");
    ASSERT_EQ(run({"--create-example", dir}).code, 0);

    auto r = run({(fs::path(dir) / "platformio.ini").string(),
                  (fs::path(dir) / "overlay.ini").string(),
                  ws.file("merged.ini")});
    EXPECT_EQ(r.code, 0) << r.err;
    EXPECT_TRUE(fs::exists(ws.file("merged.ini")));
}
