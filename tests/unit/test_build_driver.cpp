// File: tests/unit/test_build_driver.cpp
// Purpose: Verify the build driver's workspace handling and toolchain steps
//          using a recording fake in place of the Go toolchain.
// Key invariants:
//   - Steps run in order (mod init, mod tidy, build) inside the workspace.
//   - The first failing step aborts the build and its output is surfaced.
//   - The workspace is removed afterwards unless retention was requested.
// Ownership/Lifetime: Standalone unit test executable; creates and removes
//                     a scratch directory under the system temp directory.
// Links: docs/codemap.md

#include "driver/BuildDriver.hpp"
#include "driver/Transpiler.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace shgo;

namespace
{
std::string slurp(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// Stands in for the go tool: records each call, snapshots the entry source
/// and writes a fake binary for `build -o NAME`.
struct FakeGo
{
    std::vector<std::vector<std::string>> calls;
    std::vector<std::string> cwds;
    std::string entrySeen;

    /// Index of the call that fails, or -1.
    int failAt = -1;
    RunResult failure{1, "", ""};
    bool produceBinary = true;

    ProcessRunner runner()
    {
        return [this](const std::vector<std::string> &argv, const std::optional<std::string> &cwd)
        {
            calls.push_back(argv);
            cwds.push_back(cwd.value_or(""));
            if (static_cast<int>(calls.size()) - 1 == failAt)
                return failure;

            const fs::path dir(cwd.value_or("."));
            entrySeen = slurp(dir / driver::kEntrySource);
            if (argv.size() == 4 && argv[1] == "build" && produceBinary)
            {
                std::ofstream bin(dir / argv[3], std::ios::binary);
                bin << "ELF";
            }
            return RunResult{0, "", ""};
        };
    }
};

class BuildDriverTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               ("shgo-build-" + std::to_string(::getpid()) + "-" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};
} // namespace

TEST_F(BuildDriverTest, RunsToolchainStepsInWorkspace)
{
    FakeGo go;
    support::Options opts;
    driver::BuildDriver driver(opts, go.runner());

    const fs::path output = dir_ / "app";
    auto result = driver.stageAndBuild("package main\n", output.string());
    ASSERT_TRUE(result.hasValue()) << result.error().message;

    ASSERT_EQ(go.calls.size(), 3u);
    EXPECT_EQ(go.calls[0], (std::vector<std::string>{"go", "mod", "init", "shgo_output"}));
    EXPECT_EQ(go.calls[1], (std::vector<std::string>{"go", "mod", "tidy"}));
    EXPECT_EQ(go.calls[2], (std::vector<std::string>{"go", "build", "-o", "app"}));
    EXPECT_EQ(go.cwds[0], go.cwds[2]);
    EXPECT_EQ(go.entrySeen, "package main\n");

    EXPECT_EQ(slurp(output), "ELF");
    EXPECT_FALSE(fs::exists(go.cwds[0]));
}

TEST_F(BuildDriverTest, HonoursToolAndModuleOptions)
{
    FakeGo go;
    support::Options opts;
    opts.goTool = "/opt/go/bin/go";
    opts.moduleName = "example.com/tool";
    driver::BuildDriver driver(opts, go.runner());

    auto result = driver.stageAndBuild("package main\n", (dir_ / "tool").string());
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    ASSERT_EQ(go.calls.size(), 3u);
    EXPECT_EQ(go.calls[0][0], "/opt/go/bin/go");
    EXPECT_EQ(go.calls[0][3], "example.com/tool");
    EXPECT_EQ(go.calls[2][0], "/opt/go/bin/go");
}

TEST_F(BuildDriverTest, FailedStepSurfacesToolOutput)
{
    FakeGo go;
    go.failAt = 1;
    go.failure = RunResult{1, "go: finding module for package example.com/x\nmissing\n", ""};
    support::Options opts;
    driver::BuildDriver driver(opts, go.runner());

    const fs::path output = dir_ / "app";
    auto result = driver.stageAndBuild("package main\n", output.string());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, support::ErrorKind::BuildToolFailure);
    EXPECT_EQ(result.error().message, "go mod tidy failed with exit status 1:\n"
                                      "go: finding module for package example.com/x\nmissing");

    EXPECT_EQ(go.calls.size(), 2u);
    EXPECT_FALSE(fs::exists(output));
    EXPECT_FALSE(fs::exists(go.cwds[0]));
}

TEST_F(BuildDriverTest, LaunchFailureNamesTheTool)
{
    FakeGo go;
    go.failAt = 0;
    go.failure = RunResult{-1, "", "No such file or directory"};
    support::Options opts;
    driver::BuildDriver driver(opts, go.runner());

    auto result = driver.stageAndBuild("package main\n", (dir_ / "app").string());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().message, "go mod init: cannot run 'go': No such file or directory");
    EXPECT_EQ(go.calls.size(), 1u);
}

TEST_F(BuildDriverTest, MissingBinaryIsReported)
{
    FakeGo go;
    go.produceBinary = false;
    support::Options opts;
    opts.keepWorkspace = true;
    opts.workspaceDir = (dir_ / "ws").string();
    driver::BuildDriver driver(opts, go.runner());

    auto result = driver.stageAndBuild("package main\n", (dir_ / "app").string());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().message,
              "go build did not produce '" + (dir_ / "ws" / "app").string() + "'");
}

TEST_F(BuildDriverTest, KeepsRequestedWorkspace)
{
    FakeGo go;
    support::Options opts;
    opts.keepWorkspace = true;
    opts.workspaceDir = (dir_ / "ws").string();
    driver::BuildDriver driver(opts, go.runner());

    auto result = driver.stageAndBuild("package main\n", (dir_ / "bin" / "app").string());
    // The output directory does not exist, so relocation fails after the
    // build; the workspace must still be kept.
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, support::ErrorKind::BuildToolFailure);
    EXPECT_EQ(go.cwds[0], (dir_ / "ws").string());
    EXPECT_EQ(slurp(dir_ / "ws" / driver::kEntrySource), "package main\n");
    EXPECT_TRUE(fs::exists(dir_ / "ws" / "app"));
}

TEST_F(BuildDriverTest, RequestedWorkspaceIsRemovedByDefault)
{
    FakeGo go;
    support::Options opts;
    opts.workspaceDir = (dir_ / "ws").string();
    driver::BuildDriver driver(opts, go.runner());

    auto result = driver.stageAndBuild("package main\n", (dir_ / "app").string());
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_FALSE(fs::exists(dir_ / "ws"));
    EXPECT_TRUE(fs::exists(dir_ / "app"));
}

TEST_F(BuildDriverTest, NonEmptyWorkspaceIsRejected)
{
    fs::create_directories(dir_ / "ws");
    std::ofstream(dir_ / "ws" / "stale.go") << "package stale\n";

    FakeGo go;
    support::Options opts;
    opts.workspaceDir = (dir_ / "ws").string();
    driver::BuildDriver driver(opts, go.runner());

    auto result = driver.stageAndBuild("package main\n", (dir_ / "app").string());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().message, "workspace '" + (dir_ / "ws").string() + "' is not empty");
    EXPECT_TRUE(go.calls.empty());
    EXPECT_TRUE(fs::exists(dir_ / "ws" / "stale.go"));
}

TEST_F(BuildDriverTest, OutputMustNameAFile)
{
    FakeGo go;
    support::Options opts;
    driver::BuildDriver driver(opts, go.runner());

    const std::string output = dir_.string() + "/";
    auto result = driver.stageAndBuild("package main\n", output);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().message, "output path '" + output + "' does not name a file");
    EXPECT_TRUE(go.calls.empty());
}

TEST_F(BuildDriverTest, BuildFileTranspilesThenBuilds)
{
    FakeGo go;
    support::Options opts;
    support::SourceManager sm;
    const std::string script = std::string(SHGO_TEST_DATA_DIR) + "/hello.sh";

    auto result = driver::buildFile(script, (dir_ / "hello").string(), opts, sm, go.runner());
    ASSERT_TRUE(result.hasValue()) << result.error().message;
    EXPECT_NE(go.entrySeen.find("fmt.Println(\"Hello, \" + NAME + \"!\")"), std::string::npos);
    EXPECT_TRUE(fs::exists(dir_ / "hello"));
}

TEST_F(BuildDriverTest, BuildFileDoesNotRunToolchainForUnsupportedScripts)
{
    FakeGo go;
    support::Options opts;
    support::SourceManager sm;
    const std::string script = std::string(SHGO_TEST_DATA_DIR) + "/unsupported.sh";

    auto result = driver::buildFile(script, (dir_ / "app").string(), opts, sm, go.runner());
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().kind, support::ErrorKind::UnsupportedConstruct);
    EXPECT_TRUE(go.calls.empty());
    EXPECT_FALSE(fs::exists(dir_ / "app"));
}
