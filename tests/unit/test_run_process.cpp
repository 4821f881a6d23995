// File: tests/unit/test_run_process.cpp
// Purpose: Verify run_process preserves shell-sensitive characters, applies
//          the working directory and environment, and reports exit statuses.
// Key invariants: Quotes, backslashes and expansion markers inside arguments
//                 survive round-tripping through the host shell.
// Ownership/Lifetime: RunProcess owns no persistent resources; the spawned
//                     process terminates immediately.
// Links: docs/codemap.md

#include "common/RunProcess.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using shgo::quote_posix_argument;
using shgo::run_process;
using shgo::RunResult;

TEST(RunProcess, PreservesQuotesAndBackslashes)
{
    const std::string trickyArg = "value \"with quotes\" and backslash \\\\ tail";

    const RunResult result = run_process({"printf", "%s", trickyArg});

    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ(trickyArg, result.out);
}

TEST(RunProcess, EscapesPosixShellExpansions)
{
    const std::string trickyArg = "literal $PATH and `uname` markers, it's 'quoted'";

    const RunResult result = run_process({"printf", "%s", trickyArg});

    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ(trickyArg, result.out);
}

TEST(RunProcess, QuotesSingleQuotes)
{
    EXPECT_EQ("'plain'", quote_posix_argument("plain"));
    EXPECT_EQ("'it'\\''s'", quote_posix_argument("it's"));
    EXPECT_EQ("''", quote_posix_argument(""));
}

TEST(RunProcess, ForwardsEnvironmentVariables)
{
    const std::string varName = "SHGO_RUN_PROCESS_TEST_VAR";
    const std::string varValue = "shgo-test-value";
    const RunResult result = run_process({"sh", "-c", "printf %s \"$" + varName + "\""},
                                         std::nullopt, {{varName, varValue}});

    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ(varValue, result.out);
}

TEST(RunProcess, AppliesWorkingDirectory)
{
    const std::filesystem::path tempRoot = std::filesystem::temp_directory_path();
    const auto uniqueSuffix = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path tempDir =
        tempRoot / std::filesystem::path("shgo-run-process-" + std::to_string(uniqueSuffix));

    std::filesystem::create_directories(tempDir);

    const RunResult result = run_process({"touch", "marker.txt"}, tempDir.string());

    EXPECT_EQ(0, result.exit_code);
    EXPECT_TRUE(std::filesystem::exists(tempDir / "marker.txt"));

    std::error_code ec;
    std::filesystem::remove_all(tempDir, ec);
}

TEST(RunProcess, WorkingDirectoryStaysInsideChild)
{
    namespace fs = std::filesystem;
    const auto uniqueSuffix = std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path base = fs::temp_directory_path() / ("shgo-run-process-cwd-" +
                                                       std::to_string(uniqueSuffix));
    const fs::path first = base / "first";
    const fs::path second = base / "second";
    fs::create_directories(first);
    fs::create_directories(second);
    const fs::path parentBefore = fs::current_path();

    RunResult firstResult{0, "", ""};
    RunResult secondResult{0, "", ""};
    fs::path parentDuring;
    std::thread worker([&] {
        firstResult = run_process({"sh", "-c", "sleep 0.5; pwd"}, first.string());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    parentDuring = fs::current_path();
    secondResult = run_process({"sh", "-c", "pwd"}, second.string());
    worker.join();

    EXPECT_EQ(parentBefore, parentDuring);
    EXPECT_EQ(parentBefore, fs::current_path());
    EXPECT_EQ(0, firstResult.exit_code);
    EXPECT_EQ(0, secondResult.exit_code);
    EXPECT_EQ(first.string() + "\n", firstResult.out);
    EXPECT_EQ(second.string() + "\n", secondResult.out);

    std::error_code ec;
    fs::remove_all(base, ec);
}

TEST(RunProcess, EnvironmentOverridesStayInsideChild)
{
    const std::string varName = "SHGO_RUN_PROCESS_SCOPED_VAR";
    const RunResult result = run_process({"sh", "-c", "printf %s \"$" + varName + "\""},
                                         std::nullopt, {{varName, "it's scoped"}});

    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ("it's scoped", result.out);
    EXPECT_EQ(nullptr, std::getenv(varName.c_str()));
}

TEST(RunProcess, InvalidEnvironmentNameIsLaunchFailure)
{
    const RunResult result = run_process({"true"}, std::nullopt, {{"BAD-NAME", "x"}});

    EXPECT_EQ(-1, result.exit_code);
    EXPECT_NE(std::string::npos, result.err.find("invalid environment variable name"));
}

TEST(RunProcess, MissingWorkingDirectoryIsLaunchFailure)
{
    const RunResult result =
        run_process({"true"}, std::string("/nonexistent/shgo-run-process-dir"));

    EXPECT_EQ(-1, result.exit_code);
    EXPECT_NE(std::string::npos, result.err.find("unable to enter directory"));
}

TEST(RunProcess, ReportsPosixExitStatus)
{
    const RunResult result = run_process({"sh", "-c", "exit 42"});

    EXPECT_EQ(42, result.exit_code);
}

TEST(RunProcess, MergesStandardError)
{
    const RunResult result = run_process({"sh", "-c", "echo to-stderr 1>&2"});

    EXPECT_EQ(0, result.exit_code);
    EXPECT_EQ("to-stderr\n", result.out);
}

TEST(RunProcess, DefaultRunnerForwardsToRunProcess)
{
    const shgo::ProcessRunner runner = shgo::defaultProcessRunner();
    const RunResult result = runner({"sh", "-c", "exit 3"}, std::nullopt);

    EXPECT_EQ(3, result.exit_code);
}
