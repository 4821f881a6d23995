//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/shgo/cli.hpp
// Purpose: Declarations for the shgo subcommand handlers, argument parsing
//          and usage helpers.
// Key invariants: Handlers return 0 on success, 1 on conversion or build
//                 errors and 2 on usage errors.
// Ownership/Lifetime: N/A.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/RunProcess.hpp"
#include "support/options.hpp"

#include <ostream>
#include <string>

namespace shgo::tools
{

/// @brief Exit status for malformed command lines.
inline constexpr int kUsageError = 2;

/// @brief Parsed shgo command line.
struct CliOptions
{
    /// @brief Subcommand name: "convert", "build" or "ir".
    std::string command;

    /// @brief Input shell script.
    std::string script;

    /// @brief Value of `-o`.
    std::string output;

    /// @brief Pipeline options (trace, workspace, go tool).
    support::Options opts;
};

/// @brief Result of parsing the command line.
enum class CliParseResult
{
    Run,     ///< Dispatch to the subcommand.
    Help,    ///< `--help` was requested.
    Version, ///< `--version` was requested.
    Error    ///< Malformed arguments; a message was written.
};

/// @brief Parse @p argv into @p cli, reporting problems on @p err.
CliParseResult parseCommandLine(int argc, char **argv, CliOptions &cli, std::ostream &err);

void printUsage(std::ostream &os);
void printVersion(std::ostream &os);

int cmdConvert(const CliOptions &cli, std::ostream &err);
int cmdBuild(const CliOptions &cli, std::ostream &err, ProcessRunner runner = defaultProcessRunner());
int cmdIr(const CliOptions &cli, std::ostream &out, std::ostream &err);

/// @brief Full CLI: parse, then dispatch.
int runCli(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace shgo::tools
