//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.hpp
// Purpose: Declare the subprocess helper used to drive external build tools.
// Key invariants: RunResult captures the exit code and merged stdout/stderr text.
// Ownership/Lifetime: Callers own argument buffers; helper copies command text as needed.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shgo
{

/// @brief Result of launching a subprocess.
struct RunResult
{
    int exit_code;   ///< Normalised process exit code (or -1 on launch failure).
    std::string out; ///< Captured standard output text (stderr merged in).
    std::string err; ///< Launch failure text; empty when the process ran.
};

/// @brief Spawn a subprocess using the provided argument vector.
/// @param argv Command-line arguments including the executable at index zero.
/// @param cwd Optional working directory for the child.
/// @param env Environment variable overrides expressed as key/value pairs.
/// @return Captured process result including exit code and output.
RunResult run_process(const std::vector<std::string> &argv,
                      std::optional<std::string> cwd = std::nullopt,
                      const std::vector<std::pair<std::string, std::string>> &env = {});

/// @brief Signature of a subprocess launcher; lets tests substitute run_process.
using ProcessRunner = std::function<RunResult(const std::vector<std::string> &argv,
                                              const std::optional<std::string> &cwd)>;

/// @brief ProcessRunner that forwards to run_process with no overrides.
ProcessRunner defaultProcessRunner();

/// @brief Quote @p arg for a POSIX shell command line.
std::string quote_posix_argument(const std::string &arg);

} // namespace shgo
