//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: driver/BuildDriver.hpp
// Purpose: Compile generated Go source into a native binary with the Go
//          toolchain.
// Key invariants: Steps run in order (workspace, manifest, compile,
//                 relocate) and the first failing step aborts the build with
//                 a BuildToolFailure carrying the tool's output.
// Ownership/Lifetime: The driver owns a copy of its options and runner; the
//                     workspace lives for one stageAndBuild() call.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/RunProcess.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace shgo::driver
{

/// @brief Name of the generated source file inside the workspace.
inline constexpr const char *kEntrySource = "main.go";

class BuildDriver
{
  public:
    explicit BuildDriver(support::Options opts, ProcessRunner runner = defaultProcessRunner());

    /// @brief Build @p source into the executable @p outputPath.
    support::Expected<void> stageAndBuild(const std::string &source, const std::string &outputPath);

  private:
    /// @brief Run one toolchain step in @p cwd; @p step names it in errors.
    support::Expected<void> runTool(const std::vector<std::string> &argv,
                                    const std::filesystem::path &cwd,
                                    const std::string &step);

    /// @brief Move @p built to @p output, copying across file systems.
    support::Expected<void> relocate(const std::filesystem::path &built,
                                     const std::filesystem::path &output);

    support::Options opts_;
    ProcessRunner runner_;
};

/// @brief Convenience wrapper using the default process runner.
support::Expected<void> stageAndBuild(const std::string &source,
                                      const std::string &outputPath,
                                      const support::Options &opts);

} // namespace shgo::driver
