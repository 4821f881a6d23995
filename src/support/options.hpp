//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings shared by the convert and build commands.
// Key invariants: Defaults describe a plain `go` toolchain on PATH.
// Ownership/Lifetime: Value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace shgo::support
{

/// @brief Holds command-line and environment settings for one invocation.
/// @invariant Flags are independent booleans.
struct Options
{
    /// @brief Enable verbose tracing of pipeline phases.
    bool trace = false;

    /// @brief Retain the build workspace after `build` completes.
    bool keepWorkspace = false;

    /// @brief Caller-supplied workspace directory; empty selects a fresh one.
    std::string workspaceDir;

    /// @brief Go toolchain driver used for manifest and compile steps.
    std::string goTool = "go";

    /// @brief Module path written into the generated go.mod.
    std::string moduleName = "shgo_output";
};

/// @brief Apply environment overrides (SHGO_GO, SHGO_TRACE) to @p opts.
void applyEnvironment(Options &opts);

} // namespace shgo::support
