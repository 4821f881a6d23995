//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/go/ProcessBackend.hpp
// Purpose: Seam between the lowering rules and the Go code that actually
//          spawns processes and wires their standard streams.
//
// The generator never spells process-execution code itself; it asks the
// backend for a Go expression of type `error` that runs one command or one
// pipeline.  The collection pass asks the backend which runtime helpers
// those expressions use before any of them is rendered.
//
// Key invariants: Returned expressions evaluate to nil exactly when every
//                 spawned process started and exited with status 0.
// Ownership/Lifetime: Backends are stateless; the generator borrows one for
//                     the duration of generate().
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/go/Requirements.hpp"

#include <string>
#include <vector>

namespace shgo::codegen::go
{

class ProcessBackend
{
  public:
    virtual ~ProcessBackend() = default;

    /// @brief Record the helpers runCommand expressions use.
    virtual void requireCommand(Requirements &req) const = 0;

    /// @brief Record the helpers runPipeline expressions use.
    virtual void requirePipeline(Requirements &req) const = 0;

    /// @brief Expression running one external command.
    /// @param name Go string expression naming the program.
    /// @param args Go variadic argument text (`a, b` or `xs...`); may be empty.
    virtual std::string runCommand(const std::string &name, const std::string &args) const = 0;

    /// @brief Expression running @p stages connected by pipes.
    /// @param stages Go expressions of type []string, one per stage, in order.
    virtual std::string runPipeline(const std::vector<std::string> &stages) const = 0;
};

/// @brief Backend built on os/exec: shRun for commands, shPipeline for
///        pipelines.
class OsExecBackend : public ProcessBackend
{
  public:
    void requireCommand(Requirements &req) const override;
    void requirePipeline(Requirements &req) const override;

    std::string runCommand(const std::string &name, const std::string &args) const override;
    std::string runPipeline(const std::vector<std::string> &stages) const override;
};

} // namespace shgo::codegen::go
