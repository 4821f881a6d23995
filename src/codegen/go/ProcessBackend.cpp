//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief os/exec process backend.

#include "codegen/go/ProcessBackend.hpp"

namespace shgo::codegen::go
{

void OsExecBackend::requireCommand(Requirements &req) const
{
    req.require("shRun");
}

void OsExecBackend::requirePipeline(Requirements &req) const
{
    req.require("shPipeline");
}

std::string OsExecBackend::runCommand(const std::string &name, const std::string &args) const
{
    if (args.empty())
        return "shRun(" + name + ")";
    return "shRun(" + name + ", " + args + ")";
}

std::string OsExecBackend::runPipeline(const std::vector<std::string> &stages) const
{
    std::string out = "shPipeline(";
    for (std::size_t i = 0; i < stages.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += stages[i];
    }
    return out + ")";
}

} // namespace shgo::codegen::go
