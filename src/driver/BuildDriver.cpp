//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Drives `go mod init`, `go mod tidy` and `go build` over a scratch workspace
// and moves the resulting binary to the requested path.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Go toolchain build driver.

#include "driver/BuildDriver.hpp"

#include "driver/Workspace.hpp"
#include "support/trace.hpp"

#include <fstream>
#include <utility>

namespace shgo::driver
{
namespace fs = std::filesystem;

namespace
{
support::Diag buildError(std::string msg)
{
    return support::makeError(support::ErrorKind::BuildToolFailure, {}, std::move(msg));
}

std::string joinArgv(const std::vector<std::string> &argv)
{
    std::string text;
    for (const auto &arg : argv)
        text += (text.empty() ? "" : " ") + quote_posix_argument(arg);
    return text;
}
} // namespace

BuildDriver::BuildDriver(support::Options opts, ProcessRunner runner)
    : opts_(std::move(opts)), runner_(std::move(runner))
{
}

support::Expected<void> BuildDriver::stageAndBuild(const std::string &source,
                                                   const std::string &outputPath)
{
    const fs::path output(outputPath);
    if (output.filename().empty())
        return buildError("output path '" + outputPath + "' does not name a file");

    auto workspace = Workspace::create(opts_.workspaceDir);
    if (!workspace)
        return workspace.error();
    if (opts_.keepWorkspace)
        workspace.value().keep();
    const fs::path &dir = workspace.value().path();

    const fs::path entry = dir / kEntrySource;
    {
        std::ofstream out(entry, std::ios::binary);
        out << source;
        out.close();
        if (!out)
            return buildError("cannot write '" + entry.string() + "'");
    }
    support::trace("workspace", "wrote " + entry.string());

    if (auto res = runTool({opts_.goTool, "mod", "init", opts_.moduleName}, dir, "go mod init");
        !res)
    {
        return res;
    }
    if (auto res = runTool({opts_.goTool, "mod", "tidy"}, dir, "go mod tidy"); !res)
        return res;

    const std::string binary = output.filename().string();
    if (auto res = runTool({opts_.goTool, "build", "-o", binary}, dir, "go build"); !res)
        return res;

    return relocate(dir / binary, output);
}

support::Expected<void> BuildDriver::runTool(const std::vector<std::string> &argv,
                                             const fs::path &cwd,
                                             const std::string &step)
{
    support::trace("tool", joinArgv(argv));
    const RunResult result = runner_(argv, cwd.string());
    if (result.exit_code == -1)
    {
        return buildError(step + ": cannot run '" + argv.front() + "'" +
                          (result.err.empty() ? std::string() : ": " + result.err));
    }
    if (result.exit_code != 0)
    {
        std::string output = result.out;
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r'))
            output.pop_back();
        return buildError(step + " failed with exit status " + std::to_string(result.exit_code) +
                          (output.empty() ? std::string() : ":\n" + output));
    }
    return {};
}

support::Expected<void> BuildDriver::relocate(const fs::path &built, const fs::path &output)
{
    std::error_code ec;
    if (!fs::exists(built, ec))
        return buildError("go build did not produce '" + built.string() + "'");

    const fs::path target = fs::absolute(output, ec);
    if (ec)
        return buildError("cannot resolve '" + output.string() + "': " + ec.message());
    if (fs::equivalent(built, target, ec))
        return {};

    fs::rename(built, target, ec);
    if (!ec)
    {
        support::trace("relocate", "renamed to " + target.string());
        return {};
    }

    // rename() fails across file systems; fall back to copy and remove.
    support::trace("relocate", "rename failed (" + ec.message() + "), copying");
    ec.clear();
    fs::copy_file(built, target, fs::copy_options::overwrite_existing, ec);
    if (ec)
        return buildError("cannot move binary to '" + target.string() + "': " + ec.message());
    fs::remove(built, ec);
    support::trace("relocate", "copied to " + target.string());
    return {};
}

support::Expected<void> stageAndBuild(const std::string &source,
                                      const std::string &outputPath,
                                      const support::Options &opts)
{
    BuildDriver driver(opts);
    return driver.stageAndBuild(source, outputPath);
}

} // namespace shgo::driver
