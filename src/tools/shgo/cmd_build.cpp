//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief `shgo build`: convert a script and compile it with the Go toolchain.

#include "tools/shgo/cli.hpp"

#include "driver/Transpiler.hpp"

#include <utility>

namespace shgo::tools
{

int cmdBuild(const CliOptions &cli, std::ostream &err, ProcessRunner runner)
{
    support::SourceManager sm;
    auto result = driver::buildFile(cli.script, cli.output, cli.opts, sm, std::move(runner));
    if (!result)
    {
        support::printDiag(result.error(), err, &sm);
        return 1;
    }
    return 0;
}

} // namespace shgo::tools
