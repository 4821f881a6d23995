//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief `shgo convert`: write the Go source for a script.

#include "tools/shgo/cli.hpp"

#include "driver/Transpiler.hpp"

namespace shgo::tools
{

int cmdConvert(const CliOptions &cli, std::ostream &err)
{
    support::SourceManager sm;
    auto result = driver::convertFile(cli.script, cli.output, sm);
    if (!result)
    {
        support::printDiag(result.error(), err, &sm);
        return 1;
    }
    return 0;
}

} // namespace shgo::tools
