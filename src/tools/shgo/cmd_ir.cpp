//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief `shgo ir`: print the lowered program of a script.

#include "tools/shgo/cli.hpp"

#include "driver/Transpiler.hpp"

namespace shgo::tools
{

int cmdIr(const CliOptions &cli, std::ostream &out, std::ostream &err)
{
    support::SourceManager sm;
    auto dump = driver::dumpProgram(cli.script, sm);
    if (!dump)
    {
        support::printDiag(dump.error(), err, &sm);
        return 1;
    }
    out << dump.value();
    return 0;
}

} // namespace shgo::tools
