//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Usage and version output for the `shgo` CLI tool.

#include "tools/shgo/cli.hpp"

#include "shgo/version.hpp"

namespace shgo::tools
{

void printVersion(std::ostream &os)
{
    os << "shgo v" << SHGO_VERSION_STRING << "\n";
    os << "Shell to Go transpiler\n";
}

void printUsage(std::ostream &os)
{
    os << "shgo v" << SHGO_VERSION_STRING << " - Shell to Go transpiler\n"
       << "\n"
       << "Usage: shgo convert <script.sh> -o <out.go>\n"
       << "       shgo build <script.sh> -o <binary> [--keep-workspace] [--workspace <dir>]"
          " [--go <path>]\n"
       << "       shgo ir <script.sh>\n"
       << "\n"
       << "Options:\n"
       << "  -o <path>            Output file (required for convert and build)\n"
       << "  --keep-workspace     Keep the build workspace for inspection\n"
       << "  --workspace <dir>    Build in <dir>; it must be empty or absent\n"
       << "  --go <path>          Go toolchain driver (default: go, or $SHGO_GO)\n"
       << "  --trace              Log pipeline phases to stderr (or set SHGO_TRACE)\n"
       << "  --help               Show this message\n"
       << "  --version            Show version information\n"
       << "\n"
       << "Examples:\n"
       << "  shgo convert deploy.sh -o deploy.go     Write Go source\n"
       << "  shgo build deploy.sh -o deploy          Build a native binary\n"
       << "  shgo ir deploy.sh                       Show the lowered program\n";
}

} // namespace shgo::tools
