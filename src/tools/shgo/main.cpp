//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the shgo command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `shgo` CLI tool.

#include "tools/shgo/cli.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return shgo::tools::runCli(argc, argv, std::cout, std::cerr);
}
