//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file IRPrinter.hpp
/// @brief Human-readable dump of an IR Program.
///
/// @details Produces an indentation-based listing of the capability set, the
/// variable table, every function and the script body.  Words are printed in
/// double quotes with their interpolation markers intact.
///
/// Example output:
/// @code
///   capabilities: spawns-processes
///   variables:
///     NAME = "World"
///   body:
///     Assignment NAME = "World" (1:1)
///     Command builtin echo "Hello, ${NAME}!" (2:1)
/// @endcode
///
/// @invariant Output is deterministic: maps are printed in key order.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Program.hpp"

#include <string>

namespace shgo::ir
{

/// @brief Produces a textual dump of a Program.
class IRPrinter
{
  public:
    std::string dump(const Program &program);
};

/// @brief Quote @p word for the dump: `"` and `\` are escaped, newlines become `\n`.
std::string quoteWord(const Word &word);

} // namespace shgo::ir
