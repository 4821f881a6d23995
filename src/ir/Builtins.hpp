//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Builtins.hpp
// Purpose: The fixed builtin table and `test` condition classification.
// Key invariants: The table is immutable; a name is either a builtin with a
//                 native lowering, a shell-only builtin that cannot be
//                 lowered, or an external command.
// Ownership/Lifetime: Static data only.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Program.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shgo::ir
{

enum class Builtin
{
    Echo,
    Cd,
    Pwd,
    Mkdir,
    Rm,
    Cp,
    Test, ///< `test` and `[`
    Exit,
    Export,
    Read,
    Source, ///< `source` and `.`
    Printf,
    Wait,
    True,
    False, ///< `false`
    Colon, ///< `:`
    Break,
    Continue,
    Set,
};

/// @brief Look up @p name in the builtin table.
std::optional<Builtin> lookupBuiltin(std::string_view name);

/// @brief True for shell builtins that only make sense inside a shell
///        (`eval`, `trap`, `shift`...) and therefore cannot fall back to an
///        external process.
bool isShellOnlyBuiltin(std::string_view name);

/// @brief Strip the `]` closing a `[` invocation.
/// @param name Command name (`test` or `[`).
/// @param args Literal argument texts.
std::vector<std::string> testOperands(std::string_view name, std::vector<std::string> args);

/// @brief Infer the condition category of a test invocation from the
///        argument in operator position.
/// @details A leading `!` is skipped.  With two operands the operator is the
///          first, with three it is the middle one; otherwise the first
///          operand is inspected.
ConditionCategory inferConditionCategory(const std::vector<std::string> &operands);

} // namespace shgo::ir
