//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/go/Collect.hpp
// Purpose: The generator's collection pass and the IR queries it shares with
//          the lowering rules.
//
// collectRequirements walks the script body and every function before any
// text is emitted and derives the runtime helpers each statement kind and
// command class needs:
//
//   Command (useProcessHelper)    backend command helper
//   Pipeline                      backend pipeline helper
//   Concurrency capability        shOutstanding job group
//   Redirection                   shSwap
//   Subshell                      shSaveDir, shRestoreEnv when it exports
//   pwd, cp, read, printf         shPwd, shCopy, shRead, shPrintf
//   test / [                      shTestFile, shAtoi or the command helper
//
// Helpers that depend on how a single word or status value is rendered
// (globbing, positional parameters, status returns) are added by the
// emission pass as it renders them.
//
// Key invariants: matchTest is the only place that decides whether a test
//                 command has a native Go form.
// Ownership/Lifetime: Free functions; results borrow words from the Program.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/go/ProcessBackend.hpp"
#include "codegen/go/Requirements.hpp"
#include "ir/Program.hpp"

#include <set>
#include <string>
#include <vector>

namespace shgo::codegen::go
{

/// @brief Native Go form chosen for a `test` / `[` command.
struct TestForm
{
    enum class Kind
    {
        Spawn,    ///< No native form; run the command.
        File,     ///< shTestFile(op, operands[0])
        Empty,    ///< operands[0] == ""
        NonEmpty, ///< operands[0] != ""
        Equal,    ///< operands[0] == operands[1]
        NotEqual, ///< operands[0] != operands[1]
        Numeric,  ///< shAtoi(operands[0]) op shAtoi(operands[1])
    };

    Kind kind = Kind::Spawn;
    /// File test flag (`-f`, `-d`, `-e`) or Go comparison operator.
    std::string op;
    std::vector<const ir::Word *> operands;
    /// Leading `!` operand.
    bool negate = false;
};

/// @brief Classify the operands of a test command.
TestForm matchTest(const ir::Command &cmd);

/// @brief Shell names a subshell body assigns; @p exports is set when the
///        body changes the environment.
void collectAssigned(const ir::StatementList &stmts, std::set<std::string> &names, bool &exports);

/// @brief Derive the statement-level requirements of @p program.
Requirements collectRequirements(const ir::Program &program, const ProcessBackend &backend);

} // namespace shgo::codegen::go
