//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/go/GoGenerator.hpp
// Purpose: Lowers an IR Program into a single Go `package main` source file.
//
// Generation runs in passes.  The collection pass (Collect.hpp) derives the
// runtime helpers each statement kind and command class needs from the IR,
// and checkJobSafety (JobSafety.hpp) rejects background jobs that would
// share process state.  Lowering then renders the functions and the script
// body, adding the helpers that depend on how individual words are
// rendered, and the file is written in a fixed order:
//
//   header comment, package clause, sorted imports,
//   global variables (sorted, initialised from the environment),
//   runtime helpers (sorted by name),
//   functions in declaration order, shMain (the script body), main.
//
// Every lowered statement is fail-fast: a failing statement returns its
// error from the enclosing Go function, and main reports it on stderr and
// exits with the failing command's status.
//
// Key invariants:
//   - Output depends only on the Program: same Program, same bytes.
//   - A statement without a lowering rule aborts generation with an
//     UnsupportedConstruct diagnostic; no placeholder code is ever emitted.
//   - Closures (subshells, redirections, background jobs, compound
//     conditions) never let a successful `return`, `break` or `continue`
//     escape to the wrong Go function or loop.
// Ownership/Lifetime: The generator borrows the Program and the backend for
//                     one generate() call.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/go/ProcessBackend.hpp"
#include "codegen/go/Requirements.hpp"
#include "codegen/go/SourceWriter.hpp"
#include "ir/Program.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace shgo::codegen::go
{

/// @brief Generate Go source for @p program using the os/exec backend.
support::Expected<std::string> generate(const ir::Program &program);

class GoGenerator
{
  public:
    explicit GoGenerator(const ProcessBackend &backend) : backend_(backend) {}

    support::Expected<std::string> generate(const ir::Program &program);

  private:
    /// Lowering context of the statement list being emitted.
    struct Scope
    {
        /// Function being emitted, or nullptr for the script body.
        const ir::Function *function = nullptr;

        /// Inside a closure where a successful `return` would only leave the
        /// closure (redirections, negated blocks, compound conditions).
        bool returnBlocked = false;

        /// Inside a subshell or background job, where `exit` ends only that
        /// unit instead of the process.
        bool exitReturns = false;

        /// Go loops enclosing the current statement inside the current Go
        /// function literal.
        int loopDepth = 0;
    };

    /// One element of a lowered argument list.
    struct Arg
    {
        std::string expr;
        /// `expr` is a []string spliced into the list.
        bool spread = false;
    };

    //=========================================================================
    /// @name Statements and words (GoGenerator.cpp)
    /// @{
    //=========================================================================

    void emitStatements(const ir::StatementList &stmts, const Scope &scope);
    void emitStatement(const ir::Statement &stmt, const Scope &scope);

    /// @brief Lower the payload of @p stmt, ignoring its negation flag.
    void emitPayload(const ir::Statement &stmt, const Scope &scope);

    /// @brief Write `if err := expr; err != nil { return err }`.
    void emitCheck(const std::string &expr);

    /// @brief Render `func() error { body; return nil }()` at the current depth.
    std::string closure(const std::function<void()> &body);

    /// @brief Go string expression for @p word.
    std::string wordExpr(const ir::Word &word, const Scope &scope);

    /// @brief Lower command operands; `$@` always spreads, glob words spread
    ///        through shGlob when @p glob is set.
    std::vector<Arg> expandArgs(const std::vector<ir::Word> &words, const Scope &scope, bool glob);

    /// @brief Lower loop items: like expandArgs with globbing, plus field
    ///        splitting of unquoted parameter references.
    std::vector<Arg> expandItems(const std::vector<ir::Word> &words, const Scope &scope);

    /// @brief Argument list text for a call that passes @p others further
    ///        arguments besides @p args.
    static std::string variadicText(const std::vector<Arg> &args, std::size_t others = 0);
    static std::string sliceText(const std::vector<Arg> &args);

    /// @brief Operands joined by single spaces as one string expression.
    std::string joinedText(const std::vector<Arg> &args);

    static bool isListWord(const ir::Word &word);

    /// @}
    //=========================================================================
    /// @name Scopes, variables and declarations (Lower_Scope.cpp)
    /// @{
    //=========================================================================

    /// @brief Go expression reading the shell parameter @p name.
    std::string reference(const std::string &name, const Scope &scope);

    /// @brief Go []string expression for the positional parameter list.
    static std::string argumentList(const Scope &scope);

    void emitAssignment(const ir::Assignment &assign, const Scope &scope);
    void emitReturn(const ir::Return &ret, const Scope &scope);

    /// @brief Return from the current unit with status @p code (a literal
    ///        or a Go string expression when @p dynamic).
    void emitStatusReturn(const std::string &code, bool dynamic);

    void emitFunction(const ir::Function &fn);
    void emitScriptBody(const ir::Program &program);
    void emitGlobals(SourceWriter &file, const ir::Program &program) const;
    void emitMain(SourceWriter &file) const;

    /// @}
    //=========================================================================
    /// @name Commands and builtins (Lower_Builtins.cpp)
    /// @{
    //=========================================================================

    void emitCommand(const ir::Command &cmd, const Scope &scope);
    void emitEcho(const ir::Command &cmd, const Scope &scope);
    void emitCd(const ir::Command &cmd, const Scope &scope);
    void emitMkdir(const ir::Command &cmd, const Scope &scope);
    void emitRm(const ir::Command &cmd, const Scope &scope);
    void emitCp(const ir::Command &cmd, const Scope &scope);
    void emitExit(const ir::Command &cmd, const Scope &scope);
    void emitExport(const ir::Command &cmd, const Scope &scope);
    void emitPrintf(const ir::Command &cmd, const Scope &scope);
    void emitSet(const ir::Command &cmd);
    void emitLoopJump(const ir::Command &cmd, const Scope &scope);

    /// @brief `shRead(&a, &b)` for a read command.
    std::string readCall(const ir::Command &cmd);

    /// @brief Native boolean expression for a test/[ command, or nullopt
    ///        when the operands do not match a native form.
    std::optional<std::string> testExpr(const ir::Command &cmd, const Scope &scope);

    /// @brief Expression spawning `test` with the command's operands.
    std::string spawnTest(const ir::Command &cmd, const Scope &scope);

    /// @brief Boolean success expression for @p cmd, or empty when the
    ///        command needs a closure.
    std::string commandStatus(const ir::Command &cmd, const Scope &scope);

    /// @}
    //=========================================================================
    /// @name Control flow (Lower_Control.cpp)
    /// @{
    //=========================================================================

    void emitConditional(const ir::Conditional &cond, const Scope &scope);
    void emitLoop(const ir::Loop &loop, const Scope &scope);
    void emitPipeline(const ir::Pipeline &pipe, const Scope &scope);
    void emitSubshell(const ir::Subshell &sub, const Scope &scope);
    void emitRedirection(const ir::Redirection &redir, const Scope &scope);
    void emitBackground(const ir::Background &bg, const Scope &scope);

    /// @brief Boolean expression, true when every statement of @p stmts succeeds.
    std::string conditionExpr(const ir::StatementList &stmts, const Scope &scope);

    /// @brief Boolean expression, true when @p stmt succeeds (negation ignored).
    std::string statusExpr(const ir::Statement &stmt, const Scope &scope);

    /// @brief Scope of a closure whose successful returns must not escape.
    static Scope blockedScope(const Scope &scope);

    /// @}

    const ProcessBackend &backend_;
    const ir::Program *program_ = nullptr;
    Requirements req_;
    SourceWriter *out_ = nullptr;

    /// Location of the statement being lowered, for diagnostics.
    support::SourceLoc loc_;
};

} // namespace shgo::codegen::go
