//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/IRBuilder.hpp
// Purpose: Lowers the shell syntax tree into the IR Program.
//
// Key Capabilities:
//   - Classifies simple commands as builtins, function calls or external
//     processes using the fixed builtin table.
//   - Resolves words into literal / interpolated / placeholder segments.
//   - Flattens nested pipe nodes into one ordered stage list.
//   - Linearizes elif chains and turns `&&` / `||` lists into conditionals.
//   - Collects functions, variables and required capabilities.
//
// Typical Usage:
//   auto tree = shell::parse(text, fileId);
//   auto program = ir::build(tree.value());
//   if (!program) printDiag(program.error(), std::cerr, &sm);
//
// Every syntax node kind is matched explicitly; a node without a lowering
// rule aborts the whole build with an UnsupportedConstruct diagnostic and no
// partial Program is returned.
//
// Key invariants: One builder per conversion; build() may be called once.
// Ownership/Lifetime: The builder borrows the tree and owns the Program until
//                     build() moves it out.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/shell/AST.hpp"
#include "ir/Program.hpp"
#include "support/diag_expected.hpp"

#include <set>
#include <string>

namespace shgo::ir
{

/// @brief Lower @p tree into a Program.
support::Expected<Program> build(const frontends::shell::SyntaxTree &tree);

class IRBuilder
{
  public:
    /// @brief Run the lowering; see build().
    support::Expected<Program> build(const frontends::shell::SyntaxTree &tree);

  private:
    using Stmt = frontends::shell::Stmt;
    using StmtList = frontends::shell::StmtList;

    //=========================================================================
    /// @name Statements (IRBuilder.cpp)
    /// @{
    //=========================================================================

    void collectFunctionNames(const StmtList &stmts);
    void collectFunctionNames(const Stmt &stmt);

    StatementList lowerList(const StmtList &stmts);
    void lowerStmt(const Stmt &stmt, StatementList &out);
    StatementList lowerCommandNode(const Stmt &stmt);
    StatementList lowerCall(const frontends::shell::CallExpr &call);
    StatementList lowerDecl(const frontends::shell::DeclClause &decl);
    Statement lowerReturn(const frontends::shell::CallExpr &call);

    /// @brief Build a Command from a simple command without assignments.
    Command makeCommand(const frontends::shell::CallExpr &call);

    Statement wrapRedirect(Statement inner, const frontends::shell::Redirect &redir);
    Statement makeAssignment(const frontends::shell::Assign &assign, bool isLocal, bool isExport);

    /// @brief Record @p name with @p value in the innermost applicable scope.
    void bindVariable(const std::string &name, const std::string &value, bool local);

    /// @}
    //=========================================================================
    /// @name Control Flow (IRBuilder_Control.cpp)
    /// @{
    //=========================================================================

    Statement lowerAndOr(const frontends::shell::BinaryCmd &bin, SourceLoc loc);
    Statement lowerPipeline(const frontends::shell::BinaryCmd &bin, SourceLoc loc);
    void flattenPipe(const Stmt &stmt, std::vector<Command> &stages);
    Statement lowerIf(const frontends::shell::IfClause &clause);
    Statement lowerWhile(const frontends::shell::WhileClause &loop);
    Statement lowerFor(const frontends::shell::ForClause &loop);
    Statement lowerFuncDecl(const frontends::shell::FuncDecl &decl);

    /// @brief Lower a condition list; `&&` / `||` inside keep shell status semantics.
    StatementList lowerCondition(const StmtList &stmts);
    StatementList lowerLoopBody(const StmtList &stmts);
    static ConditionCategory categoryOf(const StatementList &condition);

    /// @}
    //=========================================================================
    /// @name Words (IRBuilder_Word.cpp)
    /// @{
    //=========================================================================

    Word lowerWord(const frontends::shell::Word &word);
    void lowerPart(const frontends::shell::WordPart &part, Word &out, bool quoted, bool first);
    void noteParameter(const std::string &name);

    /// @}

    Program program_;
    std::set<std::string> functionNames_;

    /// Function under construction, or nullptr in the script body.
    Function *function_ = nullptr;
    std::set<std::string> params_;

    /// Enclosing loops in the current function or script body.
    int loopDepth_ = 0;

    /// Lowering a condition: `a && b` must fail when `a` fails.
    bool strictAndOr_ = false;
};

} // namespace shgo::ir
