//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/shell/AST_Cmd.hpp
// Purpose: Statement and command nodes of the shell syntax tree.
//
// The tree follows the POSIX grammar shape.  A Stmt wraps exactly one Command
// together with the modifiers the grammar allows on any command: leading `!`,
// trailing `&` and redirections.  Binary lists (`a | b`, `a && b`) nest
// left-associatively, so `a | b | c` is Binary(Binary(a, b), c).
//
// Key invariants: `kind` always matches the concrete Command subclass; every
//                 Stmt owns a non-null command.
// Ownership/Lifetime: Parents own children through unique_ptr.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/shell/AST_Word.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace shgo::frontends::shell
{

struct Command;
using CommandPtr = std::unique_ptr<Command>;

/// @brief Redirection operators.
enum class RedirOp
{
    Out,         ///< `>`
    Append,      ///< `>>`
    In,          ///< `<`
    Clobber,     ///< `>|`
    InOut,       ///< `<>`
    DupOut,      ///< `>&`
    DupIn,       ///< `<&`
    AllOut,      ///< `&>`
    AllAppend,   ///< `&>>`
    Heredoc,     ///< `<<`
    DashHeredoc, ///< `<<-`
    HereString,  ///< `<<<`
};

/// @brief Source spelling of a redirection operator.
const char *redirOpSpelling(RedirOp op);

/// @brief A single redirection such as `2>>log`.
struct Redirect
{
    RedirOp op = RedirOp::Out;

    /// @brief Explicit descriptor prefix, or -1 when omitted.
    int fd = -1;

    /// @brief Target file, descriptor number, or heredoc delimiter.
    Word target;

    SourceLoc loc;
};

/// @brief `NAME=value` in a command prefix or declaration clause.
struct Assign
{
    std::string name;
    bool hasValue = false;
    bool append = false; ///< `+=`
    Word value;
    SourceLoc loc;
};

/// @brief A statement: one command plus its modifiers.
struct Stmt
{
    SourceLoc loc;
    CommandPtr cmd;
    std::vector<Redirect> redirs;
    bool negated = false;
    bool background = false;
};

using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

/// @brief Enumerates all command node kinds.
enum class CommandKind
{
    Call,     ///< Simple command: `NAME=v cmd arg...`
    Binary,   ///< `a | b`, `a |& b`, `a && b`, `a || b`
    If,       ///< `if ...; then ...; elif ...; else ...; fi`
    While,    ///< `while`/`until` loops
    For,      ///< `for NAME in ...` and `for ((...))`
    Case,     ///< `case WORD in ... esac`
    Block,    ///< `{ ...; }`
    Subshell, ///< `( ... )`
    FuncDecl, ///< `name() body` and `function name body`
    Decl,     ///< `export`, `local`, `declare`, `typeset`, `readonly`
    Arithm,   ///< `(( ... ))`
    Test,     ///< `[[ ... ]]`
};

/// @brief Human-readable name of a command kind ("case clause").
const char *commandKindName(CommandKind kind);

/// @brief Base class for all command nodes.
struct Command
{
    CommandKind kind;
    SourceLoc loc;

    Command(CommandKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Command() = default;
};

struct CallExpr : Command
{
    std::vector<Assign> assigns;
    std::vector<Word> args;

    explicit CallExpr(SourceLoc l) : Command(CommandKind::Call, l) {}
};

enum class BinaryOp
{
    AndStmt, ///< `&&`
    OrStmt,  ///< `||`
    Pipe,    ///< `|`
    PipeAll, ///< `|&`
};

struct BinaryCmd : Command
{
    BinaryOp op;
    StmtPtr x;
    StmtPtr y;

    BinaryCmd(SourceLoc l, BinaryOp o, StmtPtr lhs, StmtPtr rhs)
        : Command(CommandKind::Binary, l), op(o), x(std::move(lhs)), y(std::move(rhs))
    {
    }
};

/// @brief `if` clause.
/// @details `elif` is represented as a nested IfClause in `elseClause`; a
///          final `else` is an IfClause with an empty `cond`.
struct IfClause : Command
{
    StmtList cond;
    StmtList then;
    std::unique_ptr<IfClause> elseClause;

    explicit IfClause(SourceLoc l) : Command(CommandKind::If, l) {}

    /// @brief True for the trailing plain `else` node.
    [[nodiscard]] bool isElse() const
    {
        return cond.empty();
    }
};

struct WhileClause : Command
{
    bool until = false;
    StmtList cond;
    StmtList body;

    WhileClause(SourceLoc l, bool isUntil) : Command(CommandKind::While, l), until(isUntil) {}
};

struct ForClause : Command
{
    /// @brief True for `for ((init; cond; step))`.
    bool cstyle = false;
    std::string arithText;

    std::string name;
    /// @brief False for `for NAME; do`, which iterates the positional parameters.
    bool hasIn = false;
    std::vector<Word> items;

    StmtList body;

    explicit ForClause(SourceLoc l) : Command(CommandKind::For, l) {}
};

struct CaseItem
{
    std::vector<Word> patterns;
    StmtList body;
};

struct CaseClause : Command
{
    Word subject;
    std::vector<CaseItem> items;

    explicit CaseClause(SourceLoc l) : Command(CommandKind::Case, l) {}
};

struct Block : Command
{
    StmtList stmts;

    explicit Block(SourceLoc l) : Command(CommandKind::Block, l) {}
};

struct Subshell : Command
{
    StmtList stmts;

    explicit Subshell(SourceLoc l) : Command(CommandKind::Subshell, l) {}
};

struct FuncDecl : Command
{
    std::string name;
    /// @brief True for the `function name` spelling.
    bool keyword = false;
    StmtPtr body;

    FuncDecl(SourceLoc l, std::string n) : Command(CommandKind::FuncDecl, l), name(std::move(n)) {}
};

/// @brief Declaration builtin with its operands split into flags and assigns.
struct DeclClause : Command
{
    std::string variant; ///< export, local, declare, typeset or readonly
    std::vector<Word> flags;
    std::vector<Assign> assigns;

    DeclClause(SourceLoc l, std::string v) : Command(CommandKind::Decl, l), variant(std::move(v)) {}
};

struct ArithmCmd : Command
{
    std::string text;

    ArithmCmd(SourceLoc l, std::string t) : Command(CommandKind::Arithm, l), text(std::move(t)) {}
};

struct TestClause : Command
{
    std::vector<Word> words;

    explicit TestClause(SourceLoc l) : Command(CommandKind::Test, l) {}
};

/// @brief Root of a parsed script.
struct SyntaxTree
{
    uint32_t fileId = 0;
    StmtList stmts;
};

} // namespace shgo::frontends::shell
