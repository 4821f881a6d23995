//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Program.hpp
// Purpose: The intermediate representation produced by the IR builder and
//          consumed by the Go generator.
//
// A Statement is a closed tagged union: `payload` is a std::variant whose
// alternative index is the StatementKind, so every consumer can switch
// exhaustively with std::visit or kind().  Nested statement sequences are
// plain vectors; the two wrappers that modify a single statement
// (Redirection, Background) own it through unique_ptr.
//
// Key invariants:
//   - Exactly one payload per Statement (enforced by the variant).
//   - Program function names are unique; functions keep insertion order.
//   - A Pipeline holds at least one stage.
//   - A Redirection or Background always owns a non-null statement.
// Ownership/Lifetime: The Program owns everything; it is move-only.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Word.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace shgo::ir
{
using support::SourceLoc;

struct Statement;
using StatementList = std::vector<Statement>;

/// @brief How a command is lowered.
enum class CommandClass
{
    Builtin,  ///< Fixed native lowering rule.
    External, ///< Spawned as a separate process.
    Function, ///< Call of a function declared in the script.
};

struct Command
{
    std::string name;
    std::vector<Word> args;
    CommandClass cls = CommandClass::External;

    /// @brief Invocation must go through the process-execution capability.
    bool useProcessHelper = false;

    SourceLoc loc;
};

struct Assignment
{
    std::string name;
    /// @brief Absent for bare `export NAME` / `local NAME`.
    std::optional<Word> value;
    bool isLocal = false;
    bool isExport = false;
};

/// @brief Category of a `test`/`[` condition, selecting its native lowering.
enum class ConditionCategory
{
    FileTest,
    StringTest,
    NumericTest,
    GenericCommand,
};

struct ElifClause
{
    StatementList condition;
    StatementList body;
};

struct Conditional
{
    StatementList condition;
    StatementList thenBranch;
    StatementList elseBranch;
    /// @brief Elif pairs in source order.
    std::vector<ElifClause> elifs;
    ConditionCategory category = ConditionCategory::GenericCommand;
};

enum class LoopKind
{
    CountedRange, ///< `for i in {1..5}`
    IterateList,  ///< `for x in a b c`
    While,
    Until,
};

struct Loop
{
    LoopKind kind = LoopKind::While;
    StatementList condition;
    StatementList body;
    std::string var;
    int64_t from = 0;
    int64_t to = 0;
    std::vector<Word> items;
};

struct Pipeline
{
    /// @brief Stages in execution order; stage i feeds stage i + 1.
    std::vector<Command> stages;
};

struct Subshell
{
    StatementList body;
};

enum class RedirectOp
{
    TruncateWrite, ///< `>` and `>|`
    AppendWrite,   ///< `>>`
    Read,          ///< `<`
    Duplicate,     ///< `2>&1`, `>&2`
};

struct Redirection
{
    RedirectOp op = RedirectOp::TruncateWrite;
    /// @brief Descriptor being redirected (0, 1 or 2).
    int fd = 1;
    /// @brief File name; unused for Duplicate.
    Word target;
    /// @brief Source descriptor for Duplicate.
    int dupFd = -1;
    std::unique_ptr<Statement> statement;
};

struct Background
{
    std::unique_ptr<Statement> statement;
};

struct Return
{
    /// @brief Non-numeric operand, e.g. `return $status`.
    std::optional<Word> value;
    std::optional<int> code;
};

struct FunctionDecl
{
    std::string name;
};

/// @brief `{ ...; }` carrying a redirection or background marker; runs in
///        the enclosing scope.
struct Group
{
    StatementList body;
};

/// @brief Discriminator; values match the payload variant's alternative order.
enum class StatementKind
{
    Command,
    Assignment,
    Conditional,
    Loop,
    Pipeline,
    Subshell,
    Redirection,
    Background,
    Return,
    FunctionDecl,
    Group,
};

struct Statement
{
    using Payload = std::variant<Command, Assignment, Conditional, Loop, Pipeline, Subshell,
                                 Redirection, Background, Return, FunctionDecl, Group>;

    Payload payload;
    SourceLoc loc;
    /// @brief Exit status inverted (`! cmd`).
    bool negated = false;

    template <class T>
    Statement(T value, SourceLoc l) : payload(std::move(value)), loc(l)
    {
    }

    [[nodiscard]] StatementKind kind() const
    {
        return static_cast<StatementKind>(payload.index());
    }

    template <class T> T &as()
    {
        return std::get<T>(payload);
    }

    template <class T> const T &as() const
    {
        return std::get<T>(payload);
    }
};

/// @brief Capabilities a program needs from the generated runtime.
enum class Capability
{
    SpawnsProcesses,
    MutatesEnvironment,
    FilesystemIO,
    ChangesDirectory,
    ReadsInput,
    Concurrency,
};

const char *capabilityName(Capability cap);
const char *statementKindName(StatementKind kind);
const char *conditionCategoryName(ConditionCategory category);
const char *loopKindName(LoopKind kind);

struct Function
{
    std::string name;
    StatementList body;
    /// @brief Positional parameters referenced by the body ("1", "2", "@"...).
    std::vector<std::string> params;
    /// @brief `local` bindings: name to last-known literal value.
    std::map<std::string, std::string> locals;
    SourceLoc loc;
};

class Program
{
  public:
    StatementList statements;

    /// @brief Global variables: name to last-known literal value.
    std::map<std::string, std::string> variables;

    std::set<Capability> capabilities;

    /// @brief Append @p fn; returns false when the name is already taken.
    bool addFunction(Function fn);

    /// @brief Look up a function by name; nullptr when absent.
    [[nodiscard]] const Function *findFunction(const std::string &name) const;

    /// @brief Functions in declaration order.
    [[nodiscard]] const std::vector<Function> &functions() const
    {
        return functions_;
    }

  private:
    std::vector<Function> functions_;
    std::map<std::string, std::size_t> functionIndex_;
};

} // namespace shgo::ir
