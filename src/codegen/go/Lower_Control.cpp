//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Control-flow lowering: conditionals, loops, pipelines, subshells,
// redirections and background jobs.
//
// Key invariants: statements that must not let a successful `return` escape
// are emitted inside `func() error { ... }()` closures whose error result is
// checked like any other statement.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Control-flow lowering for the Go generator.

#include "codegen/go/GoGenerator.hpp"

#include "codegen/go/Collect.hpp"
#include "codegen/go/GoNames.hpp"
#include "codegen/go/JobSafety.hpp"
#include "codegen/go/Splice.hpp"
#include "ir/Unsupported.hpp"

#include <set>

namespace shgo::codegen::go
{
namespace
{
/// Condition text that is true exactly when @p cond is false.
std::string negatedCondition(const std::string &cond)
{
    static const std::string equalsNil = " == nil";
    if (cond == "true")
        return "false";
    if (cond == "false")
        return "true";
    if (cond.size() > equalsNil.size() &&
        cond.compare(cond.size() - equalsNil.size(), equalsNil.size(), equalsNil) == 0)
    {
        return cond.substr(0, cond.size() - equalsNil.size()) + " != nil";
    }
    if (cond.size() > 3 && cond.compare(0, 2, "!(") == 0 && cond.back() == ')')
    {
        // Strip the negation only when its parentheses span the whole text.
        int parens = 0;
        bool quoted = false;
        std::size_t close = 0;
        for (std::size_t i = 1; i < cond.size(); ++i)
        {
            const char c = cond[i];
            if (quoted)
            {
                if (c == '\\')
                    ++i;
                else if (c == '"')
                    quoted = false;
                continue;
            }
            if (c == '"')
                quoted = true;
            else if (c == '(')
                ++parens;
            else if (c == ')' && --parens == 0)
            {
                close = i;
                break;
            }
        }
        if (close == cond.size() - 1)
            return cond.substr(2, cond.size() - 3);
    }
    return "!(" + cond + ")";
}

const char *standardStream(int fd)
{
    switch (fd)
    {
        case 0:
            return "os.Stdin";
        case 2:
            return "os.Stderr";
        default:
            return "os.Stdout";
    }
}
} // namespace

GoGenerator::Scope GoGenerator::blockedScope(const Scope &scope)
{
    Scope inner = scope;
    inner.returnBlocked = true;
    inner.loopDepth = 0;
    return inner;
}

std::string GoGenerator::statusExpr(const ir::Statement &stmt, const Scope &scope)
{
    loc_ = stmt.loc;
    if (stmt.kind() == ir::StatementKind::Command)
    {
        std::string status = commandStatus(stmt.as<ir::Command>(), scope);
        if (!status.empty())
            return status;
    }
    const Scope inner = blockedScope(scope);
    return closure([&]() { emitPayload(stmt, inner); }) + " == nil";
}

std::string GoGenerator::conditionExpr(const ir::StatementList &stmts, const Scope &scope)
{
    if (stmts.empty())
        return "true";
    if (stmts.size() == 1)
    {
        const ir::Statement &stmt = stmts.front();
        std::string status = statusExpr(stmt, scope);
        return stmt.negated ? "!(" + status + ")" : status;
    }
    const Scope inner = blockedScope(scope);
    return closure([&]() { emitStatements(stmts, inner); }) + " == nil";
}

void GoGenerator::emitConditional(const ir::Conditional &cond, const Scope &scope)
{
    if (cond.thenBranch.empty() && cond.elifs.empty() && !cond.elseBranch.empty())
    {
        // `a || b`: run the else branch under the negated condition.
        out_->open("if " + negatedCondition(conditionExpr(cond.condition, scope)));
        emitStatements(cond.elseBranch, scope);
        out_->close();
        return;
    }

    out_->open("if " + conditionExpr(cond.condition, scope));
    emitStatements(cond.thenBranch, scope);
    for (const auto &elif : cond.elifs)
    {
        out_->dedent();
        out_->line("} else if " + conditionExpr(elif.condition, scope) + " {");
        out_->indent();
        emitStatements(elif.body, scope);
    }
    if (!cond.elseBranch.empty())
    {
        out_->dedent();
        out_->line("} else {");
        out_->indent();
        emitStatements(cond.elseBranch, scope);
    }
    out_->close();
}

void GoGenerator::emitLoop(const ir::Loop &loop, const Scope &scope)
{
    Scope body = scope;
    ++body.loopDepth;

    switch (loop.kind)
    {
        case ir::LoopKind::CountedRange:
            out_->open("for shN := " + std::to_string(loop.from) + "; shN <= " +
                       std::to_string(loop.to) + "; shN++");
            out_->line(variableName(loop.var) + " = strconv.Itoa(shN)");
            break;
        case ir::LoopKind::IterateList:
            out_->open("for _, shItem := range " + sliceText(expandItems(loop.items, scope)));
            out_->line(variableName(loop.var) + " = shItem");
            break;
        case ir::LoopKind::While:
        {
            const std::string cond = conditionExpr(loop.condition, scope);
            out_->open(cond == "true" ? "for" : "for " + cond);
            break;
        }
        case ir::LoopKind::Until:
            out_->open("for !(" + conditionExpr(loop.condition, scope) + ")");
            break;
    }
    emitStatements(loop.body, body);
    out_->close();
}

void GoGenerator::emitPipeline(const ir::Pipeline &pipe, const Scope &scope)
{
    std::vector<std::string> stages;
    for (const auto &stage : pipe.stages)
    {
        if (stage.cls != ir::CommandClass::External)
            ir::unsupported(stage.loc, "pipeline stage '" + stage.name + "'");
        std::vector<Arg> argv{{goQuote(stage.name), false}};
        for (auto &arg : expandArgs(stage.args, scope, true))
            argv.push_back(std::move(arg));
        stages.push_back(compactBinary(sliceText(argv)));
    }
    emitCheck(backend_.runPipeline(stages));
}

void GoGenerator::emitSubshell(const ir::Subshell &sub, const Scope &scope)
{
    Scope inner = scope;
    inner.returnBlocked = false;
    inner.exitReturns = true;
    inner.loopDepth = 0;

    std::set<std::string> names;
    bool exports = false;
    collectAssigned(sub.body, names, exports);

    const std::string body = closure(
        [&]()
        {
            out_->line("shRestore, err := shSaveDir()");
            out_->open("if err != nil");
            out_->line("return err");
            out_->close();
            out_->line("defer shRestore()");
            if (exports)
                out_->line("defer shRestoreEnv()()");

            // Assignments inside the subshell update private copies.
            std::set<std::string> goNames;
            for (const auto &name : names)
                goNames.insert(variableName(name));
            for (const auto &goName : goNames)
            {
                out_->line(goName + " := " + goName);
                out_->line("_ = " + goName);
            }
            emitStatements(sub.body, inner);
        });
    emitCheck(body);
}

void GoGenerator::emitRedirection(const ir::Redirection &redir, const Scope &scope)
{
    const Scope inner = blockedScope(scope);

    const std::string body = closure(
        [&]()
        {
            if (redir.op == ir::RedirectOp::Duplicate)
            {
                out_->line(std::string("defer shSwap(&") + standardStream(redir.fd) + ", " +
                           standardStream(redir.dupFd) + ")()");
            }
            else
            {
                const std::string target = wordExpr(redir.target, scope);
                switch (redir.op)
                {
                    case ir::RedirectOp::Read:
                        out_->line("shFile, err := os.Open(" + target + ")");
                        break;
                    case ir::RedirectOp::AppendWrite:
                        out_->line("shFile, err := os.OpenFile(" + compactBinary(target) +
                                   ", os.O_WRONLY|os.O_CREATE|os.O_APPEND, 0o644)");
                        break;
                    default:
                        out_->line("shFile, err := os.OpenFile(" + compactBinary(target) +
                                   ", os.O_WRONLY|os.O_CREATE|os.O_TRUNC, 0o644)");
                        break;
                }
                out_->open("if err != nil");
                out_->line("return err");
                out_->close();
                out_->line("defer shFile.Close()");
                out_->line(std::string("defer shSwap(&") + standardStream(redir.fd) +
                           ", shFile)()");
            }
            emitStatement(*redir.statement, inner);
        });
    emitCheck(body);
}

void GoGenerator::emitBackground(const ir::Background &bg, const Scope &scope)
{
    Scope inner = scope;
    inner.returnBlocked = false;
    inner.exitReturns = true;
    inner.loopDepth = 0;

    // The job works on copies of the variables it uses, taken at launch.
    std::set<std::string> goNames;
    for (const auto &name : jobNames(*bg.statement))
    {
        const bool local = scope.function != nullptr && scope.function->locals.count(name) != 0;
        if (local || program_->variables.count(name) != 0)
            goNames.insert(variableName(name));
    }
    if (!goNames.empty())
    {
        out_->line("{");
        out_->indent();
        for (const auto &goName : goNames)
        {
            out_->line(goName + " := " + goName);
            out_->line("_ = " + goName);
        }
    }

    out_->open("shOutstanding.Go(func() error");
    emitStatement(*bg.statement, inner);
    out_->line("return nil");
    out_->close(")");

    if (!goNames.empty())
    {
        out_->dedent();
        out_->line("}");
    }
}

} // namespace shgo::codegen::go
