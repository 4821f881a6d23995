//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Control-flow lowering: and-or lists, pipelines, if/elif chains, loops and
// function declarations.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Control-flow half of the IR builder.

#include "ir/IRBuilder.hpp"

#include "ir/Builtins.hpp"
#include "ir/Unsupported.hpp"

#include <algorithm>
#include <charconv>

namespace shgo::ir
{
namespace sh = frontends::shell;

namespace
{
/// Builtins that also exist as standalone programs and may therefore run as
/// a pipeline stage.
bool hasStandaloneProgram(Builtin builtin)
{
    switch (builtin)
    {
        case Builtin::Echo:
        case Builtin::Pwd:
        case Builtin::Mkdir:
        case Builtin::Rm:
        case Builtin::Cp:
        case Builtin::Test:
        case Builtin::Printf:
        case Builtin::True:
        case Builtin::False:
            return true;
        default:
            return false;
    }
}

bool parseBound(std::string_view text, int64_t &out)
{
    if (text.empty())
        return false;
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc() && ptr == end;
}

/// Recognise `{FROM..TO}` with integer bounds.
bool parseRange(const std::string &text, int64_t &from, int64_t &to)
{
    if (text.size() < 6 || text.front() != '{' || text.back() != '}')
        return false;
    const std::string_view body(text.data() + 1, text.size() - 2);
    const auto dots = body.find("..");
    if (dots == std::string_view::npos)
        return false;
    return parseBound(body.substr(0, dots), from) && parseBound(body.substr(dots + 2), to);
}

bool isPositional(const std::string &name)
{
    return !name.empty() && std::all_of(name.begin(), name.end(),
                                        [](char c) { return c >= '0' && c <= '9'; });
}
} // namespace

Statement IRBuilder::lowerAndOr(const sh::BinaryCmd &bin, SourceLoc loc)
{
    Conditional cond;

    const bool savedStrict = strictAndOr_;
    strictAndOr_ = true;
    StatementList lhs;
    lowerStmt(*bin.x, lhs);
    strictAndOr_ = savedStrict;

    StatementList rhs;
    lowerStmt(*bin.y, rhs);

    cond.condition = std::move(lhs);
    if (bin.op == sh::BinaryOp::AndStmt)
    {
        cond.thenBranch = std::move(rhs);
        if (strictAndOr_)
        {
            Command fail;
            fail.name = "false";
            fail.cls = CommandClass::Builtin;
            fail.loc = loc;
            cond.elseBranch.emplace_back(std::move(fail), loc);
        }
    }
    else
    {
        cond.elseBranch = std::move(rhs);
    }
    cond.category = categoryOf(cond.condition);
    return Statement(std::move(cond), loc);
}

Statement IRBuilder::lowerPipeline(const sh::BinaryCmd &bin, SourceLoc loc)
{
    Pipeline pipe;
    flattenPipe(*bin.x, pipe.stages);
    flattenPipe(*bin.y, pipe.stages);
    program_.capabilities.insert(Capability::SpawnsProcesses);
    return Statement(std::move(pipe), loc);
}

void IRBuilder::flattenPipe(const Stmt &stmt, std::vector<Command> &stages)
{
    if (stmt.negated || stmt.background)
        unsupported(stmt.loc, "negated or background pipeline stage");

    const sh::Command &node = *stmt.cmd;
    if (node.kind == sh::CommandKind::Binary)
    {
        const auto &bin = static_cast<const sh::BinaryCmd &>(node);
        if (bin.op == sh::BinaryOp::PipeAll)
            unsupported(stmt.loc, "'|&' pipeline");
        if (bin.op != sh::BinaryOp::Pipe)
            unsupported(stmt.loc, "and-or list inside a pipeline");
        flattenPipe(*bin.x, stages);
        flattenPipe(*bin.y, stages);
        return;
    }

    if (node.kind != sh::CommandKind::Call)
        unsupported(stmt.loc, std::string(sh::commandKindName(node.kind)) + " inside a pipeline");

    const auto &call = static_cast<const sh::CallExpr &>(node);
    if (!stmt.redirs.empty())
        unsupported(stmt.loc, "redirection inside a pipeline");
    if (!call.assigns.empty() || call.args.empty())
        unsupported(stmt.loc, "assignment inside a pipeline");
    if (call.args.front().literal() == "return")
        unsupported(stmt.loc, "'return' inside a pipeline");

    Command cmd = makeCommand(call);
    if (cmd.cls == CommandClass::Function)
        unsupported(stmt.loc, "function call '" + cmd.name + "' inside a pipeline");
    if (cmd.cls == CommandClass::Builtin)
    {
        auto builtin = lookupBuiltin(cmd.name);
        if (!builtin || !hasStandaloneProgram(*builtin))
            unsupported(stmt.loc, "builtin '" + cmd.name + "' inside a pipeline");
        cmd.cls = CommandClass::External;
        cmd.useProcessHelper = true;
    }
    stages.push_back(std::move(cmd));
}

Statement IRBuilder::lowerIf(const sh::IfClause &clause)
{
    Conditional cond;
    cond.condition = lowerCondition(clause.cond);
    cond.thenBranch = lowerList(clause.then);

    for (const sh::IfClause *tail = clause.elseClause.get(); tail; tail = tail->elseClause.get())
    {
        if (tail->isElse())
        {
            cond.elseBranch = lowerList(tail->then);
            break;
        }
        ElifClause elif;
        elif.condition = lowerCondition(tail->cond);
        elif.body = lowerList(tail->then);
        cond.elifs.push_back(std::move(elif));
    }

    cond.category = categoryOf(cond.condition);
    return Statement(std::move(cond), clause.loc);
}

Statement IRBuilder::lowerWhile(const sh::WhileClause &loop)
{
    Loop result;
    result.kind = loop.until ? LoopKind::Until : LoopKind::While;
    result.condition = lowerCondition(loop.cond);
    result.body = lowerLoopBody(loop.body);
    return Statement(std::move(result), loop.loc);
}

Statement IRBuilder::lowerFor(const sh::ForClause &loop)
{
    if (loop.cstyle)
        unsupported(loop.loc, "C-style for loop");

    Loop result;
    result.var = loop.name;
    bindVariable(loop.name, "", false);

    if (!loop.hasIn)
    {
        Word all;
        all.append(WordSegment::Kind::Interpolated, "${@}");
        all.splittable = true;
        noteParameter("@");
        result.kind = LoopKind::IterateList;
        result.items.push_back(std::move(all));
    }
    else if (loop.items.size() == 1 && loop.items.front().isPlainLiteral() &&
             parseRange(loop.items.front().literal(), result.from, result.to))
    {
        result.kind = LoopKind::CountedRange;
    }
    else
    {
        result.kind = LoopKind::IterateList;
        for (const auto &item : loop.items)
            result.items.push_back(lowerWord(item));
    }

    result.body = lowerLoopBody(loop.body);
    return Statement(std::move(result), loop.loc);
}

Statement IRBuilder::lowerFuncDecl(const sh::FuncDecl &decl)
{
    Function fn;
    fn.name = decl.name;
    fn.loc = decl.loc;

    Function *savedFunction = function_;
    const int savedDepth = loopDepth_;
    std::set<std::string> savedParams = std::move(params_);
    params_.clear();
    function_ = &fn;
    loopDepth_ = 0;

    const Stmt &body = *decl.body;
    if (body.cmd->kind == sh::CommandKind::Block && body.redirs.empty() && !body.background &&
        !body.negated)
    {
        fn.body = lowerList(static_cast<const sh::Block &>(*body.cmd).stmts);
    }
    else
    {
        lowerStmt(body, fn.body);
    }

    fn.params.assign(params_.begin(), params_.end());
    std::stable_sort(fn.params.begin(), fn.params.end(),
                     [](const std::string &a, const std::string &b)
                     {
                         const bool da = isPositional(a);
                         const bool db = isPositional(b);
                         if (da != db)
                             return da;
                         if (da && a.size() != b.size())
                             return a.size() < b.size();
                         return a < b;
                     });

    function_ = savedFunction;
    loopDepth_ = savedDepth;
    params_ = std::move(savedParams);

    if (!program_.addFunction(std::move(fn)))
        unsupported(decl.loc, "redefinition of function '" + decl.name + "'");
    return Statement(FunctionDecl{decl.name}, decl.loc);
}

StatementList IRBuilder::lowerCondition(const StmtList &stmts)
{
    const bool saved = strictAndOr_;
    strictAndOr_ = true;
    StatementList out = lowerList(stmts);
    strictAndOr_ = saved;
    return out;
}

StatementList IRBuilder::lowerLoopBody(const StmtList &stmts)
{
    ++loopDepth_;
    StatementList out = lowerList(stmts);
    --loopDepth_;
    return out;
}

ConditionCategory IRBuilder::categoryOf(const StatementList &condition)
{
    if (condition.size() != 1 || condition.front().kind() != StatementKind::Command)
        return ConditionCategory::GenericCommand;

    const auto &cmd = condition.front().as<Command>();
    if (cmd.cls != CommandClass::Builtin || lookupBuiltin(cmd.name) != Builtin::Test)
        return ConditionCategory::GenericCommand;

    std::vector<std::string> texts;
    for (const auto &arg : cmd.args)
        texts.push_back(arg.text());
    return inferConditionCategory(testOperands(cmd.name, std::move(texts)));
}

} // namespace shgo::ir
