//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Statement-level lowering: the entry point, the function-name pre-pass, the
// exhaustive dispatch over command node kinds, simple commands, declaration
// clauses and the redirection/background/negation wrappers.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Core of the shell-to-IR lowering.

#include "ir/IRBuilder.hpp"

#include "ir/Builtins.hpp"
#include "ir/Unsupported.hpp"
#include "support/trace.hpp"

#include <cctype>

namespace shgo::ir
{
namespace sh = frontends::shell;

namespace
{
bool isDigits(const std::string &text)
{
    if (text.empty())
        return false;
    for (const char c : text)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}
} // namespace

support::Expected<Program> build(const sh::SyntaxTree &tree)
{
    IRBuilder builder;
    return builder.build(tree);
}

support::Expected<Program> IRBuilder::build(const sh::SyntaxTree &tree)
{
    try
    {
        collectFunctionNames(tree.stmts);
        program_.statements = lowerList(tree.stmts);
    }
    catch (const LoweringError &err)
    {
        return err.diag();
    }

    support::trace("build", std::to_string(program_.statements.size()) + " statements, " +
                                std::to_string(program_.functions().size()) + " functions, " +
                                std::to_string(program_.variables.size()) + " variables");
    return std::move(program_);
}

void IRBuilder::collectFunctionNames(const StmtList &stmts)
{
    for (const auto &stmt : stmts)
        collectFunctionNames(*stmt);
}

void IRBuilder::collectFunctionNames(const Stmt &stmt)
{
    const sh::Command &cmd = *stmt.cmd;
    switch (cmd.kind)
    {
        case sh::CommandKind::Binary:
        {
            const auto &bin = static_cast<const sh::BinaryCmd &>(cmd);
            collectFunctionNames(*bin.x);
            collectFunctionNames(*bin.y);
            return;
        }
        case sh::CommandKind::If:
            for (auto *clause = static_cast<const sh::IfClause *>(&cmd); clause;
                 clause = clause->elseClause.get())
            {
                collectFunctionNames(clause->cond);
                collectFunctionNames(clause->then);
            }
            return;
        case sh::CommandKind::While:
        {
            const auto &loop = static_cast<const sh::WhileClause &>(cmd);
            collectFunctionNames(loop.cond);
            collectFunctionNames(loop.body);
            return;
        }
        case sh::CommandKind::For:
            collectFunctionNames(static_cast<const sh::ForClause &>(cmd).body);
            return;
        case sh::CommandKind::Case:
            for (const auto &item : static_cast<const sh::CaseClause &>(cmd).items)
                collectFunctionNames(item.body);
            return;
        case sh::CommandKind::Block:
            collectFunctionNames(static_cast<const sh::Block &>(cmd).stmts);
            return;
        case sh::CommandKind::Subshell:
            collectFunctionNames(static_cast<const sh::Subshell &>(cmd).stmts);
            return;
        case sh::CommandKind::FuncDecl:
        {
            const auto &decl = static_cast<const sh::FuncDecl &>(cmd);
            functionNames_.insert(decl.name);
            collectFunctionNames(*decl.body);
            return;
        }
        case sh::CommandKind::Call:
        case sh::CommandKind::Decl:
        case sh::CommandKind::Arithm:
        case sh::CommandKind::Test:
            return;
    }
}

StatementList IRBuilder::lowerList(const StmtList &stmts)
{
    StatementList out;
    for (const auto &stmt : stmts)
        lowerStmt(*stmt, out);
    return out;
}

void IRBuilder::lowerStmt(const Stmt &stmt, StatementList &out)
{
    StatementList lowered = lowerCommandNode(stmt);
    if (stmt.redirs.empty() && !stmt.background && !stmt.negated)
    {
        for (auto &s : lowered)
            out.push_back(std::move(s));
        return;
    }

    Statement single = lowered.size() == 1 ? std::move(lowered.front())
                                           : Statement(Group{std::move(lowered)}, stmt.loc);
    if (stmt.negated)
        single.negated = !single.negated;

    // The first redirection in source order is applied first, so it must end
    // up outermost.
    for (auto it = stmt.redirs.rbegin(); it != stmt.redirs.rend(); ++it)
        single = wrapRedirect(std::move(single), *it);

    if (stmt.background)
    {
        program_.capabilities.insert(Capability::Concurrency);
        single = Statement(Background{std::make_unique<Statement>(std::move(single))}, stmt.loc);
    }
    out.push_back(std::move(single));
}

StatementList IRBuilder::lowerCommandNode(const Stmt &stmt)
{
    const sh::Command &cmd = *stmt.cmd;
    StatementList out;
    switch (cmd.kind)
    {
        case sh::CommandKind::Call:
            return lowerCall(static_cast<const sh::CallExpr &>(cmd));
        case sh::CommandKind::Binary:
        {
            const auto &bin = static_cast<const sh::BinaryCmd &>(cmd);
            if (bin.op == sh::BinaryOp::Pipe)
                out.push_back(lowerPipeline(bin, stmt.loc));
            else if (bin.op == sh::BinaryOp::PipeAll)
                unsupported(stmt.loc, "'|&' pipeline");
            else
                out.push_back(lowerAndOr(bin, stmt.loc));
            return out;
        }
        case sh::CommandKind::If:
            out.push_back(lowerIf(static_cast<const sh::IfClause &>(cmd)));
            return out;
        case sh::CommandKind::While:
            out.push_back(lowerWhile(static_cast<const sh::WhileClause &>(cmd)));
            return out;
        case sh::CommandKind::For:
            out.push_back(lowerFor(static_cast<const sh::ForClause &>(cmd)));
            return out;
        case sh::CommandKind::Block:
            return lowerList(static_cast<const sh::Block &>(cmd).stmts);
        case sh::CommandKind::Subshell:
            out.emplace_back(Subshell{lowerList(static_cast<const sh::Subshell &>(cmd).stmts)},
                             stmt.loc);
            return out;
        case sh::CommandKind::FuncDecl:
            out.push_back(lowerFuncDecl(static_cast<const sh::FuncDecl &>(cmd)));
            return out;
        case sh::CommandKind::Decl:
            return lowerDecl(static_cast<const sh::DeclClause &>(cmd));
        case sh::CommandKind::Case:
        case sh::CommandKind::Arithm:
        case sh::CommandKind::Test:
            break;
    }
    unsupported(stmt.loc, sh::commandKindName(cmd.kind));
}

StatementList IRBuilder::lowerCall(const sh::CallExpr &call)
{
    StatementList out;
    if (call.args.empty())
    {
        for (const auto &assign : call.assigns)
            out.push_back(makeAssignment(assign, false, false));
        return out;
    }

    if (!call.assigns.empty())
    {
        unsupported(call.loc, "environment assignment prefix on command '" +
                                  call.args.front().text() + "'");
    }

    if (call.args.front().literal() == "return")
    {
        out.push_back(lowerReturn(call));
        return out;
    }

    out.emplace_back(makeCommand(call), call.loc);
    return out;
}

Command IRBuilder::makeCommand(const sh::CallExpr &call)
{
    Word nameWord = lowerWord(call.args.front());
    if (!nameWord.isLiteral())
        unsupported(call.loc, "dynamic command name '" + call.args.front().text() + "'");

    Command cmd;
    cmd.name = nameWord.literalText();
    cmd.loc = call.loc;
    for (std::size_t i = 1; i < call.args.size(); ++i)
        cmd.args.push_back(lowerWord(call.args[i]));

    if (functionNames_.count(cmd.name) != 0)
    {
        cmd.cls = CommandClass::Function;
        return cmd;
    }

    if (auto builtin = lookupBuiltin(cmd.name))
    {
        cmd.cls = CommandClass::Builtin;
        switch (*builtin)
        {
            case Builtin::Cd:
                program_.capabilities.insert(Capability::ChangesDirectory);
                break;
            case Builtin::Mkdir:
            case Builtin::Rm:
            case Builtin::Cp:
                program_.capabilities.insert(Capability::FilesystemIO);
                break;
            case Builtin::Test:
            {
                std::vector<std::string> texts;
                for (const auto &arg : cmd.args)
                    texts.push_back(arg.text());
                if (inferConditionCategory(testOperands(cmd.name, texts)) ==
                    ConditionCategory::FileTest)
                {
                    program_.capabilities.insert(Capability::FilesystemIO);
                }
                break;
            }
            case Builtin::Export:
                program_.capabilities.insert(Capability::MutatesEnvironment);
                break;
            case Builtin::Read:
            {
                program_.capabilities.insert(Capability::ReadsInput);
                bool any = false;
                for (const auto &arg : cmd.args)
                {
                    const std::string text = arg.literalText();
                    if (arg.isLiteral() && !text.empty() && text.front() != '-')
                    {
                        bindVariable(text, "", false);
                        any = true;
                    }
                }
                if (!any)
                    bindVariable("REPLY", "", false);
                break;
            }
            case Builtin::Wait:
                program_.capabilities.insert(Capability::Concurrency);
                break;
            case Builtin::Break:
            case Builtin::Continue:
                if (loopDepth_ == 0)
                    unsupported(call.loc, "'" + cmd.name + "' outside a loop");
                break;
            default:
                break;
        }
        return cmd;
    }

    if (isShellOnlyBuiltin(cmd.name))
        unsupported(call.loc, "shell builtin '" + cmd.name + "'");

    cmd.cls = CommandClass::External;
    cmd.useProcessHelper = true;
    program_.capabilities.insert(Capability::SpawnsProcesses);
    return cmd;
}

Statement IRBuilder::lowerReturn(const sh::CallExpr &call)
{
    if (call.args.size() > 2)
        unsupported(call.loc, "'return' with more than one operand");

    Return ret;
    if (call.args.size() == 2)
    {
        Word operand = lowerWord(call.args[1]);
        if (operand.isLiteral() && isDigits(operand.literalText()) &&
            operand.literalText().size() <= 9)
            ret.code = std::stoi(operand.literalText()) & 0xff;
        else
            ret.value = std::move(operand);
    }
    return Statement(std::move(ret), call.loc);
}

StatementList IRBuilder::lowerDecl(const sh::DeclClause &decl)
{
    bool isLocal = false;
    bool isExport = false;

    if (decl.variant == "local")
    {
        if (function_ == nullptr)
            unsupported(decl.loc, "'local' outside a function");
        isLocal = true;
    }
    else if (decl.variant == "export")
    {
        isExport = true;
    }
    else if (decl.variant == "declare" || decl.variant == "typeset")
    {
        isLocal = function_ != nullptr;
    }

    for (const auto &flag : decl.flags)
    {
        const std::string text = flag.literal();
        if ((decl.variant == "declare" || decl.variant == "typeset") && text == "-x")
        {
            isExport = true;
            continue;
        }
        if (decl.variant != "export" && text == "-r")
            continue;
        unsupported(flag.loc, "'" + decl.variant + " " + flag.text() + "'");
    }

    if (isExport)
        program_.capabilities.insert(Capability::MutatesEnvironment);

    StatementList out;
    for (const auto &assign : decl.assigns)
        out.push_back(makeAssignment(assign, isLocal, isExport));
    return out;
}

Statement IRBuilder::makeAssignment(const sh::Assign &assign, bool isLocal, bool isExport)
{
    Assignment result;
    result.name = assign.name;
    result.isLocal = isLocal;
    result.isExport = isExport;

    std::string known;
    if (assign.hasValue)
    {
        Word value;
        if (assign.append)
            value.append(WordSegment::Kind::Interpolated, "${" + assign.name + "}");
        Word rhs = lowerWord(assign.value);
        for (auto &seg : rhs.segments)
            value.append(seg.kind, std::move(seg.text));
        if (value.segments.empty())
            value = Word::literal("");
        known = value.isLiteral() ? value.literalText() : value.text();
        result.value = std::move(value);
    }
    bindVariable(assign.name, known, isLocal);
    return Statement(std::move(result), assign.loc);
}

void IRBuilder::bindVariable(const std::string &name, const std::string &value, bool local)
{
    if (function_ != nullptr && (local || function_->locals.count(name) != 0))
    {
        function_->locals[name] = value;
        return;
    }
    program_.variables[name] = value;
}

Statement IRBuilder::wrapRedirect(Statement inner, const sh::Redirect &redir)
{
    Redirection result;
    switch (redir.op)
    {
        case sh::RedirOp::Out:
        case sh::RedirOp::Clobber:
            result.op = RedirectOp::TruncateWrite;
            result.fd = redir.fd < 0 ? 1 : redir.fd;
            break;
        case sh::RedirOp::Append:
            result.op = RedirectOp::AppendWrite;
            result.fd = redir.fd < 0 ? 1 : redir.fd;
            break;
        case sh::RedirOp::In:
            result.op = RedirectOp::Read;
            result.fd = redir.fd < 0 ? 0 : redir.fd;
            break;
        case sh::RedirOp::DupOut:
        {
            result.op = RedirectOp::Duplicate;
            result.fd = redir.fd < 0 ? 1 : redir.fd;
            const std::string target = redir.target.literal();
            if (target == "1")
                result.dupFd = 1;
            else if (target == "2")
                result.dupFd = 2;
            if (result.dupFd < 0 || result.dupFd == result.fd || result.fd > 2 || result.fd == 0)
            {
                unsupported(redir.loc, "redirection '" + std::to_string(result.fd) + ">&" +
                                           redir.target.text() + "'");
            }
            break;
        }
        case sh::RedirOp::DupIn:
        case sh::RedirOp::InOut:
        case sh::RedirOp::AllOut:
        case sh::RedirOp::AllAppend:
        case sh::RedirOp::Heredoc:
        case sh::RedirOp::DashHeredoc:
        case sh::RedirOp::HereString:
            unsupported(redir.loc, std::string("redirection '") + sh::redirOpSpelling(redir.op) + "'");
    }

    if (result.op != RedirectOp::Duplicate)
    {
        const bool writes = result.op != RedirectOp::Read;
        if ((writes && result.fd != 1 && result.fd != 2) || (!writes && result.fd != 0))
        {
            unsupported(redir.loc, "redirection of descriptor " + std::to_string(result.fd));
        }
        result.target = lowerWord(redir.target);
        program_.capabilities.insert(Capability::FilesystemIO);
    }

    const SourceLoc loc = inner.loc;
    result.statement = std::make_unique<Statement>(std::move(inner));
    return Statement(std::move(result), loc);
}

} // namespace shgo::ir
