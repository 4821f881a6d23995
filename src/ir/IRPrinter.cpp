//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file IRPrinter.cpp
/// @brief Implements the IR Program printer used by `shgo ir`.
///
//===----------------------------------------------------------------------===//

#include "ir/IRPrinter.hpp"

#include <sstream>

namespace shgo::ir
{

namespace
{

struct Printer
{
    std::ostream &os;
    int indent = 0;

    void line(const std::string &text)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text << '\n';
    }

    void push()
    {
        ++indent;
    }

    void pop()
    {
        --indent;
    }
};

void printStmt(const Statement &stmt, Printer &p);

std::string locStr(const SourceLoc &loc)
{
    if (!loc.hasLine())
        return "";
    std::ostringstream s;
    s << " (" << loc.line << ":" << loc.column << ")";
    return s.str();
}

const char *className(CommandClass cls)
{
    switch (cls)
    {
        case CommandClass::Builtin:
            return "builtin";
        case CommandClass::External:
            return "external";
        case CommandClass::Function:
            return "function";
    }
    return "?";
}

std::string commandText(const Command &cmd)
{
    std::string text = std::string(className(cmd.cls)) + " " + cmd.name;
    for (const auto &arg : cmd.args)
        text += " " + quoteWord(arg);
    if (cmd.useProcessHelper)
        text += " [process]";
    return text;
}

std::string redirectSpelling(const Redirection &redir)
{
    const std::string fd = std::to_string(redir.fd);
    switch (redir.op)
    {
        case RedirectOp::TruncateWrite:
            return fd + "> " + quoteWord(redir.target);
        case RedirectOp::AppendWrite:
            return fd + ">> " + quoteWord(redir.target);
        case RedirectOp::Read:
            return fd + "< " + quoteWord(redir.target);
        case RedirectOp::Duplicate:
            return fd + ">&" + std::to_string(redir.dupFd);
    }
    return "?";
}

void printBlock(const char *label, const StatementList &stmts, Printer &p)
{
    p.line(label);
    p.push();
    for (const auto &stmt : stmts)
        printStmt(stmt, p);
    p.pop();
}

void printStmt(const Statement &stmt, Printer &p)
{
    const std::string neg = stmt.negated ? "! " : "";
    const std::string loc = locStr(stmt.loc);

    switch (stmt.kind())
    {
        case StatementKind::Command:
            p.line(neg + "Command " + commandText(stmt.as<Command>()) + loc);
            return;
        case StatementKind::Assignment:
        {
            const auto &assign = stmt.as<Assignment>();
            std::string text = "Assignment ";
            if (assign.isLocal)
                text += "local ";
            if (assign.isExport)
                text += "export ";
            text += assign.name;
            if (assign.value)
                text += " = " + quoteWord(*assign.value);
            p.line(neg + text + loc);
            return;
        }
        case StatementKind::Conditional:
        {
            const auto &cond = stmt.as<Conditional>();
            p.line(neg + "Conditional " + conditionCategoryName(cond.category) + loc);
            p.push();
            printBlock("Condition:", cond.condition, p);
            printBlock("Then:", cond.thenBranch, p);
            for (const auto &elif : cond.elifs)
            {
                printBlock("Elif:", elif.condition, p);
                printBlock("Then:", elif.body, p);
            }
            if (!cond.elseBranch.empty())
                printBlock("Else:", cond.elseBranch, p);
            p.pop();
            return;
        }
        case StatementKind::Loop:
        {
            const auto &loop = stmt.as<Loop>();
            std::string text = std::string("Loop ") + loopKindName(loop.kind);
            if (loop.kind == LoopKind::CountedRange)
                text += " " + loop.var + " " + std::to_string(loop.from) + ".." + std::to_string(loop.to);
            if (loop.kind == LoopKind::IterateList)
            {
                text += " " + loop.var + " in";
                for (const auto &item : loop.items)
                    text += " " + quoteWord(item);
            }
            p.line(neg + text + loc);
            p.push();
            if (loop.kind == LoopKind::While || loop.kind == LoopKind::Until)
                printBlock("Condition:", loop.condition, p);
            printBlock("Body:", loop.body, p);
            p.pop();
            return;
        }
        case StatementKind::Pipeline:
        {
            const auto &pipe = stmt.as<Pipeline>();
            p.line(neg + "Pipeline " + std::to_string(pipe.stages.size()) + " stages" + loc);
            p.push();
            for (const auto &stage : pipe.stages)
                p.line("Stage " + commandText(stage));
            p.pop();
            return;
        }
        case StatementKind::Subshell:
            p.line(neg + "Subshell" + loc);
            p.push();
            for (const auto &child : stmt.as<Subshell>().body)
                printStmt(child, p);
            p.pop();
            return;
        case StatementKind::Redirection:
        {
            const auto &redir = stmt.as<Redirection>();
            p.line(neg + "Redirection " + redirectSpelling(redir) + loc);
            p.push();
            printStmt(*redir.statement, p);
            p.pop();
            return;
        }
        case StatementKind::Background:
            p.line(neg + "Background" + loc);
            p.push();
            printStmt(*stmt.as<Background>().statement, p);
            p.pop();
            return;
        case StatementKind::Return:
        {
            const auto &ret = stmt.as<Return>();
            std::string text = "Return";
            if (ret.code)
                text += " " + std::to_string(*ret.code);
            if (ret.value)
                text += " " + quoteWord(*ret.value);
            p.line(neg + text + loc);
            return;
        }
        case StatementKind::FunctionDecl:
            p.line(neg + "FunctionDecl " + stmt.as<FunctionDecl>().name + loc);
            return;
        case StatementKind::Group:
            p.line(neg + "Group" + loc);
            p.push();
            for (const auto &child : stmt.as<Group>().body)
                printStmt(child, p);
            p.pop();
            return;
    }
}

} // namespace

std::string quoteWord(const Word &word)
{
    std::string out = "\"";
    for (const char c : word.text())
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    out += '"';
    return out;
}

std::string IRPrinter::dump(const Program &program)
{
    std::ostringstream os;
    Printer p{os};

    std::string caps = "capabilities:";
    if (program.capabilities.empty())
        caps += " none";
    for (const Capability cap : program.capabilities)
        caps += std::string(" ") + capabilityName(cap);
    p.line(caps);

    if (!program.variables.empty())
    {
        p.line("variables:");
        p.push();
        for (const auto &[name, value] : program.variables)
            p.line(name + " = " + quoteWord(Word::literal(value)));
        p.pop();
    }

    for (const auto &fn : program.functions())
    {
        std::string params;
        for (const auto &param : fn.params)
            params += (params.empty() ? "" : ", ") + param;
        p.line("function " + fn.name + "(" + params + ")" + locStr(fn.loc));
        p.push();
        if (!fn.locals.empty())
        {
            p.line("locals:");
            p.push();
            for (const auto &[name, value] : fn.locals)
                p.line(name + " = " + quoteWord(Word::literal(value)));
            p.pop();
        }
        printBlock("body:", fn.body, p);
        p.pop();
    }

    printBlock("body:", program.statements, p);
    return os.str();
}

} // namespace shgo::ir
