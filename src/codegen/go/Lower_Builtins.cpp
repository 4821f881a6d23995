//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Simple command lowering: one fixed rule per builtin, function calls, and
// external commands through the process backend.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Builtin lowering rules for the Go generator.

#include "codegen/go/GoGenerator.hpp"

#include "codegen/go/Collect.hpp"
#include "codegen/go/GoNames.hpp"
#include "codegen/go/Splice.hpp"
#include "ir/Builtins.hpp"
#include "ir/Unsupported.hpp"

#include <algorithm>
#include <cctype>

namespace shgo::codegen::go
{
namespace
{
bool isFlagWord(const ir::Word &word)
{
    if (!word.isLiteral())
        return false;
    const std::string text = word.literalText();
    return text.size() > 1 && text.front() == '-';
}

bool isName(const std::string &text)
{
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())))
        return false;
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; });
}

/// Split leading option words from operands.  Every option letter must be
/// in @p allowed; the letters seen are returned in @p flags.
std::vector<const ir::Word *> splitOptions(const ir::Command &cmd, std::string_view allowed,
                                           std::string &flags)
{
    std::vector<const ir::Word *> operands;
    bool options = true;
    for (const auto &arg : cmd.args)
    {
        if (options && arg.isLiteral() && arg.literalText() == "--")
        {
            options = false;
            continue;
        }
        if (options && isFlagWord(arg))
        {
            const std::string text = arg.literalText();
            for (std::size_t i = 1; i < text.size(); ++i)
            {
                if (allowed.find(text[i]) == std::string_view::npos)
                    ir::unsupported(cmd.loc, "'" + cmd.name + "' option '" + text + "'");
                flags += text[i];
            }
            continue;
        }
        options = false;
        operands.push_back(&arg);
    }
    return operands;
}
} // namespace

void GoGenerator::emitCommand(const ir::Command &cmd, const Scope &scope)
{
    switch (cmd.cls)
    {
        case ir::CommandClass::Function:
            emitCheck(functionName(cmd.name) + "(" + variadicText(expandArgs(cmd.args, scope, false)) +
                      ")");
            return;
        case ir::CommandClass::External:
            emitCheck(backend_.runCommand(goQuote(cmd.name),
                                          variadicText(expandArgs(cmd.args, scope, true), 1)));
            return;
        case ir::CommandClass::Builtin:
            break;
    }

    const auto builtin = ir::lookupBuiltin(cmd.name);
    if (!builtin)
        ir::unsupported(cmd.loc, "builtin '" + cmd.name + "'");

    switch (*builtin)
    {
        case ir::Builtin::Echo:
            emitEcho(cmd, scope);
            return;
        case ir::Builtin::Cd:
            emitCd(cmd, scope);
            return;
        case ir::Builtin::Pwd:
        {
            std::string flags;
            splitOptions(cmd, "LP", flags);
            emitCheck("shPwd()");
            return;
        }
        case ir::Builtin::Mkdir:
            emitMkdir(cmd, scope);
            return;
        case ir::Builtin::Rm:
            emitRm(cmd, scope);
            return;
        case ir::Builtin::Cp:
            emitCp(cmd, scope);
            return;
        case ir::Builtin::Test:
            if (auto expr = testExpr(cmd, scope))
            {
                req_.require("shStatus");
                out_->open("if !(" + *expr + ")");
                out_->line("return shStatus(1)");
                out_->close();
            }
            else
            {
                emitCheck(spawnTest(cmd, scope));
            }
            return;
        case ir::Builtin::Exit:
            emitExit(cmd, scope);
            return;
        case ir::Builtin::Export:
            emitExport(cmd, scope);
            return;
        case ir::Builtin::Read:
            emitCheck(readCall(cmd));
            return;
        case ir::Builtin::Source:
            ir::unsupported(cmd.loc, "'" + cmd.name + "' of another script");
        case ir::Builtin::Printf:
            emitPrintf(cmd, scope);
            return;
        case ir::Builtin::Wait:
            if (!cmd.args.empty())
                ir::unsupported(cmd.loc, "'wait' with operands");
            emitCheck("shOutstanding.Wait()");
            return;
        case ir::Builtin::True:
        case ir::Builtin::Colon:
            return;
        case ir::Builtin::False:
            req_.require("shStatus");
            out_->line("return shStatus(1)");
            return;
        case ir::Builtin::Break:
        case ir::Builtin::Continue:
            emitLoopJump(cmd, scope);
            return;
        case ir::Builtin::Set:
            emitSet(cmd);
            return;
    }
}

void GoGenerator::emitEcho(const ir::Command &cmd, const Scope &scope)
{
    bool newline = true;
    bool escapes = false;
    std::size_t first = 0;
    for (; first < cmd.args.size(); ++first)
    {
        const ir::Word &arg = cmd.args[first];
        if (!arg.isLiteral())
            break;
        const std::string text = arg.literalText();
        if (text.size() < 2 || text.front() != '-' ||
            text.find_first_not_of("neE", 1) != std::string::npos)
        {
            break;
        }
        for (std::size_t i = 1; i < text.size(); ++i)
        {
            if (text[i] == 'n')
                newline = false;
            else
                escapes = text[i] == 'e';
        }
    }

    const std::vector<ir::Word> rest(cmd.args.begin() + static_cast<std::ptrdiff_t>(first),
                                     cmd.args.end());
    const std::vector<Arg> ops = expandArgs(rest, scope, false);

    if (newline && !escapes)
    {
        const bool anySpread =
            std::any_of(ops.begin(), ops.end(), [](const Arg &a) { return a.spread; });
        out_->line("fmt.Println(" + (anySpread ? joinedText(ops) : variadicText(ops)) + ")");
        return;
    }

    std::string text = joinedText(ops);
    if (escapes)
    {
        req_.require("shUnescape");
        text = "shUnescape(" + text + ")";
    }
    out_->line(std::string(newline ? "fmt.Println(" : "fmt.Print(") + text + ")");
}

void GoGenerator::emitCd(const ir::Command &cmd, const Scope &scope)
{
    std::string flags;
    const auto operands = splitOptions(cmd, "LP", flags);
    if (operands.size() > 1)
        ir::unsupported(cmd.loc, "'cd' with more than one operand");

    std::string dir;
    if (operands.empty())
    {
        dir = reference("HOME", scope);
    }
    else
    {
        if (operands.front()->isLiteral() && operands.front()->literalText() == "-")
            ir::unsupported(cmd.loc, "'cd -'");
        dir = wordExpr(*operands.front(), scope);
    }
    emitCheck("os.Chdir(" + dir + ")");
}

void GoGenerator::emitMkdir(const ir::Command &cmd, const Scope &scope)
{
    std::string flags;
    const auto operands = splitOptions(cmd, "pv", flags);
    if (operands.empty())
        ir::unsupported(cmd.loc, "'mkdir' without operands");
    for (const ir::Word *dir : operands)
        emitCheck("os.MkdirAll(" + compactBinary(wordExpr(*dir, scope)) + ", 0o755)");
}

void GoGenerator::emitRm(const ir::Command &cmd, const Scope &scope)
{
    std::string flags;
    const auto operands = splitOptions(cmd, "rRfv", flags);
    const bool recursive = flags.find_first_of("rR") != std::string::npos;
    const bool force = flags.find('f') != std::string::npos;
    if (operands.empty())
    {
        if (force)
            return;
        ir::unsupported(cmd.loc, "'rm' without operands");
    }

    const std::string call = recursive ? "os.RemoveAll" : "os.Remove";
    const std::string failed = force && !recursive ? "err != nil && !os.IsNotExist(err)" : "err != nil";
    for (const ir::Word *path : operands)
    {
        if (path->glob)
        {
            req_.require("shGlob");
            out_->open("for _, shPath := range shGlob(" + wordExpr(*path, scope) + ")");
            out_->open("if err := " + call + "(shPath); " + failed);
            out_->line("return err");
            out_->close();
            out_->close();
            continue;
        }
        out_->open("if err := " + call + "(" + wordExpr(*path, scope) + "); " + failed);
        out_->line("return err");
        out_->close();
    }
}

void GoGenerator::emitCp(const ir::Command &cmd, const Scope &scope)
{
    std::string flags;
    const auto operands = splitOptions(cmd, "", flags);
    if (operands.size() != 2)
    {
        ir::unsupported(cmd.loc,
                        "'cp' with " + std::to_string(operands.size()) + " operands");
    }
    emitCheck("shCopy(" + compactBinary(wordExpr(*operands[0], scope)) + ", " +
              compactBinary(wordExpr(*operands[1], scope)) + ")");
}

void GoGenerator::emitExit(const ir::Command &cmd, const Scope &scope)
{
    if (cmd.args.size() > 1)
        ir::unsupported(cmd.loc, "'exit' with more than one operand");

    std::string code = "0";
    bool dynamic = false;
    if (!cmd.args.empty())
    {
        const ir::Word &arg = cmd.args.front();
        const std::string text = arg.literalText();
        if (arg.isLiteral() && !text.empty() && text.size() <= 9 &&
            std::all_of(text.begin(), text.end(),
                        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
        {
            code = std::to_string(std::stoi(text) & 0xff);
        }
        else
        {
            code = wordExpr(arg, scope);
            dynamic = true;
        }
    }

    if (!scope.exitReturns)
    {
        if (dynamic)
        {
            req_.require("shAtoi");
            out_->line("os.Exit(shAtoi(" + code + "))");
        }
        else
        {
            out_->line("os.Exit(" + code + ")");
        }
        return;
    }
    if (scope.returnBlocked)
        ir::unsupported(cmd.loc, "'exit' inside a redirected or negated block of a subshell");
    emitStatusReturn(code, dynamic);
}

void GoGenerator::emitExport(const ir::Command &cmd, const Scope &scope)
{
    for (const auto &arg : cmd.args)
    {
        const std::string name = arg.literalText();
        if (!arg.isLiteral() || !isName(name))
            ir::unsupported(cmd.loc, "'export' operand '" + arg.text() + "'");
        emitCheck("os.Setenv(" + goQuote(name) + ", " + compactBinary(reference(name, scope)) + ")");
    }
}

std::string GoGenerator::readCall(const ir::Command &cmd)
{
    std::string flags;
    const auto operands = splitOptions(cmd, "r", flags);

    std::string targets;
    for (const ir::Word *word : operands)
    {
        const std::string name = word->literalText();
        if (!word->isLiteral() || !isName(name))
            ir::unsupported(cmd.loc, "'read' target '" + word->text() + "'");
        targets += (targets.empty() ? "&" : ", &") + variableName(name);
    }
    if (targets.empty())
        targets = "&" + variableName("REPLY");

    return "shRead(" + targets + ")";
}

void GoGenerator::emitPrintf(const ir::Command &cmd, const Scope &scope)
{
    std::size_t first = 0;
    if (!cmd.args.empty() && cmd.args.front().isLiteral() && cmd.args.front().literalText() == "--")
        first = 1;
    if (first >= cmd.args.size())
        ir::unsupported(cmd.loc, "'printf' without a format");
    if (cmd.args[first].isLiteral() && cmd.args[first].literalText() == "-v")
        ir::unsupported(cmd.loc, "'printf -v'");

    const std::string format = wordExpr(cmd.args[first], scope);
    const std::vector<ir::Word> rest(cmd.args.begin() + static_cast<std::ptrdiff_t>(first + 1),
                                     cmd.args.end());
    const std::string args = variadicText(expandArgs(rest, scope, false), 1);

    if (args.empty())
        out_->line("fmt.Print(shPrintf(" + format + "))");
    else
        out_->line("fmt.Print(shPrintf(" + compactBinary(format) + ", " + args + "))");
}

void GoGenerator::emitSet(const ir::Command &cmd)
{
    if (cmd.args.empty())
        ir::unsupported(cmd.loc, "'set' without options");

    for (std::size_t i = 0; i < cmd.args.size(); ++i)
    {
        const ir::Word &arg = cmd.args[i];
        const std::string text = arg.literalText();
        if (!arg.isLiteral() || text.size() < 2 || text.front() != '-')
            ir::unsupported(cmd.loc, "'set " + arg.text() + "'");

        for (std::size_t k = 1; k < text.size(); ++k)
        {
            const char opt = text[k];
            if (opt == 'e' || opt == 'u')
                continue;
            if (opt != 'o')
                ir::unsupported(cmd.loc, "'set " + text + "'");

            // `-o NAME`: the three options the fail-fast model already implies.
            if (i + 1 >= cmd.args.size())
                ir::unsupported(cmd.loc, "'set -o' without an option name");
            const std::string name = cmd.args[++i].literalText();
            if (name != "errexit" && name != "nounset" && name != "pipefail")
                ir::unsupported(cmd.loc, "'set -o " + cmd.args[i].text() + "'");
        }
    }
}

void GoGenerator::emitLoopJump(const ir::Command &cmd, const Scope &scope)
{
    if (!cmd.args.empty())
        ir::unsupported(cmd.loc, "'" + cmd.name + "' with a loop count");
    if (scope.loopDepth == 0)
        ir::unsupported(cmd.loc, "'" + cmd.name + "' outside a loop of the same function literal");
    out_->line(cmd.name);
}

std::optional<std::string> GoGenerator::testExpr(const ir::Command &cmd, const Scope &scope)
{
    const TestForm form = matchTest(cmd);
    auto operand = [&](std::size_t i) { return compactBinary(wordExpr(*form.operands[i], scope)); };

    std::string expr;
    switch (form.kind)
    {
        case TestForm::Kind::Spawn:
            return std::nullopt;
        case TestForm::Kind::File:
            expr = "shTestFile(" + goQuote(form.op) + ", " + operand(0) + ")";
            break;
        case TestForm::Kind::Empty:
            expr = operand(0) + " == \"\"";
            break;
        case TestForm::Kind::NonEmpty:
            expr = operand(0) + " != \"\"";
            break;
        case TestForm::Kind::Equal:
            expr = operand(0) + " == " + operand(1);
            break;
        case TestForm::Kind::NotEqual:
            expr = operand(0) + " != " + operand(1);
            break;
        case TestForm::Kind::Numeric:
            expr = "shAtoi(" + operand(0) + ") " + form.op + " shAtoi(" + operand(1) + ")";
            break;
    }
    return form.negate ? "!(" + expr + ")" : expr;
}

std::string GoGenerator::spawnTest(const ir::Command &cmd, const Scope &scope)
{
    return backend_.runCommand(goQuote(cmd.name),
                               variadicText(expandArgs(cmd.args, scope, false), 1));
}

std::string GoGenerator::commandStatus(const ir::Command &cmd, const Scope &scope)
{
    switch (cmd.cls)
    {
        case ir::CommandClass::Function:
            return compactBinary(functionName(cmd.name) + "(" +
                                 variadicText(expandArgs(cmd.args, scope, false)) + ")") +
                   " == nil";
        case ir::CommandClass::External:
            return compactBinary(backend_.runCommand(
                       goQuote(cmd.name), variadicText(expandArgs(cmd.args, scope, true), 1))) +
                   " == nil";
        case ir::CommandClass::Builtin:
            break;
    }

    const auto builtin = ir::lookupBuiltin(cmd.name);
    if (!builtin)
        return "";
    switch (*builtin)
    {
        case ir::Builtin::Test:
            if (auto expr = testExpr(cmd, scope))
                return *expr;
            return compactBinary(spawnTest(cmd, scope)) + " == nil";
        case ir::Builtin::True:
        case ir::Builtin::Colon:
            return "true";
        case ir::Builtin::False:
            return "false";
        case ir::Builtin::Read:
            return readCall(cmd) + " == nil";
        default:
            return "";
    }
}

} // namespace shgo::codegen::go
