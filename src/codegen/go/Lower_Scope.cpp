//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Variable resolution and the top-level declarations: globals, functions,
// the script body and main.
//
// A shell parameter resolves, in order, to a `local` of the enclosing
// function, to a global assigned anywhere in the script, or to the process
// environment.  Positional parameters read the function's variadic `args`
// inside functions and os.Args in the script body.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Scope lowering for the Go generator.

#include "codegen/go/GoGenerator.hpp"

#include "codegen/go/GoNames.hpp"
#include "ir/Unsupported.hpp"

#include <algorithm>
#include <cctype>

namespace shgo::codegen::go
{
namespace
{
bool isDigits(const std::string &text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

bool isName(const std::string &text)
{
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())))
        return false;
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; });
}

bool endsWithReturn(const ir::StatementList &body)
{
    return !body.empty() && body.back().kind() == ir::StatementKind::Return && !body.back().negated;
}
} // namespace

std::string GoGenerator::reference(const std::string &name, const Scope &scope)
{
    const bool inFunction = scope.function != nullptr;

    if (name == "0")
        return "os.Args[0]";
    if (isDigits(name))
    {
        if (name.size() > 4)
            ir::unsupported(loc_, "positional parameter '$" + name + "'");
        const int index = std::stoi(name);
        req_.require("shArg");
        if (inFunction)
            return "shArg(args, " + std::to_string(index - 1) + ")";
        return "shArg(os.Args, " + std::to_string(index) + ")";
    }
    if (name == "#")
    {
        req_.import("strconv");
        return inFunction ? "strconv.Itoa(len(args))" : "strconv.Itoa(len(os.Args) - 1)";
    }
    if (name == "@" || name == "*")
    {
        req_.import("strings");
        return "strings.Join(" + argumentList(scope) + ", \" \")";
    }
    if (name == "$")
    {
        req_.import("strconv");
        return "strconv.Itoa(os.Getpid())";
    }
    if (!isName(name))
        ir::unsupported(loc_, "parameter '$" + name + "'");

    if (inFunction && scope.function->locals.count(name) != 0)
        return variableName(name);
    if (program_->variables.count(name) != 0)
        return variableName(name);
    return "os.Getenv(" + goQuote(name) + ")";
}

std::string GoGenerator::argumentList(const Scope &scope)
{
    return scope.function != nullptr ? "args" : "os.Args[1:]";
}

void GoGenerator::emitAssignment(const ir::Assignment &assign, const Scope &scope)
{
    const std::string target = variableName(assign.name);
    if (assign.value)
        out_->line(target + " = " + wordExpr(*assign.value, scope));
    if (assign.isExport)
        emitCheck("os.Setenv(" + goQuote(assign.name) + ", " + target + ")");
}

void GoGenerator::emitStatusReturn(const std::string &code, bool dynamic)
{
    if (dynamic)
    {
        req_.require("shAtoi");
        req_.require("shStatus");
        out_->open("if shCode := shAtoi(" + code + "); shCode != 0");
        out_->line("return shStatus(shCode)");
        out_->close();
        out_->line("return nil");
        return;
    }
    if (code == "0")
    {
        out_->line("return nil");
        return;
    }
    req_.require("shStatus");
    out_->line("return shStatus(" + code + ")");
}

void GoGenerator::emitReturn(const ir::Return &ret, const Scope &scope)
{
    if (scope.returnBlocked)
        ir::unsupported(loc_, "'return' inside a redirected or negated block or a condition");

    if (ret.value)
        emitStatusReturn(wordExpr(*ret.value, scope), true);
    else
        emitStatusReturn(std::to_string(ret.code.value_or(0)), false);
}

void GoGenerator::emitFunction(const ir::Function &fn)
{
    Scope scope;
    scope.function = &fn;

    const std::string goName = functionName(fn.name);
    out_->line("// " + goName + " runs the shell function " + goQuote(fn.name) + ".");
    out_->open("func " + goName + "(args ...string) error");

    if (!fn.locals.empty())
    {
        std::string names;
        std::string blanks;
        for (const auto &entry : fn.locals)
        {
            names += (names.empty() ? "" : ", ") + variableName(entry.first);
            blanks += blanks.empty() ? "_" : ", _";
        }
        out_->line("var " + names + " string");
        out_->line(blanks + " = " + names);
    }

    emitStatements(fn.body, scope);
    if (!endsWithReturn(fn.body))
        out_->line("return nil");
    out_->close();
}

void GoGenerator::emitScriptBody(const ir::Program &program)
{
    const Scope scope{};
    out_->line("// shMain runs the script body.");
    out_->open("func shMain() error");
    emitStatements(program.statements, scope);
    if (!endsWithReturn(program.statements))
        out_->line("return nil");
    out_->close();
}

void GoGenerator::emitGlobals(SourceWriter &file, const ir::Program &program) const
{
    if (program.variables.empty())
        return;

    std::size_t width = 0;
    for (const auto &entry : program.variables)
        width = std::max(width, variableName(entry.first).size());

    file.line("var (");
    file.indent();
    for (const auto &entry : program.variables)
    {
        std::string goName = variableName(entry.first);
        goName.resize(width, ' ');
        file.line(goName + " = os.Getenv(" + goQuote(entry.first) + ")");
    }
    file.dedent();
    file.line(")");
    file.blank();
}

void GoGenerator::emitMain(SourceWriter &file) const
{
    file.open("func main()");
    if (req_.has("shOutstanding"))
    {
        file.line("err := shMain()");
        file.open("if werr := shOutstanding.Wait(); err == nil");
        file.line("err = werr");
        file.close();
        file.open("if err != nil");
    }
    else
    {
        file.open("if err := shMain(); err != nil");
    }
    file.line("fmt.Fprintln(os.Stderr, \"error:\", err)");
    file.line("os.Exit(shExitCode(err))");
    file.close();
    file.close();
}

} // namespace shgo::codegen::go
