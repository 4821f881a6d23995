//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Generator entry point, file assembly and the statement/word plumbing shared
// by the lowering files.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Go code generator core.

#include "codegen/go/GoGenerator.hpp"

#include "codegen/go/Collect.hpp"
#include "codegen/go/GoNames.hpp"
#include "codegen/go/JobSafety.hpp"
#include "codegen/go/RuntimeHelpers.hpp"
#include "codegen/go/Splice.hpp"
#include "ir/Unsupported.hpp"
#include "support/trace.hpp"

#include <map>

namespace shgo::codegen::go
{

support::Expected<std::string> generate(const ir::Program &program)
{
    static const OsExecBackend backend;
    GoGenerator generator(backend);
    return generator.generate(program);
}

support::Expected<std::string> GoGenerator::generate(const ir::Program &program)
{
    program_ = &program;

    SourceWriter decls;
    out_ = &decls;
    try
    {
        std::map<std::string, std::string> goNames;
        for (const auto &fn : program.functions())
        {
            auto [it, inserted] = goNames.emplace(functionName(fn.name), fn.name);
            if (!inserted)
            {
                ir::unsupported(fn.loc, "functions '" + it->second + "' and '" + fn.name +
                                            "' map to the same Go name");
            }
        }

        checkJobSafety(program);
        req_ = collectRequirements(program, backend_);

        for (const auto &fn : program.functions())
        {
            emitFunction(fn);
            decls.blank();
        }
        emitScriptBody(program);
    }
    catch (const ir::LoweringError &err)
    {
        out_ = nullptr;
        return err.diag();
    }
    out_ = nullptr;

    SourceWriter file;
    file.line("// Code generated by shgo. DO NOT EDIT.");
    file.blank();
    file.line("package main");
    file.blank();
    file.line("import (");
    file.indent();
    for (const auto &path : req_.imports())
        file.line(goQuote(path));
    file.dedent();
    file.line(")");
    file.blank();

    emitGlobals(file, program);

    for (const auto &helper : runtimeHelpers())
    {
        if (!req_.has(helper.name))
            continue;
        file.append(helper.source);
        file.blank();
    }

    file.append(decls.str());
    file.blank();
    emitMain(file);

    std::string imports;
    for (const auto &path : req_.imports())
        imports += (imports.empty() ? "" : " ") + path;
    support::trace("generate", std::to_string(file.str().size()) + " bytes, " +
                                   std::to_string(req_.helpers().size()) + " helpers, imports: " +
                                   imports);
    return file.str();
}

void GoGenerator::emitStatements(const ir::StatementList &stmts, const Scope &scope)
{
    for (const auto &stmt : stmts)
        emitStatement(stmt, scope);
}

void GoGenerator::emitStatement(const ir::Statement &stmt, const Scope &scope)
{
    loc_ = stmt.loc;
    if (!stmt.negated)
    {
        emitPayload(stmt, scope);
        return;
    }

    const std::string status = statusExpr(stmt, scope);
    req_.require("shStatus");
    out_->open("if " + status);
    out_->line("return shStatus(1)");
    out_->close();
}

void GoGenerator::emitPayload(const ir::Statement &stmt, const Scope &scope)
{
    loc_ = stmt.loc;
    switch (stmt.kind())
    {
        case ir::StatementKind::Command:
            emitCommand(stmt.as<ir::Command>(), scope);
            return;
        case ir::StatementKind::Assignment:
            emitAssignment(stmt.as<ir::Assignment>(), scope);
            return;
        case ir::StatementKind::Conditional:
            emitConditional(stmt.as<ir::Conditional>(), scope);
            return;
        case ir::StatementKind::Loop:
            emitLoop(stmt.as<ir::Loop>(), scope);
            return;
        case ir::StatementKind::Pipeline:
            emitPipeline(stmt.as<ir::Pipeline>(), scope);
            return;
        case ir::StatementKind::Subshell:
            emitSubshell(stmt.as<ir::Subshell>(), scope);
            return;
        case ir::StatementKind::Redirection:
            emitRedirection(stmt.as<ir::Redirection>(), scope);
            return;
        case ir::StatementKind::Background:
            emitBackground(stmt.as<ir::Background>(), scope);
            return;
        case ir::StatementKind::Return:
            emitReturn(stmt.as<ir::Return>(), scope);
            return;
        case ir::StatementKind::FunctionDecl:
            // Functions are emitted as top-level Go functions.
            return;
        case ir::StatementKind::Group:
            emitStatements(stmt.as<ir::Group>().body, scope);
            return;
    }
    ir::unsupported(stmt.loc, std::string("statement kind ") + ir::statementKindName(stmt.kind()));
}

void GoGenerator::emitCheck(const std::string &expr)
{
    out_->open("if err := " + expr + "; err != nil");
    out_->line("return err");
    out_->close();
}

std::string GoGenerator::closure(const std::function<void()> &body)
{
    SourceWriter *outer = out_;
    SourceWriter inner(outer->depth() + 1);
    out_ = &inner;
    body();
    inner.line("return nil");
    out_ = outer;
    return "func() error {\n" + inner.str() + SourceWriter::tabs(outer->depth()) + "}()";
}

std::string GoGenerator::wordExpr(const ir::Word &word, const Scope &scope)
{
    std::vector<std::string> operands;
    std::string pending;
    bool literalSeen = false;

    auto flush = [&]()
    {
        if (!pending.empty())
            operands.push_back(goQuote(pending));
        pending.clear();
    };

    for (const auto &seg : word.segments)
    {
        switch (seg.kind)
        {
            case ir::WordSegment::Kind::Literal:
                pending += seg.text;
                literalSeen = true;
                break;
            case ir::WordSegment::Kind::Interpolated:
                for (const auto &token : splitInterpolated(seg.text))
                {
                    if (!token.reference)
                    {
                        pending += token.text;
                        continue;
                    }
                    flush();
                    operands.push_back(reference(token.text, scope));
                }
                break;
            case ir::WordSegment::Kind::CommandSubst:
                ir::unsupported(loc_, "command substitution '" + seg.text + "'");
        }
    }
    flush();
    if (operands.empty() && literalSeen)
        return "\"\"";
    return concatExpr(operands);
}

bool GoGenerator::isListWord(const ir::Word &word)
{
    if (word.segments.size() != 1 || word.segments.front().kind != ir::WordSegment::Kind::Interpolated)
        return false;
    const std::string &text = word.segments.front().text;
    return text == "${@}" || (text == "${*}" && word.splittable);
}

std::vector<GoGenerator::Arg> GoGenerator::expandArgs(const std::vector<ir::Word> &words,
                                                      const Scope &scope, bool glob)
{
    std::vector<Arg> args;
    for (const auto &word : words)
    {
        if (isListWord(word))
        {
            args.push_back({argumentList(scope), true});
        }
        else if (glob && word.glob)
        {
            req_.require("shGlob");
            args.push_back({"shGlob(" + wordExpr(word, scope) + ")", true});
        }
        else
        {
            args.push_back({wordExpr(word, scope), false});
        }
    }
    return args;
}

std::vector<GoGenerator::Arg> GoGenerator::expandItems(const std::vector<ir::Word> &words,
                                                       const Scope &scope)
{
    std::vector<Arg> items;
    for (const auto &word : words)
    {
        if (isListWord(word))
        {
            items.push_back({argumentList(scope), true});
        }
        else if (word.glob)
        {
            req_.require("shGlob");
            items.push_back({"shGlob(" + wordExpr(word, scope) + ")", true});
        }
        else if (word.splittable)
        {
            req_.import("strings");
            items.push_back({"strings.Fields(" + wordExpr(word, scope) + ")", true});
        }
        else
        {
            items.push_back({wordExpr(word, scope), false});
        }
    }
    return items;
}

std::string GoGenerator::variadicText(const std::vector<Arg> &args, std::size_t others)
{
    bool anySpread = false;
    for (const auto &arg : args)
        anySpread = anySpread || arg.spread;

    if (!anySpread)
    {
        const bool nested = args.size() + others > 1;
        std::string out;
        for (const auto &arg : args)
            out += (out.empty() ? "" : ", ") + (nested ? compactBinary(arg.expr) : arg.expr);
        return out;
    }
    const std::string slice = sliceText(args) + "...";
    return others > 0 ? compactBinary(slice) : slice;
}

std::string GoGenerator::sliceText(const std::vector<Arg> &args)
{
    if (args.size() == 1 && args.front().spread)
        return args.front().expr;

    std::size_t i = 0;
    std::string head;
    for (; i < args.size() && !args[i].spread; ++i)
        head += (head.empty() ? "" : ", ") + args[i].expr;
    std::string out = "[]string{" + head + "}";

    while (i < args.size())
    {
        if (args[i].spread)
        {
            out = "append(" + out + ", " + compactBinary(args[i].expr) + "...)";
            ++i;
            continue;
        }
        std::string run;
        for (; i < args.size() && !args[i].spread; ++i)
            run += ", " + compactBinary(args[i].expr);
        out = "append(" + out + run + ")";
    }
    return out;
}

std::string GoGenerator::joinedText(const std::vector<Arg> &args)
{
    if (args.empty())
        return "\"\"";

    bool anySpread = false;
    for (const auto &arg : args)
        anySpread = anySpread || arg.spread;
    if (anySpread)
    {
        req_.import("strings");
        return "strings.Join(" + compactBinary(sliceText(args)) + ", \" \")";
    }

    std::string out;
    for (const auto &arg : args)
        out += (out.empty() ? "" : " + \" \" + ") + arg.expr;
    return out;
}

} // namespace shgo::codegen::go
