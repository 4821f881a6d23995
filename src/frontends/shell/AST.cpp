//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Out-of-line helpers for shell syntax tree nodes: kind names used in
///        diagnostics and the approximate source rendering of words.

#include "frontends/shell/AST.hpp"

namespace shgo::frontends::shell
{
namespace
{
void appendPartText(const WordPart &part, std::string &out)
{
    switch (part.kind)
    {
        case WordPartKind::Lit:
        {
            const auto &lit = static_cast<const LitPart &>(part);
            if (lit.escaped)
                out += '\\';
            out += lit.value;
            return;
        }
        case WordPartKind::SglQuoted:
            out += '\'';
            out += static_cast<const SglQuotedPart &>(part).value;
            out += '\'';
            return;
        case WordPartKind::DblQuoted:
            out += '"';
            for (const auto &inner : static_cast<const DblQuotedPart &>(part).parts)
                appendPartText(*inner, out);
            out += '"';
            return;
        case WordPartKind::ParamExp:
        {
            const auto &param = static_cast<const ParamExpPart &>(part);
            if (!param.braced)
            {
                out += '$';
                out += param.name;
                return;
            }
            out += "${";
            if (param.length)
                out += '#';
            out += param.name;
            out += param.modifier;
            out += '}';
            return;
        }
        case WordPartKind::CmdSubst:
        {
            const auto &subst = static_cast<const CmdSubstPart &>(part);
            out += subst.backquoted ? "`" : "$(";
            out += subst.text;
            out += subst.backquoted ? "`" : ")";
            return;
        }
        case WordPartKind::ArithmExp:
            out += "$((";
            out += static_cast<const ArithmExpPart &>(part).text;
            out += "))";
            return;
        case WordPartKind::ProcSubst:
        {
            const auto &proc = static_cast<const ProcSubstPart &>(part);
            out += proc.input ? "<(" : ">(";
            out += proc.text;
            out += ')';
            return;
        }
        case WordPartKind::ArrayLit:
            out += '(';
            out += static_cast<const ArrayLitPart &>(part).text;
            out += ')';
            return;
    }
}
} // namespace

const char *wordPartKindName(WordPartKind kind)
{
    switch (kind)
    {
        case WordPartKind::Lit:
            return "literal";
        case WordPartKind::SglQuoted:
            return "single-quoted string";
        case WordPartKind::DblQuoted:
            return "double-quoted string";
        case WordPartKind::ParamExp:
            return "parameter expansion";
        case WordPartKind::CmdSubst:
            return "command substitution";
        case WordPartKind::ArithmExp:
            return "arithmetic expansion";
        case WordPartKind::ProcSubst:
            return "process substitution";
        case WordPartKind::ArrayLit:
            return "array assignment";
    }
    return "word part";
}

const char *commandKindName(CommandKind kind)
{
    switch (kind)
    {
        case CommandKind::Call:
            return "simple command";
        case CommandKind::Binary:
            return "binary command";
        case CommandKind::If:
            return "if clause";
        case CommandKind::While:
            return "while clause";
        case CommandKind::For:
            return "for clause";
        case CommandKind::Case:
            return "case clause";
        case CommandKind::Block:
            return "block";
        case CommandKind::Subshell:
            return "subshell";
        case CommandKind::FuncDecl:
            return "function declaration";
        case CommandKind::Decl:
            return "declaration clause";
        case CommandKind::Arithm:
            return "arithmetic command";
        case CommandKind::Test:
            return "test clause";
    }
    return "command";
}

const char *redirOpSpelling(RedirOp op)
{
    switch (op)
    {
        case RedirOp::Out:
            return ">";
        case RedirOp::Append:
            return ">>";
        case RedirOp::In:
            return "<";
        case RedirOp::Clobber:
            return ">|";
        case RedirOp::InOut:
            return "<>";
        case RedirOp::DupOut:
            return ">&";
        case RedirOp::DupIn:
            return "<&";
        case RedirOp::AllOut:
            return "&>";
        case RedirOp::AllAppend:
            return "&>>";
        case RedirOp::Heredoc:
            return "<<";
        case RedirOp::DashHeredoc:
            return "<<-";
        case RedirOp::HereString:
            return "<<<";
    }
    return "?";
}

bool Word::isPlainLiteral() const
{
    for (const auto &part : parts)
    {
        if (part->kind != WordPartKind::Lit || static_cast<const LitPart &>(*part).escaped)
            return false;
    }
    return !parts.empty();
}

std::string Word::literal() const
{
    if (!isPlainLiteral())
        return {};
    std::string out;
    for (const auto &part : parts)
        out += static_cast<const LitPart &>(*part).value;
    return out;
}

std::string Word::text() const
{
    std::string out;
    for (const auto &part : parts)
        appendPartText(*part, out);
    return out;
}

} // namespace shgo::frontends::shell
