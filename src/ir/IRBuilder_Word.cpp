//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Word lowering: flattens quoting into literal and interpolated segments and
// rejects expansions the generator has no rule for.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Word half of the IR builder.

#include "ir/IRBuilder.hpp"

#include "ir/Unsupported.hpp"

#include <cctype>

namespace shgo::ir
{
namespace sh = frontends::shell;

namespace
{
bool isPositionalOrList(const std::string &name)
{
    if (name == "@" || name == "*" || name == "#")
        return true;
    if (name.empty() || name == "0")
        return false;
    for (const char c : name)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

std::string spellExpansion(const sh::ParamExpPart &pe)
{
    return std::string("${") + (pe.length ? "#" : "") + pe.name + pe.modifier + "}";
}
} // namespace

Word IRBuilder::lowerWord(const sh::Word &word)
{
    Word out;
    bool first = true;
    for (const auto &part : word.parts)
    {
        lowerPart(*part, out, false, first);
        first = false;
    }
    if (out.segments.empty())
        out.segments.push_back({WordSegment::Kind::Literal, ""});
    return out;
}

void IRBuilder::lowerPart(const sh::WordPart &part, Word &out, bool quoted, bool first)
{
    switch (part.kind)
    {
        case sh::WordPartKind::Lit:
        {
            const auto &lit = static_cast<const sh::LitPart &>(part);
            std::string_view text = lit.value;
            if (!quoted && !lit.escaped)
            {
                if (first && !text.empty() && text.front() == '~' &&
                    (text.size() == 1 || text[1] == '/'))
                {
                    out.append(WordSegment::Kind::Interpolated, "${HOME}");
                    text.remove_prefix(1);
                }
                if (text.find_first_of("*?[") != std::string_view::npos)
                    out.glob = true;
            }
            out.append(WordSegment::Kind::Literal, std::string(text));
            return;
        }
        case sh::WordPartKind::SglQuoted:
            out.append(WordSegment::Kind::Literal,
                       static_cast<const sh::SglQuotedPart &>(part).value);
            return;
        case sh::WordPartKind::DblQuoted:
        {
            const auto &dq = static_cast<const sh::DblQuotedPart &>(part);
            if (dq.parts.empty())
                out.append(WordSegment::Kind::Literal, "");
            for (const auto &inner : dq.parts)
                lowerPart(*inner, out, true, false);
            return;
        }
        case sh::WordPartKind::ParamExp:
        {
            const auto &pe = static_cast<const sh::ParamExpPart &>(part);
            if (!pe.isSimple())
                unsupported(part.loc, "parameter expansion '" + spellExpansion(pe) + "'");
            if (pe.name == "?" || pe.name == "!" || pe.name == "-")
                unsupported(part.loc, "special parameter '$" + pe.name + "'");
            out.append(WordSegment::Kind::Interpolated, "${" + pe.name + "}");
            if (!quoted)
                out.splittable = true;
            noteParameter(pe.name);
            return;
        }
        case sh::WordPartKind::CmdSubst:
            out.append(WordSegment::Kind::CommandSubst,
                       "$(" + static_cast<const sh::CmdSubstPart &>(part).text + ")");
            return;
        case sh::WordPartKind::ArithmExp:
        case sh::WordPartKind::ProcSubst:
        case sh::WordPartKind::ArrayLit:
            break;
    }
    unsupported(part.loc, sh::wordPartKindName(part.kind));
}

void IRBuilder::noteParameter(const std::string &name)
{
    if (function_ != nullptr && isPositionalOrList(name))
        params_.insert(name);
}

} // namespace shgo::ir
