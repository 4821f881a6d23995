//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Variable-reference splicing for interpolated text.

#include "codegen/go/Splice.hpp"

namespace shgo::codegen::go
{
namespace
{
bool isNameStart(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isNameChar(char c)
{
    return isNameStart(c) || (c >= '0' && c <= '9');
}

void pushLiteral(std::vector<SpliceToken> &tokens, std::string_view text)
{
    if (text.empty())
        return;
    if (!tokens.empty() && !tokens.back().reference)
    {
        tokens.back().text.append(text);
        return;
    }
    tokens.push_back({false, std::string(text)});
}
} // namespace

std::vector<SpliceToken> splitInterpolated(std::string_view text)
{
    std::vector<SpliceToken> tokens;
    std::size_t i = 0;
    while (i < text.size())
    {
        const std::size_t dollar = text.find('$', i);
        if (dollar == std::string_view::npos || dollar + 1 >= text.size())
        {
            pushLiteral(tokens, text.substr(i));
            break;
        }
        pushLiteral(tokens, text.substr(i, dollar - i));

        const char next = text[dollar + 1];
        if (next == '$')
        {
            pushLiteral(tokens, "$");
            i = dollar + 2;
        }
        else if (next == '{')
        {
            const std::size_t closing = text.find('}', dollar + 2);
            if (closing == std::string_view::npos)
            {
                pushLiteral(tokens, text.substr(dollar));
                break;
            }
            tokens.push_back({true, std::string(text.substr(dollar + 2, closing - dollar - 2))});
            i = closing + 1;
        }
        else if (isNameStart(next))
        {
            std::size_t end = dollar + 1;
            while (end < text.size() && isNameChar(text[end]))
                ++end;
            tokens.push_back({true, std::string(text.substr(dollar + 1, end - dollar - 1))});
            i = end;
        }
        else if ((next >= '0' && next <= '9') || next == '@' || next == '*' || next == '#')
        {
            tokens.push_back({true, std::string(1, next)});
            i = dollar + 2;
        }
        else
        {
            pushLiteral(tokens, "$");
            i = dollar + 1;
        }
    }
    return tokens;
}

std::string concatExpr(const std::vector<std::string> &operands)
{
    std::string out;
    for (const auto &operand : operands)
    {
        if (operand.empty() || operand == "\"\"")
            continue;
        if (!out.empty())
            out += " + ";
        out += operand;
    }
    return out.empty() ? "\"\"" : out;
}

std::string compactBinary(std::string_view expr)
{
    std::string out;
    out.reserve(expr.size());
    int braces = 0;
    for (std::size_t i = 0; i < expr.size(); ++i)
    {
        const char c = expr[i];
        if (c == '"' || c == '`')
        {
            out += c;
            for (++i; i < expr.size(); ++i)
            {
                out += expr[i];
                if (c == '"' && expr[i] == '\\' && i + 1 < expr.size())
                {
                    out += expr[++i];
                    continue;
                }
                if (expr[i] == c)
                    break;
            }
            continue;
        }
        if (c == '{')
            ++braces;
        else if (c == '}')
            --braces;

        if (braces == 0 && c == ' ' && i + 2 < expr.size() &&
            (expr[i + 1] == '+' || expr[i + 1] == '-') && expr[i + 2] == ' ')
        {
            out += expr[i + 1];
            i += 2;
            continue;
        }
        out += c;
    }
    return out;
}

} // namespace shgo::codegen::go
