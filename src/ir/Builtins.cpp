//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Builtin table and condition-category inference.

#include "ir/Builtins.hpp"

#include <array>
#include <utility>

namespace shgo::ir
{
namespace
{
constexpr std::array<std::pair<std::string_view, Builtin>, 21> kBuiltins{{
    {"echo", Builtin::Echo},
    {"cd", Builtin::Cd},
    {"pwd", Builtin::Pwd},
    {"mkdir", Builtin::Mkdir},
    {"rm", Builtin::Rm},
    {"cp", Builtin::Cp},
    {"test", Builtin::Test},
    {"[", Builtin::Test},
    {"exit", Builtin::Exit},
    {"export", Builtin::Export},
    {"read", Builtin::Read},
    {"source", Builtin::Source},
    {".", Builtin::Source},
    {"printf", Builtin::Printf},
    {"wait", Builtin::Wait},
    {"true", Builtin::True},
    {"false", Builtin::False},
    {":", Builtin::Colon},
    {"break", Builtin::Break},
    {"continue", Builtin::Continue},
    {"set", Builtin::Set},
}};

constexpr std::array<std::string_view, 16> kShellOnly{
    "eval",  "exec",  "trap",    "shift",  "unset", "alias", "unalias", "let",
    "getopts", "select", "coproc", "ulimit", "umask", "hash",  "builtin", "command",
};

ConditionCategory categorize(std::string_view op)
{
    if (op == "-f" || op == "-d" || op == "-e")
        return ConditionCategory::FileTest;
    if (op == "-z" || op == "-n" || op == "=" || op == "==" || op == "!=")
        return ConditionCategory::StringTest;
    if (op == "-eq" || op == "-ne" || op == "-lt" || op == "-le" || op == "-gt" || op == "-ge")
        return ConditionCategory::NumericTest;
    return ConditionCategory::GenericCommand;
}
} // namespace

std::optional<Builtin> lookupBuiltin(std::string_view name)
{
    for (const auto &[key, builtin] : kBuiltins)
    {
        if (key == name)
            return builtin;
    }
    return std::nullopt;
}

bool isShellOnlyBuiltin(std::string_view name)
{
    for (auto key : kShellOnly)
    {
        if (key == name)
            return true;
    }
    return false;
}

std::vector<std::string> testOperands(std::string_view name, std::vector<std::string> args)
{
    if (name == "[" && !args.empty() && args.back() == "]")
        args.pop_back();
    return args;
}

ConditionCategory inferConditionCategory(const std::vector<std::string> &operands)
{
    std::size_t first = 0;
    if (!operands.empty() && operands.front() == "!")
        first = 1;
    const std::size_t count = operands.size() - first;

    if (count == 0)
        return ConditionCategory::GenericCommand;
    if (count == 2)
        return categorize(operands[first]);
    if (count == 3)
        return categorize(operands[first + 1]);
    return categorize(operands[first]);
}

} // namespace shgo::ir
