//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Function table management and kind names for the IR.

#include "ir/Program.hpp"

namespace shgo::ir
{

static_assert(std::variant_size_v<Statement::Payload> ==
                  static_cast<std::size_t>(StatementKind::Group) + 1,
              "StatementKind must list every payload alternative");
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(StatementKind::Return),
                                                        Statement::Payload>,
                             Return>,
              "StatementKind order must match the payload variant");

bool Program::addFunction(Function fn)
{
    if (functionIndex_.count(fn.name) != 0)
        return false;
    functionIndex_.emplace(fn.name, functions_.size());
    functions_.push_back(std::move(fn));
    return true;
}

const Function *Program::findFunction(const std::string &name) const
{
    auto it = functionIndex_.find(name);
    if (it == functionIndex_.end())
        return nullptr;
    return &functions_[it->second];
}

const char *capabilityName(Capability cap)
{
    switch (cap)
    {
        case Capability::SpawnsProcesses:
            return "spawns-processes";
        case Capability::MutatesEnvironment:
            return "mutates-environment";
        case Capability::FilesystemIO:
            return "filesystem-io";
        case Capability::ChangesDirectory:
            return "changes-directory";
        case Capability::ReadsInput:
            return "reads-input";
        case Capability::Concurrency:
            return "concurrency";
    }
    return "?";
}

const char *statementKindName(StatementKind kind)
{
    switch (kind)
    {
        case StatementKind::Command:
            return "command";
        case StatementKind::Assignment:
            return "assignment";
        case StatementKind::Conditional:
            return "conditional";
        case StatementKind::Loop:
            return "loop";
        case StatementKind::Pipeline:
            return "pipeline";
        case StatementKind::Subshell:
            return "subshell";
        case StatementKind::Redirection:
            return "redirection";
        case StatementKind::Background:
            return "background";
        case StatementKind::Return:
            return "return";
        case StatementKind::FunctionDecl:
            return "function-decl";
        case StatementKind::Group:
            return "group";
    }
    return "?";
}

const char *conditionCategoryName(ConditionCategory category)
{
    switch (category)
    {
        case ConditionCategory::FileTest:
            return "file-test";
        case ConditionCategory::StringTest:
            return "string-test";
        case ConditionCategory::NumericTest:
            return "numeric-test";
        case ConditionCategory::GenericCommand:
            return "generic-command";
    }
    return "?";
}

const char *loopKindName(LoopKind kind)
{
    switch (kind)
    {
        case LoopKind::CountedRange:
            return "range";
        case LoopKind::IterateList:
            return "list";
        case LoopKind::While:
            return "while";
        case LoopKind::Until:
            return "until";
    }
    return "?";
}

} // namespace shgo::ir
