//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Collection pass of the Go generator.

#include "codegen/go/Collect.hpp"

#include "ir/Builtins.hpp"

namespace shgo::codegen::go
{
namespace
{
const char *numericOperator(const std::string &op)
{
    if (op == "-eq")
        return "==";
    if (op == "-ne")
        return "!=";
    if (op == "-lt")
        return "<";
    if (op == "-le")
        return "<=";
    if (op == "-gt")
        return ">";
    if (op == "-ge")
        return ">=";
    return nullptr;
}

std::string literalOp(const ir::Word *word)
{
    return word->isLiteral() ? word->literalText() : "";
}

void assignedBy(const ir::Statement &stmt, std::set<std::string> &names, bool &exports)
{
    switch (stmt.kind())
    {
        case ir::StatementKind::Assignment:
        {
            const auto &assign = stmt.as<ir::Assignment>();
            names.insert(assign.name);
            exports = exports || assign.isExport;
            return;
        }
        case ir::StatementKind::Command:
        {
            const auto &cmd = stmt.as<ir::Command>();
            if (cmd.cls != ir::CommandClass::Builtin)
                return;
            if (cmd.name == "export")
            {
                exports = true;
                return;
            }
            if (cmd.name != "read")
                return;
            bool any = false;
            for (const auto &arg : cmd.args)
            {
                const std::string text = arg.literalText();
                if (arg.isLiteral() && !text.empty() && text.front() != '-')
                {
                    names.insert(text);
                    any = true;
                }
            }
            if (!any)
                names.insert("REPLY");
            return;
        }
        case ir::StatementKind::Conditional:
        {
            const auto &cond = stmt.as<ir::Conditional>();
            collectAssigned(cond.condition, names, exports);
            collectAssigned(cond.thenBranch, names, exports);
            for (const auto &elif : cond.elifs)
            {
                collectAssigned(elif.condition, names, exports);
                collectAssigned(elif.body, names, exports);
            }
            collectAssigned(cond.elseBranch, names, exports);
            return;
        }
        case ir::StatementKind::Loop:
        {
            const auto &loop = stmt.as<ir::Loop>();
            if (!loop.var.empty())
                names.insert(loop.var);
            collectAssigned(loop.condition, names, exports);
            collectAssigned(loop.body, names, exports);
            return;
        }
        case ir::StatementKind::Redirection:
            assignedBy(*stmt.as<ir::Redirection>().statement, names, exports);
            return;
        case ir::StatementKind::Background:
            assignedBy(*stmt.as<ir::Background>().statement, names, exports);
            return;
        case ir::StatementKind::Group:
            collectAssigned(stmt.as<ir::Group>().body, names, exports);
            return;
        case ir::StatementKind::Subshell:
        case ir::StatementKind::Pipeline:
        case ir::StatementKind::Return:
        case ir::StatementKind::FunctionDecl:
            return;
    }
}

class Collector
{
  public:
    Collector(const ProcessBackend &backend, Requirements &req) : backend_(backend), req_(req) {}

    void visit(const ir::StatementList &stmts)
    {
        for (const auto &stmt : stmts)
            visit(stmt);
    }

    void visit(const ir::Statement &stmt)
    {
        switch (stmt.kind())
        {
            case ir::StatementKind::Command:
                visitCommand(stmt.as<ir::Command>());
                return;
            case ir::StatementKind::Conditional:
            {
                const auto &cond = stmt.as<ir::Conditional>();
                visit(cond.condition);
                visit(cond.thenBranch);
                for (const auto &elif : cond.elifs)
                {
                    visit(elif.condition);
                    visit(elif.body);
                }
                visit(cond.elseBranch);
                return;
            }
            case ir::StatementKind::Loop:
            {
                const auto &loop = stmt.as<ir::Loop>();
                if (loop.kind == ir::LoopKind::CountedRange)
                    req_.import("strconv");
                visit(loop.condition);
                visit(loop.body);
                return;
            }
            case ir::StatementKind::Pipeline:
                backend_.requirePipeline(req_);
                return;
            case ir::StatementKind::Subshell:
            {
                const auto &sub = stmt.as<ir::Subshell>();
                std::set<std::string> names;
                bool exports = false;
                collectAssigned(sub.body, names, exports);
                req_.require("shSaveDir");
                if (exports)
                    req_.require("shRestoreEnv");
                visit(sub.body);
                return;
            }
            case ir::StatementKind::Redirection:
                req_.require("shSwap");
                visit(*stmt.as<ir::Redirection>().statement);
                return;
            case ir::StatementKind::Background:
                visit(*stmt.as<ir::Background>().statement);
                return;
            case ir::StatementKind::Group:
                visit(stmt.as<ir::Group>().body);
                return;
            case ir::StatementKind::Assignment:
            case ir::StatementKind::Return:
            case ir::StatementKind::FunctionDecl:
                return;
        }
    }

  private:
    void visitCommand(const ir::Command &cmd)
    {
        if (cmd.cls == ir::CommandClass::External)
        {
            if (cmd.useProcessHelper)
                backend_.requireCommand(req_);
            return;
        }
        if (cmd.cls != ir::CommandClass::Builtin)
            return;

        const auto builtin = ir::lookupBuiltin(cmd.name);
        if (!builtin)
            return;
        switch (*builtin)
        {
            case ir::Builtin::Pwd:
                req_.require("shPwd");
                return;
            case ir::Builtin::Cp:
                req_.require("shCopy");
                return;
            case ir::Builtin::Read:
                req_.require("shRead");
                return;
            case ir::Builtin::Printf:
                req_.require("shPrintf");
                return;
            case ir::Builtin::Test:
                switch (matchTest(cmd).kind)
                {
                    case TestForm::Kind::Spawn:
                        backend_.requireCommand(req_);
                        return;
                    case TestForm::Kind::File:
                        req_.require("shTestFile");
                        return;
                    case TestForm::Kind::Numeric:
                        req_.require("shAtoi");
                        return;
                    default:
                        return;
                }
            default:
                return;
        }
    }

    const ProcessBackend &backend_;
    Requirements &req_;
};
} // namespace

TestForm matchTest(const ir::Command &cmd)
{
    TestForm form;
    std::vector<const ir::Word *> ops;
    for (const auto &arg : cmd.args)
        ops.push_back(&arg);
    if (cmd.name == "[")
    {
        if (ops.empty() || literalOp(ops.back()) != "]")
            return form;
        ops.pop_back();
    }

    std::vector<std::string> texts;
    for (const ir::Word *op : ops)
        texts.push_back(op->isLiteral() ? op->literalText() : op->text());
    const ir::ConditionCategory category = ir::inferConditionCategory(texts);

    if (ops.size() > 1 && literalOp(ops.front()) == "!")
    {
        form.negate = true;
        ops.erase(ops.begin());
    }

    switch (category)
    {
        case ir::ConditionCategory::FileTest:
        {
            const std::string op = ops.size() == 2 ? literalOp(ops[0]) : "";
            if (op == "-f" || op == "-d" || op == "-e")
            {
                form.kind = TestForm::Kind::File;
                form.op = op;
                form.operands = {ops[1]};
            }
            break;
        }
        case ir::ConditionCategory::StringTest:
            if (ops.size() == 2)
            {
                const std::string op = literalOp(ops[0]);
                if (op == "-z")
                    form.kind = TestForm::Kind::Empty;
                else if (op == "-n")
                    form.kind = TestForm::Kind::NonEmpty;
                form.operands = {ops[1]};
            }
            else if (ops.size() == 3)
            {
                const std::string op = literalOp(ops[1]);
                if (op == "=" || op == "==")
                    form.kind = TestForm::Kind::Equal;
                else if (op == "!=")
                    form.kind = TestForm::Kind::NotEqual;
                form.operands = {ops[0], ops[2]};
            }
            break;
        case ir::ConditionCategory::NumericTest:
        {
            const char *op = ops.size() == 3 ? numericOperator(literalOp(ops[1])) : nullptr;
            if (op != nullptr)
            {
                form.kind = TestForm::Kind::Numeric;
                form.op = op;
                form.operands = {ops[0], ops[2]};
            }
            break;
        }
        case ir::ConditionCategory::GenericCommand:
            break;
    }

    if (form.kind == TestForm::Kind::Spawn)
    {
        form.operands.clear();
        form.negate = false;
    }
    return form;
}

void collectAssigned(const ir::StatementList &stmts, std::set<std::string> &names, bool &exports)
{
    for (const auto &stmt : stmts)
        assignedBy(stmt, names, exports);
}

Requirements collectRequirements(const ir::Program &program, const ProcessBackend &backend)
{
    Requirements req;
    if (program.capabilities.count(ir::Capability::Concurrency) != 0)
        req.require("shOutstanding");

    Collector collector(backend, req);
    for (const auto &fn : program.functions())
        collector.visit(fn.body);
    collector.visit(program.statements);
    return req;
}

} // namespace shgo::codegen::go
