// File: tests/unit/test_shell_parser.cpp
// Purpose: Verify the recursive-descent shell parser builds the expected
//          syntax tree shapes and reports syntax errors as MalformedSource.
// Key invariants: Pipelines and and-or lists nest to the left; elif chains
//                 nest in the else position.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/codemap.md

#include "frontends/shell/Parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace shgo::frontends::shell;
using shgo::support::ErrorKind;

namespace
{
SyntaxTree parseOk(std::string_view src)
{
    auto tree = parse(src, 1);
    EXPECT_TRUE(tree.hasValue()) << (tree ? "" : tree.error().message);
    if (!tree)
        return SyntaxTree{};
    return std::move(tree.value());
}

template <class T> const T &commandAs(const Stmt &stmt)
{
    return static_cast<const T &>(*stmt.cmd);
}
} // namespace

TEST(ShellParser, SimpleCommandsAndAssignments)
{
    const SyntaxTree tree = parseOk("NAME=\"World\"\necho \"Hello\" there\n");
    ASSERT_EQ(tree.stmts.size(), 2u);

    ASSERT_EQ(tree.stmts[0]->cmd->kind, CommandKind::Call);
    const auto &assign = commandAs<CallExpr>(*tree.stmts[0]);
    EXPECT_TRUE(assign.args.empty());
    ASSERT_EQ(assign.assigns.size(), 1u);
    EXPECT_EQ(assign.assigns[0].name, "NAME");
    EXPECT_TRUE(assign.assigns[0].hasValue);

    const auto &call = commandAs<CallExpr>(*tree.stmts[1]);
    ASSERT_EQ(call.args.size(), 3u);
    EXPECT_EQ(call.args[0].literal(), "echo");
    EXPECT_EQ(call.args[2].literal(), "there");
}

TEST(ShellParser, PipelinesNestToTheLeft)
{
    const SyntaxTree tree = parseOk("ls -la | grep \".sh\" | wc -l");
    ASSERT_EQ(tree.stmts.size(), 1u);
    ASSERT_EQ(tree.stmts[0]->cmd->kind, CommandKind::Binary);

    const auto &outer = commandAs<BinaryCmd>(*tree.stmts[0]);
    EXPECT_EQ(outer.op, BinaryOp::Pipe);
    ASSERT_EQ(outer.x->cmd->kind, CommandKind::Binary);
    EXPECT_EQ(commandAs<CallExpr>(*outer.y).args[0].literal(), "wc");

    const auto &inner = commandAs<BinaryCmd>(*outer.x);
    EXPECT_EQ(commandAs<CallExpr>(*inner.x).args[0].literal(), "ls");
    EXPECT_EQ(commandAs<CallExpr>(*inner.y).args[0].literal(), "grep");
}

TEST(ShellParser, AndOrBindsLooserThanPipe)
{
    const SyntaxTree tree = parseOk("a | b && c");
    const auto &andOr = commandAs<BinaryCmd>(*tree.stmts[0]);
    EXPECT_EQ(andOr.op, BinaryOp::AndStmt);
    EXPECT_EQ(commandAs<BinaryCmd>(*andOr.x).op, BinaryOp::Pipe);
}

TEST(ShellParser, ElifChainsNestInElsePosition)
{
    const SyntaxTree tree =
        parseOk("if a; then x; elif b; then y; elif c; then z; else w; fi\n");
    ASSERT_EQ(tree.stmts.size(), 1u);
    const auto *clause = &commandAs<IfClause>(*tree.stmts[0]);

    int elifs = 0;
    bool sawElse = false;
    for (clause = clause->elseClause.get(); clause; clause = clause->elseClause.get())
    {
        if (clause->isElse())
        {
            sawElse = true;
            ASSERT_EQ(clause->then.size(), 1u);
            EXPECT_EQ(commandAs<CallExpr>(*clause->then[0]).args[0].literal(), "w");
        }
        else
        {
            ++elifs;
        }
    }
    EXPECT_EQ(elifs, 2);
    EXPECT_TRUE(sawElse);
}

TEST(ShellParser, FunctionDeclarationSpellings)
{
    const SyntaxTree tree = parseOk("greet() { echo hi; }\nfunction bye { echo bye; }\n");
    ASSERT_EQ(tree.stmts.size(), 2u);

    const auto &first = commandAs<FuncDecl>(*tree.stmts[0]);
    EXPECT_EQ(first.name, "greet");
    EXPECT_FALSE(first.keyword);
    EXPECT_EQ(first.body->cmd->kind, CommandKind::Block);

    const auto &second = commandAs<FuncDecl>(*tree.stmts[1]);
    EXPECT_EQ(second.name, "bye");
    EXPECT_TRUE(second.keyword);
}

TEST(ShellParser, DeclarationBuiltinsBecomeDeclClauses)
{
    const SyntaxTree tree = parseOk("f() { local x=1 y; }\nexport PATH\n");
    const auto &fn = commandAs<FuncDecl>(*tree.stmts[0]);
    const auto &block = commandAs<Block>(*fn.body);
    ASSERT_EQ(block.stmts.size(), 1u);

    const auto &local = commandAs<DeclClause>(*block.stmts[0]);
    EXPECT_EQ(local.variant, "local");
    ASSERT_EQ(local.assigns.size(), 2u);
    EXPECT_TRUE(local.assigns[0].hasValue);
    EXPECT_FALSE(local.assigns[1].hasValue);

    const auto &exported = commandAs<DeclClause>(*tree.stmts[1]);
    EXPECT_EQ(exported.variant, "export");
    ASSERT_EQ(exported.assigns.size(), 1u);
    EXPECT_EQ(exported.assigns[0].name, "PATH");
}

TEST(ShellParser, ForLoopItemsAndRedirects)
{
    const SyntaxTree tree = parseOk("for f in a b c; do echo $f; done > out.txt\n");
    ASSERT_EQ(tree.stmts.size(), 1u);
    const Stmt &stmt = *tree.stmts[0];
    const auto &loop = commandAs<ForClause>(stmt);
    EXPECT_EQ(loop.name, "f");
    EXPECT_TRUE(loop.hasIn);
    EXPECT_EQ(loop.items.size(), 3u);
    ASSERT_EQ(stmt.redirs.size(), 1u);
    EXPECT_EQ(stmt.redirs[0].op, RedirOp::Out);
}

TEST(ShellParser, BackgroundAndNegation)
{
    const SyntaxTree tree = parseOk("sleep 1 &\n! grep -q x file\n");
    ASSERT_EQ(tree.stmts.size(), 2u);
    EXPECT_TRUE(tree.stmts[0]->background);
    EXPECT_TRUE(tree.stmts[1]->negated);
}

TEST(ShellParser, HeredocBodyIsSkipped)
{
    const SyntaxTree tree = parseOk("cat <<EOF\nhello $x\nEOF\necho done\n");
    ASSERT_EQ(tree.stmts.size(), 2u);
    ASSERT_EQ(tree.stmts[0]->redirs.size(), 1u);
    EXPECT_EQ(tree.stmts[0]->redirs[0].op, RedirOp::Heredoc);
    EXPECT_EQ(commandAs<CallExpr>(*tree.stmts[1]).args[0].literal(), "echo");
}

TEST(ShellParser, MissingFiIsMalformedSource)
{
    auto tree = parse("if true; then\n  echo yes\n", 7);
    ASSERT_FALSE(tree.hasValue());
    EXPECT_EQ(tree.error().kind, ErrorKind::MalformedSource);
    EXPECT_NE(tree.error().message.find("expected 'fi'"), std::string::npos);
    EXPECT_EQ(tree.error().loc.file_id, 7u);
}

TEST(ShellParser, StrayKeywordIsRejected)
{
    auto tree = parse("done\n", 1);
    ASSERT_FALSE(tree.hasValue());
    EXPECT_EQ(tree.error().kind, ErrorKind::MalformedSource);
    EXPECT_NE(tree.error().message.find("'done'"), std::string::npos);
}
