// File: tests/unit/test_ir_builder.cpp
// Purpose: Verify lowering of shell syntax trees into the IR: pipeline
//          flattening, conditional linearization, command classification,
//          capability collection and rejection of unsupported constructs.
// Key invariants: A failed build yields an UnsupportedConstruct diagnostic
//                 and no Program.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/codemap.md

#include "frontends/shell/Parser.hpp"
#include "ir/IRBuilder.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace shgo;
using namespace shgo::ir;

namespace
{
support::Expected<Program> lower(std::string_view src)
{
    auto tree = frontends::shell::parse(src, 1);
    if (!tree)
        return tree.error();
    return ir::build(tree.value());
}

Program lowerOk(std::string_view src)
{
    auto program = lower(src);
    EXPECT_TRUE(program.hasValue()) << (program ? "" : program.error().message);
    if (!program)
        return Program{};
    return std::move(program.value());
}

std::string lowerError(std::string_view src)
{
    auto program = lower(src);
    EXPECT_FALSE(program.hasValue());
    if (program)
        return {};
    EXPECT_EQ(program.error().kind, support::ErrorKind::UnsupportedConstruct);
    return program.error().message;
}

bool hasCap(const Program &program, Capability cap)
{
    return program.capabilities.count(cap) != 0;
}
} // namespace

TEST(IRBuilder, PipelinesFlattenInSourceOrder)
{
    const Program program = lowerOk("ls -la | grep \".sh\" | sort | wc -l\n");
    ASSERT_EQ(program.statements.size(), 1u);
    ASSERT_EQ(program.statements[0].kind(), StatementKind::Pipeline);

    const auto &pipe = program.statements[0].as<Pipeline>();
    ASSERT_EQ(pipe.stages.size(), 4u);
    EXPECT_EQ(pipe.stages[0].name, "ls");
    EXPECT_EQ(pipe.stages[1].name, "grep");
    EXPECT_EQ(pipe.stages[2].name, "sort");
    EXPECT_EQ(pipe.stages[3].name, "wc");
    for (const auto &stage : pipe.stages)
    {
        EXPECT_EQ(stage.cls, CommandClass::External);
        EXPECT_TRUE(stage.useProcessHelper);
    }
    EXPECT_EQ(pipe.stages[1].args[0].literalText(), ".sh");
    EXPECT_TRUE(hasCap(program, Capability::SpawnsProcesses));
}

TEST(IRBuilder, PipelinesOfAnyLength)
{
    for (std::size_t n = 0; n <= 5; ++n)
    {
        std::string src;
        for (std::size_t i = 0; i < n; ++i)
            src += (i == 0 ? "" : " | ") + std::string("stage") + std::to_string(i) + " -v";
        src += "\n";

        SCOPED_TRACE(src);
        const Program program = lowerOk(src);
        if (n == 0)
        {
            EXPECT_TRUE(program.statements.empty());
            continue;
        }
        ASSERT_EQ(program.statements.size(), 1u);
        if (n == 1)
        {
            ASSERT_EQ(program.statements[0].kind(), StatementKind::Command);
            EXPECT_EQ(program.statements[0].as<Command>().name, "stage0");
            continue;
        }
        ASSERT_EQ(program.statements[0].kind(), StatementKind::Pipeline);
        const auto &pipe = program.statements[0].as<Pipeline>();
        ASSERT_EQ(pipe.stages.size(), n);
        for (std::size_t i = 0; i < n; ++i)
        {
            EXPECT_EQ(pipe.stages[i].name, "stage" + std::to_string(i));
            ASSERT_EQ(pipe.stages[i].args.size(), 1u);
            EXPECT_EQ(pipe.stages[i].args[0].literalText(), "-v");
        }
    }
}

TEST(IRBuilder, BuiltinStageRunsAsProgram)
{
    const Program program = lowerOk("echo hi | tr a-z A-Z\n");
    const auto &pipe = program.statements[0].as<Pipeline>();
    ASSERT_EQ(pipe.stages.size(), 2u);
    EXPECT_EQ(pipe.stages[0].cls, CommandClass::External);
    EXPECT_TRUE(pipe.stages[0].useProcessHelper);
}

TEST(IRBuilder, ElifChainIsLinearized)
{
    const Program program = lowerOk("if [ -f a ]; then echo a\n"
                                    "elif [ -d b ]; then echo b\n"
                                    "elif [ -z \"$c\" ]; then echo c\n"
                                    "else echo none\n"
                                    "fi\n");
    ASSERT_EQ(program.statements.size(), 1u);
    const auto &cond = program.statements[0].as<Conditional>();
    EXPECT_EQ(cond.category, ConditionCategory::FileTest);
    ASSERT_EQ(cond.elifs.size(), 2u);
    ASSERT_EQ(cond.elseBranch.size(), 1u);
    EXPECT_EQ(cond.elseBranch[0].as<Command>().args[0].literalText(), "none");
    ASSERT_EQ(cond.elifs[1].body.size(), 1u);
    EXPECT_EQ(cond.elifs[1].body[0].as<Command>().args[0].literalText(), "c");
}

TEST(IRBuilder, ElifChainsOfAnyLength)
{
    for (std::size_t k = 0; k <= 4; ++k)
    {
        std::string src = "if [ -f a0 ]; then echo b0\n";
        for (std::size_t i = 1; i <= k; ++i)
        {
            const std::string n = std::to_string(i);
            src += "elif [ -f a" + n + " ]; then echo b" + n + "\n";
        }
        src += "else echo none\nfi\n";

        SCOPED_TRACE(src);
        const Program program = lowerOk(src);
        ASSERT_EQ(program.statements.size(), 1u);
        const auto &cond = program.statements[0].as<Conditional>();
        ASSERT_EQ(cond.elifs.size(), k);
        ASSERT_EQ(cond.thenBranch.size(), 1u);
        EXPECT_EQ(cond.thenBranch[0].as<Command>().args[0].literalText(), "b0");
        for (std::size_t i = 0; i < k; ++i)
        {
            const std::string n = std::to_string(i + 1);
            ASSERT_EQ(cond.elifs[i].condition.size(), 1u);
            EXPECT_EQ(cond.elifs[i].condition[0].as<Command>().args[1].literalText(), "a" + n);
            ASSERT_EQ(cond.elifs[i].body.size(), 1u);
            EXPECT_EQ(cond.elifs[i].body[0].as<Command>().args[0].literalText(), "b" + n);
        }
        ASSERT_EQ(cond.elseBranch.size(), 1u);
        EXPECT_EQ(cond.elseBranch[0].as<Command>().args[0].literalText(), "none");
    }
}

TEST(IRBuilder, ConditionCategoryFollowsTestOperator)
{
    auto categoryOf = [](std::string_view src)
    {
        const Program program = lowerOk(src);
        return program.statements.at(0).as<Conditional>().category;
    };
    EXPECT_EQ(categoryOf("if [ -d dir ]; then :; fi"), ConditionCategory::FileTest);
    EXPECT_EQ(categoryOf("if test -n \"$x\"; then :; fi"), ConditionCategory::StringTest);
    EXPECT_EQ(categoryOf("if [ \"$a\" = \"$b\" ]; then :; fi"), ConditionCategory::StringTest);
    EXPECT_EQ(categoryOf("if [ \"$n\" -lt 10 ]; then :; fi"), ConditionCategory::NumericTest);
    EXPECT_EQ(categoryOf("if [ ! -e f ]; then :; fi"), ConditionCategory::FileTest);
    EXPECT_EQ(categoryOf("if grep -q x f; then :; fi"), ConditionCategory::GenericCommand);
}

TEST(IRBuilder, CommandsAreClassified)
{
    const Program program = lowerOk("greet() { echo hi; }\ngreet\necho x\nls\n");
    ASSERT_EQ(program.statements.size(), 4u);
    EXPECT_EQ(program.statements[0].kind(), StatementKind::FunctionDecl);

    const auto &call = program.statements[1].as<Command>();
    EXPECT_EQ(call.cls, CommandClass::Function);
    EXPECT_FALSE(call.useProcessHelper);

    const auto &echo = program.statements[2].as<Command>();
    EXPECT_EQ(echo.cls, CommandClass::Builtin);
    EXPECT_FALSE(echo.useProcessHelper);

    const auto &ls = program.statements[3].as<Command>();
    EXPECT_EQ(ls.cls, CommandClass::External);
    EXPECT_TRUE(ls.useProcessHelper);
}

TEST(IRBuilder, FunctionCalledBeforeDeclarationIsStillAFunction)
{
    const Program program = lowerOk("main\nmain() { echo run; }\n");
    EXPECT_EQ(program.statements[0].as<Command>().cls, CommandClass::Function);
}

TEST(IRBuilder, CapabilitiesAreCollected)
{
    const Program program = lowerOk("cd /tmp\nmkdir -p out\nexport PATH\nread line\n");
    EXPECT_TRUE(hasCap(program, Capability::ChangesDirectory));
    EXPECT_TRUE(hasCap(program, Capability::FilesystemIO));
    EXPECT_TRUE(hasCap(program, Capability::MutatesEnvironment));
    EXPECT_TRUE(hasCap(program, Capability::ReadsInput));
    EXPECT_FALSE(hasCap(program, Capability::SpawnsProcesses));
    EXPECT_FALSE(hasCap(program, Capability::Concurrency));

    const Program empty = lowerOk("echo hi\n");
    EXPECT_TRUE(empty.capabilities.empty());
}

TEST(IRBuilder, BackgroundAddsConcurrency)
{
    const Program program = lowerOk("sleep 1 &\nwait\n");
    ASSERT_EQ(program.statements.size(), 2u);
    ASSERT_EQ(program.statements[0].kind(), StatementKind::Background);
    const auto &bg = program.statements[0].as<Background>();
    EXPECT_EQ(bg.statement->as<Command>().name, "sleep");
    EXPECT_TRUE(hasCap(program, Capability::Concurrency));
}

TEST(IRBuilder, VariablesRecordLastKnownValue)
{
    const Program program = lowerOk("NAME=\"World\"\nGREETING=\"Hello, $NAME\"\nNAME=x\n");
    ASSERT_EQ(program.variables.size(), 2u);
    EXPECT_EQ(program.variables.at("NAME"), "x");
    EXPECT_EQ(program.variables.at("GREETING"), "Hello, ${NAME}");

    const auto &assign = program.statements[1].as<Assignment>();
    ASSERT_TRUE(assign.value.has_value());
    EXPECT_FALSE(assign.value->isLiteral());
    EXPECT_FALSE(assign.value->splittable);
}

TEST(IRBuilder, FunctionParamsAndLocals)
{
    const Program program =
        lowerOk("copy() {\n  local src=\"$1\" dst\n  dst=\"$2\"\n  echo \"$@\" \"${10}\"\n}\n");
    ASSERT_EQ(program.functions().size(), 1u);
    const Function *fn = program.findFunction("copy");
    ASSERT_NE(fn, nullptr);

    ASSERT_EQ(fn->params.size(), 4u);
    EXPECT_EQ(fn->params[0], "1");
    EXPECT_EQ(fn->params[1], "2");
    EXPECT_EQ(fn->params[2], "10");
    EXPECT_EQ(fn->params[3], "@");

    EXPECT_EQ(fn->locals.size(), 2u);
    EXPECT_EQ(fn->locals.count("src"), 1u);
    EXPECT_EQ(fn->locals.count("dst"), 1u);
    EXPECT_TRUE(program.variables.empty());
}

TEST(IRBuilder, LoopVariablesAndReadTargetsAreBound)
{
    const Program program = lowerOk("for f in *.txt; do echo $f; done\nread\n");
    EXPECT_EQ(program.variables.count("f"), 1u);
    EXPECT_EQ(program.variables.count("REPLY"), 1u);

    const auto &loop = program.statements[0].as<Loop>();
    EXPECT_EQ(loop.kind, LoopKind::IterateList);
    ASSERT_EQ(loop.items.size(), 1u);
    EXPECT_TRUE(loop.items[0].glob);
}

TEST(IRBuilder, RangeAndPositionalLoops)
{
    const Program program = lowerOk("for i in {1..5}; do echo $i; done\n"
                                    "f() { for a; do echo $a; done; }\n");
    const auto &range = program.statements[0].as<Loop>();
    EXPECT_EQ(range.kind, LoopKind::CountedRange);
    EXPECT_EQ(range.var, "i");
    EXPECT_EQ(range.from, 1);
    EXPECT_EQ(range.to, 5);

    const Function *fn = program.findFunction("f");
    ASSERT_NE(fn, nullptr);
    const auto &all = fn->body.at(0).as<Loop>();
    EXPECT_EQ(all.kind, LoopKind::IterateList);
    ASSERT_EQ(all.items.size(), 1u);
    EXPECT_EQ(all.items[0].text(), "${@}");
    EXPECT_TRUE(all.items[0].splittable);
    ASSERT_EQ(fn->params.size(), 1u);
    EXPECT_EQ(fn->params[0], "@");
}

TEST(IRBuilder, FirstRedirectionIsOutermost)
{
    const Program program = lowerOk("cmd > out.log 2>&1\n");
    ASSERT_EQ(program.statements.size(), 1u);
    const auto &outer = program.statements[0].as<Redirection>();
    EXPECT_EQ(outer.op, RedirectOp::TruncateWrite);
    EXPECT_EQ(outer.fd, 1);
    EXPECT_EQ(outer.target.literalText(), "out.log");

    const auto &inner = outer.statement->as<Redirection>();
    EXPECT_EQ(inner.op, RedirectOp::Duplicate);
    EXPECT_EQ(inner.fd, 2);
    EXPECT_EQ(inner.dupFd, 1);
    EXPECT_EQ(inner.statement->as<Command>().name, "cmd");
}

TEST(IRBuilder, ReturnCodesWrapAtEightBits)
{
    const Program program = lowerOk("f() { return 300; }\ng() { return $rc; }\nh() { return; }\n");
    const auto &f = program.findFunction("f")->body.at(0).as<Return>();
    ASSERT_TRUE(f.code.has_value());
    EXPECT_EQ(*f.code, 44);

    const auto &g = program.findFunction("g")->body.at(0).as<Return>();
    EXPECT_FALSE(g.code.has_value());
    ASSERT_TRUE(g.value.has_value());
    EXPECT_EQ(g.value->text(), "${rc}");

    const auto &h = program.findFunction("h")->body.at(0).as<Return>();
    EXPECT_FALSE(h.code.has_value());
    EXPECT_FALSE(h.value.has_value());
}

TEST(IRBuilder, AndListOutsideConditionHasNoElse)
{
    const Program program = lowerOk("mkdir out && cd out || echo failed\n");
    const auto &orList = program.statements[0].as<Conditional>();
    ASSERT_EQ(orList.elseBranch.size(), 1u);
    EXPECT_TRUE(orList.thenBranch.empty());

    // The left side of `||` is itself a condition, so its `&&` is strict.
    ASSERT_EQ(orList.condition.size(), 1u);
    const auto &andList = orList.condition[0].as<Conditional>();
    ASSERT_EQ(andList.elseBranch.size(), 1u);
    EXPECT_EQ(andList.elseBranch[0].as<Command>().name, "false");

    const Program plain = lowerOk("true && echo yes\n");
    EXPECT_TRUE(plain.statements[0].as<Conditional>().elseBranch.empty());
}

TEST(IRBuilder, NegationAndSubshell)
{
    const Program program = lowerOk("! grep -q x f\n(cd /tmp; ls)\n");
    EXPECT_TRUE(program.statements[0].negated);
    ASSERT_EQ(program.statements[1].kind(), StatementKind::Subshell);
    EXPECT_EQ(program.statements[1].as<Subshell>().body.size(), 2u);
}

TEST(IRBuilder, UnsupportedConstructsAreRejected)
{
    EXPECT_EQ(lowerError("case $x in a) echo a;; esac\n"), "unsupported construct: case clause");
    EXPECT_EQ(lowerError("(( i++ ))\n"), "unsupported construct: arithmetic command");
    EXPECT_EQ(lowerError("[[ -f x ]]\n"), "unsupported construct: test clause");
    EXPECT_EQ(lowerError("eval \"$cmd\"\n"), "unsupported construct: shell builtin 'eval'");
    EXPECT_EQ(lowerError("echo ${x:-d}\n"),
              "unsupported construct: parameter expansion '${x:-d}'");
    EXPECT_EQ(lowerError("echo $?\n"), "unsupported construct: special parameter '$?'");
    EXPECT_EQ(lowerError("for ((i=0; i<3; i++)); do echo; done\n"),
              "unsupported construct: C-style for loop");
    EXPECT_EQ(lowerError("FOO=1 make\n"),
              "unsupported construct: environment assignment prefix on command 'make'");
    EXPECT_EQ(lowerError("break\n"), "unsupported construct: 'break' outside a loop");
    EXPECT_EQ(lowerError("local x=1\n"), "unsupported construct: 'local' outside a function");
    EXPECT_EQ(lowerError("f() { :; }\nf() { :; }\n"),
              "unsupported construct: redefinition of function 'f'");
}

TEST(IRBuilder, UnsupportedInsideFunctionFailsWholeBuild)
{
    auto program = lower("ok() { echo fine; }\nbad() { case $1 in *) ;; esac; }\n");
    ASSERT_FALSE(program.hasValue());
    EXPECT_EQ(program.error().loc.line, 2u);
}
