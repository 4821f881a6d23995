// File: tests/unit/test_go_generator.cpp
// Purpose: Verify the layout of generated Go files: header, sorted imports,
//          globals, helper selection, function order and main.
// Key invariants: Generation is deterministic and pulls in exactly the
//                 helpers and packages the lowered code references.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/codemap.md

#include "codegen/go/Collect.hpp"
#include "codegen/go/GoGenerator.hpp"
#include "driver/Transpiler.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace shgo;

namespace
{
std::string goFor(std::string_view src)
{
    auto go = driver::transpileSource(src, 1);
    EXPECT_TRUE(go.hasValue()) << (go ? "" : go.error().message);
    return go ? go.value() : std::string();
}

std::string importBlock(const std::string &go)
{
    const auto begin = go.find("import (\n");
    const auto end = go.find(")\n", begin);
    if (begin == std::string::npos || end == std::string::npos)
        return {};
    return go.substr(begin, end + 2 - begin);
}

bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}
} // namespace

TEST(GoGenerator, HelloWorldFile)
{
    const std::string go = goFor("NAME=\"World\"\necho \"Hello, $NAME!\"\n");

    const std::string head = "// Code generated by shgo. DO NOT EDIT.\n"
                             "\n"
                             "package main\n"
                             "\n"
                             "import (\n"
                             "\t\"errors\"\n"
                             "\t\"fmt\"\n"
                             "\t\"os\"\n"
                             ")\n"
                             "\n"
                             "var (\n"
                             "\tNAME = os.Getenv(\"NAME\")\n"
                             ")\n"
                             "\n"
                             "// shExitCode ";
    EXPECT_EQ(go.substr(0, head.size()), head);

    const std::string tail = "// shMain runs the script body.\n"
                             "func shMain() error {\n"
                             "\tNAME = \"World\"\n"
                             "\tfmt.Println(\"Hello, \" + NAME + \"!\")\n"
                             "\treturn nil\n"
                             "}\n"
                             "\n"
                             "func main() {\n"
                             "\tif err := shMain(); err != nil {\n"
                             "\t\tfmt.Fprintln(os.Stderr, \"error:\", err)\n"
                             "\t\tos.Exit(shExitCode(err))\n"
                             "\t}\n"
                             "}\n";
    ASSERT_GE(go.size(), tail.size());
    EXPECT_EQ(go.substr(go.size() - tail.size()), tail);

    const auto exitCode = go.find("func shExitCode(");
    const auto status = go.find("type shStatus int");
    ASSERT_NE(exitCode, std::string::npos);
    ASSERT_NE(status, std::string::npos);
    EXPECT_LT(exitCode, status);
    EXPECT_FALSE(contains(go, "shRun"));
}

TEST(GoGenerator, OutputIsDeterministic)
{
    const std::string src = "b=2\na=1\nf() { ls \"$1\"; }\ng() { ls x | wc -l; }\n"
                            "for i in {1..3}; do f $i & done\nwait\n";
    auto first = driver::transpileSource(src, 1);
    auto second = driver::transpileSource(src, 1);
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(first.value(), second.value());

    auto program = driver::lowerSource(src, 1);
    ASSERT_TRUE(program.hasValue());
    auto again = codegen::go::generate(program.value());
    auto once_more = codegen::go::generate(program.value());
    ASSERT_TRUE(again.hasValue());
    ASSERT_TRUE(once_more.hasValue());
    EXPECT_EQ(again.value(), once_more.value());
    EXPECT_EQ(again.value(), first.value());
}

TEST(GoGenerator, ImportsFollowHelpers)
{
    EXPECT_EQ(importBlock(goFor("ls -la\n")), "import (\n"
                                              "\t\"bytes\"\n"
                                              "\t\"errors\"\n"
                                              "\t\"fmt\"\n"
                                              "\t\"os\"\n"
                                              "\t\"os/exec\"\n"
                                              ")\n");

    EXPECT_EQ(importBlock(goFor("for i in {1..2}; do echo $i; done\n")), "import (\n"
                                                                          "\t\"errors\"\n"
                                                                          "\t\"fmt\"\n"
                                                                          "\t\"os\"\n"
                                                                          "\t\"strconv\"\n"
                                                                          ")\n");

    const std::string copy = goFor("cp a.txt b.txt\n");
    EXPECT_TRUE(contains(importBlock(copy), "\t\"path/filepath\"\n"));
    EXPECT_TRUE(contains(copy, "func shCopy(src, dst string) error {"));
}

TEST(GoGenerator, HelpersAreIncludedOnlyWhenUsed)
{
    const std::string go = goFor("echo hi\n");
    EXPECT_TRUE(contains(go, "func shExitCode(err error) int {"));
    EXPECT_TRUE(contains(go, "type shStatus int"));
    EXPECT_FALSE(contains(go, "func shGlob("));
    EXPECT_FALSE(contains(go, "func shRun("));
    EXPECT_FALSE(contains(go, "shOutstanding"));

    const std::string run = goFor("make all\n");
    EXPECT_TRUE(contains(run, "func shRun(name string, args ...string) error {"));
    EXPECT_TRUE(contains(run, "func shCommandError(name string, err error) error {"));
}

TEST(GoGenerator, GlobalsAreSortedAndAligned)
{
    const std::string go = goFor("a=1\nLONGNAME=2\nfunc=3\necho $a $LONGNAME $func\n");
    EXPECT_TRUE(contains(go, "var (\n"
                             "\tLONGNAME = os.Getenv(\"LONGNAME\")\n"
                             "\ta        = os.Getenv(\"a\")\n"
                             "\tv_func   = os.Getenv(\"func\")\n"
                             ")\n"))
        << go;
    EXPECT_TRUE(contains(go, "\tv_func = \"3\"\n"));
    EXPECT_TRUE(contains(go, "\tfmt.Println(a, LONGNAME, v_func)\n"));
}

TEST(GoGenerator, FunctionsPrecedeScriptBody)
{
    const std::string go = goFor("greet() {\n  echo \"Hello, $1\"\n}\n"
                                 "bye() { echo bye; }\n"
                                 "greet World\nbye\n");
    EXPECT_TRUE(contains(go, "// fn_greet runs the shell function \"greet\".\n"
                             "func fn_greet(args ...string) error {\n"
                             "\tfmt.Println(\"Hello, \" + shArg(args, 0))\n"
                             "\treturn nil\n"
                             "}\n"
                             "\n"
                             "// fn_bye runs the shell function \"bye\".\n"))
        << go;
    EXPECT_TRUE(contains(go, "\tif err := fn_greet(\"World\"); err != nil {\n"
                             "\t\treturn err\n"
                             "\t}\n"
                             "\tif err := fn_bye(); err != nil {\n"));
    EXPECT_LT(go.find("func fn_bye("), go.find("func shMain("));
}

TEST(GoGenerator, LocalsAreDeclaredPerFunction)
{
    const std::string go = goFor("f() { local a=1 b; echo $a; }\nf\n");
    EXPECT_TRUE(contains(go, "func fn_f(args ...string) error {\n"
                             "\tvar a, b string\n"
                             "\t_, _ = a, b\n"
                             "\ta = \"1\"\n"
                             "\tfmt.Println(a)\n"
                             "\treturn nil\n"
                             "}\n"))
        << go;
    EXPECT_FALSE(contains(go, "var (\n"));
}

TEST(GoGenerator, PositionalParametersInScriptBody)
{
    const std::string go = goFor("echo \"$1\" \"$#\" \"$0\"\nfor a in \"$@\"; do echo $a; done\n");
    EXPECT_TRUE(contains(go, "\tfmt.Println(shArg(os.Args, 1), strconv.Itoa(len(os.Args)-1), "
                             "os.Args[0])\n"))
        << go;
    EXPECT_TRUE(contains(go, "\tfor _, shItem := range os.Args[1:] {\n"));
}

TEST(GoGenerator, ReturnStatuses)
{
    const std::string go = goFor("f() { return 3; }\ng() { return $rc; }\nf\ng\n");
    EXPECT_TRUE(contains(go, "func fn_f(args ...string) error {\n"
                             "\treturn shStatus(3)\n"
                             "}\n"))
        << go;
    EXPECT_TRUE(contains(go, "\tif shCode := shAtoi(os.Getenv(\"rc\")); shCode != 0 {\n"
                             "\t\treturn shStatus(shCode)\n"
                             "\t}\n"
                             "\treturn nil\n"
                             "}\n"))
        << go;
}

TEST(GoGenerator, BackgroundJobsAreJoinedBeforeExit)
{
    const std::string go = goFor("sleep 1 &\n");
    EXPECT_TRUE(contains(go, "func main() {\n"
                             "\terr := shMain()\n"
                             "\tif werr := shOutstanding.Wait(); err == nil {\n"
                             "\t\terr = werr\n"
                             "\t}\n"
                             "\tif err != nil {\n"))
        << go;
    EXPECT_TRUE(contains(importBlock(go), "\t\"sync\"\n"));
}

TEST(GoGenerator, HelpersFollowStatementKinds)
{
    auto program = driver::lowerSource("ls\n(cd /tmp)\necho hi > f\nls | wc -l\nsleep 1 &\n", 1);
    ASSERT_TRUE(program.hasValue());
    const codegen::go::OsExecBackend backend{};
    const auto req = codegen::go::collectRequirements(program.value(), backend);
    EXPECT_TRUE(req.has("shRun"));
    EXPECT_TRUE(req.has("shPipeline"));
    EXPECT_TRUE(req.has("shSaveDir"));
    EXPECT_TRUE(req.has("shSwap"));
    EXPECT_TRUE(req.has("shOutstanding"));
    EXPECT_FALSE(req.has("shRestoreEnv"));
    EXPECT_FALSE(req.has("shGlob"));
}

TEST(GoGenerator, HelpersFollowCommandFlagsAndCapabilities)
{
    auto program = driver::lowerSource("ls\necho hi\n", 1);
    ASSERT_TRUE(program.hasValue());
    ir::Program &lowered = program.value();
    const codegen::go::OsExecBackend backend{};

    EXPECT_TRUE(codegen::go::collectRequirements(lowered, backend).has("shRun"));
    EXPECT_FALSE(codegen::go::collectRequirements(lowered, backend).has("shOutstanding"));

    lowered.statements[0].as<ir::Command>().useProcessHelper = false;
    lowered.capabilities.insert(ir::Capability::Concurrency);
    const auto req = codegen::go::collectRequirements(lowered, backend);
    EXPECT_FALSE(req.has("shRun"));
    EXPECT_TRUE(req.has("shOutstanding"));
}

TEST(GoGenerator, NestedOperandsArePrintedCompactly)
{
    const std::string go = goFor("a=1\nb=2\nd=src\n"
                                 "echo \"$a\" \"x$b\"\n"
                                 "echo \"x$b\"\n"
                                 "if [ \"$a\" = \"x$b\" ]; then echo same; fi\n"
                                 "cp \"$d/a\" b\n");
    EXPECT_TRUE(contains(go, "\tfmt.Println(a, \"x\"+b)\n")) << go;
    EXPECT_TRUE(contains(go, "\tfmt.Println(\"x\" + b)\n")) << go;
    EXPECT_TRUE(contains(go, "\tif a == \"x\"+b {\n")) << go;
    EXPECT_TRUE(contains(go, "\tif err := shCopy(d+\"/a\", \"b\"); err != nil {\n")) << go;
}

TEST(GoGenerator, UnsupportedStatementsAbortGeneration)
{
    auto subst = driver::transpileSource("echo $(date)\n", 1);
    ASSERT_FALSE(subst.hasValue());
    EXPECT_EQ(subst.error().kind, support::ErrorKind::UnsupportedConstruct);
    EXPECT_EQ(subst.error().message, "unsupported construct: command substitution '$(date)'");
    EXPECT_EQ(subst.error().loc.line, 1u);

    auto ret = driver::transpileSource("f() { { return 1; } > out; }\n", 1);
    ASSERT_FALSE(ret.hasValue());
    EXPECT_EQ(ret.error().message,
              "unsupported construct: 'return' inside a redirected or negated block or a condition");

    auto jump = driver::transpileSource("for x in a; do ( break ); done\n", 1);
    ASSERT_FALSE(jump.hasValue());
    EXPECT_EQ(jump.error().message,
              "unsupported construct: 'break' outside a loop of the same function literal");
}

TEST(GoGenerator, CollidingFunctionNamesAreRejected)
{
    auto go = driver::transpileSource("a-b() { :; }\na_x2d_b() { :; }\n", 1);
    ASSERT_FALSE(go.hasValue());
    EXPECT_EQ(go.error().kind, support::ErrorKind::UnsupportedConstruct);
}
