// File: tests/unit/test_go_names.cpp
// Purpose: Verify Go string quoting and the shell-to-Go identifier mapping.
// Key invariants: Quoted output is always a valid Go string literal; mapped
//                 names never collide with Go or generator identifiers.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/codemap.md

#include "codegen/go/GoNames.hpp"

#include <gtest/gtest.h>

using namespace shgo::codegen::go;

TEST(GoNames, QuotesSpecialCharacters)
{
    EXPECT_EQ(goQuote("plain"), "\"plain\"");
    EXPECT_EQ(goQuote("say \"hi\""), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(goQuote("a\\b"), "\"a\\\\b\"");
    EXPECT_EQ(goQuote("line\n\ttab\r"), "\"line\\n\\ttab\\r\"");
    EXPECT_EQ(goQuote(std::string("nul\0bell\x07", 9)), "\"nul\\x00bell\\x07\"");
    EXPECT_EQ(goQuote("\x7f"), "\"\\x7f\"");
    EXPECT_EQ(goQuote(""), "\"\"");
}

TEST(GoNames, KeepsValidUtf8AndEscapesInvalidBytes)
{
    EXPECT_EQ(goQuote("caf\xc3\xa9"), "\"caf\xc3\xa9\"");
    EXPECT_EQ(goQuote("\xe2\x9c\x93 ok"), "\"\xe2\x9c\x93 ok\"");
    // A lone continuation byte and a truncated sequence.
    EXPECT_EQ(goQuote("\x80"), "\"\\x80\"");
    EXPECT_EQ(goQuote("\xc3"), "\"\\xc3\"");
    // Overlong encoding of '/'.
    EXPECT_EQ(goQuote("\xc0\xaf"), "\"\\xc0\\xaf\"");
}

TEST(GoNames, VariableNamesAvoidCollisions)
{
    EXPECT_EQ(variableName("NAME"), "NAME");
    EXPECT_EQ(variableName("count"), "count");
    EXPECT_EQ(variableName("shell"), "shell");

    EXPECT_EQ(variableName("func"), "v_func");
    EXPECT_EQ(variableName("string"), "v_string");
    EXPECT_EQ(variableName("len"), "v_len");
    EXPECT_EQ(variableName("os"), "v_os");
    EXPECT_EQ(variableName("err"), "v_err");
    EXPECT_EQ(variableName("args"), "v_args");
    EXPECT_EQ(variableName("shN"), "v_shN");
    EXPECT_EQ(variableName("sh"), "v_sh");
    EXPECT_EQ(variableName("fn_x"), "v_fn_x");
    EXPECT_EQ(variableName("v_x"), "v_v_x");
    EXPECT_EQ(variableName("_"), "v__");
}

TEST(GoNames, KeywordTables)
{
    EXPECT_TRUE(isGoKeyword("fallthrough"));
    EXPECT_FALSE(isGoKeyword("string"));
    EXPECT_TRUE(isGoPredeclared("string"));
    EXPECT_TRUE(isGoPredeclared("nil"));
    EXPECT_FALSE(isGoPredeclared("NAME"));
}

TEST(GoNames, FunctionNamesEscapeNonIdentifierBytes)
{
    EXPECT_EQ(functionName("greet"), "fn_greet");
    EXPECT_EQ(functionName("do-build"), "fn_do_x2d_build");
    EXPECT_EQ(functionName("a.b"), "fn_a_x2e_b");
    EXPECT_NE(functionName("a-b"), functionName("a_b"));
}
