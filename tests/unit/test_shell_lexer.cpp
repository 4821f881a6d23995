// File: tests/unit/test_shell_lexer.cpp
// Purpose: Verify shell tokenization: operators, redirections with descriptor
//          prefixes, quoting and expansion parts, comments and positions.
// Key invariants: Word tokens carry at least one part; positions are 1-based.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/codemap.md

#include "frontends/shell/Lexer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace shgo::frontends::shell;

namespace
{
std::vector<Token> lexAll(std::string_view src)
{
    Lexer lexer(src, 1);
    std::vector<Token> tokens;
    while (true)
    {
        tokens.push_back(lexer.next());
        if (tokens.back().kind == TokenKind::EndOfFile)
            break;
    }
    return tokens;
}

std::vector<TokenKind> kinds(const std::vector<Token> &tokens)
{
    std::vector<TokenKind> out;
    for (const auto &tok : tokens)
        out.push_back(tok.kind);
    return out;
}
} // namespace

TEST(ShellLexer, ControlOperators)
{
    const auto tokens = lexAll("a && b || c | d; e &");
    const std::vector<TokenKind> expected{TokenKind::Word,   TokenKind::AndAnd, TokenKind::Word,
                                          TokenKind::OrOr,   TokenKind::Word,   TokenKind::Pipe,
                                          TokenKind::Word,   TokenKind::Semi,   TokenKind::Word,
                                          TokenKind::Amp,    TokenKind::EndOfFile};
    EXPECT_EQ(kinds(tokens), expected);
}

TEST(ShellLexer, RedirectionsKeepDescriptorPrefix)
{
    const auto tokens = lexAll("cmd 2>&1 >> log < in");
    ASSERT_EQ(tokens.size(), 8u);

    EXPECT_EQ(tokens[1].kind, TokenKind::Redirect);
    EXPECT_EQ(tokens[1].redir, RedirOp::DupOut);
    EXPECT_EQ(tokens[1].fd, 2);
    EXPECT_EQ(tokens[2].word.literal(), "1");

    EXPECT_EQ(tokens[3].redir, RedirOp::Append);
    EXPECT_EQ(tokens[3].fd, -1);
    EXPECT_EQ(tokens[4].word.literal(), "log");

    EXPECT_EQ(tokens[5].redir, RedirOp::In);
    EXPECT_EQ(tokens[6].word.literal(), "in");
}

TEST(ShellLexer, DigitsWithoutRedirectAreWords)
{
    const auto tokens = lexAll("echo 42");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].kind, TokenKind::Word);
    EXPECT_EQ(tokens[1].word.literal(), "42");
}

TEST(ShellLexer, DoubleQuotedStringSplitsIntoParts)
{
    const auto tokens = lexAll("echo \"Hello, $NAME!\"");
    ASSERT_EQ(tokens.size(), 3u);
    const Word &word = tokens[1].word;
    ASSERT_EQ(word.parts.size(), 1u);
    ASSERT_EQ(word.parts[0]->kind, WordPartKind::DblQuoted);

    const auto &dq = static_cast<const DblQuotedPart &>(*word.parts[0]);
    ASSERT_EQ(dq.parts.size(), 3u);
    EXPECT_EQ(static_cast<const LitPart &>(*dq.parts[0]).value, "Hello, ");
    ASSERT_EQ(dq.parts[1]->kind, WordPartKind::ParamExp);
    EXPECT_EQ(static_cast<const ParamExpPart &>(*dq.parts[1]).name, "NAME");
    EXPECT_EQ(static_cast<const LitPart &>(*dq.parts[2]).value, "!");
}

TEST(ShellLexer, BracedExpansionWithModifierIsNotSimple)
{
    const auto tokens = lexAll("echo ${x:-default} ${#y}");
    ASSERT_EQ(tokens.size(), 4u);

    const auto &withDefault = static_cast<const ParamExpPart &>(*tokens[1].word.parts[0]);
    EXPECT_EQ(withDefault.name, "x");
    EXPECT_EQ(withDefault.modifier, ":-default");
    EXPECT_FALSE(withDefault.isSimple());

    const auto &length = static_cast<const ParamExpPart &>(*tokens[2].word.parts[0]);
    EXPECT_EQ(length.name, "y");
    EXPECT_TRUE(length.length);
}

TEST(ShellLexer, SingleQuotesAndEscapesStayLiteral)
{
    const auto tokens = lexAll("echo '$HOME' \\*");
    ASSERT_EQ(tokens.size(), 4u);
    ASSERT_EQ(tokens[1].word.parts[0]->kind, WordPartKind::SglQuoted);
    EXPECT_EQ(static_cast<const SglQuotedPart &>(*tokens[1].word.parts[0]).value, "$HOME");

    const auto &escaped = static_cast<const LitPart &>(*tokens[2].word.parts[0]);
    EXPECT_EQ(escaped.value, "*");
    EXPECT_TRUE(escaped.escaped);
}

TEST(ShellLexer, CommandSubstitutionCapturesText)
{
    const auto tokens = lexAll("x=$(date +%s)");
    ASSERT_EQ(tokens.size(), 2u);
    const Word &word = tokens[0].word;
    ASSERT_EQ(word.parts.size(), 2u);
    EXPECT_EQ(static_cast<const LitPart &>(*word.parts[0]).value, "x=");
    ASSERT_EQ(word.parts[1]->kind, WordPartKind::CmdSubst);
    EXPECT_EQ(static_cast<const CmdSubstPart &>(*word.parts[1]).text, "date +%s");
}

TEST(ShellLexer, CommentsAreSkipped)
{
    const auto tokens = lexAll("echo hi # trailing comment\n# whole line\n");
    const std::vector<TokenKind> expected{TokenKind::Word, TokenKind::Word, TokenKind::Newline,
                                          TokenKind::Newline, TokenKind::EndOfFile};
    EXPECT_EQ(kinds(tokens), expected);
}

TEST(ShellLexer, TracksLinesAndColumns)
{
    const auto tokens = lexAll("a\n  b");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].loc.line, 1u);
    EXPECT_EQ(tokens[0].loc.column, 1u);
    EXPECT_EQ(tokens[2].loc.line, 2u);
    EXPECT_EQ(tokens[2].loc.column, 3u);
}

TEST(ShellLexer, UnterminatedQuoteThrows)
{
    Lexer lexer("echo \"abc", 1);
    EXPECT_EQ(lexer.next().kind, TokenKind::Word);
    EXPECT_THROW(lexer.next(), SyntaxError);
}
