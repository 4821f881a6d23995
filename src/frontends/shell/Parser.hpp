//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/shell/Parser.hpp
// Purpose: Recursive-descent parser producing the shell syntax tree.
//
// Grammar (simplified POSIX):
//
//   list      := and_or ((';' | '&' | NEWLINE) and_or)*
//   and_or    := pipeline (('&&' | '||') NEWLINE* pipeline)*
//   pipeline  := ['!'] command (('|' | '|&') NEWLINE* command)*
//   command   := compound redirect* | function_def | simple_command
//   compound  := '{' list '}' | '(' list ')' | if | while | until | for
//              | case | '((' ... '))' | '[[' ... ']]'
//
// Reserved words are ordinary words recognised only in command position.
// The first syntax error aborts parsing; parse() reports it as a
// MalformedSource diagnostic.
//
// Key invariants: Every returned Stmt owns a command.
// Ownership/Lifetime: The parser borrows its lexer.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/shell/AST.hpp"
#include "frontends/shell/Lexer.hpp"
#include "support/diag_expected.hpp"

#include <initializer_list>
#include <string>
#include <string_view>

namespace shgo::frontends::shell
{

/// @brief Parse script @p text registered as @p fileId into a syntax tree.
support::Expected<SyntaxTree> parse(std::string_view text, uint32_t fileId);

class Parser
{
  public:
    explicit Parser(Lexer &lexer);

    /// @brief Parse the whole input.
    /// @throws SyntaxError on the first malformed construct.
    SyntaxTree parseFile(uint32_t fileId);

  private:
    //=========================================================================
    /// @name Token Handling
    /// @{
    //=========================================================================

    void advance();
    bool check(TokenKind kind) const;
    bool atKeyword(std::string_view word) const;
    bool atAnyKeyword(std::initializer_list<std::string_view> words) const;
    void expectKeyword(std::string_view word, std::string_view context);
    void expect(TokenKind kind, std::string_view context);
    void skipNewlines();
    [[noreturn]] void fail(const std::string &message) const;
    [[noreturn]] void unexpected(std::string_view context) const;

    /// @}
    //=========================================================================
    /// @name Lists and Pipelines (Parser.cpp)
    /// @{
    //=========================================================================

    /// @brief Parse statements until EOF, `)`, a case terminator or one of
    ///        the reserved @p stops in command position.
    StmtList parseStmtList(std::initializer_list<std::string_view> stops);
    StmtPtr parseAndOr();
    StmtPtr parsePipeline();

    /// @}
    //=========================================================================
    /// @name Commands (Parser_Cmd.cpp)
    /// @{
    //=========================================================================

    StmtPtr parseCommand();
    StmtPtr parseSimpleCommand();
    StmtPtr parseFunctionBody(StmtPtr head, std::string name, bool keyword);
    StmtPtr parseFunctionKeyword();
    void parseRedirects(Stmt &stmt);
    Redirect parseRedirect();
    CommandPtr makeDeclClause(CallExpr &call);

    /// @}
    //=========================================================================
    /// @name Compound Commands (Parser_Compound.cpp)
    /// @{
    //=========================================================================

    CommandPtr parseBlock();
    CommandPtr parseSubshell();
    CommandPtr parseIf();
    void parseIfTail(IfClause &clause);
    CommandPtr parseWhile(bool until);
    CommandPtr parseFor();
    CommandPtr parseCase();
    CommandPtr parseTestClause();

    /// @}

    Lexer &lexer_;
    Token tok_;
};

/// @brief Split `NAME=value` / `NAME+=value` off the front of @p word.
/// @return True and fill @p out when the word is an assignment.
bool splitAssignment(Word &word, Assign &out);

/// @brief True when @p name is a valid shell variable name.
bool isValidName(std::string_view name);

} // namespace shgo::frontends::shell
