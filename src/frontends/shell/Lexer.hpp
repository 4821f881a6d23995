//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/shell/Lexer.hpp
// Purpose: Declares the shell lexer that turns script text into tokens.
//
// Words are lexed into structured parts (quotes, expansions, substitutions)
// in a single pass.  Command and arithmetic substitutions are captured as raw
// balanced text; nothing downstream evaluates them.  Heredoc bodies are
// skipped when the newline that ends their command is reached.
//
// Key invariants: Line/column tracking is 1-based; EOF yields EndOfFile
//                 tokens indefinitely.
// Ownership/Lifetime: The lexer borrows the source buffer, which must outlive it.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/shell/Token.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shgo::frontends::shell
{

class Lexer
{
  public:
    /// @brief Create a lexer over @p src belonging to file @p file_id.
    Lexer(std::string_view src, uint32_t file_id);

    /// @brief Produce the next token.
    /// @throws SyntaxError on unterminated quotes or substitutions.
    Token next();

    /// @brief Register a heredoc whose body starts after the next newline.
    void queueHeredoc(std::string delimiter, bool stripTabs);

  private:
    char peek(std::size_t offset = 0) const;
    char get();
    bool eof() const;
    support::SourceLoc here() const;

    void skipBlanksAndComments();
    void skipHeredocBodies();

    Token lexRedirect(int fd, support::SourceLoc loc);
    Token lexWord();

    /// @brief Lex an expansion starting at `$`.
    /// @return The expansion part, or nullptr when the `$` is literal.
    WordPartPtr lexDollar();
    WordPartPtr lexParamBraced(support::SourceLoc loc);
    WordPartPtr lexSingleQuoted();
    WordPartPtr lexAnsiQuoted();
    WordPartPtr lexDoubleQuoted();
    WordPartPtr lexBackquote();

    /// @brief Read up to the @p close matching an already consumed @p open.
    std::string readBalanced(char open, char close, support::SourceLoc start, const char *what);

    /// @brief Read the body of `((` up to the matching `))`.
    std::string readArithmetic(support::SourceLoc start);

    std::string_view src_;
    std::size_t pos_ = 0;
    uint32_t file_id_;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    std::vector<std::pair<std::string, bool>> heredocs_;
};

} // namespace shgo::frontends::shell
