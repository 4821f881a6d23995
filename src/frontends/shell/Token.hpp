//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/shell/Token.hpp
// Purpose: Token kinds produced by the shell lexer.
//
// Shell has no fixed keyword tokens: `if` is only a keyword in command
// position, so reserved words are lexed as ordinary Word tokens and
// recognised by the parser.  Redirection tokens carry their operator and any
// leading descriptor number (`2>`).  `((` carries the raw arithmetic text up
// to the matching `))`.
//
// Key invariants: Word tokens always carry a word with at least one part.
// Ownership/Lifetime: Tokens own their word parts.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/shell/AST_Cmd.hpp"
#include "support/source_location.hpp"

#include <stdexcept>
#include <string>

namespace shgo::frontends::shell
{

enum class TokenKind
{
    EndOfFile,
    Newline,
    Word,
    Redirect,
    Semi,      ///< `;`
    DSemi,     ///< `;;`
    SemiAmp,   ///< `;&`
    DSemiAmp,  ///< `;;&`
    Amp,       ///< `&`
    AndAnd,    ///< `&&`
    Pipe,      ///< `|`
    PipeAmp,   ///< `|&`
    OrOr,      ///< `||`
    LParen,    ///< `(`
    RParen,    ///< `)`
    DLParen,   ///< `((` ... `))` with the inner text in `text`
};

/// @brief Source spelling of a token kind, used in syntax errors.
const char *tokenKindSpelling(TokenKind kind);

struct Token
{
    TokenKind kind = TokenKind::EndOfFile;
    support::SourceLoc loc;

    /// @brief Populated for Word tokens.
    Word word;

    /// @brief Operator and descriptor prefix for Redirect tokens.
    RedirOp redir = RedirOp::Out;
    int fd = -1;

    /// @brief Raw arithmetic text for DLParen tokens.
    std::string text;
};

/// @brief Raised by the lexer and parser on malformed input; converted to a
///        MalformedSource diagnostic at the parse() boundary.
class SyntaxError : public std::runtime_error
{
  public:
    SyntaxError(support::SourceLoc loc, const std::string &message)
        : std::runtime_error(message), loc_(loc)
    {
    }

    [[nodiscard]] support::SourceLoc loc() const
    {
        return loc_;
    }

  private:
    support::SourceLoc loc_;
};

} // namespace shgo::frontends::shell
