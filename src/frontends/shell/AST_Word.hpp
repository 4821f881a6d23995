//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/shell/AST_Word.hpp
// Purpose: Word and word-part nodes of the shell syntax tree.
//
// A shell word is a sequence of adjacent parts with different quoting and
// expansion rules.  `"Hello, $NAME"!` for example is a double-quoted part
// (itself holding a literal and a parameter expansion) followed by an
// unquoted literal "!".  The parser keeps this structure intact; deciding what
// a word means is left to the IR builder.
//
// Key invariants: `kind` always matches the concrete WordPart subclass.
// Ownership/Lifetime: Words own their parts via WordPartPtr.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shgo::frontends::shell
{
using support::SourceLoc;

/// @brief Enumerates the kinds of word parts.
enum class WordPartKind
{
    /// @brief Unquoted or backslash-escaped literal text.
    Lit,
    /// @brief `'text'` or `$'text'`; never expanded.
    SglQuoted,
    /// @brief `"..."`; holds nested literal and expansion parts.
    DblQuoted,
    /// @brief `$NAME`, `${NAME}`, `$1`, `$@`, `${NAME:-x}`.
    ParamExp,
    /// @brief `$(...)` or backquoted command substitution.
    CmdSubst,
    /// @brief `$((...))` arithmetic expansion.
    ArithmExp,
    /// @brief `<(...)` or `>(...)` process substitution.
    ProcSubst,
    /// @brief `NAME=(a b c)` array literal on the right of an assignment.
    ArrayLit,
};

/// @brief Human-readable name of a word part kind ("parameter expansion").
const char *wordPartKindName(WordPartKind kind);

/// @brief Base class for all word parts.
struct WordPart
{
    WordPartKind kind;
    SourceLoc loc;

    WordPart(WordPartKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~WordPart() = default;
};

using WordPartPtr = std::unique_ptr<WordPart>;

/// @brief Literal text with quoting and escapes already removed.
struct LitPart : WordPart
{
    std::string value;

    /// @brief True when the text came from a backslash escape, which makes
    ///        it immune to glob and tilde interpretation.
    bool escaped = false;

    LitPart(SourceLoc l, std::string v, bool esc = false)
        : WordPart(WordPartKind::Lit, l), value(std::move(v)), escaped(esc)
    {
    }
};

struct SglQuotedPart : WordPart
{
    std::string value;

    SglQuotedPart(SourceLoc l, std::string v) : WordPart(WordPartKind::SglQuoted, l), value(std::move(v))
    {
    }
};

struct DblQuotedPart : WordPart
{
    /// @brief Literal, ParamExp, CmdSubst and ArithmExp parts in source order.
    std::vector<WordPartPtr> parts;

    explicit DblQuotedPart(SourceLoc l) : WordPart(WordPartKind::DblQuoted, l) {}
};

/// @brief Parameter expansion.
/// @details `name` is an identifier, a positional digit string, or one of the
///          special parameters `@ * # ? $ ! - 0`.  Anything after the name
///          inside braces (`:-default`, `%suffix`, `[i]`) is kept verbatim in
///          `modifier`; a leading `#` (length) sets `length`.
struct ParamExpPart : WordPart
{
    std::string name;
    bool braced = false;
    bool length = false;
    std::string modifier;

    ParamExpPart(SourceLoc l, std::string n) : WordPart(WordPartKind::ParamExp, l), name(std::move(n))
    {
    }

    /// @brief True for plain `$NAME` / `${NAME}` with no operator attached.
    [[nodiscard]] bool isSimple() const
    {
        return !length && modifier.empty();
    }
};

/// @brief Command substitution; the command text is kept unparsed.
struct CmdSubstPart : WordPart
{
    std::string text;
    bool backquoted = false;

    CmdSubstPart(SourceLoc l, std::string t, bool bq)
        : WordPart(WordPartKind::CmdSubst, l), text(std::move(t)), backquoted(bq)
    {
    }
};

struct ArithmExpPart : WordPart
{
    std::string text;

    ArithmExpPart(SourceLoc l, std::string t) : WordPart(WordPartKind::ArithmExp, l), text(std::move(t)) {}
};

struct ProcSubstPart : WordPart
{
    /// @brief True for `<(...)`, false for `>(...)`.
    bool input = true;
    std::string text;

    ProcSubstPart(SourceLoc l, bool in, std::string t)
        : WordPart(WordPartKind::ProcSubst, l), input(in), text(std::move(t))
    {
    }
};

struct ArrayLitPart : WordPart
{
    std::string text;

    ArrayLitPart(SourceLoc l, std::string t) : WordPart(WordPartKind::ArrayLit, l), text(std::move(t)) {}
};

/// @brief A complete shell word.
struct Word
{
    SourceLoc loc;
    std::vector<WordPartPtr> parts;

    /// @brief True when the word consists only of unescaped literal parts.
    [[nodiscard]] bool isPlainLiteral() const;

    /// @brief Concatenated text of a plain literal word; empty otherwise.
    [[nodiscard]] std::string literal() const;

    /// @brief Approximate source rendering used in diagnostics and dumps.
    [[nodiscard]] std::string text() const;
};

} // namespace shgo::frontends::shell
