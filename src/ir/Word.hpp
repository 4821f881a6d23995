//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Word.hpp
// Purpose: Value expressions of the IR (command arguments, assigned values,
//          redirection targets, loop items).
//
// A Word is an ordered list of segments that concatenate to the final value:
//
//   - Literal        text used verbatim
//   - Interpolated   text containing variable references written `${NAME}`
//                    (or `$NAME`); a literal dollar sign is written `$$`.
//                    NAME is an identifier, a positional index, or one of
//                    the special parameters `@ * # 0`, so `${1}` is the
//                    first positional argument and `${$}` the process id.
//   - CommandSubst   opaque `$(...)` placeholder; kept for dumps and
//                    diagnostics but never evaluated.
//
// Key invariants: Literal segments never contain references.
// Ownership/Lifetime: Value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

namespace shgo::ir
{

struct WordSegment
{
    enum class Kind
    {
        Literal,
        Interpolated,
        CommandSubst,
    };

    Kind kind = Kind::Literal;
    std::string text;
};

struct Word
{
    std::vector<WordSegment> segments;

    /// @brief Contains an unquoted parameter reference (subject to field
    ///        splitting when used as a loop item list).
    bool splittable = false;

    /// @brief Contains an unquoted glob metacharacter.
    bool glob = false;

    /// @brief Build a word holding the single literal @p text.
    static Word literal(std::string text);

    /// @brief True when every segment is Literal (the empty word included).
    [[nodiscard]] bool isLiteral() const;

    /// @brief Concatenated text of the literal segments.
    [[nodiscard]] std::string literalText() const;

    /// @brief True when any segment is a command substitution placeholder.
    [[nodiscard]] bool hasCommandSubst() const;

    /// @brief Rendering used by the IR printer: literals verbatim, interpolated
    ///        text with its markers, substitutions as `$(...)`.
    [[nodiscard]] std::string text() const;

    /// @brief Append a segment, merging with a trailing segment of the same kind.
    void append(WordSegment::Kind kind, std::string text);
};

} // namespace shgo::ir
