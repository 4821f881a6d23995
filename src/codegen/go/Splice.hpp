//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/go/Splice.hpp
// Purpose: Tokenise interpolated word text into literal runs and variable
//          references.
//
// Recognised references:
//   ${NAME}   any text up to the closing brace
//   $NAME     identifier grammar: [A-Za-z_][A-Za-z0-9_]*
//   $N        a single positional digit
//   $@ $* $#  argument list and count
//   $$        a literal dollar sign
// A `$` that starts none of these is literal text.
//
// Key invariants: Adjacent literal runs are merged, so tokens alternate
//                 between literal text and references except for runs of
//                 consecutive references.
// Ownership/Lifetime: Value types only.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace shgo::codegen::go
{

struct SpliceToken
{
    /// @brief True when `text` is a variable name, false for literal text.
    bool reference = false;
    std::string text;
};

/// @brief Split @p text into literal and reference tokens.
std::vector<SpliceToken> splitInterpolated(std::string_view text);

/// @brief Join @p operands with ` + `, dropping empty literals; `""` when
///        nothing remains.
std::string concatExpr(const std::vector<std::string> &operands);

/// @brief Print @p expr the way gofmt prints an operand below the top level
///        (an argument of a call with several arguments, or the operand of a
///        comparison): `a + b` becomes `a+b`.  String literals and anything
///        inside braces (composite and function literals) keep their text.
std::string compactBinary(std::string_view expr);

} // namespace shgo::codegen::go
