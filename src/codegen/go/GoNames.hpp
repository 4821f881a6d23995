//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/go/GoNames.hpp
// Purpose: Go lexical helpers: string literal quoting and the mapping from
//          shell names to Go identifiers.
// Key invariants:
//   - goQuote() always yields a valid Go interpreted string literal, even for
//     input that is not valid UTF-8.
//   - variableName() never returns a Go keyword, a predeclared identifier,
//     an imported package name or a name in the generator's reserved
//     namespaces (`sh...`, `fn_...`, `v_...`, `args`, `err`, `main`, `init`).
// Ownership/Lifetime: Stateless free functions.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace shgo::codegen::go
{

/// @brief Render @p text as a Go interpreted string literal.
std::string goQuote(std::string_view text);

/// @brief True for the 25 Go keywords.
bool isGoKeyword(std::string_view name);

/// @brief True for Go's predeclared identifiers (types, constants, builtins).
bool isGoPredeclared(std::string_view name);

/// @brief Go identifier used for the shell variable @p name.
/// @details Colliding names are prefixed with `v_`.
std::string variableName(std::string_view name);

/// @brief Go identifier used for the shell function @p name.
/// @details Always `fn_` followed by the name, with every character Go does
///          not accept in identifiers written as `_xHH_`.
std::string functionName(std::string_view name);

} // namespace shgo::codegen::go
