//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/shgo/version.hpp
// Purpose: Version constants shared by the shgo tools.
// Key invariants: SHGO_VERSION_STRING matches the numeric components.
// Ownership/Lifetime: Header-only constants.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#define SHGO_VERSION_MAJOR 0
#define SHGO_VERSION_MINOR 3
#define SHGO_VERSION_PATCH 0
#define SHGO_VERSION_STRING "0.3.0"

namespace shgo
{
/// @brief Human-readable version of the transpiler.
inline constexpr const char *kVersion = SHGO_VERSION_STRING;
} // namespace shgo
