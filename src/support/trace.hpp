//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.hpp
// Purpose: Opt-in phase tracing written to stderr as "[shgo:<component>] ...".
// Key invariants: Tracing is off unless SHGO_TRACE is set or enabled by flag.
// Ownership/Lifetime: Process-wide flag; no owned resources.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace shgo::support
{

/// @brief Whether phase tracing is active for this process.
bool traceEnabled();

/// @brief Force tracing on or off (used by the --trace flag).
void setTraceEnabled(bool enabled);

/// @brief Emit one trace line for @p component when tracing is enabled.
void trace(std::string_view component, std::string_view message);

} // namespace shgo::support
