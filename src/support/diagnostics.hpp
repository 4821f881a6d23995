//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record shared by every pipeline stage.
// Key invariants: Error diagnostics always carry a non-None ErrorKind.
// Ownership/Lifetime: Diagnostics own their message text.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <string>

namespace shgo::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Failure taxonomy used to classify error diagnostics.
enum class ErrorKind
{
    None,                 ///< Not an error (notes and warnings).
    MalformedSource,      ///< The script text does not parse.
    UnsupportedConstruct, ///< No lowering rule exists for a construct.
    BuildToolFailure,     ///< Workspace, manifest, compile or relocate step failed.
    IoFailure             ///< Reading the script or writing an output failed.
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;                 ///< Message severity
    std::string message;               ///< Human-readable text
    SourceLoc loc;                     ///< Optional source location
    ErrorKind kind = ErrorKind::None;  ///< Failure class for errors
};

/// @brief Lowercase name of @p kind, e.g. "unsupported construct".
const char *errorKindName(ErrorKind kind);

} // namespace shgo::support
