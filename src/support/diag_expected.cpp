//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers.  Every stage of the
// transpiler reports failure through these so the CLI prints one uniformly
// formatted line regardless of where the error originated.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers and the diagnostic printer.

#include "support/diag_expected.hpp"

namespace shgo::support
{
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Success is indicated by the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must check hasValue() first.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(ErrorKind kind, SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc, kind};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a SourceManager is supplied and the location is valid the
///          message is prefixed with "<path>:<line>:<column>:".  Missing
///          components are omitted.  A trailing newline is always written.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.isValid())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.hasLine())
            {
                os << ':' << diag.loc.line;
                if (diag.loc.hasColumn())
                {
                    os << ':' << diag.loc.column;
                }
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace shgo::support
