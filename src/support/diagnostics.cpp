//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Naming helpers for the diagnostic taxonomy.

#include "support/diagnostics.hpp"

namespace shgo::support
{
const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::None:
            return "none";
        case ErrorKind::MalformedSource:
            return "malformed source";
        case ErrorKind::UnsupportedConstruct:
            return "unsupported construct";
        case ErrorKind::BuildToolFailure:
            return "build tool failure";
        case ErrorKind::IoFailure:
            return "i/o failure";
    }
    return "";
}
} // namespace shgo::support
