//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Unsupported.hpp
// Purpose: Signals constructs that have no lowering rule.
// Key invariants: unsupported() never returns; it always throws LoweringError
//                 carrying an UnsupportedConstruct diagnostic.
// Ownership/Lifetime: Header-only; the builder and generator catch
//                     LoweringError at their public entry points.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <stdexcept>
#include <string>

namespace shgo::ir
{

/// @brief Exception used inside the builder and generator recursions.
class LoweringError : public std::runtime_error
{
  public:
    explicit LoweringError(support::Diag diag)
        : std::runtime_error(diag.message), diag_(std::move(diag))
    {
    }

    [[nodiscard]] const support::Diag &diag() const
    {
        return diag_;
    }

  private:
    support::Diag diag_;
};

/// @brief Abort lowering because @p construct has no rule.
/// @param loc Location of the offending construct.
/// @param construct Short description such as "case clause".
[[noreturn]] inline void unsupported(support::SourceLoc loc, const std::string &construct)
{
    throw LoweringError(support::makeError(support::ErrorKind::UnsupportedConstruct, loc,
                                           "unsupported construct: " + construct));
}

} // namespace shgo::ir
