//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the SourceLoc value type attached to syntax nodes and IR.
// Key invariants: file_id == 0 marks an unknown location.
// Ownership/Lifetime: Plain value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace shgo::support
{

/// @brief Represents an absolute position within a script.
/// @invariant file_id == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a registered file.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace shgo::support
