//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping file identifiers to script paths.
// Key invariants: File ID 0 is invalid; ids are assigned densely from 1.
// Ownership/Lifetime: Manager owns file path strings.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace shgo::support
{

/// Maintains the mapping between numeric file identifiers and the paths of
/// the scripts they were loaded from.  Registering the same path twice yields
/// the same identifier.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id (always > 0).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id, or an empty view when unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    /// Index corresponds to file identifier minus one.  A deque keeps
    /// references stable as files are added.
    std::deque<std::string> files_;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace shgo::support
