//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/go/Requirements.hpp
// Purpose: Dependency set computed by the generator's collection pass:
//          runtime helpers and imported packages.
// Key invariants:
//   - require() closes over helper dependencies and their imports, so the
//     sets are always self-consistent.
//   - Both sets are ordered, which makes emission order lexical.
// Ownership/Lifetime: One value per generate() call; never shared.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <set>
#include <string>
#include <string_view>

namespace shgo::codegen::go
{

class Requirements
{
  public:
    /// @brief Seed with the declarations every generated program uses.
    Requirements();

    /// @brief Record the runtime helper @p name and everything it needs.
    void require(std::string_view name);

    /// @brief Record a package referenced directly by lowered code.
    void import(std::string_view path);

    [[nodiscard]] bool has(std::string_view helper) const;

    [[nodiscard]] const std::set<std::string> &helpers() const
    {
        return helpers_;
    }

    [[nodiscard]] const std::set<std::string> &imports() const
    {
        return imports_;
    }

  private:
    std::set<std::string> helpers_;
    std::set<std::string> imports_;
};

} // namespace shgo::codegen::go
