//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/go/RuntimeHelpers.hpp
// Purpose: Catalog of the fixed Go declarations the generated program may
//          need (exit statuses, process spawning, globbing, redirection...).
// Key invariants:
//   - Helper source text is fixed; nothing is parameterised at run time.
//   - `deps` names other catalog entries; the dependency graph is acyclic.
//   - `imports` lists exactly the packages the helper's own text uses.
// Ownership/Lifetime: Static, immutable table.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>
#include <vector>

namespace shgo::codegen::go
{

struct RuntimeHelper
{
    std::string_view name;
    std::vector<std::string_view> imports;
    std::vector<std::string_view> deps;
    /// @brief Go declaration text, gofmt-formatted, ending in a newline.
    std::string_view source;
};

/// @brief Every helper, sorted by name.
const std::vector<RuntimeHelper> &runtimeHelpers();

/// @brief Look up a helper by name; nullptr when unknown.
const RuntimeHelper *findHelper(std::string_view name);

} // namespace shgo::codegen::go
