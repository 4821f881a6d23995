//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Helper and import bookkeeping for the Go generator.

#include "codegen/go/Requirements.hpp"

#include "codegen/go/RuntimeHelpers.hpp"

#include <stdexcept>

namespace shgo::codegen::go
{

Requirements::Requirements()
{
    // main() reports failures and maps them to an exit status.
    import("fmt");
    import("os");
    require("shExitCode");
}

void Requirements::require(std::string_view name)
{
    if (has(name))
        return;
    const RuntimeHelper *helper = findHelper(name);
    if (helper == nullptr)
        throw std::logic_error("unknown runtime helper: " + std::string(name));

    helpers_.emplace(name);
    for (auto path : helper->imports)
        import(path);
    for (auto dep : helper->deps)
        require(dep);
}

void Requirements::import(std::string_view path)
{
    imports_.emplace(path);
}

bool Requirements::has(std::string_view helper) const
{
    return helpers_.find(std::string(helper)) != helpers_.end();
}

} // namespace shgo::codegen::go
