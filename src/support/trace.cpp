//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the trace switch and the environment overrides for Options.
//
//===----------------------------------------------------------------------===//

#include "support/options.hpp"
#include "support/trace.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>

namespace shgo::support
{
namespace
{
std::atomic<bool> &traceFlag()
{
    static std::atomic<bool> enabled{std::getenv("SHGO_TRACE") != nullptr};
    return enabled;
}
} // namespace

bool traceEnabled()
{
    return traceFlag().load(std::memory_order_relaxed);
}

void setTraceEnabled(bool enabled)
{
    traceFlag().store(enabled, std::memory_order_relaxed);
}

void trace(std::string_view component, std::string_view message)
{
    if (!traceEnabled())
        return;
    std::cerr << "[shgo:" << component << "] " << message << '\n';
}

void applyEnvironment(Options &opts)
{
    if (const char *tool = std::getenv("SHGO_GO"); tool != nullptr && *tool != '\0')
        opts.goTool = tool;
    if (std::getenv("SHGO_TRACE") != nullptr)
        opts.trace = true;
}
} // namespace shgo::support
