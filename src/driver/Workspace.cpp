//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Build workspace creation and cleanup.

#include "driver/Workspace.hpp"

#include "support/trace.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <stdlib.h>

namespace shgo::driver
{
namespace fs = std::filesystem;

namespace
{
support::Diag workspaceError(const std::string &msg)
{
    return support::makeError(support::ErrorKind::BuildToolFailure, {}, msg);
}
} // namespace

support::Expected<Workspace> Workspace::create(const std::string &requested)
{
    std::error_code ec;
    if (!requested.empty())
    {
        const fs::path dir(requested);
        if (fs::exists(dir, ec))
        {
            if (!fs::is_directory(dir, ec))
                return workspaceError("workspace '" + requested + "' is not a directory");
            if (!fs::is_empty(dir, ec))
                return workspaceError("workspace '" + requested + "' is not empty");
        }
        else if (!fs::create_directories(dir, ec) && ec)
        {
            return workspaceError("cannot create workspace '" + requested + "': " + ec.message());
        }
        support::trace("workspace", "using " + dir.string());
        return Workspace(dir);
    }

    const fs::path base = fs::temp_directory_path(ec);
    if (ec)
        return workspaceError("cannot locate a temporary directory: " + ec.message());

    std::string pattern = (base / "shgo-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr)
        return workspaceError("cannot create workspace under '" + base.string() +
                              "': " + std::strerror(errno));

    fs::path dir(buffer.data());
    support::trace("workspace", "created " + dir.string());
    return Workspace(std::move(dir));
}

Workspace::Workspace(Workspace &&other) noexcept
    : path_(std::move(other.path_)), keep_(other.keep_), active_(other.active_)
{
    other.active_ = false;
}

Workspace::~Workspace()
{
    if (!active_)
        return;
    if (keep_)
    {
        support::trace("cleanup", "keeping " + path_.string());
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    support::trace("cleanup", "removed " + path_.string() + (ec ? " (" + ec.message() + ")" : ""));
}

} // namespace shgo::driver
