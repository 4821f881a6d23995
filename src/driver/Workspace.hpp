//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: driver/Workspace.hpp
// Purpose: Scratch directory holding the generated source, module manifest and
//          compiled binary of one build.
// Key invariants: A fresh workspace path is unique per invocation (mkdtemp);
//                 a caller-supplied path must be empty or absent.
// Ownership/Lifetime: The Workspace removes its directory on destruction
//                     unless keep() was called.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <filesystem>
#include <string>

namespace shgo::driver
{

class Workspace
{
  public:
    /// @brief Create the workspace directory.
    /// @param requested Directory to use; empty selects `<tmp>/shgo-XXXXXX`.
    /// @return The workspace, or a BuildToolFailure diagnostic.
    static support::Expected<Workspace> create(const std::string &requested);

    Workspace(Workspace &&other) noexcept;
    Workspace &operator=(Workspace &&) = delete;
    Workspace(const Workspace &) = delete;
    Workspace &operator=(const Workspace &) = delete;
    ~Workspace();

    [[nodiscard]] const std::filesystem::path &path() const
    {
        return path_;
    }

    /// @brief Retain the directory after destruction.
    void keep()
    {
        keep_ = true;
    }

  private:
    explicit Workspace(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
    bool keep_ = false;
    bool active_ = true;
};

} // namespace shgo::driver
