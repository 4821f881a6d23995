//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager registry.  Paths are normalised lexically so
// that "./a.sh" and "a.sh" share an identifier.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include <filesystem>

namespace shgo::support
{
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = std::filesystem::path(path).lexically_normal().generic_string();
    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
    {
        return it->second;
    }

    files_.push_back(std::move(path));
    const auto id = static_cast<uint32_t>(files_.size());
    path_to_id_.emplace(std::move(normalized), id);
    return id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
    {
        return {};
    }
    return files_[file_id - 1];
}
} // namespace shgo::support
