//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Path registration for diagnostics.
/// @details Paths are stored in a deque so the string views used as map keys
///          stay valid as more files are added.

#include "support/source_manager.hpp"

#include <filesystem>
#include <limits>

namespace sshconf::support
{

uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized =
        std::filesystem::path(std::move(path)).lexically_normal().generic_string();
    if (auto it = ids_.find(normalized); it != ids_.end())
        return it->second;

    if (paths_.size() >= std::numeric_limits<uint32_t>::max())
        return 0;

    paths_.push_back(std::move(normalized));
    const auto id = static_cast<uint32_t>(paths_.size());
    ids_.emplace(paths_.back(), id);
    return id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > paths_.size())
        return {};
    return paths_[file_id - 1];
}

} // namespace sshconf::support
