//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Registry of configuration file paths referenced by diagnostics.
// Key invariants: Ids start at 1 and are never reused; one id per normalized path.
// Ownership/Lifetime: Owns the path strings; views returned by getPath stay
//                     valid for the manager's lifetime.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sshconf::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// @brief Maps file ids carried by SourceLoc back to printable paths.
class SourceManager
{
  public:
    /// @brief Register @p path, normalized lexically (`a/./b` and `a/x/../b`
    ///        both become `a/b`).
    /// @return The path's id, the existing one if it was registered before, or
    ///         0 once the id space is exhausted.
    uint32_t addFile(std::string path);

    /// @return Normalized path for @p file_id, or an empty view if unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    std::deque<std::string> paths_;
    std::unordered_map<std::string_view, uint32_t> ids_;
};

} // namespace sshconf::support
