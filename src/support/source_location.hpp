//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Position of a diagnostic inside a registered configuration file.
// Key invariants: file_id 0 means "no file"; line and column are 1-based and 0
//                 means the part is not known.
// Ownership/Lifetime: Plain value.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace sshconf::support
{

/// @brief File, line and column of a configuration entry.
/// @details A whole-file note uses line 0; a whole-line report uses column 0.
struct SourceLoc
{
    uint32_t file_id = 0; ///< id from SourceManager::addFile
    uint32_t line = 0;    ///< physical line, counting from 1
    uint32_t column = 0;  ///< byte offset in the line, counting from 1

    [[nodiscard]] bool isValid() const
    {
        return file_id != 0;
    }

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace sshconf::support
