//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the File struct, the in-memory form of a whole
// ssh_config(5) file:
//
//     # shared defaults
//
//     Host example.com ssh.example.com
//         Port 22
//         User root
//
// is held as five Lines (comment, empty, three options).  Host/Match blocks are
// not modelled as a hierarchy; indentation is just whitespace kept on each line.
//
// The File owns its lines by value.  Callers edit it by replacing lines or
// fields of lines; untouched lines print back byte for byte.  The optional path
// records where the text came from so the file can be written back there.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/Line.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace sshconf::core
{

/// @brief Parsed configuration file.
struct File
{
    /// @brief Lines in document order.
    std::vector<Line> lines;

    /// @brief Path the file was read from, if any.
    std::optional<std::filesystem::path> path;

    friend bool operator==(const File &, const File &) = default;
};

} // namespace sshconf::core
