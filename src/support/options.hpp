//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Behaviour switches shared by the sshconf commands.
// Key invariants: Defaults give quiet, lenient checking.
// Ownership/Lifetime: Plain value.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

namespace sshconf::support
{

struct Options
{
    /// Print a note after reading and after parsing the file.
    bool trace = false;

    /// Report malformed entries as errors, so `check` exits non-zero.
    bool strict = false;
};

} // namespace sshconf::support
