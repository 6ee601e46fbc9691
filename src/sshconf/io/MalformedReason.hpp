//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sshconf/io/MalformedReason.hpp
// Purpose: Enumerates why a line was classified as Malformed.
// Key invariants: Each reason names the first grammar rule the line broke.
// Ownership/Lifetime: Stateless enumeration and string table.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

namespace sshconf::io
{

/// @brief First grammar rule a malformed line failed.
enum class MalformedReason
{
    MissingKeyword,    ///< content does not start with an ASCII letter
    InvalidSeparator,  ///< no separator, a stray character or more than one '='
    MissingArguments,  ///< keyword and separator but no argument value
    UnterminatedQuote, ///< a '"' argument never closes
    UnquotedHash       ///< an unquoted argument contains '#'
};

/// @brief Short human-readable description of @p reason.
const char *describe(MalformedReason reason);

} // namespace sshconf::io
