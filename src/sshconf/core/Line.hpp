//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sshconf/core/Line.hpp
// Purpose: Declares one physical line of a configuration file.
// Key invariants: indentPrefix + text(expression) + indentSuffix + terminator
//                 reproduces the physical line it was parsed from.
// Ownership/Lifetime: Owns its strings and expression by value.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/Expression.hpp"

#include <string>
#include <string_view>

namespace sshconf::core
{

/// @brief Terminator that ended a physical line.
enum class LineEnding
{
    Lf,   ///< "\n"
    CrLf, ///< "\r\n"
    None  ///< last line of a file without a trailing newline
};

/// @brief Bytes written for @p ending.
std::string_view terminator(LineEnding ending);

/// @brief A line split into indentation, expression and line terminator.
struct Line
{
    /// Longest run of spaces/tabs at the start of the line.
    std::string indentPrefix;

    /// Classified content between the two indents.
    Expression expression;

    /// Longest run of spaces/tabs at the end of the line that does not overlap
    /// @ref indentPrefix.
    std::string indentSuffix;

    /// Terminator of the source line; new lines default to "\n".
    LineEnding ending = LineEnding::Lf;

    friend bool operator==(const Line &, const Line &) = default;
};

} // namespace sshconf::core
