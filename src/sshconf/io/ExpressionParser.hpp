//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sshconf/io/ExpressionParser.hpp
// Purpose: Declare the classifier turning trimmed line content into an Expression.
// Key invariants: Total; every input maps to exactly one Expression kind and
//                 printing the result reproduces the input.
// Ownership/Lifetime: Returns owned expressions; does not retain the input view.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/Expression.hpp"
#include "sshconf/io/MalformedReason.hpp"

#include <optional>
#include <string_view>

namespace sshconf::io
{

/// @brief Classify trimmed line content.
///
/// @details Rules are tried in order: empty, comment ('#'), then
///          keyword/separator/arguments.  Anything that fails the last rule is
///          Malformed with the whole content preserved, even if only the
///          argument part was at fault.
///
/// @param content Line content without leading or trailing blanks.
/// @return The classified expression; never fails.
core::Expression parseExpression(std::string_view content);

/// @brief Report why @p content classifies as Malformed.
/// @param content Line content without leading or trailing blanks.
/// @return The first rule @p content breaks, or std::nullopt when it
///         classifies as Options, Comment or Empty.
std::optional<MalformedReason> explainMalformed(std::string_view content);

} // namespace sshconf::io
