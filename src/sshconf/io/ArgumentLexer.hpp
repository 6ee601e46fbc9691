//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sshconf/io/ArgumentLexer.hpp
// Purpose: Declare the tokenizer for the argument part of an entry.
// Key invariants: Concatenating the printed tokens reproduces the input.
// Ownership/Lifetime: Returns owned tokens; does not retain the input view.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/ArgumentToken.hpp"
#include "sshconf/io/MalformedReason.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace sshconf::io
{

/// @brief Split @p text into alternating value and whitespace tokens.
///
/// @details @p text is the remainder of a line after keyword and separator and
///          has no leading or trailing blanks.  A '"' opens a quoted value that
///          ends at the first '"' not directly preceded by '\'.  Any other
///          non-blank run is a pure value and must not contain '#'.
///
/// @param text Argument text to tokenize.
/// @param reason Optional out-parameter receiving the failure reason.
/// @return Tokens on success; std::nullopt when the text is empty, a quote is
///         unterminated or a pure value contains '#'.
std::optional<std::vector<core::ArgumentToken>> lexArguments(std::string_view text,
                                                             MalformedReason *reason = nullptr);

} // namespace sshconf::io
