//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sshconf/io/LineParser.hpp
// Purpose: Declare the physical-line type and the line segmenter.
// Key invariants: A PhysicalLine never contains '\n' in its body, so the
//                 segmenter cannot be handed several lines at once.
// Ownership/Lifetime: PhysicalLine views caller-owned text; parsed Lines own
//                     their data.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/Line.hpp"
#include "support/diag_expected.hpp"

#include <string_view>
#include <vector>

namespace sshconf::io
{

/// @brief Validated view of exactly one line of text.
/// @details The only ways to obtain one are @ref make, which rejects text with
///          an embedded newline, and @ref split, which cuts text at newlines.
class PhysicalLine
{
  public:
    /// @brief Validate @p text as a single line with an optional terminator.
    /// @details A trailing "\r\n" or "\n" is split off as the terminator; a
    ///          '\r' anywhere else is ordinary content.
    /// @return The line, or an error diagnostic when a '\n' remains in the body.
    static support::Expected<PhysicalLine> make(std::string_view text);

    /// @brief Cut @p text into physical lines at each '\n'.
    /// @details A final fragment without '\n' becomes a line ending in
    ///          LineEnding::None; empty text yields no lines.
    static std::vector<PhysicalLine> split(std::string_view text);

    /// @brief Line content without the terminator.
    [[nodiscard]] std::string_view body() const noexcept
    {
        return body_;
    }

    /// @brief Terminator that followed the body.
    [[nodiscard]] core::LineEnding ending() const noexcept
    {
        return ending_;
    }

  private:
    PhysicalLine(std::string_view body, core::LineEnding ending) noexcept
        : body_(body), ending_(ending)
    {
    }

    std::string_view body_;
    core::LineEnding ending_;
};

/// @brief Split @p line into indents and a classified expression.
core::Line parseLine(const PhysicalLine &line);

/// @brief Validate @p text as one physical line and parse it.
/// @return The parsed line, or the diagnostic from PhysicalLine::make.
support::Expected<core::Line> parseLine(std::string_view text);

} // namespace sshconf::io
