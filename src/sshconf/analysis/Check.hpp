//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sshconf/analysis/Check.hpp
// Purpose: Declare the malformed-entry checker for parsed configuration files.
// Key invariants: Exactly one diagnostic per Malformed line, in line order.
// Ownership/Lifetime: Diagnostics are owned by the caller's engine.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/File.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <cstdint>

namespace sshconf::analysis
{

/// @brief Report every Malformed line of @p file to @p de.
///
/// @details Each diagnostic points at the first character after the line's
///          indentation and names the first grammar rule the line breaks.
///
/// @param file Parsed configuration file.
/// @param fileId SourceManager identifier for @p file, or 0 when unknown.
/// @param de Engine receiving the diagnostics.
/// @param severity Severity assigned to each diagnostic.
/// @return Number of malformed lines found.
std::size_t checkFile(const core::File &file,
                      uint32_t fileId,
                      support::DiagnosticEngine &de,
                      support::Severity severity = support::Severity::Warning);

} // namespace sshconf::analysis
