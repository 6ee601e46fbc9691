//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic records, their printed form, and the engine that
//          collects them while a configuration file is checked.
// Key invariants: Diagnostics are kept and printed in report order.
// Ownership/Lifetime: The engine owns every diagnostic reported to it.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace sshconf::support
{

class SourceManager;

enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Lowercase name printed before the message ("note", "warning", "error").
const char *severityName(Severity severity);

/// @brief One message about a configuration file, optionally located.
struct Diagnostic
{
    Severity severity;
    std::string message;
    SourceLoc loc;
};

/// @brief Print @p diag as `path:line:col: severity: message` plus newline.
/// @details The location prefix is shortened to what is known: `path:line: `,
///          `path: ` or nothing when @p sm is null or the file id is unknown.
void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm = nullptr);

/// @brief Collects diagnostics during a check so the caller can print them
///        together and pick an exit status.
class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief Print every diagnostic with printDiag, in report order.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    std::size_t errorCount() const;
    std::size_t warningCount() const;

  private:
    std::size_t count(Severity severity) const;

    std::vector<Diagnostic> diags_;
};

} // namespace sshconf::support
