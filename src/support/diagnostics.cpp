//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Diagnostic formatting and the collecting engine.  Every message sshconf
// prints about a configuration file, from `check` warnings to I/O failures and
// `--trace` notes, goes through printDiag so the format stays uniform.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements printDiag and DiagnosticEngine.

#include "support/diagnostics.hpp"

#include "support/source_manager.hpp"

#include <algorithm>

namespace sshconf::support
{

const char *severityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "error";
}

/// @brief Write the location prefix, then severity and message.
/// @details Paths come from @p sm; a diagnostic whose file id the manager does
///          not know prints without a prefix rather than with a bare colon.
void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm)
{
    const std::string_view path =
        (sm && diag.loc.isValid()) ? sm->getPath(diag.loc.file_id) : std::string_view{};
    if (!path.empty())
    {
        os << path;
        if (diag.loc.hasLine())
        {
            os << ':' << diag.loc.line;
            if (diag.loc.hasColumn())
                os << ':' << diag.loc.column;
        }
        os << ": ";
    }
    os << severityName(diag.severity) << ": " << diag.message << '\n';
}

void DiagnosticEngine::report(Diagnostic d)
{
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

std::size_t DiagnosticEngine::count(Severity severity) const
{
    return static_cast<std::size_t>(std::count_if(
        diags_.begin(), diags_.end(), [severity](const Diagnostic &d) {
            return d.severity == severity;
        }));
}

std::size_t DiagnosticEngine::errorCount() const
{
    return count(Severity::Error);
}

std::size_t DiagnosticEngine::warningCount() const
{
    return count(Severity::Warning);
}

} // namespace sshconf::support
