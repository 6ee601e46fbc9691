//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the malformed-entry checker.
/// @details Malformed lines are kept verbatim by the parser, so the checker is
///          the place that tells a user which lines ssh would not read as
///          intended.  The reason is recomputed from the stored text, which
///          also covers Malformed expressions built by hand.

#include "sshconf/analysis/Check.hpp"

#include "sshconf/io/ExpressionParser.hpp"

#include <string>

namespace sshconf::analysis
{

std::size_t checkFile(const core::File &file,
                      uint32_t fileId,
                      support::DiagnosticEngine &de,
                      support::Severity severity)
{
    std::size_t count = 0;
    for (std::size_t i = 0; i < file.lines.size(); ++i)
    {
        const core::Line &line = file.lines[i];
        if (line.expression.kind != core::Expression::Kind::Malformed)
            continue;
        ++count;

        std::string message = "malformed entry";
        if (auto reason = io::explainMalformed(line.expression.text))
            message += std::string(": ") + io::describe(*reason);

        support::SourceLoc loc;
        loc.file_id = fileId;
        loc.line = static_cast<uint32_t>(i + 1);
        loc.column = static_cast<uint32_t>(line.indentPrefix.size() + 1);
        de.report(support::Diagnostic{severity, std::move(message), loc});
    }
    return count;
}

} // namespace sshconf::analysis
