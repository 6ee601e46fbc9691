//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief String table for malformed-line reasons.

#include "sshconf/io/MalformedReason.hpp"

namespace sshconf::io
{

const char *describe(MalformedReason reason)
{
    switch (reason)
    {
        case MalformedReason::MissingKeyword:
            return "missing keyword";
        case MalformedReason::InvalidSeparator:
            return "invalid separator";
        case MalformedReason::MissingArguments:
            return "missing arguments";
        case MalformedReason::UnterminatedQuote:
            return "unterminated quoted argument";
        case MalformedReason::UnquotedHash:
            return "unquoted '#' in argument";
    }
    return "malformed entry";
}

} // namespace sshconf::io
