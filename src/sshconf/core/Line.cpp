//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements line terminator helpers.

#include "sshconf/core/Line.hpp"

namespace sshconf::core
{

std::string_view terminator(LineEnding ending)
{
    switch (ending)
    {
        case LineEnding::Lf:
            return "\n";
        case LineEnding::CrLf:
            return "\r\n";
        case LineEnding::None:
            return {};
    }
    return "\n";
}

} // namespace sshconf::core
