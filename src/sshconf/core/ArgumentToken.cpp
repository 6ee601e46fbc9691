//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the factory helpers for argument tokens.

#include "sshconf/core/ArgumentToken.hpp"

#include <utility>

namespace sshconf::core
{

ArgumentToken ArgumentToken::pure(std::string s)
{
    return ArgumentToken{Kind::Pure, std::move(s)};
}

ArgumentToken ArgumentToken::quoted(std::string s)
{
    return ArgumentToken{Kind::Quoted, std::move(s)};
}

ArgumentToken ArgumentToken::whitespace(std::string s)
{
    return ArgumentToken{Kind::Whitespace, std::move(s)};
}

const char *kindName(ArgumentToken::Kind kind)
{
    switch (kind)
    {
        case ArgumentToken::Kind::Pure:
            return "pure";
        case ArgumentToken::Kind::Quoted:
            return "quoted";
        case ArgumentToken::Kind::Whitespace:
            return "whitespace";
    }
    return "";
}

} // namespace sshconf::core
