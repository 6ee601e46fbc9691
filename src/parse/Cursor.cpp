//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Out-of-line Cursor members.

#include "sshconf/parse/Cursor.h"

namespace sshconf::parse
{

void Cursor::advance() noexcept
{
    if (pos_ < text_.size())
        ++pos_;
}

bool Cursor::consumeIf(char c) noexcept
{
    if (peek() != c || atEnd())
        return false;
    ++pos_;
    return true;
}

std::string_view Cursor::consumeBlanks() noexcept
{
    return consumeWhile(isBlank);
}

std::string_view Cursor::consumeNonBlank() noexcept
{
    return consumeWhile([](char ch) { return !isBlank(ch); });
}

} // namespace sshconf::parse
