//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sshconf/io/StringEscape.hpp
// Purpose: Make separators, indents and argument text visible in `dump` output.
// Key invariants: Output is printable ASCII apart from bytes >= 0x80, which
//                 pass through so UTF-8 values stay readable.
// Ownership/Lifetime: Stateless.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace sshconf::io
{

/// @brief C-style escape of @p input, without surrounding quotes.
/// @details Tabs and carriage returns are the characters that matter here:
///          `"Host\t=\tx\r"` becomes `Host\t=\tx\r` with visible backslashes.
///          Other control bytes use `\xNN`.
inline std::string encodeEscapedString(std::string_view input)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size() + 2);
    for (const char ch : input)
    {
        const auto byte = static_cast<unsigned char>(ch);
        switch (ch)
        {
            case '\t':
                out += "\\t";
                continue;
            case '\r':
                out += "\\r";
                continue;
            case '\n':
                out += "\\n";
                continue;
            case '"':
            case '\\':
                out += '\\';
                out += ch;
                continue;
            default:
                break;
        }
        if (byte < 0x20 || byte == 0x7F)
        {
            out += "\\x";
            out += kHex[byte >> 4];
            out += kHex[byte & 0xF];
        }
        else
        {
            out += ch;
        }
    }
    return out;
}

} // namespace sshconf::io
