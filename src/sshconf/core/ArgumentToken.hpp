//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the ArgumentToken struct, one unit of the argument list
// that follows a keyword and its separator, e.g. the five tokens of
//
//     Host one.example.com "two words"	three
//          ^^^^^^^^^^^^^^^ ^^^^^^^^^^^ ^ ^^^^^
//          Pure            Quoted      | Pure
//                          (Whitespace tokens in between)
//
// Whitespace between values is kept as its own token so the argument list can
// be printed back exactly as it was written.  Quoted tokens store the raw text
// between the quotes; escape sequences such as \" are kept verbatim and are
// never decoded.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace sshconf::core
{

/// @brief Tagged argument token; @ref kind selects how @ref text is printed.
struct ArgumentToken
{
    /// @brief Enumerates the token forms.
    enum class Kind
    {
        Pure,
        Quoted,
        Whitespace
    };

    /// Discriminant selecting how the payload is interpreted.
    Kind kind = Kind::Pure;
    /// Value text (Pure), inner text without quotes (Quoted) or the blank run
    /// (Whitespace).
    std::string text;

    /// @brief Construct an unquoted value token.
    /// @invariant @p s contains no blank and no '#'.
    static ArgumentToken pure(std::string s);

    /// @brief Construct a double-quoted value token from its inner text.
    static ArgumentToken quoted(std::string s);

    /// @brief Construct a separator token from a run of spaces and tabs.
    static ArgumentToken whitespace(std::string s);

    /// @brief True for Pure and Quoted tokens.
    [[nodiscard]] bool isValue() const
    {
        return kind != Kind::Whitespace;
    }

    friend bool operator==(const ArgumentToken &, const ArgumentToken &) = default;
};

/// @brief Lowercase name of @p kind ("pure", "quoted", "whitespace").
const char *kindName(ArgumentToken::Kind kind);

} // namespace sshconf::core
