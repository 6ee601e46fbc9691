//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the argument tokenizer.  The lexer walks the argument text once,
// front to back, emitting one token per blank run, quoted value or pure value.
// Any token it cannot accept rejects the whole argument list; the caller then
// keeps the entire line as Malformed text instead of guessing where a value
// ends.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Tokenizes the argument list of a keyword entry.

#include "sshconf/io/ArgumentLexer.hpp"

#include "sshconf/parse/Cursor.h"

#include <algorithm>
#include <string>

namespace sshconf::io
{
namespace
{
using core::ArgumentToken;
using parse::Cursor;

void setReason(MalformedReason *out, MalformedReason reason)
{
    if (out)
        *out = reason;
}

/// @brief Scan a quoted value whose opening quote was already consumed.
/// @details The closing quote is the first '"' whose predecessor is not '\'.
///          Only the immediately preceding character is inspected, so `\\"`
///          does not close the value.
/// @return Inner text, or std::nullopt when the end of input is reached first.
std::optional<std::string_view> scanQuoted(Cursor &cur)
{
    const std::size_t begin = cur.offset();
    char prev = '\0';
    while (!cur.atEnd())
    {
        const char ch = cur.peek();
        if (ch == '"' && prev != '\\')
        {
            std::string_view inner = cur.view().substr(begin, cur.offset() - begin);
            cur.advance();
            return inner;
        }
        prev = ch;
        cur.advance();
    }
    return std::nullopt;
}
} // namespace

/// @brief Tokenize the argument part of an entry.
///
/// @details Loop invariant: every byte before the cursor belongs to exactly one
///          emitted token, so printing the tokens back in order yields the
///          consumed prefix.  The loop ends when the cursor reaches the end of
///          @p text or a token is rejected.
///
/// @param text Argument text without surrounding blanks.
/// @param reason Receives the failure reason when std::nullopt is returned.
/// @return Token sequence with at least one value token, or std::nullopt.
std::optional<std::vector<ArgumentToken>> lexArguments(std::string_view text,
                                                       MalformedReason *reason)
{
    std::vector<ArgumentToken> tokens;
    Cursor cur(text);

    while (!cur.atEnd())
    {
        if (parse::isBlank(cur.peek()))
        {
            tokens.push_back(ArgumentToken::whitespace(std::string(cur.consumeBlanks())));
        }
        else if (cur.consumeIf('"'))
        {
            auto inner = scanQuoted(cur);
            if (!inner)
            {
                setReason(reason, MalformedReason::UnterminatedQuote);
                return std::nullopt;
            }
            tokens.push_back(ArgumentToken::quoted(std::string(*inner)));
        }
        else
        {
            std::string_view value = cur.consumeNonBlank();
            if (value.find('#') != std::string_view::npos)
            {
                setReason(reason, MalformedReason::UnquotedHash);
                return std::nullopt;
            }
            tokens.push_back(ArgumentToken::pure(std::string(value)));
        }
    }

    const auto isValue = [](const ArgumentToken &t) { return t.isValue(); };
    if (std::none_of(tokens.begin(), tokens.end(), isValue))
    {
        setReason(reason, MalformedReason::MissingArguments);
        return std::nullopt;
    }
    return tokens;
}

} // namespace sshconf::io
