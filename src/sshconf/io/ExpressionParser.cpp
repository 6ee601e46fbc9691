//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the expression classifier.  The keyword and separator are read
// with the shared cursor; the argument remainder is handed to the argument
// lexer.  Both the public classifier and the malformed-line explainer run the
// same routine so the reported reason always matches the classification.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Classifies trimmed line content into Options, Comment, Empty or
///        Malformed expressions.

#include "sshconf/io/ExpressionParser.hpp"

#include "sshconf/io/ArgumentLexer.hpp"
#include "sshconf/parse/Cursor.h"

#include <algorithm>
#include <string>

namespace sshconf::io
{
namespace
{
using core::Expression;

std::string_view trimBlanks(std::string_view text)
{
    while (!text.empty() && parse::isBlank(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && parse::isBlank(text.back()))
        text.remove_suffix(1);
    return text;
}

/// @brief A separator is blanks, optionally with exactly one '=' among them.
bool isValidSeparator(std::string_view separator)
{
    return !separator.empty() && std::count(separator.begin(), separator.end(), '=') <= 1;
}

Expression reject(std::string_view content, MalformedReason *out, MalformedReason reason)
{
    if (out)
        *out = reason;
    return Expression::malformed(std::string(content));
}

/// @brief Shared classification routine.
/// @param content Trimmed line content.
/// @param reason Receives the failed rule when the result is Malformed.
Expression classify(std::string_view content, MalformedReason *reason)
{
    if (content.empty())
        return Expression::empty();
    if (content.front() == '#')
        return Expression::comment(std::string(content));

    parse::Cursor cur(content);
    const std::string_view keyword = cur.consumeWhile(parse::isKeywordChar);
    if (keyword.empty())
        return reject(content, reason, MalformedReason::MissingKeyword);

    const std::string_view separator =
        cur.consumeWhile([](char ch) { return parse::isBlank(ch) || ch == '='; });
    if (separator.empty() && cur.atEnd())
        return reject(content, reason, MalformedReason::MissingArguments);
    if (!isValidSeparator(separator))
        return reject(content, reason, MalformedReason::InvalidSeparator);

    auto arguments = lexArguments(trimBlanks(cur.remaining()), reason);
    if (!arguments)
        return Expression::malformed(std::string(content));

    return Expression::options(
        std::string(keyword), std::string(separator), std::move(*arguments));
}
} // namespace

Expression parseExpression(std::string_view content)
{
    return classify(content, nullptr);
}

std::optional<MalformedReason> explainMalformed(std::string_view content)
{
    MalformedReason reason = MalformedReason::MissingArguments;
    Expression expr = classify(content, &reason);
    if (expr.kind != Expression::Kind::Malformed)
        return std::nullopt;
    return reason;
}

} // namespace sshconf::io
