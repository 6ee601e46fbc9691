//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the factory helpers and queries for line expressions.
/// @details Factories leave the fields of inactive kinds default-constructed,
///          which keeps defaulted equality meaningful: two expressions compare
///          equal exactly when they would serialize identically and classify
///          the same way.

#include "sshconf/core/Expression.hpp"

#include <utility>

namespace sshconf::core
{

/// @brief Build an Options expression.
/// @param keyword Keyword text; expected to be non-empty ASCII letters.
/// @param separator Separator text exactly as written.
/// @param arguments Token sequence containing at least one value token.
/// @return Expression tagged Kind::Options.
Expression Expression::options(std::string keyword,
                               std::string separator,
                               std::vector<ArgumentToken> arguments)
{
    Expression e;
    e.kind = Kind::Options;
    e.keyword = std::move(keyword);
    e.separator = std::move(separator);
    e.arguments = std::move(arguments);
    return e;
}

Expression Expression::comment(std::string text)
{
    Expression e;
    e.kind = Kind::Comment;
    e.text = std::move(text);
    return e;
}

Expression Expression::empty()
{
    return Expression{};
}

Expression Expression::malformed(std::string text)
{
    Expression e;
    e.kind = Kind::Malformed;
    e.text = std::move(text);
    return e;
}

std::vector<std::string> argumentValues(const Expression &expr)
{
    std::vector<std::string> values;
    if (expr.kind != Expression::Kind::Options)
        return values;
    for (const auto &token : expr.arguments)
    {
        if (token.isValue())
            values.push_back(token.text);
    }
    return values;
}

const char *kindName(Expression::Kind kind)
{
    switch (kind)
    {
        case Expression::Kind::Options:
            return "options";
        case Expression::Kind::Comment:
            return "comment";
        case Expression::Kind::Empty:
            return "empty";
        case Expression::Kind::Malformed:
            return "malformed";
    }
    return "";
}

} // namespace sshconf::core
