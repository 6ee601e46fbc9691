//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Expression struct, the content of a line once its
// indentation has been stripped.  Every trimmed line is exactly one of:
//
// - Options:   `Keyword<separator>arguments`, e.g. `Port = 22`
// - Comment:   text starting with '#', stored verbatim including the '#'
// - Empty:     nothing between the indents
// - Malformed: anything else, stored verbatim so it prints back unchanged
//
// The struct is a discriminated union with a Kind field and factory
// functions; only the fields of the active kind are meaningful.
// ssh_config(5) treats blank lines as comments; they are kept as a separate
// kind here so callers can tell them apart.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/ArgumentToken.hpp"

#include <string>
#include <vector>

namespace sshconf::core
{

/// @brief Classified content of one configuration line.
struct Expression
{
    /// @brief Enumerates the expression forms.
    enum class Kind
    {
        Options,
        Comment,
        Empty,
        Malformed
    };

    /// Discriminant selecting which payload is active.
    Kind kind = Kind::Empty;

    /// Case-preserved keyword made of ASCII letters; Options only.
    std::string keyword;

    /// Text between keyword and arguments: blanks, or blanks around a single
    /// '='; Options only.
    std::string separator;

    /// Argument tokens with at least one value token; Options only.
    std::vector<ArgumentToken> arguments;

    /// Verbatim text for Comment (including '#') and Malformed.
    std::string text;

    /// @brief Construct a keyword/arguments entry.
    static Expression options(std::string keyword,
                              std::string separator,
                              std::vector<ArgumentToken> arguments);

    /// @brief Construct a comment from text starting with '#'.
    static Expression comment(std::string text);

    /// @brief Construct the empty expression.
    static Expression empty();

    /// @brief Construct a malformed expression preserving @p text.
    static Expression malformed(std::string text);

    friend bool operator==(const Expression &, const Expression &) = default;
};

/// @brief Value texts of the Pure and Quoted arguments of @p expr, in order.
/// @details Quoted values are returned raw, without the quotes and without
///          decoding escapes.  Non-Options expressions yield an empty vector.
std::vector<std::string> argumentValues(const Expression &expr);

/// @brief Lowercase name of @p kind ("options", "comment", "empty", "malformed").
const char *kindName(Expression::Kind kind);

} // namespace sshconf::core
