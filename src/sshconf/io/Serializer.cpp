//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the configuration serializer.
/// @details Every overload composes the one below it, mirroring how the
///          parser decomposes text: tokens make an expression, an expression
///          plus indents and a terminator make a line, lines make a file.

#include "sshconf/io/Serializer.hpp"

#include <sstream>

namespace sshconf::io
{
namespace
{
template <class Node> std::string render(const Node &node)
{
    std::ostringstream os;
    Serializer::write(node, os);
    return os.str();
}
} // namespace

void Serializer::write(const core::ArgumentToken &token, std::ostream &os)
{
    if (token.kind == core::ArgumentToken::Kind::Quoted)
        os << '"' << token.text << '"';
    else
        os << token.text;
}

void Serializer::write(const core::Expression &expr, std::ostream &os)
{
    switch (expr.kind)
    {
        case core::Expression::Kind::Options:
            os << expr.keyword << expr.separator;
            for (const auto &token : expr.arguments)
                write(token, os);
            break;
        case core::Expression::Kind::Comment:
        case core::Expression::Kind::Malformed:
            os << expr.text;
            break;
        case core::Expression::Kind::Empty:
            break;
    }
}

void Serializer::write(const core::Line &line, std::ostream &os)
{
    os << line.indentPrefix;
    write(line.expression, os);
    os << line.indentSuffix << core::terminator(line.ending);
}

void Serializer::write(const core::File &f, std::ostream &os)
{
    for (const auto &line : f.lines)
        write(line, os);
}

std::string Serializer::toString(const core::File &f)
{
    return render(f);
}

std::string Serializer::toString(const core::Line &line)
{
    return render(line);
}

std::string Serializer::toString(const core::Expression &expr)
{
    return render(expr);
}

std::string Serializer::toString(const core::ArgumentToken &token)
{
    return render(token);
}

} // namespace sshconf::io
