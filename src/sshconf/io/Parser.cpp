//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements whole-file parsing on top of the line segmenter.

#include "sshconf/io/Parser.hpp"

#include "sshconf/io/LineParser.hpp"

#include <iterator>
#include <string>
#include <utility>

namespace sshconf::io
{

/// @brief Parse each physical line of @p text in order.
/// @details Lines are independent of each other, so the result is simply the
///          per-line results in document order.
core::File Parser::parse(std::string_view text, std::optional<std::filesystem::path> source)
{
    core::File file;
    file.path = std::move(source);
    for (const auto &physical : PhysicalLine::split(text))
        file.lines.push_back(parseLine(physical));
    return file;
}

/// @brief Slurp @p is and parse the text.
core::File Parser::parse(std::istream &is, std::optional<std::filesystem::path> source)
{
    std::string text{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
    return parse(std::string_view(text), std::move(source));
}

} // namespace sshconf::io
