//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the line segmenter.  A physical line is cut into three parts:
//
//     "\t  Port 22 \n"
//      ^^^ ^^^^^^^ ^ ^^
//      |   |       | terminator (LineEnding::Lf)
//      |   |       indentSuffix
//      |   content, classified by parseExpression
//      indentPrefix
//
// A line made only of blanks puts all of them in the prefix.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Splits text into physical lines and segments each line.

#include "sshconf/io/LineParser.hpp"

#include "sshconf/io/ExpressionParser.hpp"
#include "sshconf/parse/Cursor.h"

#include <string>

namespace sshconf::io
{

/// @brief Strip the terminator from @p text and validate the remainder.
/// @param text Candidate line, optionally ending in "\n" or "\r\n".
/// @return PhysicalLine on success; an error diagnostic when @p text spans
///         more than one line.
support::Expected<PhysicalLine> PhysicalLine::make(std::string_view text)
{
    core::LineEnding ending = core::LineEnding::None;
    if (text.ends_with("\r\n"))
    {
        text.remove_suffix(2);
        ending = core::LineEnding::CrLf;
    }
    else if (text.ends_with('\n'))
    {
        text.remove_suffix(1);
        ending = core::LineEnding::Lf;
    }

    if (text.find('\n') != std::string_view::npos)
        return support::makeError({}, "multiline string can not be parsed as a single line");
    return PhysicalLine(text, ending);
}

/// @brief Cut @p text at every '\n'.
/// @details Each '\n' ends one line; a '\r' directly before it belongs to the
///          terminator.  Trailing text without '\n' forms a final line with
///          LineEnding::None.
/// @param text Whole-file text.
/// @return Lines in document order, viewing @p text.
std::vector<PhysicalLine> PhysicalLine::split(std::string_view text)
{
    std::vector<PhysicalLine> lines;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const std::size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos)
        {
            lines.push_back(PhysicalLine(text.substr(pos), core::LineEnding::None));
            break;
        }
        std::string_view body = text.substr(pos, nl - pos);
        core::LineEnding ending = core::LineEnding::Lf;
        if (body.ends_with('\r'))
        {
            body.remove_suffix(1);
            ending = core::LineEnding::CrLf;
        }
        lines.push_back(PhysicalLine(body, ending));
        pos = nl + 1;
    }
    return lines;
}

core::Line parseLine(const PhysicalLine &line)
{
    std::string_view body = line.body();

    parse::Cursor cur(body);
    const std::string_view prefix = cur.consumeBlanks();

    std::string_view rest = cur.remaining();
    std::size_t contentLen = rest.size();
    while (contentLen > 0 && parse::isBlank(rest[contentLen - 1]))
        --contentLen;

    core::Line out;
    out.indentPrefix = std::string(prefix);
    out.expression = parseExpression(rest.substr(0, contentLen));
    out.indentSuffix = std::string(rest.substr(contentLen));
    out.ending = line.ending();
    return out;
}

support::Expected<core::Line> parseLine(std::string_view text)
{
    auto physical = PhysicalLine::make(text);
    if (!physical)
        return physical.error();
    return parseLine(physical.value());
}

} // namespace sshconf::io
