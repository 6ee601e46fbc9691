//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Parser class, which reads ssh_config(5) text and
// builds a core::File.  The Parser is the inverse of the Serializer: for any
// text T, Serializer::toString(Parser::parse(T)) == T.
//
// Parsing never fails.  A line that does not fit the keyword/separator/
// arguments grammar becomes a Malformed expression carrying its original text,
// so a file with mistakes in it still loads, prints back unchanged, and can be
// inspected by the checker for what went wrong.
//
// Pipeline, per physical line:
// - PhysicalLine::split: cut the text at '\n', recording "\n"/"\r\n"/none
// - parseLine:           split off indentation
// - parseExpression:     classify the content (empty, comment, entry, malformed)
// - lexArguments:        tokenize the argument list of an entry
//
// Usage Example:
//   auto file = Parser::parse("Host example.com\n    User root\n");
//   file.lines[1].expression.arguments[0].text = "admin";
//   std::cout << Serializer::toString(file); // "Host example.com\n    User admin\n"
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/File.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string_view>

namespace sshconf::io
{

/// @brief Hand-rolled parser for ssh_config text.
class Parser
{
  public:
    /// @brief Parse @p text into a File.
    /// @param text Whole-file text.
    /// @param source Path recorded on the returned File.
    /// @return Parsed file; one Line per physical line of @p text.
    [[nodiscard]] static core::File
    parse(std::string_view text, std::optional<std::filesystem::path> source = std::nullopt);

    /// @brief Parse the remaining contents of @p is into a File.
    /// @param is Input stream; read to end of file.
    /// @param source Path recorded on the returned File.
    /// @return Parsed file.
    [[nodiscard]] static core::File
    parse(std::istream &is, std::optional<std::filesystem::path> source = std::nullopt);
};

} // namespace sshconf::io
