//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the file adapter used by the tools.  Parsing and serialization
// are pure; this is the only place that touches the filesystem.  Failures are
// reported as error diagnostics rather than exceptions so callers can print
// them with the same printer as every other diagnostic.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Reads and writes configuration files as whole byte streams.

#include "sshconf/io/FileIO.hpp"

#include "sshconf/io/Parser.hpp"
#include "sshconf/io/Serializer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace sshconf::io
{
namespace
{
/// @brief Build an I/O error diagnostic from the current errno.
support::Diag ioError(std::string_view what, const std::filesystem::path &path)
{
    std::string message = std::string(what) + " " + path.generic_string();
    if (errno != 0)
        message += ": " + std::string(std::strerror(errno));
    return support::makeError({}, std::move(message));
}
} // namespace

support::Expected<std::string> readText(const std::filesystem::path &path)
{
    // A directory opens successfully and reads as zero bytes.
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
        return support::makeError({},
                                  "cannot read " + path.generic_string() + ": is a directory");

    errno = 0;
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
        return ioError("cannot open", path);

    in.seekg(0, std::ios::end);
    const auto size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size < 0 || !in)
        return ioError("cannot read", path);

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
        return ioError("cannot read", path);
    return buffer.str();
}

support::Expected<void> writeText(const std::filesystem::path &path, std::string_view text)
{
    errno = 0;
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out)
        return ioError("cannot open", path);

    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out)
        return ioError("cannot write", path);
    return {};
}

support::Expected<core::File> readConfigFile(const std::filesystem::path &path)
{
    auto text = readText(path);
    if (!text)
        return text.error();
    return Parser::parse(std::string_view(text.value()), path);
}

support::Expected<void> writeConfigFile(const core::File &file, const std::filesystem::path &path)
{
    return writeText(path, Serializer::toString(file));
}

support::Expected<void> writeConfigFile(const core::File &file)
{
    if (!file.path)
        return support::makeError({}, "cannot write configuration: file has no path");
    return writeConfigFile(file, *file.path);
}

} // namespace sshconf::io
