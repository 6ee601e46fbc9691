//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sshconf/io/FileIO.hpp
// Purpose: Declare whole-file read/write helpers around Parser and Serializer.
// Key invariants: Files are read and written in binary mode, so no newline
//                 translation happens between disk and the model.
// Ownership/Lifetime: Returned Files and strings are owned by the caller.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/File.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace sshconf::io
{

/// @brief Read the whole file at @p path.
/// @return File contents, or an error diagnostic naming @p path.
support::Expected<std::string> readText(const std::filesystem::path &path);

/// @brief Replace the contents of @p path with @p text.
/// @return Success, or an error diagnostic naming @p path.
support::Expected<void> writeText(const std::filesystem::path &path, std::string_view text);

/// @brief Read and parse the configuration file at @p path.
/// @return Parsed file with File::path set to @p path, or the read error.
support::Expected<core::File> readConfigFile(const std::filesystem::path &path);

/// @brief Serialize @p file to @p path.
support::Expected<void> writeConfigFile(const core::File &file, const std::filesystem::path &path);

/// @brief Serialize @p file back to the path it was read from.
/// @return Error diagnostic when @p file has no path or writing fails.
support::Expected<void> writeConfigFile(const core::File &file);

} // namespace sshconf::io
