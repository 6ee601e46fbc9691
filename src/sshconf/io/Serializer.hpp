//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Serializer class, which converts the configuration
// model back to text.  Each node prints exactly the bytes it was parsed from:
//
// - ArgumentToken: text; Quoted tokens are wrapped in '"'
// - Expression:    keyword + separator + tokens, or the stored text
// - Line:          indentPrefix + expression + indentSuffix + terminator
// - File:          all lines in order
//
// Design Decisions:
// - Stateless: static methods only, nothing to configure
// - Total: every model value can be printed; there is no error path
// - Stream-based: write() targets any std::ostream; toString() wraps it
//
// Thread Safety:
// The Serializer is stateless, so different files can be serialized
// concurrently without synchronization.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/File.hpp"

#include <ostream>
#include <string>

namespace sshconf::io
{

/// @brief Serializes configuration files and their parts to text.
class Serializer
{
  public:
    /// @brief Write file @p f to output stream @p os.
    static void write(const core::File &f, std::ostream &os);

    /// @brief Write line @p line, including its terminator, to @p os.
    static void write(const core::Line &line, std::ostream &os);

    /// @brief Write expression @p expr to @p os.
    static void write(const core::Expression &expr, std::ostream &os);

    /// @brief Write token @p token to @p os.
    static void write(const core::ArgumentToken &token, std::ostream &os);

    /// @brief Serialize file @p f to a string.
    static std::string toString(const core::File &f);

    /// @brief Serialize line @p line, including its terminator, to a string.
    static std::string toString(const core::Line &line);

    /// @brief Serialize expression @p expr to a string.
    static std::string toString(const core::Expression &expr);

    /// @brief Serialize token @p token to a string.
    static std::string toString(const core::ArgumentToken &token);
};

} // namespace sshconf::io
