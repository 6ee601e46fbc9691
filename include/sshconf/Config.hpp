//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sshconf/Config.hpp
// Purpose: Stable façade for ssh_config parsing, serialization and file IO.
// Key invariants: Re-exports supported interfaces; lexer and classifier
//                 internals stay internal.
// Ownership/Lifetime: Parser/Serializer mirror underlying implementations.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/File.hpp"
#include "sshconf/io/FileIO.hpp"
#include "sshconf/io/Parser.hpp"
#include "sshconf/io/Serializer.hpp"
#include "sshconf/version.hpp"

/// @file include/sshconf/Config.hpp
/// @brief Aggregated public header for the configuration model and its text
///        IO.  Provides the File/Line/Expression/ArgumentToken model, the
///        parser, the serializer and the whole-file read/write helpers.
