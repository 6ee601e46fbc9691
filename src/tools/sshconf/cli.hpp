//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/sshconf/cli.hpp
// Purpose: Declare the reusable entry points behind the `sshconf` executable.
// Key invariants: All output goes to the injected streams; no global state.
// Ownership/Lifetime: Callers own the streams and the SourceManager.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "sshconf/core/File.hpp"
#include "sshconf/core/Line.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "support/source_manager.hpp"
#include "tools/common/ArgvView.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace sshconf::tools
{

/// @brief Fully parsed command line.
struct Invocation
{
    support::Options options;
    bool showVersion = false;
    bool showHelp = false;
    std::string command; ///< "cat", "check", "dump" or "verify"
    std::string path;    ///< configuration file operand
};

/// @brief Parse the arguments that follow the program name.
/// @return The invocation, or an error diagnostic describing the misuse.
support::Expected<Invocation> parseArgs(ArgvView args);

/// @brief Print the usage text to @p os.
void printUsage(std::ostream &os);

/// @brief First line where printing @p file differs from @p original.
/// @return 1-based line number in @p original, or nullopt when the printed
///         text equals @p original.
std::optional<std::size_t> firstMismatchLine(const core::File &file, std::string_view original);

/// @brief Render one parsed line for the `dump` command, without newline.
/// @details Example: `options keyword="Host" separator=" " arguments=[pure "a"]`.
///          Non-empty indents are appended as `prefix="..."`/`suffix="..."`.
std::string describeLine(const core::Line &line);

/// @brief Execute the sshconf CLI with injectable streams and source manager.
/// @param argc Argument count supplied by the caller.
/// @param argv Argument vector containing the program name first.
/// @param out Stream receiving command output.
/// @param err Stream receiving diagnostics and usage errors.
/// @param sm Source manager used to print file locations.
/// @return Zero on success; one on usage, I/O, check or verify failure.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm);

} // namespace sshconf::tools
