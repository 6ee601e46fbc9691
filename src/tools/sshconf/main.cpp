//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `sshconf` binary.
/// @details All behaviour lives in @ref sshconf::tools::runCLI; the entry point
///          only binds it to the process streams.

#include "support/source_manager.hpp"
#include "tools/sshconf/cli.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    sshconf::support::SourceManager sm;
    return sshconf::tools::runCLI(argc, argv, std::cout, std::cerr, sm);
}
