//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/sshconf/version.hpp
// Purpose: Version string of the sshconf library and tools.
// Key invariants: SSHCONF_VERSION_STR is a string literal.
// Ownership/Lifetime: Compile-time constant.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#define SSHCONF_VERSION_MAJOR 0
#define SSHCONF_VERSION_MINOR 1
#define SSHCONF_VERSION_PATCH 0
#define SSHCONF_VERSION_STR "0.1.0"
