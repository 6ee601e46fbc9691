//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/ArgvView.hpp
// Purpose: Walk the command line one argument at a time.
// Key invariants: A view with argc <= 0 or a null argv is empty.
// Ownership/Lifetime: Borrows argv from main(); never copies or frees it.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace sshconf::tools
{

/// @brief The unread tail of `argv`.
/// @details parseArgs consumes options and operands by repeatedly reading
///          front() and replacing the view with drop_front().
struct ArgvView
{
    int argc;
    char **argv;

    [[nodiscard]] bool empty() const
    {
        return argc <= 0 || argv == nullptr;
    }

    /// @return The next argument, or an empty view when none is left.
    [[nodiscard]] std::string_view front() const
    {
        if (empty())
            return {};
        return argv[0];
    }

    /// @brief The view without its first @p count arguments.
    [[nodiscard]] ArgvView drop_front(int count = 1) const
    {
        if (empty() || count >= argc)
            return {0, nullptr};
        return {argc - count, argv + count};
    }
};

} // namespace sshconf::tools
