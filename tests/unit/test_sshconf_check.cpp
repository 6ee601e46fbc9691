//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_sshconf_check.cpp
// Purpose: Ensure the malformed-entry checker reports one located diagnostic
//          per malformed line.
// Key invariants: Line numbers are 1-based; columns point past the indent.
// Ownership/Lifetime: Diagnostics are owned by the test's engine.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "sshconf/analysis/Check.hpp"
#include "sshconf/io/Parser.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <sstream>

using namespace sshconf;

TEST(Check, CleanFileHasNoDiagnostics)
{
    const core::File file = io::Parser::parse("# c\nHost a\n\n  User root\n");
    support::DiagnosticEngine de;
    EXPECT_EQ(analysis::checkFile(file, 1, de), 0u);
    EXPECT_TRUE(de.diagnostics().empty());
}

TEST(Check, ReportsEachMalformedLine)
{
    const core::File file = io::Parser::parse("Host a\n"
                                              "  Host # kek\n"
                                              "123\n"
                                              "\tPort\n");
    support::DiagnosticEngine de;
    EXPECT_EQ(analysis::checkFile(file, 7, de), 3u);
    EXPECT_EQ(de.warningCount(), 3u);
    EXPECT_EQ(de.errorCount(), 0u);

    const auto &diags = de.diagnostics();
    ASSERT_EQ(diags.size(), 3u);
    EXPECT_EQ(diags[0].message, "malformed entry: unquoted '#' in argument");
    EXPECT_EQ(diags[0].loc.file_id, 7u);
    EXPECT_EQ(diags[0].loc.line, 2u);
    EXPECT_EQ(diags[0].loc.column, 3u);
    EXPECT_EQ(diags[1].message, "malformed entry: missing keyword");
    EXPECT_EQ(diags[1].loc.line, 3u);
    EXPECT_EQ(diags[1].loc.column, 1u);
    EXPECT_EQ(diags[2].message, "malformed entry: missing arguments");
    EXPECT_EQ(diags[2].loc.line, 4u);
    EXPECT_EQ(diags[2].loc.column, 2u);
}

TEST(Check, StrictSeverityCountsAsErrors)
{
    const core::File file = io::Parser::parse("Host \"open\n");
    support::DiagnosticEngine de;
    analysis::checkFile(file, 1, de, support::Severity::Error);
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 0u);
}

TEST(Check, PrintsWithPath)
{
    support::SourceManager sm;
    const uint32_t id = sm.addFile("conf/./ssh_config");
    const core::File file = io::Parser::parse("Host0 x\n");
    support::DiagnosticEngine de;
    analysis::checkFile(file, id, de);

    std::ostringstream os;
    de.printAll(os, &sm);
    EXPECT_EQ(os.str(), "conf/ssh_config:1:1: warning: malformed entry: invalid separator\n");
}
