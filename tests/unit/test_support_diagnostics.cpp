//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_support_diagnostics.cpp
// Purpose: Cover Expected, diagnostic printing and source path registration.
// Key invariants: Paths are normalised and deduplicated; file id 0 is never
//                 handed out; printed diagnostics omit unknown location parts.
// Ownership/Lifetime: Test owns all support objects.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace sshconf::support;

TEST(SupportExpected, HoldsValueOrError)
{
    Expected<std::string> ok = std::string("value");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), "value");

    Expected<std::string> bad = makeError({}, "boom");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().severity, Severity::Error);
    EXPECT_EQ(bad.error().message, "boom");

    Expected<std::string> copy = ok;
    EXPECT_EQ(copy.value(), "value");
}

TEST(SupportExpected, VoidSpecialisation)
{
    Expected<void> ok;
    EXPECT_TRUE(ok.hasValue());

    Expected<void> bad = makeError({}, "nope");
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "nope");
}

TEST(SupportSourceManager, NormalisesAndDeduplicates)
{
    SourceManager sm;
    const uint32_t a = sm.addFile("dir/../ssh_config");
    const uint32_t b = sm.addFile("ssh_config");
    const uint32_t c = sm.addFile("other");
    EXPECT_NE(a, 0u);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(sm.getPath(a), "ssh_config");
    EXPECT_EQ(sm.getPath(0), "");
    EXPECT_EQ(sm.getPath(99), "");
}

TEST(SupportDiagnostics, PrintFormats)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("config");

    std::ostringstream os;
    printDiag(Diag{Severity::Warning, "w", {id, 3, 5}}, os, &sm);
    printDiag(Diag{Severity::Note, "n", {id, 0, 0}}, os, &sm);
    printDiag(Diag{Severity::Error, "e", {id, 2, 0}}, os, &sm);
    printDiag(makeError({}, "plain"), os, &sm);
    printDiag(Diag{Severity::Error, "no manager", {id, 1, 1}}, os);
    EXPECT_EQ(os.str(),
              "config:3:5: warning: w\n"
              "config: note: n\n"
              "config:2: error: e\n"
              "error: plain\n"
              "error: no manager\n");
}

TEST(SupportDiagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine de;
    de.report({Severity::Note, "n", {}});
    de.report({Severity::Warning, "w", {}});
    de.report({Severity::Error, "e", {}});
    de.report({Severity::Error, "e2", {}});
    EXPECT_EQ(de.diagnostics().size(), 4u);
    EXPECT_EQ(de.warningCount(), 1u);
    EXPECT_EQ(de.errorCount(), 2u);

    std::ostringstream os;
    de.printAll(os);
    EXPECT_EQ(os.str(), "note: n\nwarning: w\nerror: e\nerror: e2\n");
}
