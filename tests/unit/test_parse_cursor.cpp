//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_parse_cursor.cpp
// Purpose: Exercise the character cursor shared by the line and argument scanners.
// Key invariants: Offsets never run past the end; consumed runs are views into the input.
// Ownership/Lifetime: Cursors borrow string literals that outlive each test.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "sshconf/parse/Cursor.h"

using sshconf::parse::Cursor;

TEST(ParseCursor, ConsumesBlankAndNonBlankRuns)
{
    Cursor cur(" \tHost  example.com");
    EXPECT_EQ(cur.consumeBlanks(), " \t");
    EXPECT_EQ(cur.consumeNonBlank(), "Host");
    EXPECT_EQ(cur.consumeBlanks(), "  ");
    EXPECT_EQ(cur.consumeNonBlank(), "example.com");
    EXPECT_TRUE(cur.atEnd());
    EXPECT_EQ(cur.peek(), '\0');
    EXPECT_EQ(cur.consumeBlanks(), "");
}

TEST(ParseCursor, ConsumeWhileStopsAtFirstMismatch)
{
    Cursor cur("User=root");
    EXPECT_EQ(cur.consumeWhile(sshconf::parse::isKeywordChar), "User");
    EXPECT_EQ(cur.offset(), 4u);
    EXPECT_TRUE(cur.consumeIf('='));
    EXPECT_FALSE(cur.consumeIf('='));
    EXPECT_EQ(cur.remaining(), "root");
    EXPECT_EQ(cur.view(), "User=root");
}

TEST(ParseCursor, AdvanceStopsAtEnd)
{
    Cursor cur("ab");
    cur.advance();
    EXPECT_EQ(cur.peek(), 'b');
    cur.advance();
    cur.advance();
    EXPECT_TRUE(cur.atEnd());
    EXPECT_EQ(cur.offset(), 2u);
    EXPECT_FALSE(cur.consumeIf('\0'));
}

TEST(ParseCursor, CharacterClassesAreAscii)
{
    using sshconf::parse::isBlank;
    using sshconf::parse::isKeywordChar;

    EXPECT_TRUE(isBlank(' '));
    EXPECT_TRUE(isBlank('\t'));
    EXPECT_FALSE(isBlank('\r'));
    EXPECT_FALSE(isBlank('\v'));
    EXPECT_FALSE(isBlank('\xA0'));

    EXPECT_TRUE(isKeywordChar('a'));
    EXPECT_TRUE(isKeywordChar('Z'));
    EXPECT_FALSE(isKeywordChar('0'));
    EXPECT_FALSE(isKeywordChar('_'));
    EXPECT_FALSE(isKeywordChar('\xC3'));
}
