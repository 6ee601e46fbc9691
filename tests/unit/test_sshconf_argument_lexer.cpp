//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_sshconf_argument_lexer.cpp
// Purpose: Verify tokenisation of the argument part of a configuration entry.
// Key invariants: Successful results alternate values with whitespace runs and
//                 contain at least one value; failures report a reason.
// Ownership/Lifetime: Token vectors are owned by each test.
// Links: docs/ssh-config-format.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "sshconf/io/ArgumentLexer.hpp"

#include <vector>

using sshconf::core::ArgumentToken;
using sshconf::io::lexArguments;
using sshconf::io::MalformedReason;

namespace
{
using Tokens = std::vector<ArgumentToken>;
} // namespace

TEST(ArgumentLexer, SplitsPureValuesAndWhitespace)
{
    auto tokens = lexArguments("lol!*.com example.com \t !kek!");
    ASSERT_TRUE(tokens);
    const Tokens expected = {
        ArgumentToken::pure("lol!*.com"),
        ArgumentToken::whitespace(" "),
        ArgumentToken::pure("example.com"),
        ArgumentToken::whitespace(" \t "),
        ArgumentToken::pure("!kek!"),
    };
    EXPECT_EQ(*tokens, expected);
}

TEST(ArgumentLexer, KeepsQuotedTextRaw)
{
    auto tokens = lexArguments("\"hello # \\\" lol \"");
    ASSERT_TRUE(tokens);
    ASSERT_EQ(tokens->size(), 1u);
    EXPECT_EQ((*tokens)[0], ArgumentToken::quoted("hello # \\\" lol "));
}

TEST(ArgumentLexer, MixesQuotedAndPure)
{
    auto tokens = lexArguments("lol!*.com \"example.com\" \t !kek!");
    ASSERT_TRUE(tokens);
    const Tokens expected = {
        ArgumentToken::pure("lol!*.com"),
        ArgumentToken::whitespace(" "),
        ArgumentToken::quoted("example.com"),
        ArgumentToken::whitespace(" \t "),
        ArgumentToken::pure("!kek!"),
    };
    EXPECT_EQ(*tokens, expected);
}

TEST(ArgumentLexer, EmptyQuotesAreAValue)
{
    auto tokens = lexArguments("\"\"");
    ASSERT_TRUE(tokens);
    EXPECT_EQ(*tokens, Tokens{ArgumentToken::quoted("")});
}

TEST(ArgumentLexer, QuotedValueMayBeFollowedDirectlyByPure)
{
    auto tokens = lexArguments("\"a\"b");
    ASSERT_TRUE(tokens);
    const Tokens expected = {ArgumentToken::quoted("a"), ArgumentToken::pure("b")};
    EXPECT_EQ(*tokens, expected);
}

TEST(ArgumentLexer, RejectsUnquotedHash)
{
    for (const char *text : {"#", "#kek", "k#k", "kek #", "a \"b\" c#"})
    {
        MalformedReason reason = MalformedReason::MissingKeyword;
        EXPECT_FALSE(lexArguments(text, &reason)) << text;
        EXPECT_EQ(reason, MalformedReason::UnquotedHash) << text;
    }
}

TEST(ArgumentLexer, RejectsUnterminatedQuote)
{
    for (const char *text : {"\"lol", "a \"b", "\"escaped \\\""})
    {
        MalformedReason reason = MalformedReason::MissingKeyword;
        EXPECT_FALSE(lexArguments(text, &reason)) << text;
        EXPECT_EQ(reason, MalformedReason::UnterminatedQuote) << text;
    }
}

TEST(ArgumentLexer, RejectsInputWithoutValues)
{
    MalformedReason reason = MalformedReason::MissingKeyword;
    EXPECT_FALSE(lexArguments("", &reason));
    EXPECT_EQ(reason, MalformedReason::MissingArguments);

    reason = MalformedReason::MissingKeyword;
    EXPECT_FALSE(lexArguments(" \t", &reason));
    EXPECT_EQ(reason, MalformedReason::MissingArguments);
}

TEST(ArgumentLexer, ReasonPointerIsOptional)
{
    EXPECT_FALSE(lexArguments("k#k"));
    EXPECT_TRUE(lexArguments("kek"));
}
