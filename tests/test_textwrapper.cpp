/*
 * test_textwrapper.cpp — Word wrapping and visual measurement
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "textwrapper.h"

TEST(TextWrapTest, VisualLengthIgnoresEmphasisMarkers)
{
    EXPECT_EQ(TextWrap::visualLength(QStringLiteral("Hello _world_ test")), 16);
    EXPECT_EQ(TextWrap::visualLength(QStringLiteral("_word_")), 4);
    EXPECT_EQ(TextWrap::visualLength(QStringLiteral("plain")), 5);
}

TEST(TextWrapTest, FillBreaksBetweenWords)
{
    const QStringList lines = TextWrap::fill(QStringLiteral("a b c"), 3);
    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines.at(0), QStringLiteral("a b"));
    EXPECT_EQ(lines.at(1), QStringLiteral("c"));
}

TEST(TextWrapTest, FillCollapsesWhitespace)
{
    const QStringList lines = TextWrap::fill(QStringLiteral("  one \n\t two   three "), 72);
    ASSERT_EQ(lines.size(), 1);
    EXPECT_EQ(lines.first(), QStringLiteral("one two three"));
}

TEST(TextWrapTest, IndentCountsAgainstWidth)
{
    const QString indent = QStringLiteral("    ");
    const QStringList lines = TextWrap::fill(QStringLiteral("one two three"), 10, indent, indent);
    const QStringList expected = {
        QStringLiteral("    one"),
        QStringLiteral("    two"),
        QStringLiteral("    three"),
    };
    EXPECT_EQ(lines, expected);
}

TEST(TextWrapTest, LongWordsAreNotBroken)
{
    const QStringList lines = TextWrap::fill(QStringLiteral("supercalifragilistic is long"), 10);
    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines.at(0), QStringLiteral("supercalifragilistic"));
    EXPECT_EQ(lines.at(1), QStringLiteral("is long"));
}

TEST(TextWrapTest, FillOfEmptyTextIsEmpty)
{
    EXPECT_TRUE(TextWrap::fill(QString(), 72).isEmpty());
    EXPECT_TRUE(TextWrap::fill(QStringLiteral("   "), 72).isEmpty());
}

TEST(TextWrapTest, CenterUsesVisualLength)
{
    EXPECT_EQ(TextWrap::center(QStringLiteral("abc"), 11), QStringLiteral("    abc"));
    EXPECT_EQ(TextWrap::center(QStringLiteral("_ab_"), 10), QStringLiteral("    _ab_"));
}

TEST(TextWrapTest, CenterNeverPadsNegatively)
{
    const QString wide = QStringLiteral("this text is wider than the field");
    EXPECT_EQ(TextWrap::center(wide, 10), wide);
}

TEST(TextWrapTest, AlignRight)
{
    EXPECT_EQ(TextWrap::alignRight(QStringLiteral("abc"), 6), QStringLiteral("   abc"));
    EXPECT_EQ(TextWrap::alignRight(QStringLiteral("abcdef"), 3), QStringLiteral("abcdef"));
}
