/*
 * test_rendercontext.cpp — Immutable rendering context
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "rendercontext.h"

TEST(RenderContextTest, Defaults)
{
    const RenderContext ctx;
    EXPECT_TRUE(ctx.parentTag().isEmpty());
    EXPECT_EQ(ctx.quoteDepth(), 0);
    EXPECT_EQ(ctx.blockDepth(), 0);
    EXPECT_EQ(ctx.indentLevel(), 0);
    EXPECT_EQ(ctx.indentUnit(), QStringLiteral("    "));
    EXPECT_TRUE(ctx.currentIndent().isEmpty());
    EXPECT_EQ(ctx.lineWidth(), 72);
    EXPECT_FALSE(ctx.strictOutput());
    EXPECT_FALSE(ctx.hasIdMap());
}

TEST(RenderContextTest, DerivationsLeaveReceiverUnchanged)
{
    const RenderContext ctx = RenderContext().withParent(QStringLiteral("p"), QStringLiteral("x"));
    const RenderContext before = ctx;

    const RenderContext a = ctx.withParent(QStringLiteral("div"));
    const RenderContext b = ctx.withDeeperQuote();
    const RenderContext c = ctx.withDeeperBlock();
    const RenderContext d = ctx.withIndent(2);
    const RenderContext e = ctx.withStrictOutput(true);
    const RenderContext f = ctx.withIdMap({{QStringLiteral("a"), QStringLiteral("b.xhtml")}});
    const RenderContext g = ctx.withLineWidth(40);

    EXPECT_TRUE(ctx == before);
    EXPECT_EQ(a.parentTag(), QStringLiteral("div"));
    EXPECT_TRUE(a.parentStyleHint().isEmpty());
    EXPECT_EQ(b.quoteDepth(), 1);
    EXPECT_EQ(c.blockDepth(), 1);
    EXPECT_EQ(d.indentLevel(), 2);
    EXPECT_TRUE(e.strictOutput());
    EXPECT_TRUE(f.hasIdMap());
    EXPECT_EQ(g.lineWidth(), 40);
    EXPECT_EQ(ctx.parentTag(), QStringLiteral("p"));
    EXPECT_EQ(ctx.quoteDepth(), 0);
}

TEST(RenderContextTest, UnrelatedDerivationsCommute)
{
    const RenderContext ctx;
    EXPECT_TRUE(ctx.withDeeperQuote().withIndent(1) == ctx.withIndent(1).withDeeperQuote());
    EXPECT_TRUE(ctx.withDeeperBlock().withStrictOutput(true)
                == ctx.withStrictOutput(true).withDeeperBlock());
}

TEST(RenderContextTest, CurrentIndentFollowsLevel)
{
    const RenderContext ctx;
    EXPECT_EQ(ctx.withIndent(2).currentIndent(), QStringLiteral("        "));
    EXPECT_EQ(ctx.withIndent(2).withIndent(-1).currentIndent(), QStringLiteral("    "));
    EXPECT_TRUE(ctx.withIndent(-3).currentIndent().isEmpty());
}

TEST(RenderContextTest, NonPositiveLineWidthFallsBackToDefault)
{
    EXPECT_EQ(RenderContext().withLineWidth(0).lineWidth(), RenderContext::kDefaultLineWidth);
    EXPECT_EQ(RenderContext().withLineWidth(-5).lineWidth(), RenderContext::kDefaultLineWidth);
}

TEST(RenderContextTest, ParentClassification)
{
    const RenderContext ctx;
    for (const char *tag : {"p", "item", "cell", "note", "head", "l"}) {
        const RenderContext c = ctx.withParent(QString::fromLatin1(tag));
        EXPECT_TRUE(c.isInlineParent()) << tag;
        EXPECT_FALSE(c.isBlockParent()) << tag;
    }
    for (const char *tag : {"div", "body", "front", "back", "quote", "figure"}) {
        const RenderContext c = ctx.withParent(QString::fromLatin1(tag));
        EXPECT_TRUE(c.isBlockParent()) << tag;
        EXPECT_FALSE(c.isInlineParent()) << tag;
    }
}

TEST(RenderContextTest, DocumentRootIsNeitherInlineNorBlock)
{
    const RenderContext ctx = RenderContext().withParent(QStringLiteral("TEI"));
    EXPECT_FALSE(ctx.isInlineParent());
    EXPECT_FALSE(ctx.isBlockParent());
    EXPECT_FALSE(RenderContext().isInlineParent());
    EXPECT_FALSE(RenderContext().isBlockParent());
}
