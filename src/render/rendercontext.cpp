/*
 * rendercontext.cpp — Immutable state threaded through recursive rendering
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "rendercontext.h"

#include <QSet>

namespace {

const QSet<QString> &inlineParentTags()
{
    static const QSet<QString> tags = {
        QStringLiteral("p"),
        QStringLiteral("item"),
        QStringLiteral("cell"),
        QStringLiteral("note"),
        QStringLiteral("head"),
        QStringLiteral("l"),
    };
    return tags;
}

const QSet<QString> &blockParentTags()
{
    static const QSet<QString> tags = {
        QStringLiteral("div"),
        QStringLiteral("body"),
        QStringLiteral("front"),
        QStringLiteral("back"),
        QStringLiteral("quote"),
        QStringLiteral("figure"),
    };
    return tags;
}

} // anonymous namespace

RenderContext RenderContext::withParent(const QString &tag, const QString &styleHint) const
{
    RenderContext ctx = *this;
    ctx.m_parentTag = tag;
    ctx.m_parentStyleHint = styleHint;
    return ctx;
}

RenderContext RenderContext::withDeeperQuote() const
{
    RenderContext ctx = *this;
    ++ctx.m_quoteDepth;
    return ctx;
}

RenderContext RenderContext::withDeeperBlock() const
{
    RenderContext ctx = *this;
    ++ctx.m_blockDepth;
    return ctx;
}

RenderContext RenderContext::withIndent(int levels) const
{
    RenderContext ctx = *this;
    ctx.m_indentLevel += levels;
    return ctx;
}

RenderContext RenderContext::withLineWidth(int width) const
{
    RenderContext ctx = *this;
    ctx.m_lineWidth = width > 0 ? width : kDefaultLineWidth;
    return ctx;
}

RenderContext RenderContext::withStrictOutput(bool strict) const
{
    RenderContext ctx = *this;
    ctx.m_strictOutput = strict;
    return ctx;
}

RenderContext RenderContext::withIdMap(const IdMap &idMap) const
{
    RenderContext ctx = *this;
    ctx.m_idMap = idMap;
    return ctx;
}

bool RenderContext::isInlineParent() const
{
    return inlineParentTags().contains(m_parentTag);
}

bool RenderContext::isBlockParent() const
{
    return blockParentTags().contains(m_parentTag);
}
