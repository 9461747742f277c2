/*
 * renderer.cpp — Helpers shared by all output formats
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "renderer.h"
#include "teidocument.h"
#include "traverser.h"

RenderContext Renderer::rootContext() const
{
    return RenderContext().withParent(QStringLiteral("TEI"));
}

QuotePair Renderer::smartQuotes(int depth)
{
    if (depth % 2 == 0)
        return {QString(QChar(0x201C)), QString(QChar(0x201D))};
    return {QString(QChar(0x2018)), QString(QChar(0x2019))};
}

QString Renderer::extractPlainText(const QDomElement &elem)
{
    if (elem.isNull())
        return QString();
    return elem.text().trimmed();
}

QString Renderer::styleHint(const QDomElement &elem, const QString &def)
{
    return elem.attribute(QStringLiteral("rend"), def);
}

QString Renderer::formatStyleHint(const QDomElement &elem, const QString &format,
                                  const QString &def)
{
    return elem.attribute(QStringLiteral("rend-") + format, def);
}

QString Renderer::stripNamespace(const QString &tag)
{
    return Tei::stripNamespace(tag);
}

bool Renderer::hasDirectText(const QDomElement &elem)
{
    for (QDomNode node = elem.firstChild(); !node.isNull(); node = node.nextSibling()) {
        if ((node.isText() || node.isCDATASection())
            && !node.toCharacterData().data().trimmed().isEmpty())
            return true;
    }
    return false;
}

QList<RenderOutput> Renderer::renderChildren(const QDomElement &elem,
                                             const RenderContext &context,
                                             Traverser &traverser,
                                             const QSet<QString> &skipTags) const
{
    QList<RenderOutput> results;
    for (const QDomElement &child : Tei::childElements(elem)) {
        if (skipTags.contains(Tei::localTag(child)))
            continue;
        RenderOutput result = traverser.traverseElement(child, context);
        if (!Output::isEmpty(result))
            results.append(std::move(result));
    }
    return results;
}
