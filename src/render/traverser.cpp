/*
 * traverser.cpp — Generic TEI tree walker
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "traverser.h"
#include "renderer.h"
#include "teidocument.h"
#include "teitags.h"

#include <algorithm>

Traverser::Traverser(Renderer &renderer)
    : m_renderer(renderer)
{
}

RenderOutput Traverser::traverseDocument(const Tei::Document &doc)
{
    QList<RenderOutput> parts;
    parts.append(m_renderer.renderDocumentStart(doc));

    const RenderContext rootContext = m_renderer.rootContext();

    for (const QString &name : Tei::sectionNames()) {
        const QDomElement section = doc.section(name);
        if (section.isNull())
            continue;
        parts.append(traverseSection(section, rootContext.withParent(name)));
    }

    parts.append(m_renderer.renderDocumentEnd());
    return combine(parts);
}

RenderOutput Traverser::traverseSection(const QDomElement &section, const RenderContext &context)
{
    QList<RenderOutput> children;
    for (const QDomElement &child : Tei::childElements(section)) {
        const RenderContext childContext =
            context.withParent(Tei::localTag(child), Renderer::styleHint(child));
        RenderOutput result = traverseElement(child, childContext);
        if (!Output::isEmpty(result))
            children.append(std::move(result));
    }
    return combine(children);
}

RenderOutput Traverser::traverseElement(const QDomElement &elem, const RenderContext &context)
{
    const QString tag = Renderer::stripNamespace(Tei::localTag(elem));
    return m_renderer.renderElement(elem, tag, context, *this);
}

RenderOutput Traverser::combine(const QList<RenderOutput> &parts)
{
    QList<RenderOutput> kept;
    for (const RenderOutput &part : parts) {
        if (!Output::isEmpty(part))
            kept.append(part);
    }

    if (kept.isEmpty())
        return QString();

    const bool allText = std::all_of(kept.cbegin(), kept.cend(), Output::isText);
    if (allText) {
        QString text;
        for (const RenderOutput &part : kept)
            text += std::get<QString>(part);
        return text;
    }

    const bool allLines = std::all_of(kept.cbegin(), kept.cend(), Output::isLines);
    if (allLines) {
        QStringList lines;
        for (const RenderOutput &part : kept)
            lines += std::get<QStringList>(part);
        return lines;
    }

    QString text;
    for (const RenderOutput &part : kept)
        text += Output::toText(part);
    return text;
}
