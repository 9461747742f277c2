/*
 * htmlrenderer.cpp — Single-file HTML rendering
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "htmlrenderer.h"
#include "markuputils.h"
#include "stylesheets.h"
#include "teidocument.h"
#include "teitags.h"
#include "traverser.h"

#include <QUrl>

namespace {

bool isAbsoluteUrl(const QString &target)
{
    if (target.startsWith(QLatin1String("//")))
        return true;
    return !QUrl(target).scheme().isEmpty();
}

QString indentLines(const QString &text, const QString &indent)
{
    QStringList lines = text.split(QLatin1Char('\n'));
    for (QString &line : lines)
        line.prepend(indent);
    return lines.join(QLatin1Char('\n'));
}

} // anonymous namespace

HtmlRenderer::HtmlRenderer() = default;

RenderContext HtmlRenderer::rootContext() const
{
    return Renderer::rootContext().withStrictOutput(m_strictOutput);
}

RenderOutput HtmlRenderer::renderDocumentStart(const Tei::Document &doc)
{
    m_title = doc.title();

    const QString voidClose = m_strictOutput ? QStringLiteral(" /") : QString();

    QStringList parts;
    parts.append(QStringLiteral("<!DOCTYPE html>"));
    parts.append(QStringLiteral("<html lang=\"%1\">").arg(MarkupUtils::escapeAttribute(doc.language())));
    parts.append(QStringLiteral("<head>"));
    parts.append(QStringLiteral("  <meta charset=\"UTF-8\"%1>").arg(voidClose));
    parts.append(QStringLiteral("  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\"%1>")
                     .arg(voidClose));
    parts.append(QStringLiteral("  <title>%1</title>").arg(MarkupUtils::escapeText(m_title)));

    parts.append(QStringLiteral("  <style>"));
    for (const QString &rule : Stylesheets::defaultRules())
        parts.append(QStringLiteral("    ") + rule);
    if (m_stylesheetLinks.isEmpty() && !m_customCss.isEmpty()) {
        parts.append(QString());
        parts.append(QStringLiteral("    /* Custom styles */"));
        for (const QString &line : m_customCss.split(QLatin1Char('\n')))
            parts.append(QStringLiteral("    ") + line);
    }
    parts.append(QStringLiteral("  </style>"));

    for (const QString &href : m_stylesheetLinks) {
        parts.append(QStringLiteral("  <link rel=\"stylesheet\" type=\"text/css\" href=\"%1\"%2>")
                         .arg(MarkupUtils::escapeAttribute(href), voidClose));
    }

    parts.append(QStringLiteral("</head>"));
    parts.append(QStringLiteral("<body>"));
    parts.append(QStringLiteral("<h1>%1</h1>").arg(MarkupUtils::escapeText(m_title)));
    parts.append(QString());

    return parts.join(QLatin1Char('\n'));
}

RenderOutput HtmlRenderer::renderDocumentEnd()
{
    return QStringLiteral("\n</body>\n</html>\n");
}

RenderOutput HtmlRenderer::renderElement(const QDomElement &elem, const QString &tag,
                                         const RenderContext &context,
                                         Traverser &traverser)
{
    switch (Tei::tagFromName(tag)) {
    case Tei::Tag::Div:
        return renderDiv(elem, context, traverser);
    case Tei::Tag::Head:
        return renderHead(elem, context);
    case Tei::Tag::P:
        return renderParagraph(elem, context);
    case Tei::Tag::Quote:
        return renderQuote(elem, context, traverser);
    case Tei::Tag::Lg:
        return renderLineGroup(elem, context, traverser);
    case Tei::Tag::List:
        return renderList(elem, context);
    case Tei::Tag::Table:
        return renderTable(elem, context);
    case Tei::Tag::Figure:
        return renderFigure(elem, context);
    case Tei::Tag::Milestone:
        return renderMilestone(elem, context);
    case Tei::Tag::Signed:
        return renderSigned(elem, context);
    default:
        // Unknown block element: text only
        return renderTextContent(elem, context);
    }
}

// --- Helpers ---

QString HtmlRenderer::escape(const QString &text, const RenderContext &context)
{
    return context.strictOutput() ? MarkupUtils::escapeText(text) : text;
}

QString HtmlRenderer::escapeAttr(const QString &text, const RenderContext &context)
{
    return context.strictOutput() ? MarkupUtils::escapeAttribute(text) : text;
}

QString HtmlRenderer::classAttribute(const QString &cls, const RenderContext &context)
{
    if (cls.isEmpty())
        return QString();
    return QStringLiteral(" class=\"%1\"").arg(escapeAttr(cls, context));
}

QString HtmlRenderer::imageSource(const QString &url) const
{
    return m_imageMap.value(url, url);
}

QString HtmlRenderer::resolveReference(const QString &target, const RenderContext &context)
{
    const bool fragment = target.startsWith(QLatin1Char('#'));
    const bool absolute = isAbsoluteUrl(target);

    if (!fragment && !absolute && context.hasIdMap()) {
        const auto it = context.idMap().constFind(target);
        if (it != context.idMap().constEnd())
            return it.value() + QLatin1Char('#') + target;
    }
    if (fragment || absolute)
        return target;
    return QLatin1Char('#') + target;
}

// --- Block handlers ---

QString HtmlRenderer::renderDiv(const QDomElement &elem, const RenderContext &context,
                                Traverser &traverser)
{
    const QString type = elem.attribute(QStringLiteral("type"));
    const QString id = Tei::xmlId(elem);

    QString open = QStringLiteral("<div");
    if (!id.isEmpty())
        open += QStringLiteral(" id=\"%1\"").arg(escapeAttr(id, context));
    open += classAttribute(type, context) + QLatin1Char('>');

    QStringList parts;
    parts.append(open);
    const RenderContext childContext = context.withParent(QStringLiteral("div"), type);
    for (const RenderOutput &child : renderChildren(elem, childContext, traverser))
        parts.append(Output::toText(child));
    parts.append(QStringLiteral("</div>"));
    return parts.join(QLatin1Char('\n'));
}

QString HtmlRenderer::renderHead(const QDomElement &elem, const RenderContext &context)
{
    const QString parent = context.parentTag();
    if (parent != QLatin1String("div") && !Tei::isSectionName(parent)) {
        // Poem titles and figure captions are rendered by their parent
        return QString();
    }

    // The enclosing <div> carries the anchor
    const QString content = renderTextContent(elem, context.withParent(QStringLiteral("head")));
    return QStringLiteral("<h2>%1</h2>").arg(content);
}

QString HtmlRenderer::renderParagraph(const QDomElement &elem, const RenderContext &context)
{
    const QString rend = styleHint(elem);
    const QString content = renderTextContent(elem, context.withParent(QStringLiteral("p"), rend));
    return QStringLiteral("<p%1>%2</p>").arg(classAttribute(rend, context), content);
}

QString HtmlRenderer::renderQuote(const QDomElement &elem, const RenderContext &context,
                                  Traverser &traverser)
{
    if (context.isInlineParent()) {
        const QuotePair quotes = smartQuotes(context.quoteDepth());
        return quotes.open + renderTextContent(elem, context.withDeeperQuote()) + quotes.close;
    }

    const RenderContext blockContext = context.withDeeperBlock().withDeeperQuote();

    QStringList children;
    bool hasBlockChildren = false;
    // Mixed content stays one paragraph so the surrounding text survives
    const QList<QDomElement> blockCandidates =
        hasDirectText(elem) ? QList<QDomElement>() : Tei::childElements(elem);
    for (const QDomElement &child : blockCandidates) {
        const QString childTag = Tei::localTag(child);
        if (!Tei::isBlockLevel(Tei::tagFromName(childTag)))
            continue;
        hasBlockChildren = true;
        const RenderOutput result =
            traverser.traverseElement(child, blockContext.withParent(childTag, styleHint(child)));
        if (!Output::isEmpty(result))
            children.append(Output::toText(result));
    }

    if (hasBlockChildren)
        return QStringLiteral("<blockquote>\n%1\n</blockquote>").arg(children.join(QLatin1Char('\n')));

    // Bare text: one paragraph
    const QString content = renderTextContent(elem, blockContext.withParent(QStringLiteral("quote")));
    return QStringLiteral("<blockquote><p>%1</p></blockquote>").arg(content);
}

QString HtmlRenderer::renderVerseLine(const QDomElement &line, const QString &indent,
                                      const RenderContext &context) const
{
    const QString rend = styleHint(line);
    const QString cls = rend.isEmpty() ? QStringLiteral("line") : QStringLiteral("line ") + rend;
    const QString content = renderTextContent(line, context.withParent(QStringLiteral("l"), rend));
    return QStringLiteral("%1<div%2>%3</div>").arg(indent, classAttribute(cls, context), content);
}

QString HtmlRenderer::renderLineGroup(const QDomElement &elem, const RenderContext &context,
                                      Traverser &traverser)
{
    const QString rend = styleHint(elem);
    const QString cls = rend.isEmpty() ? QStringLiteral("poem") : QStringLiteral("poem ") + rend;
    const RenderContext childContext = context.withParent(QStringLiteral("lg"), rend);

    QStringList parts;
    parts.append(QStringLiteral("<div%1>").arg(classAttribute(cls, context)));

    for (const QDomElement &child : Tei::childElements(elem)) {
        switch (Tei::tagFromName(Tei::localTag(child))) {
        case Tei::Tag::Head:
            parts.append(QStringLiteral("  <div class=\"poem-title\">%1</div>")
                             .arg(renderTextContent(child, childContext.withParent(QStringLiteral("head")))));
            break;
        case Tei::Tag::Lg: {
            const RenderContext stanzaContext = childContext.withParent(QStringLiteral("lg"), styleHint(child));
            parts.append(QStringLiteral("  <div class=\"stanza\">"));
            for (const QDomElement &stanzaChild : Tei::childElements(child)) {
                if (Tei::localTag(stanzaChild) == QLatin1String("l")) {
                    parts.append(renderVerseLine(stanzaChild, QStringLiteral("    "), stanzaContext));
                    continue;
                }
                const RenderOutput result = traverser.traverseElement(stanzaChild, stanzaContext);
                if (!Output::isEmpty(result))
                    parts.append(indentLines(Output::toText(result), QStringLiteral("    ")));
            }
            parts.append(QStringLiteral("  </div>"));
            break;
        }
        case Tei::Tag::L:
            parts.append(renderVerseLine(child, QStringLiteral("  "), childContext));
            break;
        default: {
            const RenderOutput result = traverser.traverseElement(child, childContext);
            if (!Output::isEmpty(result))
                parts.append(indentLines(Output::toText(result), QStringLiteral("  ")));
            break;
        }
        }
    }

    parts.append(QStringLiteral("</div>"));
    return parts.join(QLatin1Char('\n'));
}

QString HtmlRenderer::renderList(const QDomElement &elem, const RenderContext &context)
{
    const RenderContext itemContext = context.withParent(QStringLiteral("item"));
    QStringList items;
    for (const QDomElement &item : Tei::childElements(elem, QStringLiteral("item")))
        items.append(QStringLiteral("  <li>%1</li>").arg(renderTextContent(item, itemContext)));

    if (items.isEmpty())
        return QString();
    return QStringLiteral("<ul>\n%1\n</ul>").arg(items.join(QLatin1Char('\n')));
}

QString HtmlRenderer::renderTable(const QDomElement &elem, const RenderContext &context)
{
    const RenderContext cellContext = context.withParent(QStringLiteral("cell"));

    QStringList rows;
    for (const QDomElement &row : Tei::childElements(elem, QStringLiteral("row"))) {
        QStringList cells;
        for (const QDomElement &cell : Tei::childElements(row, QStringLiteral("cell"))) {
            const QString cellTag = cell.attribute(QStringLiteral("role")) == QLatin1String("label")
                ? QStringLiteral("th")
                : QStringLiteral("td");
            cells.append(QStringLiteral("    <%1>%2</%1>").arg(cellTag, renderTextContent(cell, cellContext)));
        }
        rows.append(QStringLiteral("  <tr>\n%1\n  </tr>").arg(cells.join(QLatin1Char('\n'))));
    }

    return QStringLiteral("<table>\n%1\n</table>").arg(rows.join(QLatin1Char('\n')));
}

QString HtmlRenderer::renderFigure(const QDomElement &elem, const RenderContext &context)
{
    const QDomElement graphic = Tei::firstChild(elem, QStringLiteral("graphic"));
    const QString width = graphic.attribute(QStringLiteral("width"));
    const QString rend = styleHint(elem);

    QString open = QStringLiteral("<figure") + classAttribute(rend, context);
    if (!width.isEmpty())
        open += QStringLiteral(" style=\"width: %1;\"").arg(escapeAttr(width, context));
    open += QLatin1Char('>');

    QStringList parts;
    parts.append(open);

    if (!graphic.isNull()) {
        const QString src = imageSource(graphic.attribute(QStringLiteral("url")));
        const QString alt = extractPlainText(Tei::firstChild(elem, QStringLiteral("figDesc")));
        parts.append(QStringLiteral("  <img src=\"%1\" alt=\"%2\"%3>")
                         .arg(escapeAttr(src, context), escapeAttr(alt, context),
                              context.strictOutput() ? QStringLiteral(" /") : QString()));
    }

    const QDomElement head = Tei::firstChild(elem, QStringLiteral("head"));
    if (!head.isNull()) {
        const QString caption = renderTextContent(head, context.withParent(QStringLiteral("figure")));
        parts.append(QStringLiteral("  <figcaption>%1</figcaption>").arg(caption));
    }

    parts.append(QStringLiteral("</figure>"));
    return parts.join(QLatin1Char('\n'));
}

QString HtmlRenderer::renderMilestone(const QDomElement &elem, const RenderContext &context)
{
    const QString variant = formatStyleHint(elem, formatName(),
                                            styleHint(elem, QStringLiteral("space")));
    if (variant == QLatin1String("none"))
        return QString();
    return QStringLiteral("<div class=\"milestone %1\"></div>").arg(escapeAttr(variant, context));
}

QString HtmlRenderer::renderSigned(const QDomElement &elem, const RenderContext &context)
{
    const QString content = renderTextContent(elem, context.withParent(QStringLiteral("signed")));
    return QStringLiteral("<div class=\"signature\">%1</div>").arg(content);
}

// --- Inline content ---

QString HtmlRenderer::renderTextContent(const QDomElement &elem, const RenderContext &context) const
{
    QString result;

    for (QDomNode node = elem.firstChild(); !node.isNull(); node = node.nextSibling()) {
        if (node.isText() || node.isCDATASection()) {
            result += escape(node.toCharacterData().data(), context);
            continue;
        }
        if (!node.isElement())
            continue;

        const QDomElement child = node.toElement();
        switch (Tei::tagFromName(Tei::localTag(child))) {
        case Tei::Tag::Lb:
            result += context.strictOutput() ? QStringLiteral("<br />") : QStringLiteral("<br>");
            break;
        case Tei::Tag::Quote: {
            const QuotePair quotes = smartQuotes(context.quoteDepth());
            result += quotes.open;
            result += renderTextContent(child, context.withDeeperQuote());
            result += quotes.close;
            break;
        }
        case Tei::Tag::Hi: {
            const QString rend = styleHint(child, QStringLiteral("italic"));
            const QString inner = renderTextContent(child, context);
            if (rend == QLatin1String("italic"))
                result += QStringLiteral("<i>%1</i>").arg(inner);
            else if (rend == QLatin1String("bold"))
                result += QStringLiteral("<b>%1</b>").arg(inner);
            else
                result += QStringLiteral("<span class=\"%1\">%2</span>").arg(escapeAttr(rend, context), inner);
            break;
        }
        case Tei::Tag::Emph:
            result += QStringLiteral("<em>%1</em>").arg(renderTextContent(child, context));
            break;
        case Tei::Tag::Foreign:
        case Tei::Tag::Title:
            result += QStringLiteral("<i>%1</i>").arg(renderTextContent(child, context));
            break;
        case Tei::Tag::Ref: {
            const QString target = child.attribute(QStringLiteral("target"));
            const QString inner = renderTextContent(child, context);
            if (target.isEmpty()) {
                result += inner;
                break;
            }
            result += QStringLiteral("<a href=\"%1\">%2</a>")
                          .arg(escapeAttr(resolveReference(target, context), context), inner);
            break;
        }
        case Tei::Tag::Note:
            result += QStringLiteral("<sup>[%1]</sup>").arg(escape(extractPlainText(child), context));
            break;
        default:
            // Unknown inline element: text only
            result += escape(child.text(), context);
            break;
        }
    }

    return result;
}
