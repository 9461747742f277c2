/*
 * textrenderer.cpp — Plain-text rendering with wrapping and indentation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textrenderer.h"
#include "teidocument.h"
#include "teitags.h"
#include "textwrapper.h"
#include "traverser.h"

#include <algorithm>

namespace {

const QString kStars = QStringLiteral("*       *       *       *       *");
const QString kPoemIndent = QStringLiteral("    ");
const QString kBullet = QStringLiteral("  • ");

bool isCentered(const QString &rend)
{
    return rend == QLatin1String("center") || rend == QLatin1String("centered");
}

int extraVerseIndent(const QString &rend)
{
    if (rend == QLatin1String("indent"))
        return 2;
    if (rend == QLatin1String("indent2"))
        return 4;
    if (rend == QLatin1String("indent3"))
        return 6;
    return 0;
}

} // anonymous namespace

TextRenderer::TextRenderer(int lineWidth)
    : m_lineWidth(lineWidth > 0 ? lineWidth : RenderContext::kDefaultLineWidth)
{
}

RenderContext TextRenderer::rootContext() const
{
    return Renderer::rootContext().withLineWidth(m_lineWidth);
}

RenderOutput TextRenderer::renderDocumentStart(const Tei::Document &doc)
{
    m_title = doc.title();
    return QStringList();
}

RenderOutput TextRenderer::renderDocumentEnd()
{
    return QStringList();
}

RenderOutput TextRenderer::renderElement(const QDomElement &elem, const QString &tag,
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
        return renderFallback(elem, context);
    }
}

// --- Block handlers ---

QString TextRenderer::enclosingSection(const QDomElement &division, const RenderContext &context)
{
    if (Tei::isSectionName(context.parentTag()))
        return context.parentTag();
    const QString domParent = Tei::localTag(division.parentNode().toElement());
    if (Tei::isSectionName(domParent))
        return domParent;
    return QString();
}

QStringList TextRenderer::renderDiv(const QDomElement &elem, const RenderContext &context,
                                    Traverser &traverser)
{
    const QString section = enclosingSection(elem, context);
    const RenderContext childContext = context.withParent(QStringLiteral("div"), styleHint(elem));
    const RenderContext headContext = section.isEmpty() ? childContext
                                                        : childContext.withParent(section);

    QStringList lines;
    for (const QDomElement &child : Tei::childElements(elem)) {
        const bool isHead = Tei::localTag(child) == QLatin1String("head");
        lines += Output::toLines(traverser.traverseElement(child, isHead ? headContext : childContext));
    }
    return lines;
}

QStringList TextRenderer::renderHead(const QDomElement &elem, const RenderContext &context) const
{
    const QString heading = extractPlainText(elem).simplified();
    if (heading.isEmpty())
        return {};

    const QString parent = context.parentTag();
    if (parent == QLatin1String("body"))
        return {QString(), QString(), QString(), heading.toUpper(), QString(), QString()};
    if (parent == QLatin1String("front"))
        return {heading, QString(heading.length(), QLatin1Char('=')), QString()};
    if (parent == QLatin1String("back"))
        return {heading.toUpper(), QString()};
    if (parent == QLatin1String("div"))
        return {heading.toUpper(), QString(), QString()};

    // Poem titles and figure captions are rendered by their parent
    return {};
}

QStringList TextRenderer::renderParagraph(const QDomElement &elem, const RenderContext &context) const
{
    QStringList lines = wrapText(extractInlineText(elem, context), context);
    if (lines.isEmpty())
        return {};
    lines.append(QString());
    return lines;
}

QStringList TextRenderer::renderQuote(const QDomElement &elem, const RenderContext &context,
                                      Traverser &traverser)
{
    if (context.isInlineParent()) {
        const QuotePair quotes = smartQuotes(context.quoteDepth());
        const QString inner = extractInlineText(elem, context.withDeeperQuote());
        return wrapText(quotes.open + inner.trimmed() + quotes.close, context);
    }

    const RenderContext blockContext = context.withIndent(1)
                                           .withDeeperBlock()
                                           .withDeeperQuote()
                                           .withParent(QStringLiteral("quote"), styleHint(elem));

    // Mixed content stays one paragraph so the surrounding text survives
    QList<QDomElement> blockChildren;
    if (!hasDirectText(elem)) {
        for (const QDomElement &child : Tei::childElements(elem)) {
            if (Tei::isBlockLevel(Tei::tagFromName(Tei::localTag(child))))
                blockChildren.append(child);
        }
    }

    if (!blockChildren.isEmpty()) {
        QStringList lines;
        for (const QDomElement &child : blockChildren)
            lines += Output::toLines(traverser.traverseElement(child, blockContext));
        return lines;
    }

    // Bare text: one indented paragraph
    QStringList lines = wrapText(extractInlineText(elem, blockContext), blockContext);
    if (lines.isEmpty())
        return {};
    lines.append(QString());
    return lines;
}

QStringList TextRenderer::renderLineGroup(const QDomElement &elem, const RenderContext &context,
                                          Traverser &traverser)
{
    QStringList lines = renderVerseBody(elem, styleHint(elem), context, traverser);
    lines.append(QString());
    return lines;
}

QStringList TextRenderer::renderVerseBody(const QDomElement &group, const QString &groupRend,
                                          const RenderContext &context, Traverser &traverser)
{
    const RenderContext childContext = context.withParent(QStringLiteral("lg"), groupRend);
    QStringList lines;
    QList<VerseLine> pending;

    auto flush = [&]() {
        lines += formatVerseLines(pending, groupRend, context);
        pending.clear();
    };

    for (const QDomElement &child : Tei::childElements(group)) {
        switch (Tei::tagFromName(Tei::localTag(child))) {
        case Tei::Tag::Head: {
            flush();
            const QString title = extractPlainText(child).simplified().toUpper();
            if (title.isEmpty())
                break;
            if (isCentered(groupRend))
                lines.append(TextWrap::center(title, context.lineWidth()));
            else
                lines.append(context.currentIndent() + kPoemIndent + title);
            lines.append(QString());
            break;
        }
        case Tei::Tag::Lg: {
            flush();
            const QString stanzaRend = styleHint(child, groupRend);
            lines += renderVerseBody(child, stanzaRend, context, traverser);
            lines.append(QString());
            break;
        }
        case Tei::Tag::L: {
            const QString rend = styleHint(child);
            const QString text =
                extractInlineText(child, childContext.withParent(QStringLiteral("l"), rend)).simplified();
            pending.append({text, rend});
            break;
        }
        default:
            flush();
            lines += Output::toLines(traverser.traverseElement(child, childContext));
            break;
        }
    }
    flush();
    return lines;
}

QStringList TextRenderer::formatVerseLines(const QList<VerseLine> &verse, const QString &groupRend,
                                           const RenderContext &context) const
{
    QStringList lines;
    if (verse.isEmpty())
        return lines;

    const int width = context.lineWidth();

    if (isCentered(groupRend)) {
        // Centre the stanza as one block; per-line indents are dropped
        int longest = 0;
        for (const VerseLine &line : verse)
            longest = qMax(longest, TextWrap::visualLength(line.text));
        const QString blockPadding(qMax(0, (width - longest) / 2), QLatin1Char(' '));

        for (const VerseLine &line : verse) {
            if (isCentered(line.rend))
                lines.append(TextWrap::center(line.text, width));
            else
                lines.append(blockPadding + line.text);
        }
        return lines;
    }

    for (const VerseLine &line : verse) {
        if (isCentered(line.rend)) {
            lines.append(TextWrap::center(line.text, width));
        } else {
            const QString extra(extraVerseIndent(line.rend), QLatin1Char(' '));
            lines.append(context.currentIndent() + kPoemIndent + extra + line.text);
        }
    }
    return lines;
}

QStringList TextRenderer::renderList(const QDomElement &elem, const RenderContext &context) const
{
    const RenderContext itemContext = context.withParent(QStringLiteral("item"));
    const QString indent = context.currentIndent();
    const QString hanging = indent + QString(kBullet.length(), QLatin1Char(' '));

    QStringList lines;
    for (const QDomElement &item : Tei::childElements(elem, QStringLiteral("item"))) {
        const QString text = extractInlineText(item, itemContext);
        lines += TextWrap::fill(text, context.lineWidth(), indent + kBullet, hanging);
    }
    if (lines.isEmpty())
        return {};
    lines.append(QString());
    return lines;
}

QStringList TextRenderer::renderTable(const QDomElement &elem, const RenderContext &context) const
{
    QList<QStringList> rows;
    for (const QDomElement &row : Tei::childElements(elem, QStringLiteral("row"))) {
        QStringList cells;
        for (const QDomElement &cell : Tei::childElements(row, QStringLiteral("cell")))
            cells.append(extractPlainText(cell).simplified());
        if (!cells.isEmpty())
            rows.append(cells);
    }
    if (rows.isEmpty())
        return {};

    qsizetype columns = 0;
    for (const QStringList &row : rows)
        columns = qMax(columns, row.size());

    QList<qsizetype> widths(columns, 0);
    for (const QStringList &row : rows) {
        for (qsizetype i = 0; i < row.size(); ++i)
            widths[i] = qMax(widths[i], row.at(i).length());
    }

    const QString prefix = context.currentIndent() + QStringLiteral("  ");
    QStringList lines;
    for (const QStringList &row : rows) {
        QStringList padded;
        for (qsizetype i = 0; i < row.size(); ++i) {
            const bool last = i == row.size() - 1;
            padded.append(last ? row.at(i) : row.at(i).leftJustified(widths.at(i)));
        }
        lines.append(prefix + padded.join(QStringLiteral("  ")));
    }
    lines.append(QString());
    return lines;
}

QStringList TextRenderer::renderFigure(const QDomElement &elem, const RenderContext &context) const
{
    const QString indent = context.currentIndent();
    const QString caption = extractPlainText(Tei::firstChild(elem, QStringLiteral("head"))).simplified();

    QStringList lines;
    if (caption.isEmpty()) {
        lines.append(indent + QStringLiteral("[Illustration]"));
    } else {
        lines = TextWrap::fill(QStringLiteral("[Illustration: %1]").arg(caption),
                               context.lineWidth(), indent, indent);
    }
    lines.append(QString());
    return lines;
}

QStringList TextRenderer::renderMilestone(const QDomElement &elem, const RenderContext &context) const
{
    const QString variant = formatStyleHint(elem, formatName(),
                                            styleHint(elem, QStringLiteral("space")));
    if (variant == QLatin1String("none"))
        return {};
    if (variant == QLatin1String("stars"))
        return {TextWrap::center(kStars, context.lineWidth()), QString()};
    return {QString(), QString()};
}

QStringList TextRenderer::renderSigned(const QDomElement &elem, const RenderContext &context) const
{
    const QString text = extractInlineText(elem, context.withParent(QStringLiteral("signed")));

    QStringList lines;
    for (const QString &segment : text.split(TextWrap::kHardBreak)) {
        for (const QString &line : TextWrap::fill(segment, context.lineWidth()))
            lines.append(TextWrap::alignRight(line, context.lineWidth()));
    }
    if (lines.isEmpty())
        return {};
    lines.append(QString());
    return lines;
}

QStringList TextRenderer::renderFallback(const QDomElement &elem, const RenderContext &context) const
{
    QStringList lines = wrapText(extractPlainText(elem), context);
    if (lines.isEmpty())
        return {};
    lines.append(QString());
    return lines;
}

// --- Inline text ---

QString TextRenderer::extractInlineText(const QDomElement &elem, const RenderContext &context) const
{
    QString result;

    for (QDomNode node = elem.firstChild(); !node.isNull(); node = node.nextSibling()) {
        if (node.isText() || node.isCDATASection()) {
            result += node.toCharacterData().data();
            continue;
        }
        if (!node.isElement())
            continue;

        const QDomElement child = node.toElement();
        switch (Tei::tagFromName(Tei::localTag(child))) {
        case Tei::Tag::Lb:
            result += TextWrap::kHardBreak;
            break;
        case Tei::Tag::Quote: {
            const QuotePair quotes = smartQuotes(context.quoteDepth());
            result += quotes.open;
            result += extractInlineText(child, context.withDeeperQuote());
            result += quotes.close;
            break;
        }
        case Tei::Tag::Hi:
        case Tei::Tag::Emph:
        case Tei::Tag::Title:
        case Tei::Tag::Foreign:
            result += TextWrap::kEmphasisMarker;
            result += extractInlineText(child, context).trimmed();
            result += TextWrap::kEmphasisMarker;
            break;
        case Tei::Tag::Note:
            result += QStringLiteral(" [%1]").arg(extractPlainText(child));
            break;
        case Tei::Tag::Ref:
            result += extractInlineText(child, context);
            break;
        default:
            result += child.text();
            break;
        }
    }

    return result;
}

QStringList TextRenderer::wrapText(const QString &text, const RenderContext &context) const
{
    const QString indent = context.currentIndent();
    QStringList lines;
    const QStringList segments = text.split(TextWrap::kHardBreak);
    for (const QString &segment : segments)
        lines += TextWrap::fill(segment, context.lineWidth(), indent, indent);
    return lines;
}

QString TextRenderer::joinLines(const QStringList &lines)
{
    if (lines.isEmpty())
        return QString();
    QString text = lines.join(QLatin1Char('\n'));
    text.replace(QChar(0x00A0), QLatin1Char(' '));
    text += QLatin1Char('\n');
    return text;
}
