/*
 * textrenderer.h — Plain-text rendering with wrapping and indentation
 *
 * Every handler returns a line sequence. Emphasis is marked with
 * _underscores_, inline quotations get alternating smart quotes, block
 * quotations and verse are indented with spaces.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_TEXTRENDERER_H
#define TEIPRESS_TEXTRENDERER_H

#include <QString>
#include <QStringList>

#include "renderer.h"

class TextRenderer : public Renderer
{
public:
    explicit TextRenderer(int lineWidth = RenderContext::kDefaultLineWidth);

    int lineWidth() const { return m_lineWidth; }

    // Title cached by renderDocumentStart()
    QString title() const { return m_title; }

    RenderOutput renderDocumentStart(const Tei::Document &doc) override;
    RenderOutput renderDocumentEnd() override;
    RenderOutput renderElement(const QDomElement &elem, const QString &tag,
                               const RenderContext &context,
                               Traverser &traverser) override;
    QString formatName() const override { return QStringLiteral("text"); }
    RenderContext rootContext() const override;

    // Inline content as text: _emphasis_, smart-quoted quotations,
    // bracketed notes and TextWrap::kHardBreak for <lb/>.
    QString extractInlineText(const QDomElement &elem, const RenderContext &context) const;

    // Final plain-text form: '\n' joins, nbsp -> space, trailing newline.
    static QString joinLines(const QStringList &lines);

private:
    QStringList renderDiv(const QDomElement &elem, const RenderContext &context,
                          Traverser &traverser);
    QStringList renderHead(const QDomElement &elem, const RenderContext &context) const;
    QStringList renderParagraph(const QDomElement &elem, const RenderContext &context) const;
    QStringList renderQuote(const QDomElement &elem, const RenderContext &context,
                            Traverser &traverser);
    QStringList renderLineGroup(const QDomElement &elem, const RenderContext &context,
                                Traverser &traverser);
    QStringList renderList(const QDomElement &elem, const RenderContext &context) const;
    QStringList renderTable(const QDomElement &elem, const RenderContext &context) const;
    QStringList renderFigure(const QDomElement &elem, const RenderContext &context) const;
    QStringList renderMilestone(const QDomElement &elem, const RenderContext &context) const;
    QStringList renderSigned(const QDomElement &elem, const RenderContext &context) const;
    QStringList renderFallback(const QDomElement &elem, const RenderContext &context) const;

    // Verse: head, lines and nested stanzas of one group
    QStringList renderVerseBody(const QDomElement &group, const QString &groupRend,
                                const RenderContext &context, Traverser &traverser);

    struct VerseLine {
        QString text;
        QString rend;
    };
    QStringList formatVerseLines(const QList<VerseLine> &verse, const QString &groupRend,
                                 const RenderContext &context) const;

    // Wrap text at the context's indent, honouring hard breaks
    QStringList wrapText(const QString &text, const RenderContext &context) const;

    // Section ("front", "body", "back") a division heads, empty if nested
    static QString enclosingSection(const QDomElement &division, const RenderContext &context);

    int m_lineWidth;
    QString m_title;
};

#endif // TEIPRESS_TEXTRENDERER_H
