/*
 * epubrenderer.h — XHTML chapter rendering for EPUB 3 packages
 *
 * Always renders in strict output mode. Each top-level division of
 * front, body and back becomes one chapter file; the id map built over
 * all chapters lets references resolve across files.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_EPUBRENDERER_H
#define TEIPRESS_EPUBRENDERER_H

#include <QDomElement>
#include <QList>
#include <QString>

#include "htmlrenderer.h"

// A top-level division destined for its own chapter file
struct ChapterDivision {
    QDomElement element;
    QString section;    // "front", "body" or "back"
    QString fileName;   // e.g. "chapter3.xhtml"
    QString title;      // heading text, empty when the division has none
    QString label;      // title, or "Chapter 3" style fallback
};

class EpubRenderer : public HtmlRenderer
{
public:
    EpubRenderer();

    RenderOutput renderDocumentStart(const Tei::Document &doc) override;
    RenderOutput renderElement(const QDomElement &elem, const QString &tag,
                               const RenderContext &context,
                               Traverser &traverser) override;
    QString formatName() const override { return QStringLiteral("epub"); }
    RenderContext rootContext() const override;

    /// Complete XHTML file for one division. The heading (if any) becomes an
    /// <h2> anchored at the division's identifier; fallbackTitle is used for
    /// <title> when the division has no heading.
    QString renderChapter(const QDomElement &division, const QString &fallbackTitle,
                          const IdMap &idMap = IdMap());

    /// Chapter divisions in reading order: direct div children of front,
    /// body and back, named front<N>, chapter<N> and back<N>.
    static QList<ChapterDivision> chapterDivisions(const Tei::Document &doc);

    /// Every xml:id inside each chapter (the division's own included),
    /// mapped to the chapter's file name.
    static IdMap buildIdMap(const QList<ChapterDivision> &chapters);
    static IdMap buildIdMap(const Tei::Document &doc);

    static QString xhtmlPreamble(const QString &title);
    static QString xhtmlClosing();
};

#endif // TEIPRESS_EPUBRENDERER_H
