/*
 * renderer.h — Interface implemented by every output format
 *
 * The Traverser owns document structure and recursion; a Renderer decides
 * what each element looks like. renderElement() receives the traverser so
 * handlers can recurse into descendants with a further-derived context.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_RENDERER_H
#define TEIPRESS_RENDERER_H

#include <QDomElement>
#include <QList>
#include <QSet>
#include <QString>

#include "rendercontext.h"
#include "renderoutput.h"

namespace Tei {
class Document;
}

class Traverser;

struct QuotePair {
    QString open;
    QString close;
};

class Renderer
{
public:
    virtual ~Renderer() = default;

    // Document framing
    virtual RenderOutput renderDocumentStart(const Tei::Document &doc) = 0;
    virtual RenderOutput renderDocumentEnd() = 0;

    // Per-element dispatch. tag is the bare (namespace-free) element name.
    virtual RenderOutput renderElement(const QDomElement &elem, const QString &tag,
                                       const RenderContext &context,
                                       Traverser &traverser) = 0;

    // Format identifier used for per-format style hints ("text", "html", "epub")
    virtual QString formatName() const = 0;

    // Context the traverser starts a document from
    virtual RenderContext rootContext() const;

    // --- Shared helpers ---

    /// Quote glyphs for a quotation opened at the given depth: double
    /// quotes at even depths, single quotes at odd depths.
    static QuotePair smartQuotes(int depth);

    /// All descendant text with markup ignored, trimmed.
    static QString extractPlainText(const QDomElement &elem);

    /// The element's rend attribute, or def when absent.
    static QString styleHint(const QDomElement &elem, const QString &def = QString());

    /// The element's rend-<format> attribute, or def when absent.
    static QString formatStyleHint(const QDomElement &elem, const QString &format,
                                   const QString &def = QString());

    static QString stripNamespace(const QString &tag);

    /// True when elem has non-whitespace text of its own (not inside a
    /// child element).
    static bool hasDirectText(const QDomElement &elem);

protected:
    /// Traverse every child element with the given context, dropping empty
    /// results. Children whose tag is in skipTags are not visited.
    QList<RenderOutput> renderChildren(const QDomElement &elem,
                                       const RenderContext &context,
                                       Traverser &traverser,
                                       const QSet<QString> &skipTags = {}) const;
};

#endif // TEIPRESS_RENDERER_H
