/*
 * traverser.h — Generic TEI tree walker
 *
 * Knows the document shape (front, body, back) and how to recurse, but
 * nothing about output. Every rendering decision goes to the Renderer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_TRAVERSER_H
#define TEIPRESS_TRAVERSER_H

#include <QDomElement>
#include <QList>

#include "rendercontext.h"
#include "renderoutput.h"

namespace Tei {
class Document;
}

class Renderer;

class Traverser
{
public:
    explicit Traverser(Renderer &renderer);

    Renderer &renderer() const { return m_renderer; }

    // Whole document: preamble, front, body, back, closing
    RenderOutput traverseDocument(const Tei::Document &doc);

    // One section container; each child is visited with a context whose
    // parent is the child itself (tag and rend attribute).
    RenderOutput traverseSection(const QDomElement &section, const RenderContext &context);

    // Strip the namespace and hand the element to the renderer
    RenderOutput traverseElement(const QDomElement &elem, const RenderContext &context);

    // Join partial results: all text -> concatenated text, all line
    // sequences -> one flattened sequence. Empty parts are dropped first.
    // A mix of both (no renderer produces one) is joined as text.
    static RenderOutput combine(const QList<RenderOutput> &parts);

private:
    Renderer &m_renderer;
};

#endif // TEIPRESS_TRAVERSER_H
