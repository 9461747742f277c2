/*
 * htmlrenderer.h — Single-file HTML rendering
 *
 * Every handler returns a string fragment. In strict output mode empty
 * elements are explicitly closed and all source text is escaped; the
 * default mode emits HTML5 void elements and inserts text as-is.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_HTMLRENDERER_H
#define TEIPRESS_HTMLRENDERER_H

#include <QHash>
#include <QString>
#include <QStringList>

#include "renderer.h"

class HtmlRenderer : public Renderer
{
public:
    HtmlRenderer();

    // Custom CSS, inlined after the built-in rules
    void setCustomCss(const QString &css) { m_customCss = css; }
    QString customCss() const { return m_customCss; }

    // Link stylesheets instead of inlining the custom CSS
    void setStylesheetLinks(const QStringList &hrefs) { m_stylesheetLinks = hrefs; }
    QStringList stylesheetLinks() const { return m_stylesheetLinks; }

    void setStrictOutput(bool strict) { m_strictOutput = strict; }
    bool strictOutput() const { return m_strictOutput; }

    // graphic/@url -> src written into <img>; unmapped URLs are kept
    void setImageMap(const QHash<QString, QString> &imageMap) { m_imageMap = imageMap; }

    // Title cached by renderDocumentStart()
    QString title() const { return m_title; }

    RenderOutput renderDocumentStart(const Tei::Document &doc) override;
    RenderOutput renderDocumentEnd() override;
    RenderOutput renderElement(const QDomElement &elem, const QString &tag,
                               const RenderContext &context,
                               Traverser &traverser) override;
    QString formatName() const override { return QStringLiteral("html"); }
    RenderContext rootContext() const override;

    /// Inline content with markup. Tracks quote depth for nested
    /// quotations and resolves references through the context's id map.
    QString renderTextContent(const QDomElement &elem, const RenderContext &context) const;

    /// href for a reference target: a bare identifier found in the id map
    /// becomes "<file>#<id>", "#fragment" and absolute URLs are kept,
    /// anything else is taken as a same-file identifier.
    static QString resolveReference(const QString &target, const RenderContext &context);

protected:
    virtual QString renderDiv(const QDomElement &elem, const RenderContext &context,
                              Traverser &traverser);
    virtual QString renderHead(const QDomElement &elem, const RenderContext &context);
    virtual QString renderParagraph(const QDomElement &elem, const RenderContext &context);
    virtual QString renderQuote(const QDomElement &elem, const RenderContext &context,
                                Traverser &traverser);
    virtual QString renderLineGroup(const QDomElement &elem, const RenderContext &context,
                                    Traverser &traverser);
    virtual QString renderList(const QDomElement &elem, const RenderContext &context);
    virtual QString renderTable(const QDomElement &elem, const RenderContext &context);
    virtual QString renderFigure(const QDomElement &elem, const RenderContext &context);
    virtual QString renderMilestone(const QDomElement &elem, const RenderContext &context);
    virtual QString renderSigned(const QDomElement &elem, const RenderContext &context);

    // Text as inserted into markup: escaped only in strict mode
    static QString escape(const QString &text, const RenderContext &context);
    static QString escapeAttr(const QString &text, const RenderContext &context);

    // " class=\"...\"" or nothing
    static QString classAttribute(const QString &cls, const RenderContext &context);

    QString imageSource(const QString &url) const;

    QString m_title;

private:
    QString renderVerseLine(const QDomElement &line, const QString &indent,
                            const RenderContext &context) const;

    QString m_customCss;
    QStringList m_stylesheetLinks;
    bool m_strictOutput = false;
    QHash<QString, QString> m_imageMap;
};

#endif // TEIPRESS_HTMLRENDERER_H
