/*
 * epubrenderer.cpp — XHTML chapter rendering for EPUB 3 packages
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "epubrenderer.h"
#include "markuputils.h"
#include "teidocument.h"
#include "traverser.h"

namespace {

struct SectionNaming {
    const char *section;
    const char *filePrefix;
    const char *labelFormat;
};

const SectionNaming kSections[] = {
    {"front", "front", "Front Matter %1"},
    {"body", "chapter", "Chapter %1"},
    {"back", "back", "Back Matter %1"},
};

} // anonymous namespace

EpubRenderer::EpubRenderer()
{
    setStrictOutput(true);
}

RenderContext EpubRenderer::rootContext() const
{
    return HtmlRenderer::rootContext().withStrictOutput(true);
}

RenderOutput EpubRenderer::renderDocumentStart(const Tei::Document &doc)
{
    m_title = doc.title();
    return xhtmlPreamble(m_title) + QStringLiteral("\n<h1>%1</h1>\n").arg(MarkupUtils::escapeText(m_title));
}

RenderOutput EpubRenderer::renderElement(const QDomElement &elem, const QString &tag,
                                         const RenderContext &context,
                                         Traverser &traverser)
{
    return HtmlRenderer::renderElement(elem, tag, context.withStrictOutput(true), traverser);
}

QString EpubRenderer::xhtmlPreamble(const QString &title)
{
    const QStringList parts = {
        QStringLiteral("<?xml version=\"1.0\" encoding=\"UTF-8\"?>"),
        QStringLiteral("<!DOCTYPE html>"),
        QStringLiteral("<html xmlns=\"http://www.w3.org/1999/xhtml\" xmlns:epub=\"http://www.idpf.org/2007/ops\">"),
        QStringLiteral("<head>"),
        QStringLiteral("  <title>%1</title>").arg(MarkupUtils::escapeText(title)),
        QStringLiteral("  <link rel=\"stylesheet\" type=\"text/css\" href=\"styles.css\"/>"),
        QStringLiteral("</head>"),
        QStringLiteral("<body>"),
    };
    return parts.join(QLatin1Char('\n'));
}

QString EpubRenderer::xhtmlClosing()
{
    return QStringLiteral("</body>\n</html>");
}

QString EpubRenderer::renderChapter(const QDomElement &division, const QString &fallbackTitle,
                                    const IdMap &idMap)
{
    const QDomElement head = Tei::firstChild(division, QStringLiteral("head"));
    const QString heading = extractPlainText(head).simplified();
    const QString chapterTitle = head.isNull() ? fallbackTitle : heading;

    QStringList parts;
    parts.append(xhtmlPreamble(chapterTitle));

    if (!head.isNull()) {
        const QString id = Tei::xmlId(division);
        if (id.isEmpty()) {
            parts.append(QStringLiteral("<h2>%1</h2>").arg(MarkupUtils::escapeText(heading)));
        } else {
            parts.append(QStringLiteral("<h2 id=\"%1\">%2</h2>")
                             .arg(MarkupUtils::escapeAttribute(id), MarkupUtils::escapeText(heading)));
        }
    }

    Traverser traverser(*this);
    const RenderContext context = RenderContext()
                                      .withParent(QStringLiteral("div"))
                                      .withStrictOutput(true)
                                      .withIdMap(idMap);

    for (const QDomElement &child : Tei::childElements(division)) {
        if (Tei::localTag(child) == QLatin1String("head"))
            continue;
        const RenderOutput result = traverser.traverseElement(child, context);
        if (!Output::isEmpty(result))
            parts.append(Output::toText(result));
    }

    parts.append(xhtmlClosing());
    return parts.join(QLatin1Char('\n'));
}

QList<ChapterDivision> EpubRenderer::chapterDivisions(const Tei::Document &doc)
{
    QList<ChapterDivision> chapters;

    for (const SectionNaming &naming : kSections) {
        const QString section = QString::fromLatin1(naming.section);
        const QDomElement container = doc.section(section);
        if (container.isNull())
            continue;

        int index = 0;
        for (const QDomElement &div : Tei::childElements(container, QStringLiteral("div"))) {
            ++index;
            ChapterDivision chapter;
            chapter.element = div;
            chapter.section = section;
            chapter.fileName = QStringLiteral("%1%2.xhtml").arg(QLatin1String(naming.filePrefix)).arg(index);
            chapter.title = extractPlainText(Tei::firstChild(div, QStringLiteral("head"))).simplified();
            chapter.label = chapter.title.isEmpty()
                ? QString::fromLatin1(naming.labelFormat).arg(index)
                : chapter.title;
            chapters.append(chapter);
        }
    }

    return chapters;
}

IdMap EpubRenderer::buildIdMap(const QList<ChapterDivision> &chapters)
{
    IdMap idMap;
    for (const ChapterDivision &chapter : chapters) {
        const QString ownId = Tei::xmlId(chapter.element);
        if (!ownId.isEmpty())
            idMap.insert(ownId, chapter.fileName);
        for (const QDomElement &elem : Tei::descendants(chapter.element)) {
            const QString id = Tei::xmlId(elem);
            if (!id.isEmpty())
                idMap.insert(id, chapter.fileName);
        }
    }
    return idMap;
}

IdMap EpubRenderer::buildIdMap(const Tei::Document &doc)
{
    return buildIdMap(chapterDivisions(doc));
}
