/*
 * epubexporter.cpp — TEI document to an EPUB 3 package
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "epubexporter.h"
#include "markuputils.h"
#include "stylesheets.h"
#include "teidocument.h"
#include "zipwriter.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QSet>

namespace {

const QStringList kCoverNames = {
    QStringLiteral("cover.jpg"),
    QStringLiteral("cover.jpeg"),
    QStringLiteral("cover.png"),
    QStringLiteral("cover.gif"),
};

QString chapterId(const ChapterDivision &chapter)
{
    return QFileInfo(chapter.fileName).completeBaseName();
}

} // anonymous namespace

EpubExporter::EpubExporter() = default;

QDateTime EpubExporter::timestamp() const
{
    return m_timestamp.isValid() ? m_timestamp : QDateTime::currentDateTimeUtc();
}

bool EpubExporter::exportToFile(const Tei::Document &doc, const QString &filePath)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_errorString = file.errorString();
        return false;
    }
    if (!exportToDevice(doc, &file))
        return false;
    if (!file.commit()) {
        m_errorString = file.errorString();
        return false;
    }
    return true;
}

bool EpubExporter::exportToDevice(const Tei::Document &doc, QIODevice *device)
{
    const QString title = doc.title();
    const QList<ChapterDivision> chapters = EpubRenderer::chapterDivisions(doc);
    const IdMap idMap = EpubRenderer::buildIdMap(chapters);
    const QList<EpubImage> images = collectImages(doc);

    QHash<QString, QString> imageMap;
    for (const EpubImage &image : images)
        imageMap.insert(image.url, image.href);

    EpubRenderer renderer;
    renderer.setImageMap(imageMap);

    ZipWriter zip(device);
    zip.setTimestamp(timestamp().toLocalTime());

    auto add = [&](const QString &name, const QByteArray &data,
                   ZipWriter::Method method = ZipWriter::Method::Deflated) {
        if (zip.addFile(name, data, method))
            return true;
        m_errorString = QStringLiteral("Cannot write %1: %2").arg(name, zip.errorString());
        return false;
    };

    // mimetype must be the first entry and uncompressed
    if (!add(QStringLiteral("mimetype"), QByteArrayLiteral("application/epub+zip"),
             ZipWriter::Method::Stored))
        return false;
    if (!add(QStringLiteral("META-INF/container.xml"), containerXml().toUtf8()))
        return false;
    if (!add(QStringLiteral("OEBPS/content.opf"), packageDocument(doc, chapters, images).toUtf8()))
        return false;
    if (!add(QStringLiteral("OEBPS/nav.xhtml"), navDocument(title, chapters).toUtf8()))
        return false;
    if (!add(QStringLiteral("OEBPS/styles.css"), styleSheet().toUtf8()))
        return false;

    for (const ChapterDivision &chapter : chapters) {
        const QString xhtml = renderer.renderChapter(chapter.element, chapter.label, idMap);
        if (!add(QStringLiteral("OEBPS/") + chapter.fileName, xhtml.toUtf8()))
            return false;
    }

    for (const EpubImage &image : images) {
        QFile file(image.sourcePath);
        if (!file.open(QIODevice::ReadOnly)) {
            m_errorString = QStringLiteral("Cannot read image %1: %2")
                                .arg(QDir::toNativeSeparators(image.sourcePath), file.errorString());
            return false;
        }
        if (!add(QStringLiteral("OEBPS/") + image.href, file.readAll()))
            return false;
    }

    if (!zip.finish()) {
        m_errorString = zip.errorString();
        return false;
    }

    qInfo().noquote() << "EpubExporter:" << chapters.size() << "chapters," << images.size() << "images";
    return true;
}

QList<EpubImage> EpubExporter::collectImages(const Tei::Document &doc) const
{
    QList<EpubImage> images;
    QSet<QString> hrefs;
    const QDir dir(m_resourceDir.isEmpty() ? QDir::currentPath() : m_resourceDir);

    for (const QString &url : doc.graphicUrls()) {
        const QString sourcePath = dir.filePath(url);
        if (!QFileInfo::exists(sourcePath)) {
            qWarning().noquote() << "EpubExporter: image not found, keeping URL:" << url;
            continue;
        }
        const QString href = QStringLiteral("images/") + QFileInfo(url).fileName();
        if (hrefs.contains(href)) {
            qWarning().noquote() << "EpubExporter: duplicate image name, skipping:" << url;
            continue;
        }
        hrefs.insert(href);
        images.append({url, href, sourcePath});
    }

    return images;
}

QString EpubExporter::bookIdentifier(const QString &title) const
{
    return QStringLiteral("urn:uuid:%1-%2")
        .arg(MarkupUtils::slugify(title), timestamp().toUTC().toString(QStringLiteral("yyyyMMdd")));
}

QString EpubExporter::styleSheet() const
{
    QString css = Stylesheets::defaultCss();
    if (!m_customCss.isEmpty()) {
        css += QStringLiteral("\n/* Custom styles */\n");
        css += m_customCss;
        css += QLatin1Char('\n');
    }
    return css;
}

QString EpubExporter::mediaType(const QString &fileName)
{
    const QString suffix = QFileInfo(fileName).suffix().toLower();
    if (suffix == QLatin1String("jpg") || suffix == QLatin1String("jpeg"))
        return QStringLiteral("image/jpeg");
    if (suffix == QLatin1String("gif"))
        return QStringLiteral("image/gif");
    if (suffix == QLatin1String("svg"))
        return QStringLiteral("image/svg+xml");
    if (suffix == QLatin1String("webp"))
        return QStringLiteral("image/webp");
    return QStringLiteral("image/png");
}

QString EpubExporter::manifestId(const QString &href)
{
    QString id = QStringLiteral("img_") + QFileInfo(href).fileName();
    for (QChar &ch : id) {
        if (!ch.isLetterOrNumber() && ch != QLatin1Char('_') && ch != QLatin1Char('-'))
            ch = QLatin1Char('_');
    }
    return id;
}

QString EpubExporter::packageDocument(const Tei::Document &doc, const QList<ChapterDivision> &chapters,
                                      const QList<EpubImage> &images) const
{
    const QString title = doc.title();

    QStringList opf;
    opf.append(QStringLiteral("<?xml version=\"1.0\" encoding=\"UTF-8\"?>"));
    opf.append(QStringLiteral("<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"3.0\" unique-identifier=\"book-id\">"));

    opf.append(QStringLiteral("  <metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\">"));
    opf.append(QStringLiteral("    <dc:identifier id=\"book-id\">%1</dc:identifier>")
                   .arg(MarkupUtils::escapeText(bookIdentifier(title))));
    opf.append(QStringLiteral("    <dc:title>%1</dc:title>").arg(MarkupUtils::escapeText(title)));
    opf.append(QStringLiteral("    <dc:language>%1</dc:language>").arg(MarkupUtils::escapeText(doc.language())));
    opf.append(QStringLiteral("    <dc:creator>%1</dc:creator>").arg(MarkupUtils::escapeText(doc.author())));
    opf.append(QStringLiteral("    <meta property=\"dcterms:modified\">%1</meta>")
                   .arg(timestamp().toUTC().toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss'Z'"))));
    for (const EpubImage &image : images) {
        if (kCoverNames.contains(QFileInfo(image.href).fileName().toLower())) {
            opf.append(QStringLiteral("    <meta name=\"cover\" content=\"%1\"/>").arg(manifestId(image.href)));
            break;
        }
    }
    opf.append(QStringLiteral("  </metadata>"));

    opf.append(QStringLiteral("  <manifest>"));
    opf.append(QStringLiteral("    <item id=\"nav\" href=\"nav.xhtml\" media-type=\"application/xhtml+xml\" properties=\"nav\"/>"));
    opf.append(QStringLiteral("    <item id=\"css\" href=\"styles.css\" media-type=\"text/css\"/>"));
    for (const ChapterDivision &chapter : chapters) {
        opf.append(QStringLiteral("    <item id=\"%1\" href=\"%2\" media-type=\"application/xhtml+xml\"/>")
                       .arg(chapterId(chapter), chapter.fileName));
    }
    for (const EpubImage &image : images) {
        opf.append(QStringLiteral("    <item id=\"%1\" href=\"%2\" media-type=\"%3\"/>")
                       .arg(manifestId(image.href), MarkupUtils::escapeAttribute(image.href),
                            mediaType(image.href)));
    }
    opf.append(QStringLiteral("  </manifest>"));

    opf.append(QStringLiteral("  <spine>"));
    for (const ChapterDivision &chapter : chapters)
        opf.append(QStringLiteral("    <itemref idref=\"%1\"/>").arg(chapterId(chapter)));
    opf.append(QStringLiteral("  </spine>"));

    opf.append(QStringLiteral("</package>"));
    return opf.join(QLatin1Char('\n'));
}

QString EpubExporter::navDocument(const QString &title, const QList<ChapterDivision> &chapters)
{
    QStringList nav;
    nav.append(EpubRenderer::xhtmlPreamble(QStringLiteral("Table of Contents")));
    nav.append(QStringLiteral("  <nav epub:type=\"toc\" id=\"toc\">"));
    nav.append(QStringLiteral("    <h1>%1</h1>").arg(MarkupUtils::escapeText(title)));
    nav.append(QStringLiteral("    <ol>"));
    for (const ChapterDivision &chapter : chapters) {
        if (chapter.title.isEmpty())
            continue;
        nav.append(QStringLiteral("      <li><a href=\"%1\">%2</a></li>")
                       .arg(chapter.fileName, MarkupUtils::escapeText(chapter.title)));
    }
    nav.append(QStringLiteral("    </ol>"));
    nav.append(QStringLiteral("  </nav>"));
    nav.append(EpubRenderer::xhtmlClosing());
    return nav.join(QLatin1Char('\n'));
}

QString EpubExporter::containerXml()
{
    return QStringLiteral(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<container version=\"1.0\" xmlns=\"urn:oasis:names:tc:opendocument:xmlns:container\">\n"
        "  <rootfiles>\n"
        "    <rootfile full-path=\"OEBPS/content.opf\" media-type=\"application/oebps-package+xml\"/>\n"
        "  </rootfiles>\n"
        "</container>");
}
