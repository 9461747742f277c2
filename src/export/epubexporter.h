/*
 * epubexporter.h — TEI document to an EPUB 3 package
 *
 * Assembles the container around the chapters produced by EpubRenderer:
 * mimetype, META-INF/container.xml, the OPF package document, the
 * navigation document, the stylesheet and any images found beside the
 * input file.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_EPUBEXPORTER_H
#define TEIPRESS_EPUBEXPORTER_H

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QString>

#include "epubrenderer.h"

class QIODevice;

namespace Tei {
class Document;
}

struct EpubImage {
    QString url;        // graphic/@url as written in the source
    QString href;       // path inside OEBPS, e.g. "images/plate1.png"
    QString sourcePath; // file read into the package
};

class EpubExporter
{
public:
    EpubExporter();

    // Directory graphic URLs are resolved against (normally the input's)
    void setResourceDirectory(const QString &dir) { m_resourceDir = dir; }

    // Custom CSS already filtered for EPUB, appended to the built-in rules
    void setCustomCss(const QString &css) { m_customCss = css; }

    // Time recorded as dcterms:modified and in the archive (default: now)
    void setTimestamp(const QDateTime &timestamp) { m_timestamp = timestamp; }

    bool exportToFile(const Tei::Document &doc, const QString &filePath);
    bool exportToDevice(const Tei::Document &doc, QIODevice *device);

    QString errorString() const { return m_errorString; }

    // --- Package parts ---

    // Images referenced by the document that exist in the resource directory
    QList<EpubImage> collectImages(const Tei::Document &doc) const;

    QString bookIdentifier(const QString &title) const;
    QString styleSheet() const;
    QString packageDocument(const Tei::Document &doc, const QList<ChapterDivision> &chapters,
                            const QList<EpubImage> &images) const;
    static QString navDocument(const QString &title, const QList<ChapterDivision> &chapters);
    static QString containerXml();

    static QString mediaType(const QString &fileName);
    static QString manifestId(const QString &href);

private:
    QDateTime timestamp() const;

    QString m_resourceDir;
    QString m_customCss;
    QDateTime m_timestamp;
    QString m_errorString;
};

#endif // TEIPRESS_EPUBEXPORTER_H
