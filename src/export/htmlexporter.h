/*
 * htmlexporter.h — TEI document to a single HTML file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_HTMLEXPORTER_H
#define TEIPRESS_HTMLEXPORTER_H

#include <QString>
#include <QStringList>

namespace Tei {
class Document;
}

class HtmlExporter
{
public:
    HtmlExporter();

    // Custom CSS already filtered for HTML; inlined unless links are set
    void setCustomCss(const QString &css) { m_customCss = css; }
    void setStylesheetLinks(const QStringList &hrefs) { m_stylesheetLinks = hrefs; }
    void setStrictOutput(bool strict) { m_strictOutput = strict; }

    QString exportDocument(const Tei::Document &doc) const;

    // Export document to a file. Returns true on success.
    bool exportToFile(const Tei::Document &doc, const QString &filePath);

    QString errorString() const { return m_errorString; }

private:
    QString m_customCss;
    QStringList m_stylesheetLinks;
    bool m_strictOutput = false;
    QString m_errorString;
};

#endif // TEIPRESS_HTMLEXPORTER_H
