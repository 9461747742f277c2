/*
 * textexporter.h — TEI document to plain text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_TEXTEXPORTER_H
#define TEIPRESS_TEXTEXPORTER_H

#include <QString>

#include "rendercontext.h"

namespace Tei {
class Document;
}

class TextExporter
{
public:
    explicit TextExporter(int lineWidth = RenderContext::kDefaultLineWidth);

    int lineWidth() const { return m_lineWidth; }

    // The whole document as UTF-8 plain text with a trailing newline
    QString exportDocument(const Tei::Document &doc) const;

    // Export document to a file. Returns true on success.
    bool exportToFile(const Tei::Document &doc, const QString &filePath);

    QString errorString() const { return m_errorString; }

private:
    int m_lineWidth;
    QString m_errorString;
};

#endif // TEIPRESS_TEXTEXPORTER_H
