/*
 * textexporter.cpp — TEI document to plain text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textexporter.h"
#include "teidocument.h"
#include "textrenderer.h"
#include "traverser.h"

#include <QSaveFile>

TextExporter::TextExporter(int lineWidth)
    : m_lineWidth(lineWidth)
{
}

QString TextExporter::exportDocument(const Tei::Document &doc) const
{
    TextRenderer renderer(m_lineWidth);
    Traverser traverser(renderer);
    return TextRenderer::joinLines(Output::toLines(traverser.traverseDocument(doc)));
}

bool TextExporter::exportToFile(const Tei::Document &doc, const QString &filePath)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_errorString = file.errorString();
        return false;
    }
    file.write(exportDocument(doc).toUtf8());
    if (!file.commit()) {
        m_errorString = file.errorString();
        return false;
    }
    return true;
}
