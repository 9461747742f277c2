/*
 * htmlexporter.cpp — TEI document to a single HTML file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "htmlexporter.h"
#include "htmlrenderer.h"
#include "teidocument.h"
#include "traverser.h"

#include <QSaveFile>

HtmlExporter::HtmlExporter() = default;

QString HtmlExporter::exportDocument(const Tei::Document &doc) const
{
    HtmlRenderer renderer;
    renderer.setCustomCss(m_customCss);
    renderer.setStylesheetLinks(m_stylesheetLinks);
    renderer.setStrictOutput(m_strictOutput);

    Traverser traverser(renderer);
    return Output::toText(traverser.traverseDocument(doc));
}

bool HtmlExporter::exportToFile(const Tei::Document &doc, const QString &filePath)
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
