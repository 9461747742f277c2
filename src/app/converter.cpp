/*
 * converter.cpp — One input document to one output file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "converter.h"
#include "epubexporter.h"
#include "htmlexporter.h"
#include "stylesheets.h"
#include "teidocument.h"
#include "textexporter.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

Converter::Converter(const Options &options)
    : m_options(options)
{
}

Converter::Format Converter::formatFromName(const QString &name)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("text") || n == QLatin1String("txt"))
        return Format::Text;
    if (n == QLatin1String("html") || n == QLatin1String("htm"))
        return Format::Html;
    if (n == QLatin1String("epub"))
        return Format::Epub;
    return Format::Auto;
}

Converter::Format Converter::formatForFile(const QString &filePath)
{
    const QString suffix = QFileInfo(filePath).suffix().toLower();
    if (suffix == QLatin1String("txt"))
        return Format::Text;
    if (suffix == QLatin1String("html") || suffix == QLatin1String("htm")
        || suffix == QLatin1String("xhtml"))
        return Format::Html;
    if (suffix == QLatin1String("epub"))
        return Format::Epub;
    return Format::Auto;
}

QString Converter::formatName(Format format)
{
    switch (format) {
    case Format::Text:
        return QStringLiteral("text");
    case Format::Html:
        return QStringLiteral("html");
    case Format::Epub:
        return QStringLiteral("epub");
    case Format::Auto:
        break;
    }
    return QStringLiteral("auto");
}

QStringList Converter::stylesheetPaths(const QString &inputFile) const
{
    if (!m_options.stylesheets.isEmpty())
        return m_options.stylesheets;
    if (!m_options.discoverStylesheets)
        return {};

    const QStringList found = Stylesheets::discover(inputFile);
    if (!found.isEmpty()) {
        QStringList names;
        for (const QString &path : found)
            names.append(QFileInfo(path).fileName());
        qInfo().noquote() << "Converter: auto-detected stylesheets:" << names.join(QStringLiteral(", "));
    }
    return found;
}

bool Converter::collectStylesheets(const QString &inputFile, const QString &format, QString *css)
{
    return Stylesheets::load(stylesheetPaths(inputFile), format, css, &m_errorString);
}

bool Converter::convert(const QString &inputFile, const QString &outputFile)
{
    m_errorString.clear();

    Format format = m_options.format;
    if (format == Format::Auto)
        format = formatForFile(outputFile);
    if (format == Format::Auto) {
        m_errorString = QStringLiteral("Cannot determine output format for %1").arg(outputFile);
        return false;
    }

    if (!QFileInfo::exists(inputFile)) {
        m_errorString = QStringLiteral("Input file not found: %1").arg(inputFile);
        return false;
    }

    Tei::Document doc;
    QString parseError;
    if (!doc.load(inputFile, &parseError)) {
        m_errorString = parseError;
        return false;
    }

    switch (format) {
    case Format::Text: {
        TextExporter exporter(m_options.lineWidth);
        if (!exporter.exportToFile(doc, outputFile)) {
            m_errorString = exporter.errorString();
            return false;
        }
        break;
    }
    case Format::Html: {
        HtmlExporter exporter;
        exporter.setStrictOutput(m_options.strictOutput);
        if (m_options.linkStylesheets) {
            const QDir outputDir = QFileInfo(outputFile).absoluteDir();
            QStringList links;
            for (const QString &path : stylesheetPaths(inputFile))
                links.append(outputDir.relativeFilePath(QFileInfo(path).absoluteFilePath()));
            exporter.setStylesheetLinks(links);
        } else {
            QString css;
            if (!collectStylesheets(inputFile, QStringLiteral("html"), &css))
                return false;
            exporter.setCustomCss(css);
        }
        if (!exporter.exportToFile(doc, outputFile)) {
            m_errorString = exporter.errorString();
            return false;
        }
        break;
    }
    case Format::Epub: {
        QString css;
        if (!collectStylesheets(inputFile, QStringLiteral("epub"), &css))
            return false;
        EpubExporter exporter;
        exporter.setCustomCss(css);
        exporter.setResourceDirectory(QFileInfo(inputFile).absolutePath());
        if (!exporter.exportToFile(doc, outputFile)) {
            m_errorString = exporter.errorString();
            return false;
        }
        break;
    }
    case Format::Auto:
        break;
    }

    return true;
}
