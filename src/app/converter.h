/*
 * converter.h — One input document to one output file
 *
 * Resolves the output format, gathers stylesheets and drives the
 * matching exporter. Used by the command-line front end.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_CONVERTER_H
#define TEIPRESS_CONVERTER_H

#include <QString>
#include <QStringList>

#include "rendercontext.h"

class Converter
{
public:
    enum class Format {
        Auto,
        Text,
        Html,
        Epub,
    };

    struct Options {
        Format format = Format::Auto;
        int lineWidth = RenderContext::kDefaultLineWidth;
        QStringList stylesheets;          // explicit --css files
        bool discoverStylesheets = true;  // look for *.css beside the input
        bool linkStylesheets = false;     // HTML: <link> instead of inlining
        bool strictOutput = false;        // HTML: escape text, close empty elements
    };

    explicit Converter(const Options &options);

    bool convert(const QString &inputFile, const QString &outputFile);

    QString errorString() const { return m_errorString; }

    // "text"/"txt", "html"/"htm", "epub"; Auto for anything else
    static Format formatFromName(const QString &name);
    // From the output file extension; Auto if unrecognised
    static Format formatForFile(const QString &filePath);
    static QString formatName(Format format);

private:
    bool collectStylesheets(const QString &inputFile, const QString &format, QString *css);
    QStringList stylesheetPaths(const QString &inputFile) const;

    Options m_options;
    QString m_errorString;
};

#endif // TEIPRESS_CONVERTER_H
