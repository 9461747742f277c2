/*
 * main.cpp — teipress command-line entry point
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>

#include <KAboutData>
#include <KLocalizedString>

#include "converter.h"
#include "teipresssettings.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("teipress");

    KAboutData aboutData(
        QStringLiteral("teipress"),
        i18n("TeiPress"),
        QStringLiteral("0.1.0"),
        i18n("Convert TEI documents to plain text, HTML and EPUB"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(QStringLiteral("input"), i18n("TEI XML file to convert"));
    parser.addPositionalArgument(QStringLiteral("output"),
                                 i18n("Output file (.txt, .html or .epub)"));

    const QCommandLineOption formatOption(
        {QStringLiteral("f"), QStringLiteral("format")},
        i18n("Output format: text, html or epub (default: from the output file extension)."),
        QStringLiteral("format"));
    const QCommandLineOption widthOption(
        {QStringLiteral("w"), QStringLiteral("width")},
        i18n("Line width of plain-text output."),
        QStringLiteral("columns"));
    const QCommandLineOption cssOption(
        QStringLiteral("css"),
        i18n("Custom stylesheet; may be given more than once. Disables auto-discovery."),
        QStringLiteral("file"));
    const QCommandLineOption noDiscoveryOption(
        QStringLiteral("no-css-discovery"),
        i18n("Do not use CSS files found next to the input document."));
    const QCommandLineOption linkCssOption(
        QStringLiteral("link-css"),
        i18n("Link stylesheets from HTML output instead of embedding them."));
    const QCommandLineOption strictOption(
        QStringLiteral("strict"),
        i18n("Escape text and close empty elements in HTML output."));
    parser.addOptions({formatOption, widthOption, cssOption, noDiscoveryOption,
                       linkCssOption, strictOption});

    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 2) {
        qCritical().noquote() << i18n("Expected an input and an output file.");
        parser.showHelp(1);
    }

    auto *settings = TeiPressSettings::self();

    Converter::Options options;
    options.lineWidth = settings->lineWidth();
    options.discoverStylesheets = settings->autoDiscover();
    options.linkStylesheets = !settings->inlineStylesheet();
    options.strictOutput = settings->strictOutput();

    if (parser.isSet(formatOption)) {
        options.format = Converter::formatFromName(parser.value(formatOption));
        if (options.format == Converter::Format::Auto) {
            qCritical().noquote() << i18n("Unknown output format: %1", parser.value(formatOption));
            return 1;
        }
    }
    if (parser.isSet(widthOption)) {
        bool ok = false;
        const int width = parser.value(widthOption).toInt(&ok);
        if (!ok || width <= 0) {
            qCritical().noquote() << i18n("Invalid line width: %1", parser.value(widthOption));
            return 1;
        }
        options.lineWidth = width;
    }
    options.stylesheets = parser.values(cssOption);
    if (parser.isSet(noDiscoveryOption))
        options.discoverStylesheets = false;
    if (parser.isSet(linkCssOption))
        options.linkStylesheets = true;
    if (parser.isSet(strictOption))
        options.strictOutput = true;

    const QString input = args.at(0);
    const QString output = args.at(1);

    Converter converter(options);
    if (!converter.convert(input, output)) {
        qCritical().noquote() << i18n("Conversion failed: %1", converter.errorString());
        return 1;
    }

    qInfo().noquote() << i18n("Conversion complete: %1", QFileInfo(output).absoluteFilePath());
    return 0;
}
