/*
 * stylesheets.cpp — Built-in CSS, stylesheet discovery and per-format filtering
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "stylesheets.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

namespace Stylesheets {

QStringList defaultRules()
{
    return {
        QStringLiteral("body { max-width: 40em; margin: 2em auto; padding: 0 1em; font-family: serif; line-height: 1.6; }"),
        QStringLiteral("h1 { text-align: center; }"),
        QStringLiteral("h2 { margin-top: 2em; }"),
        QStringLiteral(".italic { font-style: italic; }"),
        QStringLiteral(".bold { font-weight: bold; }"),
        QStringLiteral(".underline { text-decoration: underline; }"),
        QStringLiteral(".small-caps { font-variant: small-caps; }"),
        QStringLiteral(".signature { text-align: right; font-style: italic; margin-top: 0.5em; }"),
        QStringLiteral("blockquote { margin: 1em 2em; }"),
        QStringLiteral("figure { margin: 2em auto; width: 80%; max-width: 100%; text-align: center; }"),
        QStringLiteral("figure.left { float: left; margin: 0 2em 1em 0; width: 50%; max-width: 50%; }"),
        QStringLiteral("figure.right { float: right; margin: 0 0 1em 2em; width: 50%; max-width: 50%; }"),
        QStringLiteral("figure.center { margin: 2em auto; display: block; }"),
        QStringLiteral("figure img { width: 100%; height: auto; }"),
        QStringLiteral("figcaption { margin-top: 0.5em; font-style: italic; }"),
        QStringLiteral(".poem { margin: 1em 0; }"),
        QStringLiteral(".poem.center { text-align: center; }"),
        QStringLiteral(".poem.center .stanza { display: inline-block; text-align: left; }"),
        QStringLiteral(".poem-title { text-align: center; font-weight: bold; margin-bottom: 1em; }"),
        QStringLiteral(".stanza { margin-bottom: 1em; }"),
        QStringLiteral(".line { margin-top: 0; margin-bottom: 0; }"),
        QStringLiteral(".indent { margin-left: 2em; }"),
        QStringLiteral(".indent2 { margin-left: 4em; }"),
        QStringLiteral(".indent3 { margin-left: 6em; }"),
        QStringLiteral(".center { text-align: center; }"),
        QStringLiteral(".milestone { text-align: center; margin: 2em 0; }"),
        QStringLiteral(".milestone.stars::before { content: \"*       *       *       *       *\"; white-space: pre; }"),
        QStringLiteral(".milestone.space { height: 2em; }"),
        QStringLiteral("table { border-collapse: collapse; margin: 1em 0; }"),
        QStringLiteral("td, th { border: 1px solid #ccc; padding: 0.5em; }"),
    };
}

QString defaultCss()
{
    return defaultRules().join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QStringList discover(const QString &inputFile)
{
    const QDir dir = QFileInfo(inputFile).absoluteDir();
    const QStringList names = dir.entryList({QStringLiteral("*.css")},
                                            QDir::Files | QDir::Readable, QDir::Name);
    QStringList paths;
    for (const QString &name : names)
        paths.append(dir.filePath(name));
    return paths;
}

QString filterForFormat(const QString &css, const QString &format)
{
    static const QRegularExpression directive(
        QStringLiteral("^\\s*/\\*\\s*@(html|epub|both)\\s*\\*/\\s*$"),
        QRegularExpression::CaseInsensitiveOption);

    const QString wanted = format.toLower();
    QString mode = QStringLiteral("both");
    QStringList kept;

    const QStringList lines = css.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        const QRegularExpressionMatch match = directive.match(line);
        if (match.hasMatch()) {
            mode = match.captured(1).toLower();
            continue;
        }
        if (mode == QLatin1String("both") || mode == wanted)
            kept.append(line);
    }

    return kept.join(QLatin1Char('\n')).trimmed();
}

bool load(const QStringList &paths, const QString &format,
          QString *css, QString *errorString)
{
    QStringList parts;

    for (const QString &path : paths) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            if (errorString)
                *errorString = QStringLiteral("Cannot read stylesheet %1: %2")
                                   .arg(QDir::toNativeSeparators(path), file.errorString());
            return false;
        }
        const QString filtered = filterForFormat(QString::fromUtf8(file.readAll()), format);
        if (!filtered.isEmpty())
            parts.append(filtered);
    }

    if (css)
        *css = parts.join(QStringLiteral("\n\n"));
    return true;
}

} // namespace Stylesheets
