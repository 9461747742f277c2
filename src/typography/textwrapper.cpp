/*
 * textwrapper.cpp — Greedy word wrapping for monospaced plain-text output
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textwrapper.h"

#include <QRegularExpression>

namespace TextWrap {

QStringList fill(const QString &text, int width,
                 const QString &initialIndent, const QString &subsequentIndent)
{
    const QStringList words = text.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (words.isEmpty())
        return {};

    QStringList lines;
    QString current = initialIndent + words.first();

    for (qsizetype i = 1; i < words.size(); ++i) {
        const QString &word = words.at(i);
        if (current.length() + 1 + word.length() <= width) {
            current += QLatin1Char(' ');
            current += word;
        } else {
            lines.append(current);
            current = subsequentIndent + word;
        }
    }
    lines.append(current);
    return lines;
}

int visualLength(const QString &text)
{
    static const QRegularExpression emphasis(QStringLiteral("_([^_]+)_"));
    QString visual = text;
    visual.replace(emphasis, QStringLiteral("\\1"));
    return static_cast<int>(visual.length());
}

QString center(const QString &text, int width)
{
    const int padding = qMax(0, (width - visualLength(text)) / 2);
    return QString(padding, QLatin1Char(' ')) + text;
}

QString alignRight(const QString &text, int width)
{
    const int padding = qMax(0, width - visualLength(text));
    return QString(padding, QLatin1Char(' ')) + text;
}

} // namespace TextWrap
