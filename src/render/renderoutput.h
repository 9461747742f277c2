/*
 * renderoutput.h — Rendered unit: a text fragment or a sequence of lines
 *
 * Hypertext renderers produce QString fragments; the plain-text renderer
 * produces QStringList line sequences so block containers can splice child
 * output without re-splitting on newlines.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_RENDEROUTPUT_H
#define TEIPRESS_RENDEROUTPUT_H

#include <QString>
#include <QStringList>

#include <variant>

using RenderOutput = std::variant<QString, QStringList>;

namespace Output {

inline bool isEmpty(const RenderOutput &out)
{
    return std::visit([](const auto &value) { return value.isEmpty(); }, out);
}

inline bool isText(const RenderOutput &out)
{
    return std::holds_alternative<QString>(out);
}

inline bool isLines(const RenderOutput &out)
{
    return std::holds_alternative<QStringList>(out);
}

/// Text form: fragments as-is, line sequences joined with '\n'.
inline QString toText(const RenderOutput &out)
{
    if (const auto *text = std::get_if<QString>(&out))
        return *text;
    return std::get<QStringList>(out).join(QLatin1Char('\n'));
}

/// Line form: line sequences as-is, fragments split on '\n'.
inline QStringList toLines(const RenderOutput &out)
{
    if (const auto *lines = std::get_if<QStringList>(&out))
        return *lines;
    const QString &text = std::get<QString>(out);
    if (text.isEmpty())
        return {};
    return text.split(QLatin1Char('\n'));
}

} // namespace Output

#endif // TEIPRESS_RENDEROUTPUT_H
