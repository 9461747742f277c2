/*
 * textwrapper.h — Greedy word wrapping for monospaced plain-text output
 *
 * Words are never split. Indent strings count against the line width,
 * so deeper nesting leaves fewer columns for text. A word wider than the
 * remaining columns is placed alone on its line.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_TEXTWRAPPER_H
#define TEIPRESS_TEXTWRAPPER_H

#include <QChar>
#include <QString>
#include <QStringList>

namespace TextWrap {

// Paragraph-internal hard break produced by <lb/> in plain text
inline constexpr QChar kHardBreak(0x2028);

// Emphasis marker used around _highlighted_ text
inline constexpr QChar kEmphasisMarker(u'_');

/// Collapse whitespace and wrap to width columns.
QStringList fill(const QString &text, int width,
                 const QString &initialIndent = QString(),
                 const QString &subsequentIndent = QString());

/// Length as displayed: _emphasis_ marker pairs are not counted.
int visualLength(const QString &text);

/// Left-pad text so it sits centred in width columns.
QString center(const QString &text, int width);

/// Right-align text in width columns (unchanged if it does not fit).
QString alignRight(const QString &text, int width);

} // namespace TextWrap

#endif // TEIPRESS_TEXTWRAPPER_H
