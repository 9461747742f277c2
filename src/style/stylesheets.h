/*
 * stylesheets.h — Built-in CSS, stylesheet discovery and per-format filtering
 *
 * Custom stylesheets may hold rules for one output only. A line holding
 * nothing but a comment whose text is @html, @epub or @both starts a
 * section for that format; lines before the first such comment belong
 * to both formats.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_STYLESHEETS_H
#define TEIPRESS_STYLESHEETS_H

#include <QString>
#include <QStringList>

namespace Stylesheets {

/// The built-in rules, one rule per line.
QStringList defaultRules();

/// defaultRules() joined into a stylesheet.
QString defaultCss();

/// Every *.css file in the input document's directory, sorted by name.
QStringList discover(const QString &inputFile);

/// Keep the lines meant for format ("html" or "epub"); section comments
/// are dropped and the result is trimmed.
QString filterForFormat(const QString &css, const QString &format);

/// Read and filter the files in order, joined by a blank line. Returns
/// false and names the offending file in errorString if one is unreadable.
bool load(const QStringList &paths, const QString &format,
          QString *css, QString *errorString = nullptr);

} // namespace Stylesheets

#endif // TEIPRESS_STYLESHEETS_H
