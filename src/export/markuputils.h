/*
 * markuputils.h — Shared markup utility functions
 *
 * Provides escapeText(), escapeAttribute() and slugify() used by the
 * hypertext renderers and the e-book packager.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_MARKUPUTILS_H
#define TEIPRESS_MARKUPUTILS_H

#include <QString>

namespace MarkupUtils {

/// Escape the XML special characters &, < and >.
inline QString escapeText(const QString &text)
{
    QString result;
    result.reserve(text.size() + text.size() / 8);

    for (QChar ch : text) {
        switch (ch.unicode()) {
        case '&':
            result.append(QLatin1String("&amp;"));
            break;
        case '<':
            result.append(QLatin1String("&lt;"));
            break;
        case '>':
            result.append(QLatin1String("&gt;"));
            break;
        default:
            result.append(ch);
            break;
        }
    }

    return result;
}

/// Escape text for use inside a double-quoted attribute value.
inline QString escapeAttribute(const QString &text)
{
    QString result = escapeText(text);
    result.replace(QLatin1Char('"'), QLatin1String("&quot;"));
    result.replace(QLatin1Char('\''), QLatin1String("&#x27;"));
    return result;
}

/// Lower-case ASCII slug: letters and digits kept, runs of anything
/// else collapsed to a single '-'. Never empty.
inline QString slugify(const QString &text)
{
    QString slug;
    bool pendingDash = false;

    for (QChar ch : text.toLower()) {
        const ushort code = ch.unicode();
        const bool keep = (code >= 'a' && code <= 'z') || (code >= '0' && code <= '9');
        if (!keep) {
            pendingDash = !slug.isEmpty();
            continue;
        }
        if (pendingDash)
            slug.append(QLatin1Char('-'));
        pendingDash = false;
        slug.append(ch);
    }

    return slug.isEmpty() ? QStringLiteral("book") : slug;
}

} // namespace MarkupUtils

#endif // TEIPRESS_MARKUPUTILS_H
