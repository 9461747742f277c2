/*
 * teitags.h — Closed set of TEI element names understood by the renderers
 *
 * Tag names are looked up once per element and dispatched through this
 * enum. Anything outside the set maps to Tag::Unknown and falls back to
 * flattened text in every renderer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_TEITAGS_H
#define TEIPRESS_TEITAGS_H

#include <QStringList>
#include <QString>
#include <QStringView>

namespace Tei {

enum class Tag {
    // Sections
    Front,
    Body,
    Back,
    // Block level
    Div,
    Head,
    P,
    Quote,
    Lg,
    L,
    List,
    Item,
    Table,
    Row,
    Cell,
    Figure,
    Graphic,
    FigDesc,
    Milestone,
    Signed,
    // Inline
    Lb,
    Hi,
    Emph,
    Ref,
    Note,
    Foreign,
    Title,

    Unknown
};

Tag tagFromName(QStringView name);
QString tagName(Tag tag);

// Tags that a block quotation renders as separate blocks
bool isBlockLevel(Tag tag);

// Section containers of <text>, in traversal order
inline const QStringList &sectionNames()
{
    static const QStringList names = {
        QStringLiteral("front"),
        QStringLiteral("body"),
        QStringLiteral("back"),
    };
    return names;
}

inline bool isSectionName(const QString &name)
{
    return sectionNames().contains(name);
}

} // namespace Tei

#endif // TEIPRESS_TEITAGS_H
