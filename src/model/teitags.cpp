/*
 * teitags.cpp — TEI tag name table
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "teitags.h"

#include <QHash>

namespace Tei {

namespace {

struct TagEntry {
    const char *name;
    Tag tag;
};

const TagEntry kTagTable[] = {
    {"front", Tag::Front},
    {"body", Tag::Body},
    {"back", Tag::Back},
    {"div", Tag::Div},
    {"head", Tag::Head},
    {"p", Tag::P},
    {"quote", Tag::Quote},
    {"lg", Tag::Lg},
    {"l", Tag::L},
    {"list", Tag::List},
    {"item", Tag::Item},
    {"table", Tag::Table},
    {"row", Tag::Row},
    {"cell", Tag::Cell},
    {"figure", Tag::Figure},
    {"graphic", Tag::Graphic},
    {"figDesc", Tag::FigDesc},
    {"milestone", Tag::Milestone},
    {"signed", Tag::Signed},
    {"lb", Tag::Lb},
    {"hi", Tag::Hi},
    {"emph", Tag::Emph},
    {"ref", Tag::Ref},
    {"note", Tag::Note},
    {"foreign", Tag::Foreign},
    {"title", Tag::Title},
};

const QHash<QString, Tag> &tagLookup()
{
    static const QHash<QString, Tag> lookup = [] {
        QHash<QString, Tag> h;
        for (const auto &entry : kTagTable)
            h.insert(QString::fromLatin1(entry.name), entry.tag);
        return h;
    }();
    return lookup;
}

} // anonymous namespace

Tag tagFromName(QStringView name)
{
    return tagLookup().value(name.toString(), Tag::Unknown);
}

QString tagName(Tag tag)
{
    for (const auto &entry : kTagTable) {
        if (entry.tag == tag)
            return QString::fromLatin1(entry.name);
    }
    return QString();
}

bool isBlockLevel(Tag tag)
{
    switch (tag) {
    case Tag::P:
    case Tag::Lg:
    case Tag::List:
    case Tag::Table:
    case Tag::Figure:
    case Tag::Div:
    case Tag::Quote:
    case Tag::Signed:
        return true;
    default:
        return false;
    }
}

} // namespace Tei
