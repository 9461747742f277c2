/*
 * teidocument.cpp — Parsed TEI document and namespace-aware element helpers
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "teidocument.h"

#include <QFile>
#include <QSet>

namespace Tei {

Document::Document() = default;

bool Document::load(const QString &filePath, QString *errorString)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString)
            *errorString = QStringLiteral("Cannot open %1: %2")
                               .arg(filePath, file.errorString());
        m_doc = QDomDocument();
        return false;
    }
    return setContent(file.readAll(), errorString);
}

bool Document::setContent(const QByteArray &xml, QString *errorString)
{
    QDomDocument doc;
    const QDomDocument::ParseResult result =
        doc.setContent(xml, QDomDocument::ParseOption::UseNamespaceProcessing
                                | QDomDocument::ParseOption::PreserveSpacingOnlyNodes);
    if (!result) {
        if (errorString)
            *errorString = QStringLiteral("XML parse error at line %1, column %2: %3")
                               .arg(result.errorLine)
                               .arg(result.errorColumn)
                               .arg(result.errorMessage);
        m_doc = QDomDocument();
        return false;
    }
    m_doc = doc;
    return true;
}

QDomElement Document::section(const QString &name) const
{
    if (isNull())
        return QDomElement();
    return firstDescendant(root(), name);
}

QDomElement Document::front() const
{
    return section(QStringLiteral("front"));
}

QDomElement Document::body() const
{
    return section(QStringLiteral("body"));
}

QDomElement Document::back() const
{
    return section(QStringLiteral("back"));
}

QString Document::title() const
{
    if (isNull())
        return QStringLiteral("Untitled");
    const QDomElement title = firstDescendant(root(), QStringLiteral("title"));
    const QString text = title.isNull() ? QString() : title.text().simplified();
    return text.isEmpty() ? QStringLiteral("Untitled") : text;
}

QString Document::author() const
{
    if (isNull())
        return QStringLiteral("Unknown");
    const QDomElement header = firstDescendant(root(), QStringLiteral("teiHeader"));
    if (header.isNull())
        return QStringLiteral("Unknown");
    const QDomElement author = firstDescendant(header, QStringLiteral("author"));
    const QString text = author.isNull() ? QString() : author.text().simplified();
    return text.isEmpty() ? QStringLiteral("Unknown") : text;
}

QString Document::language() const
{
    if (isNull())
        return QStringLiteral("en");
    QString lang = root().attributeNS(QLatin1String(kXmlNamespace), QStringLiteral("lang"));
    if (lang.isEmpty())
        lang = root().attribute(QStringLiteral("xml:lang"));
    return lang.isEmpty() ? QStringLiteral("en") : lang;
}

Metadata Document::metadata() const
{
    Metadata meta;
    meta.title = title();
    meta.author = author();
    meta.language = language();

    if (isNull())
        return meta;

    const QDomElement pubStmt = firstDescendant(root(), QStringLiteral("publicationStmt"));
    const QDomElement pubPara = firstChild(pubStmt, QStringLiteral("p"));
    if (!pubPara.isNull())
        meta.publication = pubPara.text().trimmed();

    const QDomElement sourceDesc = firstDescendant(root(), QStringLiteral("sourceDesc"));
    const QDomElement sourcePara = firstChild(sourceDesc, QStringLiteral("p"));
    if (!sourcePara.isNull())
        meta.source = sourcePara.text().trimmed();

    return meta;
}

QStringList Document::graphicUrls() const
{
    QStringList urls;
    if (isNull())
        return urls;

    QSet<QString> seen;
    for (const QDomElement &elem : descendants(root())) {
        if (localTag(elem) != QLatin1String("graphic"))
            continue;
        const QString url = elem.attribute(QStringLiteral("url"));
        if (url.isEmpty() || seen.contains(url))
            continue;
        seen.insert(url);
        urls.append(url);
    }
    return urls;
}

// --- Element helpers ---

QString stripNamespace(const QString &tag)
{
    if (tag.startsWith(QLatin1Char('{'))) {
        const qsizetype close = tag.indexOf(QLatin1Char('}'));
        if (close >= 0)
            return tag.mid(close + 1);
    }
    const qsizetype colon = tag.indexOf(QLatin1Char(':'));
    if (colon >= 0)
        return tag.mid(colon + 1);
    return tag;
}

QString localTag(const QDomElement &elem)
{
    if (elem.isNull())
        return QString();
    const QString local = elem.localName();
    return local.isEmpty() ? stripNamespace(elem.tagName()) : local;
}

QString xmlId(const QDomElement &elem)
{
    if (elem.isNull())
        return QString();
    QString id = elem.attributeNS(QLatin1String(kXmlNamespace), QStringLiteral("id"));
    if (id.isEmpty())
        id = elem.attribute(QStringLiteral("xml:id"));
    return id;
}

QList<QDomElement> childElements(const QDomElement &parent, const QString &tag)
{
    QList<QDomElement> result;
    if (parent.isNull())
        return result;
    for (QDomElement child = parent.firstChildElement(); !child.isNull();
         child = child.nextSiblingElement()) {
        if (tag.isEmpty() || localTag(child) == tag)
            result.append(child);
    }
    return result;
}

QDomElement firstChild(const QDomElement &parent, const QString &tag)
{
    if (parent.isNull())
        return QDomElement();
    for (QDomElement child = parent.firstChildElement(); !child.isNull();
         child = child.nextSiblingElement()) {
        if (localTag(child) == tag)
            return child;
    }
    return QDomElement();
}

QDomElement firstDescendant(const QDomElement &root, const QString &tag)
{
    if (root.isNull())
        return QDomElement();
    for (QDomElement child = root.firstChildElement(); !child.isNull();
         child = child.nextSiblingElement()) {
        if (localTag(child) == tag)
            return child;
        const QDomElement found = firstDescendant(child, tag);
        if (!found.isNull())
            return found;
    }
    return QDomElement();
}

QList<QDomElement> descendants(const QDomElement &root)
{
    QList<QDomElement> result;
    if (root.isNull())
        return result;
    for (QDomElement child = root.firstChildElement(); !child.isNull();
         child = child.nextSiblingElement()) {
        result.append(child);
        result.append(descendants(child));
    }
    return result;
}

} // namespace Tei
