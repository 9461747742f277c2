/*
 * teidocument.h — Parsed TEI document and namespace-aware element helpers
 *
 * Wraps a QDomDocument parsed with namespace processing. The tree is
 * read-only once loaded; renderers only ever receive const references.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_TEIDOCUMENT_H
#define TEIPRESS_TEIDOCUMENT_H

#include <QDomDocument>
#include <QDomElement>
#include <QList>
#include <QString>
#include <QStringList>

namespace Tei {

inline constexpr auto kTeiNamespace = "http://www.tei-c.org/ns/1.0";
inline constexpr auto kXmlNamespace = "http://www.w3.org/XML/1998/namespace";

struct Metadata {
    QString title;
    QString author;
    QString language;
    QString publication;   // publicationStmt/p, empty if absent
    QString source;        // sourceDesc/p, empty if absent
};

class Document
{
public:
    Document();

    // Parse from file or memory. On failure the document stays empty and
    // errorString (if given) receives the parser message with position.
    bool load(const QString &filePath, QString *errorString = nullptr);
    bool setContent(const QByteArray &xml, QString *errorString = nullptr);

    bool isNull() const { return m_doc.isNull() || m_doc.documentElement().isNull(); }
    QDomElement root() const { return m_doc.documentElement(); }

    // Top-level sections, null when absent
    QDomElement front() const;
    QDomElement body() const;
    QDomElement back() const;
    QDomElement section(const QString &name) const;

    // Header information
    QString title() const;
    QString author() const;
    QString language() const;
    Metadata metadata() const;

    // Unique graphic URLs in document order
    QStringList graphicUrls() const;

private:
    QDomDocument m_doc;
};

// --- Element helpers ---

/// Tag name without namespace qualifier.
QString localTag(const QDomElement &elem);

/// Remove a Clark-notation "{uri}" or "prefix:" qualifier from a tag.
QString stripNamespace(const QString &tag);

/// Value of the xml:id attribute, empty if none.
QString xmlId(const QDomElement &elem);

/// Direct child elements, optionally restricted to one local tag name.
QList<QDomElement> childElements(const QDomElement &parent,
                                 const QString &tag = QString());

/// First direct child with the given local tag name, or a null element.
QDomElement firstChild(const QDomElement &parent, const QString &tag);

/// First descendant (document order) with the given local tag name.
QDomElement firstDescendant(const QDomElement &root, const QString &tag);

/// All descendant elements in document order, excluding root itself.
QList<QDomElement> descendants(const QDomElement &root);

} // namespace Tei

#endif // TEIPRESS_TEIDOCUMENT_H
