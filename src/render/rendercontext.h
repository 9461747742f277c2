/*
 * rendercontext.h — Immutable state threaded through recursive rendering
 *
 * Every with*() call returns a modified copy; the receiver never changes,
 * so sibling subtrees cannot observe each other's context. QString and
 * QHash members are implicitly shared, which keeps the copies cheap.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_RENDERCONTEXT_H
#define TEIPRESS_RENDERCONTEXT_H

#include <QHash>
#include <QString>

// In-document identifier -> output file name (multi-file e-book output)
using IdMap = QHash<QString, QString>;

class RenderContext
{
public:
    static constexpr int kDefaultLineWidth = 72;

    RenderContext() = default;

    // Enclosing element
    QString parentTag() const { return m_parentTag; }
    QString parentStyleHint() const { return m_parentStyleHint; }

    // Nesting
    int quoteDepth() const { return m_quoteDepth; }
    int blockDepth() const { return m_blockDepth; }  // advisory, no rule reads it yet

    // Plain-text layout
    int indentLevel() const { return m_indentLevel; }
    QString indentUnit() const { return m_indentUnit; }
    QString currentIndent() const { return m_indentUnit.repeated(qMax(0, m_indentLevel)); }
    int lineWidth() const { return m_lineWidth; }

    // Hypertext output
    bool strictOutput() const { return m_strictOutput; }
    const IdMap &idMap() const { return m_idMap; }
    bool hasIdMap() const { return !m_idMap.isEmpty(); }

    // Derivations
    RenderContext withParent(const QString &tag, const QString &styleHint = QString()) const;
    RenderContext withDeeperQuote() const;
    RenderContext withDeeperBlock() const;
    RenderContext withIndent(int levels) const;
    RenderContext withLineWidth(int width) const;
    RenderContext withStrictOutput(bool strict) const;
    RenderContext withIdMap(const IdMap &idMap) const;

    // Parent classification. The two sets are disjoint; a tag in neither
    // (e.g. the document root) answers false to both.
    bool isInlineParent() const;
    bool isBlockParent() const;

    bool operator==(const RenderContext &other) const = default;

private:
    QString m_parentTag;
    QString m_parentStyleHint;
    int m_quoteDepth = 0;
    int m_blockDepth = 0;
    int m_indentLevel = 0;
    QString m_indentUnit = QStringLiteral("    ");
    int m_lineWidth = kDefaultLineWidth;
    bool m_strictOutput = false;
    IdMap m_idMap;
};

#endif // TEIPRESS_RENDERCONTEXT_H
