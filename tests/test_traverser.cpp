/*
 * test_traverser.cpp — Section order, child contexts and result combination
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "renderer.h"
#include "teidocument.h"
#include "teifixture.h"
#include "traverser.h"

namespace {

// Records every dispatch and answers with "<dom parent>/<tag>"
class RecordingRenderer : public Renderer
{
public:
    struct Call {
        QString tag;
        QString parent;
        QString hint;
    };

    RenderOutput renderDocumentStart(const Tei::Document &) override
    {
        return QStringList{QStringLiteral("START")};
    }

    RenderOutput renderDocumentEnd() override
    {
        return QStringList{QStringLiteral("END")};
    }

    RenderOutput renderElement(const QDomElement &elem, const QString &tag,
                               const RenderContext &context, Traverser &) override
    {
        calls.append({tag, context.parentTag(), context.parentStyleHint()});
        return QStringList{Tei::localTag(elem.parentNode().toElement()) + QLatin1Char('/') + tag};
    }

    QString formatName() const override { return QStringLiteral("record"); }

    QList<Call> calls;
};

} // anonymous namespace

class TraverserTest : public TeiFixture
{
protected:
    RecordingRenderer m_renderer;
};

TEST_F(TraverserTest, VisitsSectionsInFixedOrder)
{
    // Source order deliberately differs from traversal order
    loadText(QStringLiteral("<back><div/></back><body><div/></body><front><div/></front>"));

    Traverser traverser(m_renderer);
    const RenderOutput out = traverser.traverseDocument(m_doc);
    ASSERT_TRUE(Output::isLines(out));

    const QStringList expected = {
        QStringLiteral("START"),
        QStringLiteral("front/div"),
        QStringLiteral("body/div"),
        QStringLiteral("back/div"),
        QStringLiteral("END"),
    };
    EXPECT_EQ(std::get<QStringList>(out), expected);
}

TEST_F(TraverserTest, SectionChildContextCarriesOwnTagAndStyle)
{
    loadText(QStringLiteral("<body><div rend=\"fancy\"/><p rend=\"center\"/><p/></body>"));

    Traverser traverser(m_renderer);
    traverser.traverseDocument(m_doc);

    ASSERT_EQ(m_renderer.calls.size(), 3);
    EXPECT_EQ(m_renderer.calls.at(0).parent, QStringLiteral("div"));
    EXPECT_EQ(m_renderer.calls.at(0).hint, QStringLiteral("fancy"));
    EXPECT_EQ(m_renderer.calls.at(1).parent, QStringLiteral("p"));
    EXPECT_EQ(m_renderer.calls.at(1).hint, QStringLiteral("center"));
    EXPECT_TRUE(m_renderer.calls.at(2).hint.isEmpty());
}

TEST_F(TraverserTest, ElementTagIsNamespaceFree)
{
    const QDomElement p = bodyElement(QStringLiteral("<p>x</p>"));
    Traverser traverser(m_renderer);
    traverser.traverseElement(p, RenderContext());
    ASSERT_EQ(m_renderer.calls.size(), 1);
    EXPECT_EQ(m_renderer.calls.first().tag, QStringLiteral("p"));
}

TEST(TraverserCombineTest, ConcatenatesText)
{
    const RenderOutput out = Traverser::combine({QStringLiteral("<p>a</p>"), QStringLiteral("<p>b</p>")});
    ASSERT_TRUE(Output::isText(out));
    EXPECT_EQ(std::get<QString>(out), QStringLiteral("<p>a</p><p>b</p>"));
}

TEST(TraverserCombineTest, FlattensLineSequences)
{
    const RenderOutput out = Traverser::combine({QStringList{QStringLiteral("a")},
                                                 QStringList{QStringLiteral("b"), QStringLiteral("c")}});
    ASSERT_TRUE(Output::isLines(out));
    const QStringList expected = {QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")};
    EXPECT_EQ(std::get<QStringList>(out), expected);
}

TEST(TraverserCombineTest, DropsEmptyParts)
{
    const RenderOutput out = Traverser::combine({QString(), QStringList{QStringLiteral("x")}, QStringList()});
    ASSERT_TRUE(Output::isLines(out));
    EXPECT_EQ(std::get<QStringList>(out), QStringList{QStringLiteral("x")});

    EXPECT_TRUE(Output::isEmpty(Traverser::combine({})));
    EXPECT_TRUE(Output::isEmpty(Traverser::combine({QString(), QStringList()})));
}

// No renderer mixes shapes; the fallback only has to keep all content.
TEST(TraverserCombineTest, MixedShapesFallBackToText)
{
    const RenderOutput out = Traverser::combine({QStringLiteral("a"),
                                                 QStringList{QStringLiteral("b"), QStringLiteral("c")}});
    ASSERT_TRUE(Output::isText(out));
    const QString text = std::get<QString>(out);
    EXPECT_TRUE(text.contains(QLatin1Char('a')));
    EXPECT_TRUE(text.contains(QLatin1Char('b')));
    EXPECT_TRUE(text.contains(QLatin1Char('c')));
}
