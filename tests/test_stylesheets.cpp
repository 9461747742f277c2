/*
 * test_stylesheets.cpp — Per-format stylesheet sections and discovery
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "stylesheets.h"

using Stylesheets::filterForFormat;

namespace {

void writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly)) << path.toStdString();
    file.write(content);
}

} // anonymous namespace

TEST(StylesheetFilterTest, EmptyInput)
{
    EXPECT_TRUE(filterForFormat(QString(), QStringLiteral("html")).isEmpty());
    EXPECT_TRUE(filterForFormat(QString(), QStringLiteral("epub")).isEmpty());
}

TEST(StylesheetFilterTest, UnsectionedRulesApplyToBoth)
{
    const QString css = QStringLiteral("body { margin: 0; }\np { text-indent: 1em; }");
    EXPECT_EQ(filterForFormat(css, QStringLiteral("html")), css);
    EXPECT_EQ(filterForFormat(css, QStringLiteral("epub")), css);
}

TEST(StylesheetFilterTest, SingleFormatSections)
{
    const QString rule = QStringLiteral("body { margin: 0; }");

    const QString htmlOnly = QStringLiteral("/* @html */\n") + rule;
    EXPECT_EQ(filterForFormat(htmlOnly, QStringLiteral("html")), rule);
    EXPECT_TRUE(filterForFormat(htmlOnly, QStringLiteral("epub")).isEmpty());

    const QString epubOnly = QStringLiteral("/* @epub */\n") + rule;
    EXPECT_TRUE(filterForFormat(epubOnly, QStringLiteral("html")).isEmpty());
    EXPECT_EQ(filterForFormat(epubOnly, QStringLiteral("epub")), rule);

    const QString both = QStringLiteral("/* @both */\n") + rule;
    EXPECT_EQ(filterForFormat(both, QStringLiteral("html")), rule);
    EXPECT_EQ(filterForFormat(both, QStringLiteral("epub")), rule);
}

TEST(StylesheetFilterTest, MixedSections)
{
    const QString css = QStringLiteral(
        "/* @both */\n"
        "body { font-family: serif; }\n"
        "/* @html */\n"
        "body { max-width: 40em; }\n"
        "/* @epub */\n"
        "body { margin: 0 5%; }\n"
        "/* @both */\n"
        "p { text-indent: 1em; }");

    const QString html = filterForFormat(css, QStringLiteral("html"));
    EXPECT_TRUE(html.contains(QStringLiteral("font-family: serif")));
    EXPECT_TRUE(html.contains(QStringLiteral("max-width: 40em")));
    EXPECT_FALSE(html.contains(QStringLiteral("margin: 0 5%")));
    EXPECT_TRUE(html.contains(QStringLiteral("text-indent: 1em")));

    const QString epub = filterForFormat(css, QStringLiteral("epub"));
    EXPECT_TRUE(epub.contains(QStringLiteral("font-family: serif")));
    EXPECT_FALSE(epub.contains(QStringLiteral("max-width: 40em")));
    EXPECT_TRUE(epub.contains(QStringLiteral("margin: 0 5%")));
    EXPECT_TRUE(epub.contains(QStringLiteral("text-indent: 1em")));
}

TEST(StylesheetFilterTest, SectionCommentSpacingAndCase)
{
    const QString rule = QStringLiteral("body { margin: 0; }");
    EXPECT_EQ(filterForFormat(QStringLiteral("/*@html*/\n") + rule, QStringLiteral("html")), rule);
    EXPECT_EQ(filterForFormat(QStringLiteral("/*  @html  */\n") + rule, QStringLiteral("html")), rule);
    EXPECT_EQ(filterForFormat(QStringLiteral("/*\t@html\t*/\n") + rule, QStringLiteral("html")), rule);
    EXPECT_EQ(filterForFormat(QStringLiteral("/* @HTML */\n") + rule, QStringLiteral("html")), rule);
    EXPECT_EQ(filterForFormat(QStringLiteral("/* @Epub */\n") + rule, QStringLiteral("epub")), rule);
}

TEST(StylesheetFilterTest, OtherCommentsAreOrdinaryLines)
{
    const QString unknown = QStringLiteral("/* @unknown */\nbody { margin: 0; }");
    EXPECT_EQ(filterForFormat(unknown, QStringLiteral("html")), unknown);

    const QString extra = QStringLiteral("/* @html extra */\nbody { margin: 0; }");
    EXPECT_EQ(filterForFormat(extra, QStringLiteral("html")), extra);
}

TEST(StylesheetFilterTest, EmptyAndRepeatedSections)
{
    const QString emptyHtml = QStringLiteral("/* @html */\n/* @epub */\nbody { margin: 0; }");
    EXPECT_TRUE(filterForFormat(emptyHtml, QStringLiteral("html")).isEmpty());
    EXPECT_EQ(filterForFormat(emptyHtml, QStringLiteral("epub")), QStringLiteral("body { margin: 0; }"));

    const QString repeated = QStringLiteral("/* @html */\n/* @html */\nbody { margin: 0; }");
    EXPECT_EQ(filterForFormat(repeated, QStringLiteral("html")), QStringLiteral("body { margin: 0; }"));
}

TEST(StylesheetFilterTest, BlankLinesInsideSectionSurvive)
{
    const QString css = QStringLiteral("/* @both */\nbody { margin: 0; }\n\np { text-indent: 1em; }");
    EXPECT_TRUE(filterForFormat(css, QStringLiteral("html")).contains(QStringLiteral("\n\n")));
}

TEST(StylesheetFilterTest, UnknownFormatKeepsSharedRulesOnly)
{
    const QString css = QStringLiteral(
        "/* @both */\nbody { margin: 0; }\n/* @html */\n.html-only { color: blue; }");
    const QString result = filterForFormat(css, QStringLiteral("pdf"));
    EXPECT_TRUE(result.contains(QStringLiteral("body { margin: 0; }")));
    EXPECT_FALSE(result.contains(QStringLiteral(".html-only")));
}

TEST(StylesheetDiscoveryTest, FindsCssBesideInputSortedByName)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    writeFile(dir.filePath(QStringLiteral("book.xml")), "<TEI/>");
    writeFile(dir.filePath(QStringLiteral("zeta.css")), "z {}");
    writeFile(dir.filePath(QStringLiteral("alpha.css")), "a {}");
    writeFile(dir.filePath(QStringLiteral("notes.txt")), "x");

    const QStringList found = Stylesheets::discover(dir.filePath(QStringLiteral("book.xml")));
    const QStringList expected = {
        QDir(dir.path()).filePath(QStringLiteral("alpha.css")),
        QDir(dir.path()).filePath(QStringLiteral("zeta.css")),
    };
    EXPECT_EQ(found, expected);
}

TEST(StylesheetDiscoveryTest, LoadFiltersAndJoins)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString a = dir.filePath(QStringLiteral("a.css"));
    const QString b = dir.filePath(QStringLiteral("b.css"));
    writeFile(a, "p { color: red; }\n/* @epub */\n.e { margin: 0; }\n");
    writeFile(b, "/* @html */\nh1 { color: blue; }\n");

    QString css;
    QString error;
    ASSERT_TRUE(Stylesheets::load({a, b}, QStringLiteral("html"), &css, &error));
    EXPECT_EQ(css, QStringLiteral("p { color: red; }\n\nh1 { color: blue; }"));

    ASSERT_TRUE(Stylesheets::load({a, b}, QStringLiteral("epub"), &css, &error));
    EXPECT_EQ(css, QStringLiteral("p { color: red; }\n.e { margin: 0; }"));
}

TEST(StylesheetDiscoveryTest, UnreadableFileIsReported)
{
    QString css;
    QString error;
    EXPECT_FALSE(Stylesheets::load({QStringLiteral("/nonexistent/teipress/missing.css")},
                                   QStringLiteral("html"), &css, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("missing.css")));
}

TEST(StylesheetDefaultsTest, BuiltInRules)
{
    const QString css = Stylesheets::defaultCss();
    EXPECT_TRUE(css.endsWith(QLatin1Char('\n')));
    EXPECT_TRUE(css.contains(QStringLiteral(".poem {")));
    EXPECT_TRUE(css.contains(QStringLiteral(".milestone.stars")));
    EXPECT_EQ(css.count(QLatin1Char('\n')), Stylesheets::defaultRules().size());
}
