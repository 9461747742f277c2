/*
 * test_converter.cpp — Format selection and end-to-end conversion
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "converter.h"
#include "teifixture.h"

namespace {

void writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly)) << path.toStdString();
    file.write(content);
}

QString readText(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return QString();
    return QString::fromUtf8(file.readAll());
}

} // anonymous namespace

class ConverterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_input = m_dir.filePath(QStringLiteral("book.xml"));
        writeFile(m_input, teiDocument(QStringLiteral(
                                           "<body><div><head>Opening</head><p>Call me Ishmael.</p></div></body>"))
                               .toUtf8());
    }

    QTemporaryDir m_dir;
    QString m_input;
};

TEST(ConverterFormatTest, NamesAndExtensions)
{
    using Format = Converter::Format;
    EXPECT_EQ(Converter::formatFromName(QStringLiteral("TXT")), Format::Text);
    EXPECT_EQ(Converter::formatFromName(QStringLiteral("htm")), Format::Html);
    EXPECT_EQ(Converter::formatFromName(QStringLiteral("epub")), Format::Epub);
    EXPECT_EQ(Converter::formatFromName(QStringLiteral("pdf")), Format::Auto);

    EXPECT_EQ(Converter::formatForFile(QStringLiteral("out/book.txt")), Format::Text);
    EXPECT_EQ(Converter::formatForFile(QStringLiteral("book.XHTML")), Format::Html);
    EXPECT_EQ(Converter::formatForFile(QStringLiteral("book.epub")), Format::Epub);
    EXPECT_EQ(Converter::formatForFile(QStringLiteral("book")), Format::Auto);

    EXPECT_EQ(Converter::formatName(Format::Html), QStringLiteral("html"));
}

TEST_F(ConverterTest, TextByExtension)
{
    const QString output = m_dir.filePath(QStringLiteral("book.txt"));
    Converter converter(Converter::Options{});
    ASSERT_TRUE(converter.convert(m_input, output)) << converter.errorString().toStdString();
    EXPECT_EQ(readText(output), QStringLiteral("\n\n\nOPENING\n\n\nCall me Ishmael.\n\n"));
}

TEST_F(ConverterTest, HtmlWithDiscoveredStylesheet)
{
    writeFile(m_dir.filePath(QStringLiteral("extra.css")),
              "/* @html */\n.html-only { color: blue; }\n/* @epub */\n.epub-only { color: red; }\n");
    const QString output = m_dir.filePath(QStringLiteral("book.html"));

    Converter converter(Converter::Options{});
    ASSERT_TRUE(converter.convert(m_input, output)) << converter.errorString().toStdString();

    const QString html = readText(output);
    EXPECT_TRUE(html.contains(QStringLiteral(".html-only { color: blue; }")));
    EXPECT_FALSE(html.contains(QStringLiteral(".epub-only")));
    EXPECT_TRUE(html.contains(QStringLiteral("<p>Call me Ishmael.</p>")));
}

TEST_F(ConverterTest, HtmlLinkedStylesheets)
{
    writeFile(m_dir.filePath(QStringLiteral("extra.css")), ".x { color: blue; }\n");
    const QString output = m_dir.filePath(QStringLiteral("book.html"));

    Converter::Options options;
    options.linkStylesheets = true;
    Converter converter(options);
    ASSERT_TRUE(converter.convert(m_input, output));

    const QString html = readText(output);
    EXPECT_TRUE(html.contains(QStringLiteral("<link rel=\"stylesheet\" type=\"text/css\" href=\"extra.css\">")));
    EXPECT_FALSE(html.contains(QStringLiteral(".x { color: blue; }")));
}

TEST_F(ConverterTest, DiscoveryCanBeDisabled)
{
    writeFile(m_dir.filePath(QStringLiteral("extra.css")), ".x { color: blue; }\n");
    const QString output = m_dir.filePath(QStringLiteral("book.html"));

    Converter::Options options;
    options.discoverStylesheets = false;
    Converter converter(options);
    ASSERT_TRUE(converter.convert(m_input, output));
    EXPECT_FALSE(readText(output).contains(QStringLiteral(".x { color: blue; }")));
}

TEST_F(ConverterTest, ExplicitFormatOverridesExtension)
{
    const QString output = m_dir.filePath(QStringLiteral("book.out"));
    Converter::Options options;
    options.format = Converter::Format::Epub;
    Converter converter(options);
    ASSERT_TRUE(converter.convert(m_input, output)) << converter.errorString().toStdString();

    QFile file(output);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QByteArray head = file.read(58);
    EXPECT_TRUE(head.startsWith("PK\x03\x04"));
    EXPECT_EQ(head.mid(30, 8), QByteArray("mimetype"));
}

TEST_F(ConverterTest, UnknownOutputFormatFails)
{
    Converter converter(Converter::Options{});
    EXPECT_FALSE(converter.convert(m_input, m_dir.filePath(QStringLiteral("book.pdf"))));
    EXPECT_TRUE(converter.errorString().contains(QStringLiteral("book.pdf")));
}

TEST_F(ConverterTest, MissingInputFails)
{
    Converter converter(Converter::Options{});
    EXPECT_FALSE(converter.convert(m_dir.filePath(QStringLiteral("absent.xml")),
                                   m_dir.filePath(QStringLiteral("out.txt"))));
    EXPECT_TRUE(converter.errorString().startsWith(QStringLiteral("Input file not found")));
}

TEST_F(ConverterTest, MissingStylesheetFails)
{
    Converter::Options options;
    options.stylesheets = {m_dir.filePath(QStringLiteral("nope.css"))};
    Converter converter(options);
    EXPECT_FALSE(converter.convert(m_input, m_dir.filePath(QStringLiteral("book.html"))));
    EXPECT_TRUE(converter.errorString().contains(QStringLiteral("nope.css")));
}

TEST_F(ConverterTest, MalformedInputFails)
{
    writeFile(m_input, "<TEI><text>");
    Converter converter(Converter::Options{});
    EXPECT_FALSE(converter.convert(m_input, m_dir.filePath(QStringLiteral("out.txt"))));
    EXPECT_FALSE(converter.errorString().isEmpty());
}
