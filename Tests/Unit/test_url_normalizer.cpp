#include <QtTest/QtTest>
#include "core/dedup/url_normalizer.h"

using nr::UrlNormalizer;

class TestUrlNormalizer : public QObject {
    Q_OBJECT

private slots:
    void testStripsFragment();
    void testStripsQuery();
    void testLowercasesSchemeAndHost();
    void testStripsTrailingSlash();
    void testRootPath();
    void testPathCasePreserved();
    void testEmptyInput();
    void testWhitespaceTrimmed();
};

void TestUrlNormalizer::testStripsFragment()
{
    QCOMPARE(UrlNormalizer::normalize(QStringLiteral("https://news.example.com/a/1#comments")),
             QStringLiteral("https://news.example.com/a/1"));
}

void TestUrlNormalizer::testStripsQuery()
{
    QCOMPARE(UrlNormalizer::normalize(
                 QStringLiteral("https://news.example.com/a/1?utm_source=rss&utm_medium=feed")),
             QStringLiteral("https://news.example.com/a/1"));
}

void TestUrlNormalizer::testLowercasesSchemeAndHost()
{
    QCOMPARE(UrlNormalizer::normalize(QStringLiteral("HTTPS://News.Example.COM/a/1")),
             QStringLiteral("https://news.example.com/a/1"));
}

void TestUrlNormalizer::testStripsTrailingSlash()
{
    QCOMPARE(UrlNormalizer::normalize(QStringLiteral("https://news.example.com/a/1/")),
             UrlNormalizer::normalize(QStringLiteral("https://news.example.com/a/1")));
}

void TestUrlNormalizer::testRootPath()
{
    QCOMPARE(UrlNormalizer::normalize(QStringLiteral("https://news.example.com/")),
             QStringLiteral("https://news.example.com"));
}

void TestUrlNormalizer::testPathCasePreserved()
{
    QVERIFY(UrlNormalizer::normalize(QStringLiteral("https://news.example.com/Story"))
            != UrlNormalizer::normalize(QStringLiteral("https://news.example.com/story")));
}

void TestUrlNormalizer::testEmptyInput()
{
    QVERIFY(UrlNormalizer::normalize(QString()).isEmpty());
    QVERIFY(UrlNormalizer::normalize(QStringLiteral("   ")).isEmpty());
}

void TestUrlNormalizer::testWhitespaceTrimmed()
{
    QCOMPARE(UrlNormalizer::normalize(QStringLiteral("  https://news.example.com/a/1  ")),
             QStringLiteral("https://news.example.com/a/1"));
}

QTEST_MAIN(TestUrlNormalizer)
#include "test_url_normalizer.moc"
