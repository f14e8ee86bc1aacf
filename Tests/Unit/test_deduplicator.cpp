#include <QtTest/QtTest>
#include "core/dedup/deduplicator.h"
#include "Support/article_builders.h"

using nr::Deduplicator;
using nr::NormalizedArticle;
using nr::test::makeArticle;

class TestDeduplicator : public QObject {
    Q_OBJECT

private slots:
    void testEmptyInput();
    void testSingleArticle();
    void testUrlDuplicateFirstSeenWins();
    void testArticlesWithoutUrlNotMergedByUrl();
    void testTitleIdentityCaseAndWhitespace();
    void testTransitiveClusterPicksLongestBody();
    void testLongestBodyTieBreaksByArrival();
    void testThresholdInclusive();
    void testIdempotentOnOwnOutput();
    void testClusterIdStable();
    void testStageStats();
    void testOutputOrderedByEarliestArrival();
};

void TestDeduplicator::testEmptyInput()
{
    const auto result = Deduplicator().deduplicate({});
    QVERIFY(result.representatives.empty());
    QVERIFY(result.clusters.empty());
    QCOMPARE(result.stats.inputCount, 0);
}

void TestDeduplicator::testSingleArticle()
{
    const auto result = Deduplicator().deduplicate(
        {makeArticle(QStringLiteral("a1"), QStringLiteral("src"), QStringLiteral("lone story"))});
    QCOMPARE(result.representatives.size(), size_t(1));
    QCOMPARE(result.representatives[0].clusterSize, 1);
    QCOMPARE(result.clusters[0].representativeId, QStringLiteral("a1"));
}

void TestDeduplicator::testUrlDuplicateFirstSeenWins()
{
    NormalizedArticle first = makeArticle(QStringLiteral("a1"), QStringLiteral("s1"),
                                          QStringLiteral("harbour bridge reopens"));
    NormalizedArticle second = makeArticle(QStringLiteral("a2"), QStringLiteral("s2"),
                                           QStringLiteral("completely different headline"),
                                           QStringLiteral("a much longer body that would otherwise win the cluster"));
    first.url = QStringLiteral("https://News.Example.com/story/1?utm_source=rss");
    second.url = QStringLiteral("https://news.example.com/story/1/#top");

    const auto result = Deduplicator().deduplicate({first, second});
    QCOMPARE(result.stats.afterUrl, 1);
    QCOMPARE(result.representatives.size(), size_t(1));
    QCOMPARE(result.representatives[0].article.id, QStringLiteral("a1"));
    QCOMPARE(result.clusters[0].memberIds,
             (std::vector<QString>{QStringLiteral("a1"), QStringLiteral("a2")}));
}

void TestDeduplicator::testArticlesWithoutUrlNotMergedByUrl()
{
    NormalizedArticle first = makeArticle(QStringLiteral("a1"), QStringLiteral("s1"),
                                          QStringLiteral("harbour bridge reopens"));
    NormalizedArticle second = makeArticle(QStringLiteral("a2"), QStringLiteral("s2"),
                                           QStringLiteral("museum wing closes"));
    first.url.clear();
    second.url.clear();

    const auto result = Deduplicator().deduplicate({first, second});
    QCOMPARE(result.stats.afterUrl, 2);
    QCOMPARE(result.representatives.size(), size_t(2));
}

void TestDeduplicator::testTitleIdentityCaseAndWhitespace()
{
    const auto result = Deduplicator().deduplicate({
        makeArticle(QStringLiteral("a1"), QStringLiteral("s1"),
                    QStringLiteral("Election Results Announced")),
        makeArticle(QStringLiteral("a2"), QStringLiteral("s2"),
                    QStringLiteral("  election   RESULTS announced ")),
    });
    QCOMPARE(result.stats.afterUrl, 2);
    QCOMPARE(result.stats.afterTitle, 1);
    QCOMPARE(result.representatives.size(), size_t(1));
    QCOMPARE(result.representatives[0].article.id, QStringLiteral("a1"));
    QCOMPARE(result.representatives[0].clusterSize, 2);
}

void TestDeduplicator::testTransitiveClusterPicksLongestBody()
{
    // Pairwise title Jaccard: (a1,a2) 0.67, (a2,a3) 0.70, (a1,a3) 0.40.
    const auto result = Deduplicator().deduplicate({
        makeArticle(QStringLiteral("a1"), QStringLiteral("s1"),
                    QStringLiteral("central bank holds rates steady today"),
                    QStringLiteral("short body")),
        makeArticle(QStringLiteral("a2"), QStringLiteral("s2"),
                    QStringLiteral("central bank holds rates steady today amid inflation worries"),
                    QStringLiteral("a medium length body text")),
        makeArticle(QStringLiteral("a3"), QStringLiteral("s3"),
                    QStringLiteral("central bank holds rates amid inflation worries again"),
                    QStringLiteral("the longest body of the three articles in this cluster")),
    });
    QCOMPARE(result.representatives.size(), size_t(1));
    QCOMPARE(result.representatives[0].article.id, QStringLiteral("a3"));
    QCOMPARE(result.representatives[0].clusterSize, 3);
    QCOMPARE(result.representatives[0].arrivalIndex, 2);
}

void TestDeduplicator::testLongestBodyTieBreaksByArrival()
{
    const QString body = QStringLiteral("identical length body");
    const auto result = Deduplicator().deduplicate({
        makeArticle(QStringLiteral("a1"), QStringLiteral("s1"),
                    QStringLiteral("storm hits coastal towns overnight"), body),
        makeArticle(QStringLiteral("a2"), QStringLiteral("s2"),
                    QStringLiteral("storm hits coastal towns overnight again"), body),
    });
    QCOMPARE(result.representatives.size(), size_t(1));
    QCOMPARE(result.representatives[0].article.id, QStringLiteral("a1"));
}

void TestDeduplicator::testThresholdInclusive()
{
    // Jaccard exactly 0.6
    const std::vector<NormalizedArticle> articles = {
        makeArticle(QStringLiteral("a1"), QStringLiteral("s1"), QStringLiteral("central bank holds rates")),
        makeArticle(QStringLiteral("a2"), QStringLiteral("s2"), QStringLiteral("central bank cuts rates")),
    };
    QCOMPARE(Deduplicator().deduplicate(articles).representatives.size(), size_t(1));

    nr::DedupConfig strict;
    strict.similarityThreshold = 0.61;
    strict.graphFloor = 0.61;
    QCOMPARE(Deduplicator(strict).deduplicate(articles).representatives.size(), size_t(2));
}

void TestDeduplicator::testIdempotentOnOwnOutput()
{
    const std::vector<NormalizedArticle> input = {
        makeArticle(QStringLiteral("a1"), QStringLiteral("s1"), QStringLiteral("central bank holds rates")),
        makeArticle(QStringLiteral("a2"), QStringLiteral("s2"), QStringLiteral("central bank cuts rates")),
        makeArticle(QStringLiteral("a3"), QStringLiteral("s3"), QStringLiteral("museum wing closes")),
        makeArticle(QStringLiteral("a4"), QStringLiteral("s1"), QStringLiteral("MUSEUM wing closes")),
    };
    const auto first = Deduplicator().deduplicate(input);

    std::vector<NormalizedArticle> again;
    for (const auto& rep : first.representatives) {
        again.push_back(rep.article);
    }
    const auto second = Deduplicator().deduplicate(again);
    QCOMPARE(second.representatives.size(), first.representatives.size());
    for (const auto& rep : second.representatives) {
        QCOMPARE(rep.clusterSize, 1);
    }
}

void TestDeduplicator::testClusterIdStable()
{
    const QString id = Deduplicator::clusterIdFor(QStringLiteral("article-42"));
    QCOMPARE(id.size(), 16);
    QCOMPARE(id, Deduplicator::clusterIdFor(QStringLiteral("article-42")));
    QVERIFY(id != Deduplicator::clusterIdFor(QStringLiteral("article-43")));

    const auto result = Deduplicator().deduplicate(
        {makeArticle(QStringLiteral("article-42"), QStringLiteral("s"), QStringLiteral("a story"))});
    QCOMPARE(result.representatives[0].clusterId, id);
    QCOMPARE(result.clusters[0].clusterId, id);
}

void TestDeduplicator::testStageStats()
{
    NormalizedArticle urlDup = makeArticle(QStringLiteral("a2"), QStringLiteral("s2"),
                                           QStringLiteral("unrelated words here"));
    urlDup.url = QStringLiteral("https://news.example.com/articles/a1");

    const auto result = Deduplicator().deduplicate({
        makeArticle(QStringLiteral("a1"), QStringLiteral("s1"), QStringLiteral("harbour bridge reopens")),
        urlDup,
        makeArticle(QStringLiteral("a3"), QStringLiteral("s3"), QStringLiteral("Harbour Bridge Reopens")),
        makeArticle(QStringLiteral("a4"), QStringLiteral("s4"), QStringLiteral("harbour bridge reopens today")),
        makeArticle(QStringLiteral("a5"), QStringLiteral("s5"), QStringLiteral("museum wing closes")),
    });
    QCOMPARE(result.stats.inputCount, 5);
    QCOMPARE(result.stats.afterUrl, 4);
    QCOMPARE(result.stats.afterTitle, 3);
    QCOMPARE(result.stats.clusterCount, 2);
    QCOMPARE(result.clusters[0].size(), 4);
}

void TestDeduplicator::testOutputOrderedByEarliestArrival()
{
    const auto result = Deduplicator().deduplicate({
        makeArticle(QStringLiteral("a1"), QStringLiteral("s1"), QStringLiteral("museum wing closes")),
        makeArticle(QStringLiteral("a2"), QStringLiteral("s2"), QStringLiteral("harbour bridge reopens")),
        makeArticle(QStringLiteral("a3"), QStringLiteral("s3"), QStringLiteral("museum wing closes for repairs"),
                    QStringLiteral("this body is considerably longer than the generated body of the first "
                                   "article, so it represents the museum cluster")),
    });
    QCOMPARE(result.representatives.size(), size_t(2));
    QCOMPARE(result.representatives[0].article.id, QStringLiteral("a3"));
    QCOMPARE(result.representatives[1].article.id, QStringLiteral("a2"));
}

QTEST_MAIN(TestDeduplicator)
#include "test_deduplicator.moc"
