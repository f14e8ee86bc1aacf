#include <QtTest/QtTest>
#include "core/scoring/source_trust.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

using nr::SourceTier;
using nr::SourceTrust;
using nr::SourceTrustTable;

class TestSourceTrust : public QObject {
    Q_OBJECT

private slots:
    void testTierBaseTrust();
    void testTierStringRoundTrip();
    void testUnknownTierString();
    void testBaseTrustOverride();
    void testBlacklistAlwaysZero();
    void testTableLookup();
    void testFromJsonSkipsBadEntries();
    void testLoadFromFile();
    void testLoadFromMissingFile();
};

void TestSourceTrust::testTierBaseTrust()
{
    QCOMPARE(nr::tierBaseTrust(SourceTier::Whitelist), 0.95);
    QCOMPARE(nr::tierBaseTrust(SourceTier::Tier1), 0.85);
    QCOMPARE(nr::tierBaseTrust(SourceTier::Tier2), 0.65);
    QCOMPARE(nr::tierBaseTrust(SourceTier::Tier3), 0.40);
    QCOMPARE(nr::tierBaseTrust(SourceTier::Blacklist), 0.0);
}

void TestSourceTrust::testTierStringRoundTrip()
{
    for (SourceTier tier : {SourceTier::Whitelist, SourceTier::Tier1, SourceTier::Tier2,
                            SourceTier::Tier3, SourceTier::Blacklist}) {
        const auto parsed = nr::sourceTierFromString(nr::sourceTierToString(tier));
        QVERIFY(parsed.has_value());
        QCOMPARE(*parsed, tier);
    }
    QCOMPARE(*nr::sourceTierFromString(QStringLiteral(" Tier1 ")), SourceTier::Tier1);
}

void TestSourceTrust::testUnknownTierString()
{
    QVERIFY(!nr::sourceTierFromString(QStringLiteral("tier4")).has_value());
    QVERIFY(!nr::sourceTierFromString(QString()).has_value());
}

void TestSourceTrust::testBaseTrustOverride()
{
    SourceTrust source;
    source.tier = SourceTier::Tier2;
    QCOMPARE(source.trust(), 0.65);
    source.baseTrust = 0.72;
    QCOMPARE(source.trust(), 0.72);
    source.baseTrust = 1.5;
    QCOMPARE(source.trust(), 1.0);
}

void TestSourceTrust::testBlacklistAlwaysZero()
{
    SourceTrust source;
    source.tier = SourceTier::Blacklist;
    source.baseTrust = 0.9;
    QCOMPARE(source.trust(), 0.0);
}

void TestSourceTrust::testTableLookup()
{
    SourceTrust wire;
    wire.sourceId = QStringLiteral("wire");
    wire.name = QStringLiteral("Wire Service");
    wire.tier = SourceTier::Whitelist;

    const SourceTrustTable table({wire});
    QCOMPARE(table.size(), 1);
    const auto found = table.lookup(QStringLiteral("wire"));
    QVERIFY(found.has_value());
    QCOMPARE(found->name, QStringLiteral("Wire Service"));
    QVERIFY(!table.lookup(QStringLiteral("unknown")).has_value());
}

void TestSourceTrust::testFromJsonSkipsBadEntries()
{
    const QByteArray raw = R"({"sources": [
        {"id": "wire", "name": "Wire Service", "tier": "whitelist"},
        {"id": "blog", "tier": "tier3", "baseTrust": 0.3},
        {"name": "no id", "tier": "tier1"},
        {"id": "odd", "tier": "platinum"}
    ]})";
    const SourceTrustTable table = SourceTrustTable::fromJson(QJsonDocument::fromJson(raw).object());
    QCOMPARE(table.size(), 2);
    QCOMPARE(table.lookup(QStringLiteral("wire"))->trust(), 0.95);
    QCOMPARE(table.lookup(QStringLiteral("blog"))->trust(), 0.3);
    QCOMPARE(table.lookup(QStringLiteral("blog"))->name, QStringLiteral("blog"));
    QVERIFY(!table.lookup(QStringLiteral("odd")).has_value());
}

void TestSourceTrust::testLoadFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + QStringLiteral("/sources.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"sources": [{"id": "daily", "tier": "tier2"}]})");
    file.close();

    const auto table = SourceTrustTable::loadFromFile(path);
    QVERIFY(table.has_value());
    QCOMPARE(table->lookup(QStringLiteral("daily"))->tier, SourceTier::Tier2);
}

void TestSourceTrust::testLoadFromMissingFile()
{
    QVERIFY(!SourceTrustTable::loadFromFile(QStringLiteral("/nonexistent/sources.json")).has_value());
}

QTEST_MAIN(TestSourceTrust)
#include "test_source_trust.moc"
