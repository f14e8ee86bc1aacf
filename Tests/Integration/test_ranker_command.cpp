#include <QtTest/QtTest>
#include "ranker_command.h"
#include "core/registry/source_registry_store.h"
#include "core/shared/settings_manager.h"
#include "Support/article_builders.h"

#include <QBuffer>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <memory>

using nr::RankerCommand;
using nr::test::makeArticle;

class TestRankerCommand : public QObject {
    Q_OBJECT

private slots:
    void init();

    // ── Successful runs ─────────────────────────────────────────
    void testRanksArticlesFile();
    void testPresetAndLimitOptions();
    void testSourcesFileAppliesTrust();
    void testRegistryAppliesTrust();
    void testSettingsFile();
    void testSaveSettingsWritesEffectiveConfiguration();

    // ── Failures ────────────────────────────────────────────────
    void testMissingArticlesOption();
    void testUnreadableArticlesFile();
    void testMalformedArticlesFile();
    void testSourcesAndRegistryConflict();
    void testUnknownPreset();
    void testNonIntegerLimit();
    void testNegativeLimit();
    void testInvalidNow();
    void testSaveSettingsUnwritable();

private:
    QString writeFile(const QString& name, const QByteArray& contents);
    QString writeArticles();
    int runCommand(const QStringList& extraArgs, QJsonObject* json = nullptr);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestRankerCommand::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

QString TestRankerCommand::writeFile(const QString& name, const QByteArray& contents)
{
    const QString path = m_dir->filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return {};
    }
    file.write(contents);
    return path;
}

QString TestRankerCommand::writeArticles()
{
    nr::NormalizedArticle repost = makeArticle(QStringLiteral("a3"), QStringLiteral("blog"),
                                               QStringLiteral("a copy of the bridge story"));
    repost.url = QStringLiteral("https://news.example.com/articles/a1?utm_source=feed");

    QJsonArray array;
    array.append(nr::articleToJson(makeArticle(QStringLiteral("a1"), QStringLiteral("wire"),
                                               QStringLiteral("harbour bridge reopens after repairs"))));
    array.append(nr::articleToJson(makeArticle(QStringLiteral("a2"), QStringLiteral("daily"),
                                               QStringLiteral("city council approves transit budget"))));
    array.append(nr::articleToJson(repost));
    return writeFile(QStringLiteral("articles.json"), QJsonDocument(array).toJson());
}

int TestRankerCommand::runCommand(const QStringList& extraArgs, QJsonObject* json)
{
    QBuffer buffer;
    buffer.open(QIODevice::WriteOnly);
    RankerCommand command;
    const int code = command.run(QStringList{QStringLiteral("newsrank-ranker")} + extraArgs, buffer);
    if (json) {
        *json = QJsonDocument::fromJson(buffer.data()).object();
    }
    return code;
}

namespace {

QJsonObject resultFor(const QJsonObject& root, const QString& id)
{
    const QJsonArray results = root.value(QStringLiteral("results")).toArray();
    for (const QJsonValue& value : results) {
        const QJsonObject entry = value.toObject();
        if (entry.value(QStringLiteral("article")).toObject().value(QStringLiteral("id")).toString() == id) {
            return entry;
        }
    }
    return {};
}

} // namespace

// ── Successful runs ─────────────────────────────────────────────

void TestRankerCommand::testRanksArticlesFile()
{
    QJsonObject root;
    const int code = runCommand({QStringLiteral("--articles"), writeArticles(),
                                 QStringLiteral("--now"), QStringLiteral("2024-05-01T12:00:00Z")},
                                &root);
    QCOMPARE(code, int(RankerCommand::ExitOk));
    QCOMPARE(root.value(QStringLiteral("preset")).toString(), QStringLiteral("quality"));
    QCOMPARE(root.value(QStringLiteral("count")).toInt(), 2);

    const QJsonObject dedup = root.value(QStringLiteral("dedup")).toObject();
    QCOMPARE(dedup.value(QStringLiteral("input")).toInt(), 3);
    QCOMPARE(dedup.value(QStringLiteral("afterUrl")).toInt(), 2);

    const QJsonArray results = root.value(QStringLiteral("results")).toArray();
    QCOMPARE(results.size(), 2);
    QCOMPARE(results.at(0).toObject().value(QStringLiteral("rank")).toInt(), 1);
    QCOMPARE(results.at(1).toObject().value(QStringLiteral("rank")).toInt(), 2);

    const QJsonObject bridge = resultFor(root, QStringLiteral("a1"));
    QVERIFY(!bridge.isEmpty());
    QCOMPARE(bridge.value(QStringLiteral("clusterSize")).toInt(), 2);
    QCOMPARE(bridge.value(QStringLiteral("article")).toObject().value(QStringLiteral("body")).toString(),
             QStringLiteral("reporters covered harbour bridge reopens after repairs with several details today"));
    QVERIFY(bridge.value(QStringLiteral("scores")).toObject().contains(QStringLiteral("credibility")));

    // Without a trust table every source is unknown and flagged.
    const QJsonArray flags = bridge.value(QStringLiteral("policyFlags")).toArray();
    QVERIFY(flags.contains(QStringLiteral("suspicious_credibility")));
}

void TestRankerCommand::testPresetAndLimitOptions()
{
    QJsonObject root;
    const int code = runCommand({QStringLiteral("--articles"), writeArticles(),
                                 QStringLiteral("--preset"), QStringLiteral("trending"),
                                 QStringLiteral("--limit"), QStringLiteral("1")},
                                &root);
    QCOMPARE(code, int(RankerCommand::ExitOk));
    QCOMPARE(root.value(QStringLiteral("preset")).toString(), QStringLiteral("trending"));
    QCOMPARE(root.value(QStringLiteral("count")).toInt(), 1);
}

void TestRankerCommand::testSourcesFileAppliesTrust()
{
    const QString sources = writeFile(QStringLiteral("sources.json"), R"({
        "sources": [
            {"id": "wire", "name": "Wire Service", "tier": "whitelist"},
            {"id": "daily", "tier": "tier1"}
        ]
    })");

    QJsonObject root;
    const int code = runCommand({QStringLiteral("--articles"), writeArticles(),
                                 QStringLiteral("--sources"), sources},
                                &root);
    QCOMPARE(code, int(RankerCommand::ExitOk));

    const QJsonObject scores = resultFor(root, QStringLiteral("a1"))
                                   .value(QStringLiteral("scores")).toObject();
    QCOMPARE(scores.value(QStringLiteral("sourceTrust")).toDouble(), 0.95);
    QVERIFY(resultFor(root, QStringLiteral("a1"))
                .value(QStringLiteral("policyFlags")).toArray().isEmpty());
}

void TestRankerCommand::testRegistryAppliesTrust()
{
    const QString dbPath = m_dir->filePath(QStringLiteral("registry.db"));
    {
        auto store = nr::SourceRegistryStore::open(dbPath);
        QVERIFY(store.has_value());
        nr::SourceRecord wire;
        wire.id = QStringLiteral("wire");
        wire.name = QStringLiteral("Wire Service");
        wire.tier = nr::SourceTier::Tier1;
        wire.baseTrust = 0.9;
        QVERIFY(store->upsertSource(wire));
    }

    QJsonObject root;
    const int code = runCommand({QStringLiteral("--articles"), writeArticles(),
                                 QStringLiteral("--registry"), dbPath},
                                &root);
    QCOMPARE(code, int(RankerCommand::ExitOk));
    const QJsonObject scores = resultFor(root, QStringLiteral("a1"))
                                   .value(QStringLiteral("scores")).toObject();
    QCOMPARE(scores.value(QStringLiteral("sourceTrust")).toDouble(), 0.9);
}

void TestRankerCommand::testSettingsFile()
{
    const QString settings = writeFile(QStringLiteral("settings.json"),
                                       R"({"preset": "credible", "limit": 1})");
    QJsonObject root;
    const int code = runCommand({QStringLiteral("--articles"), writeArticles(),
                                 QStringLiteral("--settings"), settings},
                                &root);
    QCOMPARE(code, int(RankerCommand::ExitOk));
    QCOMPARE(root.value(QStringLiteral("preset")).toString(), QStringLiteral("credible"));
    QCOMPARE(root.value(QStringLiteral("count")).toInt(), 1);
}

void TestRankerCommand::testSaveSettingsWritesEffectiveConfiguration()
{
    const QString settings = writeFile(QStringLiteral("settings.json"), R"({"diversityCap": 2})");
    const QString saved = m_dir->filePath(QStringLiteral("out/effective.json"));
    const int code = runCommand({QStringLiteral("--articles"), writeArticles(),
                                 QStringLiteral("--settings"), settings,
                                 QStringLiteral("--preset"), QStringLiteral("trending"),
                                 QStringLiteral("--limit"), QStringLiteral("7"),
                                 QStringLiteral("--now"), QStringLiteral("2024-05-01T12:00:00Z"),
                                 QStringLiteral("--save-settings"), saved});
    QCOMPARE(code, int(RankerCommand::ExitOk));

    const auto loaded = nr::SettingsManager::loadFromFile(saved);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->diversityCap, 2);
    QCOMPARE(loaded->limit, 7);
    QCOMPARE(loaded->presetName, QStringLiteral("trending"));
    QVERIFY(loaded->referenceTime.has_value());
    QCOMPARE(*loaded->referenceTime, nr::test::referenceNow());
}

// ── Failures ────────────────────────────────────────────────────

void TestRankerCommand::testMissingArticlesOption()
{
    QCOMPARE(runCommand({}), int(RankerCommand::ExitIoError));
}

void TestRankerCommand::testUnreadableArticlesFile()
{
    const QString missing = m_dir->filePath(QStringLiteral("does-not-exist.json"));
    QCOMPARE(runCommand({QStringLiteral("--articles"), missing}), int(RankerCommand::ExitIoError));
}

void TestRankerCommand::testMalformedArticlesFile()
{
    const QString path = writeFile(QStringLiteral("broken.json"), "{\"not\": \"an array\"}");
    QCOMPARE(runCommand({QStringLiteral("--articles"), path}), int(RankerCommand::ExitIoError));
}

void TestRankerCommand::testSourcesAndRegistryConflict()
{
    QCOMPARE(runCommand({QStringLiteral("--articles"), writeArticles(),
                         QStringLiteral("--sources"), QStringLiteral("a.json"),
                         QStringLiteral("--registry"), QStringLiteral("b.db")}),
             int(RankerCommand::ExitConfigError));
}

void TestRankerCommand::testUnknownPreset()
{
    QJsonObject root;
    QCOMPARE(runCommand({QStringLiteral("--articles"), writeArticles(),
                         QStringLiteral("--preset"), QStringLiteral("viral")},
                        &root),
             int(RankerCommand::ExitConfigError));
    QVERIFY(root.isEmpty());
}

void TestRankerCommand::testNonIntegerLimit()
{
    QCOMPARE(runCommand({QStringLiteral("--articles"), writeArticles(),
                         QStringLiteral("--limit"), QStringLiteral("ten")}),
             int(RankerCommand::ExitConfigError));
}

void TestRankerCommand::testNegativeLimit()
{
    QCOMPARE(runCommand({QStringLiteral("--articles"), writeArticles(),
                         QStringLiteral("--limit=-1")}),
             int(RankerCommand::ExitConfigError));
}

void TestRankerCommand::testInvalidNow()
{
    QCOMPARE(runCommand({QStringLiteral("--articles"), writeArticles(),
                         QStringLiteral("--now"), QStringLiteral("yesterday")}),
             int(RankerCommand::ExitConfigError));
}

void TestRankerCommand::testSaveSettingsUnwritable()
{
    // A regular file where the parent directory should be.
    const QString blocker = writeFile(QStringLiteral("blocker"), "x");
    QCOMPARE(runCommand({QStringLiteral("--articles"), writeArticles(),
                         QStringLiteral("--save-settings"), blocker + QStringLiteral("/settings.json")}),
             int(RankerCommand::ExitIoError));
}

QTEST_MAIN(TestRankerCommand)
#include "test_ranker_command.moc"
