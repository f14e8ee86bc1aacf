#include "ranker_command.h"

#include "core/registry/source_registry_store.h"
#include "core/scoring/source_trust.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QTextStream>

#include <cstdio>

namespace nr {

namespace {

QJsonArray stringArray(const std::vector<QString>& values)
{
    QJsonArray array;
    for (const QString& value : values) {
        array.append(value);
    }
    return array;
}

QJsonObject scoresToJson(const ScoreVector& scores)
{
    QJsonObject json;
    json[QStringLiteral("integrity")] = scores.integrityScore();
    json[QStringLiteral("credibility")] = scores.credibilityScore();
    json[QStringLiteral("quality")] = scores.qualityScore();
    json[QStringLiteral("popularity")] = scores.popularityScore();
    json[QStringLiteral("relevance")] = scores.relevanceScore();
    json[QStringLiteral("spam")] = scores.spamScore();
    json[QStringLiteral("titleBodyConsistency")] = scores.integrity.titleBodyConsistency;
    json[QStringLiteral("contamination")] = scores.integrity.contamination;
    json[QStringLiteral("sourceTrust")] = scores.credibility.sourceTrust;
    json[QStringLiteral("corroborationCount")] = scores.credibility.corroborationCount;
    json[QStringLiteral("evidence")] = scores.credibility.evidenceScore;
    json[QStringLiteral("sensationalismPenalty")] = scores.credibility.sensationalismPenalty;
    json[QStringLiteral("trendingVelocity")] = scores.popularity.trendingVelocity;
    json[QStringLiteral("flags")] = stringArray(scores.diagnosticFlags());
    return json;
}

bool parseIntOption(const QCommandLineParser& parser, const QCommandLineOption& option,
                      int& target)
{
    if (!parser.isSet(option)) {
        return true;
    }
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok) {
        return false;
    }
    target = value;
    return true;
}

void printError(const QString& message)
{
    QTextStream err(stderr);
    err << "newsrank-ranker: " << message << Qt::endl;
}

} // namespace

std::optional<std::vector<NormalizedArticle>> RankerCommand::loadArticles(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(nrCore, "Failed to open articles file: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        LOG_WARN(nrCore, "Failed to parse articles JSON (%s): %s",
                 qUtf8Printable(filePath), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    std::vector<NormalizedArticle> articles;
    const QJsonArray array = doc.array();
    articles.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        articles.push_back(articleFromJson(value.toObject()));
    }
    return articles;
}

QJsonDocument RankerCommand::resultToJson(const EngineResult& result)
{
    QJsonArray results;
    for (const RankedArticle& ranked : result.ranked) {
        QJsonObject entry;
        entry[QStringLiteral("rank")] = ranked.rankPosition;
        entry[QStringLiteral("finalScore")] = ranked.finalScore;
        entry[QStringLiteral("clusterId")] = ranked.clusterId;
        entry[QStringLiteral("clusterSize")] = ranked.clusterSize;
        entry[QStringLiteral("policyFlags")] = stringArray(ranked.policyFlags);
        entry[QStringLiteral("scores")] = scoresToJson(ranked.scores);
        entry[QStringLiteral("article")] = articleToJson(ranked.article);
        results.append(entry);
    }

    QJsonObject dedup;
    dedup[QStringLiteral("input")] = result.dedupStats.inputCount;
    dedup[QStringLiteral("afterUrl")] = result.dedupStats.afterUrl;
    dedup[QStringLiteral("afterTitle")] = result.dedupStats.afterTitle;
    dedup[QStringLiteral("clusters")] = result.dedupStats.clusterCount;

    QJsonObject root;
    root[QStringLiteral("preset")] = result.presetName;
    root[QStringLiteral("count")] = static_cast<int>(result.ranked.size());
    root[QStringLiteral("dedup")] = dedup;
    root[QStringLiteral("results")] = results;
    return QJsonDocument(root);
}

int RankerCommand::run(const QStringList& arguments, QIODevice& output)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Deduplicate, score and rank a batch of news articles."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption articlesOption(
        QStringLiteral("articles"), QStringLiteral("JSON array of normalized articles."),
        QStringLiteral("file"));
    const QCommandLineOption sourcesOption(
        QStringLiteral("sources"), QStringLiteral("JSON source trust table."),
        QStringLiteral("file"));
    const QCommandLineOption registryOption(
        QStringLiteral("registry"), QStringLiteral("SQLite source registry."),
        QStringLiteral("db"));
    const QCommandLineOption settingsOption(
        QStringLiteral("settings"), QStringLiteral("JSON engine settings."),
        QStringLiteral("file"));
    const QCommandLineOption saveSettingsOption(
        QStringLiteral("save-settings"),
        QStringLiteral("Write the effective settings (file plus overrides) as JSON."),
        QStringLiteral("file"));
    const QCommandLineOption presetOption(
        QStringLiteral("preset"), QStringLiteral("Ranking preset name."),
        QStringLiteral("name"));
    const QCommandLineOption limitOption(
        QStringLiteral("limit"), QStringLiteral("Maximum number of results."),
        QStringLiteral("n"));
    const QCommandLineOption offsetOption(
        QStringLiteral("offset"), QStringLiteral("Results to skip after diversity capping."),
        QStringLiteral("n"));
    const QCommandLineOption capOption(
        QStringLiteral("diversity-cap"), QStringLiteral("Maximum results per source."),
        QStringLiteral("n"));
    const QCommandLineOption nowOption(
        QStringLiteral("now"), QStringLiteral("Reference time (ISO 8601)."),
        QStringLiteral("time"));
    const QCommandLineOption verboseOption(
        QStringLiteral("verbose"), QStringLiteral("Enable debug logging."));

    parser.addOptions({articlesOption, sourcesOption, registryOption, settingsOption,
                       saveSettingsOption, presetOption, limitOption, offsetOption, capOption, nowOption,
                       verboseOption});
    parser.process(arguments);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("newsrank.*.debug=true"));
    }

    if (!parser.isSet(articlesOption)) {
        printError(QStringLiteral("--articles is required"));
        return ExitIoError;
    }
    if (parser.isSet(sourcesOption) && parser.isSet(registryOption)) {
        printError(QStringLiteral("--sources and --registry are mutually exclusive"));
        return ExitConfigError;
    }

    // Settings
    EngineSettings settings;
    if (parser.isSet(settingsOption)) {
        auto loaded = SettingsManager::loadFromFile(parser.value(settingsOption));
        if (!loaded.has_value()) {
            printError(QStringLiteral("cannot read settings file %1")
                           .arg(parser.value(settingsOption)));
            return ExitIoError;
        }
        settings = std::move(*loaded);
    }
    if (!parseIntOption(parser, limitOption, settings.limit)
        || !parseIntOption(parser, offsetOption, settings.offset)
        || !parseIntOption(parser, capOption, settings.diversityCap)) {
        printError(QStringLiteral("--limit, --offset and --diversity-cap take integers"));
        return ExitConfigError;
    }
    if (parser.isSet(nowOption)) {
        const QDateTime now = QDateTime::fromString(parser.value(nowOption), Qt::ISODate);
        if (!now.isValid()) {
            printError(QStringLiteral("invalid --now timestamp: %1").arg(parser.value(nowOption)));
            return ExitConfigError;
        }
        settings.referenceTime = now;
    }
    if (parser.isSet(presetOption)) {
        settings.presetName = parser.value(presetOption);
    }
    if (parser.isSet(saveSettingsOption)
        && !SettingsManager::saveToFile(settings, parser.value(saveSettingsOption))) {
        printError(QStringLiteral("cannot write settings file %1")
                       .arg(parser.value(saveSettingsOption)));
        return ExitIoError;
    }

    // Source trust
    SourceTrustTable trustTable;
    if (parser.isSet(sourcesOption)) {
        auto table = SourceTrustTable::loadFromFile(parser.value(sourcesOption));
        if (!table.has_value()) {
            printError(QStringLiteral("cannot read sources file %1")
                           .arg(parser.value(sourcesOption)));
            return ExitIoError;
        }
        trustTable = std::move(*table);
    } else if (parser.isSet(registryOption)) {
        auto store = SourceRegistryStore::open(parser.value(registryOption));
        if (!store.has_value()) {
            printError(QStringLiteral("cannot open registry %1")
                           .arg(parser.value(registryOption)));
            return ExitIoError;
        }
        trustTable = store->snapshot();
    } else {
        LOG_WARN(nrCore, "No source trust table given; every source is unknown");
    }

    // Articles
    auto articles = loadArticles(parser.value(articlesOption));
    if (!articles.has_value()) {
        printError(QStringLiteral("cannot read articles file %1")
                       .arg(parser.value(articlesOption)));
        return ExitIoError;
    }

    RankingRequest request;
    request.articles = std::move(*articles);

    const RankingEngine engine(trustTable, settings);
    const EngineResult result = engine.run(request);
    if (!result.ok()) {
        printError(result.errorMessage.value_or(QStringLiteral("configuration error")));
        return ExitConfigError;
    }

    const QByteArray json = resultToJson(result).toJson(QJsonDocument::Indented);
    if (output.write(json) != json.size()) {
        printError(QStringLiteral("failed to write results"));
        return ExitIoError;
    }
    return ExitOk;
}

} // namespace nr
