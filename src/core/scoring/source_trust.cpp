#include "core/scoring/source_trust.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <algorithm>

namespace nr {

QString sourceTierToString(SourceTier tier)
{
    switch (tier) {
    case SourceTier::Whitelist: return QStringLiteral("whitelist");
    case SourceTier::Tier1:     return QStringLiteral("tier1");
    case SourceTier::Tier2:     return QStringLiteral("tier2");
    case SourceTier::Tier3:     return QStringLiteral("tier3");
    case SourceTier::Blacklist: return QStringLiteral("blacklist");
    }
    return QStringLiteral("tier3");
}

std::optional<SourceTier> sourceTierFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("whitelist")) return SourceTier::Whitelist;
    if (lower == QLatin1String("tier1"))     return SourceTier::Tier1;
    if (lower == QLatin1String("tier2"))     return SourceTier::Tier2;
    if (lower == QLatin1String("tier3"))     return SourceTier::Tier3;
    if (lower == QLatin1String("blacklist")) return SourceTier::Blacklist;
    return std::nullopt;
}

double tierBaseTrust(SourceTier tier)
{
    switch (tier) {
    case SourceTier::Whitelist: return 0.95;
    case SourceTier::Tier1:     return 0.85;
    case SourceTier::Tier2:     return 0.65;
    case SourceTier::Tier3:     return 0.40;
    case SourceTier::Blacklist: return 0.0;
    }
    return 0.40;
}

double SourceTrust::trust() const
{
    if (tier == SourceTier::Blacklist) {
        return 0.0;
    }
    return std::clamp(baseTrust.value_or(tierBaseTrust(tier)), 0.0, 1.0);
}

SourceTrustTable::SourceTrustTable(const std::vector<SourceTrust>& sources)
{
    m_sources.reserve(static_cast<qsizetype>(sources.size()));
    for (const SourceTrust& source : sources) {
        m_sources.insert(source.sourceId, source);
    }
}

std::optional<SourceTrust> SourceTrustTable::lookup(const QString& sourceId) const
{
    const auto it = m_sources.constFind(sourceId);
    if (it == m_sources.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

SourceTrustTable SourceTrustTable::fromJson(const QJsonObject& json)
{
    std::vector<SourceTrust> sources;
    const QJsonArray array = json.value(QStringLiteral("sources")).toArray();
    sources.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& value : array) {
        const QJsonObject entry = value.toObject();
        SourceTrust source;
        source.sourceId = entry.value(QStringLiteral("id")).toString();
        if (source.sourceId.isEmpty()) {
            LOG_WARN(nrRegistry, "Skipping source entry without id");
            continue;
        }
        const auto tier = sourceTierFromString(
            entry.value(QStringLiteral("tier")).toString(QStringLiteral("tier3")));
        if (!tier.has_value()) {
            LOG_WARN(nrRegistry, "Skipping source '%s' with unknown tier '%s'",
                     qUtf8Printable(source.sourceId),
                     qUtf8Printable(entry.value(QStringLiteral("tier")).toString()));
            continue;
        }
        source.tier = *tier;
        source.name = entry.value(QStringLiteral("name")).toString(source.sourceId);
        if (entry.value(QStringLiteral("baseTrust")).isDouble()) {
            source.baseTrust = entry.value(QStringLiteral("baseTrust")).toDouble();
        }
        sources.push_back(std::move(source));
    }
    return SourceTrustTable(sources);
}

std::optional<SourceTrustTable> SourceTrustTable::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(nrRegistry, "Failed to open sources file: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(nrRegistry, "Failed to parse sources JSON (%s): %s",
                 qUtf8Printable(filePath), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }
    return fromJson(doc.object());
}

} // namespace nr
