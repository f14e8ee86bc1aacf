#pragma once

#include <QHash>
#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace nr {

enum class SourceTier {
    Whitelist,
    Tier1,
    Tier2,
    Tier3,
    Blacklist,
};

QString sourceTierToString(SourceTier tier);
std::optional<SourceTier> sourceTierFromString(const QString& str);

// Default trust per tier: whitelist 0.95, tier1 0.85, tier2 0.65,
// tier3 0.40, blacklist 0.0.
double tierBaseTrust(SourceTier tier);

struct SourceTrust {
    QString sourceId;
    QString name;
    SourceTier tier = SourceTier::Tier3;
    std::optional<double> baseTrust;    // registry override of the tier default

    // Effective trust in [0,1]. Blacklisted sources are always 0.0.
    double trust() const;
};

// SourceTrustLookup -- narrow read interface onto the external source
// registry. Implementations must be safe to call concurrently for reads.
class SourceTrustLookup {
public:
    virtual ~SourceTrustLookup() = default;

    // Returns nullopt for unknown source identifiers.
    virtual std::optional<SourceTrust> lookup(const QString& sourceId) const = 0;
};

// Immutable in-memory lookup table, typically a snapshot of the registry
// taken before a ranking run.
class SourceTrustTable : public SourceTrustLookup {
public:
    SourceTrustTable() = default;
    explicit SourceTrustTable(const std::vector<SourceTrust>& sources);

    std::optional<SourceTrust> lookup(const QString& sourceId) const override;

    int size() const { return m_sources.size(); }

    // {"sources": [{"id", "name", "tier", "baseTrust"}]}. Entries without
    // an id or with an unrecognised tier are skipped with a warning.
    static SourceTrustTable fromJson(const QJsonObject& json);
    static std::optional<SourceTrustTable> loadFromFile(const QString& filePath);

private:
    QHash<QString, SourceTrust> m_sources;
};

} // namespace nr
