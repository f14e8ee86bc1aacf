#pragma once

#include "core/scoring/source_trust.h"

#include <QDateTime>
#include <QString>

#include <optional>
#include <vector>

#include <sqlite3.h>

namespace nr {

// One row of the source registry.
struct SourceRecord {
    QString id;
    QString name;
    SourceTier tier = SourceTier::Tier3;
    std::optional<double> baseTrust;
    bool isActive = true;
    int failureCount = 0;                   // consecutive failures
    std::optional<QDateTime> lastCrawled;
    std::optional<QDateTime> lastSuccess;

    SourceTrust toTrust() const;
};

// SourceRegistryStore -- SQLite-backed owner of the cross-run source state.
//
// The ingestion side records crawl outcomes; the ranking side only ever sees
// an immutable snapshot() taken before a run. Single-threaded.
class SourceRegistryStore {
public:
    static constexpr int kDefaultMaxConsecutiveFailures = 5;

    ~SourceRegistryStore();

    // Move-only (owns sqlite3* handle)
    SourceRegistryStore(SourceRegistryStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SourceRegistryStore& operator=(SourceRegistryStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SourceRegistryStore(const SourceRegistryStore&) = delete;
    SourceRegistryStore& operator=(const SourceRegistryStore&) = delete;

    // Open or create the registry. ":memory:" opens a private in-memory
    // database.
    static std::optional<SourceRegistryStore> open(const QString& dbPath);

    // Insert a source, or update name/tier/base trust of an existing one.
    // Crawl counters and the active flag of an existing row are preserved.
    bool upsertSource(const SourceRecord& source);

    std::optional<SourceRecord> getSource(const QString& sourceId);

    // Active, non-blacklisted sources ordered by id.
    std::vector<SourceRecord> activeSources();
    std::vector<SourceRecord> allSources();

    // Resets the failure counter. Returns false for unknown sources.
    bool recordSuccess(const QString& sourceId,
                       const QDateTime& at = QDateTime::currentDateTimeUtc());

    // Increments the failure counter and deactivates the source once it
    // reaches maxConsecutiveFailures. Returns the new count, or nullopt for
    // unknown sources.
    std::optional<int> recordFailure(const QString& sourceId,
                                     int maxConsecutiveFailures = kDefaultMaxConsecutiveFailures,
                                     const QDateTime& at = QDateTime::currentDateTimeUtc());

    // Re-enables a deactivated source and clears its failure counter.
    bool reactivate(const QString& sourceId);

    // Immutable trust table over every registered source.
    SourceTrustTable snapshot();

private:
    SourceRegistryStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    std::vector<SourceRecord> querySources(const char* sql);

    sqlite3* m_db = nullptr;
};

} // namespace nr
