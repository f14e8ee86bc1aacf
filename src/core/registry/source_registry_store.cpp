#include "core/registry/source_registry_store.h"
#include "core/registry/registry_schema.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QTimeZone>

namespace nr {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, name, tier, base_trust, is_active, failure_count, last_crawled, last_success "
    "FROM sources";

QString columnText(sqlite3_stmt* stmt, int col)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? QString::fromUtf8(text) : QString();
}

std::optional<QDateTime> columnTime(sqlite3_stmt* stmt, int col)
{
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    const double epoch = sqlite3_column_double(stmt, col);
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(epoch * 1000.0), QTimeZone::UTC);
}

double toEpoch(const QDateTime& at)
{
    return static_cast<double>(at.toMSecsSinceEpoch()) / 1000.0;
}

SourceRecord readRow(sqlite3_stmt* stmt)
{
    SourceRecord record;
    record.id = columnText(stmt, 0);
    record.name = columnText(stmt, 1);
    const QString tier = columnText(stmt, 2);
    record.tier = sourceTierFromString(tier).value_or(SourceTier::Tier3);
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
        record.baseTrust = sqlite3_column_double(stmt, 3);
    }
    record.isActive = sqlite3_column_int(stmt, 4) != 0;
    record.failureCount = sqlite3_column_int(stmt, 5);
    record.lastCrawled = columnTime(stmt, 6);
    record.lastSuccess = columnTime(stmt, 7);
    return record;
}

} // namespace

SourceTrust SourceRecord::toTrust() const
{
    SourceTrust trust;
    trust.sourceId = id;
    trust.name = name.isEmpty() ? id : name;
    trust.tier = tier;
    trust.baseTrust = baseTrust;
    return trust;
}

SourceRegistryStore::~SourceRegistryStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SourceRegistryStore> SourceRegistryStore::open(const QString& dbPath)
{
    SourceRegistryStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SourceRegistryStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(nrRegistry, "Failed to open registry: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kRegistryConnectionPragmas)) {
        LOG_ERROR(nrRegistry, "Failed to set connection pragmas");
        return false;
    }

    int userVersion = 0;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db, "PRAGMA user_version", -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            userVersion = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    if (userVersion > kRegistrySchemaVersion) {
        LOG_ERROR(nrRegistry, "Registry schema v%d is newer than supported v%d",
                  userVersion, kRegistrySchemaVersion);
        return false;
    }

    if (userVersion == 0) {
        // In-memory databases stay in "memory" journal mode; that is fine.
        if (!execSql(kRegistryDatabasePragmas)) {
            LOG_ERROR(nrRegistry, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kRegistrySchemaV1)) {
            LOG_ERROR(nrRegistry, "Failed to create registry schema");
            return false;
        }
    }

    if (dbPath != QLatin1String(":memory:")) {
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(nrRegistry, "Registry opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SourceRegistryStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(nrRegistry, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SourceRegistryStore::upsertSource(const SourceRecord& source)
{
    if (source.id.isEmpty()) {
        LOG_WARN(nrRegistry, "upsertSource: empty source id");
        return false;
    }

    const char* sql = R"(
        INSERT INTO sources (id, name, tier, base_trust, is_active, failure_count)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            tier = excluded.tier,
            base_trust = excluded.base_trust
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(nrRegistry, "upsertSource prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray idUtf8 = source.id.toUtf8();
    const QByteArray nameUtf8 = (source.name.isEmpty() ? source.id : source.name).toUtf8();
    const QByteArray tierUtf8 = sourceTierToString(source.tier).toUtf8();

    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, nameUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, tierUtf8.constData(), -1, SQLITE_STATIC);
    if (source.baseTrust.has_value()) {
        sqlite3_bind_double(stmt, 4, *source.baseTrust);
    } else {
        sqlite3_bind_null(stmt, 4);
    }
    sqlite3_bind_int(stmt, 5, source.isActive ? 1 : 0);
    sqlite3_bind_int(stmt, 6, source.failureCount);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(nrRegistry, "upsertSource failed for '%s': %s",
                  idUtf8.constData(), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::optional<SourceRecord> SourceRegistryStore::getSource(const QString& sourceId)
{
    const QByteArray sql = QByteArray(kSelectColumns) + " WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(nrRegistry, "getSource prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray idUtf8 = sourceId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<SourceRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        record = readRow(stmt);
    }
    sqlite3_finalize(stmt);
    return record;
}

std::vector<SourceRecord> SourceRegistryStore::querySources(const char* sql)
{
    std::vector<SourceRecord> records;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(nrRegistry, "querySources prepare failed: %s", sqlite3_errmsg(m_db));
        return records;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        records.push_back(readRow(stmt));
    }
    sqlite3_finalize(stmt);
    return records;
}

std::vector<SourceRecord> SourceRegistryStore::activeSources()
{
    const QByteArray sql = QByteArray(kSelectColumns)
        + " WHERE is_active = 1 AND tier != 'blacklist' ORDER BY id";
    return querySources(sql.constData());
}

std::vector<SourceRecord> SourceRegistryStore::allSources()
{
    const QByteArray sql = QByteArray(kSelectColumns) + " ORDER BY id";
    return querySources(sql.constData());
}

bool SourceRegistryStore::recordSuccess(const QString& sourceId, const QDateTime& at)
{
    const char* sql = R"(
        UPDATE sources
        SET failure_count = 0, last_crawled = ?2, last_success = ?2
        WHERE id = ?1
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(nrRegistry, "recordSuccess prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QByteArray idUtf8 = sourceId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 2, toEpoch(at));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(nrRegistry, "recordSuccess failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return sqlite3_changes(m_db) > 0;
}

std::optional<int> SourceRegistryStore::recordFailure(const QString& sourceId,
                                                      int maxConsecutiveFailures,
                                                      const QDateTime& at)
{
    const char* sql = R"(
        UPDATE sources
        SET failure_count = failure_count + 1,
            last_crawled = ?2,
            is_active = CASE WHEN failure_count + 1 >= ?3 THEN 0 ELSE is_active END
        WHERE id = ?1
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(nrRegistry, "recordFailure prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray idUtf8 = sourceId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_double(stmt, 2, toEpoch(at));
    sqlite3_bind_int(stmt, 3, maxConsecutiveFailures);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(nrRegistry, "recordFailure failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    if (sqlite3_changes(m_db) == 0) {
        return std::nullopt;
    }

    const std::optional<SourceRecord> record = getSource(sourceId);
    if (!record.has_value()) {
        return std::nullopt;
    }
    if (!record->isActive) {
        LOG_WARN(nrRegistry, "source '%s' deactivated after %d consecutive failures",
                 idUtf8.constData(), record->failureCount);
    }
    return record->failureCount;
}

bool SourceRegistryStore::reactivate(const QString& sourceId)
{
    const char* sql = "UPDATE sources SET is_active = 1, failure_count = 0 WHERE id = ?1";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(nrRegistry, "reactivate prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const QByteArray idUtf8 = sourceId.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

SourceTrustTable SourceRegistryStore::snapshot()
{
    std::vector<SourceTrust> trust;
    for (const SourceRecord& record : allSources()) {
        trust.push_back(record.toTrust());
    }
    LOG_DEBUG(nrRegistry, "snapshot: %zu sources", trust.size());
    return SourceTrustTable(trust);
}

} // namespace nr
