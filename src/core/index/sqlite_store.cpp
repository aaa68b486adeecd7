#include "core/index/sqlite_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"
#include "core/vector/vector_math.h"

#include <sqlite3.h>
#include <QDateTime>
#include <QFile>
#include <QHash>
#include <QSet>
#include <QUuid>

#include <algorithm>

namespace mc {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, title, type, content, description, source_path, source_url, "
    "mime_type, embedding, created_at, updated_at FROM media_items";

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

// Binds a QString, or NULL when empty. Caller keeps the bytes alive.
void bindOptionalText(sqlite3_stmt* stmt, int index, const QByteArray& utf8)
{
    if (utf8.isEmpty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        sqlite3_bind_text(stmt, index, utf8.constData(), -1, SQLITE_STATIC);
    }
}

} // namespace

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLiteStore> SQLiteStore::open(const QString& dbPath)
{
    SQLiteStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath)
{
    int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(mcIndex, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(mcIndex, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='media_items'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        // In-memory databases report "memory" instead of WAL; not an error.
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(mcIndex, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV1)) {
            LOG_ERROR(mcIndex, "Failed to create schema");
            return false;
        }
    }

    if (dbPath != QLatin1String(":memory:")) {
        // Restrict database file permissions to owner-only (0600)
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(mcIndex, "Database opened successfully: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(mcIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void SQLiteStore::reportError(CatalogError* errorOut, const char* context) const
{
    const char* message = m_db ? sqlite3_errmsg(m_db) : "database not open";
    LOG_ERROR(mcIndex, "%s failed: %s", context, message);
    setError(errorOut, ErrorCode::StorageError,
             QStringLiteral("%1 failed: %2").arg(QLatin1String(context), QString::fromUtf8(message)));
}

QByteArray SQLiteStore::encodeEmbedding(const Embedding& embedding)
{
    return QByteArray(reinterpret_cast<const char*>(embedding.data()),
                      static_cast<int>(embedding.size() * sizeof(float)));
}

Embedding SQLiteStore::decodeEmbedding(const void* blob, int bytes)
{
    if (!blob || bytes <= 0 || bytes % static_cast<int>(sizeof(float)) != 0) {
        return {};
    }
    Embedding embedding(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(embedding.data(), blob, static_cast<size_t>(bytes));
    return embedding;
}

MediaRecord SQLiteStore::readRecord(sqlite3_stmt* stmt)
{
    MediaRecord record;
    record.id = columnText(stmt, 0);
    record.title = columnText(stmt, 1);
    record.type = mediaTypeFromString(columnText(stmt, 2)).value_or(MediaType::Text);
    record.content = columnText(stmt, 3);
    record.description = columnText(stmt, 4);
    record.sourcePath = columnText(stmt, 5);
    record.sourceUrl = columnText(stmt, 6);
    record.mimeType = columnText(stmt, 7);
    record.embedding = decodeEmbedding(sqlite3_column_blob(stmt, 8),
                                       sqlite3_column_bytes(stmt, 8));
    record.createdAt = sqlite3_column_double(stmt, 9);
    record.updatedAt = sqlite3_column_double(stmt, 10);
    return record;
}

// ── Records ─────────────────────────────────────────────────

std::optional<MediaRecord> SQLiteStore::insertRecord(const MediaRecord& record,
                                                     CatalogError* errorOut)
{
    if (record.title.trimmed().isEmpty()) {
        setError(errorOut, ErrorCode::InvalidInput, QStringLiteral("Title must not be empty"));
        return std::nullopt;
    }

    const char* sql = R"(
        INSERT INTO media_items (id, title, type, content, description, source_path,
                                 source_url, mime_type, embedding, embedding_dims,
                                 created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        reportError(errorOut, "insertRecord prepare");
        return std::nullopt;
    }

    MediaRecord stored = record;
    if (stored.id.isEmpty()) {
        stored.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    const double now = static_cast<double>(QDateTime::currentSecsSinceEpoch());
    if (stored.createdAt <= 0.0) {
        stored.createdAt = now;
    }
    if (stored.updatedAt <= 0.0) {
        stored.updatedAt = stored.createdAt;
    }

    const QByteArray idUtf8 = stored.id.toUtf8();
    const QByteArray titleUtf8 = stored.title.toUtf8();
    const QByteArray typeUtf8 = mediaTypeToString(stored.type).toUtf8();
    const QByteArray contentUtf8 = stored.content.toUtf8();
    const QByteArray descUtf8 = stored.description.toUtf8();
    const QByteArray pathUtf8 = stored.sourcePath.toUtf8();
    const QByteArray urlUtf8 = stored.sourceUrl.toUtf8();
    const QByteArray mimeUtf8 = stored.mimeType.toUtf8();
    const QByteArray blob = encodeEmbedding(stored.embedding);

    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, titleUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, typeUtf8.constData(), -1, SQLITE_STATIC);
    bindOptionalText(stmt, 4, contentUtf8);
    bindOptionalText(stmt, 5, descUtf8);
    bindOptionalText(stmt, 6, pathUtf8);
    bindOptionalText(stmt, 7, urlUtf8);
    bindOptionalText(stmt, 8, mimeUtf8);
    if (blob.isEmpty()) {
        sqlite3_bind_null(stmt, 9);
    } else {
        sqlite3_bind_blob(stmt, 9, blob.constData(), blob.size(), SQLITE_STATIC);
    }
    sqlite3_bind_int(stmt, 10, static_cast<int>(stored.embedding.size()));
    sqlite3_bind_double(stmt, 11, stored.createdAt);
    sqlite3_bind_double(stmt, 12, stored.updatedAt);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        reportError(errorOut, "insertRecord");
        return std::nullopt;
    }

    LOG_DEBUG(mcIndex, "insertRecord: id=%s type=%s dims=%d",
              idUtf8.constData(), typeUtf8.constData(),
              static_cast<int>(stored.embedding.size()));
    return stored;
}

std::optional<MediaRecord> SQLiteStore::getRecord(const QString& id, CatalogError* errorOut)
{
    const QByteArray sql = QByteArray(kSelectColumns) + " WHERE id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        reportError(errorOut, "getRecord prepare");
        return std::nullopt;
    }

    const QByteArray idUtf8 = id.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<MediaRecord> result;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        result = readRecord(stmt);
    }
    sqlite3_finalize(stmt);

    if (rc == SQLITE_ROW) {
        return result;
    }
    if (rc == SQLITE_DONE) {
        setError(errorOut, ErrorCode::NotFound,
                 QStringLiteral("Media item %1 not found").arg(id));
        return std::nullopt;
    }
    reportError(errorOut, "getRecord");
    return std::nullopt;
}

std::optional<std::vector<MediaRecord>> SQLiteStore::getRecords(const QStringList& ids,
                                                                CatalogError* errorOut)
{
    std::vector<MediaRecord> ordered;
    if (ids.isEmpty()) {
        return ordered;
    }

    QByteArray sql = QByteArray(kSelectColumns) + " WHERE id IN (";
    for (int i = 0; i < ids.size(); ++i) {
        sql += (i == 0) ? "?" : ",?";
    }
    sql += ")";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        reportError(errorOut, "getRecords prepare");
        return std::nullopt;
    }

    std::vector<QByteArray> idBytes;
    idBytes.reserve(static_cast<size_t>(ids.size()));
    for (int i = 0; i < ids.size(); ++i) {
        idBytes.push_back(ids[i].toUtf8());
        sqlite3_bind_text(stmt, i + 1, idBytes.back().constData(), -1, SQLITE_STATIC);
    }

    QHash<QString, MediaRecord> byId;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        MediaRecord record = readRecord(stmt);
        byId.insert(record.id, std::move(record));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        reportError(errorOut, "getRecords");
        return std::nullopt;
    }

    QSet<QString> emitted;
    for (const QString& id : ids) {
        auto it = byId.constFind(id);
        if (it != byId.constEnd() && !emitted.contains(id)) {
            ordered.push_back(it.value());
            emitted.insert(id);
        }
    }
    return ordered;
}

std::optional<std::vector<MediaRecord>> SQLiteStore::selectRecords(const char* sql,
                                                                   const char* context,
                                                                   CatalogError* errorOut)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        reportError(errorOut, context);
        return std::nullopt;
    }

    std::vector<MediaRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(readRecord(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        reportError(errorOut, context);
        return std::nullopt;
    }
    return records;
}

std::optional<std::vector<MediaRecord>> SQLiteStore::allRecords(CatalogError* errorOut)
{
    const QByteArray sql = QByteArray(kSelectColumns) + " ORDER BY created_at DESC, rowid DESC";
    return selectRecords(sql.constData(), "allRecords", errorOut);
}

std::optional<std::vector<MediaRecord>> SQLiteStore::recordsWithoutEmbedding(
    CatalogError* errorOut)
{
    const QByteArray sql = QByteArray(kSelectColumns)
        + " WHERE embedding IS NULL OR embedding_dims = 0 ORDER BY created_at ASC, rowid ASC";
    return selectRecords(sql.constData(), "recordsWithoutEmbedding", errorOut);
}

bool SQLiteStore::removeRecord(const QString& id, CatalogError* errorOut)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM media_items WHERE id = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        reportError(errorOut, "removeRecord prepare");
        return false;
    }

    const QByteArray idUtf8 = id.toUtf8();
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        reportError(errorOut, "removeRecord");
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        setError(errorOut, ErrorCode::NotFound,
                 QStringLiteral("Media item %1 not found").arg(id));
        return false;
    }
    return true;
}

bool SQLiteStore::setEmbedding(const QString& id, const Embedding& embedding,
                               CatalogError* errorOut)
{
    sqlite3_stmt* stmt = nullptr;
    const char* sql =
        "UPDATE media_items SET embedding = ?1, embedding_dims = ?2, updated_at = ?3 "
        "WHERE id = ?4";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        reportError(errorOut, "setEmbedding prepare");
        return false;
    }

    const QByteArray blob = encodeEmbedding(embedding);
    const QByteArray idUtf8 = id.toUtf8();
    if (blob.isEmpty()) {
        sqlite3_bind_null(stmt, 1);
    } else {
        sqlite3_bind_blob(stmt, 1, blob.constData(), blob.size(), SQLITE_STATIC);
    }
    sqlite3_bind_int(stmt, 2, static_cast<int>(embedding.size()));
    sqlite3_bind_double(stmt, 3, static_cast<double>(QDateTime::currentSecsSinceEpoch()));
    sqlite3_bind_text(stmt, 4, idUtf8.constData(), -1, SQLITE_STATIC);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        reportError(errorOut, "setEmbedding");
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        setError(errorOut, ErrorCode::NotFound,
                 QStringLiteral("Media item %1 not found").arg(id));
        return false;
    }
    return true;
}

std::optional<int> SQLiteStore::countRecords(bool embeddedOnly, CatalogError* errorOut)
{
    const char* sql = embeddedOnly
        ? "SELECT COUNT(*) FROM media_items WHERE embedding IS NOT NULL AND embedding_dims > 0"
        : "SELECT COUNT(*) FROM media_items";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        reportError(errorOut, "countRecords prepare");
        return std::nullopt;
    }

    std::optional<int> count;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (!count) {
        reportError(errorOut, "countRecords");
    }
    return count;
}

// ── Vector candidates ───────────────────────────────────────

std::optional<std::vector<CandidateHit>> SQLiteStore::query(const Embedding& vector,
                                                            int limit,
                                                            const QStringList& excludeIds,
                                                            DistanceMetric metric,
                                                            CatalogError* errorOut)
{
    std::vector<CandidateHit> hits;
    if (limit <= 0 || vector.empty()) {
        return hits;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql =
        "SELECT id, embedding FROM media_items "
        "WHERE embedding IS NOT NULL AND embedding_dims > 0 ORDER BY rowid ASC";
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        reportError(errorOut, "query prepare");
        return std::nullopt;
    }

    const QSet<QString> excluded(excludeIds.begin(), excludeIds.end());
    int skippedDims = 0;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const QString id = columnText(stmt, 0);
        if (excluded.contains(id)) {
            continue;
        }
        const Embedding embedding = decodeEmbedding(sqlite3_column_blob(stmt, 1),
                                                    sqlite3_column_bytes(stmt, 1));
        if (embedding.size() != vector.size()) {
            ++skippedDims;
            continue;
        }
        hits.push_back({id, VectorMath::distance(vector, embedding, metric)});
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        reportError(errorOut, "query");
        return std::nullopt;
    }

    if (skippedDims > 0) {
        LOG_WARN(mcIndex, "query: skipped %d embeddings with dimension != %d",
                 skippedDims, static_cast<int>(vector.size()));
    }

    std::stable_sort(hits.begin(), hits.end(), [](const CandidateHit& a, const CandidateHit& b) {
        return a.distance < b.distance;
    });
    if (hits.size() > static_cast<size_t>(limit)) {
        hits.resize(static_cast<size_t>(limit));
    }
    return hits;
}

} // namespace mc
