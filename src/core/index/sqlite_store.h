#pragma once

#include "core/index/record_store.h"
#include "core/vector/candidate_store.h"

#include <QString>

#include <optional>
#include <vector>

#include <sqlite3.h>

namespace mc {

// SQLiteStore: single-threaded owner of the catalog database.
// Serves both as the record store and as an exhaustive-scan vector
// candidate store over the stored embeddings.
class SQLiteStore : public RecordStore, public VectorCandidateStore {
public:
    ~SQLiteStore() override;

    // Move-only (owns sqlite3* handle)
    SQLiteStore(SQLiteStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SQLiteStore& operator=(SQLiteStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // Open or create the database at the given path (":memory:" for a
    // private in-memory catalog). Creates schema on first open.
    static std::optional<SQLiteStore> open(const QString& dbPath);

    // ── RecordStore ─────────────────────────────────────────

    std::optional<MediaRecord> insertRecord(const MediaRecord& record,
                                            CatalogError* errorOut = nullptr) override;
    std::optional<MediaRecord> getRecord(const QString& id,
                                         CatalogError* errorOut = nullptr) override;
    std::optional<std::vector<MediaRecord>> getRecords(const QStringList& ids,
                                                       CatalogError* errorOut = nullptr) override;
    std::optional<std::vector<MediaRecord>> allRecords(CatalogError* errorOut = nullptr) override;
    std::optional<std::vector<MediaRecord>> recordsWithoutEmbedding(
        CatalogError* errorOut = nullptr) override;
    bool removeRecord(const QString& id, CatalogError* errorOut = nullptr) override;
    bool setEmbedding(const QString& id, const Embedding& embedding,
                      CatalogError* errorOut = nullptr) override;
    std::optional<int> countRecords(bool embeddedOnly, CatalogError* errorOut = nullptr) override;

    // ── VectorCandidateStore ────────────────────────────────

    std::optional<std::vector<CandidateHit>> query(const Embedding& vector,
                                                   int limit,
                                                   const QStringList& excludeIds,
                                                   DistanceMetric metric,
                                                   CatalogError* errorOut = nullptr) override;

private:
    SQLiteStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    std::optional<std::vector<MediaRecord>> selectRecords(const char* sql,
                                                          const char* context,
                                                          CatalogError* errorOut);
    static MediaRecord readRecord(sqlite3_stmt* stmt);
    static QByteArray encodeEmbedding(const Embedding& embedding);
    static Embedding decodeEmbedding(const void* blob, int bytes);

    void reportError(CatalogError* errorOut, const char* context) const;

    sqlite3* m_db = nullptr;
};

} // namespace mc
