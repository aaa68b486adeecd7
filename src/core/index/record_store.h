#pragma once

#include "core/shared/errors.h"
#include "core/shared/types.h"

#include <QStringList>

#include <optional>
#include <vector>

namespace mc {

// Persistence contract for catalog records. Lookups of unknown ids report
// NotFound; storage failures report StorageError.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Stores a new record. Assigns an id when none is given and stamps
    // createdAt / updatedAt when unset. Returns the stored record.
    virtual std::optional<MediaRecord> insertRecord(const MediaRecord& record,
                                                    CatalogError* errorOut = nullptr) = 0;

    virtual std::optional<MediaRecord> getRecord(const QString& id,
                                                 CatalogError* errorOut = nullptr) = 0;

    // Bulk fetch in the order of ids. Unknown ids are skipped.
    virtual std::optional<std::vector<MediaRecord>> getRecords(const QStringList& ids,
                                                               CatalogError* errorOut = nullptr) = 0;

    // Newest first.
    virtual std::optional<std::vector<MediaRecord>> allRecords(CatalogError* errorOut = nullptr) = 0;

    virtual std::optional<std::vector<MediaRecord>> recordsWithoutEmbedding(
        CatalogError* errorOut = nullptr) = 0;

    virtual bool removeRecord(const QString& id, CatalogError* errorOut = nullptr) = 0;

    virtual bool setEmbedding(const QString& id, const Embedding& embedding,
                              CatalogError* errorOut = nullptr) = 0;

    virtual std::optional<int> countRecords(bool embeddedOnly,
                                            CatalogError* errorOut = nullptr) = 0;
};

} // namespace mc
