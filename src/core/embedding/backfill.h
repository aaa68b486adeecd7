#pragma once

#include "core/embedding/embedding_gateway.h"
#include "core/index/record_store.h"

#include <QStringList>

#include <optional>

namespace mc {

struct BackfillReport {
    int scanned = 0;
    int embedded = 0;
    int skipped = 0; // No text to embed
    int failed = 0;
    QStringList failedIds;
};

// Embeds every record that has no vector yet, one provider call at a time
// with backfillDelayMs between calls. Per-record failures are counted and
// the run continues.
class EmbeddingBackfill {
public:
    EmbeddingBackfill(RecordStore& records, EmbeddingGateway& gateway,
                      const EmbeddingSettings& settings = {});

    // Fails only when the pending records cannot be listed.
    std::optional<BackfillReport> run(CatalogError* errorOut = nullptr);

private:
    RecordStore& m_records;
    EmbeddingGateway& m_gateway;
    EmbeddingSettings m_settings;
};

} // namespace mc
