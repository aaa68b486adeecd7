#include "core/embedding/backfill.h"
#include "core/embedding/text_preparer.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QThread>

namespace mc {

EmbeddingBackfill::EmbeddingBackfill(RecordStore& records, EmbeddingGateway& gateway,
                                     const EmbeddingSettings& settings)
    : m_records(records)
    , m_gateway(gateway)
    , m_settings(settings)
{
}

std::optional<BackfillReport> EmbeddingBackfill::run(CatalogError* errorOut)
{
    const auto pending = m_records.recordsWithoutEmbedding(errorOut);
    if (!pending) {
        return std::nullopt;
    }

    LOG_INFO(mcEmbedding, "Backfill: %d items without embeddings",
             static_cast<int>(pending->size()));

    QElapsedTimer timer;
    timer.start();

    BackfillReport report;
    bool calledProvider = false;
    for (const auto& record : *pending) {
        ++report.scanned;

        const QString text = TextPreparer::prepare(record);
        if (text.trimmed().isEmpty()) {
            ++report.skipped;
            LOG_DEBUG(mcEmbedding, "Backfill: skipping %s, nothing to embed",
                      qUtf8Printable(record.id));
            continue;
        }

        // Throttle provider calls; an open breaker fails fast without a call
        if (calledProvider && m_settings.backfillDelayMs > 0
            && !m_gateway.circuitBreaker().isOpen()) {
            QThread::msleep(static_cast<unsigned long>(m_settings.backfillDelayMs));
        }
        calledProvider = true;

        CatalogError error;
        const auto embedding = m_gateway.embed(text, &error);
        if (!embedding || !m_records.setEmbedding(record.id, *embedding, &error)) {
            ++report.failed;
            report.failedIds.append(record.id);
            LOG_WARN(mcEmbedding, "Backfill: %s failed [%s]: %s",
                     qUtf8Printable(record.title), qUtf8Printable(errorCodeToString(error.code)),
                     qUtf8Printable(error.message));
            continue;
        }

        ++report.embedded;
        LOG_DEBUG(mcEmbedding, "Backfill: embedded %s", qUtf8Printable(record.title));
    }

    LOG_INFO(mcEmbedding, "Backfill complete: scanned=%d embedded=%d skipped=%d failed=%d (%lld ms)",
             report.scanned, report.embedded, report.skipped, report.failed,
             static_cast<long long>(timer.elapsed()));
    return report;
}

} // namespace mc
