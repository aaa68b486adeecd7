#include "core/embedding/embedding_gateway.h"
#include "core/shared/logging.h"

#include <chrono>

namespace mc {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < openThreshold) {
        return false;
    }
    // In open state: check if enough time has elapsed for half-open
    if (steadyNowMs() - lastFailureTime.load() >= halfOpenDelayMs) {
        return false;
    }
    return true;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

EmbeddingGateway::EmbeddingGateway(EmbeddingProvider& provider, const EmbeddingSettings& settings)
    : m_provider(provider)
    , m_settings(settings)
    , m_circuitBreaker(settings.circuitOpenThreshold, settings.circuitHalfOpenDelayMs)
{
    if (m_provider.dimensions() != m_settings.dimensions) {
        LOG_WARN(mcEmbedding, "Provider %s reports %d dimensions, corpus expects %d",
                 qUtf8Printable(m_provider.name()), m_provider.dimensions(),
                 m_settings.dimensions);
    }
}

std::optional<Embedding> EmbeddingGateway::embed(const QString& text, CatalogError* errorOut)
{
    if (text.trimmed().isEmpty()) {
        setError(errorOut, ErrorCode::InvalidInput,
                 QStringLiteral("Cannot embed empty text"));
        return std::nullopt;
    }

    if (m_circuitBreaker.isOpen()) {
        LOG_WARN(mcEmbedding, "Embedding circuit breaker is open, skipping provider call");
        setError(errorOut, ErrorCode::ProviderError,
                 QStringLiteral("Embedding provider temporarily unavailable"));
        return std::nullopt;
    }

    QString providerError;
    Embedding embedding = m_provider.embed(text, &providerError);
    if (embedding.empty()) {
        m_circuitBreaker.recordFailure();
        const QString message = providerError.isEmpty()
            ? QStringLiteral("Embedding provider returned no vector")
            : providerError;
        LOG_WARN(mcEmbedding, "embed failed (%s): %s",
                 qUtf8Printable(m_provider.name()), qUtf8Printable(message));
        setError(errorOut, ErrorCode::ProviderError, message);
        return std::nullopt;
    }

    if (static_cast<int>(embedding.size()) != m_settings.dimensions) {
        m_circuitBreaker.recordFailure();
        const QString message = QStringLiteral("Embedding has %1 dimensions, expected %2")
                                    .arg(static_cast<int>(embedding.size())).arg(m_settings.dimensions);
        LOG_WARN(mcEmbedding, "%s", qUtf8Printable(message));
        setError(errorOut, ErrorCode::ProviderError, message);
        return std::nullopt;
    }

    m_circuitBreaker.recordSuccess();
    return embedding;
}

} // namespace mc
