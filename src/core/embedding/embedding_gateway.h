#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/shared/engine_config.h"
#include "core/shared/errors.h"

#include <atomic>
#include <cstdint>
#include <optional>

namespace mc {

struct EmbeddingCircuitBreaker {
    explicit EmbeddingCircuitBreaker(int openThreshold = 5, int halfOpenDelayMs = 30000)
        : openThreshold(openThreshold)
        , halfOpenDelayMs(halfOpenDelayMs)
    {
    }

    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    const int openThreshold;   // Open after this many consecutive failures
    const int halfOpenDelayMs; // Allow one attempt after this long

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

// Wraps the embedding provider with input validation, a corpus dimension
// check and a circuit breaker. Every failure surfaces as ProviderError.
class EmbeddingGateway {
public:
    EmbeddingGateway(EmbeddingProvider& provider, const EmbeddingSettings& settings = {});

    EmbeddingGateway(const EmbeddingGateway&) = delete;
    EmbeddingGateway& operator=(const EmbeddingGateway&) = delete;

    std::optional<Embedding> embed(const QString& text, CatalogError* errorOut = nullptr);

    int dimensions() const { return m_settings.dimensions; }
    QString providerName() const { return m_provider.name(); }

    // Backfill reads this to skip its throttle while open
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    EmbeddingProvider& m_provider;
    EmbeddingSettings m_settings;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace mc
