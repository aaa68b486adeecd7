#pragma once

#include "core/shared/types.h"

#include <QString>

namespace mc {

// Text-to-vector model. Implementations return an empty vector on failure
// and describe the failure through errorOut.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual Embedding embed(const QString& text, QString* errorOut = nullptr) = 0;
    virtual int dimensions() const = 0;
    virtual QString name() const = 0;
};

} // namespace mc
